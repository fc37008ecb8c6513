// SPDX-License-Identifier: Apache-2.0
#include "ToolSchema.hpp"

#include <core/JsonUtils.hpp>

#include <format>

namespace mcplink
{

namespace
{

    auto isTextContentArray(const nlohmann::json& payload) -> bool
    {
        if (!payload.is_array() || payload.empty())
            return false;
        for (auto const& item: payload)
        {
            if (!item.is_object() || json::getStringOr(item, "type", "") != "text"
                || !item.contains("text") || !item["text"].is_string())
                return false;
        }
        return true;
    }

} // namespace

auto projectInputSchema(const nlohmann::json& schema) -> nlohmann::json
{
    if (schema.is_object() && schema.value("type", nlohmann::json {}) == "object" && schema.contains("properties")
        && schema["properties"].is_object())
        return schema;

    auto projected = nlohmann::json {
        { "type", "object" },
        { "properties", nlohmann::json::object() },
        { "required", nlohmann::json::array() },
    };

    if (!schema.is_object())
        return projected;

    if (schema.contains("properties") && schema["properties"].is_object())
        projected["properties"] = schema["properties"];
    if (schema.contains("required") && schema["required"].is_array())
        projected["required"] = schema["required"];

    return projected;
}

auto makeLlmDeclaration(std::string_view llmName, const ToolDescriptor& tool) -> nlohmann::json
{
    return nlohmann::json {
        { "type", "function" },
        { "function",
          {
              { "name", llmName },
              { "description", tool.description },
              { "parameters", projectInputSchema(tool.inputSchema) },
          } },
    };
}

auto resultToLlmText(const ToolInvocationResult& result) -> std::string
{
    auto render = [](const nlohmann::json& payload) -> std::string {
        if (payload.is_string())
            return payload.get<std::string>();

        if (isTextContentArray(payload))
        {
            auto text = std::string {};
            for (auto const& item: payload)
            {
                if (!text.empty())
                    text += '\n';
                text += item["text"].get<std::string>();
            }
            return text;
        }

        if (payload.is_null())
            return {};

        return payload.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    };

    if (result.success)
        return render(result.payload);

    auto detail = result.errorMessage;
    if (detail.empty())
        detail = render(result.payload);
    if (detail.empty())
        detail = std::string(errorCodeName(result.errorCode));
    return std::format("Error: {}", detail);
}

} // namespace mcplink
