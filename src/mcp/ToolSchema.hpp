// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace mcplink
{

/// @brief Projects an MCP input schema onto the parameter shape of the LLM tool-calling layer.
///
/// A schema that is already {type:"object", properties:{...}} is returned unchanged.
/// Anything else becomes {type:"object", properties, required}, taking properties
/// and required from the source where they are well-formed.
[[nodiscard]] auto projectInputSchema(const nlohmann::json& schema) -> nlohmann::json;

/// @brief Builds one {type:"function", function:{name, description, parameters}} declaration.
[[nodiscard]] auto makeLlmDeclaration(std::string_view llmName, const ToolDescriptor& tool) -> nlohmann::json;

/// @brief Renders a tool result as the text fed back into the conversation.
///
/// Strings are returned as-is, MCP content arrays of text items are joined by
/// newlines, any other JSON is pretty-printed and failures become "Error: ...".
[[nodiscard]] auto resultToLlmText(const ToolInvocationResult& result) -> std::string;

} // namespace mcplink
