// SPDX-License-Identifier: Apache-2.0
#include "ToolRegistry.hpp"

#include <core/Log.hpp>
#include <mcp/ToolSchema.hpp>

#include <algorithm>
#include <format>
#include <set>

namespace mcplink
{

namespace
{

    /// Gives every tool a distinct LLM name. A name held by several tools is
    /// qualified with the server for each holder that is still bare; holders that
    /// are all qualified already keep the first name and take numeric suffixes.
    void assignLlmNames(RegistrySnapshot& snapshot)
    {
        auto names = std::map<ToolKey, std::string> {};
        auto qualified = std::set<ToolKey> {};
        for (auto const& [key, tool]: snapshot.tools)
            names.emplace(key, key.second);

        auto clashing = true;
        while (clashing)
        {
            clashing = false;

            auto holders = std::map<std::string, std::vector<ToolKey>> {};
            auto taken = std::set<std::string> {};
            for (auto const& [key, name]: names)
            {
                holders[name].push_back(key);
                taken.insert(name);
            }

            for (auto const& [name, keys]: holders)
            {
                if (keys.size() < 2)
                    continue;
                clashing = true;

                auto const anyBare =
                    std::ranges::any_of(keys, [&](auto const& key) { return !qualified.contains(key); });
                if (anyBare)
                {
                    for (auto const& key: keys)
                    {
                        if (qualified.insert(key).second)
                            names[key] = std::format("{}_{}", key.first, key.second);
                    }
                    continue;
                }

                for (auto i = std::size_t { 1 }; i < keys.size(); ++i)
                {
                    auto suffix = 2;
                    auto candidate = std::format("{}_{}", name, suffix);
                    while (taken.contains(candidate))
                        candidate = std::format("{}_{}", name, ++suffix);
                    log::debug("LLM name '{}' of '{}/{}' is ambiguous; using '{}'", name, keys[i].first, keys[i].second, candidate);
                    taken.insert(candidate);
                    names[keys[i]] = std::move(candidate);
                }
            }
        }

        for (auto& [key, name]: names)
        {
            snapshot.llmLookup.emplace(name, key);
            snapshot.llmNames.emplace(key, std::move(name));
        }
    }

} // namespace

ToolRegistry::ToolRegistry(): _snapshot(std::make_shared<const RegistrySnapshot>())
{
}

void ToolRegistry::registerTools(const std::string& serverName, std::vector<ToolDescriptor> tools)
{
    auto lock = std::lock_guard(_mutex);

    auto merged = _snapshot->tools;
    std::erase_if(merged, [&](auto const& entry) { return entry.first.first == serverName; });

    for (auto& tool: tools)
    {
        tool.serverName = serverName;
        auto key = ToolKey { serverName, tool.toolName };
        merged.insert_or_assign(std::move(key), std::move(tool));
    }

    publish(std::move(merged));
    log::debug("Registered {} tool(s) for server '{}'", tools.size(), serverName);
}

void ToolRegistry::unregisterServer(const std::string& serverName)
{
    auto lock = std::lock_guard(_mutex);

    auto merged = _snapshot->tools;
    auto const removed =
        std::erase_if(merged, [&](auto const& entry) { return entry.first.first == serverName; });
    if (removed == 0)
        return;

    publish(std::move(merged));
    log::debug("Unregistered {} tool(s) of server '{}'", removed, serverName);
}

void ToolRegistry::publish(std::map<ToolKey, ToolDescriptor> tools)
{
    auto next = std::make_shared<RegistrySnapshot>();
    next->tools = std::move(tools);
    assignLlmNames(*next);
    _snapshot = std::move(next);
}

auto ToolRegistry::snapshot() const -> std::shared_ptr<const RegistrySnapshot>
{
    auto lock = std::lock_guard(_mutex);
    return _snapshot;
}

auto ToolRegistry::listAll() const -> std::vector<ToolDescriptor>
{
    auto const current = snapshot();
    auto tools = std::vector<ToolDescriptor> {};
    tools.reserve(current->tools.size());
    for (auto const& [key, tool]: current->tools)
        tools.push_back(tool);
    return tools;
}

auto ToolRegistry::toolsByServer() const -> std::map<std::string, std::vector<ToolDescriptor>>
{
    auto const current = snapshot();
    auto grouped = std::map<std::string, std::vector<ToolDescriptor>> {};
    for (auto const& [key, tool]: current->tools)
        grouped[key.first].push_back(tool);
    return grouped;
}

auto ToolRegistry::find(std::string_view serverName, std::string_view toolName) const
    -> std::optional<ToolDescriptor>
{
    auto const current = snapshot();
    auto const it = current->tools.find(ToolKey { std::string(serverName), std::string(toolName) });
    if (it == current->tools.end())
        return std::nullopt;
    return it->second;
}

auto ToolRegistry::toLlmFormat() const -> nlohmann::json
{
    auto const current = snapshot();
    auto declarations = nlohmann::json::array();
    for (auto const& [key, name]: current->llmNames)
        declarations.push_back(makeLlmDeclaration(name, current->tools.at(key)));
    return declarations;
}

auto ToolRegistry::fromLlmToolCall(const LlmToolCall& call) const -> Result<ToolInvocationRequest>
{
    auto const current = snapshot();
    auto const it = current->llmLookup.find(call.name);
    if (it == current->llmLookup.end())
        return makeError(ErrorCode::UnknownToolError, std::format("Unknown tool '{}'", call.name));

    return ToolInvocationRequest {
        .serverName = it->second.first,
        .toolName = it->second.second,
        .arguments = call.arguments.is_null() ? nlohmann::json::object() : call.arguments,
    };
}

} // namespace mcplink
