// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mcplink
{

/// @brief (serverName, toolName)
using ToolKey = std::pair<std::string, std::string>;

/// @brief Immutable merged view of every registered server's catalog.
struct RegistrySnapshot
{
    std::map<ToolKey, ToolDescriptor> tools;

    /// Name declared to the LLM layer for each tool, and the reverse lookup.
    std::map<ToolKey, std::string> llmNames;
    std::map<std::string, ToolKey> llmLookup;
};

/// @brief Aggregates the tool catalogs of all servers into one namespace.
///
/// Every mutation builds a fresh snapshot and swaps it in under one mutex. Readers
/// hold on to a snapshot and never observe a partially replaced server catalog.
class ToolRegistry
{
  public:
    ToolRegistry();

    /// @brief Atomically replaces the catalog of @p serverName.
    void registerTools(const std::string& serverName, std::vector<ToolDescriptor> tools);

    /// @brief Removes every tool of @p serverName.
    void unregisterServer(const std::string& serverName);

    [[nodiscard]] auto snapshot() const -> std::shared_ptr<const RegistrySnapshot>;

    /// @brief Returns a copy of all tools, ordered by server and tool name.
    [[nodiscard]] auto listAll() const -> std::vector<ToolDescriptor>;

    [[nodiscard]] auto toolsByServer() const -> std::map<std::string, std::vector<ToolDescriptor>>;

    [[nodiscard]] auto find(std::string_view serverName, std::string_view toolName) const
        -> std::optional<ToolDescriptor>;

    /// @brief Returns all tools as LLM function declarations.
    ///
    /// A tool name advertised by exactly one server is declared bare. Colliding
    /// names are declared as "<server>_<tool>" for every advertising server; a
    /// qualified name that still clashes gets a numeric suffix. Every tool is
    /// declared under exactly one unique name.
    [[nodiscard]] auto toLlmFormat() const -> nlohmann::json;

    /// @brief Resolves an LLM-issued call back to a routed invocation.
    /// @return The request, or UnknownToolError if the name is not in the current snapshot.
    [[nodiscard]] auto fromLlmToolCall(const LlmToolCall& call) const -> Result<ToolInvocationRequest>;

  private:
    void publish(std::map<ToolKey, ToolDescriptor> tools);

    mutable std::mutex _mutex;
    std::shared_ptr<const RegistrySnapshot> _snapshot;
};

} // namespace mcplink
