// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/HealthMonitor.hpp>
#include <mcp/ServerConnection.hpp>
#include <mcp/ToolRegistry.hpp>
#include <mcp/Transport.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcplink
{

enum class ServerEventKind : std::uint8_t
{
    StateChanged,
    Unavailable,
    HealthCheckFailed,
};

[[nodiscard]] constexpr auto serverEventKindName(ServerEventKind kind) -> std::string_view
{
    switch (kind)
    {
        case ServerEventKind::StateChanged: return "StateChanged";
        case ServerEventKind::Unavailable: return "Unavailable";
        case ServerEventKind::HealthCheckFailed: return "HealthCheckFailed";
    }
    return "Unknown";
}

/// @brief Structured notification about one server, for the logging collaborator.
struct ServerEvent
{
    std::string server;
    ServerEventKind kind = ServerEventKind::StateChanged;
    ConnectionState from = ConnectionState::Disconnected;
    ConnectionState to = ConnectionState::Disconnected;
    std::string message;
};

using ServerEventCallback = std::function<void(const ServerEvent&)>;

struct ManagerOptions
{
    ConnectionOptions connection;
    HealthOptions health;
    TransportFactory transportFactory; ///< Defaults to makeTransport().
    ServerEventCallback onEvent;       ///< Invoked serialized, from connection threads.
};

/// @brief The single entry point the application uses to reach its MCP servers.
///
/// Owns one ServerConnection per configured server, the shared ToolRegistry and
/// the HealthMonitor. Tool calls are routed by server name; failures come back
/// as a failed ToolInvocationResult rather than as an error.
class ServerManager
{
  public:
    explicit ServerManager(ManagerOptions options = {});
    ~ServerManager();

    ServerManager(const ServerManager&) = delete;
    ServerManager& operator=(const ServerManager&) = delete;

    /// @brief Creates and starts one connection per descriptor.
    ///
    /// Connections come up concurrently and independently; this call does not
    /// wait for them. Fails with InvalidArgument on a duplicate server name or
    /// once the manager has been stopped.
    [[nodiscard]] auto start(std::vector<ServerDescriptor> descriptors) -> VoidResult;

    /// @brief Closes every connection, failing its outstanding calls at once, and
    /// stops health monitoring. Idempotent and final.
    void stop();

    [[nodiscard]] auto listTools() const -> std::vector<ToolDescriptor>;
    [[nodiscard]] auto toolsByServer() const -> std::map<std::string, std::vector<ToolDescriptor>>;

    /// @brief Tool declarations in the LLM function-calling format.
    [[nodiscard]] auto llmTools() const -> nlohmann::json;

    /// @brief Routes a tool invocation to its server.
    ///
    /// Checked in order: UnknownServerError, NotReadyError, UnknownToolError (the
    /// server is not contacted), then the call itself.
    [[nodiscard]] auto callTool(const ToolInvocationRequest& request,
                                std::optional<std::chrono::milliseconds> timeout = std::nullopt)
        -> ToolInvocationResult;

    [[nodiscard]] auto callTool(std::string serverName, std::string toolName, nlohmann::json arguments)
        -> ToolInvocationResult;

    /// @brief Resolves an LLM-issued call through the registry and invokes it.
    [[nodiscard]] auto callLlmTool(const LlmToolCall& call) -> ToolInvocationResult;

    [[nodiscard]] auto serverStates() const -> std::map<std::string, ConnectionState>;
    [[nodiscard]] auto healthSummary() const -> HealthSummary;
    [[nodiscard]] auto healthStatus(const std::string& serverName) const -> std::optional<HealthStatus>;

    /// @brief Restarts a Closed connection with a fresh retry budget.
    [[nodiscard]] auto resetServer(const std::string& serverName) -> VoidResult;

    /// @brief Waits until every connection finished its first attempt.
    [[nodiscard]] auto awaitSettled(std::chrono::milliseconds timeout) const -> bool;

    [[nodiscard]] auto connection(const std::string& serverName) const -> std::shared_ptr<ServerConnection>;
    [[nodiscard]] auto registry() const -> const ToolRegistry& { return _registry; }
    [[nodiscard]] auto health() -> HealthMonitor& { return *_health; }

  private:
    void emit(ServerEvent event);

    ManagerOptions _options;
    ToolRegistry _registry;
    std::unique_ptr<HealthMonitor> _health;

    mutable std::mutex _mutex;
    std::map<std::string, std::shared_ptr<ServerConnection>> _connections;
    bool _stopped = false;

    std::mutex _eventMutex;
};

} // namespace mcplink
