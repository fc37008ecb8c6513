// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/Backoff.hpp>
#include <mcp/ToolRegistry.hpp>
#include <mcp/Transport.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <format>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcplink
{

/// @brief Lifecycle state of one server connection.
enum class ConnectionState : std::uint8_t
{
    Disconnected,
    Connecting,
    Initializing,
    Ready,
    Degraded,
    Closed,
};

[[nodiscard]] constexpr auto connectionStateName(ConnectionState state) -> std::string_view
{
    switch (state)
    {
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Connecting: return "Connecting";
        case ConnectionState::Initializing: return "Initializing";
        case ConnectionState::Ready: return "Ready";
        case ConnectionState::Degraded: return "Degraded";
        case ConnectionState::Closed: return "Closed";
    }
    return "Unknown";
}

/// @brief Timeouts and retry budget of a connection.
struct ConnectionOptions
{
    std::chrono::milliseconds requestTimeout { 30000 };
    std::chrono::milliseconds initializeTimeout { 30000 };
    ReconnectPolicy reconnect;
};

/// @brief Observers of a connection. Invoked on the connection's own threads.
struct ConnectionEvents
{
    std::function<void(ConnectionState from, ConnectionState to, const std::string& reason)> onStateChanged;

    /// Called once when the retry budget is exhausted and the connection gives up.
    std::function<void(const std::string& reason)> onUnavailable;
};

/// @brief Owns the transport and the pending call table of one MCP server.
///
/// A supervisor thread drives the lifecycle: open the transport, run
/// initialize, send notifications/initialized, fetch tools/list, register the
/// catalog and report Ready. Loss of the transport (or a failed health check)
/// fails every outstanding call with ConnectionLostError, moves the connection
/// to Degraded and schedules reconnects with exponential backoff until the
/// retry budget is spent, at which point the connection is Closed.
///
/// Stream transports get a dedicated reader thread that resolves pending calls
/// by id, so replies may arrive in any order. For HTTP the reply is taken from
/// the send() result directly.
class ServerConnection
{
  public:
    ServerConnection(ServerDescriptor descriptor,
                     ToolRegistry& registry,
                     ConnectionOptions options = {},
                     TransportFactory factory = {},
                     ConnectionEvents events = {});
    ~ServerConnection();

    ServerConnection(const ServerConnection&) = delete;
    ServerConnection& operator=(const ServerConnection&) = delete;

    /// @brief Starts the supervisor. Returns immediately; progress is reported through state().
    void start();

    /// @brief Closes the connection for good, failing all outstanding calls. Idempotent.
    void stop();

    /// @brief Starts a Closed connection again with a fresh retry budget.
    [[nodiscard]] auto restart() -> VoidResult;

    [[nodiscard]] auto name() const -> const std::string&;
    [[nodiscard]] auto descriptor() const -> const ServerDescriptor&;
    [[nodiscard]] auto state() const -> ConnectionState;

    /// @brief Blocks until the connection is in @p state or @p timeout elapses.
    [[nodiscard]] auto awaitState(ConnectionState state, std::chrono::milliseconds timeout) const -> bool;

    /// @brief Blocks until the first connection attempt has finished (Ready or not).
    [[nodiscard]] auto awaitSettled(std::chrono::milliseconds timeout) const -> bool;

    /// @brief Fetches a fresh catalog via tools/list and re-registers it.
    /// @return The tools, or NotReadyError unless Ready.
    [[nodiscard]] auto listTools() -> Result<std::vector<ToolDescriptor>>;

    /// @brief Invokes a tool and waits for its result.
    ///
    /// Fails with NotReadyError unless Ready. A timeout removes the pending call
    /// and yields TimeoutError without changing the connection state.
    [[nodiscard]] auto callTool(std::string_view toolName,
                                const nlohmann::json& arguments,
                                std::optional<std::chrono::milliseconds> timeout = std::nullopt)
        -> ToolInvocationResult;

    /// @brief Liveness check.
    /// @return The round-trip latency or a HealthCheckError.
    [[nodiscard]] auto ping(std::chrono::milliseconds timeout) -> Result<std::chrono::milliseconds>;

    /// @brief Treats a failed health check like a transport closure.
    void reportHealthFailure(std::string_view reason);

    /// @brief The initialize result of the current session, if any.
    [[nodiscard]] auto capabilities() const -> std::optional<ServerCapabilities>;

    [[nodiscard]] auto pendingCallCount() const -> std::size_t;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcplink

template <>
struct std::formatter<mcplink::ConnectionState>: std::formatter<std::string_view>
{
    auto format(mcplink::ConnectionState state, auto& ctx) const
    {
        return std::formatter<std::string_view>::format(mcplink::connectionStateName(state), ctx);
    }
};
