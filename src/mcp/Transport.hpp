// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mcplink
{

/// @brief Abstract duplex channel carrying JSON-RPC frames to one MCP server.
///
/// A frame is one complete JSON document as text. Stream transports (stdio,
/// WebSocket) deliver replies asynchronously through receive(). The HTTP
/// transport has no inbound stream: each send() is one request/response
/// exchange and returns the correlated reply directly. That asymmetry is
/// reported by hasReceiveStream(); callers branch on it rather than on the
/// concrete type.
///
/// send() may be called from several threads at once. receive() is called from
/// a single reader thread. close() may be called from any thread at any time,
/// is idempotent, and makes a blocked receive() return.
class Transport
{
  public:
    virtual ~Transport() = default;

    /// @brief Spawns or dials the server.
    /// @return Success or a ConnectionError.
    [[nodiscard]] virtual auto open() -> VoidResult = 0;

    /// @brief Sends one frame to the server.
    /// @param frame The serialized JSON-RPC envelope.
    /// @return For stream transports std::nullopt; for HTTP the reply body, or
    ///         std::nullopt when the server answered without a body. Fails with
    ///         TransportError if the channel is closed.
    [[nodiscard]] virtual auto send(std::string_view frame) -> Result<std::optional<std::string>> = 0;

    /// @brief Sends one frame whose exchange must complete within @p timeout.
    ///
    /// Only request/response transports wait for the reply here, so only they
    /// apply the deadline. A missed deadline fails with TimeoutError.
    [[nodiscard]] virtual auto exchange(std::string_view frame, std::chrono::milliseconds /*timeout*/)
        -> Result<std::optional<std::string>>
    {
        return send(frame);
    }

    /// @brief Blocks until the next inbound frame arrives.
    /// @return The frame, std::nullopt once the peer has closed (end of sequence),
    ///         or a TransportError on a channel fault.
    [[nodiscard]] virtual auto receive() -> Result<std::optional<std::string>> = 0;

    /// @brief Closes the channel and releases the peer. Always safe to call.
    virtual void close() = 0;

    /// @brief Returns true between a successful open() and close()/peer closure.
    [[nodiscard]] virtual auto isOpen() const -> bool = 0;

    /// @brief Returns false for request/response transports without a receive stream.
    [[nodiscard]] virtual auto hasReceiveStream() const -> bool { return true; }
};

/// @brief Creates a fresh, unopened transport for a server.
using TransportFactory = std::function<std::unique_ptr<Transport>(const ServerDescriptor&)>;

/// @brief Default factory choosing StdioTransport, WebSocketTransport or HttpTransport.
/// @param requestTimeout Upper bound for a WebSocket dial, and for an HTTP exchange sent without its own deadline.
[[nodiscard]] auto makeTransport(const ServerDescriptor& descriptor,
                                 std::chrono::milliseconds requestTimeout = std::chrono::seconds(30))
    -> std::unique_ptr<Transport>;

} // namespace mcplink
