// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>
#include <mcp/Transport.hpp>

#include <chrono>
#include <memory>

namespace mcplink
{

/// @brief Transport that exchanges JSON-RPC frames over a WebSocket client connection.
///
/// Each text message carries one JSON document. libwebsockets is not thread-safe,
/// so the event loop is serviced solely by the thread calling receive(); send()
/// queues outbound frames and wakes that loop to write them.
class WebSocketTransport: public Transport
{
  public:
    explicit WebSocketTransport(WebSocketConfig config,
                                std::chrono::milliseconds connectTimeout = std::chrono::seconds(10));
    ~WebSocketTransport() override;

    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;

    [[nodiscard]] auto open() -> VoidResult override;
    [[nodiscard]] auto send(std::string_view frame) -> Result<std::optional<std::string>> override;
    [[nodiscard]] auto receive() -> Result<std::optional<std::string>> override;
    void close() override;
    [[nodiscard]] auto isOpen() const -> bool override;

    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace mcplink
