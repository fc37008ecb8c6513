// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace mcplink::jsonrpc
{

/// @brief Standard JSON-RPC 2.0 error codes.
namespace codes
{
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;
} // namespace codes

/// @brief Represents a JSON-RPC 2.0 error object.
struct RpcError
{
    int code = 0;
    std::string message;
    nlohmann::json data;
};

/// @brief A response to one of our requests, correlated by id.
struct Response
{
    int64_t id = 0;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;

    /// @brief Returns true if this response indicates success.
    [[nodiscard]] auto isSuccess() const -> bool { return result.has_value(); }
};

/// @brief A request issued by the server to us.
struct Request
{
    nlohmann::json id;
    std::string method;
    nlohmann::json params;
};

/// @brief A notification issued by the server (no id, no reply expected).
struct Notification
{
    std::string method;
    nlohmann::json params;
};

/// @brief Any decoded inbound envelope.
using Message = std::variant<Response, Request, Notification>;

/// @brief Builds a JSON-RPC 2.0 request message.
/// @param id The request ID.
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC request object.
[[nodiscard]] auto makeRequest(int64_t id, std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 notification message (no id).
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC notification object.
[[nodiscard]] auto makeNotification(std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a success response to a server-initiated request.
[[nodiscard]] auto makeResult(const nlohmann::json& id, nlohmann::json result) -> nlohmann::json;

/// @brief Builds an error response to a server-initiated request.
[[nodiscard]] auto makeErrorResponse(const nlohmann::json& id, int code, std::string_view message)
    -> nlohmann::json;

/// @brief Serializes an envelope as a single line of compact JSON.
[[nodiscard]] auto encode(const nlohmann::json& message) -> std::string;

/// @brief Classifies a parsed JSON-RPC 2.0 message.
/// @param message The JSON message.
/// @return The decoded message or a ProtocolError.
[[nodiscard]] auto parseMessage(const nlohmann::json& message) -> Result<Message>;

/// @brief Parses and classifies one inbound frame of text.
/// @param frame The raw text received from a transport.
/// @return The decoded message or a ProtocolError.
[[nodiscard]] auto decode(std::string_view frame) -> Result<Message>;

/// @brief Hands out request ids, monotonically increasing per connection.
class IdGenerator
{
  public:
    [[nodiscard]] auto next() noexcept -> int64_t { return _next.fetch_add(1, std::memory_order_relaxed); }

  private:
    std::atomic<int64_t> _next { 1 };
};

} // namespace mcplink::jsonrpc
