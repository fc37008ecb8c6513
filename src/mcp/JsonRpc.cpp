// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <core/JsonUtils.hpp>

#include <format>

namespace mcplink::jsonrpc
{

auto makeRequest(int64_t id, std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeNotification(std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeResult(const nlohmann::json& id, nlohmann::json result) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "result", std::move(result) },
    };
}

auto makeErrorResponse(const nlohmann::json& id, int code, std::string_view message) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "error", { { "code", code }, { "message", message } } },
    };
}

auto encode(const nlohmann::json& message) -> std::string
{
    // Non-UTF-8 input is replaced rather than thrown on.
    return message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

auto parseMessage(const nlohmann::json& message) -> Result<Message>
{
    if (!message.is_object() || !message.contains("jsonrpc") || message["jsonrpc"] != "2.0")
        return makeError(ErrorCode::ProtocolError, "Not a valid JSON-RPC 2.0 message");

    auto const hasId = message.contains("id") && !message["id"].is_null();

    if (message.contains("method"))
    {
        if (!message["method"].is_string())
            return makeError(ErrorCode::ProtocolError, "JSON-RPC method must be a string");

        auto method = message["method"].get<std::string>();
        auto params = message.value("params", nlohmann::json {});
        if (hasId)
            return Request { .id = message["id"], .method = std::move(method), .params = std::move(params) };
        return Notification { .method = std::move(method), .params = std::move(params) };
    }

    if (!hasId)
        return makeError(ErrorCode::ProtocolError, "JSON-RPC response without id");

    // We only ever issue integer ids.
    if (!message["id"].is_number_integer())
        return makeError(ErrorCode::ProtocolError,
                         std::format("JSON-RPC response with foreign id: {}", message["id"].dump()));

    auto response = Response { .id = message["id"].get<int64_t>() };

    if (message.contains("result"))
    {
        response.result = message["result"];
    }
    else if (message.contains("error") && message["error"].is_object())
    {
        auto const& err = message["error"];
        response.error = RpcError {
            .code = static_cast<int>(json::getIntOr(err, "code", 0)),
            .message = json::getStringOr(err, "message", "Unknown error"),
            .data = err.value("data", nlohmann::json {}),
        };
    }
    else
    {
        return makeError(ErrorCode::ProtocolError, "JSON-RPC message has neither result, error, nor method");
    }

    return response;
}

auto decode(std::string_view frame) -> Result<Message>
{
    return json::parse(frame).and_then([](const nlohmann::json& message) { return parseMessage(message); });
}

} // namespace mcplink::jsonrpc
