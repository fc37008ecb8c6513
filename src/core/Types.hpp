// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mcplink
{

/// @brief Wire transport used to reach an MCP server.
enum class TransportKind : std::uint8_t
{
    Stdio,
    WebSocket,
    Http,
};

/// @brief Converts a TransportKind to its configuration spelling.
[[nodiscard]] constexpr auto transportKindToString(TransportKind kind) -> std::string_view
{
    switch (kind)
    {
        case TransportKind::Stdio: return "stdio";
        case TransportKind::WebSocket: return "websocket";
        case TransportKind::Http: return "http";
    }
    return "unknown";
}

/// @brief Launch parameters of a stdio server process.
struct StdioConfig
{
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
};

/// @brief Endpoint of a WebSocket server.
struct WebSocketConfig
{
    std::string host;
    int port = 0;
    std::string path = "/";
    bool secure = false;
};

/// @brief Endpoint of an HTTP server; every request is a POST to this URL.
struct HttpConfig
{
    std::string url;
};

/// @brief Transport-specific part of a server descriptor.
using TransportConfig = std::variant<StdioConfig, WebSocketConfig, HttpConfig>;

/// @brief Immutable description of one configured MCP server.
struct ServerDescriptor
{
    std::string name;
    TransportConfig transport;

    [[nodiscard]] auto kind() const -> TransportKind
    {
        return static_cast<TransportKind>(transport.index());
    }
};

/// @brief A tool advertised by one server. Identity is (serverName, toolName).
struct ToolDescriptor
{
    std::string serverName;
    std::string toolName;
    std::string description;
    nlohmann::json inputSchema = nlohmann::json::object();
};

/// @brief A request to run a tool, routed by server and tool name.
struct ToolInvocationRequest
{
    std::string serverName;
    std::string toolName;
    nlohmann::json arguments = nlohmann::json::object();
};

/// @brief Outcome of a tool invocation, fed back into the conversation.
struct ToolInvocationResult
{
    bool success = false;
    nlohmann::json payload;   ///< The server's result.content on success.
    std::string errorMessage; ///< Set when success is false.
    ErrorCode errorCode = ErrorCode::Unknown;

    [[nodiscard]] static auto ok(nlohmann::json payload) -> ToolInvocationResult
    {
        return ToolInvocationResult { .success = true, .payload = std::move(payload) };
    }

    [[nodiscard]] static auto failure(const Error& error) -> ToolInvocationResult
    {
        return ToolInvocationResult {
            .success = false,
            .errorMessage = error.message,
            .errorCode = error.code,
        };
    }
};

/// @brief A tool call as emitted by the LLM layer.
struct LlmToolCall
{
    std::string id;
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();
};

/// @brief Capabilities reported by a server in its initialize response.
struct ServerCapabilities
{
    std::string protocolVersion;
    std::string serverName;
    std::string serverVersion;
    bool hasTools = false;
};

} // namespace mcplink
