// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace mcplink
{

/// @brief Error codes for categorizing failures across the MCP runtime.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    ConnectionError,     ///< Transport could not be opened (spawn or dial failure).
    TransportError,      ///< Mid-session channel fault.
    ProtocolError,       ///< Malformed or unparsable JSON-RPC envelope.
    TimeoutError,        ///< No response within the deadline.
    UnknownServerError,  ///< No connection registered under the requested server name.
    UnknownToolError,    ///< Tool is absent from the current registry snapshot.
    NotReadyError,       ///< Call issued to a connection that is not Ready.
    HealthCheckError,    ///< Liveness ping failed.
    ConnectionLostError, ///< Outstanding call failed because its connection went away.
    ToolCallError,       ///< The server answered tools/call with an error.
};

/// @brief Returns a stable, human-readable name for an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::ConfigError: return "ConfigError";
        case ErrorCode::ConnectionError: return "ConnectionError";
        case ErrorCode::TransportError: return "TransportError";
        case ErrorCode::ProtocolError: return "ProtocolError";
        case ErrorCode::TimeoutError: return "TimeoutError";
        case ErrorCode::UnknownServerError: return "UnknownServerError";
        case ErrorCode::UnknownToolError: return "UnknownToolError";
        case ErrorCode::NotReadyError: return "NotReadyError";
        case ErrorCode::HealthCheckError: return "HealthCheckError";
        case ErrorCode::ConnectionLostError: return "ConnectionLostError";
        case ErrorCode::ToolCallError: return "ToolCallError";
    }
    return "Unknown";
}

/// @brief Represents an error with a code and descriptive message.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message) });
}

} // namespace mcplink

template <>
struct std::formatter<mcplink::Error>: std::formatter<std::string>
{
    auto format(const mcplink::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", mcplink::errorCodeName(error.code), error.message), ctx);
    }
};
