// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Log.hpp>
#include <core/Types.hpp>
#include <mcp/HealthMonitor.hpp>
#include <mcp/ServerConnection.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace mcplink
{

/// @brief One entry of the mcpServers section.
struct ServerEntry
{
    ServerDescriptor descriptor;
    bool enabled = true;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    /// @brief Servers in configuration order, including disabled ones.
    std::vector<ServerEntry> servers;

    ConnectionOptions connection;
    HealthOptions healthCheck;
    log::Level logLevel = log::Level::Info;

    /// @brief Descriptors of the enabled servers, in configuration order.
    [[nodiscard]] auto enabledServers() const -> std::vector<ServerDescriptor>;
};

/// @brief Loads the configuration from the default config path.
///
/// A missing file yields the default configuration.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the configuration from a specific file path.
/// @return The loaded configuration or a ConfigError.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Parses configuration JSON text.
/// @return The configuration, or a ConfigError naming the offending server.
[[nodiscard]] auto parseConfig(std::string_view text) -> Result<AppConfig>;

/// @brief Saves the configuration to a file, creating parent directories.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Splits a ws:// or wss:// URL into a WebSocket endpoint.
[[nodiscard]] auto parseWebSocketUrl(std::string_view url) -> Result<WebSocketConfig>;

/// @brief Returns the default config directory path for the current platform.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

} // namespace mcplink
