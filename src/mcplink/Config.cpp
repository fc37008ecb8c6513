// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>

#include <nlohmann/json.hpp>

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <set>
#include <sstream>
#include <type_traits>
#include <variant>

namespace mcplink
{

namespace
{

    using OrderedJson = nlohmann::ordered_json;

    auto millisecondsOr(const OrderedJson& section, std::string_view key, std::chrono::milliseconds fallback)
        -> std::chrono::milliseconds
    {
        return std::chrono::milliseconds(json::getIntOr(section, key, fallback.count()));
    }

    auto parseTransportKind(std::string_view type) -> std::optional<TransportKind>
    {
        if (type == "stdio")
            return TransportKind::Stdio;
        if (type == "websocket" || type == "ws")
            return TransportKind::WebSocket;
        if (type == "http")
            return TransportKind::Http;
        return std::nullopt;
    }

    auto detectTransportKind(const OrderedJson& server) -> std::optional<TransportKind>
    {
        if (server.contains("command"))
            return TransportKind::Stdio;

        auto const url = json::getStringOr(server, "url", "");
        if (url.starts_with("ws://") || url.starts_with("wss://"))
            return TransportKind::WebSocket;
        if (!url.empty())
            return TransportKind::Http;

        if (server.contains("host") && server.contains("port"))
            return TransportKind::WebSocket;
        return std::nullopt;
    }

    auto parseServer(const std::string& name, const OrderedJson& server) -> Result<ServerEntry>
    {
        if (!server.is_object())
            return makeError(ErrorCode::ConfigError, std::format("Server '{}': entry must be an object", name));

        auto kind = std::optional<TransportKind> {};
        if (server.contains("type"))
        {
            auto const type = json::getStringOr(server, "type", "");
            kind = parseTransportKind(type);
            if (!kind)
                return makeError(ErrorCode::ConfigError,
                                 std::format("Server '{}': unknown transport type '{}'", name, type));
        }
        else
        {
            kind = detectTransportKind(server);
            if (!kind)
                return makeError(ErrorCode::ConfigError,
                                 std::format("Server '{}': needs a command, a url or host and port", name));
        }

        auto entry = ServerEntry {
            .descriptor = ServerDescriptor { .name = name },
            .enabled = json::getBoolOr(server, "enabled", true),
        };

        switch (*kind)
        {
            case TransportKind::Stdio: {
                auto config = StdioConfig {
                    .command = json::getStringOr(server, "command", ""),
                    .args = json::getStringList(server, "args"),
                    .env = json::getStringMap(server, "env"),
                };
                if (config.command.empty())
                    return makeError(ErrorCode::ConfigError, std::format("Server '{}': missing command", name));
                entry.descriptor.transport = std::move(config);
                break;
            }
            case TransportKind::WebSocket: {
                auto const url = json::getStringOr(server, "url", "");
                auto config = WebSocketConfig {};
                if (!url.empty())
                {
                    auto parsed = parseWebSocketUrl(url);
                    if (!parsed)
                        return makeError(ErrorCode::ConfigError,
                                         std::format("Server '{}': {}", name, parsed.error().message));
                    config = std::move(*parsed);
                }
                else
                {
                    config.host = json::getStringOr(server, "host", "");
                    config.port = static_cast<int>(json::getIntOr(server, "port", 0));
                    config.path = json::getStringOr(server, "path", "/");
                    config.secure = json::getBoolOr(server, "secure", false);
                }
                if (config.host.empty() || config.port <= 0 || config.port > 65535)
                    return makeError(ErrorCode::ConfigError,
                                     std::format("Server '{}': websocket needs host and a valid port", name));
                entry.descriptor.transport = std::move(config);
                break;
            }
            case TransportKind::Http: {
                auto config = HttpConfig { .url = json::getStringOr(server, "url", "") };
                if (!config.url.starts_with("http://") && !config.url.starts_with("https://"))
                    return makeError(ErrorCode::ConfigError,
                                     std::format("Server '{}': http needs an http(s) url", name));
                entry.descriptor.transport = std::move(config);
                break;
            }
        }

        return entry;
    }

    auto parseServers(const OrderedJson& section, AppConfig& config) -> VoidResult
    {
        auto names = std::set<std::string> {};
        auto add = [&](const std::string& name, const OrderedJson& server) -> VoidResult {
            if (name.empty())
                return makeError(ErrorCode::ConfigError, "Server entry without a name");
            if (!names.insert(name).second)
                return makeError(ErrorCode::ConfigError, std::format("Duplicate server name '{}'", name));

            auto entry = parseServer(name, server);
            if (!entry)
                return std::unexpected(entry.error());
            config.servers.push_back(std::move(*entry));
            return {};
        };

        if (section.is_object())
        {
            for (auto const& [name, server]: section.items())
            {
                if (auto added = add(name, server); !added)
                    return added;
            }
            return {};
        }

        if (section.is_array())
        {
            for (auto const& server: section)
            {
                if (auto added = add(json::getStringOr(server, "name", ""), server); !added)
                    return added;
            }
            return {};
        }

        return makeError(ErrorCode::ConfigError, "mcpServers must be an object or an array");
    }

} // namespace

auto AppConfig::enabledServers() const -> std::vector<ServerDescriptor>
{
    auto descriptors = std::vector<ServerDescriptor> {};
    for (auto const& entry: servers)
    {
        if (entry.enabled)
            descriptors.push_back(entry.descriptor);
    }
    return descriptors;
}

auto parseWebSocketUrl(std::string_view url) -> Result<WebSocketConfig>
{
    auto config = WebSocketConfig {};
    if (url.starts_with("wss://"))
    {
        config.secure = true;
        url.remove_prefix(6);
    }
    else if (url.starts_with("ws://"))
    {
        url.remove_prefix(5);
    }
    else
    {
        return makeError(ErrorCode::ConfigError, std::format("Not a WebSocket URL: '{}'", url));
    }

    auto const slash = url.find('/');
    auto const hostPort = url.substr(0, slash);
    config.path = slash == std::string_view::npos ? "/" : std::string(url.substr(slash));

    auto const colon = hostPort.rfind(':');
    if (colon == std::string_view::npos)
    {
        config.host = std::string(hostPort);
        config.port = config.secure ? 443 : 80;
    }
    else
    {
        config.host = std::string(hostPort.substr(0, colon));
        auto const portText = hostPort.substr(colon + 1);
        auto const [ptr, ec] = std::from_chars(portText.data(), portText.data() + portText.size(), config.port);
        if (ec != std::errc {} || ptr != portText.data() + portText.size())
            return makeError(ErrorCode::ConfigError, std::format("Invalid port in URL: '{}'", portText));
    }

    if (config.host.empty())
        return makeError(ErrorCode::ConfigError, "WebSocket URL without host");
    return config;
}

auto defaultConfigDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\mcplink";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/mcplink";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig)
        return std::string(xdgConfig) + "/mcplink";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/mcplink";
    return ".";
#endif
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto parseConfig(std::string_view text) -> Result<AppConfig>
{
    auto parseResult = json::parse<OrderedJson>(text);
    if (!parseResult)
        return makeError(ErrorCode::ConfigError, parseResult.error().message);

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Configuration root must be an object");

    auto config = AppConfig {};

    // MCP servers section
    if (root.contains("mcpServers"))
    {
        if (auto parsed = parseServers(root["mcpServers"], config); !parsed)
            return std::unexpected(parsed.error());
    }

    // Connection section
    if (root.contains("connection"))
    {
        auto const& connection = root["connection"];
        config.connection.requestTimeout =
            millisecondsOr(connection, "requestTimeoutMs", config.connection.requestTimeout);
        config.connection.initializeTimeout =
            millisecondsOr(connection, "initializeTimeoutMs", config.connection.initializeTimeout);
    }

    // Reconnect section
    if (root.contains("reconnect"))
    {
        auto const& reconnect = root["reconnect"];
        auto& policy = config.connection.reconnect;
        policy.baseDelay = millisecondsOr(reconnect, "baseDelayMs", policy.baseDelay);
        policy.maxDelay = millisecondsOr(reconnect, "maxDelayMs", policy.maxDelay);
        policy.maxAttempts = static_cast<int>(json::getIntOr(reconnect, "maxAttempts", policy.maxAttempts));
        policy.jitter = json::getDoubleOr(reconnect, "jitter", policy.jitter);
        if (policy.maxAttempts < 0)
            return makeError(ErrorCode::ConfigError, "reconnect.maxAttempts must not be negative");
    }

    // Health check section
    if (root.contains("healthCheck"))
    {
        auto const& health = root["healthCheck"];
        config.healthCheck.enabled = json::getBoolOr(health, "enabled", config.healthCheck.enabled);
        config.healthCheck.interval = millisecondsOr(health, "intervalMs", config.healthCheck.interval);
        config.healthCheck.timeout = millisecondsOr(health, "timeoutMs", config.healthCheck.timeout);
        if (config.healthCheck.interval.count() <= 0)
            return makeError(ErrorCode::ConfigError, "healthCheck.intervalMs must be positive");
    }

    if (root.contains("logLevel"))
    {
        auto const name = json::getStringOr(root, "logLevel", "");
        auto const level = log::parseLevel(name);
        if (!level)
            return makeError(ErrorCode::ConfigError, std::format("Unknown log level '{}'", name));
        config.logLevel = *level;
    }

    return config;
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto config = parseConfig(ss.str());
    if (!config)
        return makeError(ErrorCode::ConfigError, std::format("{}: {}", path, config.error().message));
    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = OrderedJson::object();

    // MCP servers section
    auto servers = OrderedJson::object();
    for (auto const& entry: config.servers)
    {
        auto server = OrderedJson::object();
        server["type"] = transportKindToString(entry.descriptor.kind());
        std::visit(
            [&server](const auto& transport) {
                using T = std::decay_t<decltype(transport)>;
                if constexpr (std::is_same_v<T, StdioConfig>)
                {
                    server["command"] = transport.command;
                    if (!transport.args.empty())
                        server["args"] = transport.args;
                    if (!transport.env.empty())
                        server["env"] = transport.env;
                }
                else if constexpr (std::is_same_v<T, WebSocketConfig>)
                {
                    server["host"] = transport.host;
                    server["port"] = transport.port;
                    server["path"] = transport.path;
                    if (transport.secure)
                        server["secure"] = true;
                }
                else
                {
                    server["url"] = transport.url;
                }
            },
            entry.descriptor.transport);
        if (!entry.enabled)
            server["enabled"] = false;
        servers[entry.descriptor.name] = std::move(server);
    }
    root["mcpServers"] = std::move(servers);

    root["connection"] = {
        { "requestTimeoutMs", config.connection.requestTimeout.count() },
        { "initializeTimeoutMs", config.connection.initializeTimeout.count() },
    };

    auto const& policy = config.connection.reconnect;
    root["reconnect"] = {
        { "baseDelayMs", policy.baseDelay.count() },
        { "maxDelayMs", policy.maxDelay.count() },
        { "maxAttempts", policy.maxAttempts },
        { "jitter", policy.jitter },
    };

    root["healthCheck"] = {
        { "enabled", config.healthCheck.enabled },
        { "intervalMs", config.healthCheck.interval.count() },
        { "timeoutMs", config.healthCheck.timeout.count() },
    };

    root["logLevel"] = log::levelName(config.logLevel);

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }
    return loadConfigFromFile(path);
}

} // namespace mcplink
