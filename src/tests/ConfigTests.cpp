// SPDX-License-Identifier: Apache-2.0
#include <mcplink/Config.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

using namespace mcplink;
using namespace std::chrono_literals;

TEST_CASE("defaultConfigDir returns a non-empty path", "[config]")
{
    auto const dir = defaultConfigDir();
    REQUIRE(!dir.empty());
}

TEST_CASE("defaultConfigPath returns a path ending with config.json", "[config]")
{
    auto const path = defaultConfigPath();
    REQUIRE(path.ends_with("config.json"));
}

TEST_CASE("AppConfig has expected defaults", "[config]")
{
    auto const config = AppConfig {};
    CHECK(config.servers.empty());
    CHECK(config.connection.requestTimeout == 30s);
    CHECK(config.connection.reconnect.baseDelay == 1s);
    CHECK(config.connection.reconnect.maxDelay == 30s);
    CHECK(config.connection.reconnect.maxAttempts == 5);
    CHECK(config.healthCheck.enabled);
    CHECK(config.healthCheck.interval == 30s);
    CHECK(config.healthCheck.timeout == 5s);
    CHECK(config.logLevel == log::Level::Info);
}

TEST_CASE("parseConfig reads all three transports", "[config]")
{
    auto const config = parseConfig(R"({
        "mcpServers": {
            "fs": {
                "command": "mcp-fs",
                "args": ["--root", "/tmp"],
                "env": {"KEY": "value"}
            },
            "remote": { "url": "wss://tools.example.com:8443/mcp" },
            "api": { "type": "http", "url": "http://localhost:9000/rpc" },
            "local-ws": { "type": "websocket", "host": "127.0.0.1", "port": 7000 }
        }
    })");
    REQUIRE(config.has_value());
    REQUIRE(config->servers.size() == 4);

    // Configuration order is kept.
    auto const& fs = config->servers[0].descriptor;
    CHECK(fs.name == "fs");
    REQUIRE(fs.kind() == TransportKind::Stdio);
    auto const& stdio = std::get<StdioConfig>(fs.transport);
    CHECK(stdio.command == "mcp-fs");
    CHECK(stdio.args.size() == 2);
    CHECK(stdio.env.at("KEY") == "value");

    auto const& remote = config->servers[1].descriptor;
    REQUIRE(remote.kind() == TransportKind::WebSocket);
    auto const& ws = std::get<WebSocketConfig>(remote.transport);
    CHECK(ws.host == "tools.example.com");
    CHECK(ws.port == 8443);
    CHECK(ws.path == "/mcp");
    CHECK(ws.secure);

    auto const& api = config->servers[2].descriptor;
    REQUIRE(api.kind() == TransportKind::Http);
    CHECK(std::get<HttpConfig>(api.transport).url == "http://localhost:9000/rpc");

    auto const& local = config->servers[3].descriptor;
    REQUIRE(local.kind() == TransportKind::WebSocket);
    CHECK(std::get<WebSocketConfig>(local.transport).port == 7000);
    CHECK(std::get<WebSocketConfig>(local.transport).path == "/");
}

TEST_CASE("parseConfig accepts mcpServers as an array", "[config]")
{
    auto const config = parseConfig(R"({
        "mcpServers": [
            { "name": "a", "command": "server-a" },
            { "name": "b", "command": "server-b", "enabled": false }
        ]
    })");
    REQUIRE(config.has_value());
    REQUIRE(config->servers.size() == 2);
    CHECK(!config->servers[1].enabled);

    auto const enabled = config->enabledServers();
    REQUIRE(enabled.size() == 1);
    CHECK(enabled.front().name == "a");
}

TEST_CASE("parseConfig reads timing sections", "[config]")
{
    auto const config = parseConfig(R"({
        "connection": { "requestTimeoutMs": 1500, "initializeTimeoutMs": 2500 },
        "reconnect": { "baseDelayMs": 200, "maxDelayMs": 4000, "maxAttempts": 7, "jitter": 0.1 },
        "healthCheck": { "enabled": false, "intervalMs": 10000, "timeoutMs": 1000 },
        "logLevel": "debug"
    })");
    REQUIRE(config.has_value());
    CHECK(config->connection.requestTimeout == 1500ms);
    CHECK(config->connection.initializeTimeout == 2500ms);
    CHECK(config->connection.reconnect.baseDelay == 200ms);
    CHECK(config->connection.reconnect.maxDelay == 4000ms);
    CHECK(config->connection.reconnect.maxAttempts == 7);
    CHECK(config->connection.reconnect.jitter == 0.1);
    CHECK(!config->healthCheck.enabled);
    CHECK(config->healthCheck.interval == 10s);
    CHECK(config->healthCheck.timeout == 1s);
    CHECK(config->logLevel == log::Level::Debug);
}

TEST_CASE("parseConfig reports invalid entries with the server name", "[config]")
{
    auto expectError = [](std::string_view text, std::string_view fragment) {
        auto const config = parseConfig(text);
        REQUIRE(!config.has_value());
        CHECK(config.error().code == ErrorCode::ConfigError);
        CHECK(config.error().message.find(fragment) != std::string::npos);
    };

    SECTION("unknown type")
    {
        expectError(R"({"mcpServers": {"odd": {"type": "carrier-pigeon"}}})", "odd");
    }

    SECTION("no transport fields")
    {
        expectError(R"({"mcpServers": {"empty": {}}})", "empty");
    }

    SECTION("bad websocket port")
    {
        expectError(R"({"mcpServers": {"sock": {"type": "ws", "host": "h", "port": 70000}}})", "sock");
    }

    SECTION("http without http url")
    {
        expectError(R"({"mcpServers": {"api": {"type": "http", "url": "ftp://x"}}})", "api");
    }

    SECTION("duplicate name in array form")
    {
        expectError(R"({"mcpServers": [{"name": "x", "command": "a"}, {"name": "x", "command": "b"}]})", "x");
    }

    SECTION("negative retry budget")
    {
        expectError(R"({"reconnect": {"maxAttempts": -1}})", "maxAttempts");
    }

    SECTION("unknown log level")
    {
        expectError(R"({"logLevel": "chatty"})", "chatty");
    }

    SECTION("malformed JSON")
    {
        auto const config = parseConfig("{ invalid json }");
        REQUIRE(!config.has_value());
        CHECK(config.error().code == ErrorCode::ConfigError);
    }
}

TEST_CASE("parseWebSocketUrl", "[config]")
{
    auto plain = parseWebSocketUrl("ws://localhost");
    REQUIRE(plain.has_value());
    CHECK(plain->host == "localhost");
    CHECK(plain->port == 80);
    CHECK(plain->path == "/");
    CHECK(!plain->secure);

    auto secure = parseWebSocketUrl("wss://example.com/socket");
    REQUIRE(secure.has_value());
    CHECK(secure->port == 443);
    CHECK(secure->path == "/socket");

    CHECK(!parseWebSocketUrl("http://example.com").has_value());
    CHECK(!parseWebSocketUrl("ws://host:notaport/").has_value());
    CHECK(!parseWebSocketUrl("ws://:80/").has_value());
}

TEST_CASE("loadConfigFromFile returns error for missing file", "[config]")
{
    auto const result = loadConfigFromFile("/nonexistent/path/config.json");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
}

TEST_CASE("saveConfigToFile and loadConfigFromFile preserve the configuration", "[config]")
{
    auto const tempPath = std::filesystem::temp_directory_path() / "mcplink_test_save" / "config.json";
    std::filesystem::remove_all(tempPath.parent_path());

    auto config = AppConfig {};
    config.servers.push_back(ServerEntry {
        .descriptor = { .name = "fs", .transport = StdioConfig { .command = "mcp-fs", .args = { "--ro" } } },
    });
    config.servers.push_back(ServerEntry {
        .descriptor = { .name = "ws", .transport = WebSocketConfig { .host = "h", .port = 81, .path = "/x", .secure = true } },
        .enabled = false,
    });
    config.servers.push_back(ServerEntry {
        .descriptor = { .name = "api", .transport = HttpConfig { .url = "https://api.example.com/mcp" } },
    });
    config.connection.reconnect.maxAttempts = 2;
    config.healthCheck.interval = 5s;
    config.logLevel = log::Level::Warning;

    REQUIRE(saveConfigToFile(tempPath.string(), config).has_value());

    auto const loaded = loadConfigFromFile(tempPath.string());
    REQUIRE(loaded.has_value());
    REQUIRE(loaded->servers.size() == 3);
    CHECK(loaded->servers[0].descriptor.name == "fs");
    CHECK(std::get<StdioConfig>(loaded->servers[0].descriptor.transport).args.front() == "--ro");
    CHECK(!loaded->servers[1].enabled);
    CHECK(std::get<WebSocketConfig>(loaded->servers[1].descriptor.transport).secure);
    CHECK(loaded->servers[2].descriptor.kind() == TransportKind::Http);
    CHECK(loaded->connection.reconnect.maxAttempts == 2);
    CHECK(loaded->healthCheck.interval == 5s);
    CHECK(loaded->logLevel == log::Level::Warning);

    std::filesystem::remove_all(tempPath.parent_path());
}
