// SPDX-License-Identifier: Apache-2.0
#include <mcp/HealthMonitor.hpp>

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <memory>

#include "MockServer.hpp"

using namespace mcplink;
using namespace mcplink::test;
using namespace std::chrono_literals;

namespace
{

auto manualChecks() -> HealthOptions
{
    return HealthOptions { .enabled = false, .interval = 1h, .timeout = 100ms };
}

} // namespace

TEST_CASE("HealthMonitor rejects unknown servers", "[health]")
{
    auto monitor = HealthMonitor(manualChecks());
    auto const status = monitor.checkNow("ghost");
    REQUIRE(!status.has_value());
    CHECK(status.error().code == ErrorCode::UnknownServerError);
    CHECK(!monitor.status("ghost").has_value());
}

TEST_CASE("HealthMonitor records a healthy check", "[health]")
{
    auto server = std::make_shared<MockServer>();
    auto registry = ToolRegistry {};
    auto connection = std::make_shared<ServerConnection>(mockDescriptor("m"), registry, fastOptions(), server->factory(server));
    connection->start();
    REQUIRE(connection->awaitState(ConnectionState::Ready, 5s));

    auto monitor = HealthMonitor(manualChecks());
    monitor.watch(connection);

    CHECK(monitor.summary().total == 1);
    CHECK(monitor.summary().healthy == 0);
    CHECK(monitor.summary().unhealthy.empty());

    auto const status = monitor.checkNow("m");
    REQUIRE(status.has_value());
    CHECK(status->healthy);
    CHECK(status->error.empty());

    auto const summary = monitor.summary();
    CHECK(summary.total == 1);
    CHECK(summary.healthy == 1);
    CHECK(summary.unhealthy.empty());
    CHECK(server->countMethod("ping") == 1);
}

TEST_CASE("HealthMonitor does not ping a connection that is not Ready", "[health]")
{
    auto server = std::make_shared<MockServer>();
    server->failOpens(-1);
    auto registry = ToolRegistry {};
    auto connection = std::make_shared<ServerConnection>(mockDescriptor("down"), registry, fastOptions(0), server->factory(server));
    connection->start();
    REQUIRE(connection->awaitState(ConnectionState::Closed, 5s));

    auto monitor = HealthMonitor(manualChecks());
    monitor.watch(connection);

    auto const status = monitor.checkNow("down");
    REQUIRE(status.has_value());
    CHECK(!status->healthy);
    CHECK(status->error.find("Closed") != std::string::npos);
    CHECK(server->countMethod("ping") == 0);

    auto const summary = monitor.summary();
    REQUIRE(summary.unhealthy.size() == 1);
    CHECK(summary.unhealthy.front() == "down");
}

TEST_CASE("HealthMonitor failed ping degrades and reconnects the server", "[health]")
{
    auto server = std::make_shared<MockServer>();
    server->setTools({ "before" });
    auto registry = ToolRegistry {};
    auto connection = std::make_shared<ServerConnection>(mockDescriptor("m"), registry, fastOptions(), server->factory(server));
    connection->start();
    REQUIRE(connection->awaitState(ConnectionState::Ready, 5s));

    auto failures = std::atomic<int> { 0 };
    auto monitor = HealthMonitor(manualChecks(), [&](const std::string& name, const std::string&) {
        if (name == "m")
            ++failures;
    });
    monitor.watch(connection);

    server->answerPings(false);
    server->setTools({ "after" });

    auto const status = monitor.checkNow("m");
    REQUIRE(status.has_value());
    CHECK(!status->healthy);
    CHECK(!status->error.empty());
    CHECK(failures == 1);

    REQUIRE(eventually([&] { return server->opens() >= 2; }));
    REQUIRE(connection->awaitState(ConnectionState::Ready, 5s));
    CHECK(server->countMethod("initialize") == 2);
    CHECK(registry.find("m", "after").has_value());
    CHECK(!registry.find("m", "before").has_value());

    monitor.stop();
}

TEST_CASE("HealthMonitor checks periodically when enabled", "[health]")
{
    auto server = std::make_shared<MockServer>();
    auto registry = ToolRegistry {};
    auto connection = std::make_shared<ServerConnection>(mockDescriptor("m"), registry, fastOptions(), server->factory(server));
    connection->start();
    REQUIRE(connection->awaitState(ConnectionState::Ready, 5s));

    auto monitor = HealthMonitor(HealthOptions { .enabled = true, .interval = 20ms, .timeout = 1s });
    monitor.watch(connection);

    REQUIRE(eventually([&] { return server->countMethod("ping") >= 2; }));
    auto const status = monitor.status("m");
    REQUIRE(status.has_value());
    CHECK(status->healthy);

    monitor.unwatch("m");
    CHECK(!monitor.status("m").has_value());
    CHECK(monitor.summary().total == 0);
}

TEST_CASE("HealthMonitor shares ownership of watched connections", "[health]")
{
    auto server = std::make_shared<MockServer>();
    auto registry = ToolRegistry {};
    auto connection = std::make_shared<ServerConnection>(mockDescriptor("m"), registry, fastOptions(), server->factory(server));
    connection->start();
    REQUIRE(connection->awaitState(ConnectionState::Ready, 5s));

    auto monitor = HealthMonitor(manualChecks());
    monitor.watch(connection);

    auto const observer = std::weak_ptr<ServerConnection>(connection);
    connection.reset();
    CHECK(!observer.expired());

    auto const status = monitor.checkNow("m");
    REQUIRE(status.has_value());
    CHECK(status->healthy);

    monitor.unwatch("m");
    CHECK(observer.expired());
}

TEST_CASE("HealthMonitor stays silent about pings failing after a stop request", "[health]")
{
    auto server = std::make_shared<MockServer>();
    server->answerPings(false);
    auto registry = ToolRegistry {};
    auto connection = std::make_shared<ServerConnection>(mockDescriptor("m"), registry, fastOptions(), server->factory(server));
    connection->start();
    REQUIRE(connection->awaitState(ConnectionState::Ready, 5s));

    auto failures = std::atomic<int> { 0 };
    auto monitor = HealthMonitor(HealthOptions { .enabled = true, .interval = 10ms, .timeout = 10s },
                                 [&](const std::string&, const std::string&) { ++failures; });
    monitor.watch(connection);
    REQUIRE(eventually([&] { return server->countMethod("ping") >= 1; }));

    auto const started = std::chrono::steady_clock::now();
    monitor.requestStop();
    connection->stop();
    monitor.stop();

    CHECK(std::chrono::steady_clock::now() - started < 2s);
    CHECK(failures == 0);
    CHECK(!monitor.status("m").has_value());
}
