// SPDX-License-Identifier: Apache-2.0
#include "HealthMonitor.hpp"

#include <core/Log.hpp>

#include <condition_variable>
#include <map>
#include <mutex>
#include <stop_token>
#include <thread>

namespace mcplink
{

struct HealthMonitor::Impl
{
    HealthOptions options;
    FailureCallback onFailure;

    mutable std::mutex mutex;
    std::condition_variable_any wakeup;
    std::map<std::string, std::shared_ptr<ServerConnection>> connections;
    std::map<std::string, std::jthread> workers;
    std::map<std::string, HealthStatus> statuses;

    void record(const std::string& name, HealthStatus status)
    {
        auto lock = std::lock_guard(mutex);
        if (connections.contains(name))
            statuses.insert_or_assign(name, std::move(status));
    }

    auto check(ServerConnection& connection, const std::stop_token& token = {}) -> HealthStatus
    {
        auto status = HealthStatus { .lastCheck = std::chrono::system_clock::now() };

        if (auto const state = connection.state(); state != ConnectionState::Ready)
        {
            status.error = std::format("not ready ({})", state);
            record(connection.name(), status);
            return status;
        }

        auto latency = connection.ping(options.timeout);
        if (latency)
        {
            status.healthy = true;
            status.latency = *latency;
            log::trace("[{}] health check ok ({} ms)", connection.name(), latency->count());
            record(connection.name(), status);
            return status;
        }

        status.error = latency.error().message;
        if (token.stop_requested())
            return status;
        record(connection.name(), status);

        log::warning("[{}] health check failed: {}", connection.name(), status.error);
        connection.reportHealthFailure(status.error);
        if (onFailure)
            onFailure(connection.name(), status.error);
        return status;
    }

    void run(const std::stop_token& token, ServerConnection& connection)
    {
        while (!token.stop_requested())
        {
            {
                auto lock = std::unique_lock(mutex);
                wakeup.wait_for(lock, token, options.interval, [] { return false; });
            }
            if (token.stop_requested())
                return;
            check(connection, token);
        }
    }
};

HealthMonitor::HealthMonitor(HealthOptions options, FailureCallback onFailure): _impl(std::make_unique<Impl>())
{
    _impl->options = options;
    _impl->onFailure = std::move(onFailure);
}

HealthMonitor::~HealthMonitor()
{
    stop();
}

void HealthMonitor::watch(std::shared_ptr<ServerConnection> connection)
{
    auto const name = connection->name();
    unwatch(name);

    auto lock = std::lock_guard(_impl->mutex);
    _impl->connections[name] = connection;
    if (_impl->options.enabled)
    {
        _impl->workers[name] = std::jthread(
            [this, connection](const std::stop_token& token) { _impl->run(token, *connection); });
    }
    log::debug("[{}] health monitoring {} (every {} ms)",
               name,
               _impl->options.enabled ? "enabled" : "disabled",
               _impl->options.interval.count());
}

void HealthMonitor::unwatch(const std::string& serverName)
{
    auto connection = std::shared_ptr<ServerConnection> {};
    auto worker = std::jthread {};
    {
        auto lock = std::lock_guard(_impl->mutex);
        if (auto it = _impl->connections.find(serverName); it != _impl->connections.end())
        {
            connection = std::move(it->second);
            _impl->connections.erase(it);
        }
        _impl->statuses.erase(serverName);
        if (auto it = _impl->workers.find(serverName); it != _impl->workers.end())
        {
            worker = std::move(it->second);
            _impl->workers.erase(it);
        }
    }
    // Joined outside the lock; the worker may be waiting for it. The connection
    // is released last since its destructor may run here.
    if (worker.joinable())
    {
        worker.request_stop();
        worker.join();
    }
    connection.reset();
}

void HealthMonitor::requestStop()
{
    auto lock = std::lock_guard(_impl->mutex);
    for (auto& [name, worker]: _impl->workers)
        worker.request_stop();
}

void HealthMonitor::stop()
{
    auto connections = std::map<std::string, std::shared_ptr<ServerConnection>> {};
    auto workers = std::map<std::string, std::jthread> {};
    {
        auto lock = std::lock_guard(_impl->mutex);
        workers.swap(_impl->workers);
        connections.swap(_impl->connections);
    }
    for (auto& [name, worker]: workers)
        worker.request_stop();
    workers.clear();
    connections.clear();
}

auto HealthMonitor::checkNow(const std::string& serverName) -> Result<HealthStatus>
{
    auto connection = std::shared_ptr<ServerConnection> {};
    {
        auto lock = std::lock_guard(_impl->mutex);
        if (auto it = _impl->connections.find(serverName); it != _impl->connections.end())
            connection = it->second;
    }
    if (!connection)
        return makeError(ErrorCode::UnknownServerError, std::format("Server '{}' is not monitored", serverName));

    return _impl->check(*connection);
}

auto HealthMonitor::status(const std::string& serverName) const -> std::optional<HealthStatus>
{
    auto lock = std::lock_guard(_impl->mutex);
    if (auto it = _impl->statuses.find(serverName); it != _impl->statuses.end())
        return it->second;
    return std::nullopt;
}

auto HealthMonitor::summary() const -> HealthSummary
{
    auto lock = std::lock_guard(_impl->mutex);

    auto result = HealthSummary { .total = _impl->connections.size() };
    auto totalLatency = std::chrono::milliseconds { 0 };
    for (auto const& [name, status]: _impl->statuses)
    {
        if (status.healthy)
        {
            ++result.healthy;
            totalLatency += status.latency;
        }
        else
        {
            result.unhealthy.push_back(name);
        }
    }
    if (result.healthy > 0)
        result.averageLatency = totalLatency / static_cast<std::chrono::milliseconds::rep>(result.healthy);
    return result;
}

} // namespace mcplink
