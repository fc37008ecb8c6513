// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/ServerConnection.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcplink
{

struct HealthOptions
{
    bool enabled = true;
    std::chrono::milliseconds interval { 30000 };
    std::chrono::milliseconds timeout { 5000 };
};

/// @brief Outcome of the most recent liveness check of one server.
struct HealthStatus
{
    bool healthy = false;
    std::chrono::milliseconds latency { 0 };
    std::chrono::system_clock::time_point lastCheck;
    std::string error;
};

struct HealthSummary
{
    std::size_t total = 0;   ///< Watched servers.
    std::size_t healthy = 0; ///< Servers whose last check passed.
    std::chrono::milliseconds averageLatency { 0 }; ///< Over healthy servers.
    std::vector<std::string> unhealthy;             ///< Servers whose last check failed.
};

/// @brief Periodically pings every watched Ready connection.
///
/// Each server is checked by its own worker thread, so a slow server never
/// delays the others. A failed ping is reported to the connection, which
/// treats it like a transport closure. No lock is held while a ping is in flight.
class HealthMonitor
{
  public:
    using FailureCallback = std::function<void(const std::string& server, const std::string& reason)>;

    explicit HealthMonitor(HealthOptions options = {}, FailureCallback onFailure = {});
    ~HealthMonitor();

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    /// @brief Starts checking @p connection. The monitor shares ownership until unwatch() or stop().
    void watch(std::shared_ptr<ServerConnection> connection);

    void unwatch(const std::string& serverName);

    /// @brief Asks every worker to finish without waiting for it. A check whose
    /// ping fails after this point reports nothing.
    void requestStop();

    /// @brief Stops all workers. Idempotent.
    ///
    /// A ping in flight is not interrupted; stop the connections first to
    /// release it immediately.
    void stop();

    /// @brief Runs one check immediately on the calling thread.
    [[nodiscard]] auto checkNow(const std::string& serverName) -> Result<HealthStatus>;

    [[nodiscard]] auto status(const std::string& serverName) const -> std::optional<HealthStatus>;
    [[nodiscard]] auto summary() const -> HealthSummary;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcplink
