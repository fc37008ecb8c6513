// SPDX-License-Identifier: Apache-2.0
#include "Backoff.hpp"

#include <algorithm>
#include <mutex>
#include <random>

namespace mcplink
{

auto computeBackoffDelay(const ReconnectPolicy& policy, int attempt, double jitterSample)
    -> std::chrono::milliseconds
{
    auto const base = std::max<std::chrono::milliseconds::rep>(policy.baseDelay.count(), 0);
    auto const cap = std::max<std::chrono::milliseconds::rep>(policy.maxDelay.count(), base);

    // Doubling past 2^30 would overflow long before the cap matters.
    auto const exponent = std::clamp(attempt - 1, 0, 30);
    auto const nominal = std::min(static_cast<double>(base) * static_cast<double>(1LL << exponent),
                                  static_cast<double>(cap));

    auto const spread = std::clamp(policy.jitter, 0.0, 1.0) * std::clamp(jitterSample, -1.0, 1.0);
    auto const delay = std::max(0.0, nominal * (1.0 + spread));
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(delay));
}

auto computeBackoffDelay(const ReconnectPolicy& policy, int attempt) -> std::chrono::milliseconds
{
    static auto mutex = std::mutex {};
    static auto engine = std::mt19937 { std::random_device {}() };

    auto sample = 0.0;
    {
        auto lock = std::lock_guard(mutex);
        sample = std::uniform_real_distribution<double>(-1.0, 1.0)(engine);
    }
    return computeBackoffDelay(policy, attempt, sample);
}

} // namespace mcplink
