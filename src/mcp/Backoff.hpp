// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>

namespace mcplink
{

/// @brief Exponential backoff parameters for reconnecting a lost server.
struct ReconnectPolicy
{
    std::chrono::milliseconds baseDelay { 1000 };
    std::chrono::milliseconds maxDelay { 30000 };
    int maxAttempts = 5;
    double jitter = 0.2; ///< Relative spread, 0.2 means +/-20%.
};

/// @brief Computes the delay before reconnect attempt number @p attempt (1-based).
///
/// The nominal delay is baseDelay * 2^(attempt-1), capped at maxDelay, then scaled
/// by (1 + jitter * jitterSample).
///
/// @param jitterSample A value in [-1, 1].
[[nodiscard]] auto computeBackoffDelay(const ReconnectPolicy& policy, int attempt, double jitterSample)
    -> std::chrono::milliseconds;

/// @brief Same as above with a random jitter sample.
[[nodiscard]] auto computeBackoffDelay(const ReconnectPolicy& policy, int attempt) -> std::chrono::milliseconds;

} // namespace mcplink
