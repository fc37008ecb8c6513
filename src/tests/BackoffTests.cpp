// SPDX-License-Identifier: Apache-2.0
#include <mcp/Backoff.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace mcplink;
using namespace std::chrono_literals;

TEST_CASE("Backoff doubles per attempt up to the cap", "[backoff]")
{
    auto const policy = ReconnectPolicy { .baseDelay = 1000ms, .maxDelay = 30000ms, .maxAttempts = 10, .jitter = 0.2 };

    CHECK(computeBackoffDelay(policy, 1, 0.0) == 1000ms);
    CHECK(computeBackoffDelay(policy, 2, 0.0) == 2000ms);
    CHECK(computeBackoffDelay(policy, 3, 0.0) == 4000ms);
    CHECK(computeBackoffDelay(policy, 5, 0.0) == 16000ms);
    CHECK(computeBackoffDelay(policy, 6, 0.0) == 30000ms);
    CHECK(computeBackoffDelay(policy, 60, 0.0) == 30000ms);
}

TEST_CASE("Backoff jitter scales the nominal delay", "[backoff]")
{
    auto const policy = ReconnectPolicy { .baseDelay = 1000ms, .maxDelay = 30000ms, .maxAttempts = 5, .jitter = 0.2 };

    CHECK(computeBackoffDelay(policy, 1, 1.0) == 1200ms);
    CHECK(computeBackoffDelay(policy, 1, -1.0) == 800ms);
    CHECK(computeBackoffDelay(policy, 6, 1.0) == 36000ms);
}

TEST_CASE("Backoff random jitter stays within bounds", "[backoff]")
{
    auto const policy = ReconnectPolicy { .baseDelay = 1000ms, .maxDelay = 30000ms, .maxAttempts = 5, .jitter = 0.2 };

    for (auto i = 0; i < 100; ++i)
    {
        auto const delay = computeBackoffDelay(policy, 2);
        CHECK(delay >= 1600ms);
        CHECK(delay <= 2400ms);
    }
}

TEST_CASE("Backoff treats attempt zero like the first attempt", "[backoff]")
{
    auto const policy = ReconnectPolicy { .baseDelay = 500ms, .maxDelay = 1000ms, .maxAttempts = 5, .jitter = 0.0 };
    CHECK(computeBackoffDelay(policy, 0, 0.5) == 500ms);
}
