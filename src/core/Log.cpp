// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <atomic>
#include <mutex>
#include <print>

namespace mcplink::log
{

namespace
{
    auto globalLevel = std::atomic<Level> { Level::Info };
    auto globalCallback = LogCallback {};
    auto globalMutex = std::mutex {};
} // namespace

void setCallback(LogCallback callback)
{
    auto lock = std::lock_guard(globalMutex);
    globalCallback = std::move(callback);
}

void setLevel(Level level)
{
    globalLevel.store(level, std::memory_order_relaxed);
}

auto getLevel() -> Level
{
    return globalLevel.load(std::memory_order_relaxed);
}

auto levelName(Level level) -> std::string_view
{
    switch (level)
    {
        case Level::Error: return "error";
        case Level::Warning: return "warning";
        case Level::Info: return "info";
        case Level::Debug: return "debug";
        case Level::Trace: return "trace";
    }
    return "unknown";
}

auto parseLevel(std::string_view name) -> std::optional<Level>
{
    for (auto const level: { Level::Error, Level::Warning, Level::Info, Level::Debug, Level::Trace })
    {
        if (levelName(level) == name)
            return level;
    }
    if (name == "warn")
        return Level::Warning;
    return std::nullopt;
}

void write(Level level, std::string_view message)
{
    if (level > getLevel())
        return;

    auto lock = std::lock_guard(globalMutex);

    if (globalCallback)
    {
        globalCallback(level, message);
        return;
    }

    constexpr auto levelPrefix = [](Level l) -> std::string_view {
        switch (l)
        {
            case Level::Error: return "ERROR";
            case Level::Warning: return "WARN ";
            case Level::Info: return "INFO ";
            case Level::Debug: return "DEBUG";
            case Level::Trace: return "TRACE";
        }
        return "?????";
    };

    std::println(stderr, "[{}] {}", levelPrefix(level), message);
}

} // namespace mcplink::log
