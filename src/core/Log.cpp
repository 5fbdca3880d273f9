// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <atomic>
#include <mutex>
#include <print>

namespace pagent::log
{

namespace
{
    auto globalLevel = std::atomic<Level> { Level::Info };
    auto sinkMutex = std::mutex {};
    auto sinkCallback = LogCallback {};
    thread_local auto currentThreadTag = std::string {};

    constexpr auto levelPrefix(Level level) -> std::string_view
    {
        switch (level)
        {
            case Level::Error: return "ERROR";
            case Level::Warning: return "WARN ";
            case Level::Info: return "INFO ";
            case Level::Debug: return "DEBUG";
            case Level::Trace: return "TRACE";
        }
        return "?????";
    }
} // namespace

void setCallback(LogCallback callback)
{
    auto lock = std::lock_guard(sinkMutex);
    sinkCallback = std::move(callback);
}

void setLevel(Level level)
{
    globalLevel.store(level, std::memory_order_relaxed);
}

auto getLevel() -> Level
{
    return globalLevel.load(std::memory_order_relaxed);
}

auto levelFromString(std::string_view name) -> std::optional<Level>
{
    if (name == "error")
        return Level::Error;
    if (name == "warning" || name == "warn")
        return Level::Warning;
    if (name == "info")
        return Level::Info;
    if (name == "debug")
        return Level::Debug;
    if (name == "trace")
        return Level::Trace;
    return std::nullopt;
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

void setThreadTag(std::string tag)
{
    currentThreadTag = std::move(tag);
}

auto threadTag() -> std::string_view
{
    return currentThreadTag;
}

void write(Level level, std::string_view message)
{
    if (!enabled(level))
        return;

    auto const record = Record { .level = level, .thread = currentThreadTag, .message = message };

    // One record at a time, so lines of concurrent workers never interleave.
    auto lock = std::lock_guard(sinkMutex);
    if (sinkCallback)
    {
        sinkCallback(record);
        return;
    }

    if (record.thread.empty())
        std::println(stderr, "[{}] {}", levelPrefix(level), message);
    else
        std::println(stderr, "[{}] [{}] {}", levelPrefix(level), record.thread, message);
}

} // namespace pagent::log
