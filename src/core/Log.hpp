// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <format>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace pagent::log
{

/// @brief Verbosity level for log messages.
enum class Level
{
    Error,
    Warning,
    Info,
    Debug,
    Trace,
};

/// @brief A single log line as handed to a sink.
struct Record
{
    Level level = Level::Info;

    /// Tag of the emitting thread, empty for untagged threads.
    std::string_view thread;
    std::string_view message;
};

/// @brief Receives every log record that passes the level filter.
using LogCallback = std::function<void(const Record& record)>;

/// @brief Routes log records to @p callback instead of stderr.
///
/// Pass an empty callback to revert to stderr output. Records are delivered one at a time,
/// but possibly from different threads.
void setCallback(LogCallback callback);

void setLevel(Level level);
[[nodiscard]] auto getLevel() -> Level;

/// @brief Parses a level name ("error", "warning", "info", "debug", "trace").
[[nodiscard]] auto levelFromString(std::string_view name) -> std::optional<Level>;
[[nodiscard]] auto levelName(Level level) -> std::string_view;

/// @brief Names the calling thread in its log records, e.g. "ChatPresenter".
void setThreadTag(std::string tag);
[[nodiscard]] auto threadTag() -> std::string_view;

/// @brief Writes a log message at the given level.
void write(Level level, std::string_view message);

[[nodiscard]] inline auto enabled(Level level) -> bool
{
    return level <= getLevel();
}

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args)
{
    write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(Level::Warning))
        write(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(Level::Info))
        write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(Level::Debug))
        write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
}

/// @brief Logs a trace message. Presenters trace every event they handle.
template <typename... Args>
void trace(std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(Level::Trace))
        write(Level::Trace, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace pagent::log
