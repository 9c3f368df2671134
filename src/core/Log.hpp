// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <format>
#include <functional>
#include <optional>
#include <string_view>

namespace mcpmux::log
{

enum class Level
{
    Error,
    Warning,
    Info,
    Debug,
    Trace,
};

[[nodiscard]] auto toString(Level level) -> std::string_view;

/// @brief Parses a level name such as "info" or "WARNING" (case-insensitive).
/// "critical" maps to Error and "warn" to Warning.
[[nodiscard]] auto levelFromString(std::string_view name) -> std::optional<Level>;

void setLevel(Level level);
[[nodiscard]] auto getLevel() -> Level;

/// @brief Receives each message that passes the level filter, unformatted.
using Sink = std::function<void(Level level, std::string_view message)>;

/// @brief Registers a sink next to stderr and the log file.
/// @return A handle for removeSink().
[[nodiscard]] auto addSink(Sink sink) -> std::size_t;
void removeSink(std::size_t handle);

/// @brief Appends every line to @p path as well. An empty path closes the file.
/// @return False if the file cannot be opened.
[[nodiscard]] auto setLogFile(std::string_view path) -> bool;

/// @brief Emits one line as `<UTC timestamp> [LEVEL] message`. Thread-safe.
void write(Level level, std::string_view message);

template <typename... Args>
void at(Level level, std::format_string<Args...> fmt, Args&&... args)
{
    if (level <= getLevel())
        write(level, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args)
{
    at(Level::Error, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args)
{
    at(Level::Warning, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args)
{
    at(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args)
{
    at(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void trace(std::format_string<Args...> fmt, Args&&... args)
{
    at(Level::Trace, fmt, std::forward<Args>(args)...);
}

} // namespace mcpmux::log
