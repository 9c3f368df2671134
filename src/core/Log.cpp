// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <core/Time.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <map>
#include <mutex>
#include <string>

namespace mcpmux::log
{

namespace
{
    struct Output
    {
        std::mutex mutex;
        std::ofstream file;
        std::map<std::size_t, Sink> sinks;
        std::size_t nextHandle = 1;
    };

    auto output() -> Output&
    {
        static auto instance = Output {};
        return instance;
    }

    auto currentLevel = std::atomic<Level> { Level::Info };

    constexpr auto label(Level level) -> std::string_view
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

auto toString(Level level) -> std::string_view
{
    switch (level)
    {
        case Level::Error: return "error";
        case Level::Warning: return "warning";
        case Level::Info: return "info";
        case Level::Debug: return "debug";
        case Level::Trace: return "trace";
    }
    return "info";
}

auto levelFromString(std::string_view name) -> std::optional<Level>
{
    auto lower = std::string(name);
    std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return std::tolower(c); });

    if (lower == "critical")
        return Level::Error;
    if (lower == "warn")
        return Level::Warning;
    for (auto const level: { Level::Error, Level::Warning, Level::Info, Level::Debug, Level::Trace })
    {
        if (toString(level) == lower)
            return level;
    }
    return std::nullopt;
}

void setLevel(Level level)
{
    currentLevel = level;
}

auto getLevel() -> Level
{
    return currentLevel;
}

auto addSink(Sink sink) -> std::size_t
{
    auto& out = output();
    auto lock = std::lock_guard(out.mutex);
    auto const handle = out.nextHandle++;
    out.sinks.emplace(handle, std::move(sink));
    return handle;
}

void removeSink(std::size_t handle)
{
    auto& out = output();
    auto lock = std::lock_guard(out.mutex);
    out.sinks.erase(handle);
}

auto setLogFile(std::string_view path) -> bool
{
    auto& out = output();
    auto lock = std::lock_guard(out.mutex);
    if (out.file.is_open())
        out.file.close();

    if (path.empty())
        return true;

    out.file.open(std::string(path), std::ios::app);
    return out.file.is_open();
}

void write(Level level, std::string_view message)
{
    if (level > currentLevel)
        return;

    auto const line =
        std::format("{} [{}] {}\n", formatTimestamp(std::chrono::system_clock::now()), label(level), message);

    auto& out = output();
    auto lock = std::lock_guard(out.mutex);
    std::fputs(line.c_str(), stderr);
    if (out.file.is_open())
        out.file << line << std::flush;
    for (const auto& [handle, sink]: out.sinks)
        sink(level, message);
}

} // namespace mcpmux::log
