// SPDX-License-Identifier: Apache-2.0
#include "Time.hpp"

#include <ctime>
#include <format>

namespace mcpmux
{

auto formatTimestamp(std::chrono::system_clock::time_point time) -> std::string
{
    auto const seconds = std::chrono::system_clock::to_time_t(time);
    auto const millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count() % 1000;

    auto tm = std::tm {};
    gmtime_r(&seconds, &tm);
    return std::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                       tm.tm_year + 1900,
                       tm.tm_mon + 1,
                       tm.tm_mday,
                       tm.tm_hour,
                       tm.tm_min,
                       tm.tm_sec,
                       millis);
}

} // namespace mcpmux
