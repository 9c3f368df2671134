// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <string>

namespace mcpmux
{

/// @brief Formats a time point as UTC ISO-8601 with milliseconds, e.g. `2024-05-01T12:00:00.250Z`.
[[nodiscard]] auto formatTimestamp(std::chrono::system_clock::time_point time) -> std::string;

} // namespace mcpmux
