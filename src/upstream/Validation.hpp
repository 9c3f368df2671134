// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <upstream/Backend.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace mcpmux::validation
{

constexpr auto MaxBackendIdLength = std::size_t { 50 };
constexpr auto MaxArgs = std::size_t { 50 };
constexpr auto MaxArgLength = std::size_t { 500 };
constexpr auto MinServicePort = uint16_t { 1024 };

/// @brief Checks that @p id is 1-50 characters of `[A-Za-z0-9_-]`.
[[nodiscard]] auto validateBackendId(std::string_view id) -> VoidResult;

/// @brief Checks that @p url is an http(s) URL with a host and at most 2048 characters.
[[nodiscard]] auto validateUrl(std::string_view url) -> VoidResult;

/// @brief Checks that @p port is an unprivileged port (1024-65535).
[[nodiscard]] auto validatePort(uint16_t port) -> VoidResult;

/// @brief Checks the argument count and length limits.
[[nodiscard]] auto validateArgs(const std::vector<std::string>& args) -> VoidResult;

/// @brief Checks that @p command resolves to an executable file.
/// @return The resolved executable path, or a ConfigError.
[[nodiscard]] auto validateCommand(std::string_view command) -> Result<std::string>;

/// @brief Checks that a non-empty working directory exists.
[[nodiscard]] auto validateWorkingDirectory(std::string_view path) -> VoidResult;

/// @brief Returns true if a TCP listener can currently be bound to 127.0.0.1:@p port.
[[nodiscard]] auto isPortFree(uint16_t port) -> bool;

/// @brief Runs every self-contained check for a backend specification.
///
/// Checks that depend on other registered backends (duplicate ids, ports shared with
/// another Service backend) are the registry's job.
/// @return Success or the first ConfigError found.
[[nodiscard]] auto validateBackendSpec(const BackendSpec& spec) -> VoidResult;

} // namespace mcpmux::validation
