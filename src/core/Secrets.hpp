// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <map>
#include <string>
#include <string_view>

namespace mcpmux
{

/// @brief Returns true if the value uses `$NAME` environment indirection.
[[nodiscard]] auto isSecretReference(std::string_view value) -> bool;

/// @brief Resolves a configuration value that may reference an environment variable.
///
/// A value of the form `$NAME` is replaced by the value of the environment variable
/// `NAME` at the time of the call. Any other value is returned verbatim.
/// An unset (or empty) variable is a ConfigError; the value is never silently emptied.
/// @param value The configured value.
/// @param field The configuration field name, used in error messages.
/// @return The resolved value or a ConfigError.
[[nodiscard]] auto resolveSecret(std::string_view value, std::string_view field) -> Result<std::string>;

/// @brief Resolves every value of an environment map with resolveSecret().
[[nodiscard]] auto resolveSecrets(const std::map<std::string, std::string>& values, std::string_view field)
    -> Result<std::map<std::string, std::string>>;

/// @brief Masks a secret for log output, keeping at most the first four characters.
[[nodiscard]] auto maskSecret(std::string_view secret) -> std::string;

} // namespace mcpmux
