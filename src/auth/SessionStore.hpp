// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

namespace mcpmux::auth
{

/// @brief Returns @p bytes of OpenSSL randomness, hex-encoded.
[[nodiscard]] auto generateToken(std::size_t bytes = 32) -> Result<std::string>;

/// @brief Compares two secrets in time independent of where they differ.
[[nodiscard]] auto constantTimeEquals(std::string_view a, std::string_view b) -> bool;

/// @brief In-memory admin sessions with a fixed lifetime.
///
/// Unknown and expired tokens are rejected. Expired sessions are dropped when they are
/// looked up and by purgeExpired().
class SessionStore
{
  public:
    using Clock = std::chrono::steady_clock;

    /// @brief Creates a session that expires @p ttl from now.
    /// @return The 256-bit session token, or an IoError if no randomness is available.
    [[nodiscard]] auto create(std::chrono::seconds ttl) -> Result<std::string>;

    [[nodiscard]] auto validate(std::string_view token) -> bool;
    void invalidate(std::string_view token);

    /// @return The number of removed sessions.
    auto purgeExpired() -> std::size_t;

    [[nodiscard]] auto size() const -> std::size_t;

  private:
    mutable std::mutex _mutex;
    std::map<std::string, Clock::time_point, std::less<>> _sessions;
};

} // namespace mcpmux::auth
