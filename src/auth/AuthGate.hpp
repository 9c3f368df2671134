// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <auth/SessionStore.hpp>
#include <core/Error.hpp>

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpmux::auth
{

struct AuthGateConfig
{
    std::string apiToken;   ///< Empty leaves the tool endpoint open.
    std::string uiPassword; ///< Empty disables admin login.
    std::chrono::seconds sessionTtl { 3600 };
    std::size_t maxLoginFailures = 5;
    std::chrono::seconds lockoutWindow { 300 };
};

/// @brief Extracts the token of an `Authorization: Bearer <token>` header value.
[[nodiscard]] auto bearerToken(std::string_view authorizationHeader) -> std::optional<std::string_view>;

/// @brief Decides who may call tools and who may administer the gateway.
///
/// The authorize functions only accept or reject. Sessions are created and destroyed
/// by login() and logout().
class AuthGate
{
  public:
    explicit AuthGate(AuthGateConfig config);

    /// @brief Checks the bearer token of a tool-endpoint request.
    [[nodiscard]] auto authorizeToolCall(std::string_view requestToken) const -> bool;

    /// @brief Returns true if no API token is configured.
    [[nodiscard]] auto toolEndpointOpen() const -> bool { return _config.apiToken.empty(); }

    [[nodiscard]] auto authorizeAdmin(std::string_view sessionToken) -> bool;

    /// @brief Exchanges the admin password for a session token.
    /// @return The token, or an AuthError for a wrong password, disabled login or a rate-limited client.
    [[nodiscard]] auto login(std::string_view password, std::string_view clientAddress) -> Result<std::string>;

    void logout(std::string_view sessionToken);

    /// @brief Returns true once a client has used up its failed attempts within the lockout window.
    [[nodiscard]] auto isRateLimited(std::string_view clientAddress) -> bool;

    /// @brief Forgets failed attempts that fell out of the lockout window.
    /// @return The number of clients that no longer have any recorded failure.
    auto purgeExpiredFailures() -> std::size_t;

    /// @brief Returns the number of clients with recorded failed attempts.
    [[nodiscard]] auto trackedClients() -> std::size_t;

    [[nodiscard]] auto sessions() -> SessionStore& { return _sessions; }

  private:
    using Clock = std::chrono::steady_clock;

    AuthGateConfig _config;
    SessionStore _sessions;

    std::mutex _failuresMutex;
    std::map<std::string, std::vector<Clock::time_point>, std::less<>> _failures;

    [[nodiscard]] auto isRateLimitedLocked(std::string_view clientAddress, Clock::time_point now) -> bool;
};

} // namespace mcpmux::auth
