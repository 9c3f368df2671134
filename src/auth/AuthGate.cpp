// SPDX-License-Identifier: Apache-2.0
#include "AuthGate.hpp"

#include <core/Log.hpp>

namespace mcpmux::auth
{

auto bearerToken(std::string_view authorizationHeader) -> std::optional<std::string_view>
{
    constexpr auto Prefix = std::string_view("Bearer ");
    if (!authorizationHeader.starts_with(Prefix))
        return std::nullopt;
    return authorizationHeader.substr(Prefix.size());
}

AuthGate::AuthGate(AuthGateConfig config): _config(std::move(config))
{
    if (_config.apiToken.empty())
        log::warning("No API token configured: the MCP endpoint accepts unauthenticated tool calls");
    if (_config.uiPassword.empty())
        log::warning("No admin password configured: admin login is disabled");
}

auto AuthGate::authorizeToolCall(std::string_view requestToken) const -> bool
{
    if (_config.apiToken.empty())
        return true;
    return constantTimeEquals(requestToken, _config.apiToken);
}

auto AuthGate::authorizeAdmin(std::string_view sessionToken) -> bool
{
    return _sessions.validate(sessionToken);
}

auto AuthGate::login(std::string_view password, std::string_view clientAddress) -> Result<std::string>
{
    {
        auto lock = std::lock_guard(_failuresMutex);
        auto const now = Clock::now();
        if (isRateLimitedLocked(clientAddress, now))
        {
            log::warning("Rate limit exceeded for {}", clientAddress);
            return makeError(ErrorCode::AuthError, "Too many failed login attempts; try again later");
        }

        if (_config.uiPassword.empty() || !constantTimeEquals(password, _config.uiPassword))
        {
            auto it = _failures.find(clientAddress);
            if (it == _failures.end())
                it = _failures.emplace(std::string(clientAddress), std::vector<Clock::time_point> {}).first;
            it->second.push_back(now);
            log::warning("Failed login attempt from {}", clientAddress);
            return makeError(ErrorCode::AuthError, "Invalid password");
        }

        if (auto const it = _failures.find(clientAddress); it != _failures.end())
            _failures.erase(it);
    }

    auto token = _sessions.create(_config.sessionTtl);
    if (!token)
        return makeError(ErrorCode::AuthError, token.error().message);
    return token;
}

void AuthGate::logout(std::string_view sessionToken)
{
    _sessions.invalidate(sessionToken);
}

auto AuthGate::isRateLimited(std::string_view clientAddress) -> bool
{
    auto lock = std::lock_guard(_failuresMutex);
    return isRateLimitedLocked(clientAddress, Clock::now());
}

auto AuthGate::purgeExpiredFailures() -> std::size_t
{
    auto lock = std::lock_guard(_failuresMutex);
    auto const now = Clock::now();
    auto purged = std::size_t { 0 };
    for (auto it = _failures.begin(); it != _failures.end();)
    {
        std::erase_if(it->second, [&](Clock::time_point attempt) { return now - attempt >= _config.lockoutWindow; });
        if (it->second.empty())
        {
            it = _failures.erase(it);
            ++purged;
        }
        else
        {
            ++it;
        }
    }
    return purged;
}

auto AuthGate::trackedClients() -> std::size_t
{
    auto lock = std::lock_guard(_failuresMutex);
    return _failures.size();
}

auto AuthGate::isRateLimitedLocked(std::string_view clientAddress, Clock::time_point now) -> bool
{
    auto const it = _failures.find(clientAddress);
    if (it == _failures.end())
        return false;

    std::erase_if(it->second, [&](Clock::time_point attempt) { return now - attempt >= _config.lockoutWindow; });
    if (it->second.empty())
    {
        _failures.erase(it);
        return false;
    }
    return it->second.size() >= _config.maxLoginFailures;
}

} // namespace mcpmux::auth
