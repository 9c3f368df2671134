// SPDX-License-Identifier: Apache-2.0
#include "SessionStore.hpp"

#include <core/Log.hpp>

#include <openssl/crypto.h>
#include <openssl/rand.h>

#include <format>
#include <vector>

namespace mcpmux::auth
{

auto generateToken(std::size_t bytes) -> Result<std::string>
{
    auto buffer = std::vector<unsigned char>(bytes);
    if (::RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1)
        return makeError(ErrorCode::IoError, "Cannot generate a random token");

    auto token = std::string {};
    token.reserve(bytes * 2);
    for (auto const byte: buffer)
        token += std::format("{:02x}", byte);
    return token;
}

auto constantTimeEquals(std::string_view a, std::string_view b) -> bool
{
    if (a.size() != b.size())
        return false;
    return ::CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

auto SessionStore::create(std::chrono::seconds ttl) -> Result<std::string>
{
    auto token = generateToken();
    if (!token)
        return token;

    auto lock = std::lock_guard(_mutex);
    _sessions[*token] = Clock::now() + ttl;
    log::info("Session created: {}...", token->substr(0, 8));
    return token;
}

auto SessionStore::validate(std::string_view token) -> bool
{
    if (token.empty())
        return false;

    auto lock = std::lock_guard(_mutex);
    auto const it = _sessions.find(token);
    if (it == _sessions.end())
        return false;

    if (Clock::now() >= it->second)
    {
        _sessions.erase(it);
        return false;
    }
    return true;
}

void SessionStore::invalidate(std::string_view token)
{
    auto lock = std::lock_guard(_mutex);
    if (auto const it = _sessions.find(token); it != _sessions.end())
    {
        _sessions.erase(it);
        log::info("Session invalidated: {}...", token.substr(0, 8));
    }
}

auto SessionStore::purgeExpired() -> std::size_t
{
    auto const now = Clock::now();
    auto lock = std::lock_guard(_mutex);
    return std::erase_if(_sessions, [now](const auto& session) { return now >= session.second; });
}

auto SessionStore::size() const -> std::size_t
{
    auto lock = std::lock_guard(_mutex);
    return _sessions.size();
}

} // namespace mcpmux::auth
