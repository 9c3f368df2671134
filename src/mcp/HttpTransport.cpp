// SPDX-License-Identifier: Apache-2.0
#include "HttpTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>
#include <net/HttpClient.hpp>

#include <atomic>
#include <deque>
#include <format>
#include <mutex>
#include <stop_token>

namespace mcpmux
{

namespace
{
    constexpr auto NotificationTimeout = std::chrono::milliseconds(5000);
    constexpr auto CloseTimeout = std::chrono::milliseconds(2000);

    auto trimmed(std::string_view text) -> std::string_view
    {
        while (!text.empty() && (text.back() == '\r' || text.back() == ' '))
            text.remove_suffix(1);
        return text;
    }
} // namespace

auto parseEventStream(std::string_view body) -> std::vector<nlohmann::json>
{
    auto messages = std::vector<nlohmann::json> {};
    auto data = std::string {};
    auto hasData = false;

    auto flush = [&] {
        if (!hasData)
            return;
        if (auto parsed = json::parse(data))
            messages.push_back(std::move(*parsed));
        else
            log::debug("Skipping non-JSON SSE event: {}", parsed.error().message);
        data.clear();
        hasData = false;
    };

    while (!body.empty())
    {
        auto const eol = body.find('\n');
        auto const line = trimmed(body.substr(0, eol));
        body = eol == std::string_view::npos ? std::string_view {} : body.substr(eol + 1);

        if (line.empty())
        {
            flush();
            continue;
        }
        if (!line.starts_with("data:"))
            continue;

        auto value = line.substr(5);
        if (value.starts_with(' '))
            value.remove_prefix(1);
        if (hasData)
            data += '\n';
        data += value;
        hasData = true;
    }
    flush();
    return messages;
}

struct HttpTransport::Impl
{
    HttpTransportConfig config;
    std::atomic<bool> connected = true;
    std::stop_source cancel;

    mutable std::mutex mutex;
    std::string sessionId;
    std::deque<nlohmann::json> outgoing;
    std::deque<nlohmann::json> incoming;

    auto headers() const -> net::HeaderMap
    {
        auto map = net::HeaderMap {
            { "content-type", "application/json" },
            { "accept", "application/json, text/event-stream" },
        };
        if (!config.bearerToken.empty())
            map["authorization"] = std::format("Bearer {}", config.bearerToken);

        auto lock = std::lock_guard(mutex);
        if (!sessionId.empty())
            map["mcp-session-id"] = sessionId;
        return map;
    }

    auto post(const nlohmann::json& message, std::chrono::milliseconds timeout) -> Result<net::HttpResponse>
    {
        auto response = net::fetch(net::HttpClientRequest {
            .method = "POST",
            .url = config.url,
            .headers = headers(),
            .body = message.dump(),
            .timeout = timeout,
            .cancel = cancel.get_token(),
        });
        if (!response)
            return response;

        if (auto const id = response->header("mcp-session-id"); !id.empty())
        {
            auto lock = std::lock_guard(mutex);
            sessionId = id;
        }

        if (response->status == 401 || response->status == 403)
            return makeError(ErrorCode::ConnectionError,
                             std::format("{} rejected credentials (HTTP {})", config.url, response->status));
        if (response->status >= 400)
            return makeError(ErrorCode::TransportError,
                             std::format("{} answered HTTP {}: {}",
                                         config.url,
                                         response->status,
                                         response->body.substr(0, 200)));
        return response;
    }

    auto messagesOf(const net::HttpResponse& response) const -> std::vector<nlohmann::json>
    {
        if (response.body.empty())
            return {};

        if (response.header("content-type").find("text/event-stream") != std::string::npos)
            return parseEventStream(response.body);

        auto parsed = json::parse(response.body);
        if (!parsed)
        {
            log::warning("Ignoring unparsable response from {}: {}", config.url, parsed.error().message);
            return {};
        }
        if (!parsed->is_array())
            return { std::move(*parsed) };

        auto messages = std::vector<nlohmann::json> {};
        for (auto& message: *parsed)
            messages.push_back(std::move(message));
        return messages;
    }
};

HttpTransport::HttpTransport(HttpTransportConfig config): _impl(std::make_unique<Impl>())
{
    _impl->config = std::move(config);
}

HttpTransport::~HttpTransport()
{
    close();
}

auto HttpTransport::send(const nlohmann::json& message) -> VoidResult
{
    if (!_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    if (message.contains("id") && message.contains("method"))
    {
        auto lock = std::lock_guard(_impl->mutex);
        _impl->outgoing.push_back(message);
        return {};
    }

    // Notifications and responses get no JSON-RPC reply; only the HTTP status matters.
    return _impl->post(message, NotificationTimeout).transform([](const net::HttpResponse&) {});
}

auto HttpTransport::receive(std::chrono::milliseconds timeout) -> Result<nlohmann::json>
{
    if (!_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    auto const deadline = std::chrono::steady_clock::now() + timeout;
    auto lock = std::unique_lock(_impl->mutex);

    while (_impl->incoming.empty())
    {
        if (_impl->outgoing.empty())
            return makeError(ErrorCode::TimeoutError, "No pending request to receive a response for");

        auto const remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0)
            return makeError(ErrorCode::TimeoutError,
                             std::format("No response from {} within {} ms", _impl->config.url, timeout.count()));

        auto request = std::move(_impl->outgoing.front());
        _impl->outgoing.pop_front();

        lock.unlock();
        auto messages = exchange(request, remaining);
        lock.lock();
        if (!messages)
            return std::unexpected(messages.error());
        for (auto& message: *messages)
            _impl->incoming.push_back(std::move(message));
    }

    auto message = std::move(_impl->incoming.front());
    _impl->incoming.pop_front();
    return message;
}

auto HttpTransport::exchange(const nlohmann::json& request, std::chrono::milliseconds timeout)
    -> Result<std::vector<nlohmann::json>>
{
    if (!_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    return _impl->post(request, timeout).transform([this](const net::HttpResponse& response) {
        return _impl->messagesOf(response);
    });
}

void HttpTransport::close()
{
    if (!_impl->connected.exchange(false))
        return;
    _impl->cancel.request_stop();

    {
        auto lock = std::lock_guard(_impl->mutex);
        _impl->outgoing.clear();
        _impl->incoming.clear();
        if (_impl->sessionId.empty())
            return;
    }

    auto const response = net::fetch(net::HttpClientRequest {
        .method = "DELETE",
        .url = _impl->config.url,
        .headers = _impl->headers(),
        .body = {},
        .timeout = CloseTimeout,
        .cancel = {},
    });
    if (!response)
        log::debug("Closing MCP session at {} failed: {}", _impl->config.url, response.error().message);
}

auto HttpTransport::isConnected() const -> bool
{
    return _impl->connected;
}

auto HttpTransport::endpoint() const -> std::string
{
    return _impl->config.url;
}

auto HttpTransport::sessionId() const -> std::string
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->sessionId;
}

} // namespace mcpmux
