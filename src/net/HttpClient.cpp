// SPDX-License-Identifier: Apache-2.0
#include "HttpClient.hpp"

#include <core/Log.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <chrono>
#include <exception>
#include <format>
#include <optional>

namespace mcpmux::net
{

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace
{
    constexpr auto CancelPollInterval = std::chrono::milliseconds(20);

    using BeastRequest = http::request<http::string_body>;
    using BeastResponse = http::response<http::string_body>;

    auto buildRequest(const HttpClientRequest& request, const Url& url) -> BeastRequest
    {
        auto verb = http::string_to_verb(request.method);
        if (verb == http::verb::unknown)
            verb = http::verb::get;

        auto req = BeastRequest { verb, url.target, 11 };
        auto const defaultPort = url.isTls() ? "443" : "80";
        req.set(http::field::host, url.port == defaultPort ? url.host : std::format("{}:{}", url.host, url.port));
        req.set(http::field::user_agent, "mcpmux/0.1");
        req.set(http::field::connection, "close");
        for (const auto& [name, value]: request.headers)
            req.set(name, value);
        req.body() = request.body;
        req.prepare_payload();
        return req;
    }

    auto toResponse(const BeastResponse& res) -> HttpResponse
    {
        auto response = HttpResponse {};
        response.status = res.result_int();
        for (const auto& field: res)
            response.headers[normalizeHeaderName(field.name_string())] = std::string(field.value());
        response.body = res.body();
        return response;
    }

    template <typename Stream>
    auto exchange(Stream& stream, BeastRequest& req) -> asio::awaitable<HttpResponse>
    {
        co_await http::async_write(stream, req, asio::use_awaitable);

        auto buffer = beast::flat_buffer {};
        auto res = BeastResponse {};
        co_await http::async_read(stream, buffer, res, asio::use_awaitable);
        co_return toResponse(res);
    }

    auto plainRequest(Url url, BeastRequest req, std::chrono::milliseconds timeout)
        -> asio::awaitable<HttpResponse>
    {
        auto executor = co_await asio::this_coro::executor;
        auto resolver = tcp::resolver(executor);
        auto const endpoints = co_await resolver.async_resolve(url.host, url.port, asio::use_awaitable);

        auto stream = beast::tcp_stream(executor);
        stream.expires_after(timeout);
        co_await stream.async_connect(endpoints, asio::use_awaitable);

        auto response = co_await exchange(stream, req);

        auto ec = beast::error_code {};
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        co_return response;
    }

    auto tlsRequest(Url url, BeastRequest req, ssl::context& context, std::chrono::milliseconds timeout)
        -> asio::awaitable<HttpResponse>
    {
        auto executor = co_await asio::this_coro::executor;
        auto resolver = tcp::resolver(executor);
        auto const endpoints = co_await resolver.async_resolve(url.host, url.port, asio::use_awaitable);

        auto stream = beast::ssl_stream<beast::tcp_stream>(executor, context);
        if (!::SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str()))
            throw beast::system_error(beast::error_code(static_cast<int>(::ERR_get_error()),
                                                        asio::error::get_ssl_category()));
        ::SSL_set1_host(stream.native_handle(), url.host.c_str());

        beast::get_lowest_layer(stream).expires_after(timeout);
        co_await beast::get_lowest_layer(stream).async_connect(endpoints, asio::use_awaitable);
        co_await stream.async_handshake(ssl::stream_base::client, asio::use_awaitable);

        auto response = co_await exchange(stream, req);

        // Many servers close without a TLS close_notify; the response is already complete.
        auto ec = beast::error_code {};
        beast::get_lowest_layer(stream).socket().shutdown(tcp::socket::shutdown_both, ec);
        co_return response;
    }

    auto classify(const beast::error_code& ec, const Url& url) -> Error
    {
        if (ec == beast::error::timeout || ec == asio::error::timed_out)
            return Error { ErrorCode::TimeoutError, std::format("Request to {} timed out", url.host) };

        if (ec == asio::error::connection_refused || ec == asio::error::host_not_found
            || ec == asio::error::host_not_found_try_again || ec == asio::error::network_unreachable
            || ec == asio::error::host_unreachable || ec == asio::error::connection_reset)
        {
            return Error { ErrorCode::ConnectionError,
                           std::format("Cannot connect to {}:{}: {}", url.host, url.port, ec.message()) };
        }

        return Error { ErrorCode::TransportError,
                       std::format("HTTP exchange with {}:{} failed: {}", url.host, url.port, ec.message()) };
    }
} // namespace

auto fetch(const HttpClientRequest& request) -> Result<HttpResponse>
{
    auto urlResult = parseUrl(request.url);
    if (!urlResult)
        return std::unexpected(urlResult.error());
    auto const& url = *urlResult;

    auto req = buildRequest(request, url);

    // The TLS context must outlive the io_context that owns the coroutine frame.
    auto tlsContext = std::optional<ssl::context> {};
    if (url.isTls())
    {
        tlsContext.emplace(ssl::context::tls_client);
        tlsContext->set_default_verify_paths();
        tlsContext->set_verify_mode(ssl::verify_peer);
    }

    auto outcome = std::optional<Result<HttpResponse>> {};
    auto ioc = asio::io_context {};

    auto onDone = [&outcome, &url](std::exception_ptr error, HttpResponse response) {
        if (!error)
        {
            outcome = std::move(response);
            return;
        }

        try
        {
            std::rethrow_exception(error);
        }
        catch (const beast::system_error& e)
        {
            outcome = std::unexpected(classify(e.code(), url));
        }
        catch (const std::exception& e)
        {
            outcome = makeError(ErrorCode::TransportError, std::format("HTTP request failed: {}", e.what()));
        }
    };

    if (tlsContext)
        asio::co_spawn(ioc, tlsRequest(url, std::move(req), *tlsContext, request.timeout), onDone);
    else
        asio::co_spawn(ioc, plainRequest(url, std::move(req), request.timeout), onDone);

    // Resolution is not covered by the stream timer, so bound the whole run as well.
    auto const deadline = std::chrono::steady_clock::now() + request.timeout + std::chrono::milliseconds(250);
    while (!outcome && !ioc.stopped() && !request.cancel.stop_requested()
           && std::chrono::steady_clock::now() < deadline)
    {
        ioc.run_one_for(CancelPollInterval);
    }

    if (!outcome)
    {
        ioc.stop();
        if (request.cancel.stop_requested())
        {
            log::debug("HTTP {} {} cancelled", request.method, request.url);
            return makeError(ErrorCode::TransportError, std::format("Request to {} was cancelled", url.host));
        }
        log::debug("HTTP {} {} abandoned after {} ms", request.method, request.url, request.timeout.count());
        return makeError(ErrorCode::TimeoutError, std::format("Request to {} timed out", url.host));
    }

    return std::move(*outcome);
}

} // namespace mcpmux::net
