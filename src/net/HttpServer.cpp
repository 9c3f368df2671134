// SPDX-License-Identifier: Apache-2.0
#include "HttpServer.hpp"

#include <core/Log.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <format>
#include <mutex>
#include <optional>
#include <thread>

namespace mcpmux::net
{

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

namespace
{
    auto toRequest(const http::request<http::string_body>& req, std::string remoteAddress) -> HttpRequest
    {
        auto request = HttpRequest {};
        request.method = std::string(req.method_string());
        request.target = std::string(req.target());

        auto const queryStart = request.target.find('?');
        request.path = request.target.substr(0, queryStart);
        if (queryStart != std::string::npos)
            request.query = parseQuery(std::string_view(request.target).substr(queryStart + 1));

        for (const auto& field: req)
            request.headers[normalizeHeaderName(field.name_string())] = std::string(field.value());
        request.body = req.body();
        request.remoteAddress = std::move(remoteAddress);
        return request;
    }

    auto toBeast(HttpResponse response, unsigned version, bool keepAlive) -> http::response<http::string_body>
    {
        auto res = http::response<http::string_body> {};
        res.version(version);
        res.result(response.status);
        res.set(http::field::server, "mcpmux");
        for (const auto& [name, value]: response.headers)
            res.set(name, value);
        res.keep_alive(keepAlive);
        res.body() = std::move(response.body);
        res.prepare_payload();
        return res;
    }

    auto invokeHandler(const HttpHandler* handler, HttpRequest request) -> asio::awaitable<HttpResponse>
    {
        try
        {
            co_return (*handler)(request);
        }
        catch (const std::exception& e)
        {
            log::error("HTTP handler for {} {} threw: {}", request.method, request.path, e.what());
            co_return HttpResponse::json(500, R"({"error":"Internal server error"})");
        }
    }
} // namespace

struct HttpServer::Impl
{
    HttpServerConfig config;
    HttpHandler handler;

    asio::io_context ioc;
    std::optional<asio::thread_pool> workers;
    tcp::acceptor acceptor { ioc };
    std::thread ioThread;

    std::atomic<bool> running = false;
    std::atomic<bool> stopping = false;
    uint16_t boundPort = 0;

    std::mutex activeMutex;
    std::condition_variable activeCondition;
    std::size_t active = 0;

    auto acceptLoop() -> asio::awaitable<void>
    {
        for (;;)
        {
            auto ec = beast::error_code {};
            auto socket = co_await acceptor.async_accept(asio::redirect_error(asio::use_awaitable, ec));
            if (ec)
            {
                if (ec == asio::error::operation_aborted || !acceptor.is_open())
                    co_return;
                log::warning("HTTP accept failed: {}", ec.message());
                continue;
            }
            asio::co_spawn(ioc, session(beast::tcp_stream(std::move(socket))), asio::detached);
        }
    }

    auto session(beast::tcp_stream stream) -> asio::awaitable<void>
    {
        auto ec = beast::error_code {};
        auto const endpoint = stream.socket().remote_endpoint(ec);
        auto const remoteAddress = ec ? std::string {} : endpoint.address().to_string();
        auto buffer = beast::flat_buffer {};

        for (;;)
        {
            auto parser = http::request_parser<http::string_body> {};
            parser.body_limit(config.maxBodyBytes);

            stream.expires_after(config.idleTimeout);
            co_await http::async_read(stream, buffer, parser, asio::redirect_error(asio::use_awaitable, ec));
            if (ec)
                break;

            auto req = parser.release();
            stream.expires_never();

            beginRequest();
            auto response = co_await asio::co_spawn(
                workers->get_executor(), invokeHandler(&handler, toRequest(req, remoteAddress)), asio::use_awaitable);
            endRequest();

            auto const keepAlive = req.keep_alive() && !stopping;
            auto res = toBeast(std::move(response), req.version(), keepAlive);

            stream.expires_after(config.idleTimeout);
            co_await http::async_write(stream, res, asio::redirect_error(asio::use_awaitable, ec));
            if (ec || !keepAlive)
                break;
        }

        stream.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    void beginRequest()
    {
        auto lock = std::lock_guard(activeMutex);
        ++active;
    }

    void endRequest()
    {
        {
            auto lock = std::lock_guard(activeMutex);
            --active;
        }
        activeCondition.notify_all();
    }

    void runLoop()
    {
        for (;;)
        {
            try
            {
                ioc.run();
                return;
            }
            catch (const std::exception& e)
            {
                log::error("HTTP server loop error: {}", e.what());
            }
        }
    }
};

HttpServer::HttpServer(): _impl(std::make_unique<Impl>())
{
}

HttpServer::~HttpServer()
{
    stop(std::chrono::milliseconds(0));
}

auto HttpServer::start(const HttpServerConfig& config, HttpHandler handler) -> VoidResult
{
    if (_impl->running)
        return makeError(ErrorCode::InvalidArgument, "HTTP server is already running");

    _impl->config = config;
    _impl->handler = std::move(handler);

    auto ec = beast::error_code {};
    auto resolver = tcp::resolver(_impl->ioc);
    auto const results = resolver.resolve(config.host, std::to_string(config.port), ec);
    if (ec || results.empty())
        return makeError(ErrorCode::IoError,
                         std::format("Cannot resolve listen address {}:{}: {}", config.host, config.port, ec.message()));

    auto const endpoint = results.begin()->endpoint();
    auto& acceptor = _impl->acceptor;
    if (acceptor.open(endpoint.protocol(), ec); !ec)
        acceptor.set_option(asio::socket_base::reuse_address(true), ec);
    if (!ec)
        acceptor.bind(endpoint, ec);
    if (!ec)
        acceptor.listen(asio::socket_base::max_listen_connections, ec);
    if (ec)
    {
        auto ignored = beast::error_code {};
        acceptor.close(ignored);
        return makeError(ErrorCode::IoError,
                         std::format("Cannot listen on {}:{}: {}", config.host, config.port, ec.message()));
    }

    _impl->boundPort = acceptor.local_endpoint(ec).port();
    _impl->workers.emplace(std::max<std::size_t>(config.workerThreads, 1));
    _impl->stopping = false;
    _impl->running = true;

    asio::co_spawn(_impl->ioc, _impl->acceptLoop(), asio::detached);
    _impl->ioThread = std::thread([impl = _impl.get()] { impl->runLoop(); });

    log::info("HTTP server listening on {}:{}", config.host, _impl->boundPort);
    return {};
}

auto HttpServer::port() const -> uint16_t
{
    return _impl->boundPort;
}

auto HttpServer::isRunning() const -> bool
{
    return _impl->running;
}

void HttpServer::stopAccepting()
{
    if (!_impl->running || _impl->stopping.exchange(true))
        return;

    asio::post(_impl->ioc, [impl = _impl.get()] {
        auto ec = beast::error_code {};
        impl->acceptor.close(ec);
    });
    log::debug("HTTP server on port {} stopped accepting connections", _impl->boundPort);
}

void HttpServer::stop(std::chrono::milliseconds grace)
{
    stopAccepting();
    if (!_impl->running.exchange(false))
        return;

    {
        auto lock = std::unique_lock(_impl->activeMutex);
        if (!_impl->activeCondition.wait_for(lock, grace, [this] { return _impl->active == 0; }))
            log::warning("HTTP server stopping with {} request(s) still in flight", _impl->active);
    }

    _impl->ioc.stop();
    if (_impl->ioThread.joinable())
        _impl->ioThread.join();

    auto ec = beast::error_code {};
    _impl->acceptor.close(ec);

    // Handlers that are still running finish before the pool is torn down.
    if (_impl->workers)
    {
        _impl->workers->stop();
        _impl->workers->join();
    }
    log::debug("HTTP server on port {} stopped", _impl->boundPort);
}

} // namespace mcpmux::net
