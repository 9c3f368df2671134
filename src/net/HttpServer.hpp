// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <net/Http.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace mcpmux::net
{

/// @brief Request handler. Called on a worker thread and may block.
using HttpHandler = std::function<HttpResponse(const HttpRequest&)>;

/// @brief Listener configuration for HttpServer.
struct HttpServerConfig
{
    std::string host = "127.0.0.1";
    uint16_t port = 0; ///< 0 binds an ephemeral port, see HttpServer::port().
    std::chrono::milliseconds idleTimeout { 30000 };
    std::size_t maxBodyBytes = 8 * 1024 * 1024;
    std::size_t workerThreads = 16;
};

/// @brief Minimal HTTP/1.1 server with keep-alive support.
///
/// Connections are served by coroutines on an internal I/O thread. Handlers run on a
/// separate worker pool so a slow handler never stalls other connections.
class HttpServer
{
  public:
    HttpServer();
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// @brief Binds the listener and starts serving.
    /// @return Success or an IoError if the address cannot be bound.
    [[nodiscard]] auto start(const HttpServerConfig& config, HttpHandler handler) -> VoidResult;

    /// @brief Returns the bound port (valid after a successful start()).
    [[nodiscard]] auto port() const -> uint16_t;

    /// @brief Returns true between a successful start() and stop().
    [[nodiscard]] auto isRunning() const -> bool;

    /// @brief Closes the listener. Open connections are served until stop(), without keep-alive.
    void stopAccepting();

    /// @brief Stops accepting, waits up to @p grace for in-flight handlers, then closes everything.
    ///
    /// Handlers still running after the grace period are waited for before the worker
    /// pool is torn down.
    void stop(std::chrono::milliseconds grace = std::chrono::milliseconds(2000));

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcpmux::net
