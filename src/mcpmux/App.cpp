// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <auth/AuthGate.hpp>
#include <core/Log.hpp>
#include <server/GatewayServer.hpp>
#include <upstream/Aggregator.hpp>

#include <atomic>
#include <csignal>
#include <format>
#include <thread>

namespace mcpmux
{

namespace
{
    std::atomic<int> receivedSignal = 0;

    void onTerminationSignal(int signal)
    {
        receivedSignal = signal;
    }

    constexpr auto SignalPollInterval = std::chrono::milliseconds(200);
    constexpr auto SessionPurgeInterval = std::chrono::minutes(5);
} // namespace

struct App::Impl
{
    AppConfig config;
    std::unique_ptr<Aggregator> aggregator;
    std::unique_ptr<auth::AuthGate> auth;
    std::unique_ptr<GatewayServer> server;
    std::atomic<bool> stopRequested = false;

    explicit Impl(AppConfig cfg): config(std::move(cfg)) {}

    // Closing the upstream clients is what unblocks handlers still waiting on a backend,
    // so the HTTP workers are only joined after the aggregator has shut down.
    void shutdown()
    {
        auto const grace = config.timeouts.shutdownGrace;
        if (server)
            server->stopAccepting();
        if (aggregator)
            aggregator->shutdown(grace);
        if (server)
            server->stop(grace);
    }
};

App::App(AppConfig config): _impl(std::make_unique<Impl>(std::move(config)))
{
}

App::~App()
{
    _impl->shutdown();
}

auto App::initialize() -> VoidResult
{
    auto& config = _impl->config;

    if (auto const level = log::levelFromString(config.logging.level))
        log::setLevel(*level);
    if (!config.logging.file.empty() && !log::setLogFile(config.logging.file))
        return makeError(ErrorCode::IoError, std::format("Cannot open log file: {}", config.logging.file));

    if (auto resolved = resolveServerSecrets(config); !resolved)
        return resolved;

    std::signal(SIGINT, onTerminationSignal);
    std::signal(SIGTERM, onTerminationSignal);
    std::signal(SIGPIPE, SIG_IGN);

    log::info("Starting mcpmux with {} configured backend(s)", config.upstreams.size());

    _impl->auth = std::make_unique<auth::AuthGate>(auth::AuthGateConfig {
        .apiToken = config.server.apiToken,
        .uiPassword = config.server.uiPassword,
        .sessionTtl = config.server.sessionTtl,
        .maxLoginFailures = 5,
        .lockoutWindow = std::chrono::seconds(300),
    });

    _impl->aggregator = std::make_unique<Aggregator>(aggregatorOptions(config));
    _impl->aggregator->start(config.upstreams);

    _impl->server = std::make_unique<GatewayServer>(*_impl->aggregator, *_impl->auth);
    auto started = _impl->server->start(net::HttpServerConfig {
        .host = config.server.host,
        .port = config.server.port,
        .idleTimeout = std::chrono::seconds(30),
        .maxBodyBytes = 8 * 1024 * 1024,
        .workerThreads = config.server.workerThreads,
    });
    if (!started)
        return started;

    log::info("mcpmux listening on http://{}:{}/mcp", config.server.host, _impl->server->port());
    return {};
}

auto App::run() -> int
{
    auto lastPurge = std::chrono::steady_clock::now();
    while (receivedSignal == 0 && !_impl->stopRequested)
    {
        std::this_thread::sleep_for(SignalPollInterval);

        if (std::chrono::steady_clock::now() - lastPurge >= SessionPurgeInterval)
        {
            if (auto const purged = _impl->auth->sessions().purgeExpired(); purged > 0)
                log::debug("Purged {} expired session(s)", purged);
            if (auto const forgotten = _impl->auth->purgeExpiredFailures(); forgotten > 0)
                log::debug("Forgot failed logins of {} client(s)", forgotten);
            lastPurge = std::chrono::steady_clock::now();
        }
    }

    if (auto const signal = receivedSignal.load(); signal != 0)
        log::info("Received signal {}, shutting down", signal);
    else
        log::info("Stop requested, shutting down");
    _impl->shutdown();
    return 0;
}

void App::requestStop()
{
    _impl->stopRequested = true;
}

auto App::port() const -> uint16_t
{
    return _impl->server ? _impl->server->port() : 0;
}

} // namespace mcpmux
