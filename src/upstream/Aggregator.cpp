// SPDX-License-Identifier: Apache-2.0
#include "Aggregator.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <format>

namespace mcpmux
{

namespace
{
    constexpr auto EventPollInterval = std::chrono::milliseconds(200);
} // namespace

Aggregator::Aggregator(AggregatorOptions options):
    _maxParallel(std::max<std::size_t>(options.maxParallel, 1)),
    _supervisor(options.supervisor),
    _registry(_supervisor, options.connector ? std::move(options.connector) : defaultConnector(), options.timeouts),
    _catalog(_registry),
    _tracker(options.tracking),
    _router(_catalog, _registry, _tracker),
    _dispatcher([this](std::stop_token token) { dispatchEvents(std::move(token)); })
{
}

Aggregator::~Aggregator()
{
    shutdown(std::chrono::milliseconds(0));
}

void Aggregator::start(const std::vector<BackendSpec>& backends)
{
    log::info("Starting {} configured backend(s)", backends.size());

    auto next = std::atomic<std::size_t> { 0 };
    {
        // Each backend is discovered as soon as it connects; a slow one never holds up the others.
        auto const workerCount = std::min(_maxParallel, std::max<std::size_t>(backends.size(), 1));
        auto workers = std::vector<std::jthread> {};
        workers.reserve(workerCount);
        for (auto i = std::size_t { 0 }; i < workerCount; ++i)
        {
            workers.emplace_back([&] {
                for (auto index = next++; index < backends.size(); index = next++)
                {
                    if (_shuttingDown)
                        return;
                    auto added = _registry.add(backends[index]);
                    if (!added)
                    {
                        log::error("Skipping backend '{}': {}", backends[index].id, added.error().message);
                        continue;
                    }
                    if (auto refreshed = _catalog.refresh(*added); !refreshed)
                        log::debug("Initial discovery for '{}' failed: {}", *added, refreshed.error().message);
                }
            });
        }
    }

    auto const ready = std::ranges::count_if(_registry.list(),
                                             [](const BackendInfo& b) { return b.status == BackendStatus::Ready; });
    log::info("{} of {} backend(s) ready, {} tool(s) available", ready, backends.size(), _catalog.all().size());
}

auto Aggregator::addBackend(BackendSpec spec) -> Result<BackendInfo>
{
    if (auto open = rejectIfShuttingDown(); !open)
        return std::unexpected(open.error());

    auto id = _registry.add(std::move(spec));
    if (!id)
        return std::unexpected(id.error());

    if (auto refreshed = _catalog.refresh(*id); !refreshed)
        log::debug("Initial discovery for '{}' failed: {}", *id, refreshed.error().message);

    return backend(*id);
}

auto Aggregator::removeBackend(std::string_view id) -> VoidResult
{
    if (auto open = rejectIfShuttingDown(); !open)
        return open;

    auto removed = _registry.remove(id);
    _catalog.purge(id);
    return removed;
}

auto Aggregator::reconnectBackend(std::string_view id) -> Result<BackendInfo>
{
    if (auto open = rejectIfShuttingDown(); !open)
        return std::unexpected(open.error());

    if (!_registry.contains(id))
        return makeError(ErrorCode::NotFound, std::format("Backend '{}' not found", id));

    _catalog.purge(id);
    auto reconnected = _registry.reconnect(id);
    if (!reconnected)
        return std::unexpected(reconnected.error());

    if (auto refreshed = _catalog.refresh(id); !refreshed)
        log::debug("Discovery after reconnect of '{}' failed: {}", id, refreshed.error().message);

    return backend(id);
}

auto Aggregator::refreshTools() -> Result<std::size_t>
{
    if (auto open = rejectIfShuttingDown(); !open)
        return std::unexpected(open.error());

    auto ready = std::vector<std::string> {};
    for (const auto& info: _registry.list())
        if (info.status == BackendStatus::Ready)
            ready.push_back(info.id);

    log::info("Refreshing tools of {} ready backend(s)", ready.size());
    _catalog.refreshAll(ready, _maxParallel);
    return ready.size();
}

auto Aggregator::listBackends() const -> std::vector<BackendInfo>
{
    auto backends = _registry.list();
    for (auto& info: backends)
        info = withCatalogInfo(std::move(info));
    return backends;
}

auto Aggregator::backend(std::string_view id) const -> Result<BackendInfo>
{
    return _registry.info(id).transform([this](BackendInfo info) { return withCatalogInfo(std::move(info)); });
}

auto Aggregator::tools() const -> std::vector<ToolEntry>
{
    return _catalog.all();
}

auto Aggregator::callTool(std::string_view qualifiedName,
                          const nlohmann::json& arguments,
                          std::string_view clientAddress) -> Result<ToolOutcome>
{
    {
        auto lock = std::lock_guard(_inFlightMutex);
        if (_shuttingDown)
            return makeError(ErrorCode::BackendUnavailable, "Gateway is shutting down");
        ++_inFlight;
    }

    auto outcome = _router.call(qualifiedName, arguments, clientAddress);

    {
        auto lock = std::lock_guard(_inFlightMutex);
        --_inFlight;
    }
    _inFlightDrained.notify_all();
    return outcome;
}

void Aggregator::shutdown(std::chrono::milliseconds grace)
{
    {
        auto lock = std::unique_lock(_inFlightMutex);
        if (_shuttingDown.exchange(true))
            return;

        log::info("Shutting down; waiting up to {} ms for {} tool call(s)", grace.count(), _inFlight);
        if (!_inFlightDrained.wait_for(lock, grace, [this] { return _inFlight == 0; }))
            log::warning("{} tool call(s) still running at shutdown", _inFlight);
    }

    _registry.closeAll();
    _supervisor.stopAll();

    _dispatcher.request_stop();
    if (_dispatcher.joinable())
        _dispatcher.join();
    log::info("Upstream shutdown complete");
}

auto Aggregator::withCatalogInfo(BackendInfo info) const -> BackendInfo
{
    info.toolCount = _catalog.toolCount(info.id);
    info.lastDiscoveryError = _catalog.lastDiscoveryError(info.id);
    return info;
}

auto Aggregator::rejectIfShuttingDown() const -> VoidResult
{
    if (_shuttingDown)
        return makeError(ErrorCode::InvalidArgument, "Gateway is shutting down");
    return {};
}

void Aggregator::dispatchEvents(std::stop_token token)
{
    auto& events = _supervisor.events();
    while (!token.stop_requested())
    {
        auto event = events.receive(EventPollInterval);
        if (event)
            onProcessEvent(*event);
        else if (events.isClosed())
            return;

        for (const auto& id: _registry.markDisconnected())
            _catalog.purge(id);
    }
}

void Aggregator::onProcessEvent(const ProcessEvent& event)
{
    log::debug("Process event: backend '{}' is {}", event.backendId, toString(event.state));
    if (event.state != ProcessState::Crashed)
        return;

    // Events are delivered asynchronously; a restart or removal may already have superseded this one.
    if (_registry.processOf(event.backendId) != event.handle)
        return;
    if (auto const current = _supervisor.status(event.handle); !current || *current != ProcessState::Crashed)
        return;

    auto const reason = event.exitCode ? std::format("{} (exit code {})", event.message, *event.exitCode)
                                       : event.message;
    if (_registry.markCrashed(event.backendId, reason))
        _catalog.purge(event.backendId);
}

} // namespace mcpmux
