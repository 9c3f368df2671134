// SPDX-License-Identifier: Apache-2.0
#include "ConnectionRegistry.hpp"

#include <core/Log.hpp>
#include <core/Secrets.hpp>
#include <upstream/Validation.hpp>

#include <format>
#include <mutex>
#include <thread>

namespace mcpmux
{

namespace
{
    /// Slack on top of a service's startup timeout for the final probe and termination.
    constexpr auto SettleSlack = std::chrono::seconds(10);
} // namespace

struct ConnectionRegistry::Slot
{
    BackendSpec spec;

    // Held for a whole connect or reconnect cycle.
    std::mutex lifecycleMutex;

    mutable std::mutex stateMutex;
    BackendStatus status = BackendStatus::Connecting;
    std::string lastError;
    std::shared_ptr<UpstreamClient> client;
    std::optional<ProcessHandle> process;
};

ConnectionRegistry::ConnectionRegistry(ProcessSupervisor& supervisor, Connector connector, McpClientTimeouts timeouts):
    _supervisor(supervisor), _connector(std::move(connector)), _timeouts(timeouts)
{
}

ConnectionRegistry::~ConnectionRegistry()
{
    closeAll();
}

auto ConnectionRegistry::add(BackendSpec spec) -> Result<std::string>
{
    if (auto valid = validation::validateBackendSpec(spec); !valid)
        return std::unexpected(valid.error());

    auto resolved = resolveSecrets(spec);
    if (!resolved)
        return std::unexpected(resolved.error());

    auto const* service = std::get_if<ServiceBackendConfig>(&spec.config);
    if (service && !validation::isPortFree(service->port))
        return makeError(ErrorCode::ConfigError, std::format("Port {} is already in use", service->port));

    auto slot = std::make_shared<Slot>();
    slot->spec = spec;

    {
        auto lock = std::unique_lock(_mutex);
        if (_slots.contains(spec.id))
            return makeError(ErrorCode::ConfigError, std::format("Backend '{}' already exists", spec.id));

        if (service)
        {
            for (const auto& [otherId, other]: _slots)
            {
                auto const* otherService = std::get_if<ServiceBackendConfig>(&other->spec.config);
                if (otherService && otherService->port == service->port)
                    return makeError(
                        ErrorCode::ConfigError,
                        std::format("Port {} is already used by backend '{}'", service->port, otherId));
            }
        }
        _slots.emplace(spec.id, slot);
    }

    log::info("Registered {} backend '{}'", toString(transportKindOf(spec.config)), spec.id);

    {
        auto lock = std::lock_guard(slot->lifecycleMutex);
        connect(*slot, *resolved);
    }
    return spec.id;
}

auto ConnectionRegistry::remove(std::string_view id) -> VoidResult
{
    auto slot = std::shared_ptr<Slot> {};
    {
        auto lock = std::unique_lock(_mutex);
        auto const it = _slots.find(id);
        if (it == _slots.end())
            return makeError(ErrorCode::NotFound, std::format("Backend '{}' not found", id));
        slot = it->second;
        _slots.erase(it);
    }

    // No lifecycle lock here: a connect that is still waiting for its process must not
    // hold up removal. It notices the Stopped status and discards what it built.
    auto client = std::shared_ptr<UpstreamClient> {};
    auto process = std::optional<ProcessHandle> {};
    {
        auto lock = std::lock_guard(slot->stateMutex);
        slot->status = BackendStatus::Stopped;
        client = std::move(slot->client);
        process = slot->process;
        slot->process.reset();
    }

    // The last owner closes the client, which may be a call that is still in flight.
    client.reset();

    if (process)
    {
        if (auto released = _supervisor.release(*process); !released)
            log::warning("Stopping process of backend '{}' failed: {}", id, released.error().message);
    }

    log::info("Removed backend '{}'", id);
    return {};
}

auto ConnectionRegistry::get(std::string_view id) const -> std::shared_ptr<UpstreamClient>
{
    auto slot = find(id);
    if (!slot)
        return nullptr;

    auto lock = std::lock_guard(slot->stateMutex);
    return slot->status == BackendStatus::Ready ? slot->client : nullptr;
}

auto ConnectionRegistry::list() const -> std::vector<BackendInfo>
{
    auto slots = std::vector<std::shared_ptr<Slot>> {};
    {
        auto lock = std::shared_lock(_mutex);
        for (const auto& [id, slot]: _slots)
            slots.push_back(slot);
    }

    auto infos = std::vector<BackendInfo> {};
    infos.reserve(slots.size());
    for (const auto& slot: slots)
    {
        auto lock = std::lock_guard(slot->stateMutex);
        infos.push_back(BackendInfo {
            .id = slot->spec.id,
            .transportKind = transportKindOf(slot->spec.config),
            .status = slot->status,
            .lastError = slot->lastError,
            .toolCount = 0,
            .lastDiscoveryError = {},
        });
    }
    return infos;
}

auto ConnectionRegistry::info(std::string_view id) const -> Result<BackendInfo>
{
    auto slot = find(id);
    if (!slot)
        return makeError(ErrorCode::NotFound, std::format("Backend '{}' not found", id));

    auto lock = std::lock_guard(slot->stateMutex);
    return BackendInfo {
        .id = slot->spec.id,
        .transportKind = transportKindOf(slot->spec.config),
        .status = slot->status,
        .lastError = slot->lastError,
        .toolCount = 0,
        .lastDiscoveryError = {},
    };
}

auto ConnectionRegistry::status(std::string_view id) const -> Result<BackendStatus>
{
    return info(id).transform([](const BackendInfo& backend) { return backend.status; });
}

auto ConnectionRegistry::contains(std::string_view id) const -> bool
{
    return find(id) != nullptr;
}

auto ConnectionRegistry::processOf(std::string_view id) const -> std::optional<ProcessHandle>
{
    auto slot = find(id);
    if (!slot)
        return std::nullopt;

    auto lock = std::lock_guard(slot->stateMutex);
    return slot->process;
}

auto ConnectionRegistry::reconnect(std::string_view id) -> Result<std::string>
{
    auto slot = find(id);
    if (!slot)
        return makeError(ErrorCode::NotFound, std::format("Backend '{}' not found", id));

    auto lifecycle = std::unique_lock(slot->lifecycleMutex, std::try_to_lock);
    if (!lifecycle.owns_lock())
        return makeError(ErrorCode::InvalidArgument, std::format("Backend '{}' is already connecting", id));

    auto resolved = resolveSecrets(slot->spec);
    if (!resolved)
        return std::unexpected(resolved.error());

    auto previous = std::shared_ptr<UpstreamClient> {};
    {
        auto lock = std::lock_guard(slot->stateMutex);
        if (slot->status == BackendStatus::Connecting)
            return makeError(ErrorCode::InvalidArgument, std::format("Backend '{}' is already connecting", id));
        slot->status = BackendStatus::Connecting;
        slot->lastError.clear();
        previous = std::move(slot->client);
    }

    previous.reset();

    log::info("Reconnecting backend '{}'", id);
    connect(*slot, *resolved);
    return std::string(id);
}

auto ConnectionRegistry::markCrashed(std::string_view id, std::string_view reason) -> bool
{
    auto slot = find(id);
    if (!slot)
        return false;

    auto client = std::shared_ptr<UpstreamClient> {};
    {
        auto lock = std::lock_guard(slot->stateMutex);
        if (!canTransition(slot->status, BackendStatus::Crashed))
            return false;
        slot->status = BackendStatus::Crashed;
        slot->lastError = std::string(reason);
        client = std::move(slot->client);
    }

    log::error("Backend '{}' crashed: {}", id, reason);
    return true;
}

auto ConnectionRegistry::markDisconnected() -> std::vector<std::string>
{
    auto slots = std::vector<std::shared_ptr<Slot>> {};
    {
        auto lock = std::shared_lock(_mutex);
        for (const auto& [id, slot]: _slots)
            slots.push_back(slot);
    }

    auto crashed = std::vector<std::string> {};
    for (const auto& slot: slots)
    {
        auto client = std::shared_ptr<UpstreamClient> {};
        {
            auto lock = std::lock_guard(slot->stateMutex);
            if (slot->status != BackendStatus::Ready || !slot->client)
                continue;
            client = slot->client;
        }

        if (client->isConnected())
            continue;

        auto const reason = std::format("Lost connection to {}", client->describe());
        {
            auto lock = std::lock_guard(slot->stateMutex);
            // A reconnect may have replaced the client in the meantime.
            if (slot->status != BackendStatus::Ready || slot->client != client)
                continue;
            slot->status = BackendStatus::Crashed;
            slot->lastError = reason;
            slot->client.reset();
        }

        log::error("Backend '{}' crashed: {}", slot->spec.id, reason);
        crashed.push_back(slot->spec.id);
    }
    return crashed;
}

void ConnectionRegistry::closeAll()
{
    auto slots = std::vector<std::shared_ptr<Slot>> {};
    {
        auto lock = std::shared_lock(_mutex);
        for (const auto& [id, slot]: _slots)
            slots.push_back(slot);
    }

    auto closers = std::vector<std::jthread> {};
    for (const auto& slot: slots)
    {
        auto client = std::shared_ptr<UpstreamClient> {};
        {
            auto lock = std::lock_guard(slot->stateMutex);
            if (slot->status == BackendStatus::Stopped)
                continue;
            slot->status = BackendStatus::Stopped;
            client = std::move(slot->client);
        }
        if (client)
            closers.emplace_back([client = std::move(client)] { client->close(); });
    }
}

auto ConnectionRegistry::find(std::string_view id) const -> std::shared_ptr<Slot>
{
    auto lock = std::shared_lock(_mutex);
    auto const it = _slots.find(id);
    return it != _slots.end() ? it->second : nullptr;
}

auto ConnectionRegistry::resolveSecrets(const BackendSpec& spec) const -> Result<BackendSpec>
{
    auto resolved = spec;

    if (auto* http = std::get_if<HttpBackendConfig>(&resolved.config))
    {
        if (http->bearerToken.empty())
            return resolved;
        auto token = resolveSecret(http->bearerToken, std::format("backend '{}' bearerToken", spec.id));
        if (!token)
            return std::unexpected(token.error());
        http->bearerToken = std::move(*token);
        return resolved;
    }

    auto& env = std::holds_alternative<StdioBackendConfig>(resolved.config)
                    ? std::get<StdioBackendConfig>(resolved.config).env
                    : std::get<ServiceBackendConfig>(resolved.config).env;
    auto values = mcpmux::resolveSecrets(env, std::format("backend '{}' env", spec.id));
    if (!values)
        return std::unexpected(values.error());
    env = std::move(*values);
    return resolved;
}

void ConnectionRegistry::connect(Slot& slot, const BackendSpec& resolved)
{
    auto const& id = slot.spec.id;
    auto processHandle = std::optional<ProcessHandle> {};

    if (auto const* service = std::get_if<ServiceBackendConfig>(&resolved.config))
    {
        auto existing = std::optional<ProcessHandle> {};
        {
            auto lock = std::lock_guard(slot.stateMutex);
            if (slot.status != BackendStatus::Connecting)
                return;

            existing = slot.process;
            if (!existing)
            {
                slot.process = _supervisor.start(ProcessSpec {
                    .backendId = id,
                    .command = service->command,
                    .args = service->args,
                    .env = service->env,
                    .workingDirectory = service->workingDirectory,
                    .port = service->port,
                    .healthCheckPath = service->healthCheckPath,
                    .startupTimeout = service->startupTimeout,
                });
                processHandle = slot.process;
            }
        }

        if (existing)
        {
            if (auto restarted = _supervisor.restart(*existing); !restarted)
            {
                transition(slot, BackendStatus::Crashed, restarted.error().message);
                return;
            }
            processHandle = existing;
        }

        auto const settled = _supervisor.waitUntilSettled(*processHandle, service->startupTimeout + SettleSlack);
        if (!settled || *settled != ProcessState::Running)
        {
            auto const process = _supervisor.info(*processHandle);
            auto reason = std::format("Service did not become healthy ({})",
                                      settled ? toString(*settled) : std::string_view("unknown"));
            if (process && !process->lastError.empty())
                reason = process->failure
                             ? std::format("{}: {}", errorCodeName(*process->failure), process->lastError)
                             : process->lastError;
            transition(slot, BackendStatus::Crashed, std::move(reason));
            return;
        }
    }
    else
    {
        auto lock = std::lock_guard(slot.stateMutex);
        if (slot.status != BackendStatus::Connecting)
            return;
    }

    auto transport = _connector(resolved);
    if (!transport)
    {
        transition(slot, BackendStatus::Crashed, std::format("Connection failed: {}", transport.error().message));
        return;
    }

    auto client = std::make_shared<McpClient>(std::move(*transport), _timeouts);
    auto capabilities = client->initialize();
    if (!capabilities)
    {
        client->close();
        transition(slot, BackendStatus::Crashed, std::format("Handshake failed: {}", capabilities.error().message));
        return;
    }

    auto upstream = std::visit(
        Overloaded {
            [&](const HttpBackendConfig& http) {
                return std::make_shared<UpstreamClient>(HttpUpstream { .client = client, .url = http.url });
            },
            [&](const StdioBackendConfig& stdio) {
                return std::make_shared<UpstreamClient>(StdioUpstream { .client = client, .command = stdio.command });
            },
            [&](const ServiceBackendConfig& service) {
                return std::make_shared<UpstreamClient>(
                    ServiceUpstream { .client = client, .process = processHandle.value_or(0), .port = service.port });
            },
        },
        resolved.config);

    {
        auto lock = std::lock_guard(slot.stateMutex);
        if (slot.status == BackendStatus::Connecting)
        {
            slot.client = upstream;
            slot.status = BackendStatus::Ready;
            slot.lastError.clear();
            upstream.reset();
        }
    }

    if (upstream)
    {
        log::info("Backend '{}' changed state while connecting; discarding the new connection", id);
        upstream->close();
        return;
    }

    log::info("Backend '{}' is ready ({} v{})", id, capabilities->serverName, capabilities->serverVersion);
}

auto ConnectionRegistry::transition(Slot& slot, BackendStatus to, std::string lastError) -> bool
{
    auto from = BackendStatus::Connecting;
    {
        auto lock = std::lock_guard(slot.stateMutex);
        from = slot.status;
        if (!canTransition(from, to))
            return false;
        slot.status = to;
        if (!lastError.empty())
            slot.lastError = lastError;
    }

    if (to == BackendStatus::Crashed)
        log::error("Backend '{}' is crashed: {}", slot.spec.id, lastError);
    else
        log::info("Backend '{}': {} -> {}", slot.spec.id, toString(from), toString(to));
    return true;
}

} // namespace mcpmux
