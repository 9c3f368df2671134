// SPDX-License-Identifier: Apache-2.0
#include "ToolCatalog.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <atomic>
#include <format>
#include <thread>

namespace mcpmux
{

auto qualifiedToolName(std::string_view backendId, std::string_view toolName) -> std::string
{
    return std::format("{}_{}", backendId, toolName);
}

ToolCatalog::ToolCatalog(ConnectionRegistry& registry): _registry(registry)
{
}

auto ToolCatalog::refresh(std::string_view backendId) -> VoidResult
{
    auto serial = refreshLock(backendId);
    auto refreshGuard = std::unique_lock(*serial);

    auto client = _registry.get(backendId);
    if (!client)
    {
        // Let go of the refresh lock first so that purge can forget it.
        refreshGuard.unlock();
        serial.reset();
        purge(backendId);
        return makeError(ErrorCode::BackendUnavailable, std::format("Backend '{}' is not ready", backendId));
    }

    auto tools = client->discover();
    if (!tools)
    {
        auto message = std::format("Discovery failed: {}", tools.error().message);
        log::warning("Backend '{}': {}", backendId, message);
        install(backendId, {}, message);
        return makeError(ErrorCode::DiscoveryError, std::move(message));
    }

    auto entries = std::vector<ToolEntry> {};
    entries.reserve(tools->size());
    for (auto& tool: *tools)
    {
        entries.push_back(ToolEntry {
            .qualifiedName = qualifiedToolName(backendId, tool.name),
            .backendId = std::string(backendId),
            .originalName = std::move(tool.name),
            .description = std::move(tool.description),
            .inputSchema = std::move(tool.inputSchema),
        });
    }

    auto const count = entries.size();
    if (install(backendId, std::move(entries), {}))
        log::info("Backend '{}' provides {} tool(s)", backendId, count);
    return {};
}

void ToolCatalog::refreshAll(const std::vector<std::string>& backendIds, std::size_t maxParallel)
{
    auto next = std::atomic<std::size_t> { 0 };
    auto const workerCount = std::clamp<std::size_t>(maxParallel, 1, std::max<std::size_t>(backendIds.size(), 1));

    auto workers = std::vector<std::jthread> {};
    workers.reserve(workerCount);
    for (auto i = std::size_t { 0 }; i < workerCount; ++i)
    {
        workers.emplace_back([&] {
            for (auto index = next++; index < backendIds.size(); index = next++)
            {
                // Failures are recorded per backend and never stop the others.
                if (auto refreshed = refresh(backendIds[index]); !refreshed)
                    log::debug("Refresh of '{}' failed: {}", backendIds[index], refreshed.error().message);
            }
        });
    }
}

auto ToolCatalog::purge(std::string_view backendId) -> std::size_t
{
    auto lock = std::unique_lock(_mutex);
    auto const it = _byBackend.find(backendId);
    auto const count = it != _byBackend.end() ? it->second.size() : 0;
    eraseBackendLocked(backendId);
    if (auto const error = _discoveryErrors.find(backendId); error != _discoveryErrors.end())
        _discoveryErrors.erase(error);

    lock.unlock();

    {
        // A refresh that is still running keeps its own reference to the lock.
        auto locks = std::lock_guard(_refreshLocksMutex);
        if (auto const it = _refreshLocks.find(backendId); it != _refreshLocks.end() && it->second.use_count() == 1)
            _refreshLocks.erase(it);
    }

    if (count > 0)
        log::info("Purged {} tool(s) of backend '{}'", count, backendId);
    return count;
}

auto ToolCatalog::all() const -> std::vector<ToolEntry>
{
    auto lock = std::shared_lock(_mutex);
    auto entries = std::vector<ToolEntry> {};
    entries.reserve(_entries.size());
    for (const auto& [name, entry]: _entries)
        entries.push_back(entry);
    return entries;
}

auto ToolCatalog::resolve(std::string_view qualifiedName) const -> Result<ResolvedTool>
{
    auto lock = std::shared_lock(_mutex);
    auto const it = _entries.find(qualifiedName);
    if (it == _entries.end())
        return makeError(ErrorCode::ToolNotFound, std::format("Tool '{}' not found", qualifiedName));
    return ResolvedTool { .backendId = it->second.backendId, .originalName = it->second.originalName };
}

auto ToolCatalog::toolCount(std::string_view backendId) const -> std::size_t
{
    auto lock = std::shared_lock(_mutex);
    auto const it = _byBackend.find(backendId);
    return it != _byBackend.end() ? it->second.size() : 0;
}

auto ToolCatalog::lastDiscoveryError(std::string_view backendId) const -> std::string
{
    auto lock = std::shared_lock(_mutex);
    auto const it = _discoveryErrors.find(backendId);
    return it != _discoveryErrors.end() ? it->second : std::string {};
}

auto ToolCatalog::trackedBackends() -> std::size_t
{
    auto lock = std::lock_guard(_refreshLocksMutex);
    return _refreshLocks.size();
}

auto ToolCatalog::refreshLock(std::string_view backendId) -> std::shared_ptr<std::mutex>
{
    auto lock = std::lock_guard(_refreshLocksMutex);
    auto it = _refreshLocks.find(backendId);
    if (it == _refreshLocks.end())
        it = _refreshLocks.emplace(std::string(backendId), std::make_shared<std::mutex>()).first;
    return it->second;
}

auto ToolCatalog::install(std::string_view backendId, std::vector<ToolEntry> entries, std::string discoveryError)
    -> bool
{
    auto lock = std::unique_lock(_mutex);

    eraseBackendLocked(backendId);

    auto const status = _registry.status(backendId);
    if (!status || *status != BackendStatus::Ready)
    {
        log::debug("Backend '{}' is no longer ready; discarding discovered tools", backendId);
        return false;
    }

    if (discoveryError.empty())
        _discoveryErrors.erase(std::string(backendId));
    else
        _discoveryErrors[std::string(backendId)] = std::move(discoveryError);

    for (auto& entry: entries)
    {
        if (auto const existing = _entries.find(entry.qualifiedName); existing != _entries.end())
        {
            auto const& owner = existing->second.backendId;
            if (owner == backendId)
            {
                log::warning("Backend '{}' lists tool '{}' more than once", backendId, entry.originalName);
            }
            else
            {
                log::warning("Tool '{}' of backend '{}' replaces the entry of backend '{}'",
                             entry.qualifiedName,
                             backendId,
                             owner);
                std::erase(_byBackend[owner], entry.qualifiedName);
            }
        }

        auto name = entry.qualifiedName;
        _entries.insert_or_assign(std::move(name), std::move(entry));
    }

    auto names = std::vector<std::string> {};
    for (const auto& [name, entry]: _entries)
    {
        if (entry.backendId == backendId)
            names.push_back(name);
    }
    _byBackend[std::string(backendId)] = std::move(names);
    return true;
}

void ToolCatalog::eraseBackendLocked(std::string_view backendId)
{
    auto const it = _byBackend.find(backendId);
    if (it == _byBackend.end())
        return;

    for (const auto& name: it->second)
    {
        auto const entry = _entries.find(name);
        if (entry != _entries.end() && entry->second.backendId == backendId)
            _entries.erase(entry);
    }
    _byBackend.erase(it);
}

} // namespace mcpmux
