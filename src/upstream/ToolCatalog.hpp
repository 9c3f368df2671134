// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <upstream/ConnectionRegistry.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace mcpmux
{

/// @brief One tool of the merged catalog.
struct ToolEntry
{
    std::string qualifiedName; ///< backendId + "_" + originalName
    std::string backendId;
    std::string originalName;
    std::string description;
    nlohmann::json inputSchema;
};

/// @brief Where a qualified name routes to.
struct ResolvedTool
{
    std::string backendId;
    std::string originalName;
};

/// @brief Builds the catalog-wide name of a backend tool.
[[nodiscard]] auto qualifiedToolName(std::string_view backendId, std::string_view toolName) -> std::string;

/// @brief Flat, namespaced directory of the tools of all Ready backends.
///
/// Each refresh replaces one backend's entries atomically. Entries are only installed
/// while the backend is Ready, so a crash observed before the install wins over a
/// slow discovery.
class ToolCatalog
{
  public:
    explicit ToolCatalog(ConnectionRegistry& registry);

    ToolCatalog(const ToolCatalog&) = delete;
    ToolCatalog& operator=(const ToolCatalog&) = delete;

    /// @brief Re-discovers the tools of one backend.
    /// @return Success, BackendUnavailable (entries purged) or DiscoveryError (backend left with zero tools).
    auto refresh(std::string_view backendId) -> VoidResult;

    /// @brief Refreshes many backends with at most @p maxParallel discoveries in flight.
    void refreshAll(const std::vector<std::string>& backendIds, std::size_t maxParallel = 4);

    /// @brief Drops every entry of a backend and its bookkeeping.
    /// @return The number of removed entries.
    auto purge(std::string_view backendId) -> std::size_t;

    /// @brief Returns all entries, ordered by qualified name.
    [[nodiscard]] auto all() const -> std::vector<ToolEntry>;

    /// @brief Maps a qualified name back to its backend and original tool name.
    /// @return The target, or ToolNotFound.
    [[nodiscard]] auto resolve(std::string_view qualifiedName) const -> Result<ResolvedTool>;

    [[nodiscard]] auto toolCount(std::string_view backendId) const -> std::size_t;

    /// @brief Returns the message of the last failed discovery, or an empty string.
    [[nodiscard]] auto lastDiscoveryError(std::string_view backendId) const -> std::string;

    /// @brief Returns the number of backends with a refresh lock, i.e. known to the catalog.
    [[nodiscard]] auto trackedBackends() -> std::size_t;

  private:
    ConnectionRegistry& _registry;

    mutable std::shared_mutex _mutex;
    std::map<std::string, ToolEntry, std::less<>> _entries;
    std::map<std::string, std::vector<std::string>, std::less<>> _byBackend;
    std::map<std::string, std::string, std::less<>> _discoveryErrors;

    std::mutex _refreshLocksMutex;
    std::map<std::string, std::shared_ptr<std::mutex>, std::less<>> _refreshLocks;

    [[nodiscard]] auto refreshLock(std::string_view backendId) -> std::shared_ptr<std::mutex>;
    auto install(std::string_view backendId, std::vector<ToolEntry> entries, std::string discoveryError) -> bool;
    void eraseBackendLocked(std::string_view backendId);
};

} // namespace mcpmux
