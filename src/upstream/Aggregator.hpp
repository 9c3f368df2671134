// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <upstream/ConnectionRegistry.hpp>
#include <upstream/ProcessSupervisor.hpp>
#include <upstream/RequestRouter.hpp>
#include <upstream/RequestTracker.hpp>
#include <upstream/ToolCatalog.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace mcpmux
{

struct AggregatorOptions
{
    SupervisorOptions supervisor;
    McpClientTimeouts timeouts;
    RequestTrackerOptions tracking;
    std::size_t maxParallel = 4; ///< Concurrent connects and discoveries during start().
    Connector connector;         ///< Empty selects defaultConnector().
};

/// @brief Owns the upstream side of the gateway and keeps its parts consistent.
///
/// Administrative changes go through here so that the registry and the catalog never
/// disagree: adding a backend refreshes its tools, removing or crashing one purges them.
/// Process events from the supervisor are consumed on a dedicated dispatch thread, which
/// also notices clients whose connection went away between calls.
class Aggregator
{
  public:
    explicit Aggregator(AggregatorOptions options = {});
    ~Aggregator();

    Aggregator(const Aggregator&) = delete;
    Aggregator& operator=(const Aggregator&) = delete;

    /// @brief Registers all configured backends and discovers the tools of each as soon as it connects.
    ///
    /// Invalid entries are logged and skipped; they never prevent the others from starting.
    void start(const std::vector<BackendSpec>& backends);

    /// @brief Registers and connects a backend, then discovers its tools.
    /// @return The backend's state after the attempt, or a ConfigError.
    [[nodiscard]] auto addBackend(BackendSpec spec) -> Result<BackendInfo>;

    /// @brief Removes a backend with its tools and process.
    auto removeBackend(std::string_view id) -> VoidResult;

    /// @brief Re-runs the connection cycle of a backend and re-discovers its tools.
    [[nodiscard]] auto reconnectBackend(std::string_view id) -> Result<BackendInfo>;

    /// @brief Re-discovers the tools of every Ready backend, at most maxParallel at a time.
    /// @return The number of backends refreshed.
    auto refreshTools() -> Result<std::size_t>;

    [[nodiscard]] auto listBackends() const -> std::vector<BackendInfo>;
    [[nodiscard]] auto backend(std::string_view id) const -> Result<BackendInfo>;

    [[nodiscard]] auto tools() const -> std::vector<ToolEntry>;

    /// @brief Routes a tool call. Rejected with BackendUnavailable once shutdown has begun.
    [[nodiscard]] auto callTool(std::string_view qualifiedName,
                                const nlohmann::json& arguments,
                                std::string_view clientAddress = {}) -> Result<ToolOutcome>;

    /// @brief Stops admin changes, drains tool calls for up to @p grace, then closes
    ///        every client and stops every process. Safe to call more than once.
    void shutdown(std::chrono::milliseconds grace);

    [[nodiscard]] auto isShuttingDown() const -> bool { return _shuttingDown; }

    [[nodiscard]] auto supervisor() -> ProcessSupervisor& { return _supervisor; }
    [[nodiscard]] auto registry() -> ConnectionRegistry& { return _registry; }
    [[nodiscard]] auto catalog() -> ToolCatalog& { return _catalog; }
    [[nodiscard]] auto tracker() -> RequestTracker& { return _tracker; }

  private:
    std::size_t _maxParallel;
    ProcessSupervisor _supervisor;
    ConnectionRegistry _registry;
    ToolCatalog _catalog;
    RequestTracker _tracker;
    RequestRouter _router;

    std::atomic<bool> _shuttingDown = false;
    std::mutex _inFlightMutex;
    std::condition_variable _inFlightDrained;
    std::size_t _inFlight = 0;

    std::jthread _dispatcher;

    [[nodiscard]] auto withCatalogInfo(BackendInfo info) const -> BackendInfo;
    [[nodiscard]] auto rejectIfShuttingDown() const -> VoidResult;
    void dispatchEvents(std::stop_token token);
    void onProcessEvent(const ProcessEvent& event);
};

} // namespace mcpmux
