// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/EventChannel.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace mcpmux
{

/// @brief Lifecycle state of a supervised process.
enum class ProcessState : std::uint8_t
{
    NotStarted,
    Launching,
    HealthChecking,
    Running,
    Crashed,
    Stopped,
};

[[nodiscard]] auto toString(ProcessState state) -> std::string_view;

/// @brief Opaque handle of a supervised process. Never reused within one supervisor.
using ProcessHandle = std::uint64_t;

/// @brief What to launch and how to decide that it is up.
struct ProcessSpec
{
    std::string backendId;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::string workingDirectory;
    uint16_t port = 0;
    std::string healthCheckPath = "/mcp";
    std::chrono::milliseconds startupTimeout { 30000 };
};

/// @brief Snapshot of a supervised process.
struct SupervisedProcess
{
    std::string backendId;
    ProcessHandle handle = 0;
    pid_t pid = -1;
    std::chrono::system_clock::time_point startedAt;
    std::string healthCheckUrl;
    unsigned restartCount = 0;
    ProcessState state = ProcessState::NotStarted;
    std::optional<int> exitCode;
    std::string lastError;
    std::optional<ErrorCode> failure; ///< SpawnError or HealthCheckTimeout when startup failed.
};

/// @brief A state change published by the supervisor.
struct ProcessEvent
{
    std::string backendId;
    ProcessHandle handle = 0;
    ProcessState state = ProcessState::NotStarted;
    std::optional<int> exitCode;
    std::optional<ErrorCode> failure;
    std::string message;
};

struct SupervisorOptions
{
    std::chrono::milliseconds healthInterval { 1000 };
    std::chrono::milliseconds probeTimeout { 2000 };
    std::chrono::milliseconds stopGrace { 5000 };
};

/// @brief Spawns, health-checks and watches backend processes that serve MCP over HTTP.
///
/// Every process gets one monitor thread that launches it, polls its health endpoint
/// until it answers with a status below 500, and then watches for an unexpected exit.
/// All state changes are published on events(). A failing process never affects the
/// supervision of any other process.
class ProcessSupervisor
{
  public:
    explicit ProcessSupervisor(SupervisorOptions options = {});
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    /// @brief Starts supervising a new process. Launching happens asynchronously.
    /// @return The handle; spawn failures show up as ProcessState::Crashed.
    [[nodiscard]] auto start(ProcessSpec spec) -> ProcessHandle;

    /// @brief Terminates the process (SIGTERM, grace period, SIGKILL) and marks it Stopped.
    /// @return Success, or NotFound for an unknown handle.
    auto stop(ProcessHandle handle) -> VoidResult;

    /// @brief Stops the process and forgets the handle.
    auto release(ProcessHandle handle) -> VoidResult;

    /// @brief Stops the process if needed and launches it again with the same spec.
    [[nodiscard]] auto restart(ProcessHandle handle) -> VoidResult;

    [[nodiscard]] auto status(ProcessHandle handle) const -> Result<ProcessState>;
    [[nodiscard]] auto info(ProcessHandle handle) const -> Result<SupervisedProcess>;

    /// @brief Blocks until the process is Running, Crashed or Stopped, or @p timeout elapses.
    /// @return The state at return time.
    [[nodiscard]] auto waitUntilSettled(ProcessHandle handle, std::chrono::milliseconds timeout) const
        -> Result<ProcessState>;

    /// @brief Stops every supervised process in parallel.
    void stopAll();

    /// @brief Channel of state changes, consumed by the aggregator.
    [[nodiscard]] auto events() -> EventChannel<ProcessEvent>&;

  private:
    struct Entry;

    SupervisorOptions _options;
    EventChannel<ProcessEvent> _events;
    mutable std::mutex _mutex;
    std::map<ProcessHandle, std::shared_ptr<Entry>> _entries;
    ProcessHandle _nextHandle = 1;

    [[nodiscard]] auto find(ProcessHandle handle) const -> std::shared_ptr<Entry>;
    void launch(const std::shared_ptr<Entry>& entry);
    void monitor(std::stop_token token, Entry& entry);
    void setState(Entry& entry,
                  ProcessState state,
                  std::string message,
                  std::optional<int> exitCode = std::nullopt,
                  std::optional<ErrorCode> failure = std::nullopt);
    void halt(Entry& entry);
};

} // namespace mcpmux
