// SPDX-License-Identifier: Apache-2.0
#include "ProcessSupervisor.hpp"

#include <core/Log.hpp>
#include <core/Process.hpp>
#include <net/HttpClient.hpp>

#include <algorithm>
#include <condition_variable>
#include <format>
#include <thread>

namespace mcpmux
{

namespace
{
    auto isSettled(ProcessState state) -> bool
    {
        return state == ProcessState::Running || state == ProcessState::Crashed || state == ProcessState::Stopped;
    }

    /// Sleeps for @p duration unless a stop is requested first.
    /// @return False if the sleep was interrupted.
    auto sleepFor(std::stop_token const& token, std::chrono::milliseconds duration) -> bool
    {
        auto mutex = std::mutex {};
        auto condition = std::condition_variable_any {};
        auto lock = std::unique_lock(mutex);
        return !condition.wait_for(lock, token, duration, [] { return false; }) && !token.stop_requested();
    }
} // namespace

auto toString(ProcessState state) -> std::string_view
{
    switch (state)
    {
        case ProcessState::NotStarted: return "not_started";
        case ProcessState::Launching: return "launching";
        case ProcessState::HealthChecking: return "health_checking";
        case ProcessState::Running: return "running";
        case ProcessState::Crashed: return "crashed";
        case ProcessState::Stopped: return "stopped";
    }
    return "unknown";
}

struct ProcessSupervisor::Entry
{
    ProcessSpec spec;

    mutable std::mutex mutex;
    mutable std::condition_variable changed;
    SupervisedProcess record;

    // Serializes stop / restart. The monitor thread is only touched under this lock.
    std::mutex lifecycleMutex;
    std::jthread monitor;
};

ProcessSupervisor::ProcessSupervisor(SupervisorOptions options): _options(options)
{
}

ProcessSupervisor::~ProcessSupervisor()
{
    stopAll();
    _events.close();
}

auto ProcessSupervisor::start(ProcessSpec spec) -> ProcessHandle
{
    auto entry = std::make_shared<Entry>();
    entry->record.backendId = spec.backendId;
    entry->record.healthCheckUrl = std::format("http://127.0.0.1:{}{}", spec.port, spec.healthCheckPath);
    entry->spec = std::move(spec);

    auto handle = ProcessHandle {};
    {
        auto lock = std::lock_guard(_mutex);
        handle = _nextHandle++;
        entry->record.handle = handle;
        _entries.emplace(handle, entry);
    }

    {
        auto lock = std::lock_guard(entry->lifecycleMutex);
        launch(entry);
    }
    return handle;
}

auto ProcessSupervisor::stop(ProcessHandle handle) -> VoidResult
{
    auto entry = find(handle);
    if (!entry)
        return makeError(ErrorCode::NotFound, std::format("Unknown process handle {}", handle));

    auto lock = std::lock_guard(entry->lifecycleMutex);
    halt(*entry);
    return {};
}

auto ProcessSupervisor::release(ProcessHandle handle) -> VoidResult
{
    auto stopped = stop(handle);
    if (!stopped)
        return stopped;

    auto lock = std::lock_guard(_mutex);
    _entries.erase(handle);
    return {};
}

auto ProcessSupervisor::restart(ProcessHandle handle) -> VoidResult
{
    auto entry = find(handle);
    if (!entry)
        return makeError(ErrorCode::NotFound, std::format("Unknown process handle {}", handle));

    auto lock = std::lock_guard(entry->lifecycleMutex);
    halt(*entry);
    {
        auto recordLock = std::lock_guard(entry->mutex);
        ++entry->record.restartCount;
        entry->record.exitCode.reset();
        entry->record.lastError.clear();
        entry->record.pid = -1;
    }
    log::info("Restarting service '{}' (restart #{})", entry->spec.backendId, entry->record.restartCount);
    launch(entry);
    return {};
}

auto ProcessSupervisor::status(ProcessHandle handle) const -> Result<ProcessState>
{
    return info(handle).transform([](const SupervisedProcess& process) { return process.state; });
}

auto ProcessSupervisor::info(ProcessHandle handle) const -> Result<SupervisedProcess>
{
    auto entry = find(handle);
    if (!entry)
        return makeError(ErrorCode::NotFound, std::format("Unknown process handle {}", handle));

    auto lock = std::lock_guard(entry->mutex);
    return entry->record;
}

auto ProcessSupervisor::waitUntilSettled(ProcessHandle handle, std::chrono::milliseconds timeout) const
    -> Result<ProcessState>
{
    auto entry = find(handle);
    if (!entry)
        return makeError(ErrorCode::NotFound, std::format("Unknown process handle {}", handle));

    auto lock = std::unique_lock(entry->mutex);
    entry->changed.wait_for(lock, timeout, [&] { return isSettled(entry->record.state); });
    return entry->record.state;
}

void ProcessSupervisor::stopAll()
{
    auto entries = std::vector<std::shared_ptr<Entry>> {};
    {
        auto lock = std::lock_guard(_mutex);
        for (const auto& [handle, entry]: _entries)
            entries.push_back(entry);
    }

    auto workers = std::vector<std::jthread> {};
    workers.reserve(entries.size());
    for (const auto& entry: entries)
    {
        workers.emplace_back([this, entry] {
            auto lock = std::lock_guard(entry->lifecycleMutex);
            halt(*entry);
        });
    }
}

auto ProcessSupervisor::events() -> EventChannel<ProcessEvent>&
{
    return _events;
}

auto ProcessSupervisor::find(ProcessHandle handle) const -> std::shared_ptr<Entry>
{
    auto lock = std::lock_guard(_mutex);
    auto const it = _entries.find(handle);
    return it != _entries.end() ? it->second : nullptr;
}

void ProcessSupervisor::launch(const std::shared_ptr<Entry>& entry)
{
    entry->monitor = std::jthread([this, entry](std::stop_token token) { monitor(std::move(token), *entry); });
}

void ProcessSupervisor::monitor(std::stop_token token, Entry& entry)
{
    auto const& spec = entry.spec;
    setState(entry, ProcessState::Launching, std::format("Launching '{}'", spec.command));

    auto pid = process::spawnProcess(process::SpawnRequest {
        .command = spec.command,
        .args = spec.args,
        .env = spec.env,
        .workingDirectory = spec.workingDirectory,
        .stdinFd = -1,
        .stdoutFd = -1,
    });
    if (!pid)
    {
        setState(entry, ProcessState::Crashed, pid.error().message, std::nullopt, ErrorCode::SpawnError);
        return;
    }

    {
        auto lock = std::lock_guard(entry.mutex);
        entry.record.pid = *pid;
        entry.record.startedAt = std::chrono::system_clock::now();
    }
    setState(entry, ProcessState::HealthChecking, std::format("Started pid {}", *pid));

    auto const attempts = std::max<std::int64_t>(1, spec.startupTimeout / _options.healthInterval);
    auto healthy = false;
    auto url = std::string {};
    {
        auto lock = std::lock_guard(entry.mutex);
        url = entry.record.healthCheckUrl;
    }

    for (auto attempt = std::int64_t { 0 }; attempt < attempts && !healthy; ++attempt)
    {
        if (token.stop_requested())
            return;

        if (auto const exitCode = process::tryReap(*pid))
        {
            setState(entry,
                     ProcessState::Crashed,
                     std::format("Process exited with code {} during startup", *exitCode),
                     *exitCode);
            return;
        }

        auto const probe = net::fetch(net::HttpClientRequest {
            .method = "GET",
            .url = url,
            .headers = {},
            .body = {},
            .timeout = _options.probeTimeout,
        });
        if (probe && probe->status < 500)
        {
            healthy = true;
            break;
        }
        log::trace("Health probe {} for '{}' failed", attempt + 1, spec.backendId);

        if (!sleepFor(token, _options.healthInterval))
            return;
    }

    if (!healthy)
    {
        auto const exitCode = process::terminateProcess(*pid, _options.stopGrace);
        setState(entry,
                 ProcessState::Crashed,
                 std::format("Health check at {} did not succeed within {} attempts", url, attempts),
                 exitCode,
                 ErrorCode::HealthCheckTimeout);
        return;
    }

    setState(entry, ProcessState::Running, std::format("Healthy at {}", url));

    while (sleepFor(token, _options.healthInterval))
    {
        if (auto const exitCode = process::tryReap(*pid))
        {
            setState(entry,
                     ProcessState::Crashed,
                     std::format("Process exited unexpectedly with code {}", *exitCode),
                     *exitCode);
            return;
        }
    }
}

void ProcessSupervisor::setState(Entry& entry,
                                 ProcessState state,
                                 std::string message,
                                 std::optional<int> exitCode,
                                 std::optional<ErrorCode> failure)
{
    auto event = ProcessEvent {};
    {
        auto lock = std::lock_guard(entry.mutex);
        entry.record.state = state;
        if (exitCode)
            entry.record.exitCode = exitCode;
        if (state == ProcessState::Launching)
            entry.record.failure.reset();
        if (state == ProcessState::Crashed)
        {
            entry.record.lastError = message;
            entry.record.failure = failure;
        }

        event = ProcessEvent {
            .backendId = entry.record.backendId,
            .handle = entry.record.handle,
            .state = state,
            .exitCode = entry.record.exitCode,
            .failure = failure,
            .message = message,
        };
    }
    entry.changed.notify_all();

    if (state == ProcessState::Crashed)
        log::error("Service '{}' crashed: {}", event.backendId, event.message);
    else
        log::info("Service '{}' is {}: {}", event.backendId, toString(state), event.message);

    _events.push(std::move(event));
}

void ProcessSupervisor::halt(Entry& entry)
{
    // Joining first leaves this thread as the only one that may still reap the pid.
    if (entry.monitor.joinable())
    {
        entry.monitor.request_stop();
        entry.monitor.join();
    }

    auto pid = pid_t { -1 };
    auto state = ProcessState::NotStarted;
    auto reaped = false;
    {
        auto lock = std::lock_guard(entry.mutex);
        pid = entry.record.pid;
        state = entry.record.state;
        reaped = entry.record.exitCode.has_value();
    }

    if (state == ProcessState::Stopped)
        return;

    auto exitCode = std::optional<int> {};
    if (pid > 0 && !reaped)
        exitCode = process::terminateProcess(pid, _options.stopGrace);

    setState(entry, ProcessState::Stopped, "Stopped", exitCode);
}

} // namespace mcpmux
