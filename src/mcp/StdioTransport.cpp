// SPDX-License-Identifier: Apache-2.0
#include "StdioTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <core/Process.hpp>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <atomic>
#include <format>
#include <mutex>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace mcpmux
{

namespace
{
    /// Time between SIGTERM and SIGKILL when a stdio server is closed.
    constexpr auto CloseGrace = std::chrono::milliseconds(2000);

    /// Writes to a server that already exited must fail with EPIPE instead of killing the gateway.
    void ignoreBrokenPipes()
    {
        static auto once = std::once_flag {};
        std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
    }
} // namespace

struct StdioTransport::Impl
{
    int stdinWrite = -1;
    int stdoutRead = -1;
    std::atomic<bool> connected = false;
    std::string readBuffer;
    std::string command;
    std::string commandLine;
    std::mutex writeMutex;

    // Guards the child pid; whoever reaps the child clears it.
    std::mutex processMutex;
    pid_t childPid = -1;
};

StdioTransport::StdioTransport(): _impl(std::make_unique<Impl>())
{
}

StdioTransport::~StdioTransport()
{
    close();
}

auto StdioTransport::start(const StdioTransportConfig& config) -> VoidResult
{
    if (_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport already connected");

    ignoreBrokenPipes();

    int stdinPipe[2];
    int stdoutPipe[2];

    if (::pipe2(stdinPipe, O_CLOEXEC) != 0)
        return makeError(ErrorCode::SpawnError, "Failed to create stdin pipe");
    if (::pipe2(stdoutPipe, O_CLOEXEC) != 0)
    {
        ::close(stdinPipe[0]);
        ::close(stdinPipe[1]);
        return makeError(ErrorCode::SpawnError, "Failed to create stdout pipe");
    }

    auto const pid = process::spawnProcess(process::SpawnRequest {
        .command = config.command,
        .args = config.args,
        .env = config.env,
        .workingDirectory = config.workingDirectory,
        .stdinFd = stdinPipe[0],
        .stdoutFd = stdoutPipe[1],
    });

    ::close(stdinPipe[0]);
    ::close(stdoutPipe[1]);

    if (!pid)
    {
        ::close(stdinPipe[1]);
        ::close(stdoutPipe[0]);
        return std::unexpected(pid.error());
    }

    {
        auto lock = std::lock_guard(_impl->processMutex);
        _impl->childPid = *pid;
    }
    _impl->stdinWrite = stdinPipe[1];
    _impl->stdoutRead = stdoutPipe[0];
    _impl->command = config.command;
    _impl->commandLine = config.command;
    for (const auto& arg: config.args)
        _impl->commandLine += " " + arg;
    _impl->readBuffer.clear();
    _impl->connected = true;
    log::info("MCP server started: {} (pid {})", _impl->commandLine, *pid);
    return {};
}

auto StdioTransport::send(const nlohmann::json& message) -> VoidResult
{
    if (!_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    auto const data = message.dump() + "\n";

    auto lock = std::lock_guard(_impl->writeMutex);
    auto offset = std::size_t { 0 };
    while (offset < data.size())
    {
        auto const written = ::write(_impl->stdinWrite, data.data() + offset, data.size() - offset);
        if (written < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::TransportError,
                             std::format("Failed to write to process stdin: {}", std::strerror(errno)));
        }
        offset += static_cast<std::size_t>(written);
    }

    return {};
}

auto StdioTransport::receive(std::chrono::milliseconds timeout) -> Result<nlohmann::json>
{
    if (!_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    auto const deadline = std::chrono::steady_clock::now() + timeout;

    // Read until we get a complete line
    while (true)
    {
        auto const newlinePos = _impl->readBuffer.find('\n');
        if (newlinePos != std::string::npos)
        {
            auto line = _impl->readBuffer.substr(0, newlinePos);
            _impl->readBuffer.erase(0, newlinePos + 1);

            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (line.empty())
                continue;

            return json::parse(line);
        }

        auto const remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0)
            return makeError(ErrorCode::TimeoutError,
                             std::format("No response from '{}' within {} ms", _impl->command, timeout.count()));

        auto pfd = pollfd { .fd = _impl->stdoutRead, .events = POLLIN, .revents = 0 };
        auto const ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::TransportError, std::format("poll failed: {}", std::strerror(errno)));
        }
        if (ready == 0)
            continue;

        auto buf = std::array<char, 4096> {};
        auto const bytesRead = ::read(_impl->stdoutRead, buf.data(), buf.size());
        if (bytesRead < 0 && errno == EINTR)
            continue;
        if (bytesRead <= 0)
        {
            _impl->connected = false;
            return makeError(ErrorCode::TransportError, "Process stdout closed");
        }
        _impl->readBuffer.append(buf.data(), static_cast<size_t>(bytesRead));
    }
}

void StdioTransport::close()
{
    // Stopping the child first makes a write blocked on a full pipe fail with EPIPE,
    // so the write mutex below is free soon after.
    {
        auto lock = std::lock_guard(_impl->processMutex);
        if (_impl->childPid > 0)
        {
            auto const exitCode = process::terminateProcess(_impl->childPid, CloseGrace);
            log::debug("MCP server '{}' (pid {}) exited with code {}", _impl->command, _impl->childPid, exitCode);
            _impl->childPid = -1;
        }
    }

    {
        auto lock = std::lock_guard(_impl->writeMutex);
        if (_impl->stdinWrite >= 0)
        {
            ::close(_impl->stdinWrite);
            _impl->stdinWrite = -1;
        }
    }
    if (_impl->stdoutRead >= 0)
    {
        ::close(_impl->stdoutRead);
        _impl->stdoutRead = -1;
    }

    if (_impl->connected.exchange(false))
        log::debug("MCP transport closed");
}

auto StdioTransport::isConnected() const -> bool
{
    if (!_impl->connected)
        return false;

    // A close() in progress owns the child; report the flag until it is done.
    auto lock = std::unique_lock(_impl->processMutex, std::try_to_lock);
    if (!lock.owns_lock() || _impl->childPid <= 0)
        return _impl->connected;

    if (auto const exitCode = process::tryReap(_impl->childPid))
    {
        log::warning("MCP server '{}' (pid {}) exited with code {}", _impl->command, _impl->childPid, *exitCode);
        _impl->childPid = -1;
        _impl->connected = false;
    }
    return _impl->connected;
}

auto StdioTransport::endpoint() const -> std::string
{
    return _impl->commandLine.empty() ? std::string("stdio") : _impl->commandLine;
}

auto StdioTransport::pid() const -> pid_t
{
    auto lock = std::lock_guard(_impl->processMutex);
    return _impl->childPid;
}

} // namespace mcpmux
