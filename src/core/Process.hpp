// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace mcpmux::process
{

/// @brief Parameters for spawnProcess().
struct SpawnRequest
{
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env; ///< Overrides applied on top of the inherited environment.
    std::string workingDirectory;           ///< Empty keeps the current directory.
    int stdinFd = -1;                       ///< -1 connects stdin to /dev/null.
    int stdoutFd = -1;                      ///< -1 connects stdout to /dev/null.
};

/// @brief Resolves a command to an executable file.
///
/// Commands containing a '/' are checked as paths; bare names are looked up in PATH.
/// @return The resolved path, or std::nullopt if no executable file was found.
[[nodiscard]] auto findExecutable(std::string_view command) -> std::optional<std::string>;

/// @brief Spawns a child process with posix_spawnp. stderr is inherited.
/// @return The child pid, or a SpawnError.
[[nodiscard]] auto spawnProcess(const SpawnRequest& request) -> Result<pid_t>;

/// @brief Maps a waitpid() status to a shell-style exit code (128 + signal for signals).
[[nodiscard]] auto exitCodeFromStatus(int status) -> int;

/// @brief Reaps the child if it has exited, without blocking.
/// @return The exit code, or std::nullopt while the child is still running.
[[nodiscard]] auto tryReap(pid_t pid) -> std::optional<int>;

/// @brief Sends SIGTERM, waits up to @p grace, then SIGKILLs and reaps the child.
/// @return The exit code of the reaped child.
auto terminateProcess(pid_t pid, std::chrono::milliseconds grace) -> int;

} // namespace mcpmux::process
