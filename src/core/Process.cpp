// SPDX-License-Identifier: Apache-2.0
#include "Process.hpp"

#include <core/Log.hpp>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <format>
#include <thread>

#include <sys/stat.h>
#include <sys/wait.h>

#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace mcpmux::process
{

namespace
{
    auto isExecutableFile(const std::string& path) -> bool
    {
        struct stat info {};
        if (::stat(path.c_str(), &info) != 0 || !S_ISREG(info.st_mode))
            return false;
        return ::access(path.c_str(), X_OK) == 0;
    }

    /// Owns a posix_spawn_file_actions_t for the duration of a spawn.
    class FileActions
    {
      public:
        FileActions() { posix_spawn_file_actions_init(&_actions); }
        ~FileActions() { posix_spawn_file_actions_destroy(&_actions); }

        FileActions(const FileActions&) = delete;
        FileActions& operator=(const FileActions&) = delete;

        [[nodiscard]] auto get() -> posix_spawn_file_actions_t* { return &_actions; }

      private:
        posix_spawn_file_actions_t _actions {};
    };
} // namespace

auto findExecutable(std::string_view command) -> std::optional<std::string>
{
    if (command.empty())
        return std::nullopt;

    if (command.find('/') != std::string_view::npos)
    {
        auto path = std::string(command);
        if (isExecutableFile(path))
            return path;
        return std::nullopt;
    }

    auto const* pathEnv = std::getenv("PATH");
    auto searchPath = std::string_view(pathEnv ? pathEnv : "/usr/local/bin:/usr/bin:/bin");
    while (true)
    {
        auto const colon = searchPath.find(':');
        auto dir = searchPath.substr(0, colon);
        if (dir.empty())
            dir = ".";

        auto candidate = std::format("{}/{}", dir, command);
        if (isExecutableFile(candidate))
            return candidate;

        if (colon == std::string_view::npos)
            break;
        searchPath = searchPath.substr(colon + 1);
    }
    return std::nullopt;
}

auto spawnProcess(const SpawnRequest& request) -> Result<pid_t>
{
    auto actions = FileActions {};

    if (request.stdinFd >= 0)
        posix_spawn_file_actions_adddup2(actions.get(), request.stdinFd, STDIN_FILENO);
    else
        posix_spawn_file_actions_addopen(actions.get(), STDIN_FILENO, "/dev/null", O_RDONLY, 0);

    if (request.stdoutFd >= 0)
        posix_spawn_file_actions_adddup2(actions.get(), request.stdoutFd, STDOUT_FILENO);
    else
        posix_spawn_file_actions_addopen(actions.get(), STDOUT_FILENO, "/dev/null", O_WRONLY, 0);

    if (!request.workingDirectory.empty())
        posix_spawn_file_actions_addchdir_np(actions.get(), request.workingDirectory.c_str());

    // Build argv
    auto argv = std::vector<char*> {};
    auto cmdCopy = request.command;
    argv.push_back(cmdCopy.data());
    auto argCopies = std::vector<std::string>(request.args);
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    // Build environment (inherit + overrides)
    auto envStrings = std::vector<std::string> {};
    if (environ)
    {
        for (auto** e = environ; *e; ++e)
        {
            auto entry = std::string_view(*e);
            auto const key = entry.substr(0, entry.find('='));
            if (!request.env.contains(std::string(key)))
                envStrings.emplace_back(entry);
        }
    }
    for (const auto& [key, value]: request.env)
        envStrings.push_back(std::format("{}={}", key, value));

    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    auto pid = pid_t {};
    auto const status =
        posix_spawnp(&pid, request.command.c_str(), actions.get(), nullptr, argv.data(), envp.data());
    if (status != 0)
        return makeError(ErrorCode::SpawnError,
                         std::format("Failed to spawn process '{}': {}", request.command, std::strerror(status)));

    log::debug("Spawned '{}' as pid {}", request.command, pid);
    return pid;
}

auto exitCodeFromStatus(int status) -> int
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

auto tryReap(pid_t pid) -> std::optional<int>
{
    auto status = 0;
    auto const result = ::waitpid(pid, &status, WNOHANG);
    if (result == 0)
        return std::nullopt;
    if (result < 0)
        return errno == ECHILD ? std::optional<int> { -1 } : std::nullopt;
    return exitCodeFromStatus(status);
}

auto terminateProcess(pid_t pid, std::chrono::milliseconds grace) -> int
{
    if (auto const code = tryReap(pid))
        return *code;

    ::kill(pid, SIGTERM);

    auto const deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (auto const code = tryReap(pid))
            return *code;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    log::warning("Process {} did not exit within {} ms, sending SIGKILL", pid, grace.count());
    ::kill(pid, SIGKILL);

    auto status = 0;
    while (::waitpid(pid, &status, 0) < 0)
    {
        if (errno != EINTR)
            return -1;
    }
    return exitCodeFromStatus(status);
}

} // namespace mcpmux::process
