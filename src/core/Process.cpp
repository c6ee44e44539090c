// SPDX-License-Identifier: Apache-2.0
#include "Process.hpp"

#include <core/Log.hpp>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <format>

#include <sys/stat.h>
#include <sys/wait.h>

#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace voxtype
{

namespace
{

    auto isExecutableFile(const std::string& path) -> bool
    {
        struct stat st {};
        return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
    }

    auto writeAll(int fd, std::string_view data) -> bool
    {
        while (!data.empty())
        {
            auto const written = ::write(fd, data.data(), data.size());
            if (written < 0)
            {
                if (errno == EINTR)
                    continue;
                return false;
            }
            data.remove_prefix(static_cast<size_t>(written));
        }
        return true;
    }

} // namespace

auto findExecutable(std::string_view name) -> std::optional<std::string>
{
    if (name.empty())
        return std::nullopt;

    if (name.find('/') != std::string_view::npos)
    {
        auto path = std::string(name);
        if (isExecutableFile(path))
            return path;
        return std::nullopt;
    }

    auto const* const pathEnv = std::getenv("PATH");
    if (!pathEnv)
        return std::nullopt;

    auto dirs = std::string_view { pathEnv };
    while (!dirs.empty())
    {
        auto const sep = dirs.find(':');
        auto const dir = dirs.substr(0, sep);
        dirs = sep == std::string_view::npos ? std::string_view {} : dirs.substr(sep + 1);

        auto candidate = std::format("{}/{}", dir.empty() ? "." : dir, name);
        if (isExecutableFile(candidate))
            return candidate;
    }

    return std::nullopt;
}

auto runProcess(const ProcessSpec& spec) -> Result<int>
{
    int stdinPipe[2] = { -1, -1 };
    if (spec.stdinData && ::pipe(stdinPipe) != 0)
        return makeError(ErrorCode::IoError, "Failed to create stdin pipe");

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    if (spec.stdinData)
    {
        posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
        posix_spawn_file_actions_addclose(&actions, stdinPipe[1]);
    }

    // Build argv
    auto argv = std::vector<char*> {};
    auto cmdCopy = spec.command;
    argv.push_back(cmdCopy.data());
    auto argCopies = std::vector<std::string>(spec.args);
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    pid_t pid;
    auto const status = posix_spawnp(&pid, spec.command.c_str(), &actions, nullptr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);

    if (spec.stdinData)
        ::close(stdinPipe[0]);

    if (status != 0)
    {
        if (spec.stdinData)
            ::close(stdinPipe[1]);
        return makeError(ErrorCode::IoError,
                         std::format("Failed to spawn process '{}': {}", spec.command, strerror(status)));
    }

    if (spec.stdinData)
    {
        if (!writeAll(stdinPipe[1], *spec.stdinData))
            log::warning("Failed to write stdin of '{}': {}", spec.command, strerror(errno));
        ::close(stdinPipe[1]);
    }

    int waitStatus = 0;
    while (::waitpid(pid, &waitStatus, 0) < 0)
    {
        if (errno != EINTR)
            return makeError(ErrorCode::IoError,
                             std::format("Failed to wait for '{}': {}", spec.command, strerror(errno)));
    }

    if (WIFEXITED(waitStatus))
        return WEXITSTATUS(waitStatus);
    if (WIFSIGNALED(waitStatus))
        return 128 + WTERMSIG(waitStatus);
    return 1;
}

} // namespace voxtype
