// SPDX-License-Identifier: Apache-2.0
#include "SessionLock.hpp"

#include <core/Log.hpp>

#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstring>
#include <format>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace voxtype
{

namespace
{

    auto parsePid(std::string_view content) -> std::optional<pid_t>
    {
        auto pid = pid_t { 0 };
        auto const [ptr, ec] = std::from_chars(content.data(), content.data() + content.size(), pid);
        if (ec != std::errc {} || pid <= 0)
            return std::nullopt;
        return pid;
    }

    auto readPid(int fd) -> std::optional<pid_t>
    {
        char buffer[32] {};
        auto const n = ::pread(fd, buffer, sizeof(buffer) - 1, 0);
        if (n <= 0)
            return std::nullopt;
        return parsePid(std::string_view(buffer, static_cast<size_t>(n)));
    }

    /// Tells whether @p fd still refers to the file currently linked at @p path.
    auto isLinkedAt(int fd, const std::string& path) -> bool
    {
        struct stat opened {};
        struct stat linked {};
        if (::fstat(fd, &opened) != 0 || ::stat(path.c_str(), &linked) != 0)
            return false;
        return opened.st_dev == linked.st_dev && opened.st_ino == linked.st_ino;
    }

    auto writePid(int fd, const std::string& path) -> VoidResult
    {
        auto const content = std::format("{}\n", ::getpid());
        if (::ftruncate(fd, 0) != 0
            || ::pwrite(fd, content.data(), content.size(), 0) != static_cast<ssize_t>(content.size()))
            return makeError(ErrorCode::IoError, std::format("Cannot write lock file {}: {}", path, strerror(errno)));
        return {};
    }

    constexpr auto MaxAcquireAttempts = 3;
    constexpr auto OwnerPidAttempts = 10;
    constexpr auto OwnerPidPause = std::chrono::milliseconds(5);

} // namespace

auto SessionLock::liveOwner(std::string_view path) -> std::optional<pid_t>
{
    auto const fd = ::open(std::string(path).c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0)
        return std::nullopt;

    auto owner = std::optional<pid_t> {};
    if (::flock(fd, LOCK_SH | LOCK_NB) == 0)
        ::flock(fd, LOCK_UN);
    else if (errno == EWOULDBLOCK)
    {
        for (auto attempt = 0; attempt < OwnerPidAttempts && !owner; ++attempt)
        {
            owner = readPid(fd);
            if (!owner)
                std::this_thread::sleep_for(OwnerPidPause);
        }
    }

    ::close(fd);
    return owner;
}

auto SessionLock::acquire(std::string path) -> Result<SessionLock>
{
    for (auto attempt = 0; attempt < MaxAcquireAttempts; ++attempt)
    {
        auto const fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
        if (fd < 0)
            return makeError(ErrorCode::IoError, std::format("Cannot open lock file {}: {}", path, strerror(errno)));

        if (::flock(fd, LOCK_EX | LOCK_NB) != 0)
        {
            auto const error = errno;
            auto const owner = readPid(fd);
            ::close(fd);
            if (error != EWOULDBLOCK)
                return makeError(ErrorCode::IoError, std::format("Cannot lock {}: {}", path, strerror(error)));
            if (owner)
                return makeError(ErrorCode::SessionAlreadyActive,
                                 std::format("Another session is active (pid {})", *owner));
            return makeError(ErrorCode::SessionAlreadyActive, "Another session is active");
        }

        // The previous owner may have unlinked the file between our open() and flock().
        if (!isLinkedAt(fd, path))
        {
            ::close(fd);
            continue;
        }

        if (auto const previous = readPid(fd))
            log::warning("[{}] Taking over lock file {} left by pid {}",
                         errorCodeToString(ErrorCode::LockStaleOverride),
                         path,
                         *previous);

        if (auto written = writePid(fd, path); !written)
        {
            ::close(fd);
            return std::unexpected(written.error());
        }

        log::debug("Session lock acquired: {} (pid {})", path, ::getpid());
        return SessionLock(std::move(path), fd);
    }

    return makeError(ErrorCode::SessionAlreadyActive, std::format("Lost the race for lock file {}", path));
}

SessionLock::SessionLock(std::string path, int fd): _path(std::move(path)), _fd(fd)
{
}

SessionLock::SessionLock(SessionLock&& other) noexcept:
    _path(std::exchange(other._path, {})), _fd(std::exchange(other._fd, -1))
{
}

SessionLock& SessionLock::operator=(SessionLock&& other) noexcept
{
    if (this != &other)
    {
        release();
        _path = std::exchange(other._path, {});
        _fd = std::exchange(other._fd, -1);
    }
    return *this;
}

SessionLock::~SessionLock()
{
    release();
}

void SessionLock::release()
{
    if (_fd < 0)
        return;

    // Unlink while still holding the lock, and only the file we locked.
    if (isLinkedAt(_fd, _path))
    {
        if (::unlink(_path.c_str()) != 0)
            log::error("Cannot remove lock file {}: {}", _path, strerror(errno));
        else
            log::debug("Session lock released: {}", _path);
    }

    ::close(_fd);
    _fd = -1;
    _path.clear();
}

} // namespace voxtype
