// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <optional>
#include <string>
#include <string_view>

#include <sys/types.h>

namespace voxtype
{

/// @brief Single-instance admission through an advisory-locked pid file.
///
/// Ownership is an exclusive flock(2) on the lock file, held for the lifetime of the
/// SessionLock, so the kernel drops it when the owner exits however it exits. The file
/// content is the owner's pid and only serves reporting. A file left behind by an owner
/// that died is stale and is taken over. The file is removed when the owning SessionLock
/// is destroyed.
class SessionLock
{
  public:
    /// @brief Acquires the lock at @p path.
    /// @return The held lock, or SessionAlreadyActive if another open file holds it.
    [[nodiscard]] static auto acquire(std::string path) -> Result<SessionLock>;

    /// @brief Returns the pid of the live owner of the lock at @p path, if any.
    ///
    /// A lock that is held but does not name its owner yet (the owner is between taking
    /// the lock and writing its pid) is reported as unowned after a short wait.
    [[nodiscard]] static auto liveOwner(std::string_view path) -> std::optional<pid_t>;

    SessionLock(SessionLock&& other) noexcept;
    SessionLock& operator=(SessionLock&& other) noexcept;
    SessionLock(const SessionLock&) = delete;
    SessionLock& operator=(const SessionLock&) = delete;
    ~SessionLock();

    /// @brief Removes the lock file and drops the lock now. Idempotent.
    void release();

    [[nodiscard]] auto path() const -> const std::string& { return _path; }
    [[nodiscard]] auto isHeld() const -> bool { return _fd >= 0; }

  private:
    SessionLock(std::string path, int fd);

    std::string _path;
    int _fd = -1;
};

} // namespace voxtype
