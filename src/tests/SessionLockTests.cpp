// SPDX-License-Identifier: Apache-2.0
#include <session/SessionLock.hpp>
#include <session/StopSignal.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <format>
#include <fstream>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace voxtype;

namespace
{

auto tempPath(std::string_view name) -> std::string
{
    return (std::filesystem::temp_directory_path() / std::format("voxtype_test_{}_{}", ::getpid(), name)).string();
}

void writePidFile(const std::string& path, pid_t pid)
{
    auto file = std::ofstream(path, std::ios::trunc);
    file << pid << '\n';
}

/// @brief Returns the pid of a child that has already exited and been reaped.
auto deadPid() -> pid_t
{
    auto const child = ::fork();
    if (child == 0)
        ::_exit(0);
    REQUIRE(child > 0);
    auto status = 0;
    ::waitpid(child, &status, 0);
    return child;
}

} // namespace

TEST_CASE("SessionLock admits one session at a time", "[lock]")
{
    auto const path = tempPath("admit.pid");
    std::filesystem::remove(path);

    auto first = SessionLock::acquire(path);
    REQUIRE(first.has_value());
    CHECK(first->isHeld());
    CHECK(std::filesystem::exists(path));
    CHECK(SessionLock::liveOwner(path) == ::getpid());

    auto second = SessionLock::acquire(path);
    REQUIRE(!second.has_value());
    CHECK(second.error().code == ErrorCode::SessionAlreadyActive);

    first->release();
    CHECK(!first->isHeld());
    CHECK(!std::filesystem::exists(path));
    CHECK(!SessionLock::liveOwner(path).has_value());

    auto third = SessionLock::acquire(path);
    CHECK(third.has_value());
}

TEST_CASE("SessionLock takes over a stale lock", "[lock]")
{
    auto const path = tempPath("stale.pid");
    writePidFile(path, deadPid());

    auto lock = SessionLock::acquire(path);

    REQUIRE(lock.has_value());
    auto file = std::ifstream(path);
    auto owner = pid_t { 0 };
    file >> owner;
    CHECK(owner == ::getpid());
}

TEST_CASE("SessionLock treats garbage lock content as stale", "[lock]")
{
    auto const path = tempPath("garbage.pid");
    {
        auto file = std::ofstream(path, std::ios::trunc);
        file << "not a pid\n";
    }

    CHECK(!SessionLock::liveOwner(path).has_value());
    CHECK(SessionLock::acquire(path).has_value());
}

TEST_CASE("SessionLock removes the file when it goes out of scope", "[lock]")
{
    auto const path = tempPath("scope.pid");
    std::filesystem::remove(path);
    {
        auto lock = SessionLock::acquire(path);
        REQUIRE(lock.has_value());

        auto moved = std::move(*lock);
        CHECK(moved.isHeld());
        CHECK(!lock->isHeld());
    }
    CHECK(!std::filesystem::exists(path));
}

TEST_CASE("SessionLock leaves a lock file it no longer owns alone", "[lock]")
{
    auto const path = tempPath("foreign.pid");
    std::filesystem::remove(path);
    {
        auto lock = SessionLock::acquire(path);
        REQUIRE(lock.has_value());
        std::filesystem::remove(path);
        writePidFile(path, ::getppid());
    }
    CHECK(std::filesystem::exists(path));
    std::filesystem::remove(path);
}

TEST_CASE("SessionLock refuses a held lock whose file does not name its owner yet", "[lock]")
{
    auto const path = tempPath("unnamed.pid");
    std::filesystem::remove(path);

    // Another owner that has taken the lock but not written its pid.
    auto const holder = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    REQUIRE(holder >= 0);
    REQUIRE(::flock(holder, LOCK_EX | LOCK_NB) == 0);

    auto refused = SessionLock::acquire(path);
    REQUIRE(!refused.has_value());
    CHECK(refused.error().code == ErrorCode::SessionAlreadyActive);
    CHECK(std::filesystem::file_size(path) == 0);

    ::close(holder);

    auto admitted = SessionLock::acquire(path);
    REQUIRE(admitted.has_value());
    CHECK(SessionLock::liveOwner(path) == ::getpid());
}

TEST_CASE("SessionLock refuses a held lock even when its pid looks stale", "[lock]")
{
    auto const path = tempPath("heldstale.pid");
    writePidFile(path, deadPid());

    auto const holder = ::open(path.c_str(), O_RDWR | O_CLOEXEC);
    REQUIRE(holder >= 0);
    REQUIRE(::flock(holder, LOCK_EX | LOCK_NB) == 0);

    auto refused = SessionLock::acquire(path);
    REQUIRE(!refused.has_value());
    CHECK(refused.error().code == ErrorCode::SessionAlreadyActive);
    CHECK(std::filesystem::exists(path));

    ::close(holder);
    std::filesystem::remove(path);
}

TEST_CASE("liveOwner of a missing lock file is empty", "[lock]")
{
    auto const path = tempPath("missing.pid");
    std::filesystem::remove(path);
    CHECK(!SessionLock::liveOwner(path).has_value());
}

TEST_CASE("StopSignal observes the stop file", "[lock]")
{
    StopSignal::reset();
    auto const path = tempPath("session.stop");
    std::filesystem::remove(path);

    auto const signal = StopSignal(path);
    CHECK(!signal.requested());

    REQUIRE(StopSignal::requestExternal(path).has_value());
    CHECK(signal.requested());

    signal.clearStale();
    CHECK(!signal.requested());
    CHECK(!std::filesystem::exists(path));
}

TEST_CASE("StopSignal observes the process-wide flag", "[lock]")
{
    StopSignal::reset();
    auto const signal = StopSignal("");
    CHECK(!signal.requested());

    StopSignal::request();
    CHECK(signal.requested());

    StopSignal::reset();
    CHECK(!signal.requested());
}
