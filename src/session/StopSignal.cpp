// SPDX-License-Identifier: Apache-2.0
#include "StopSignal.hpp"

#include <core/Log.hpp>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <format>
#include <fstream>

#include <signal.h>
#include <unistd.h>

namespace voxtype
{

namespace
{

    std::atomic<bool> stopRequested = false;

    void handleStopSignal(int /*signal*/)
    {
        stopRequested.store(true);
    }

} // namespace

StopSignal::StopSignal(std::string stopFile): _stopFile(std::move(stopFile))
{
}

void StopSignal::installSignalHandlers()
{
    struct sigaction action {};
    action.sa_handler = handleStopSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    ::sigaction(SIGINT, &action, nullptr);
    ::sigaction(SIGTERM, &action, nullptr);
}

void StopSignal::request()
{
    stopRequested.store(true);
}

void StopSignal::reset()
{
    stopRequested.store(false);
}

auto StopSignal::requestExternal(std::string_view stopFile) -> VoidResult
{
    auto file = std::ofstream(std::string(stopFile), std::ios::trunc);
    if (!file)
        return makeError(ErrorCode::IoError, std::format("Cannot write stop file {}", stopFile));

    auto const now = std::chrono::system_clock::now().time_since_epoch();
    file << std::chrono::duration_cast<std::chrono::milliseconds>(now).count() << '\n';
    if (!file)
        return makeError(ErrorCode::IoError, std::format("Cannot write stop file {}", stopFile));
    return {};
}

void StopSignal::clearStale() const
{
    if (::unlink(_stopFile.c_str()) == 0)
        log::debug("Removed stale stop file {}", _stopFile);
    else if (errno != ENOENT)
        log::warning("Cannot remove stop file {}: {}", _stopFile, strerror(errno));
}

auto StopSignal::requested() const -> bool
{
    if (stopRequested.load())
        return true;
    return !_stopFile.empty() && ::access(_stopFile.c_str(), F_OK) == 0;
}

} // namespace voxtype
