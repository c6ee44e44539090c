// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

namespace voxtype
{

/// @brief Process exit codes of the command line interface.
enum class ExitCode : int
{
    Success = 0,
    Failure = 1,
    Usage = 2,
    NoSessionRunning = 3,
    LockContention = 4,
    NoEngineAvailable = 5,
};

/// @brief Maps an error to the exit code the command line reports for it.
[[nodiscard]] constexpr auto exitCodeFor(ErrorCode code) -> ExitCode
{
    switch (code)
    {
        case ErrorCode::SessionAlreadyActive: return ExitCode::LockContention;
        case ErrorCode::NoEngineAvailable: return ExitCode::NoEngineAvailable;
        case ErrorCode::NoSessionRunning: return ExitCode::NoSessionRunning;
        case ErrorCode::InvalidArgument: return ExitCode::Usage;
        default: return ExitCode::Failure;
    }
}

} // namespace voxtype
