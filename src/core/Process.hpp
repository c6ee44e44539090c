// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace voxtype
{

/// @brief Describes a helper process to run (xdotool, notify-send, ...).
struct ProcessSpec
{
    std::string command;
    std::vector<std::string> args;

    /// @brief Data written to the child's stdin before it is closed. Empty = inherit no input.
    std::optional<std::string> stdinData;
};

/// @brief Looks up an executable in $PATH.
/// @param name The executable name (absolute paths are checked directly).
/// @return The resolved path, or std::nullopt if not found or not executable.
[[nodiscard]] auto findExecutable(std::string_view name) -> std::optional<std::string>;

/// @brief Spawns a process and waits for it to exit.
/// @param spec The command line and optional stdin payload.
/// @return The exit status (128 + signal number if killed), or an IoError if the spawn failed.
[[nodiscard]] auto runProcess(const ProcessSpec& spec) -> Result<int>;

} // namespace voxtype
