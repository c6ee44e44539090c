// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <format>
#include <optional>
#include <string_view>

namespace voxtype::log
{

enum class Level
{
    Error,
    Warning,
    Info,
    Debug,
    Trace,
};

/// @brief Parses "error", "warning", "info", "debug" or "trace" (case-sensitive).
[[nodiscard]] auto levelFromString(std::string_view name) -> std::optional<Level>;

void setLevel(Level level);
[[nodiscard]] auto getLevel() -> Level;

/// @brief Names the process role that prefixes every line ("run", "daemon", ...).
///
/// Session and daemon processes append to the same log file, so each line carries
/// the role and the process id.
void setRole(std::string_view role);

/// @brief Mirrors every log line into the given file, appending with a timestamp.
///
/// An empty path closes the current file. Failure to open is reported on stderr and
/// logging continues on the console only.
void setLogFile(std::string_view path);

/// @brief Writes one message to every active sink if @p level passes the threshold.
void write(Level level, std::string_view message);

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args)
{
    write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args)
{
    write(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args)
{
    if (getLevel() >= Level::Info)
        write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args)
{
    if (getLevel() >= Level::Debug)
        write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void trace(std::format_string<Args...> fmt, Args&&... args)
{
    if (getLevel() >= Level::Trace)
        write(Level::Trace, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace voxtype::log
