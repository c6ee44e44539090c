// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <string>
#include <string_view>

namespace voxtype
{

/// @brief Tells a running session to stop.
///
/// Combines a process-wide flag (set by SIGINT/SIGTERM or request()) with a stop file that
/// `voxtype stop` writes from another process.
class StopSignal
{
  public:
    explicit StopSignal(std::string stopFile);

    /// @brief Routes SIGINT and SIGTERM to the process-wide flag.
    static void installSignalHandlers();

    /// @brief Sets the process-wide flag.
    static void request();

    /// @brief Clears the process-wide flag.
    static void reset();

    /// @brief Writes the stop file for a session running in another process.
    [[nodiscard]] static auto requestExternal(std::string_view stopFile) -> VoidResult;

    /// @brief Removes a stop file left over from an earlier session.
    void clearStale() const;

    /// @brief Returns true if a stop was requested by signal, request() or stop file.
    [[nodiscard]] auto requested() const -> bool;

    [[nodiscard]] auto stopFile() const -> const std::string& { return _stopFile; }

  private:
    std::string _stopFile;
};

} // namespace voxtype
