// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <chrono>
#include <cstdint>
#include <optional>

namespace voxtype
{

/// @brief Abstract source of fixed-size audio frames, in capture order.
class FrameSource
{
  public:
    virtual ~FrameSource() = default;

    /// @brief Starts producing frames.
    /// @return Success or an error.
    [[nodiscard]] virtual auto start() -> VoidResult = 0;

    /// @brief Waits for the next frame.
    /// @param timeout Maximum time to wait.
    /// @return The next frame, std::nullopt if none arrived within the timeout, or an error.
    ///         Errors are fatal to the reading session.
    [[nodiscard]] virtual auto nextFrame(std::chrono::milliseconds timeout)
        -> Result<std::optional<AudioFrame>> = 0;

    /// @brief Stops producing frames. Safe to call more than once.
    virtual void close() = 0;

    /// @brief Returns the sample rate of produced frames.
    [[nodiscard]] virtual auto sampleRate() const -> std::uint32_t = 0;
};

} // namespace voxtype
