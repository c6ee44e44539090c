// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/FrameSource.hpp>
#include <core/Error.hpp>

#include <memory>
#include <string>

namespace voxtype
{

/// @brief Configuration of the microphone frame source.
struct AudioCaptureConfig
{
    /// @brief Substring to match against capture device names (case-insensitive).
    /// If empty, the first non-monitor capture device is used.
    std::string deviceName;
    std::uint32_t sampleRate = 16000;
    std::uint32_t framesPerBuffer = 1024;

    /// @brief How much audio may queue up while the session thread is busy.
    double maxBufferedSeconds = 60.0;
};

/// @brief Captures the microphone using miniaudio and hands out fixed-size int16 frames.
///
/// The device callback only copies samples into a queue; the reading thread pulls frames
/// with nextFrame(). A device that stops on its own is reported as an AudioError.
class AudioCapture: public FrameSource
{
  public:
    explicit AudioCapture(AudioCaptureConfig config = {});
    ~AudioCapture() override;

    AudioCapture(const AudioCapture&) = delete;
    AudioCapture& operator=(const AudioCapture&) = delete;

    /// @brief Opens the capture device (without starting it).
    /// @return Success or an error.
    [[nodiscard]] auto initialize() -> VoidResult;

    [[nodiscard]] auto start() -> VoidResult override;
    [[nodiscard]] auto nextFrame(std::chrono::milliseconds timeout) -> Result<std::optional<AudioFrame>> override;
    void close() override;
    [[nodiscard]] auto sampleRate() const -> std::uint32_t override;

    // Impl must be accessible from the C audio callback
    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace voxtype
