// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <span>
#include <vector>

namespace voxtype
{

/// @brief Wraps mono 16-bit PCM samples into a RIFF/WAVE byte buffer.
/// @param samples The PCM samples.
/// @param sampleRate The sample rate in Hz.
/// @return The complete WAV file contents (44-byte header + data).
[[nodiscard]] auto encodeWav(std::span<const std::int16_t> samples, std::uint32_t sampleRate)
    -> std::vector<std::uint8_t>;

/// @brief Converts 16-bit PCM to normalized float32 in [-1, 1).
[[nodiscard]] auto toFloatSamples(std::span<const std::int16_t> samples) -> std::vector<float>;

} // namespace voxtype
