// SPDX-License-Identifier: Apache-2.0
#include "WavEncoder.hpp"

#include <string_view>

namespace voxtype
{

namespace
{

    constexpr auto WavHeaderSize = 44u;
    constexpr auto BitsPerSample = std::uint16_t { 16 };
    constexpr auto Channels = std::uint16_t { 1 };

    void putTag(std::vector<std::uint8_t>& out, std::string_view tag)
    {
        out.insert(out.end(), tag.begin(), tag.end());
    }

    void putU16(std::vector<std::uint8_t>& out, std::uint16_t value)
    {
        out.push_back(static_cast<std::uint8_t>(value & 0xFF));
        out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
    }

    void putU32(std::vector<std::uint8_t>& out, std::uint32_t value)
    {
        for (auto shift = 0; shift < 32; shift += 8)
            out.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFF));
    }

} // namespace

auto encodeWav(std::span<const std::int16_t> samples, std::uint32_t sampleRate) -> std::vector<std::uint8_t>
{
    auto const dataSize = static_cast<std::uint32_t>(samples.size() * sizeof(std::int16_t));
    auto const blockAlign = static_cast<std::uint16_t>(Channels * BitsPerSample / 8);

    auto out = std::vector<std::uint8_t> {};
    out.reserve(WavHeaderSize + dataSize);

    putTag(out, "RIFF");
    putU32(out, 36 + dataSize);
    putTag(out, "WAVE");

    putTag(out, "fmt ");
    putU32(out, 16); // PCM fmt chunk size
    putU16(out, 1);  // PCM
    putU16(out, Channels);
    putU32(out, sampleRate);
    putU32(out, sampleRate * blockAlign);
    putU16(out, blockAlign);
    putU16(out, BitsPerSample);

    putTag(out, "data");
    putU32(out, dataSize);
    for (auto const sample: samples)
        putU16(out, static_cast<std::uint16_t>(sample));

    return out;
}

auto toFloatSamples(std::span<const std::int16_t> samples) -> std::vector<float>
{
    auto out = std::vector<float> {};
    out.reserve(samples.size());
    for (auto const sample: samples)
        out.push_back(static_cast<float>(sample) / 32768.0f);
    return out;
}

} // namespace voxtype
