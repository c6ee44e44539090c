// SPDX-License-Identifier: Apache-2.0
#include <audio/WavEncoder.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace voxtype;

namespace
{

auto readU32(const std::vector<std::uint8_t>& bytes, std::size_t offset) -> std::uint32_t
{
    return static_cast<std::uint32_t>(bytes[offset]) | (static_cast<std::uint32_t>(bytes[offset + 1]) << 8)
           | (static_cast<std::uint32_t>(bytes[offset + 2]) << 16)
           | (static_cast<std::uint32_t>(bytes[offset + 3]) << 24);
}

auto readU16(const std::vector<std::uint8_t>& bytes, std::size_t offset) -> std::uint16_t
{
    return static_cast<std::uint16_t>(bytes[offset] | (bytes[offset + 1] << 8));
}

auto tag(const std::vector<std::uint8_t>& bytes, std::size_t offset) -> std::string
{
    return std::string(bytes.begin() + static_cast<std::ptrdiff_t>(offset),
                       bytes.begin() + static_cast<std::ptrdiff_t>(offset + 4));
}

} // namespace

TEST_CASE("encodeWav writes a mono 16-bit PCM header", "[wav]")
{
    auto const samples = std::vector<std::int16_t> { 0, 1, -1, 32767, -32768 };
    auto const wav = encodeWav(samples, 16000);

    REQUIRE(wav.size() == 44 + samples.size() * 2);
    CHECK(tag(wav, 0) == "RIFF");
    CHECK(readU32(wav, 4) == 36 + samples.size() * 2);
    CHECK(tag(wav, 8) == "WAVE");
    CHECK(tag(wav, 12) == "fmt ");
    CHECK(readU16(wav, 20) == 1);
    CHECK(readU16(wav, 22) == 1);
    CHECK(readU32(wav, 24) == 16000);
    CHECK(readU32(wav, 28) == 32000);
    CHECK(readU16(wav, 32) == 2);
    CHECK(readU16(wav, 34) == 16);
    CHECK(tag(wav, 36) == "data");
    CHECK(readU32(wav, 40) == samples.size() * 2);
}

TEST_CASE("encodeWav stores samples little-endian", "[wav]")
{
    auto const wav = encodeWav(std::vector<std::int16_t> { 0x1234, -2 }, 8000);

    CHECK(wav[44] == 0x34);
    CHECK(wav[45] == 0x12);
    CHECK(wav[46] == 0xFE);
    CHECK(wav[47] == 0xFF);
}

TEST_CASE("encodeWav of no samples is a bare header", "[wav]")
{
    auto const wav = encodeWav({}, 16000);
    CHECK(wav.size() == 44);
    CHECK(readU32(wav, 40) == 0);
}

TEST_CASE("toFloatSamples normalizes to [-1, 1)", "[wav]")
{
    auto const floats = toFloatSamples(std::vector<std::int16_t> { 0, -32768, 16384 });

    REQUIRE(floats.size() == 3);
    CHECK(floats[0] == 0.0f);
    CHECK(floats[1] == -1.0f);
    CHECK(floats[2] == 0.5f);
}
