// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace voxtype
{

/// @brief Ordering key of a phrase. Assigned at boundary detection, strictly increasing from 0.
using SequenceNumber = std::uint64_t;

/// @brief Language the engines are asked to transcribe in.
enum class LanguageMode
{
    Auto,
    English,
    Czech,
};

/// @brief All supported language modes, in display order.
inline constexpr auto AllLanguageModes =
    std::array { LanguageMode::Auto, LanguageMode::English, LanguageMode::Czech };

/// @brief Converts a LanguageMode to its persisted code ("auto", "en", "cs").
[[nodiscard]] constexpr auto languageModeToString(LanguageMode mode) -> std::string_view
{
    switch (mode)
    {
        case LanguageMode::Auto: return "auto";
        case LanguageMode::English: return "en";
        case LanguageMode::Czech: return "cs";
    }
    return "auto";
}

/// @brief Returns a human-readable name for a language mode.
[[nodiscard]] constexpr auto languageModeDisplayName(LanguageMode mode) -> std::string_view
{
    switch (mode)
    {
        case LanguageMode::Auto: return "Auto-detect";
        case LanguageMode::English: return "English";
        case LanguageMode::Czech: return "Czech";
    }
    return "Auto-detect";
}

/// @brief Parses a persisted language code.
/// @return The language mode, or std::nullopt if the code is not supported.
[[nodiscard]] constexpr auto languageModeFromString(std::string_view str) -> std::optional<LanguageMode>
{
    if (str == "auto")
        return LanguageMode::Auto;
    if (str == "en")
        return LanguageMode::English;
    if (str == "cs")
        return LanguageMode::Czech;
    return std::nullopt;
}

/// @brief Why a session ended.
enum class TerminationReason
{
    LongSilence,
    MaxDuration,
    ExternalStop,
    Error,
};

[[nodiscard]] constexpr auto terminationReasonToString(TerminationReason reason) -> std::string_view
{
    switch (reason)
    {
        case TerminationReason::LongSilence: return "long_silence";
        case TerminationReason::MaxDuration: return "max_duration";
        case TerminationReason::ExternalStop: return "external_stop";
        case TerminationReason::Error: return "error";
    }
    return "error";
}

/// @brief A fixed-size block of mono 16-bit samples as delivered by a FrameSource.
struct AudioFrame
{
    std::chrono::steady_clock::time_point timestamp;
    std::vector<std::int16_t> samples;
    std::uint32_t sampleRate = 16000;
};

/// @brief A contiguous run of frames judged to be one phrase.
struct AudioChunk
{
    SequenceNumber sequence = 0;
    std::vector<std::int16_t> samples;
    std::uint32_t sampleRate = 16000;

    /// @brief Returns the chunk length in seconds.
    [[nodiscard]] auto durationSeconds() const -> double
    {
        if (sampleRate == 0)
            return 0.0;
        return static_cast<double>(samples.size()) / static_cast<double>(sampleRate);
    }
};

/// @brief The outcome of transcribing one AudioChunk.
struct TranscriptionResult
{
    SequenceNumber sequence = 0;
    std::string text;
    LanguageMode language = LanguageMode::Auto;
    std::string engine;
    bool success = true;
    std::optional<Error> error;

    /// @brief Builds a failure result that still occupies its sequence slot.
    [[nodiscard]] static auto failure(SequenceNumber sequence, std::string engine, Error error)
        -> TranscriptionResult
    {
        return TranscriptionResult {
            .sequence = sequence,
            .text = {},
            .language = LanguageMode::Auto,
            .engine = std::move(engine),
            .success = false,
            .error = std::move(error),
        };
    }
};

} // namespace voxtype
