// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <chrono>
#include <string_view>

namespace voxtype
{

/// @brief Uniform contract over heterogeneous transcription backends.
///
/// Implementations must be safe to call from several worker threads at once and must not
/// retain the chunk after transcribe() returns. Errors use the engine codes of ErrorCode
/// (AuthMissing, AuthInvalid, NetworkUnreachable, Timeout, RateLimited, MalformedResponse).
class Engine
{
  public:
    virtual ~Engine() = default;

    /// @brief Returns the configured engine name (e.g. "elevenlabs").
    [[nodiscard]] virtual auto name() const -> std::string_view = 0;

    /// @brief Returns the per-call time bound used when none is given explicitly.
    [[nodiscard]] virtual auto defaultTimeout() const -> std::chrono::milliseconds = 0;

    /// @brief Lightweight availability check (credentials present, service reachable).
    /// @return true if the engine can take requests, or the reason it cannot.
    [[nodiscard]] virtual auto probe() -> Result<bool> = 0;

    /// @brief Transcribes one phrase.
    /// @param chunk The phrase audio; its sequence number is copied into the result.
    /// @param language The language mode to force, or Auto for detection.
    /// @param timeout Upper bound for the call.
    /// @return The transcription or an engine error.
    [[nodiscard]] virtual auto transcribe(const AudioChunk& chunk,
                                          LanguageMode language,
                                          std::chrono::milliseconds timeout) -> Result<TranscriptionResult> = 0;
};

} // namespace voxtype
