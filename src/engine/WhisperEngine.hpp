// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <engine/Engine.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace voxtype
{

/// @brief Configuration for the local whisper.cpp engine.
struct WhisperConfig
{
    std::string name = "whisper";
    std::string modelPath;
    int threads = 4;
    std::chrono::milliseconds timeout { 30000 };
};

/// @brief Offline speech-to-text using whisper.cpp.
///
/// The model is loaded lazily on the first transcription. A whisper context can only run
/// one inference at a time, so concurrent calls are serialized.
class WhisperEngine: public Engine
{
  public:
    explicit WhisperEngine(WhisperConfig config);
    ~WhisperEngine() override;

    WhisperEngine(const WhisperEngine&) = delete;
    WhisperEngine& operator=(const WhisperEngine&) = delete;

    [[nodiscard]] auto name() const -> std::string_view override;
    [[nodiscard]] auto defaultTimeout() const -> std::chrono::milliseconds override;

    /// @brief Succeeds if the model file exists and is readable. Does not load it.
    [[nodiscard]] auto probe() -> Result<bool> override;

    [[nodiscard]] auto transcribe(const AudioChunk& chunk, LanguageMode language, std::chrono::milliseconds timeout)
        -> Result<TranscriptionResult> override;

    /// @brief Loads the model now instead of on the first transcription.
    [[nodiscard]] auto load() -> VoidResult;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

/// @brief Returns an empty string if @p text is a known whisper hallucination token, else @p text.
[[nodiscard]] auto filterWhisperHallucination(std::string text) -> std::string;

} // namespace voxtype
