// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <engine/Engine.hpp>
#include <net/HttpClient.hpp>

#include <chrono>
#include <optional>
#include <string>

namespace voxtype
{

/// @brief Configuration of the ElevenLabs speech-to-text engine.
struct ElevenLabsConfig
{
    std::string name = "elevenlabs";
    std::string apiKey;
    std::string baseUrl = "https://api.elevenlabs.io/v1";
    std::string modelId = "scribe_v1";
    std::chrono::milliseconds timeout { 8000 };
    std::chrono::milliseconds probeTimeout { 5000 };
};

namespace elevenlabs
{
    /// @brief WAV payloads smaller than this are answered locally with empty text.
    inline constexpr auto MinimumWavBytes = std::size_t { 8000 };

    /// @brief Checks that an API key is present and has the expected "sk_" shape.
    [[nodiscard]] auto checkApiKey(std::string_view apiKey) -> VoidResult;

    /// @brief Maps an HTTP status of the transcription endpoint to an engine error.
    /// @return std::nullopt for 200, otherwise the matching error code.
    [[nodiscard]] auto classifyTranscribeStatus(long status) -> std::optional<ErrorCode>;

    /// @brief Maps an HTTP status of the models endpoint to the probe outcome.
    [[nodiscard]] auto classifyProbeStatus(long status) -> Result<bool>;

    /// @brief Extracts the trimmed "text" field of a transcription response.
    [[nodiscard]] auto parseTranscript(std::string_view body) -> Result<std::string>;
} // namespace elevenlabs

/// @brief Cloud transcription through the ElevenLabs REST API.
class ElevenLabsEngine: public Engine
{
  public:
    explicit ElevenLabsEngine(ElevenLabsConfig config);

    [[nodiscard]] auto name() const -> std::string_view override { return _config.name; }
    [[nodiscard]] auto defaultTimeout() const -> std::chrono::milliseconds override { return _config.timeout; }
    [[nodiscard]] auto probe() -> Result<bool> override;
    [[nodiscard]] auto transcribe(const AudioChunk& chunk, LanguageMode language, std::chrono::milliseconds timeout)
        -> Result<TranscriptionResult> override;

  private:
    ElevenLabsConfig _config;
    HttpClient _http;
};

} // namespace voxtype
