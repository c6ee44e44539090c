// SPDX-License-Identifier: Apache-2.0
#include "ElevenLabsEngine.hpp"

#include <audio/WavEncoder.hpp>
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <array>
#include <format>
#include <vector>

namespace voxtype
{

namespace elevenlabs
{

    auto checkApiKey(std::string_view apiKey) -> VoidResult
    {
        if (apiKey.empty())
            return makeError(ErrorCode::AuthMissing, "No ElevenLabs API key configured");
        if (!apiKey.starts_with("sk_"))
            return makeError(ErrorCode::AuthInvalid, "ElevenLabs API key does not start with 'sk_'");
        return {};
    }

    auto classifyTranscribeStatus(long status) -> std::optional<ErrorCode>
    {
        if (status == 200)
            return std::nullopt;
        if (status == 429)
            return ErrorCode::RateLimited;
        if (status == 401 || status == 403)
            return ErrorCode::AuthInvalid;
        if (status >= 500)
            return ErrorCode::NetworkUnreachable;
        return ErrorCode::MalformedResponse;
    }

    auto classifyProbeStatus(long status) -> Result<bool>
    {
        // 422 and 429 still prove the service and the key are fine.
        switch (status)
        {
            case 200:
            case 422:
            case 429: return true;
            case 401:
            case 403:
                return makeError(ErrorCode::AuthInvalid,
                                 std::format("ElevenLabs rejected the API key (HTTP {})", status));
            default:
                if (status >= 500)
                    return makeError(ErrorCode::NetworkUnreachable,
                                     std::format("ElevenLabs service error (HTTP {})", status));
                return makeError(ErrorCode::MalformedResponse,
                                 std::format("Unexpected ElevenLabs probe answer (HTTP {})", status));
        }
    }

    auto parseTranscript(std::string_view body) -> Result<std::string>
    {
        auto parsed = json::parse(body, ErrorCode::MalformedResponse);
        if (!parsed)
            return std::unexpected(parsed.error());

        auto text = json::requireString(*parsed, "text", ErrorCode::MalformedResponse);
        if (!text)
            return std::unexpected(text.error());

        auto const start = text->find_first_not_of(" \t\n\r");
        if (start == std::string::npos)
            return std::string {};
        auto const end = text->find_last_not_of(" \t\n\r");
        return text->substr(start, end - start + 1);
    }

} // namespace elevenlabs

ElevenLabsEngine::ElevenLabsEngine(ElevenLabsConfig config): _config(std::move(config))
{
}

auto ElevenLabsEngine::probe() -> Result<bool>
{
    if (auto keyCheck = elevenlabs::checkApiKey(_config.apiKey); !keyCheck)
        return std::unexpected(keyCheck.error());

    auto const headers = std::array { std::format("xi-api-key: {}", _config.apiKey) };
    auto response = _http.get(std::format("{}/models", _config.baseUrl), headers, _config.probeTimeout);
    if (!response)
        return std::unexpected(response.error());

    return elevenlabs::classifyProbeStatus(response->status);
}

auto ElevenLabsEngine::transcribe(const AudioChunk& chunk,
                                  LanguageMode language,
                                  std::chrono::milliseconds timeout) -> Result<TranscriptionResult>
{
    if (auto keyCheck = elevenlabs::checkApiKey(_config.apiKey); !keyCheck)
        return std::unexpected(keyCheck.error());

    auto result = TranscriptionResult {
        .sequence = chunk.sequence,
        .text = {},
        .language = language,
        .engine = _config.name,
        .success = true,
        .error = std::nullopt,
    };

    auto const wav = encodeWav(chunk.samples, chunk.sampleRate);
    if (wav.size() < elevenlabs::MinimumWavBytes)
    {
        log::debug("Phrase #{} too short for transcription ({} bytes)", chunk.sequence, wav.size());
        return result;
    }

    auto parts = std::vector<MultipartPart> {
        { .name = "file",
          .data = std::string(wav.begin(), wav.end()),
          .filename = "audio.wav",
          .contentType = "audio/wav" },
        { .name = "model_id", .data = _config.modelId, .filename = {}, .contentType = {} },
        { .name = "tag_audio_events", .data = "false", .filename = {}, .contentType = {} },
    };
    if (language != LanguageMode::Auto)
        parts.push_back({ .name = "language_code",
                          .data = std::string(languageModeToString(language)),
                          .filename = {},
                          .contentType = {} });

    auto const headers = std::array { std::format("xi-api-key: {}", _config.apiKey) };
    auto const started = std::chrono::steady_clock::now();
    auto response =
        _http.postMultipart(std::format("{}/speech-to-text", _config.baseUrl), headers, parts, timeout);
    if (!response)
        return std::unexpected(response.error());

    if (auto const failure = elevenlabs::classifyTranscribeStatus(response->status))
        return makeError(*failure,
                         std::format("ElevenLabs HTTP {}: {}", response->status, response->body.substr(0, 200)));

    auto text = elevenlabs::parseTranscript(response->body);
    if (!text)
        return std::unexpected(text.error());

    auto const elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started);
    log::info("ElevenLabs transcribed #{} in {:.1f}s: '{}'", chunk.sequence, elapsed.count(), *text);

    result.text = std::move(*text);
    return result;
}

} // namespace voxtype
