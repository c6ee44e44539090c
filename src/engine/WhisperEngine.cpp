// SPDX-License-Identifier: Apache-2.0
#include "WhisperEngine.hpp"

#include <audio/WavEncoder.hpp>
#include <core/Log.hpp>

#include <whisper.h>

#include <array>
#include <filesystem>
#include <format>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>

namespace voxtype
{

namespace
{

    auto whisperLineMutex = std::mutex {};

    /// @brief Line buffer for whisper.cpp log continuation messages.
    auto whisperLineBuffer = std::string {};

    auto mapGgmlLevel(ggml_log_level level) -> std::optional<log::Level>
    {
        switch (level)
        {
            case GGML_LOG_LEVEL_ERROR: return log::Level::Error;
            case GGML_LOG_LEVEL_WARN: return log::Level::Warning;
            case GGML_LOG_LEVEL_INFO: return log::Level::Debug;
            case GGML_LOG_LEVEL_DEBUG: return log::Level::Trace;
            default: return std::nullopt;
        }
    }

    /// @brief Forwards whisper.cpp output to voxtype::log, one complete line at a time.
    ///
    /// whisper.cpp prints its load report in fragments; informational output is demoted
    /// to debug so it stays out of the terminal during dictation.
    void whisperLogCallback(ggml_log_level level, char const* text, void* /*userData*/)
    {
        if (level == GGML_LOG_LEVEL_NONE || text == nullptr)
            return;

        auto lock = std::lock_guard(whisperLineMutex);
        whisperLineBuffer += std::string_view { text };

        while (true)
        {
            auto const nlPos = whisperLineBuffer.find('\n');
            if (nlPos == std::string::npos)
                break;

            auto line = whisperLineBuffer.substr(0, nlPos);
            auto const end = line.find_last_not_of(" \t\r");
            if (end != std::string::npos)
                line = line.substr(0, end + 1);

            if (!line.empty() && end != std::string::npos)
                log::write(mapGgmlLevel(level).value_or(log::Level::Debug), line);

            whisperLineBuffer.erase(0, nlPos + 1);
        }
    }

    struct AbortState
    {
        std::chrono::steady_clock::time_point deadline;
    };

    auto abortWhenExpired(void* userData) -> bool
    {
        auto const* state = static_cast<AbortState const*>(userData);
        return std::chrono::steady_clock::now() >= state->deadline;
    }

} // namespace

auto filterWhisperHallucination(std::string text) -> std::string
{
    if (!text.starts_with('[') && !text.starts_with('('))
        return text;

    static constexpr auto HallucinationPatterns = std::array {
        std::string_view { "[BLANK_AUDIO]" }, std::string_view { "(blank audio)" },
        std::string_view { "[SOUND]" },       std::string_view { "[MUSIC]" },
        std::string_view { "[NOISE]" },       std::string_view { "(silence)" },
    };
    for (auto const& pattern: HallucinationPatterns)
        if (text == pattern)
            return std::string {};
    return text;
}

struct WhisperEngine::Impl
{
    WhisperConfig config;
    std::timed_mutex mutex;
    whisper_context* ctx = nullptr;

    ~Impl()
    {
        if (ctx)
            whisper_free(ctx);
    }

    auto ensureLoaded() -> VoidResult
    {
        if (ctx)
            return {};

        whisper_log_set(whisperLogCallback, nullptr);

        auto const started = std::chrono::steady_clock::now();
        auto params = whisper_context_default_params();
        ctx = whisper_init_from_file_with_params(config.modelPath.c_str(), params);
        if (!ctx)
            return makeError(ErrorCode::ModelLoadError,
                             std::format("Failed to load whisper model: {}", config.modelPath));

        auto const elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started);
        log::info("Whisper model loaded in {:.1f}s: {}", elapsed.count(), config.modelPath);
        return {};
    }
};

WhisperEngine::WhisperEngine(WhisperConfig config): _impl(std::make_unique<Impl>())
{
    _impl->config = std::move(config);
}

WhisperEngine::~WhisperEngine() = default;

auto WhisperEngine::name() const -> std::string_view
{
    return _impl->config.name;
}

auto WhisperEngine::defaultTimeout() const -> std::chrono::milliseconds
{
    return _impl->config.timeout;
}

auto WhisperEngine::probe() -> Result<bool>
{
    auto const& path = _impl->config.modelPath;
    if (path.empty())
        return makeError(ErrorCode::ModelLoadError, "No whisper model configured");

    auto ec = std::error_code {};
    if (!std::filesystem::is_regular_file(path, ec))
        return makeError(ErrorCode::ModelLoadError, std::format("Whisper model not found: {}", path));

    if (!std::ifstream(path, std::ios::binary).is_open())
        return makeError(ErrorCode::ModelLoadError, std::format("Whisper model not readable: {}", path));

    return true;
}

auto WhisperEngine::transcribe(const AudioChunk& chunk,
                               LanguageMode language,
                               std::chrono::milliseconds timeout) -> Result<TranscriptionResult>
{
    auto abortState = AbortState { .deadline = std::chrono::steady_clock::now() + timeout };

    auto lock = std::unique_lock(_impl->mutex, std::defer_lock);
    if (!lock.try_lock_until(abortState.deadline))
        return makeError(ErrorCode::Timeout,
                         std::format("Whisper busy, phrase #{} not started in time", chunk.sequence));

    if (auto loaded = _impl->ensureLoaded(); !loaded)
        return std::unexpected(loaded.error());

    auto const samples = toFloatSamples(chunk.samples);
    auto const languageCode = std::string(languageModeToString(language));

    auto params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.language = languageCode.c_str();
    params.detect_language = false;
    params.translate = false;
    params.n_threads = _impl->config.threads;
    params.print_progress = false;
    params.print_special = false;
    params.print_realtime = false;
    params.print_timestamps = false;
    params.no_context = true;
    params.single_segment = true;
    params.abort_callback = abortWhenExpired;
    params.abort_callback_user_data = &abortState;

    auto const rc = whisper_full(_impl->ctx, params, samples.data(), static_cast<int>(samples.size()));
    if (rc != 0)
    {
        if (std::chrono::steady_clock::now() >= abortState.deadline)
            return makeError(ErrorCode::Timeout, std::format("Whisper timed out on phrase #{}", chunk.sequence));
        return makeError(ErrorCode::MalformedResponse,
                         std::format("Whisper transcription failed with code: {}", rc));
    }

    auto text = std::string {};
    auto const nSegments = whisper_full_n_segments(_impl->ctx);
    for (auto i = 0; i < nSegments; ++i)
        if (auto const* segmentText = whisper_full_get_segment_text(_impl->ctx, i))
            text += segmentText;

    auto const start = text.find_first_not_of(" \t\n\r");
    if (start == std::string::npos)
        text.clear();
    else
        text = text.substr(start, text.find_last_not_of(" \t\n\r") - start + 1);

    return TranscriptionResult {
        .sequence = chunk.sequence,
        .text = filterWhisperHallucination(std::move(text)),
        .language = language,
        .engine = _impl->config.name,
        .success = true,
        .error = std::nullopt,
    };
}

auto WhisperEngine::load() -> VoidResult
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->ensureLoaded();
}

} // namespace voxtype
