// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/FrameSource.hpp>
#include <engine/Engine.hpp>
#include <inject/TextInjector.hpp>
#include <notify/Notifier.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <format>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace voxtype::testing
{

inline constexpr auto TestSampleRate = std::uint32_t { 16000 };

/// @brief 100 ms frames at 16 kHz.
inline constexpr auto TestFrameSamples = std::size_t { 1600 };

inline auto makeFrame(std::int16_t amplitude) -> AudioFrame
{
    return AudioFrame {
        .timestamp = std::chrono::steady_clock::now(),
        .samples = std::vector<std::int16_t>(TestFrameSamples, amplitude),
        .sampleRate = TestSampleRate,
    };
}

/// @brief Appends @p seconds worth of speech (amplitude 1000) or silence (0) frames.
inline void appendFrames(std::vector<AudioFrame>& frames, double seconds, bool speech)
{
    auto const count = static_cast<int>(seconds * 10.0 + 0.5);
    for (auto i = 0; i < count; ++i)
        frames.push_back(makeFrame(speech ? std::int16_t { 1000 } : std::int16_t { 0 }));
}

/// @brief Frame source that replays a fixed script and then reports no more frames.
class ScriptedFrameSource: public FrameSource
{
  public:
    explicit ScriptedFrameSource(std::vector<AudioFrame> frames): _frames(frames.begin(), frames.end()) {}

    auto start() -> VoidResult override
    {
        if (failStart)
            return makeError(ErrorCode::AudioError, "no capture device");
        started = true;
        return {};
    }

    auto nextFrame(std::chrono::milliseconds timeout) -> Result<std::optional<AudioFrame>> override
    {
        if (_frames.empty())
        {
            if (failWhenEmpty)
                return makeError(ErrorCode::AudioError, "device disconnected");
            std::this_thread::sleep_for(std::min(timeout, std::chrono::milliseconds(5)));
            return std::optional<AudioFrame> {};
        }
        auto frame = std::move(_frames.front());
        _frames.pop_front();
        ++delivered;
        return std::optional<AudioFrame> { std::move(frame) };
    }

    void close() override { closed = true; }

    auto sampleRate() const -> std::uint32_t override { return TestSampleRate; }

    bool failStart = false;
    bool failWhenEmpty = false;
    bool started = false;
    bool closed = false;
    std::size_t delivered = 0;

  private:
    std::deque<AudioFrame> _frames;
};

/// @brief Engine whose availability and transcription behavior is scripted per test.
class FakeEngine: public Engine
{
  public:
    using Behavior = std::function<Result<TranscriptionResult>(const AudioChunk&, int call)>;

    explicit FakeEngine(std::string name): _name(std::move(name)) {}

    auto name() const -> std::string_view override { return _name; }
    auto defaultTimeout() const -> std::chrono::milliseconds override { return std::chrono::milliseconds(1000); }

    auto probe() -> Result<bool> override
    {
        ++probes;
        if (availabilityDelay > std::chrono::milliseconds::zero())
            std::this_thread::sleep_for(availabilityDelay);
        if (probeError)
            return makeError(*probeError, "probe failed");
        return true;
    }

    auto transcribe(const AudioChunk& chunk, LanguageMode language, std::chrono::milliseconds /*timeout*/)
        -> Result<TranscriptionResult> override
    {
        auto const call = calls.fetch_add(1);
        {
            auto lock = std::lock_guard(_mutex);
            _sequences.push_back(chunk.sequence);
        }
        if (behavior)
            return behavior(chunk, call);
        return TranscriptionResult {
            .sequence = chunk.sequence,
            .text = std::format("phrase {}", chunk.sequence),
            .language = language,
            .engine = _name,
            .success = true,
            .error = std::nullopt,
        };
    }

    [[nodiscard]] auto sequences() const -> std::vector<SequenceNumber>
    {
        auto lock = std::lock_guard(_mutex);
        return _sequences;
    }

    std::optional<ErrorCode> probeError;
    std::chrono::milliseconds availabilityDelay { 0 };
    Behavior behavior;
    std::atomic<int> calls = 0;
    std::atomic<int> probes = 0;

  private:
    std::string _name;
    mutable std::mutex _mutex;
    std::vector<SequenceNumber> _sequences;
};

/// @brief Builds a successful result the way an engine would.
inline auto textResult(const AudioChunk& chunk, std::string text, std::string engine = "fake") -> TranscriptionResult
{
    return TranscriptionResult {
        .sequence = chunk.sequence,
        .text = std::move(text),
        .language = LanguageMode::Auto,
        .engine = std::move(engine),
        .success = true,
        .error = std::nullopt,
    };
}

/// @brief Records injected text in delivery order.
class RecordingInjector: public TextInjector
{
  public:
    auto name() const -> std::string_view override { return "recording"; }

    auto inject(std::string_view text) -> VoidResult override
    {
        auto lock = std::lock_guard(_mutex);
        if (failInject)
            return makeError(ErrorCode::TargetWindowLost, "window gone");
        _texts.emplace_back(text);
        return {};
    }

    auto pressReturn() -> VoidResult override
    {
        auto lock = std::lock_guard(_mutex);
        _texts.emplace_back("<Return>");
        return {};
    }

    [[nodiscard]] auto texts() const -> std::vector<std::string>
    {
        auto lock = std::lock_guard(_mutex);
        return _texts;
    }

    bool failInject = false;

  private:
    mutable std::mutex _mutex;
    std::vector<std::string> _texts;
};

/// @brief Records every notice.
class RecordingNotifier: public Notifier
{
  public:
    void notify(std::string_view message, Urgency urgency = Urgency::Normal) override
    {
        auto lock = std::lock_guard(_mutex);
        _notices.emplace_back(std::string(message), urgency);
    }

    [[nodiscard]] auto notices() const -> std::vector<std::pair<std::string, Urgency>>
    {
        auto lock = std::lock_guard(_mutex);
        return _notices;
    }

    /// @brief Counts notices containing @p fragment.
    [[nodiscard]] auto count(std::string_view fragment) const -> std::size_t
    {
        auto lock = std::lock_guard(_mutex);
        auto n = std::size_t { 0 };
        for (auto const& [message, urgency]: _notices)
            if (message.find(fragment) != std::string::npos)
                ++n;
        return n;
    }

  private:
    mutable std::mutex _mutex;
    std::vector<std::pair<std::string, Urgency>> _notices;
};

} // namespace voxtype::testing
