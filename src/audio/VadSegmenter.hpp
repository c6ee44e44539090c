// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace voxtype
{

/// @brief Thresholds of the voice-activity segmenter.
struct VadConfig
{
    /// @brief RMS amplitude (int16 scale) above which a frame counts as speech.
    double silenceThreshold = 50.0;

    /// @brief Silence that closes a phrase without ending the session.
    double shortPauseSeconds = 1.5;

    /// @brief Silence that ends the session.
    double longPauseSeconds = 4.0;

    /// @brief Minimum phrase length before a mid-session boundary may be emitted.
    double minPhraseSeconds = 2.0;

    /// @brief Hard cap on the session length.
    double maxSessionSeconds = 45.0;
};

/// @brief State of the segmenter state machine.
enum class VadState
{
    Idle,           ///< No speech seen yet.
    InPhrase,       ///< Speech frames are being accumulated.
    ShortSilence,   ///< Inside a phrase, accumulating trailing silence.
    AwaitingPhrase, ///< A phrase boundary was emitted; waiting for speech to resume.
    Ended,          ///< Terminal. Further frames are ignored.
};

/// @brief What happened while processing one frame (or a forced stop).
struct SegmentEvents
{
    /// @brief Chunks closed by this step, in sequence order.
    std::vector<AudioChunk> chunks;

    /// @brief Set when this step ended the session.
    std::optional<TerminationReason> sessionEnd;
};

/// @brief Splits a frame stream into phrases using amplitude-based voice activity detection.
///
/// A short pause after a long enough phrase emits a phrase boundary while the session stays
/// open; a long pause, the maximum session length, or an explicit finish() ends the session.
/// Any phrase still open at session end is flushed regardless of its length.
/// Durations are measured in samples, so results depend only on the frames, not on wall time.
class VadSegmenter
{
  public:
    explicit VadSegmenter(VadConfig config = {});

    /// @brief Processes one frame and reports closed chunks and session end.
    [[nodiscard]] auto feed(const AudioFrame& frame) -> SegmentEvents;

    /// @brief Ends the session for an external reason, flushing the open phrase.
    ///
    /// Does nothing if the session already ended.
    [[nodiscard]] auto finish(TerminationReason reason) -> SegmentEvents;

    [[nodiscard]] auto state() const noexcept -> VadState { return _state; }

    /// @brief Returns the sequence number the next emitted chunk will carry.
    [[nodiscard]] auto nextSequence() const noexcept -> SequenceNumber { return _nextSequence; }

    /// @brief Returns the session length seen so far in seconds.
    [[nodiscard]] auto sessionSeconds() const -> double;

    [[nodiscard]] auto config() const noexcept -> const VadConfig& { return _config; }

    /// @brief Computes the RMS amplitude of a frame.
    [[nodiscard]] static auto rmsLevel(std::span<const std::int16_t> samples) -> double;

  private:
    [[nodiscard]] auto toSamples(double seconds) const -> std::uint64_t;
    void appendToPhrase(std::span<const std::int16_t> samples);
    [[nodiscard]] auto closePhrase() -> AudioChunk;
    void endSession(TerminationReason reason, SegmentEvents& events);

    VadConfig _config;
    VadState _state = VadState::Idle;
    std::uint32_t _sampleRate = 16000;

    SequenceNumber _nextSequence = 0;
    std::vector<std::int16_t> _phrase;
    std::vector<std::int16_t> _pending; // silence seen while awaiting the next phrase
    std::uint64_t _silenceSamples = 0;
    std::uint64_t _sessionSamples = 0;
};

} // namespace voxtype
