// SPDX-License-Identifier: Apache-2.0
#include "VadSegmenter.hpp"

#include <core/Log.hpp>

#include <cmath>

namespace voxtype
{

VadSegmenter::VadSegmenter(VadConfig config): _config(config)
{
}

auto VadSegmenter::rmsLevel(std::span<const std::int16_t> samples) -> double
{
    if (samples.empty())
        return 0.0;

    auto sum = 0.0;
    for (auto const sample: samples)
    {
        auto const value = static_cast<double>(sample);
        sum += value * value;
    }

    return std::sqrt(sum / static_cast<double>(samples.size()));
}

auto VadSegmenter::sessionSeconds() const -> double
{
    return static_cast<double>(_sessionSamples) / static_cast<double>(_sampleRate);
}

auto VadSegmenter::toSamples(double seconds) const -> std::uint64_t
{
    return static_cast<std::uint64_t>(std::llround(seconds * static_cast<double>(_sampleRate)));
}

void VadSegmenter::appendToPhrase(std::span<const std::int16_t> samples)
{
    _phrase.insert(_phrase.end(), samples.begin(), samples.end());
}

auto VadSegmenter::closePhrase() -> AudioChunk
{
    auto chunk = AudioChunk {
        .sequence = _nextSequence++,
        .samples = std::move(_phrase),
        .sampleRate = _sampleRate,
    };
    _phrase.clear();
    return chunk;
}

void VadSegmenter::endSession(TerminationReason reason, SegmentEvents& events)
{
    if (_state == VadState::InPhrase || _state == VadState::ShortSilence)
    {
        auto chunk = closePhrase();
        log::info("Final phrase #{} flushed ({:.1f}s)", chunk.sequence, chunk.durationSeconds());
        events.chunks.push_back(std::move(chunk));
    }

    _pending.clear();
    _state = VadState::Ended;
    events.sessionEnd = reason;
    log::info("Session ended after {:.1f}s: {}", sessionSeconds(), terminationReasonToString(reason));
}

auto VadSegmenter::feed(const AudioFrame& frame) -> SegmentEvents
{
    auto events = SegmentEvents {};
    if (_state == VadState::Ended)
        return events;

    if (frame.sampleRate != 0)
        _sampleRate = frame.sampleRate;

    auto const samples = std::span<const std::int16_t>(frame.samples);
    auto const frameSamples = static_cast<std::uint64_t>(samples.size());
    _sessionSamples += frameSamples;

    auto const level = rmsLevel(samples);
    auto const speech = level > _config.silenceThreshold;

    switch (_state)
    {
        case VadState::Idle:
            if (speech)
            {
                log::debug("Speech detected (level: {:.1f})", level);
                _state = VadState::InPhrase;
                _silenceSamples = 0;
                appendToPhrase(samples);
            }
            break;

        case VadState::InPhrase:
        case VadState::ShortSilence:
            appendToPhrase(samples);
            if (speech)
            {
                _state = VadState::InPhrase;
                _silenceSamples = 0;
                break;
            }

            _state = VadState::ShortSilence;
            _silenceSamples += frameSamples;

            if (_silenceSamples >= toSamples(_config.longPauseSeconds))
            {
                endSession(TerminationReason::LongSilence, events);
                return events;
            }

            if (_silenceSamples >= toSamples(_config.shortPauseSeconds)
                && _phrase.size() >= toSamples(_config.minPhraseSeconds))
            {
                auto chunk = closePhrase();
                log::info("Phrase boundary #{} ({:.1f}s)", chunk.sequence, chunk.durationSeconds());
                events.chunks.push_back(std::move(chunk));
                _state = VadState::AwaitingPhrase;
                _pending.clear();
            }
            break;

        case VadState::AwaitingPhrase:
            if (speech)
            {
                // The silence gathered since the boundary leads into the new phrase.
                _state = VadState::InPhrase;
                _silenceSamples = 0;
                _phrase = std::move(_pending);
                _pending.clear();
                appendToPhrase(samples);
                break;
            }

            _pending.insert(_pending.end(), samples.begin(), samples.end());
            _silenceSamples += frameSamples;
            if (_silenceSamples >= toSamples(_config.longPauseSeconds))
            {
                endSession(TerminationReason::LongSilence, events);
                return events;
            }
            break;

        case VadState::Ended: break;
    }

    if (_sessionSamples >= toSamples(_config.maxSessionSeconds))
        endSession(TerminationReason::MaxDuration, events);

    return events;
}

auto VadSegmenter::finish(TerminationReason reason) -> SegmentEvents
{
    auto events = SegmentEvents {};
    if (_state != VadState::Ended)
        endSession(reason, events);
    return events;
}

} // namespace voxtype
