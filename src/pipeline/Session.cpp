// SPDX-License-Identifier: Apache-2.0
#include "Session.hpp"

#include <core/Log.hpp>

#include <format>

namespace voxtype
{

namespace
{

    /// @brief Joins the workers if none can still be inside an engine call, detaches them otherwise.
    /// @return The number of engine calls left running on detached workers.
    auto finishDispatcher(TranscriptionDispatcher& dispatcher, const OrderedInjector& ordered, bool drained)
        -> std::size_t
    {
        if (drained && ordered.stats().timedOut == 0)
        {
            dispatcher.join();
            return 0;
        }
        return dispatcher.abandon();
    }

} // namespace

Session::Session(SessionConfig config,
                 FrameSource& source,
                 std::shared_ptr<EngineSelector> selector,
                 TextInjector& injector,
                 Notifier& notifier,
                 StopPredicate stopRequested):
    _config(std::move(config)),
    _source(source),
    _selector(std::move(selector)),
    _injector(injector),
    _notifier(notifier),
    _stopRequested(std::move(stopRequested))
{
}

auto Session::run() -> Result<SessionReport>
{
    if (auto started = _source.start(); !started)
        return std::unexpected(started.error());

    auto const startedAt = std::chrono::steady_clock::now();
    auto report = SessionReport {};
    report.engine = _selector->currentName();

    _notifier.notify(std::format("Recording ({}, {})", report.engine, languageModeDisplayName(_config.language)),
                     Urgency::Low);
    log::info("Session started: engine '{}', language {}", report.engine, languageModeToString(_config.language));

    auto ordered = std::make_shared<OrderedInjector>(_injector, _config.injection);
    auto dispatcher = TranscriptionDispatcher(
        _config.dispatcher,
        [selector = _selector, language = _config.language](const AudioChunk& chunk) {
            return selector->transcribe(chunk, language);
        },
        [ordered](TranscriptionResult result) { ordered->deliver(std::move(result)); });

    auto segmenter = VadSegmenter(_config.vad);
    auto reason = std::optional<TerminationReason> {};

    auto const dispatch = [&](SegmentEvents events) {
        for (auto& chunk: events.chunks)
        {
            log::info("Phrase #{} closed ({:.1f}s)", chunk.sequence, chunk.durationSeconds());
            ordered->expect(chunk.sequence);
            ++report.chunks;
            if (!dispatcher.submit(std::move(chunk)))
                log::warning("Dispatcher closed, phrase dropped");
        }
        if (events.sessionEnd)
            reason = events.sessionEnd;
    };

    while (!reason)
    {
        if (_stopRequested())
        {
            log::info("Stop requested");
            dispatch(segmenter.finish(TerminationReason::ExternalStop));
            break;
        }

        if (_selector->exhausted())
        {
            report.error = Error { ErrorCode::NoEngineAvailable, "All transcription engines failed" };
            dispatch(segmenter.finish(TerminationReason::Error));
            break;
        }

        auto frame = _source.nextFrame(_config.frameTimeout);
        if (!frame)
        {
            log::error("Audio capture failed: {}", frame.error());
            report.error = frame.error();
            dispatch(segmenter.finish(TerminationReason::ExternalStop));
            break;
        }
        if (!*frame)
            continue;

        dispatch(segmenter.feed(**frame));
    }

    _source.close();
    report.reason = reason.value_or(TerminationReason::ExternalStop);
    log::info("Recording ended: {} after {:.1f}s of audio, {} phrase(s)",
              terminationReasonToString(report.reason),
              segmenter.sessionSeconds(),
              report.chunks);

    switch (report.reason)
    {
        case TerminationReason::LongSilence:
        case TerminationReason::MaxDuration: {
            dispatcher.close();
            // Every expected sequence resolves by its deadline at the latest.
            auto const deadline =
                std::chrono::steady_clock::now() + _config.injection.resultTimeout + std::chrono::seconds(1);
            auto const drained = ordered->waitUntilDrained(deadline);
            if (!drained)
                ordered->abandon();
            report.abandonedCalls = finishDispatcher(dispatcher, *ordered, drained);
            break;
        }
        case TerminationReason::ExternalStop: {
            dispatcher.close();
            auto const drained = ordered->waitUntilDrained(std::chrono::steady_clock::now() + _config.stopGrace);
            if (!drained)
            {
                log::info("Stop grace period over");
                ordered->abandon();
            }
            report.abandonedCalls = finishDispatcher(dispatcher, *ordered, drained);
            break;
        }
        case TerminationReason::Error:
            ordered->abandon();
            report.abandonedCalls = dispatcher.abandon();
            break;
    }

    report.transcript = ordered->transcript();
    report.injection = ordered->stats();
    report.fallbacks = _selector->fallbackCount();
    report.seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - startedAt).count();
    if (report.fallbacks > 0 || report.engine.empty())
        report.engine = _selector->currentName();

    if (report.chunks == 0)
        _notifier.notify("No speech detected", Urgency::Low);
    else
        _notifier.notify(std::format("Recording stopped ({} phrase(s))", report.chunks), Urgency::Low);

    if (report.abandonedCalls > 0)
        log::debug("{} transcription(s) still running on detached workers", report.abandonedCalls);

    log::info("Session finished in {:.1f}s: {} injected, {} empty, {} failed, {} discarded",
              report.seconds,
              report.injection.injected,
              report.injection.empty,
              report.injection.failed,
              report.injection.discarded);
    return report;
}

} // namespace voxtype
