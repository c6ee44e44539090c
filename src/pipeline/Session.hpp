// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/FrameSource.hpp>
#include <audio/VadSegmenter.hpp>
#include <engine/EngineSelector.hpp>
#include <inject/TextInjector.hpp>
#include <notify/Notifier.hpp>
#include <pipeline/OrderedInjector.hpp>
#include <pipeline/TranscriptionDispatcher.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace voxtype
{

struct SessionConfig
{
    VadConfig vad;
    DispatcherConfig dispatcher;
    OrderedInjectorConfig injection;
    LanguageMode language = LanguageMode::Auto;

    /// @brief How long outstanding phrases may still complete after an external stop.
    std::chrono::milliseconds stopGrace { 3000 };

    /// @brief Upper bound of one frame read, and so of the stop-check interval.
    std::chrono::milliseconds frameTimeout { 100 };
};

/// @brief Outcome of one recording session.
struct SessionReport
{
    TerminationReason reason = TerminationReason::LongSilence;
    std::size_t chunks = 0;
    std::string transcript;
    InjectionStats injection;
    std::string engine;
    int fallbacks = 0;
    double seconds = 0.0;

    /// @brief Engine calls still running on detached workers when the session returned.
    ///
    /// Such calls may still log or notify, so the process must not run static destructors
    /// while they are alive.
    std::size_t abandonedCalls = 0;

    /// @brief Set if the session ended because of a failure (audio device or engines).
    std::optional<Error> error;
};

/// @brief One recording-to-completion run: capture, segment, transcribe, inject in order.
///
/// The caller holds the session lock and has already selected the initial engine.
class Session
{
  public:
    using StopPredicate = std::function<bool()>;

    Session(SessionConfig config,
            FrameSource& source,
            std::shared_ptr<EngineSelector> selector,
            TextInjector& injector,
            Notifier& notifier,
            StopPredicate stopRequested);

    /// @brief Runs the session until it ends.
    /// @return The report, or an error if the audio source could not be started.
    [[nodiscard]] auto run() -> Result<SessionReport>;

  private:
    SessionConfig _config;
    FrameSource& _source;
    std::shared_ptr<EngineSelector> _selector;
    TextInjector& _injector;
    Notifier& _notifier;
    StopPredicate _stopRequested;
};

} // namespace voxtype
