// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <engine/Engine.hpp>
#include <notify/Notifier.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace voxtype
{

/// @brief One configured engine together with its selection priority.
struct EngineEntry
{
    std::shared_ptr<Engine> engine;

    /// @brief Higher is preferred. Ties keep declaration order.
    int priority = 0;
};

/// @brief Tuning of the fallback controller.
struct FallbackPolicy
{
    /// @brief Consecutive failures after which the current engine is demoted.
    int failureThreshold = 1;

    /// @brief Extra attempts on rate_limited before it counts as a failure.
    int rateLimitRetries = 2;
    std::chrono::milliseconds rateLimitBackoff { 1000 };
};

/// @brief Picks the engine of a session and moves to the next one when it fails.
///
/// Demotion is sticky: an engine demoted once, or found unavailable at session start, is never
/// used again in the same session. One worker at a time owns a transition; the others wait for
/// it, so each transition happens (and is announced) exactly once. Fallback candidates are
/// checked for availability without the lock held.
class EngineSelector
{
  public:
    EngineSelector(std::vector<EngineEntry> engines, FallbackPolicy policy, Notifier& notifier);

    /// @brief Probes the engines in priority order and makes the first available one current.
    /// @return NoEngineAvailable if no engine probes successfully.
    [[nodiscard]] auto selectInitial() -> VoidResult;

    /// @brief Transcribes @p chunk on the current engine, falling back as needed.
    ///
    /// Safe to call from several threads. The chunk that triggered a fallback is retried once
    /// on the newly promoted engine.
    /// @return The transcription, or the last engine error if the chunk is lost.
    [[nodiscard]] auto transcribe(const AudioChunk& chunk, LanguageMode language) -> Result<TranscriptionResult>;

    /// @brief Returns the current engine, or nullptr once every engine has failed.
    [[nodiscard]] auto current() const -> std::shared_ptr<Engine>;

    /// @brief Returns the name of the current engine or an empty string.
    [[nodiscard]] auto currentName() const -> std::string;

    /// @brief Returns true once no engine is left for this session. Never blocks.
    [[nodiscard]] auto exhausted() const -> bool;

    /// @brief Number of fallback transitions so far.
    [[nodiscard]] auto fallbackCount() const -> int;

    /// @brief Returns the engines sorted by descending priority, ties in declaration order.
    [[nodiscard]] static auto orderByPriority(std::vector<EngineEntry> engines) -> std::vector<EngineEntry>;

  private:
    struct Slot
    {
        std::shared_ptr<Engine> engine;
        bool demoted = false;
    };

    [[nodiscard]] auto callWithRetries(Engine& engine, const AudioChunk& chunk, LanguageMode language)
        -> Result<TranscriptionResult>;

    /// @brief Waits for a running transition and returns the engine it settled on.
    [[nodiscard]] auto settledCurrent() -> std::shared_ptr<Engine>;

    /// @brief Records a failure of @p engine and switches engines once the threshold is reached.
    /// @return The engine to retry the chunk on, or nullptr if the chunk is lost.
    [[nodiscard]] auto recordFailure(const std::shared_ptr<Engine>& engine, const Error& error)
        -> std::shared_ptr<Engine>;

    FallbackPolicy _policy;
    Notifier& _notifier;

    mutable std::mutex _mutex;
    std::condition_variable _switched;
    std::vector<Slot> _slots;
    std::ptrdiff_t _current = -1;
    int _consecutiveFailures = 0;
    int _fallbackCount = 0;
    bool _switching = false;
    std::atomic<bool> _exhausted = false;
};

} // namespace voxtype
