// SPDX-License-Identifier: Apache-2.0
#include "EngineSelector.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <format>
#include <optional>
#include <thread>

namespace voxtype
{

namespace
{

    auto probeEngine(Engine& engine) -> VoidResult
    {
        auto const probed = engine.probe();
        if (!probed)
            return std::unexpected(probed.error());
        if (!*probed)
            return makeError(ErrorCode::NetworkUnreachable, "probe reported unavailable");
        return {};
    }

} // namespace

EngineSelector::EngineSelector(std::vector<EngineEntry> engines, FallbackPolicy policy, Notifier& notifier):
    _policy(policy), _notifier(notifier)
{
    for (auto& entry: orderByPriority(std::move(engines)))
        if (entry.engine)
            _slots.push_back(Slot { .engine = std::move(entry.engine), .demoted = false });
}

auto EngineSelector::orderByPriority(std::vector<EngineEntry> engines) -> std::vector<EngineEntry>
{
    std::ranges::stable_sort(engines, [](const EngineEntry& a, const EngineEntry& b) {
        return a.priority > b.priority;
    });
    return engines;
}

auto EngineSelector::selectInitial() -> VoidResult
{
    auto lock = std::lock_guard(_mutex);

    for (auto i = std::size_t { 0 }; i < _slots.size(); ++i)
    {
        auto& engine = *_slots[i].engine;
        if (auto probed = probeEngine(engine); !probed)
        {
            log::warning("Engine '{}' unavailable: {}", engine.name(), probed.error());
            _slots[i].demoted = true;
            continue;
        }

        _current = static_cast<std::ptrdiff_t>(i);
        _exhausted.store(false);
        log::info("Using transcription engine '{}'", engine.name());
        return {};
    }

    _exhausted.store(true);
    return makeError(ErrorCode::NoEngineAvailable,
                     _slots.empty() ? "No transcription engine configured"
                                    : "No configured transcription engine is available");
}

auto EngineSelector::current() const -> std::shared_ptr<Engine>
{
    auto lock = std::lock_guard(_mutex);
    if (_current < 0)
        return nullptr;
    return _slots[static_cast<std::size_t>(_current)].engine;
}

auto EngineSelector::currentName() const -> std::string
{
    auto const engine = current();
    return engine ? std::string(engine->name()) : std::string {};
}

auto EngineSelector::exhausted() const -> bool
{
    return _exhausted.load();
}

auto EngineSelector::settledCurrent() -> std::shared_ptr<Engine>
{
    auto lock = std::unique_lock(_mutex);
    _switched.wait(lock, [this] { return !_switching; });
    if (_current < 0)
        return nullptr;
    return _slots[static_cast<std::size_t>(_current)].engine;
}

auto EngineSelector::fallbackCount() const -> int
{
    auto lock = std::lock_guard(_mutex);
    return _fallbackCount;
}

auto EngineSelector::callWithRetries(Engine& engine, const AudioChunk& chunk, LanguageMode language)
    -> Result<TranscriptionResult>
{
    auto result = engine.transcribe(chunk, language, engine.defaultTimeout());
    for (auto retry = 0; retry < _policy.rateLimitRetries && !result && result.error().code == ErrorCode::RateLimited;
         ++retry)
    {
        log::debug("Engine '{}' rate limited on #{}, retrying", engine.name(), chunk.sequence);
        std::this_thread::sleep_for(_policy.rateLimitBackoff);
        result = engine.transcribe(chunk, language, engine.defaultTimeout());
    }
    return result;
}

auto EngineSelector::transcribe(const AudioChunk& chunk, LanguageMode language) -> Result<TranscriptionResult>
{
    auto engine = settledCurrent();
    if (!engine)
        return makeError(ErrorCode::NoEngineAvailable, "No transcription engine left");

    auto result = callWithRetries(*engine, chunk, language);
    if (result)
    {
        auto lock = std::lock_guard(_mutex);
        if (_current >= 0 && _slots[static_cast<std::size_t>(_current)].engine == engine)
            _consecutiveFailures = 0;
        return result;
    }

    log::warning("Engine '{}' failed on #{}: {}", engine->name(), chunk.sequence, result.error());

    auto retryEngine = recordFailure(engine, result.error());
    if (!retryEngine)
        return result;

    log::info("Retrying #{} on '{}'", chunk.sequence, retryEngine->name());
    auto retried = callWithRetries(*retryEngine, chunk, language);
    if (!retried)
    {
        log::warning("Engine '{}' failed on retried #{}: {}", retryEngine->name(), chunk.sequence, retried.error());
        (void) recordFailure(retryEngine, retried.error());
    }
    return retried;
}

auto EngineSelector::recordFailure(const std::shared_ptr<Engine>& engine, const Error& error)
    -> std::shared_ptr<Engine>
{
    auto lock = std::unique_lock(_mutex);
    _switched.wait(lock, [this] { return !_switching; });

    if (_current < 0)
        return nullptr;

    auto const failedIndex = static_cast<std::size_t>(_current);
    if (_slots[failedIndex].engine != engine)
    {
        // Another worker already moved away from this engine.
        return _slots[failedIndex].engine;
    }

    if (++_consecutiveFailures < _policy.failureThreshold)
        return nullptr;

    _slots[failedIndex].demoted = true;
    _consecutiveFailures = 0;
    _switching = true;

    auto candidates = std::vector<std::size_t> {};
    for (auto i = std::size_t { 0 }; i < _slots.size(); ++i)
        if (!_slots[i].demoted)
            candidates.push_back(i);
    lock.unlock();

    // _slots is never resized and a slot's engine never changes, so candidates are checked unlocked.
    auto const failedName = std::string(engine->name());
    auto promoted = std::optional<std::size_t> {};
    auto unavailable = std::vector<std::size_t> {};
    for (auto const i: candidates)
    {
        auto& candidate = *_slots[i].engine;
        if (auto probed = probeEngine(candidate); !probed)
        {
            log::warning("Fallback engine '{}' unavailable: {}", candidate.name(), probed.error());
            unavailable.push_back(i);
            continue;
        }
        promoted = i;
        break;
    }

    lock.lock();
    for (auto const i: unavailable)
        _slots[i].demoted = true;
    _current = promoted ? static_cast<std::ptrdiff_t>(*promoted) : -1;
    if (promoted)
        ++_fallbackCount;
    else
        _exhausted.store(true);
    _switching = false;
    lock.unlock();
    _switched.notify_all();

    if (!promoted)
    {
        log::error("No transcription engine left after '{}' failed", failedName);
        _notifier.notify("No transcription engine available", Urgency::Critical);
        return nullptr;
    }

    auto next = _slots[*promoted].engine;
    log::warning("Falling back from '{}' to '{}' after {}", failedName, next->name(), errorCodeToString(error.code));
    _notifier.notify(
        std::format("{} failed ({}), switched to {}", failedName, errorCodeToString(error.code), next->name()),
        Urgency::Normal);
    return next;
}

} // namespace voxtype
