// SPDX-License-Identifier: Apache-2.0
#include "OrderedInjector.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <condition_variable>
#include <format>
#include <map>
#include <mutex>
#include <stop_token>
#include <thread>

namespace voxtype
{

struct OrderedInjector::Impl
{
    TextInjector& injector;
    OrderedInjectorConfig config;

    mutable std::mutex mutex;
    std::condition_variable_any cv;
    std::map<SequenceNumber, TranscriptionResult> buffered;
    std::map<SequenceNumber, std::chrono::steady_clock::time_point> deadlines;
    SequenceNumber cursor = 0;
    SequenceNumber expectedEnd = 0;
    bool abandoned = false;
    std::string transcript;
    InjectionStats stats;
    std::jthread watchdog;

    Impl(TextInjector& injector, OrderedInjectorConfig config): injector(injector), config(std::move(config)) {}

    /// @brief Releases the contiguous run starting at the cursor. Requires mutex.
    void releaseReadyLocked()
    {
        while (!abandoned)
        {
            auto const it = buffered.find(cursor);
            if (it == buffered.end())
                break;

            auto result = std::move(it->second);
            buffered.erase(it);
            deadlines.erase(cursor);
            releaseLocked(result);
            ++cursor;
        }
        cv.notify_all();
    }

    void releaseLocked(const TranscriptionResult& result)
    {
        if (!result.success)
        {
            ++stats.failed;
            log::warning("Phrase #{} lost: {}",
                         result.sequence,
                         result.error ? std::format("{}", *result.error) : std::string("unknown error"));
            return;
        }

        auto const prepared = prepareForInjection(result.text, config.cleaner);
        if (prepared.empty())
        {
            ++stats.empty;
            log::debug("Phrase #{} has no text to inject", result.sequence);
            return;
        }

        if (!prepared.text.empty())
        {
            if (auto injected = injector.inject(prepared.text); !injected)
            {
                ++stats.injectErrors;
                log::error("Injecting phrase #{} failed: {}", result.sequence, injected.error());
                return;
            }
            transcript += prepared.text;
        }

        if (prepared.pressReturn)
        {
            if (auto pressed = injector.pressReturn(); !pressed)
            {
                ++stats.injectErrors;
                log::error("Sending Return for phrase #{} failed: {}", result.sequence, pressed.error());
                return;
            }
            transcript += '\n';
        }

        ++stats.injected;
        log::info("Injected #{} via {}: '{}'", result.sequence, result.engine, prepared.text);
    }

    void runWatchdog(const std::stop_token& stopToken)
    {
        auto lock = std::unique_lock(mutex);
        while (!stopToken.stop_requested())
        {
            if (deadlines.empty())
            {
                cv.wait(lock, stopToken, [this] { return !deadlines.empty() || abandoned; });
                if (abandoned)
                    return;
                continue;
            }

            auto const [sequence, deadline] = *std::ranges::min_element(
                deadlines, [](auto const& a, auto const& b) { return a.second < b.second; });

            if (std::chrono::steady_clock::now() < deadline)
            {
                cv.wait_until(lock, stopToken, deadline, [this] { return abandoned; });
                if (abandoned)
                    return;
                continue;
            }

            deadlines.erase(sequence);
            if (sequence < cursor || buffered.contains(sequence))
                continue;

            log::warning("No result for phrase #{} within {}s", sequence, config.resultTimeout.count() / 1000.0);
            ++stats.timedOut;
            buffered.emplace(sequence,
                             TranscriptionResult::failure(
                                 sequence, {}, Error { ErrorCode::Timeout, "no result before deadline" }));
            releaseReadyLocked();
        }
    }
};

OrderedInjector::OrderedInjector(TextInjector& injector, OrderedInjectorConfig config):
    _impl(std::make_unique<Impl>(injector, std::move(config)))
{
    _impl->watchdog = std::jthread([this](const std::stop_token& token) { _impl->runWatchdog(token); });
}

OrderedInjector::~OrderedInjector()
{
    abandon();
    _impl->watchdog.request_stop();
    if (_impl->watchdog.joinable())
        _impl->watchdog.join();
}

void OrderedInjector::expect(SequenceNumber sequence)
{
    auto lock = std::lock_guard(_impl->mutex);
    if (_impl->abandoned)
        return;
    _impl->deadlines[sequence] = std::chrono::steady_clock::now() + _impl->config.resultTimeout;
    _impl->expectedEnd = std::max(_impl->expectedEnd, sequence + 1);
    _impl->cv.notify_all();
}

void OrderedInjector::deliver(TranscriptionResult result)
{
    auto lock = std::lock_guard(_impl->mutex);

    if (_impl->abandoned || result.sequence < _impl->cursor || _impl->buffered.contains(result.sequence))
    {
        ++_impl->stats.discarded;
        log::debug("Discarding late result for phrase #{}", result.sequence);
        return;
    }

    _impl->expectedEnd = std::max(_impl->expectedEnd, result.sequence + 1);
    auto const sequence = result.sequence;
    _impl->buffered.emplace(sequence, std::move(result));
    _impl->releaseReadyLocked();
}

auto OrderedInjector::waitUntilDrained(std::chrono::steady_clock::time_point deadline) -> bool
{
    auto lock = std::unique_lock(_impl->mutex);
    return _impl->cv.wait_until(
        lock, deadline, [this] { return _impl->abandoned || _impl->cursor >= _impl->expectedEnd; })
        && !_impl->abandoned;
}

void OrderedInjector::abandon()
{
    auto lock = std::lock_guard(_impl->mutex);
    if (_impl->abandoned)
        return;
    _impl->abandoned = true;
    if (auto const pending = _impl->expectedEnd - _impl->cursor; pending > 0)
        log::info("Abandoning {} outstanding phrase(s)", pending);
    _impl->buffered.clear();
    _impl->deadlines.clear();
    _impl->cv.notify_all();
}

auto OrderedInjector::cursor() const -> SequenceNumber
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->cursor;
}

auto OrderedInjector::transcript() const -> std::string
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->transcript;
}

auto OrderedInjector::stats() const -> InjectionStats
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->stats;
}

} // namespace voxtype
