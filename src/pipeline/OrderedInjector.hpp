// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>
#include <inject/TextCleaner.hpp>
#include <inject/TextInjector.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace voxtype
{

struct OrderedInjectorConfig
{
    TextCleanerConfig cleaner;

    /// @brief Time after expect() at which a missing result is replaced by a timeout failure.
    std::chrono::milliseconds resultTimeout { 20000 };
};

/// @brief Counters describing what happened to each released sequence number.
struct InjectionStats
{
    std::size_t injected = 0;
    std::size_t empty = 0;
    std::size_t failed = 0;

    /// @brief Failures synthesized by the deadline watchdog; included in failed.
    std::size_t timedOut = 0;
    std::size_t injectErrors = 0;
    std::size_t discarded = 0;
};

/// @brief Releases transcription results to the text injector strictly in sequence order.
///
/// Results may arrive from any thread and in any order; they are buffered until every
/// earlier sequence number has been released. Failed and empty results still advance the
/// cursor. Each expected sequence has a deadline, after which a watchdog thread releases a
/// synthesized timeout failure in its place, so the cursor never stalls.
///
/// Insertion and release happen under one mutex, so the injector is never called
/// concurrently and never out of order.
class OrderedInjector
{
  public:
    OrderedInjector(TextInjector& injector, OrderedInjectorConfig config);
    ~OrderedInjector();

    OrderedInjector(const OrderedInjector&) = delete;
    OrderedInjector& operator=(const OrderedInjector&) = delete;

    /// @brief Announces that a result for @p sequence will be delivered and arms its deadline.
    ///
    /// Must be called in ascending sequence order, before the result can arrive.
    void expect(SequenceNumber sequence);

    /// @brief Hands over a result. Late duplicates and results after abandon() are discarded.
    void deliver(TranscriptionResult result);

    /// @brief Blocks until every expected sequence has been released or @p deadline passes.
    /// @return true if drained.
    [[nodiscard]] auto waitUntilDrained(std::chrono::steady_clock::time_point deadline) -> bool;

    /// @brief Stops releasing. Whatever arrives later is discarded.
    void abandon();

    /// @brief Returns the next sequence number eligible for release.
    [[nodiscard]] auto cursor() const -> SequenceNumber;

    /// @brief Returns the concatenation of all injected text.
    [[nodiscard]] auto transcript() const -> std::string;

    [[nodiscard]] auto stats() const -> InjectionStats;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace voxtype
