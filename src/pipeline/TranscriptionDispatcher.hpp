// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <cstddef>
#include <functional>
#include <memory>

namespace voxtype
{

struct DispatcherConfig
{
    /// @brief Number of engine calls that may run at once.
    std::size_t maxInFlight = 3;

    /// @brief Chunks that may wait for a free worker before submit() blocks.
    std::size_t maxQueuedChunks = 4;
};

/// @brief Runs transcriptions on a small worker pool, off the audio ingestion thread.
///
/// Workers share their state through a shared_ptr, so an abandoned dispatcher can be destroyed
/// while engine calls are still running; their results are then dropped.
class TranscriptionDispatcher
{
  public:
    using TranscribeFunction = std::function<Result<TranscriptionResult>(const AudioChunk&)>;
    using ResultSink = std::function<void(TranscriptionResult)>;

    TranscriptionDispatcher(DispatcherConfig config, TranscribeFunction transcribe, ResultSink sink);

    /// @brief Abandons if still running, otherwise joins the idle workers.
    ~TranscriptionDispatcher();

    TranscriptionDispatcher(const TranscriptionDispatcher&) = delete;
    TranscriptionDispatcher& operator=(const TranscriptionDispatcher&) = delete;

    /// @brief Queues a chunk, blocking while the queue is full.
    /// @return false if the dispatcher was closed or abandoned.
    [[nodiscard]] auto submit(AudioChunk chunk) -> bool;

    /// @brief Accepts no more chunks. Queued chunks are still transcribed.
    void close();

    /// @brief Waits for the workers to finish the queue and exit. Call close() first.
    void join();

    /// @brief Drops queued chunks and detaches the workers. Results still running are discarded.
    /// @return The number of engine calls still running on the detached workers.
    auto abandon() -> std::size_t;

    /// @brief Returns the number of engine calls currently running.
    [[nodiscard]] auto inFlight() const -> std::size_t;

  private:
    struct State;
    std::shared_ptr<State> _state;
};

} // namespace voxtype
