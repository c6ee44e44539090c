// SPDX-License-Identifier: Apache-2.0
#include "TranscriptionDispatcher.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

namespace voxtype
{

struct TranscriptionDispatcher::State
{
    DispatcherConfig config;
    TranscribeFunction transcribe;
    ResultSink sink;

    std::mutex mutex;
    std::condition_variable workAvailable;
    std::condition_variable spaceAvailable;
    std::deque<AudioChunk> queue;
    std::size_t inFlight = 0;
    bool closed = false;
    bool abandoned = false;
    std::vector<std::thread> workers;

    static void run(std::shared_ptr<State> self)
    {
        while (true)
        {
            auto chunk = AudioChunk {};
            {
                auto lock = std::unique_lock(self->mutex);
                self->workAvailable.wait(lock, [&] { return !self->queue.empty() || self->closed; });
                if (self->abandoned || self->queue.empty())
                    return;
                chunk = std::move(self->queue.front());
                self->queue.pop_front();
                ++self->inFlight;
                self->spaceAvailable.notify_one();
            }

            auto const sequence = chunk.sequence;
            auto result = self->transcribe(chunk);
            auto transcription = result ? std::move(*result)
                                        : TranscriptionResult::failure(sequence, {}, std::move(result.error()));

            bool abandoned = false;
            {
                auto lock = std::lock_guard(self->mutex);
                --self->inFlight;
                abandoned = self->abandoned;
            }

            if (abandoned)
            {
                log::debug("Dropping result of phrase #{} from abandoned session", sequence);
                continue;
            }
            self->sink(std::move(transcription));
        }
    }
};

TranscriptionDispatcher::TranscriptionDispatcher(DispatcherConfig config,
                                                 TranscribeFunction transcribe,
                                                 ResultSink sink):
    _state(std::make_shared<State>())
{
    _state->config = config;
    _state->config.maxInFlight = std::max<std::size_t>(1, config.maxInFlight);
    _state->config.maxQueuedChunks = std::max<std::size_t>(1, config.maxQueuedChunks);
    _state->transcribe = std::move(transcribe);
    _state->sink = std::move(sink);

    for (auto i = std::size_t { 0 }; i < _state->config.maxInFlight; ++i)
        _state->workers.emplace_back(&State::run, _state);
}

TranscriptionDispatcher::~TranscriptionDispatcher()
{
    {
        auto lock = std::lock_guard(_state->mutex);
        if (_state->workers.empty())
            return;
    }
    abandon();
}

auto TranscriptionDispatcher::submit(AudioChunk chunk) -> bool
{
    auto lock = std::unique_lock(_state->mutex);
    if (_state->queue.size() >= _state->config.maxQueuedChunks && !_state->closed)
        log::debug("Transcription queue full, holding phrase #{}", chunk.sequence);

    _state->spaceAvailable.wait(
        lock, [this] { return _state->closed || _state->queue.size() < _state->config.maxQueuedChunks; });
    if (_state->closed)
        return false;

    _state->queue.push_back(std::move(chunk));
    _state->workAvailable.notify_one();
    return true;
}

void TranscriptionDispatcher::close()
{
    auto lock = std::lock_guard(_state->mutex);
    _state->closed = true;
    _state->workAvailable.notify_all();
    _state->spaceAvailable.notify_all();
}

void TranscriptionDispatcher::join()
{
    auto workers = std::vector<std::thread> {};
    {
        auto lock = std::lock_guard(_state->mutex);
        workers.swap(_state->workers);
    }
    for (auto& worker: workers)
        worker.join();
}

auto TranscriptionDispatcher::abandon() -> std::size_t
{
    auto workers = std::vector<std::thread> {};
    auto running = std::size_t { 0 };
    {
        auto lock = std::lock_guard(_state->mutex);
        _state->closed = true;
        _state->abandoned = true;
        if (!_state->queue.empty())
            log::debug("Dropping {} queued phrase(s)", _state->queue.size());
        _state->queue.clear();
        workers.swap(_state->workers);
        running = workers.empty() ? 0 : _state->inFlight;
        _state->workAvailable.notify_all();
        _state->spaceAvailable.notify_all();
    }
    for (auto& worker: workers)
        worker.detach();
    return running;
}

auto TranscriptionDispatcher::inFlight() const -> std::size_t
{
    auto lock = std::lock_guard(_state->mutex);
    return _state->inFlight;
}

} // namespace voxtype
