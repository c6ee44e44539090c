// SPDX-License-Identifier: Apache-2.0
#include <engine/EngineSelector.hpp>

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <thread>

#include "TestFakes.hpp"

using namespace voxtype;
using namespace voxtype::testing;
using namespace std::chrono_literals;

namespace
{

auto quickPolicy() -> FallbackPolicy
{
    return FallbackPolicy { .failureThreshold = 1, .rateLimitRetries = 2, .rateLimitBackoff = 0ms };
}

auto chunk(SequenceNumber sequence) -> AudioChunk
{
    return AudioChunk { .sequence = sequence, .samples = std::vector<std::int16_t>(1600, 500), .sampleRate = 16000 };
}

auto failingWith(ErrorCode code) -> FakeEngine::Behavior
{
    return [code](const AudioChunk&, int) -> Result<TranscriptionResult> {
        return makeError(code, "scripted failure");
    };
}

} // namespace

TEST_CASE("orderByPriority sorts descending and keeps declaration order on ties", "[selector]")
{
    auto const a = std::make_shared<FakeEngine>("a");
    auto const b = std::make_shared<FakeEngine>("b");
    auto const c = std::make_shared<FakeEngine>("c");

    auto const ordered = EngineSelector::orderByPriority({
        { .engine = a, .priority = 10 },
        { .engine = b, .priority = 50 },
        { .engine = c, .priority = 10 },
    });

    REQUIRE(ordered.size() == 3);
    CHECK(ordered[0].engine == b);
    CHECK(ordered[1].engine == a);
    CHECK(ordered[2].engine == c);
}

TEST_CASE("selectInitial picks the highest priority engine that is available", "[selector]")
{
    auto notifier = RecordingNotifier {};
    auto const cloud = std::make_shared<FakeEngine>("elevenlabs");
    auto const local = std::make_shared<FakeEngine>("whisper");

    SECTION("preferred engine available")
    {
        auto selector = EngineSelector({ { .engine = local, .priority = 50 }, { .engine = cloud, .priority = 100 } },
                                       quickPolicy(),
                                       notifier);
        REQUIRE(selector.selectInitial().has_value());
        CHECK(selector.currentName() == "elevenlabs");
        CHECK(local->probes.load() == 0);
    }

    SECTION("preferred engine unavailable at start: silent choice of the next one")
    {
        cloud->probeError = ErrorCode::AuthMissing;
        auto selector = EngineSelector({ { .engine = cloud, .priority = 100 }, { .engine = local, .priority = 50 } },
                                       quickPolicy(),
                                       notifier);
        REQUIRE(selector.selectInitial().has_value());
        CHECK(selector.currentName() == "whisper");
        CHECK(selector.fallbackCount() == 0);
        CHECK(notifier.notices().empty());
    }
}

TEST_CASE("selectInitial fails when no engine is available", "[selector]")
{
    auto notifier = RecordingNotifier {};
    auto const cloud = std::make_shared<FakeEngine>("elevenlabs");
    auto const local = std::make_shared<FakeEngine>("whisper");
    cloud->probeError = ErrorCode::AuthMissing;
    local->probeError = ErrorCode::ModelLoadError;

    auto selector = EngineSelector({ { .engine = cloud, .priority = 100 }, { .engine = local, .priority = 50 } },
                                   quickPolicy(),
                                   notifier);
    auto const selected = selector.selectInitial();

    REQUIRE_FALSE(selected.has_value());
    CHECK(selected.error().code == ErrorCode::NoEngineAvailable);
    CHECK(selector.exhausted());
    CHECK(selector.current() == nullptr);
}

TEST_CASE("A failing engine is demoted once and the triggering chunk is retried", "[selector]")
{
    auto notifier = RecordingNotifier {};
    auto const cloud = std::make_shared<FakeEngine>("elevenlabs");
    auto const local = std::make_shared<FakeEngine>("whisper");
    cloud->behavior = failingWith(ErrorCode::NetworkUnreachable);

    auto selector = EngineSelector({ { .engine = cloud, .priority = 100 }, { .engine = local, .priority = 50 } },
                                   quickPolicy(),
                                   notifier);
    REQUIRE(selector.selectInitial().has_value());

    auto const result = selector.transcribe(chunk(0), LanguageMode::English);

    REQUIRE(result.has_value());
    CHECK(result->sequence == 0);
    CHECK(result->engine == "whisper");
    CHECK(selector.currentName() == "whisper");
    CHECK(selector.fallbackCount() == 1);
    CHECK(notifier.count("switched to whisper") == 1);
    CHECK(notifier.count("network_unreachable") == 1);

    SECTION("demotion is sticky for the rest of the session")
    {
        for (auto sequence = SequenceNumber { 1 }; sequence < 4; ++sequence)
            REQUIRE(selector.transcribe(chunk(sequence), LanguageMode::English).has_value());
        CHECK(cloud->calls.load() == 1);
        CHECK(local->sequences() == std::vector<SequenceNumber> { 0, 1, 2, 3 });
        CHECK(notifier.notices().size() == 1);
    }
}

TEST_CASE("Concurrent failures produce exactly one fallback notice", "[selector]")
{
    auto notifier = RecordingNotifier {};
    auto const cloud = std::make_shared<FakeEngine>("elevenlabs");
    auto const local = std::make_shared<FakeEngine>("whisper");
    cloud->behavior = [](const AudioChunk&, int) -> Result<TranscriptionResult> {
        std::this_thread::sleep_for(20ms);
        return makeError(ErrorCode::Timeout, "too slow");
    };

    auto selector = EngineSelector({ { .engine = cloud, .priority = 100 }, { .engine = local, .priority = 50 } },
                                   quickPolicy(),
                                   notifier);
    REQUIRE(selector.selectInitial().has_value());

    auto results = std::vector<Result<TranscriptionResult>>(3, makeError(ErrorCode::Unknown, "not run"));
    {
        auto workers = std::vector<std::jthread> {};
        for (auto i = std::size_t { 0 }; i < results.size(); ++i)
            workers.emplace_back([&, i] { results[i] = selector.transcribe(chunk(i), LanguageMode::Auto); });
    }

    for (auto const& result: results)
    {
        REQUIRE(result.has_value());
        CHECK(result->engine == "whisper");
    }
    CHECK(selector.fallbackCount() == 1);
    CHECK(notifier.notices().size() == 1);
}

TEST_CASE("Rate limiting is retried on the same engine before it counts as a failure", "[selector]")
{
    auto notifier = RecordingNotifier {};
    auto const cloud = std::make_shared<FakeEngine>("elevenlabs");
    auto const local = std::make_shared<FakeEngine>("whisper");

    SECTION("recovers within the retry budget")
    {
        cloud->behavior = [](const AudioChunk& audio, int call) -> Result<TranscriptionResult> {
            if (call < 2)
                return makeError(ErrorCode::RateLimited, "slow down");
            return textResult(audio, "hello", "elevenlabs");
        };
        auto selector = EngineSelector({ { .engine = cloud, .priority = 100 }, { .engine = local, .priority = 50 } },
                                       quickPolicy(),
                                       notifier);
        REQUIRE(selector.selectInitial().has_value());

        auto const result = selector.transcribe(chunk(0), LanguageMode::Auto);
        REQUIRE(result.has_value());
        CHECK(result->text == "hello");
        CHECK(cloud->calls.load() == 3);
        CHECK(local->calls.load() == 0);
        CHECK(selector.fallbackCount() == 0);
    }

    SECTION("persistent rate limiting falls back")
    {
        cloud->behavior = failingWith(ErrorCode::RateLimited);
        auto selector = EngineSelector({ { .engine = cloud, .priority = 100 }, { .engine = local, .priority = 50 } },
                                       quickPolicy(),
                                       notifier);
        REQUIRE(selector.selectInitial().has_value());

        auto const result = selector.transcribe(chunk(0), LanguageMode::Auto);
        REQUIRE(result.has_value());
        CHECK(cloud->calls.load() == 3);
        CHECK(result->engine == "whisper");
        CHECK(notifier.count("rate_limited") == 1);
    }
}

TEST_CASE("A failure threshold above one loses chunks before demoting", "[selector]")
{
    auto notifier = RecordingNotifier {};
    auto const cloud = std::make_shared<FakeEngine>("elevenlabs");
    auto const local = std::make_shared<FakeEngine>("whisper");
    cloud->behavior = failingWith(ErrorCode::MalformedResponse);

    auto policy = quickPolicy();
    policy.failureThreshold = 2;
    auto selector =
        EngineSelector({ { .engine = cloud, .priority = 100 }, { .engine = local, .priority = 50 } }, policy, notifier);
    REQUIRE(selector.selectInitial().has_value());

    auto const first = selector.transcribe(chunk(0), LanguageMode::Auto);
    REQUIRE_FALSE(first.has_value());
    CHECK(first.error().code == ErrorCode::MalformedResponse);
    CHECK(selector.currentName() == "elevenlabs");

    auto const second = selector.transcribe(chunk(1), LanguageMode::Auto);
    REQUIRE(second.has_value());
    CHECK(second->engine == "whisper");
    CHECK(selector.fallbackCount() == 1);
}

TEST_CASE("Fallback skips engines that report unavailable", "[selector]")
{
    auto notifier = RecordingNotifier {};
    auto const cloud = std::make_shared<FakeEngine>("elevenlabs");
    auto const daemon = std::make_shared<FakeEngine>("daemon");
    auto const local = std::make_shared<FakeEngine>("whisper");
    cloud->behavior = failingWith(ErrorCode::AuthInvalid);

    auto selector = EngineSelector(
        {
            { .engine = cloud, .priority = 100 },
            { .engine = daemon, .priority = 80 },
            { .engine = local, .priority = 50 },
        },
        quickPolicy(),
        notifier);
    REQUIRE(selector.selectInitial().has_value());
    daemon->probeError = ErrorCode::NetworkUnreachable;

    auto const result = selector.transcribe(chunk(0), LanguageMode::Auto);

    REQUIRE(result.has_value());
    CHECK(result->engine == "whisper");
    CHECK(daemon->calls.load() == 0);
    CHECK(notifier.count("switched to whisper") == 1);
}

TEST_CASE("Running out of engines exhausts the selector", "[selector]")
{
    auto notifier = RecordingNotifier {};
    auto const cloud = std::make_shared<FakeEngine>("elevenlabs");
    auto const local = std::make_shared<FakeEngine>("whisper");
    cloud->behavior = failingWith(ErrorCode::NetworkUnreachable);
    local->behavior = failingWith(ErrorCode::MalformedResponse);

    auto selector = EngineSelector({ { .engine = cloud, .priority = 100 }, { .engine = local, .priority = 50 } },
                                   quickPolicy(),
                                   notifier);
    REQUIRE(selector.selectInitial().has_value());

    auto const result = selector.transcribe(chunk(0), LanguageMode::Auto);

    REQUIRE_FALSE(result.has_value());
    CHECK(selector.exhausted());
    CHECK(selector.current() == nullptr);
    CHECK(notifier.count("No transcription engine available") == 1);

    auto const next = selector.transcribe(chunk(1), LanguageMode::Auto);
    REQUIRE_FALSE(next.has_value());
    CHECK(next.error().code == ErrorCode::NoEngineAvailable);
}

TEST_CASE("An engine unavailable at session start is not promoted later", "[selector]")
{
    auto notifier = RecordingNotifier {};
    auto const cloud = std::make_shared<FakeEngine>("elevenlabs");
    auto const daemon = std::make_shared<FakeEngine>("daemon");
    auto const local = std::make_shared<FakeEngine>("whisper");
    cloud->probeError = ErrorCode::NetworkUnreachable;
    daemon->behavior = failingWith(ErrorCode::Timeout);

    auto selector = EngineSelector(
        {
            { .engine = cloud, .priority = 100 },
            { .engine = daemon, .priority = 80 },
            { .engine = local, .priority = 50 },
        },
        quickPolicy(),
        notifier);
    REQUIRE(selector.selectInitial().has_value());
    REQUIRE(selector.currentName() == "daemon");

    // The cloud comes back, but it already failed in this session.
    cloud->probeError.reset();

    SECTION("the next engine after the failed one takes over")
    {
        auto const result = selector.transcribe(chunk(0), LanguageMode::Auto);

        REQUIRE(result.has_value());
        CHECK(result->engine == "whisper");
        CHECK(selector.currentName() == "whisper");
        CHECK(notifier.count("daemon failed (timeout), switched to whisper") == 1);
    }

    SECTION("with nothing else left the selector is exhausted")
    {
        local->behavior = failingWith(ErrorCode::MalformedResponse);

        auto const result = selector.transcribe(chunk(0), LanguageMode::Auto);

        REQUIRE_FALSE(result.has_value());
        CHECK(selector.exhausted());
    }

    CHECK(cloud->probes.load() == 1);
    CHECK(cloud->calls.load() == 0);
    CHECK(notifier.count("switched to elevenlabs") == 0);
}

TEST_CASE("exhausted() answers while a fallback availability check is still running", "[selector]")
{
    auto notifier = RecordingNotifier {};
    auto const cloud = std::make_shared<FakeEngine>("elevenlabs");
    auto const local = std::make_shared<FakeEngine>("whisper");
    cloud->behavior = failingWith(ErrorCode::NetworkUnreachable);

    auto selector = EngineSelector({ { .engine = cloud, .priority = 100 }, { .engine = local, .priority = 50 } },
                                   quickPolicy(),
                                   notifier);
    REQUIRE(selector.selectInitial().has_value());
    local->availabilityDelay = 800ms;

    auto worker = std::jthread([&selector] { (void) selector.transcribe(chunk(0), LanguageMode::Auto); });
    while (local->probes.load() == 0)
        std::this_thread::sleep_for(1ms);

    auto const before = std::chrono::steady_clock::now();
    CHECK_FALSE(selector.exhausted());
    CHECK(std::chrono::steady_clock::now() - before < 200ms);

    worker.join();
    CHECK(selector.currentName() == "whisper");
    CHECK(local->calls.load() == 1);
}
