// SPDX-License-Identifier: Apache-2.0
#include <engine/ElevenLabsEngine.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace voxtype;
using namespace std::chrono_literals;

TEST_CASE("checkApiKey distinguishes missing and malformed keys", "[elevenlabs]")
{
    auto const missing = elevenlabs::checkApiKey("");
    REQUIRE(!missing.has_value());
    CHECK(missing.error().code == ErrorCode::AuthMissing);

    auto const malformed = elevenlabs::checkApiKey("abc123");
    REQUIRE(!malformed.has_value());
    CHECK(malformed.error().code == ErrorCode::AuthInvalid);

    CHECK(elevenlabs::checkApiKey("sk_0123456789").has_value());
}

TEST_CASE("classifyTranscribeStatus maps HTTP statuses to engine errors", "[elevenlabs]")
{
    CHECK(!elevenlabs::classifyTranscribeStatus(200).has_value());
    CHECK(elevenlabs::classifyTranscribeStatus(429) == ErrorCode::RateLimited);
    CHECK(elevenlabs::classifyTranscribeStatus(401) == ErrorCode::AuthInvalid);
    CHECK(elevenlabs::classifyTranscribeStatus(403) == ErrorCode::AuthInvalid);
    CHECK(elevenlabs::classifyTranscribeStatus(502) == ErrorCode::NetworkUnreachable);
    CHECK(elevenlabs::classifyTranscribeStatus(400) == ErrorCode::MalformedResponse);
}

TEST_CASE("classifyProbeStatus treats validation and rate limit answers as reachable", "[elevenlabs]")
{
    for (auto const status: { 200L, 422L, 429L })
    {
        auto const probed = elevenlabs::classifyProbeStatus(status);
        REQUIRE(probed.has_value());
        CHECK(*probed);
    }

    CHECK(elevenlabs::classifyProbeStatus(401).error().code == ErrorCode::AuthInvalid);
    CHECK(elevenlabs::classifyProbeStatus(503).error().code == ErrorCode::NetworkUnreachable);
    CHECK(elevenlabs::classifyProbeStatus(404).error().code == ErrorCode::MalformedResponse);
}

TEST_CASE("parseTranscript extracts and trims the text", "[elevenlabs]")
{
    auto const text = elevenlabs::parseTranscript(R"({"language_code": "en", "text": "  Hello world. "})");
    REQUIRE(text.has_value());
    CHECK(*text == "Hello world.");

    auto const blank = elevenlabs::parseTranscript(R"({"text": "   "})");
    REQUIRE(blank.has_value());
    CHECK(blank->empty());
}

TEST_CASE("parseTranscript rejects unexpected bodies", "[elevenlabs]")
{
    CHECK(elevenlabs::parseTranscript("<html>Bad Gateway</html>").error().code == ErrorCode::MalformedResponse);
    CHECK(elevenlabs::parseTranscript(R"({"detail": "oops"})").error().code == ErrorCode::MalformedResponse);
    CHECK(elevenlabs::parseTranscript(R"({"text": 42})").error().code == ErrorCode::MalformedResponse);
}

TEST_CASE("ElevenLabsEngine fails fast without credentials", "[elevenlabs]")
{
    auto engine = ElevenLabsEngine(ElevenLabsConfig {});

    auto const probed = engine.probe();
    REQUIRE(!probed.has_value());
    CHECK(probed.error().code == ErrorCode::AuthMissing);

    auto const chunk =
        AudioChunk { .sequence = 2, .samples = std::vector<std::int16_t>(32000, 100), .sampleRate = 16000 };
    auto const result = engine.transcribe(chunk, LanguageMode::English, 1s);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::AuthMissing);
}

TEST_CASE("ElevenLabsEngine answers tiny phrases locally with empty text", "[elevenlabs]")
{
    auto engine = ElevenLabsEngine(ElevenLabsConfig { .name = "elevenlabs",
                                                      .apiKey = "sk_test",
                                                      .baseUrl = "http://127.0.0.1:9",
                                                      .modelId = "scribe_v1",
                                                      .timeout = 1s,
                                                      .probeTimeout = 1s });

    auto const chunk =
        AudioChunk { .sequence = 5, .samples = std::vector<std::int16_t>(800, 100), .sampleRate = 16000 };
    auto const result = engine.transcribe(chunk, LanguageMode::Auto, 1s);

    REQUIRE(result.has_value());
    CHECK(result->sequence == 5);
    CHECK(result->text.empty());
    CHECK(result->engine == "elevenlabs");
}
