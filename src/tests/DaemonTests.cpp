// SPDX-License-Identifier: Apache-2.0
#include <engine/DaemonEngine.hpp>
#include <ipc/DaemonServer.hpp>
#include <ipc/JsonRpc.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <format>
#include <memory>
#include <optional>
#include <queue>
#include <thread>

#include <unistd.h>

#include "TestFakes.hpp"

using namespace voxtype;
using namespace voxtype::testing;
using namespace std::chrono_literals;

namespace
{

/// @brief Replies shared by every MockTransport a factory hands out.
struct MockScript
{
    std::queue<nlohmann::json> responses;
    std::vector<nlohmann::json> sentMessages;
    int connections = 0;
};

/// @brief Mock transport for testing DaemonEngine without a running daemon.
class MockTransport: public Transport
{
  public:
    explicit MockTransport(std::shared_ptr<MockScript> script): _script(std::move(script)) {}

    auto send(const nlohmann::json& message) -> VoidResult override
    {
        _script->sentMessages.push_back(message);
        return {};
    }

    auto receive(std::chrono::milliseconds /*timeout*/) -> Result<nlohmann::json> override
    {
        if (_script->responses.empty())
            return makeError(ErrorCode::Timeout, "No more mock responses");
        auto msg = _script->responses.front();
        _script->responses.pop();
        return msg;
    }

    void close() override {}

    auto isConnected() const -> bool override { return true; }

  private:
    std::shared_ptr<MockScript> _script;
};

auto mockEngine(std::shared_ptr<MockScript> script) -> DaemonEngine
{
    return DaemonEngine(DaemonEngineConfig {}, [script]() -> Result<std::unique_ptr<Transport>> {
        ++script->connections;
        return std::make_unique<MockTransport>(script);
    });
}

auto phrase(SequenceNumber sequence) -> AudioChunk
{
    return AudioChunk { .sequence = sequence, .samples = { 0, 100, -100, 32767, -32768 }, .sampleRate = 16000 };
}

auto uniqueSocketPath() -> std::string
{
    return (std::filesystem::temp_directory_path() / std::format("voxtype_test_{}.sock", ::getpid())).string();
}

} // namespace

TEST_CASE("DaemonEngine probe succeeds on pong", "[daemon]")
{
    auto script = std::make_shared<MockScript>();
    script->responses.push(jsonrpc::makeResponse(1, { { "pong", true } }));

    auto engine = mockEngine(script);
    auto const probed = engine.probe();

    REQUIRE(probed.has_value());
    CHECK(*probed);
    REQUIRE(script->sentMessages.size() == 1);
    CHECK(script->sentMessages[0]["method"] == "ping");
}

TEST_CASE("DaemonEngine probe fails when the daemon cannot be reached", "[daemon]")
{
    auto engine = DaemonEngine(DaemonEngineConfig {}, []() -> Result<std::unique_ptr<Transport>> {
        return makeError(ErrorCode::TransportError, "connection refused");
    });

    auto const probed = engine.probe();
    REQUIRE(!probed.has_value());
    CHECK(probed.error().code == ErrorCode::NetworkUnreachable);
}

TEST_CASE("DaemonEngine transcribe sends the samples and returns the text", "[daemon]")
{
    auto script = std::make_shared<MockScript>();
    script->responses.push(jsonrpc::makeResponse(
        1, { { "sequence", 4 }, { "text", "hello there" }, { "language", "en" }, { "engine", "whisper" } }));

    auto engine = mockEngine(script);
    auto const result = engine.transcribe(phrase(4), LanguageMode::English, 1s);

    REQUIRE(result.has_value());
    CHECK(result->sequence == 4);
    CHECK(result->text == "hello there");
    CHECK(result->engine == "daemon");
    CHECK(result->language == LanguageMode::English);

    REQUIRE(script->sentMessages.size() == 1);
    auto const& params = script->sentMessages[0]["params"];
    CHECK(params["language"] == "en");
    CHECK(params["samples"].size() == 5);
    CHECK(params["samples"][3] == 32767);
}

TEST_CASE("DaemonEngine maps daemon failures to engine errors", "[daemon]")
{
    auto script = std::make_shared<MockScript>();
    auto engine = mockEngine(script);

    SECTION("application error keeps its code")
    {
        script->responses.push(jsonrpc::makeErrorResponse(1, Error { ErrorCode::Timeout, "inference too slow" }));
        auto const result = engine.transcribe(phrase(0), LanguageMode::Auto, 1s);
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::Timeout);
    }

    SECTION("reply without text is malformed")
    {
        script->responses.push(jsonrpc::makeResponse(1, { { "sequence", 0 } }));
        auto const result = engine.transcribe(phrase(0), LanguageMode::Auto, 1s);
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::MalformedResponse);
    }

    SECTION("non-JSON-RPC reply is malformed")
    {
        script->responses.push(nlohmann::json { { "hello", "world" } });
        auto const result = engine.transcribe(phrase(0), LanguageMode::Auto, 1s);
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::MalformedResponse);
    }

    SECTION("no reply in time is a timeout")
    {
        auto const result = engine.transcribe(phrase(0), LanguageMode::Auto, 1s);
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::Timeout);
    }
}

TEST_CASE("DaemonEngine opens a connection per call", "[daemon]")
{
    auto script = std::make_shared<MockScript>();
    script->responses.push(jsonrpc::makeResponse(1, { { "pong", true } }));
    script->responses.push(jsonrpc::makeResponse(2, { { "text", "" } }));

    auto engine = mockEngine(script);
    REQUIRE(engine.probe().has_value());
    REQUIRE(engine.transcribe(phrase(0), LanguageMode::Auto, 1s).has_value());

    CHECK(script->connections == 2);
    CHECK(script->sentMessages[0]["id"] != script->sentMessages[1]["id"]);
}

TEST_CASE("DaemonServer answers ping and status", "[daemon]")
{
    auto server = DaemonServer(DaemonServerConfig { .socketPath = uniqueSocketPath() },
                               std::make_shared<FakeEngine>("whisper"));

    auto const pong = server.handle(jsonrpc::makeRequest(1, "ping"));
    CHECK(pong["id"] == 1);
    CHECK(pong["result"]["pong"] == true);

    auto const status = server.handle(jsonrpc::makeRequest(2, "status"));
    CHECK(status["result"]["engine"] == "whisper");
    CHECK(status["result"]["requests"] == 0);
}

TEST_CASE("DaemonServer transcribes with its engine", "[daemon]")
{
    auto const engine = std::make_shared<FakeEngine>("whisper");
    auto server = DaemonServer(DaemonServerConfig { .socketPath = uniqueSocketPath() }, engine);

    auto const params = nlohmann::json {
        { "sequence", 3 },
        { "language", "cs" },
        { "sampleRate", 16000 },
        { "samples", { 1, 2, 3 } },
    };
    auto const reply = server.handle(jsonrpc::makeRequest(5, "transcribe", params));

    REQUIRE(reply.contains("result"));
    CHECK(reply["result"]["sequence"] == 3);
    CHECK(reply["result"]["text"] == "phrase 3");
    CHECK(reply["result"]["language"] == "cs");
    CHECK(engine->sequences() == std::vector<SequenceNumber> { 3 });
}

TEST_CASE("DaemonServer rejects bad requests", "[daemon]")
{
    auto const engine = std::make_shared<FakeEngine>("whisper");
    auto server = DaemonServer(DaemonServerConfig { .socketPath = uniqueSocketPath() }, engine);

    SECTION("unknown method")
    {
        auto const reply = server.handle(jsonrpc::makeRequest(1, "reboot"));
        CHECK(reply["error"]["code"] == jsonrpc::codes::MethodNotFound);
    }

    SECTION("samples out of range")
    {
        auto const reply = server.handle(jsonrpc::makeRequest(1, "transcribe", { { "samples", { 40000 } } }));
        CHECK(reply["error"]["code"] == jsonrpc::codes::InvalidParams);
        CHECK(engine->calls.load() == 0);
    }

    SECTION("unsupported language")
    {
        auto const reply =
            server.handle(jsonrpc::makeRequest(1, "transcribe", { { "samples", { 1 } }, { "language", "de" } }));
        CHECK(reply["error"]["code"] == jsonrpc::codes::InvalidParams);
    }

    SECTION("engine failure travels as application error")
    {
        engine->behavior = [](const AudioChunk&, int) -> Result<TranscriptionResult> {
            return makeError(ErrorCode::ModelLoadError, "model gone");
        };
        auto const reply = server.handle(jsonrpc::makeRequest(1, "transcribe", { { "samples", { 1 } } }));
        CHECK(reply["error"]["code"] == jsonrpc::codes::ApplicationError);
        CHECK(reply["error"]["data"]["code"] == "model_load_error");
    }

    SECTION("notifications get no reply")
    {
        auto const reply = server.handle(nlohmann::json { { "jsonrpc", "2.0" }, { "method", "ping" } });
        CHECK(reply.is_null());
    }

    SECTION("invalid message")
    {
        auto const reply = server.handle(nlohmann::json { { "id", 4 } });
        CHECK(reply["error"]["code"] == jsonrpc::codes::InvalidRequest);
        CHECK(reply["id"] == 4);
    }
}

TEST_CASE("DaemonEngine talks to a DaemonServer over a unix socket", "[daemon]")
{
    auto const path = uniqueSocketPath();
    auto server = DaemonServer(DaemonServerConfig { .socketPath = path, .pollInterval = 20ms },
                               std::make_shared<FakeEngine>("whisper"));
    REQUIRE(server.bind().has_value());

    auto serverError = std::optional<Error> {};
    auto serving = std::jthread([&](std::stop_token token) {
        if (auto served = server.serve(token); !served)
            serverError = served.error();
    });

    auto engine = DaemonEngine(
        DaemonEngineConfig { .name = "daemon", .socketPath = path, .timeout = 2s, .probeTimeout = 2s });

    auto const probed = engine.probe();
    REQUIRE(probed.has_value());
    CHECK(*probed);

    auto const result = engine.transcribe(phrase(11), LanguageMode::Auto, 2s);
    REQUIRE(result.has_value());
    CHECK(result->sequence == 11);
    CHECK(result->text == "phrase 11");

    SECTION("a second daemon on the same socket is refused")
    {
        auto second = DaemonServer(DaemonServerConfig { .socketPath = path }, std::make_shared<FakeEngine>("whisper"));
        auto const bound = second.bind();
        REQUIRE(!bound.has_value());
        CHECK(bound.error().code == ErrorCode::SessionAlreadyActive);
    }

    serving.request_stop();
    serving.join();
    CHECK(!serverError.has_value());
}
