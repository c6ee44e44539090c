// SPDX-License-Identifier: Apache-2.0
#include <ipc/JsonRpc.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace voxtype;

TEST_CASE("makeRequest creates valid JSON-RPC 2.0 request", "[jsonrpc]")
{
    auto request = jsonrpc::makeRequest(1, "ping");

    CHECK(request["jsonrpc"] == "2.0");
    CHECK(request["id"] == 1);
    CHECK(request["method"] == "ping");
    CHECK(!request.contains("params"));
}

TEST_CASE("makeRequest includes params when provided", "[jsonrpc]")
{
    auto params = nlohmann::json { { "sequence", 7 } };
    auto request = jsonrpc::makeRequest(42, "transcribe", params);

    CHECK(request["id"] == 42);
    REQUIRE(request.contains("params"));
    CHECK(request["params"]["sequence"] == 7);
}

TEST_CASE("parseRequest accepts requests and notifications", "[jsonrpc]")
{
    auto const request = jsonrpc::parseRequest(jsonrpc::makeRequest(3, "status"));
    REQUIRE(request.has_value());
    CHECK(request->method == "status");
    CHECK(request->id == 3);
    CHECK(!request->isNotification());

    auto const notification = jsonrpc::parseRequest(nlohmann::json { { "jsonrpc", "2.0" }, { "method", "ping" } });
    REQUIRE(notification.has_value());
    CHECK(notification->isNotification());
}

TEST_CASE("parseRequest rejects malformed requests", "[jsonrpc]")
{
    CHECK(!jsonrpc::parseRequest(nlohmann::json { { "method", "ping" } }).has_value());
    CHECK(!jsonrpc::parseRequest(nlohmann::json { { "jsonrpc", "2.0" }, { "id", 1 } }).has_value());
    CHECK(!jsonrpc::parseRequest(
               nlohmann::json { { "jsonrpc", "2.0" }, { "id", 1 }, { "method", "ping" }, { "params", 5 } })
               .has_value());
    CHECK(jsonrpc::parseRequest(nlohmann::json::array()).error().code == ErrorCode::ProtocolError);
}

TEST_CASE("parseResponse handles success response", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
        { "result", { { "pong", true } } },
    };

    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(result.has_value());
    CHECK(result->isSuccess());
    CHECK(result->result->at("pong") == true);
    CHECK(!result->error.has_value());
}

TEST_CASE("parseResponse handles error response", "[jsonrpc]")
{
    auto msg = jsonrpc::makeErrorResponse(1, jsonrpc::codes::InvalidRequest, "Invalid Request");

    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(result.has_value());
    CHECK(!result->isSuccess());
    REQUIRE(result->error.has_value());
    CHECK(result->error->code == -32600);
    CHECK(result->error->message == "Invalid Request");
}

TEST_CASE("parseResponse rejects non-JSON-RPC messages", "[jsonrpc]")
{
    auto msg = nlohmann::json { { "version", "1.0" } };
    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProtocolError);
}

TEST_CASE("parseResponse handles response without result or error", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
    };

    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProtocolError);
}

TEST_CASE("Application errors keep their error code across the wire", "[jsonrpc]")
{
    auto const msg = jsonrpc::makeErrorResponse(9, Error { ErrorCode::ModelLoadError, "model missing" });
    CHECK(msg["error"]["code"] == jsonrpc::codes::ApplicationError);
    CHECK(msg["error"]["data"]["code"] == "model_load_error");

    auto const parsed = jsonrpc::parseResponse(msg);
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->error.has_value());

    auto const error = jsonrpc::toError(*parsed->error);
    CHECK(error.code == ErrorCode::ModelLoadError);
    CHECK(error.message == "model missing");
}

TEST_CASE("Protocol-level RPC errors become ProtocolError", "[jsonrpc]")
{
    auto const error = jsonrpc::toError(jsonrpc::RpcError {
        .code = jsonrpc::codes::MethodNotFound,
        .message = "Unknown method: foo",
        .data = nullptr,
    });
    CHECK(error.code == ErrorCode::ProtocolError);
}
