// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <format>

namespace voxtype::jsonrpc
{

auto makeRequest(int64_t id, std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeResponse(const nlohmann::json& id, nlohmann::json result) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "result", std::move(result) },
    };
}

auto makeErrorResponse(const nlohmann::json& id, int code, std::string_view message, nlohmann::json data)
    -> nlohmann::json
{
    auto err = nlohmann::json {
        { "code", code },
        { "message", message },
    };
    if (!data.is_null())
        err["data"] = std::move(data);

    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "error", std::move(err) },
    };
}

auto makeErrorResponse(const nlohmann::json& id, const Error& error) -> nlohmann::json
{
    return makeErrorResponse(id,
                             codes::ApplicationError,
                             error.message,
                             nlohmann::json { { "code", errorCodeToString(error.code) } });
}

auto parseRequest(const nlohmann::json& message) -> Result<Request>
{
    if (!message.is_object() || !message.contains("jsonrpc") || message["jsonrpc"] != "2.0")
        return makeError(ErrorCode::ProtocolError, "Not a valid JSON-RPC 2.0 message");

    if (!message.contains("method") || !message["method"].is_string())
        return makeError(ErrorCode::ProtocolError, "JSON-RPC request without method");

    auto request = Request {};
    request.method = message["method"].get<std::string>();

    if (message.contains("id"))
        request.id = message["id"];

    if (message.contains("params"))
    {
        request.params = message["params"];
        if (!request.params.is_object() && !request.params.is_array())
            return makeError(ErrorCode::ProtocolError, "JSON-RPC params must be an object or array");
    }

    return request;
}

auto parseResponse(const nlohmann::json& message) -> Result<Response>
{
    if (!message.is_object() || !message.contains("jsonrpc") || message["jsonrpc"] != "2.0")
        return makeError(ErrorCode::ProtocolError, "Not a valid JSON-RPC 2.0 message");

    auto response = Response {};

    if (message.contains("id"))
        response.id = message["id"];

    if (message.contains("result"))
    {
        response.result = message["result"];
    }
    else if (message.contains("error") && message["error"].is_object())
    {
        auto const& err = message["error"];
        response.error = RpcError {
            .code = err.value("code", 0),
            .message = err.value("message", "Unknown error"),
            .data = err.value("data", nlohmann::json {}),
        };
    }
    else
    {
        return makeError(ErrorCode::ProtocolError, "JSON-RPC response has neither result nor error");
    }

    return response;
}

auto toError(const RpcError& rpcError) -> Error
{
    if (rpcError.code == codes::ApplicationError && rpcError.data.is_object() && rpcError.data.contains("code")
        && rpcError.data["code"].is_string())
    {
        return Error { errorCodeFromString(rpcError.data["code"].get<std::string>()), rpcError.message };
    }
    return Error { ErrorCode::ProtocolError, std::format("RPC error {}: {}", rpcError.code, rpcError.message) };
}

} // namespace voxtype::jsonrpc
