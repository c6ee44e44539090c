// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace voxtype::jsonrpc
{

/// @brief Standard JSON-RPC 2.0 error codes.
namespace codes
{
    inline constexpr int ParseError = -32700;
    inline constexpr int InvalidRequest = -32600;
    inline constexpr int MethodNotFound = -32601;
    inline constexpr int InvalidParams = -32602;
    inline constexpr int InternalError = -32603;

    /// @brief Application-level failure; data.code carries the voxtype error code name.
    inline constexpr int ApplicationError = -32000;
} // namespace codes

/// @brief Represents a JSON-RPC 2.0 error.
struct RpcError
{
    int code = 0;
    std::string message;
    nlohmann::json data;
};

/// @brief Represents a parsed JSON-RPC 2.0 request or notification.
struct Request
{
    nlohmann::json id;
    std::string method;
    nlohmann::json params;

    /// @brief Returns true if no reply is expected.
    [[nodiscard]] auto isNotification() const -> bool { return id.is_null(); }
};

/// @brief Represents a parsed JSON-RPC 2.0 response.
struct Response
{
    nlohmann::json id;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;

    /// @brief Returns true if this response indicates success.
    [[nodiscard]] auto isSuccess() const -> bool { return result.has_value(); }
};

/// @brief Builds a JSON-RPC 2.0 request message.
/// @param id The request ID.
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC request object.
[[nodiscard]] auto makeRequest(int64_t id, std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a successful JSON-RPC 2.0 response.
[[nodiscard]] auto makeResponse(const nlohmann::json& id, nlohmann::json result) -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 error response.
[[nodiscard]] auto makeErrorResponse(const nlohmann::json& id,
                                     int code,
                                     std::string_view message,
                                     nlohmann::json data = nullptr) -> nlohmann::json;

/// @brief Builds an ApplicationError response carrying a voxtype Error.
[[nodiscard]] auto makeErrorResponse(const nlohmann::json& id, const Error& error) -> nlohmann::json;

/// @brief Parses a JSON-RPC 2.0 request.
/// @param message The JSON message to parse.
/// @return The parsed request or an Error.
[[nodiscard]] auto parseRequest(const nlohmann::json& message) -> Result<Request>;

/// @brief Parses a JSON-RPC 2.0 response.
/// @param message The JSON message to parse.
/// @return The parsed response or an Error.
[[nodiscard]] auto parseResponse(const nlohmann::json& message) -> Result<Response>;

/// @brief Converts an RPC error back into a voxtype Error.
///
/// ApplicationError responses restore the original error code from data.code; all other
/// RPC errors become ErrorCode::ProtocolError.
[[nodiscard]] auto toError(const RpcError& rpcError) -> Error;

} // namespace voxtype::jsonrpc
