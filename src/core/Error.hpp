// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace voxtype
{

/// @brief Error codes for categorizing failures across the application.
///
/// The session, engine and injection groups mirror the user-visible error taxonomy;
/// the remaining codes describe infrastructure failures.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    AudioError,
    ModelLoadError,
    TransportError,
    ProtocolError,

    // Session admission
    SessionAlreadyActive,
    NoEngineAvailable,
    LockStaleOverride,
    NoSessionRunning,

    // Transcription engines
    AuthMissing,
    AuthInvalid,
    NetworkUnreachable,
    Timeout,
    RateLimited,
    MalformedResponse,

    // Text injection
    InjectorUnavailable,
    TargetWindowLost,
};

/// @brief Represents an error with a code and descriptive message.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message) });
}

/// @brief Returns the snake_case name of an error code (e.g. "rate_limited").
[[nodiscard]] constexpr auto errorCodeToString(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "unknown";
        case ErrorCode::InvalidArgument: return "invalid_argument";
        case ErrorCode::IoError: return "io_error";
        case ErrorCode::ConfigError: return "config_error";
        case ErrorCode::AudioError: return "audio_error";
        case ErrorCode::ModelLoadError: return "model_load_error";
        case ErrorCode::TransportError: return "transport_error";
        case ErrorCode::ProtocolError: return "protocol_error";
        case ErrorCode::SessionAlreadyActive: return "already_active";
        case ErrorCode::NoEngineAvailable: return "no_engine_available";
        case ErrorCode::LockStaleOverride: return "lock_stale_override";
        case ErrorCode::NoSessionRunning: return "no_session_running";
        case ErrorCode::AuthMissing: return "auth_missing";
        case ErrorCode::AuthInvalid: return "auth_invalid";
        case ErrorCode::NetworkUnreachable: return "network_unreachable";
        case ErrorCode::Timeout: return "timeout";
        case ErrorCode::RateLimited: return "rate_limited";
        case ErrorCode::MalformedResponse: return "malformed_response";
        case ErrorCode::InjectorUnavailable: return "injector_unavailable";
        case ErrorCode::TargetWindowLost: return "target_window_lost";
    }
    return "unknown";
}

/// @brief Parses a snake_case error code name, falling back to ErrorCode::Unknown.
[[nodiscard]] constexpr auto errorCodeFromString(std::string_view name) -> ErrorCode
{
    for (auto i = static_cast<int>(ErrorCode::Unknown); i <= static_cast<int>(ErrorCode::TargetWindowLost); ++i)
        if (errorCodeToString(static_cast<ErrorCode>(i)) == name)
            return static_cast<ErrorCode>(i);
    return ErrorCode::Unknown;
}

} // namespace voxtype

template <>
struct std::formatter<voxtype::Error>: std::formatter<std::string>
{
    auto format(const voxtype::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", voxtype::errorCodeToString(error.code), error.message), ctx);
    }
};
