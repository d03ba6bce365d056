// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace toolbridge
{

/// @brief Error codes for categorizing failures across the bridge.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    ConfigError,
    MalformedMessage,
    SpawnError,
    HandshakeFailure,
    UnknownProvider,
    InvocationTimeout,
    RemoteToolError,
    TransportError,
    TimeoutError,
};

/// @brief Returns the name of an error code, e.g. "HandshakeFailure".
[[nodiscard]] constexpr auto errorCodeToString(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::ConfigError: return "ConfigError";
        case ErrorCode::MalformedMessage: return "MalformedMessage";
        case ErrorCode::SpawnError: return "SpawnError";
        case ErrorCode::HandshakeFailure: return "HandshakeFailure";
        case ErrorCode::UnknownProvider: return "UnknownProvider";
        case ErrorCode::InvocationTimeout: return "InvocationTimeout";
        case ErrorCode::RemoteToolError: return "RemoteToolError";
        case ErrorCode::TransportError: return "TransportError";
        case ErrorCode::TimeoutError: return "TimeoutError";
    }
    return "Unknown";
}

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

} // namespace toolbridge

template <>
struct std::formatter<toolbridge::Error>: std::formatter<std::string>
{
    auto format(const toolbridge::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", toolbridge::errorCodeToString(error.code), error.message), ctx);
    }
};
