// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace envproxy
{

/// @brief Error codes for categorizing failures across the proxy.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    ConfigError,
    SpawnError,
    WriteError,
    TransportError,
    ProtocolError,
    TimeoutError,
    UnknownContextError,
    UnknownServerError,
    NoActiveContextError,
    ToolInvocationError,
    NoResponseError,
};

/// @brief Returns a stable, human-readable name for an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::ConfigError: return "ConfigError";
        case ErrorCode::SpawnError: return "SpawnError";
        case ErrorCode::WriteError: return "WriteError";
        case ErrorCode::TransportError: return "TransportError";
        case ErrorCode::ProtocolError: return "ProtocolError";
        case ErrorCode::TimeoutError: return "TimeoutError";
        case ErrorCode::UnknownContextError: return "UnknownContextError";
        case ErrorCode::UnknownServerError: return "UnknownServerError";
        case ErrorCode::NoActiveContextError: return "NoActiveContextError";
        case ErrorCode::ToolInvocationError: return "ToolInvocationError";
        case ErrorCode::NoResponseError: return "NoResponseError";
    }
    return "Unknown";
}

/// @brief Represents an error with a code, a descriptive message and optional structured data.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;

    /// @brief Structured detail passed through verbatim (e.g. a backend's JSON-RPC error object).
    nlohmann::json payload;
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
    return std::unexpected<Error>(Error { .code = code, .message = std::move(message), .payload = nullptr });
}

/// @brief Creates an unexpected Error value carrying a structured payload.
/// @param code The error code.
/// @param message A descriptive error message.
/// @param payload Structured data attached to the error.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message, nlohmann::json payload)
    -> std::unexpected<Error>
{
    return std::unexpected<Error>(
        Error { .code = code, .message = std::move(message), .payload = std::move(payload) });
}

} // namespace envproxy

template <>
struct std::formatter<envproxy::Error>: std::formatter<std::string>
{
    auto format(const envproxy::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", envproxy::errorCodeName(error.code), error.message), ctx);
    }
};
