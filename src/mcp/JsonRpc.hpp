// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace envproxy::jsonrpc
{

/// @brief Standard JSON-RPC 2.0 error codes.
namespace codes
{
    constexpr auto ParseError = -32700;
    constexpr auto InvalidRequest = -32600;
    constexpr auto MethodNotFound = -32601;
    constexpr auto InvalidParams = -32602;
    constexpr auto InternalError = -32603;
} // namespace codes

/// @brief Represents a JSON-RPC 2.0 error object to be sent.
struct RpcError
{
    int code = 0;
    std::string message;
    nlohmann::json data;
};

/// @brief Represents a parsed JSON-RPC 2.0 response.
struct Response
{
    nlohmann::json id;
    std::optional<nlohmann::json> result;

    /// @brief The `error` member exactly as the peer sent it.
    std::optional<nlohmann::json> error;

    /// @brief Returns true if this response carries a result and no error.
    [[nodiscard]] auto isSuccess() const -> bool { return result.has_value() && !error.has_value(); }

    /// @brief Returns the id as an integer, if it is one.
    [[nodiscard]] auto numericId() const -> std::optional<int64_t>
    {
        if (id.is_number_integer())
            return id.get<int64_t>();
        return std::nullopt;
    }
};

/// @brief Represents a parsed JSON-RPC 2.0 request or notification.
struct Request
{
    std::optional<nlohmann::json> id;
    std::string method;
    nlohmann::json params;

    /// @brief Returns true if no response is expected.
    [[nodiscard]] auto isNotification() const -> bool { return !id.has_value(); }
};

/// @brief Builds a JSON-RPC 2.0 request message.
/// @param id The request ID.
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC request object.
[[nodiscard]] auto makeRequest(int64_t id, std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a successful JSON-RPC 2.0 response.
[[nodiscard]] auto makeResultResponse(const nlohmann::json& id, nlohmann::json result) -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 error response.
[[nodiscard]] auto makeErrorResponse(const nlohmann::json& id, const RpcError& error) -> nlohmann::json;

/// @brief Parses a JSON-RPC 2.0 response.
///
/// Messages that carry neither `result` nor `error` (requests and notifications
/// sent by the peer) are rejected.
/// @param message The JSON message to parse.
/// @return The parsed response or an Error.
[[nodiscard]] auto parseResponse(const nlohmann::json& message) -> Result<Response>;

/// @brief Parses a JSON-RPC 2.0 request or notification.
/// @param message The JSON message to parse.
/// @return The parsed request or an Error.
[[nodiscard]] auto parseRequest(const nlohmann::json& message) -> Result<Request>;

/// @brief Extracts a readable message from a JSON-RPC error object of any shape.
[[nodiscard]] auto describeError(const nlohmann::json& error) -> std::string;

} // namespace envproxy::jsonrpc
