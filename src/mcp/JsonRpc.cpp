// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <format>

namespace envproxy::jsonrpc
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

auto makeResultResponse(const nlohmann::json& id, nlohmann::json result) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "result", std::move(result) },
    };
}

auto makeErrorResponse(const nlohmann::json& id, const RpcError& error) -> nlohmann::json
{
    auto err = nlohmann::json {
        { "code", error.code },
        { "message", error.message },
    };
    if (!error.data.is_null())
        err["data"] = error.data;

    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "error", std::move(err) },
    };
}

auto parseResponse(const nlohmann::json& message) -> Result<Response>
{
    if (!message.is_object() || !message.contains("jsonrpc") || message["jsonrpc"] != "2.0")
        return makeError(ErrorCode::ProtocolError, "Not a valid JSON-RPC 2.0 message");

    auto response = Response {};

    if (message.contains("id"))
        response.id = message["id"];

    if (message.contains("error"))
        response.error = message["error"];
    else if (message.contains("result"))
        response.result = message["result"];
    else
        return makeError(ErrorCode::ProtocolError, "JSON-RPC message has neither result nor error");

    return response;
}

auto parseRequest(const nlohmann::json& message) -> Result<Request>
{
    if (!message.is_object() || !message.contains("jsonrpc") || message["jsonrpc"] != "2.0")
        return makeError(ErrorCode::ProtocolError, "Not a valid JSON-RPC 2.0 message");

    if (!message.contains("method") || !message["method"].is_string())
        return makeError(ErrorCode::ProtocolError, "JSON-RPC request has no method");

    auto request = Request {
        .id = std::nullopt,
        .method = message["method"].get<std::string>(),
        .params = message.value("params", nlohmann::json::object()),
    };

    if (message.contains("id") && !message["id"].is_null())
        request.id = message["id"];

    return request;
}

auto describeError(const nlohmann::json& error) -> std::string
{
    if (error.is_string())
        return error.get<std::string>();

    if (error.is_object() && error.contains("message") && error["message"].is_string())
    {
        auto const message = error["message"].get<std::string>();
        // Backends are free to put anything into "code"; only integers are shown.
        if (error.contains("code") && error["code"].is_number_integer())
            return std::format("RPC error {}: {}", error["code"].get<int64_t>(), message);
        return std::format("RPC error: {}", message);
    }

    return error.dump();
}

} // namespace envproxy::jsonrpc
