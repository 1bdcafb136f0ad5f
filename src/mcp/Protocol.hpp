// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/JsonRpc.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string_view>

namespace envproxy::mcp
{

/// @brief The only protocol version the proxy speaks, to backends and to its own clients.
constexpr auto ProtocolVersion = std::string_view { "2024-11-05" };

constexpr auto ImplementationName = std::string_view { "envproxy" };
constexpr auto ImplementationVersion = std::string_view { "0.1.0" };

/// @brief Builds the handshake request that opens every exchange with a backend.
[[nodiscard]] inline auto makeInitializeRequest(int64_t id) -> nlohmann::json
{
    return jsonrpc::makeRequest(id,
                                "initialize",
                                nlohmann::json {
                                    { "protocolVersion", ProtocolVersion },
                                    { "capabilities", nlohmann::json::object() },
                                    { "clientInfo",
                                      nlohmann::json {
                                          { "name", ImplementationName },
                                          { "version", ImplementationVersion },
                                      } },
                                });
}

/// @brief Builds a `tools/list` request.
[[nodiscard]] inline auto makeListToolsRequest(int64_t id) -> nlohmann::json
{
    return jsonrpc::makeRequest(id, "tools/list", nlohmann::json::object());
}

/// @brief Builds a `tools/call` request.
[[nodiscard]] inline auto makeCallToolRequest(int64_t id, std::string_view name, const nlohmann::json& arguments)
    -> nlohmann::json
{
    return jsonrpc::makeRequest(id,
                                "tools/call",
                                nlohmann::json {
                                    { "name", name },
                                    { "arguments", arguments.is_null() ? nlohmann::json::object() : arguments },
                                });
}

} // namespace envproxy::mcp
