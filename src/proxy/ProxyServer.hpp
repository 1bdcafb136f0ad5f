// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <proxy/ProxyFacade.hpp>

#include <nlohmann/json.hpp>

#include <iosfwd>
#include <optional>

namespace envproxy
{

/// @brief Serves the proxy's own tools over newline-delimited JSON-RPC.
///
/// Exposes `list_contexts`, `switch_context`, `get_current_context`, `proxy_tool`
/// and `list_proxied_tools` to a single client, one request at a time.
class ProxyServer
{
  public:
    explicit ProxyServer(ProxyFacade& facade);

    /// @brief Reads requests from @p in and writes responses to @p out until end of input.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run(std::istream& in, std::ostream& out) -> int;

    /// @brief Handles one incoming message.
    /// @return The response, or std::nullopt for notifications.
    [[nodiscard]] auto handleMessage(const nlohmann::json& message) -> std::optional<nlohmann::json>;

  private:
    ProxyFacade& _facade;

    [[nodiscard]] auto handleInitialize(const nlohmann::json& params) const -> nlohmann::json;
    [[nodiscard]] auto handleToolsList() const -> nlohmann::json;
    [[nodiscard]] auto handleToolsCall(const nlohmann::json& params) -> Result<nlohmann::json>;
    [[nodiscard]] auto callTool(std::string_view name, const nlohmann::json& arguments) -> Result<nlohmann::json>;
};

} // namespace envproxy
