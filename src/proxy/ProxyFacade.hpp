// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <proxy/ContextPool.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace envproxy
{

/// @brief The active context as reported to callers.
struct CurrentContext
{
    std::string name;
    std::string server;
    EnvironmentMap overrides;
    std::vector<std::string> toolNames;
};

/// @brief Caller-facing operations of the proxy, delegating to the ContextPool.
class ProxyFacade
{
  public:
    explicit ProxyFacade(ContextPool& pool);

    /// @brief Lists every configured context with its state.
    [[nodiscard]] auto listContexts() const -> std::vector<ContextSummary>;

    /// @brief Makes a context current.
    /// @param name The context name.
    /// @return The context and its tools, or an error.
    [[nodiscard]] auto switchContext(std::string_view name) -> Result<ContextInfo>;

    /// @brief Describes the current context, or std::nullopt when none is active.
    [[nodiscard]] auto getCurrentContext() -> Result<std::optional<CurrentContext>>;

    /// @brief Calls a tool on the current context's backend.
    /// @param name The tool name.
    /// @param arguments The tool arguments; null means no arguments.
    /// @return The backend's result verbatim, or an error.
    [[nodiscard]] auto invokeTool(std::string_view name, const nlohmann::json& arguments) -> Result<nlohmann::json>;

    /// @brief Lists the current context's tools (empty when no context is active).
    [[nodiscard]] auto listAvailableTools() -> Result<std::vector<ToolDescriptor>>;

    /// @brief Forgets the current context's cached tools and fetches them again.
    [[nodiscard]] auto refreshTools() -> Result<std::vector<ToolDescriptor>>;

  private:
    ContextPool& _pool;
};

[[nodiscard]] auto toJson(const ContextSummary& summary) -> nlohmann::json;
[[nodiscard]] auto toJson(const ContextInfo& info) -> nlohmann::json;
[[nodiscard]] auto toJson(const std::optional<CurrentContext>& current) -> nlohmann::json;
[[nodiscard]] auto toJson(const std::vector<ToolDescriptor>& tools) -> nlohmann::json;

} // namespace envproxy
