// SPDX-License-Identifier: Apache-2.0
#include "ProxyFacade.hpp"

#include <core/JsonUtils.hpp>

#include <format>

namespace envproxy
{

namespace
{

    auto optionalString(const std::optional<std::string>& value) -> nlohmann::json
    {
        return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
    }

} // namespace

ProxyFacade::ProxyFacade(ContextPool& pool): _pool(pool)
{
}

auto ProxyFacade::listContexts() const -> std::vector<ContextSummary>
{
    return _pool.describe();
}

auto ProxyFacade::switchContext(std::string_view name) -> Result<ContextInfo>
{
    return _pool.activate(name);
}

auto ProxyFacade::getCurrentContext() -> Result<std::optional<CurrentContext>>
{
    auto const name = _pool.currentContext();
    if (!name)
        return std::optional<CurrentContext> {};

    auto const* context = _pool.catalog().findContext(*name);
    if (!context)
        return makeError(ErrorCode::UnknownContextError, std::format("Unknown context: {}", *name));

    return _pool.listTools(*name).transform([&](const std::vector<ToolDescriptor>& tools) {
        auto current = CurrentContext {
            .name = *name,
            .server = context->server,
            .overrides = context->env,
            .toolNames = {},
        };
        for (const auto& tool: tools)
            current.toolNames.push_back(tool.name);
        return std::optional<CurrentContext>(std::move(current));
    });
}

auto ProxyFacade::invokeTool(std::string_view name, const nlohmann::json& arguments) -> Result<nlohmann::json>
{
    return _pool.invoke(name, arguments.is_null() ? nlohmann::json::object() : arguments);
}

auto ProxyFacade::listAvailableTools() -> Result<std::vector<ToolDescriptor>>
{
    return _pool.listTools();
}

auto ProxyFacade::refreshTools() -> Result<std::vector<ToolDescriptor>>
{
    auto const name = _pool.currentContext();
    if (!name)
        return makeError(ErrorCode::NoActiveContextError, "No active context. Use switch_context first.");

    _pool.invalidateTools(*name);
    return _pool.listTools(*name);
}

auto toJson(const ContextSummary& summary) -> nlohmann::json
{
    return nlohmann::json {
        { "name", summary.name },
        { "server", summary.server },
        { "command", summary.commandLine },
        { "env", json::fromStringMap(summary.overrides) },
        { "description", optionalString(summary.description) },
        { "active", summary.isCurrent },
        { "loaded", summary.isLoaded },
        { "tools_cached", summary.hasCachedTools },
    };
}

auto toJson(const ContextInfo& info) -> nlohmann::json
{
    return nlohmann::json {
        { "context", info.name },
        { "server", info.server },
        { "env", json::fromStringMap(info.overrides) },
        { "description", optionalString(info.description) },
        { "tools_available", info.tools.size() },
        { "tools", toJson(info.tools) },
    };
}

auto toJson(const std::optional<CurrentContext>& current) -> nlohmann::json
{
    if (!current)
        return nlohmann::json { { "context", nullptr }, { "message", "No context active" } };

    return nlohmann::json {
        { "context", current->name },
        { "server", current->server },
        { "env", json::fromStringMap(current->overrides) },
        { "tools_available", current->toolNames.size() },
        { "tool_names", current->toolNames },
    };
}

auto toJson(const std::vector<ToolDescriptor>& tools) -> nlohmann::json
{
    auto array = nlohmann::json::array();
    for (const auto& tool: tools)
    {
        array.push_back(nlohmann::json {
            { "name", tool.name },
            { "description", optionalString(tool.description) },
            { "input_schema", tool.inputSchema },
        });
    }
    return array;
}

} // namespace envproxy
