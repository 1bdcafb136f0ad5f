// SPDX-License-Identifier: Apache-2.0
#include "ContextCatalog.hpp"

#include <format>

extern char** environ;

namespace envproxy
{

auto ContextCatalog::findContext(std::string_view name) const -> const ContextDescriptor*
{
    auto const it = contexts.find(std::string(name));
    return it != contexts.end() ? &it->second : nullptr;
}

auto ContextCatalog::findServer(std::string_view name) const -> const ServerDescriptor*
{
    auto const it = servers.find(std::string(name));
    return it != servers.end() ? &it->second : nullptr;
}

auto ContextCatalog::buildEnvironment(std::string_view contextName, const EnvironmentMap& base) const
    -> Result<EnvironmentMap>
{
    auto const* context = findContext(contextName);
    if (!context)
        return makeError(ErrorCode::UnknownContextError, std::format("Unknown context: {}", contextName));

    auto env = base;
    for (const auto& [key, value]: defaults)
        env[key] = value;
    for (const auto& [key, value]: context->env)
        env[key] = value;
    return env;
}

auto ContextCatalog::launchSpec(std::string_view contextName, const EnvironmentMap& base) const
    -> Result<LaunchSpec>
{
    auto const* context = findContext(contextName);
    if (!context)
        return makeError(ErrorCode::UnknownContextError, std::format("Unknown context: {}", contextName));

    auto const* server = findServer(context->server);
    if (!server)
        return makeError(ErrorCode::UnknownServerError,
                         std::format("Context '{}' references unknown server '{}'", contextName, context->server));

    return buildEnvironment(contextName, base).transform([server](EnvironmentMap env) {
        return LaunchSpec {
            .command = server->command,
            .args = server->args,
            .environment = std::move(env),
        };
    });
}

auto ContextCatalog::launchSpec(std::string_view contextName) const -> Result<LaunchSpec>
{
    return launchSpec(contextName, processEnvironment());
}

auto commandLine(const ServerDescriptor& server) -> std::string
{
    auto line = server.command;
    for (const auto& arg: server.args)
        line += " " + arg;
    return line;
}

auto processEnvironment() -> EnvironmentMap
{
    auto env = EnvironmentMap {};
    if (!environ)
        return env;

    for (auto** e = environ; *e; ++e)
    {
        auto const entry = std::string_view(*e);
        auto const eq = entry.find('=');
        if (eq == std::string_view::npos || eq == 0)
            continue;
        env.emplace(std::string(entry.substr(0, eq)), std::string(entry.substr(eq + 1)));
    }
    return env;
}

} // namespace envproxy
