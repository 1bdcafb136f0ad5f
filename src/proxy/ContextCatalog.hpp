// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace envproxy
{

/// @brief A named backend command template.
struct ServerDescriptor
{
    std::string command;
    std::vector<std::string> args;
};

/// @brief A named selection of a server plus environment overrides.
struct ContextDescriptor
{
    std::string server;
    EnvironmentMap env;
    std::optional<std::string> description;
};

/// @brief The server and context tables, plus the global default environment.
///
/// Read-only once loaded. Resolves a context name into concrete launch parameters.
struct ContextCatalog
{
    EnvironmentMap defaults;
    std::map<std::string, ServerDescriptor> servers;
    std::map<std::string, ContextDescriptor> contexts;

    [[nodiscard]] auto findContext(std::string_view name) const -> const ContextDescriptor*;
    [[nodiscard]] auto findServer(std::string_view name) const -> const ServerDescriptor*;

    /// @brief Computes the effective environment of a context.
    ///
    /// Layers, later wins: @p base, then the global defaults, then the context's overrides.
    /// @param contextName The context.
    /// @param base The base environment, usually the proxy's own.
    /// @return The environment or ErrorCode::UnknownContextError.
    [[nodiscard]] auto buildEnvironment(std::string_view contextName, const EnvironmentMap& base) const
        -> Result<EnvironmentMap>;

    /// @brief Resolves a context into command, arguments and effective environment.
    /// @return The launch parameters, ErrorCode::UnknownContextError or ErrorCode::UnknownServerError.
    [[nodiscard]] auto launchSpec(std::string_view contextName, const EnvironmentMap& base) const
        -> Result<LaunchSpec>;

    /// @brief Same as above, using the proxy's current process environment as the base.
    [[nodiscard]] auto launchSpec(std::string_view contextName) const -> Result<LaunchSpec>;
};

/// @brief Joins a server's command and arguments with spaces.
[[nodiscard]] auto commandLine(const ServerDescriptor& server) -> std::string;

/// @brief Snapshots the current process environment.
[[nodiscard]] auto processEnvironment() -> EnvironmentMap;

} // namespace envproxy
