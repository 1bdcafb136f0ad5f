// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace envproxy
{

/// @brief Environment variables as name → value, keys unique.
using EnvironmentMap = std::map<std::string, std::string>;

/// @brief Snapshot of a tool offered by a backend server.
struct ToolDescriptor
{
    std::string name;
    std::optional<std::string> description;

    /// @brief Input schema document, passed through verbatim (null when the backend sent none).
    nlohmann::json inputSchema;
};

/// @brief Concrete parameters for launching one backend process.
struct LaunchSpec
{
    std::string command;
    std::vector<std::string> args;

    /// @brief The complete environment of the child process.
    EnvironmentMap environment;
};

} // namespace envproxy
