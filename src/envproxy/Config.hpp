// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <proxy/ContextCatalog.hpp>
#include <proxy/ContextPool.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace envproxy
{

/// @brief Name of the environment variable that points at a config file.
constexpr auto ConfigPathVariable = std::string_view { "ENVPROXY_CONFIG" };

/// @brief File name looked up in the working directory and the config directory.
constexpr auto ConfigFileName = std::string_view { "contexts.json" };

/// @brief Top-level application configuration.
struct AppConfig
{
    ContextCatalog catalog;

    /// @brief Context treated as current on startup, if any.
    std::optional<std::string> currentContext;

    PoolConfig pool;
};

/// @brief Builds the configuration from an already parsed JSON document.
/// @param root The document root.
/// @return The configuration or ErrorCode::ConfigError naming the offending entry.
[[nodiscard]] auto parseConfig(const nlohmann::json& root) -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Locates and loads the configuration.
///
/// Lookup order: @p explicitPath, then `$ENVPROXY_CONFIG`, then `./contexts.json`,
/// then defaultConfigPath(). An explicit or environment-provided path must exist.
/// When nothing is found an empty configuration is returned.
[[nodiscard]] auto loadConfig(std::optional<std::string> explicitPath = std::nullopt) -> Result<AppConfig>;

/// @brief Returns the default config directory ($XDG_CONFIG_HOME/envproxy or ~/.config/envproxy).
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path.
[[nodiscard]] auto defaultConfigPath() -> std::string;

} // namespace envproxy
