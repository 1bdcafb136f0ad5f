// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>
#include <utility>

namespace envproxy
{

namespace
{

    auto readStringMap(const nlohmann::json& value, std::string_view where) -> Result<EnvironmentMap>
    {
        auto result = EnvironmentMap {};
        if (value.is_null())
            return result;
        if (!value.is_object())
            return makeError(ErrorCode::ConfigError, std::format("{} must be an object", where));

        for (const auto& [key, entry]: value.items())
        {
            if (!entry.is_string())
                return makeError(ErrorCode::ConfigError, std::format("{}.{} must be a string", where, key));
            result[key] = entry.get<std::string>();
        }
        return result;
    }

    auto readServer(const std::string& name, const nlohmann::json& value) -> Result<ServerDescriptor>
    {
        if (!value.is_object())
            return makeError(ErrorCode::ConfigError, std::format("servers.{} must be an object", name));

        auto command = json::getString(value, "command");
        if (!command)
            return makeError(ErrorCode::ConfigError, std::format("servers.{}.command must be a string", name));

        auto server = ServerDescriptor { .command = std::move(*command), .args = {} };

        if (value.contains("args"))
        {
            auto const& args = value["args"];
            if (!args.is_array())
                return makeError(ErrorCode::ConfigError, std::format("servers.{}.args must be an array", name));
            for (const auto& arg: args)
            {
                if (!arg.is_string())
                    return makeError(ErrorCode::ConfigError,
                                     std::format("servers.{}.args must contain only strings", name));
                server.args.push_back(arg.get<std::string>());
            }
        }

        return server;
    }

    auto readContext(const std::string& name, const nlohmann::json& value) -> Result<ContextDescriptor>
    {
        if (!value.is_object())
            return makeError(ErrorCode::ConfigError, std::format("contexts.{} must be an object", name));

        auto server = json::getString(value, "server");
        if (!server)
            return makeError(ErrorCode::ConfigError, std::format("contexts.{}.server must be a string", name));

        auto env = readStringMap(value.value("env", nlohmann::json {}), std::format("contexts.{}.env", name));
        if (!env)
            return std::unexpected(env.error());

        auto context = ContextDescriptor { .server = std::move(*server), .env = std::move(*env), .description = {} };
        if (value.contains("description") && value["description"].is_string())
            context.description = value["description"].get<std::string>();
        return context;
    }

    auto readMilliseconds(const nlohmann::json& pool, std::string_view key, std::chrono::milliseconds& out)
        -> VoidResult
    {
        auto const keyStr = std::string(key);
        if (!pool.contains(keyStr))
            return {};
        auto const& value = pool[keyStr];
        if (!value.is_number_integer() || value.get<int64_t>() < 0)
            return makeError(ErrorCode::ConfigError, std::format("pool.{} must be a non-negative integer", key));
        out = std::chrono::milliseconds(value.get<int64_t>());
        return {};
    }

    auto readPool(const nlohmann::json& value) -> Result<PoolConfig>
    {
        auto pool = PoolConfig {};
        if (value.is_null())
            return pool;
        if (!value.is_object())
            return makeError(ErrorCode::ConfigError, "pool must be an object");

        if (value.contains("maxSessions"))
        {
            auto const& maxSessions = value["maxSessions"];
            if (!maxSessions.is_number_integer() || maxSessions.get<int64_t>() < 1)
                return makeError(ErrorCode::ConfigError, "pool.maxSessions must be a positive integer");
            pool.maxSessions = maxSessions.get<size_t>();
        }

        for (auto const& [key, field]: { std::pair { "listTimeoutMs", &pool.listTimeout },
                                          std::pair { "callTimeoutMs", &pool.callTimeout },
                                          std::pair { "pacingMs", &pool.pacing },
                                          std::pair { "gracePeriodMs", &pool.gracePeriod },
                                          std::pair { "killPeriodMs", &pool.killPeriod } })
        {
            if (auto result = readMilliseconds(value, key, *field); !result)
                return std::unexpected(result.error());
        }

        return pool;
    }

    auto fileExists(const std::string& path) -> bool
    {
        auto ec = std::error_code {};
        return std::filesystem::is_regular_file(path, ec);
    }

} // namespace

auto defaultConfigDir() -> std::string
{
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/envproxy";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/envproxy";
    return ".";
}

auto defaultConfigPath() -> std::string
{
    return std::format("{}/{}", defaultConfigDir(), ConfigFileName);
}

auto parseConfig(const nlohmann::json& root) -> Result<AppConfig>
{
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Configuration root must be an object");

    auto config = AppConfig {};

    auto defaults = readStringMap(root.value("defaults", nlohmann::json {}), "defaults");
    if (!defaults)
        return std::unexpected(defaults.error());
    config.catalog.defaults = std::move(*defaults);

    if (root.contains("servers"))
    {
        if (!root["servers"].is_object())
            return makeError(ErrorCode::ConfigError, "servers must be an object");
        for (const auto& [name, serverJson]: root["servers"].items())
        {
            auto server = readServer(name, serverJson);
            if (!server)
                return std::unexpected(server.error());
            config.catalog.servers[name] = std::move(*server);
        }
    }

    if (root.contains("contexts"))
    {
        if (!root["contexts"].is_object())
            return makeError(ErrorCode::ConfigError, "contexts must be an object");
        for (const auto& [name, contextJson]: root["contexts"].items())
        {
            auto context = readContext(name, contextJson);
            if (!context)
                return std::unexpected(context.error());
            config.catalog.contexts[name] = std::move(*context);
        }
    }

    if (root.contains("currentContext") && root["currentContext"].is_string())
        config.currentContext = root["currentContext"].get<std::string>();

    auto pool = readPool(root.value("pool", nlohmann::json {}));
    if (!pool)
        return std::unexpected(pool.error());
    config.pool = *pool;

    return config;
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto parseResult = json::parse(ss.str());
    if (!parseResult)
    {
        auto const extension = std::filesystem::path(path).extension();
        if (extension == ".yaml" || extension == ".yml")
            return makeError(ErrorCode::ConfigError,
                             std::format("{}: YAML config files are not supported, convert it to JSON", path));
        return makeError(ErrorCode::ConfigError, std::format("{}: {}", path, parseResult.error().message));
    }

    auto config = parseConfig(*parseResult);
    if (!config)
        return makeError(ErrorCode::ConfigError, std::format("{}: {}", path, config.error().message));

    log::info("Loaded {} server(s) and {} context(s) from {}",
              config->catalog.servers.size(),
              config->catalog.contexts.size(),
              path);
    return config;
}

auto loadConfig(std::optional<std::string> explicitPath) -> Result<AppConfig>
{
    if (explicitPath)
    {
        if (!fileExists(*explicitPath))
            return makeError(ErrorCode::ConfigError, std::format("Config file not found: {}", *explicitPath));
        return loadConfigFromFile(*explicitPath);
    }

    if (auto const* const fromEnv = std::getenv(std::string(ConfigPathVariable).c_str()); fromEnv && *fromEnv)
    {
        if (!fileExists(fromEnv))
            return makeError(ErrorCode::ConfigError,
                             std::format("Config file not found: {} (from {})", fromEnv, ConfigPathVariable));
        return loadConfigFromFile(fromEnv);
    }

    if (auto const local = std::string(ConfigFileName); fileExists(local))
        return loadConfigFromFile(local);

    if (auto const path = defaultConfigPath(); fileExists(path))
        return loadConfigFromFile(path);

    log::info("No config file found, starting with no contexts");
    return AppConfig {};
}

} // namespace envproxy
