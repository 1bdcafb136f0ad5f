// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <envproxy/Config.hpp>
#include <proxy/ContextPool.hpp>
#include <proxy/ProxyFacade.hpp>
#include <proxy/ProxyServer.hpp>

#include <CLI/CLI.hpp>

#include <iostream>
#include <optional>
#include <string>

int main(int argc, char** argv)
{
    auto app = CLI::App { "envproxy - switch MCP backend servers between named environment contexts" };

    auto configPath = std::string {};
    auto verbose = false;
    auto logLevel = std::string { "warning" };
    auto maxSessions = size_t { 0 };

    app.add_option("-c,--config", configPath, "Path to contexts.json config file (JSON only, YAML is not read)");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_option("--log-level", logLevel, "Log level (error|warning|info|debug|trace)")
        ->check(CLI::IsMember({ "error", "warning", "info", "debug", "trace" }, CLI::ignore_case));
    app.add_option("--max-sessions", maxSessions, "Maximum number of live backend sessions")
        ->check(CLI::PositiveNumber);

    CLI11_PARSE(app, argc, argv);

    if (verbose)
        envproxy::log::setLevel(envproxy::log::Level::Debug);
    else if (auto const level = envproxy::log::parseLevel(logLevel))
        envproxy::log::setLevel(*level);

    auto configResult =
        envproxy::loadConfig(configPath.empty() ? std::nullopt : std::optional<std::string>(configPath));
    if (!configResult)
    {
        envproxy::log::error("Configuration error: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;
    if (maxSessions > 0)
        config.pool.maxSessions = maxSessions;

    auto pool = envproxy::ContextPool(
        std::move(config.catalog), config.pool, envproxy::TransportFactory {}, config.currentContext);
    auto facade = envproxy::ProxyFacade(pool);
    auto server = envproxy::ProxyServer(facade);

    envproxy::log::info("Serving on stdio");
    auto const exitCode = server.run(std::cin, std::cout);

    pool.shutdown();
    return exitCode;
}
