// SPDX-License-Identifier: Apache-2.0
#include "ContextPool.hpp"

#include <core/Log.hpp>
#include <mcp/Correlator.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/Protocol.hpp>
#include <mcp/StdioTransport.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <format>

namespace envproxy
{

struct ContextPool::Session
{
    std::string contextName;
    std::unique_ptr<Transport> transport;
    int64_t nextId = 0;
    std::optional<std::vector<ToolDescriptor>> toolCache;
    std::atomic<bool> cachePopulated { false };

    /// @brief Set by an exchange that found the backend gone; the session is then discarded.
    bool broken = false;
    bool closed = false;

    /// @brief Held for the duration of an exchange.
    std::mutex mutex;
};

namespace
{

    auto parseTools(const nlohmann::json& result) -> std::vector<ToolDescriptor>
    {
        auto tools = std::vector<ToolDescriptor> {};

        if (!result.is_object() || !result.contains("tools") || !result["tools"].is_array())
            return tools;

        for (const auto& toolJson: result["tools"])
        {
            if (!toolJson.is_object() || !toolJson.contains("name") || !toolJson["name"].is_string())
                continue;

            auto tool = ToolDescriptor {
                .name = toolJson["name"].get<std::string>(),
                .description = std::nullopt,
                .inputSchema = toolJson.value("inputSchema", nlohmann::json {}),
            };
            if (toolJson.contains("description") && toolJson["description"].is_string())
                tool.description = toolJson["description"].get<std::string>();

            tools.push_back(std::move(tool));
        }

        return tools;
    }

} // namespace

template <typename Fn>
auto ContextPool::withSession(std::string_view contextName, Fn&& fn) -> std::invoke_result_t<Fn, Session&>
{
    // A session can be evicted between lookup and locking it; the retry starts a fresh one.
    for (auto attempt = 0; attempt < 2; ++attempt)
    {
        auto session = acquireSession(contextName);
        if (!session)
            return std::unexpected(session.error());

        auto lock = std::unique_lock((*session)->mutex);
        if ((*session)->closed)
            continue;

        auto result = fn(**session);
        auto const broken = (*session)->broken;
        lock.unlock();

        if (broken)
            discardSession(*session);
        return result;
    }

    return makeError(ErrorCode::TransportError,
                     std::format("Session for context '{}' was closed while in use", contextName));
}

ContextPool::ContextPool(ContextCatalog catalog,
                         PoolConfig config,
                         TransportFactory factory,
                         std::optional<std::string> initialContext):
    _catalog(std::move(catalog)),
    _config(config),
    _factory(factory ? std::move(factory) : TransportFactory(&StdioTransport::open))
{
    if (_config.maxSessions == 0)
        _config.maxSessions = 1;

    if (initialContext)
    {
        if (_catalog.findContext(*initialContext))
            _current = std::move(initialContext);
        else
            log::warning("Ignoring unknown initial context '{}'", *initialContext);
    }
}

ContextPool::~ContextPool()
{
    shutdown();
}

auto ContextPool::activate(std::string_view contextName) -> Result<ContextInfo>
{
    auto const* context = _catalog.findContext(contextName);
    if (!context)
        return makeError(ErrorCode::UnknownContextError, std::format("Unknown context: {}", contextName));

    auto session = acquireSession(contextName);
    if (!session)
        return std::unexpected(session.error());

    // The session may be discarded before the listing and fail to restart; only a
    // successful listing makes the context current.
    auto tools = listTools(contextName);
    if (!tools)
        return std::unexpected(tools.error());

    {
        auto const lock = std::lock_guard(_mutex);
        if (_current != contextName)
        {
            _current = std::string(contextName);
            log::info("Switched to context: {}", contextName);
        }
    }

    return ContextInfo {
        .name = std::string(contextName),
        .server = context->server,
        .overrides = context->env,
        .description = context->description,
        .tools = std::move(*tools),
    };
}

auto ContextPool::listTools(std::optional<std::string_view> contextName) -> Result<std::vector<ToolDescriptor>>
{
    auto const target = contextName ? std::optional<std::string>(std::string(*contextName)) : currentContext();
    if (!target)
        return std::vector<ToolDescriptor> {};

    if (!_catalog.findContext(*target))
        return makeError(ErrorCode::UnknownContextError, std::format("Unknown context: {}", *target));

    return withSession(*target, [this](Session& session) -> Result<std::vector<ToolDescriptor>> {
        if (session.toolCache)
            return *session.toolCache;

        auto fetched = fetchTools(session);
        if (!fetched)
            return std::vector<ToolDescriptor> {};

        log::info("Context '{}' offers {} tools", session.contextName, fetched->size());
        session.toolCache = std::move(*fetched);
        session.cachePopulated = true;
        return *session.toolCache;
    });
}

auto ContextPool::invoke(std::string_view toolName, const nlohmann::json& arguments) -> Result<nlohmann::json>
{
    auto const current = currentContext();
    if (!current)
        return makeError(ErrorCode::NoActiveContextError, "No active context. Use switch_context first.");

    return withSession(*current, [&](Session& session) -> Result<nlohmann::json> {
        auto const initId = session.nextId++;
        auto const callId = session.nextId++;
        auto const requests = std::array {
            mcp::makeInitializeRequest(initId),
            mcp::makeCallToolRequest(callId, toolName, arguments),
        };

        log::debug("Calling tool '{}' on context '{}'", toolName, session.contextName);
        auto result = exchange(*session.transport,
                               requests,
                               requests.size(),
                               ExchangeOptions { .timeout = _config.callTimeout, .pacing = _config.pacing });
        if (!result)
        {
            session.broken = true;
            return std::unexpected(result.error());
        }
        session.broken = result->closed;

        auto const* response = result->find(callId);
        if (!response)
        {
            return makeError(ErrorCode::NoResponseError,
                             std::format("No response from context '{}' for tool '{}'{}",
                                         session.contextName,
                                         toolName,
                                         result->timedOut ? " before the timeout" : ""));
        }

        if (response->error)
        {
            return makeError(ErrorCode::ToolInvocationError,
                             std::format("Tool '{}' failed: {}", toolName, jsonrpc::describeError(*response->error)),
                             *response->error);
        }

        return *response->result;
    });
}

auto ContextPool::describe() const -> std::vector<ContextSummary>
{
    auto const lock = std::lock_guard(_mutex);

    auto summaries = std::vector<ContextSummary> {};
    summaries.reserve(_catalog.contexts.size());
    for (const auto& [name, context]: _catalog.contexts)
    {
        auto const* server = _catalog.findServer(context.server);
        auto const session = findLocked(name);
        summaries.push_back(ContextSummary {
            .name = name,
            .server = context.server,
            .commandLine = server ? commandLine(*server) : "unknown",
            .overrides = context.env,
            .description = context.description,
            .isCurrent = _current == name,
            .isLoaded = session != nullptr,
            .hasCachedTools = session && session->cachePopulated.load(),
        });
    }
    return summaries;
}

void ContextPool::invalidateTools(std::string_view contextName)
{
    auto session = SessionPtr {};
    {
        auto const lock = std::lock_guard(_mutex);
        session = findLocked(contextName);
    }
    if (!session)
        return;

    auto const lock = std::lock_guard(session->mutex);
    session->toolCache.reset();
    session->cachePopulated = false;
    log::debug("Tool cache of context '{}' invalidated", contextName);
}

void ContextPool::shutdown()
{
    auto sessions = std::vector<SessionPtr> {};
    {
        auto const lock = std::lock_guard(_mutex);
        sessions.swap(_sessions);
    }

    for (const auto& session: sessions)
        closeSession(*session);

    if (!sessions.empty())
        log::info("Pool shut down, {} sessions closed", sessions.size());
}

auto ContextPool::currentContext() const -> std::optional<std::string>
{
    auto const lock = std::lock_guard(_mutex);
    return _current;
}

auto ContextPool::liveSessionCount() const -> size_t
{
    auto const lock = std::lock_guard(_mutex);
    return _sessions.size();
}

auto ContextPool::hasSession(std::string_view contextName) const -> bool
{
    auto const lock = std::lock_guard(_mutex);
    return findLocked(contextName) != nullptr;
}

auto ContextPool::catalog() const -> const ContextCatalog&
{
    return _catalog;
}

auto ContextPool::config() const -> const PoolConfig&
{
    return _config;
}

auto ContextPool::findLocked(std::string_view contextName) const -> SessionPtr
{
    auto const it =
        std::ranges::find_if(_sessions, [&](const SessionPtr& s) { return s->contextName == contextName; });
    return it != _sessions.end() ? *it : nullptr;
}

auto ContextPool::acquireSession(std::string_view contextName) -> Result<SessionPtr>
{
    auto victims = std::vector<SessionPtr> {};
    auto session = SessionPtr {};
    {
        auto const lock = std::lock_guard(_mutex);

        session = findLocked(contextName);
        if (session)
        {
            log::debug("Reusing session for context: {}", contextName);
        }
        else
        {
            auto spec = _catalog.launchSpec(contextName);
            if (!spec)
                return std::unexpected(spec.error());

            log::info("Starting new session for context '{}': {}", contextName, spec->command);
            auto transport = _factory(*spec);
            if (!transport)
            {
                log::error("Failed to start context '{}': {}", contextName, transport.error().message);
                return std::unexpected(transport.error());
            }

            // Oldest non-current session goes first; the current one is never evicted.
            while (_sessions.size() >= _config.maxSessions)
            {
                auto const it = std::ranges::find_if(
                    _sessions, [this](const SessionPtr& s) { return s->contextName != _current; });
                if (it == _sessions.end())
                {
                    log::warning("Cannot evict: only the current context '{}' is in the pool, exceeding the "
                                 "limit of {} sessions",
                                 _current.value_or(""),
                                 _config.maxSessions);
                    break;
                }
                log::info("Evicting context: {}", (*it)->contextName);
                victims.push_back(*it);
                _sessions.erase(it);
            }

            session = std::make_shared<Session>();
            session->contextName = std::string(contextName);
            session->transport = std::move(*transport);
            _sessions.push_back(session);
        }
    }

    for (const auto& victim: victims)
        closeSession(*victim);

    return session;
}

auto ContextPool::fetchTools(Session& session) -> std::optional<std::vector<ToolDescriptor>>
{
    auto const initId = session.nextId++;
    auto const listId = session.nextId++;
    auto const requests = std::array {
        mcp::makeInitializeRequest(initId),
        mcp::makeListToolsRequest(listId),
    };

    auto result = exchange(*session.transport,
                           requests,
                           requests.size(),
                           ExchangeOptions { .timeout = _config.listTimeout, .pacing = _config.pacing });
    if (!result)
    {
        session.broken = true;
        log::warning("Failed to list tools for context '{}': {}", session.contextName, result.error().message);
        return std::nullopt;
    }
    session.broken = result->closed;

    auto const* response = result->find(listId);
    if (!response)
    {
        log::warning("Context '{}' did not answer tools/list{}",
                     session.contextName,
                     result->timedOut ? " before the timeout" : "");
        return std::nullopt;
    }

    if (response->error)
    {
        log::warning("Context '{}' rejected tools/list: {}",
                     session.contextName,
                     jsonrpc::describeError(*response->error));
        return std::nullopt;
    }

    return parseTools(*response->result);
}

void ContextPool::discardSession(const SessionPtr& session)
{
    {
        auto const lock = std::lock_guard(_mutex);
        std::erase(_sessions, session);
    }
    log::warning("Backend of context '{}' is gone, discarding its session", session->contextName);
    closeSession(*session);
}

void ContextPool::closeSession(Session& session)
{
    auto const lock = std::lock_guard(session.mutex);
    if (session.closed)
        return;

    log::info("Terminating session for context: {}", session.contextName);
    session.transport->close(_config.gracePeriod, _config.killPeriod);
    session.closed = true;
}

} // namespace envproxy
