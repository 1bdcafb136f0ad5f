// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/Transport.hpp>
#include <proxy/ContextCatalog.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace envproxy
{

/// @brief Creates the transport for a new session.
using TransportFactory = std::function<Result<std::unique_ptr<Transport>>(const LaunchSpec& spec)>;

/// @brief Pool limits and timing.
struct PoolConfig
{
    size_t maxSessions = 5;
    std::chrono::milliseconds listTimeout { 30000 };
    std::chrono::milliseconds callTimeout { 120000 };
    std::chrono::milliseconds pacing { 10 };
    std::chrono::milliseconds gracePeriod = DefaultGracePeriod;
    std::chrono::milliseconds killPeriod = DefaultKillPeriod;
};

/// @brief What activating a context yields.
struct ContextInfo
{
    std::string name;
    std::string server;
    EnvironmentMap overrides;
    std::optional<std::string> description;
    std::vector<ToolDescriptor> tools;
};

/// @brief Point-in-time view of one configured context.
struct ContextSummary
{
    std::string name;
    std::string server;
    std::string commandLine;
    EnvironmentMap overrides;
    std::optional<std::string> description;
    bool isCurrent = false;
    bool isLoaded = false;
    bool hasCachedTools = false;
};

/// @brief Keeps backend sessions keyed by context name, bounded in number.
///
/// At most one session exists per context and at most one exchange runs per
/// session at a time. When a new session would exceed the limit, the oldest
/// session that is not the current context is evicted. The pool lock is never
/// held across a backend round trip, so a slow backend only blocks callers of
/// its own context.
class ContextPool
{
  public:
    /// @brief Constructs the pool.
    /// @param catalog The server and context tables.
    /// @param config Limits and timing.
    /// @param factory Creates backend transports; spawns a StdioTransport by default.
    /// @param initialContext Context to treat as current before any activation (no session is started).
    ContextPool(ContextCatalog catalog,
                PoolConfig config,
                TransportFactory factory = {},
                std::optional<std::string> initialContext = std::nullopt);
    ~ContextPool();

    ContextPool(const ContextPool&) = delete;
    ContextPool& operator=(const ContextPool&) = delete;

    /// @brief Makes a context current, starting its session if needed.
    /// @param contextName The context to activate.
    /// @return The context with its tools, or UnknownContextError, UnknownServerError or SpawnError.
    [[nodiscard]] auto activate(std::string_view contextName) -> Result<ContextInfo>;

    /// @brief Returns the tools of a context, fetching them on first use.
    ///
    /// A backend that fails or does not answer in time yields an empty list.
    /// @param contextName The context, or the current one when omitted.
    /// @return The tools (empty if no context is current), or a configuration/spawn error.
    [[nodiscard]] auto listTools(std::optional<std::string_view> contextName = std::nullopt)
        -> Result<std::vector<ToolDescriptor>>;

    /// @brief Calls a tool on the current context's backend.
    /// @param toolName The tool name.
    /// @param arguments The tool arguments.
    /// @return The backend's result verbatim, or NoActiveContextError, ToolInvocationError,
    ///         NoResponseError, WriteError, SpawnError.
    [[nodiscard]] auto invoke(std::string_view toolName, const nlohmann::json& arguments) -> Result<nlohmann::json>;

    /// @brief Summarizes every configured context.
    [[nodiscard]] auto describe() const -> std::vector<ContextSummary>;

    /// @brief Drops the cached tools of a context so the next listing fetches them again.
    void invalidateTools(std::string_view contextName);

    /// @brief Closes every session. The current context is kept and restarted lazily.
    void shutdown();

    [[nodiscard]] auto currentContext() const -> std::optional<std::string>;
    [[nodiscard]] auto liveSessionCount() const -> size_t;
    [[nodiscard]] auto hasSession(std::string_view contextName) const -> bool;
    [[nodiscard]] auto catalog() const -> const ContextCatalog&;
    [[nodiscard]] auto config() const -> const PoolConfig&;

  private:
    struct Session;
    using SessionPtr = std::shared_ptr<Session>;

    ContextCatalog _catalog;
    PoolConfig _config;
    TransportFactory _factory;

    mutable std::mutex _mutex;
    std::vector<SessionPtr> _sessions; // insertion order, oldest first
    std::optional<std::string> _current;

    [[nodiscard]] auto findLocked(std::string_view contextName) const -> SessionPtr;
    [[nodiscard]] auto acquireSession(std::string_view contextName) -> Result<SessionPtr>;

    template <typename Fn>
    auto withSession(std::string_view contextName, Fn&& fn) -> std::invoke_result_t<Fn, Session&>;

    [[nodiscard]] auto fetchTools(Session& session) -> std::optional<std::vector<ToolDescriptor>>;
    void discardSession(const SessionPtr& session);
    void closeSession(Session& session);
};

} // namespace envproxy
