// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>
#include <mcp/Transport.hpp>

#include <memory>

namespace envproxy
{

/// @brief Transport that communicates with a backend server via stdio pipes.
///
/// Spawns a child process and exchanges newline-delimited JSON over its stdin/stdout.
/// The child's stderr is drained on a background thread and logged, never parsed.
class StdioTransport: public Transport
{
  public:
    StdioTransport();
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    /// @brief Spawns a backend and returns a connected transport.
    /// @param spec Command, arguments and the complete child environment.
    /// @return The transport, or ErrorCode::SpawnError.
    [[nodiscard]] static auto open(const LaunchSpec& spec) -> Result<std::unique_ptr<Transport>>;

    /// @brief Starts the backend process.
    /// @param spec Command, arguments and the complete child environment.
    /// @return Success, or ErrorCode::SpawnError.
    [[nodiscard]] auto start(const LaunchSpec& spec) -> VoidResult;

    [[nodiscard]] auto send(const nlohmann::json& message, Deadline deadline) -> VoidResult override;
    [[nodiscard]] auto receive(Deadline deadline) -> Result<nlohmann::json> override;
    void close(std::chrono::milliseconds gracePeriod, std::chrono::milliseconds killPeriod) override;
    [[nodiscard]] auto isConnected() const -> bool override;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace envproxy
