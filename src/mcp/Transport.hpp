// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <chrono>

namespace envproxy
{

using Clock = std::chrono::steady_clock;
using Deadline = Clock::time_point;

/// @brief Default time a backend gets to exit after its input is closed.
constexpr auto DefaultGracePeriod = std::chrono::milliseconds { 2000 };

/// @brief Default time a backend gets to exit after SIGTERM before it is killed.
constexpr auto DefaultKillPeriod = std::chrono::milliseconds { 2000 };

/// @brief Abstract interface for line-delimited JSON-RPC communication with one backend.
///
/// send() and receive() may be used concurrently by one writer and one reader thread.
class Transport
{
  public:
    virtual ~Transport() = default;

    /// @brief Sends a JSON message to the backend as a single line.
    /// @param message The JSON message to send.
    /// @param deadline The point in time after which a backend that is not reading is given up on.
    /// @return Success, or ErrorCode::WriteError if the backend's input is closed or stays full.
    [[nodiscard]] virtual auto send(const nlohmann::json& message, Deadline deadline) -> VoidResult = 0;

    /// @brief Receives the next JSON object from the backend.
    ///
    /// Lines that are not JSON objects are discarded.
    /// @param deadline The point in time after which to give up.
    /// @return The received object, ErrorCode::TimeoutError when the deadline passed,
    ///         or ErrorCode::TransportError when the output stream closed.
    [[nodiscard]] virtual auto receive(Deadline deadline) -> Result<nlohmann::json> = 0;

    /// @brief Shuts the backend down: close input, wait, terminate, wait, kill.
    ///
    /// Always returns once the backend is gone. Safe to call repeatedly.
    /// @param gracePeriod How long to wait for a cooperative exit after closing input.
    /// @param killPeriod How long to wait after the termination signal before killing.
    virtual void close(std::chrono::milliseconds gracePeriod, std::chrono::milliseconds killPeriod) = 0;

    /// @brief Returns true if the transport is connected.
    [[nodiscard]] virtual auto isConnected() const -> bool = 0;
};

} // namespace envproxy
