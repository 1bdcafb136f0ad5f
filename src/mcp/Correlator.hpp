// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/Transport.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <span>

namespace envproxy
{

/// @brief Default delay between consecutive requests of one exchange.
constexpr auto DefaultPacing = std::chrono::milliseconds { 10 };

/// @brief Timing parameters for one exchange.
struct ExchangeOptions
{
    std::chrono::milliseconds timeout { 30000 };
    std::chrono::milliseconds pacing = DefaultPacing;
};

/// @brief The responses collected by one exchange, keyed by request id.
struct ExchangeResult
{
    std::map<int64_t, jsonrpc::Response> responses;

    /// @brief True if the deadline passed before all expected responses arrived.
    bool timedOut = false;

    /// @brief True if the backend's output closed before all expected responses arrived.
    bool closed = false;

    /// @brief Returns the response for the given request id, or nullptr.
    [[nodiscard]] auto find(int64_t id) const -> const jsonrpc::Response*
    {
        auto const it = responses.find(id);
        return it != responses.end() ? &it->second : nullptr;
    }
};

/// @brief Sends a batch of requests and collects their responses.
///
/// A writer thread sends the requests in order with a pacing delay between them,
/// while the calling thread reads responses and attributes them to requests by `id`.
/// Responses may arrive in any order; messages that are not responses to one of
/// the batch's requests are skipped. Returns once @p expectedResponses responses
/// have been collected, the deadline passes, or the backend's output closes;
/// the result may therefore hold fewer responses than requested.
///
/// @param transport The transport to use; must not be used by anyone else meanwhile.
/// @param requests JSON-RPC requests, each with a distinct integer id.
/// @param expectedResponses How many responses to wait for.
/// @param options Timeout and pacing.
/// @return The collected responses, or ErrorCode::WriteError if a request could not be sent.
[[nodiscard]] auto exchange(Transport& transport,
                            std::span<const nlohmann::json> requests,
                            size_t expectedResponses,
                            const ExchangeOptions& options) -> Result<ExchangeResult>;

} // namespace envproxy
