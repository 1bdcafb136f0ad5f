// SPDX-License-Identifier: Apache-2.0
#include "Correlator.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <set>
#include <thread>

namespace envproxy
{

namespace
{

    /// @brief Upper bound for a single blocking read, so a failed writer is noticed promptly.
    constexpr auto ReadSlice = std::chrono::milliseconds { 100 };

} // namespace

auto exchange(Transport& transport,
              std::span<const nlohmann::json> requests,
              size_t expectedResponses,
              const ExchangeOptions& options) -> Result<ExchangeResult>
{
    auto const deadline = Clock::now() + options.timeout;

    auto pendingIds = std::set<int64_t> {};
    for (const auto& request: requests)
    {
        if (request.contains("id") && request["id"].is_number_integer())
            pendingIds.insert(request["id"].get<int64_t>());
    }
    expectedResponses = std::min(expectedResponses, pendingIds.size());

    auto mutex = std::mutex {};
    auto wakeup = std::condition_variable_any {};
    auto writeError = std::optional<Error> {};
    auto writeFailed = std::atomic<bool> { false };

    auto writer = std::jthread([&](const std::stop_token& stopToken) {
        for (auto i = size_t { 0 }; i < requests.size(); ++i)
        {
            if (i > 0 && options.pacing.count() > 0)
            {
                auto lock = std::unique_lock(mutex);
                wakeup.wait_for(lock, stopToken, options.pacing, [] { return false; });
            }
            if (stopToken.stop_requested())
                return;

            auto sent = transport.send(requests[i], deadline);
            if (!sent)
            {
                auto const lock = std::lock_guard(mutex);
                writeError = sent.error();
                writeFailed.store(true);
                return;
            }
        }
    });

    auto result = ExchangeResult {};
    while (result.responses.size() < expectedResponses && !writeFailed.load())
    {
        auto const sliceEnd = std::min(deadline, Clock::now() + ReadSlice);
        auto message = transport.receive(sliceEnd);
        if (!message)
        {
            if (message.error().code == ErrorCode::TimeoutError)
            {
                if (Clock::now() < deadline)
                    continue;
                result.timedOut = true;
                log::debug("Exchange timed out with {}/{} responses", result.responses.size(), expectedResponses);
                break;
            }
            log::debug("Exchange ended early: {}", message.error().message);
            result.closed = true;
            break;
        }

        auto response = jsonrpc::parseResponse(*message);
        if (!response)
        {
            log::debug("Skipping non-response message: {}", response.error().message);
            continue;
        }

        auto const id = response->numericId();
        if (!id || !pendingIds.contains(*id) || result.responses.contains(*id))
        {
            log::debug("Skipping response with unexpected id {}", response->id.dump());
            continue;
        }

        result.responses.emplace(*id, std::move(*response));
    }

    writer.request_stop();
    wakeup.notify_all();
    writer.join();

    if (writeError)
        return std::unexpected(*writeError);

    return result;
}

} // namespace envproxy
