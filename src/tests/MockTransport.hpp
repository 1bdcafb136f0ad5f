// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/JsonRpc.hpp>
#include <mcp/Protocol.hpp>
#include <mcp/Transport.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace envproxy
{

/// @brief What a test can observe of a MockTransport, valid even after the transport is gone.
struct MockMonitor
{
    std::mutex mutex;
    std::vector<nlohmann::json> sent;
    std::atomic<bool> closed { false };
    std::atomic<bool> failSends { false };

    /// @brief When set, send() behaves like a backend whose input is full until the deadline.
    std::atomic<bool> stallSends { false };

    [[nodiscard]] auto sentMessages() -> std::vector<nlohmann::json>
    {
        auto const lock = std::lock_guard(mutex);
        return sent;
    }

    [[nodiscard]] auto sentCount() -> size_t
    {
        auto const lock = std::lock_guard(mutex);
        return sent.size();
    }
};

/// @brief In-memory transport whose replies are produced by a handler per sent message.
class MockTransport: public Transport
{
  public:
    using Handler = std::function<std::vector<nlohmann::json>(const nlohmann::json& message)>;

    explicit MockTransport(Handler handler = {}, std::shared_ptr<MockMonitor> monitor = std::make_shared<MockMonitor>()):
        _handler(std::move(handler)), _monitor(std::move(monitor))
    {
    }

    void setHandler(Handler handler) { _handler = std::move(handler); }

    [[nodiscard]] auto monitor() const -> std::shared_ptr<MockMonitor> { return _monitor; }

    /// @brief Queues a message as if the backend had written it unprompted.
    void push(nlohmann::json message)
    {
        {
            auto const lock = std::lock_guard(_mutex);
            _inbox.push_back(std::move(message));
        }
        _ready.notify_all();
    }

    /// @brief Simulates the backend closing its output.
    void closeOutput()
    {
        {
            auto const lock = std::lock_guard(_mutex);
            _outputClosed = true;
        }
        _ready.notify_all();
    }

    auto send(const nlohmann::json& message, Deadline deadline) -> VoidResult override
    {
        if (_monitor->stallSends)
        {
            std::this_thread::sleep_until(deadline);
            return makeError(ErrorCode::WriteError, "mock backend input is full");
        }
        if (_monitor->failSends || _monitor->closed)
            return makeError(ErrorCode::WriteError, "mock backend is not reading");

        {
            auto const lock = std::lock_guard(_monitor->mutex);
            _monitor->sent.push_back(message);
        }

        if (!_handler)
            return {};

        for (auto& reply: _handler(message))
            push(std::move(reply));
        return {};
    }

    auto receive(Deadline deadline) -> Result<nlohmann::json> override
    {
        auto lock = std::unique_lock(_mutex);
        _ready.wait_until(lock, deadline, [this] { return !_inbox.empty() || _outputClosed; });

        if (!_inbox.empty())
        {
            auto message = std::move(_inbox.front());
            _inbox.pop_front();
            return message;
        }
        if (_outputClosed)
            return makeError(ErrorCode::TransportError, "mock backend closed its output");
        return makeError(ErrorCode::TimeoutError, "mock backend did not answer");
    }

    void close(std::chrono::milliseconds /*gracePeriod*/, std::chrono::milliseconds /*killPeriod*/) override
    {
        _monitor->closed = true;
        closeOutput();
    }

    [[nodiscard]] auto isConnected() const -> bool override { return !_monitor->closed; }

  private:
    Handler _handler;
    std::shared_ptr<MockMonitor> _monitor;

    std::mutex _mutex;
    std::condition_variable _ready;
    std::deque<nlohmann::json> _inbox;
    bool _outputClosed = false;
};

/// @brief Handler of a well-behaved backend offering the given tools.
///
/// `tools/call` answers with a text result naming the tool, unless @p onCall is given.
inline auto makeBackendHandler(std::vector<std::string> toolNames,
                               std::function<nlohmann::json(const nlohmann::json& request)> onCall = {})
    -> MockTransport::Handler
{
    return [toolNames = std::move(toolNames), onCall = std::move(onCall)](const nlohmann::json& message) {
        auto replies = std::vector<nlohmann::json> {};
        if (!message.contains("id"))
            return replies;

        auto const& id = message["id"];
        auto const method = message.value("method", std::string {});
        if (method == "initialize")
        {
            replies.push_back(jsonrpc::makeResultResponse(
                id,
                nlohmann::json {
                    { "protocolVersion", mcp::ProtocolVersion },
                    { "capabilities", { { "tools", nlohmann::json::object() } } },
                    { "serverInfo", { { "name", "mock" }, { "version", "1.0" } } },
                }));
        }
        else if (method == "tools/list")
        {
            auto tools = nlohmann::json::array();
            for (const auto& name: toolNames)
            {
                tools.push_back(nlohmann::json {
                    { "name", name },
                    { "description", "Mock tool " + name },
                    { "inputSchema", { { "type", "object" } } },
                });
            }
            replies.push_back(jsonrpc::makeResultResponse(id, nlohmann::json { { "tools", std::move(tools) } }));
        }
        else if (method == "tools/call")
        {
            if (onCall)
            {
                replies.push_back(onCall(message));
            }
            else
            {
                auto const text = "called " + message["params"].value("name", std::string {});
                replies.push_back(jsonrpc::makeResultResponse(
                    id,
                    nlohmann::json {
                        { "content", nlohmann::json::array({ { { "type", "text" }, { "text", text } } }) },
                    }));
            }
        }
        return replies;
    };
}

} // namespace envproxy
