// SPDX-License-Identifier: Apache-2.0
#include "StdioTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <climits>
#include <cstring>
#include <format>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <sys/wait.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>

namespace envproxy
{

namespace
{

    constexpr auto ExitPollInterval = std::chrono::milliseconds { 10 };
    constexpr auto StderrPollTimeoutMs = 100;

    void closeFd(int& fd)
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }

    /// @brief Writing to a pipe whose reader is gone must fail with EPIPE, not kill the proxy.
    void ignoreSigpipe()
    {
        static auto once = std::once_flag {};
        std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
    }

    auto trim(std::string_view text) -> std::string_view
    {
        auto const first = text.find_first_not_of(" \t\r");
        if (first == std::string_view::npos)
            return {};
        auto const last = text.find_last_not_of(" \t\r");
        return text.substr(first, last - first + 1);
    }

} // namespace

struct StdioTransport::Impl
{
    pid_t childPid = -1;
    int stdinWrite = -1;
    int stdoutRead = -1;
    int stderrRead = -1;
    std::atomic<bool> connected { false };
    bool stdoutClosed = false;
    std::string readBuffer;
    std::string tag;
    std::jthread stderrDrain;
    std::mutex stdinMutex;
    std::mutex lifecycleMutex;

    /// @brief Collects the child's exit status if it has exited.
    /// @return True once the child is gone.
    auto reap() -> bool
    {
        if (childPid <= 0)
            return true;

        auto status = 0;
        auto const rc = ::waitpid(childPid, &status, WNOHANG);
        if (rc == 0)
            return false;
        if (rc < 0 && errno == EINTR)
            return false;

        if (rc == childPid && WIFEXITED(status))
            log::debug("Backend '{}' (pid {}) exited with status {}", tag, childPid, WEXITSTATUS(status));
        else if (rc == childPid && WIFSIGNALED(status))
            log::debug("Backend '{}' (pid {}) terminated by signal {}", tag, childPid, WTERMSIG(status));

        childPid = -1;
        return true;
    }

    /// @brief Polls for the child's exit for at most the given period.
    auto waitForExit(std::chrono::milliseconds period) -> bool
    {
        auto const deadline = Clock::now() + period;
        while (!reap())
        {
            if (Clock::now() >= deadline)
                return false;
            std::this_thread::sleep_for(ExitPollInterval);
        }
        return true;
    }

    /// @brief Reads the child's stderr line by line and logs it.
    static void drainStderr(const std::stop_token& stopToken, int fd, const std::string& tag)
    {
        auto pending = std::string {};
        auto buf = std::array<char, 4096> {};

        auto const flushLines = [&] {
            auto pos = pending.find('\n');
            while (pos != std::string::npos)
            {
                auto const line = trim(std::string_view(pending).substr(0, pos));
                if (!line.empty())
                    log::debug("[{} stderr] {}", tag, line);
                pending.erase(0, pos + 1);
                pos = pending.find('\n');
            }
        };

        while (!stopToken.stop_requested())
        {
            auto pfd = pollfd { .fd = fd, .events = POLLIN, .revents = 0 };
            auto const rc = ::poll(&pfd, 1, StderrPollTimeoutMs);
            if (rc == 0)
                continue;
            if (rc < 0)
            {
                if (errno == EINTR)
                    continue;
                break;
            }

            auto const bytesRead = ::read(fd, buf.data(), buf.size());
            if (bytesRead < 0 && errno == EINTR)
                continue;
            if (bytesRead <= 0)
                break;

            pending.append(buf.data(), static_cast<size_t>(bytesRead));
            flushLines();
        }

        if (!trim(pending).empty())
            log::debug("[{} stderr] {}", tag, trim(pending));
    }
};

StdioTransport::StdioTransport(): _impl(std::make_unique<Impl>())
{
}

StdioTransport::~StdioTransport()
{
    close(DefaultGracePeriod, DefaultKillPeriod);
}

auto StdioTransport::open(const LaunchSpec& spec) -> Result<std::unique_ptr<Transport>>
{
    auto transport = std::make_unique<StdioTransport>();
    auto startResult = transport->start(spec);
    if (!startResult)
        return std::unexpected(startResult.error());
    return std::unique_ptr<Transport>(std::move(transport));
}

auto StdioTransport::start(const LaunchSpec& spec) -> VoidResult
{
    if (_impl->connected)
        return makeError(ErrorCode::SpawnError, "Transport already connected");

    ignoreSigpipe();

    // All pipe ends are close-on-exec so no other backend inherits them;
    // dup2 onto 0/1/2 clears the flag for the child's own ends.
    int stdinPipe[2] = { -1, -1 };
    int stdoutPipe[2] = { -1, -1 };
    int stderrPipe[2] = { -1, -1 };

    auto const closePipes = [&] {
        for (auto* p: { stdinPipe, stdoutPipe, stderrPipe })
        {
            closeFd(p[0]);
            closeFd(p[1]);
        }
    };

    if (::pipe2(stdinPipe, O_CLOEXEC) != 0 || ::pipe2(stdoutPipe, O_CLOEXEC) != 0
        || ::pipe2(stderrPipe, O_CLOEXEC) != 0)
    {
        auto const err = errno;
        closePipes();
        return makeError(ErrorCode::SpawnError, std::format("Failed to create pipes: {}", strerror(err)));
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stderrPipe[1], STDERR_FILENO);

    // The proxy ignores SIGPIPE; the backend gets the default disposition back.
    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);
    sigset_t defaultSignals;
    sigemptyset(&defaultSignals);
    sigaddset(&defaultSignals, SIGPIPE);
    posix_spawnattr_setsigdefault(&attr, &defaultSignals);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETSIGDEF);

    // Build argv
    auto argv = std::vector<char*> {};
    auto cmdCopy = spec.command;
    argv.push_back(cmdCopy.data());
    auto argCopies = std::vector<std::string>(spec.args);
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    // The environment is passed complete, nothing is inherited implicitly.
    auto envStrings = std::vector<std::string> {};
    envStrings.reserve(spec.environment.size());
    for (const auto& [key, value]: spec.environment)
        envStrings.push_back(std::format("{}={}", key, value));

    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid = -1;
    auto const status = posix_spawnp(&pid, spec.command.c_str(), &actions, &attr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attr);

    closeFd(stdinPipe[0]);
    closeFd(stdoutPipe[1]);
    closeFd(stderrPipe[1]);

    if (status != 0)
    {
        closePipes();
        return makeError(ErrorCode::SpawnError,
                         std::format("Failed to spawn process '{}': {}", spec.command, strerror(status)));
    }

    // Non-blocking so a backend that stops reading cannot stall send() past its deadline.
    ::fcntl(stdinPipe[1], F_SETFL, ::fcntl(stdinPipe[1], F_GETFL) | O_NONBLOCK);

    _impl->childPid = pid;
    _impl->stdinWrite = stdinPipe[1];
    _impl->stdoutRead = stdoutPipe[0];
    _impl->stderrRead = stderrPipe[0];
    _impl->stdoutClosed = false;
    _impl->readBuffer.clear();
    _impl->tag = spec.command;
    _impl->stderrDrain = std::jthread([fd = _impl->stderrRead, tag = _impl->tag](const std::stop_token& token) {
        Impl::drainStderr(token, fd, tag);
    });

    _impl->connected = true;
    log::info("Backend started: {} (pid {})", spec.command, pid);
    return {};
}

auto StdioTransport::send(const nlohmann::json& message, Deadline deadline) -> VoidResult
{
    if (!_impl->connected)
        return makeError(ErrorCode::WriteError, "Transport not connected");

    auto const data = message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";

    auto const lock = std::lock_guard(_impl->stdinMutex);
    if (_impl->stdinWrite < 0)
        return makeError(ErrorCode::WriteError, "Backend stdin is closed");

    auto offset = size_t { 0 };
    while (offset < data.size())
    {
        auto const written = ::write(_impl->stdinWrite, data.data() + offset, data.size() - offset);
        if (written < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK)
            {
                auto const remaining =
                    std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
                if (remaining <= 0)
                    return makeError(ErrorCode::WriteError,
                                     std::format("Backend '{}' is not reading its input", _impl->tag));

                auto pfd = pollfd { .fd = _impl->stdinWrite, .events = POLLOUT, .revents = 0 };
                auto const rc = ::poll(&pfd, 1, static_cast<int>(std::min<long long>(remaining, INT_MAX)));
                if (rc > 0 || (rc < 0 && errno == EINTR))
                    continue;
                return makeError(ErrorCode::WriteError,
                                 std::format("Backend '{}' is not reading its input", _impl->tag));
            }
            return makeError(ErrorCode::WriteError,
                             std::format("Failed to write to backend '{}': {}", _impl->tag, strerror(errno)));
        }
        offset += static_cast<size_t>(written);
    }

    log::trace("[{}] -> {}", _impl->tag, std::string_view(data).substr(0, data.size() - 1));
    return {};
}

auto StdioTransport::receive(Deadline deadline) -> Result<nlohmann::json>
{
    if (_impl->stdoutRead < 0)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    // Read until we get a complete line that holds a JSON object
    while (true)
    {
        auto const newlinePos = _impl->readBuffer.find('\n');
        if (newlinePos != std::string::npos)
        {
            auto const line = std::string(trim(std::string_view(_impl->readBuffer).substr(0, newlinePos)));
            _impl->readBuffer.erase(0, newlinePos + 1);

            if (line.empty())
                continue;

            if (line.front() != '{')
            {
                log::debug("[{}] ignoring non-protocol output: {}", _impl->tag, line);
                continue;
            }

            auto parsed = json::parse(line);
            if (!parsed || !parsed->is_object())
            {
                log::debug("[{}] ignoring malformed line: {}", _impl->tag, line);
                continue;
            }

            log::trace("[{}] <- {}", _impl->tag, line);
            return std::move(*parsed);
        }

        if (_impl->stdoutClosed)
            return makeError(ErrorCode::TransportError, std::format("Backend '{}' closed its output", _impl->tag));

        auto const remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (remaining.count() <= 0)
            return makeError(ErrorCode::TimeoutError, "Timed out waiting for backend output");

        auto pfd = pollfd { .fd = _impl->stdoutRead, .events = POLLIN, .revents = 0 };
        auto const rc = ::poll(&pfd, 1, static_cast<int>(std::min<long long>(remaining.count(), INT_MAX)));
        if (rc == 0)
            continue;
        if (rc < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::TransportError, std::format("poll failed: {}", strerror(errno)));
        }

        auto buf = std::array<char, 4096> {};
        auto const bytesRead = ::read(_impl->stdoutRead, buf.data(), buf.size());
        if (bytesRead < 0 && errno == EINTR)
            continue;
        if (bytesRead <= 0)
        {
            // A trailing line without newline is still a line.
            _impl->stdoutClosed = true;
            if (!_impl->readBuffer.empty())
                _impl->readBuffer.push_back('\n');
            continue;
        }
        _impl->readBuffer.append(buf.data(), static_cast<size_t>(bytesRead));
    }
}

void StdioTransport::close(std::chrono::milliseconds gracePeriod, std::chrono::milliseconds killPeriod)
{
    auto const lifecycle = std::lock_guard(_impl->lifecycleMutex);

    if (_impl->childPid < 0 && _impl->stdinWrite < 0 && _impl->stdoutRead < 0 && _impl->stderrRead < 0)
        return;

    _impl->connected = false;

    // Closing stdin is the cooperative shutdown request.
    {
        auto const lock = std::lock_guard(_impl->stdinMutex);
        closeFd(_impl->stdinWrite);
    }

    if (!_impl->waitForExit(gracePeriod))
    {
        log::debug("Backend '{}' still running after closing stdin, sending SIGTERM", _impl->tag);
        ::kill(_impl->childPid, SIGTERM);

        if (!_impl->waitForExit(killPeriod))
        {
            log::warning("Backend '{}' (pid {}) ignored SIGTERM, killing it", _impl->tag, _impl->childPid);
            ::kill(_impl->childPid, SIGKILL);

            auto status = 0;
            while (::waitpid(_impl->childPid, &status, 0) < 0 && errno == EINTR)
            {
            }
            _impl->childPid = -1;
        }
    }

    closeFd(_impl->stdoutRead);
    if (_impl->stderrDrain.joinable())
    {
        _impl->stderrDrain.request_stop();
        _impl->stderrDrain.join();
    }
    closeFd(_impl->stderrRead);
    _impl->readBuffer.clear();

    log::debug("Backend transport closed: {}", _impl->tag);
}

auto StdioTransport::isConnected() const -> bool
{
    return _impl->connected;
}

} // namespace envproxy
