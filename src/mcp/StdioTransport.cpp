// SPDX-License-Identifier: Apache-2.0
#include "StdioTransport.hpp"

#include <core/Log.hpp>

#include <array>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <deque>
#include <format>
#include <mutex>
#include <thread>

#include <sys/wait.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace mcplink
{

namespace
{

    constexpr auto TerminateGracePeriod = std::chrono::milliseconds(2000);
    constexpr auto StderrDrainPeriod = std::chrono::milliseconds(100);

    void closeFd(int& fd)
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }

    auto makePipe(std::array<int, 2>& fds) -> bool
    {
        if (::pipe(fds.data()) != 0)
            return false;
        ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
        ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
        return true;
    }

    void ignoreSigpipe()
    {
        // A write to an exited child must surface as EPIPE instead of killing us.
        static auto once = std::once_flag {};
        std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
    }

} // namespace

struct StdioTransport::Impl
{
    StdioConfig config;

    pid_t childPid = -1;
    int stdinWrite = -1;
    int stdoutRead = -1;
    int stderrRead = -1;
    std::array<int, 2> wakePipe { -1, -1 };

    std::atomic<bool> connected = false;
    std::atomic<bool> closeRequested = false;

    std::mutex writeMutex;
    std::mutex processMutex;

    std::string readBuffer; // reader thread only
    std::string stderrBuffer;

    mutable std::mutex diagnosticsMutex;
    std::deque<std::string> diagnostics;

    void reapChild(bool terminate)
    {
        auto lock = std::lock_guard(processMutex);
        if (childPid <= 0)
            return;

        auto status = 0;
        if (terminate)
        {
            ::kill(childPid, SIGTERM);
            auto const deadline = std::chrono::steady_clock::now() + TerminateGracePeriod;
            while (::waitpid(childPid, &status, WNOHANG) == 0)
            {
                if (std::chrono::steady_clock::now() >= deadline)
                {
                    ::kill(childPid, SIGKILL);
                    ::waitpid(childPid, &status, 0);
                    break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
        }
        else if (::waitpid(childPid, &status, WNOHANG) == 0)
        {
            // Stdout closed but the process lingers; it is reaped on close().
            return;
        }

        if (WIFEXITED(status))
            log::debug("MCP server '{}' exited with status {}", config.command, WEXITSTATUS(status));
        else if (WIFSIGNALED(status))
            log::debug("MCP server '{}' terminated by signal {}", config.command, WTERMSIG(status));
        childPid = -1;
    }

    void drainStderr()
    {
        auto buf = std::array<char, 4096> {};
        auto const bytesRead = ::read(stderrRead, buf.data(), buf.size());
        if (bytesRead <= 0)
        {
            if (bytesRead == 0 || errno != EINTR)
                closeFd(stderrRead);
            return;
        }

        stderrBuffer.append(buf.data(), static_cast<size_t>(bytesRead));
        auto newlinePos = stderrBuffer.find('\n');
        while (newlinePos != std::string::npos)
        {
            auto line = stderrBuffer.substr(0, newlinePos);
            stderrBuffer.erase(0, newlinePos + 1);
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (!line.empty())
            {
                log::debug("[{} stderr] {}", config.command, line);
                auto lock = std::lock_guard(diagnosticsMutex);
                diagnostics.push_back(std::move(line));
                while (diagnostics.size() > MaxDiagnosticLines)
                    diagnostics.pop_front();
            }
            newlinePos = stderrBuffer.find('\n');
        }
    }

    /// Collects what an exited server left on stderr. Bounded, since a process
    /// the server spawned may keep the write end open long after it is gone.
    void drainRemainingStderr()
    {
        auto const deadline = std::chrono::steady_clock::now() + StderrDrainPeriod;
        while (stderrRead >= 0)
        {
            auto const remaining =
                std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0)
                break;

            auto fds = std::array<pollfd, 2> {};
            fds[0] = pollfd { .fd = stderrRead, .events = POLLIN, .revents = 0 };
            fds[1] = pollfd { .fd = wakePipe[0], .events = POLLIN, .revents = 0 };

            auto const ready = ::poll(fds.data(), fds.size(), static_cast<int>(remaining.count()));
            if (ready < 0 && errno == EINTR)
                continue;
            if (ready <= 0 || fds[1].revents != 0)
                break;
            drainStderr();
        }
    }

    void releaseDescriptors()
    {
        closeFd(stdinWrite);
        closeFd(stdoutRead);
        closeFd(stderrRead);
        closeFd(wakePipe[0]);
        closeFd(wakePipe[1]);
    }
};

StdioTransport::StdioTransport(StdioConfig config): _impl(std::make_unique<Impl>())
{
    _impl->config = std::move(config);
}

StdioTransport::~StdioTransport()
{
    close();
    _impl->releaseDescriptors();
}

auto StdioTransport::open() -> VoidResult
{
    if (_impl->connected)
        return makeError(ErrorCode::ConnectionError, "Transport already connected");
    if (_impl->config.command.empty())
        return makeError(ErrorCode::ConnectionError, "Stdio transport requires a command");

    ignoreSigpipe();

    auto stdinPipe = std::array<int, 2> { -1, -1 };
    auto stdoutPipe = std::array<int, 2> { -1, -1 };
    auto stderrPipe = std::array<int, 2> { -1, -1 };

    auto const closeAll = [&] {
        for (auto* fds: { &stdinPipe, &stdoutPipe, &stderrPipe })
        {
            closeFd((*fds)[0]);
            closeFd((*fds)[1]);
        }
    };

    if (!makePipe(stdinPipe) || !makePipe(stdoutPipe) || !makePipe(stderrPipe) || !makePipe(_impl->wakePipe))
    {
        auto const reason = std::string(std::strerror(errno));
        closeAll();
        _impl->releaseDescriptors();
        return makeError(ErrorCode::ConnectionError, std::format("Failed to create pipes: {}", reason));
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stderrPipe[1], STDERR_FILENO);

    // Build argv
    auto argv = std::vector<char*> {};
    auto cmdCopy = _impl->config.command;
    argv.push_back(cmdCopy.data());
    auto argCopies = std::vector<std::string>(_impl->config.args);
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    // Build environment (inherit + config overrides)
    auto envStrings = std::vector<std::string> {};
    if (environ)
    {
        for (auto** e = environ; *e; ++e)
        {
            auto entry = std::string_view(*e);
            auto const key = entry.substr(0, entry.find('='));
            if (!_impl->config.env.contains(std::string(key)))
                envStrings.emplace_back(entry);
        }
    }
    for (const auto& [key, value]: _impl->config.env)
        envStrings.push_back(std::format("{}={}", key, value));

    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid;
    auto const status =
        posix_spawnp(&pid, _impl->config.command.c_str(), &actions, nullptr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);

    closeFd(stdinPipe[0]);
    closeFd(stdoutPipe[1]);
    closeFd(stderrPipe[1]);

    if (status != 0)
    {
        closeAll();
        _impl->releaseDescriptors();
        return makeError(
            ErrorCode::ConnectionError,
            std::format("Failed to spawn process '{}': {}", _impl->config.command, std::strerror(status)));
    }

    {
        auto lock = std::lock_guard(_impl->processMutex);
        _impl->childPid = pid;
    }
    _impl->stdinWrite = stdinPipe[1];
    _impl->stdoutRead = stdoutPipe[0];
    _impl->stderrRead = stderrPipe[0];
    _impl->closeRequested = false;
    _impl->connected = true;

    log::info("MCP server started: {} (pid {})", _impl->config.command, pid);
    return {};
}

auto StdioTransport::send(std::string_view frame) -> Result<std::optional<std::string>>
{
    auto lock = std::lock_guard(_impl->writeMutex);
    if (!_impl->connected || _impl->stdinWrite < 0)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    auto data = std::string(frame);
    data += '\n';

    auto remaining = std::string_view(data);
    while (!remaining.empty())
    {
        auto const written = ::write(_impl->stdinWrite, remaining.data(), remaining.size());
        if (written < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::TransportError,
                             std::format("Failed to write to process stdin: {}", std::strerror(errno)));
        }
        remaining.remove_prefix(static_cast<size_t>(written));
    }

    return std::nullopt;
}

auto StdioTransport::receive() -> Result<std::optional<std::string>>
{
    if (_impl->stdoutRead < 0)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    while (true)
    {
        auto const newlinePos = _impl->readBuffer.find('\n');
        if (newlinePos != std::string::npos)
        {
            auto line = _impl->readBuffer.substr(0, newlinePos);
            _impl->readBuffer.erase(0, newlinePos + 1);

            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (line.find_first_not_of(" \t") == std::string::npos)
                continue;

            return line;
        }

        if (_impl->closeRequested)
            return std::nullopt;

        auto fds = std::array<pollfd, 3> {};
        fds[0] = pollfd { .fd = _impl->stdoutRead, .events = POLLIN, .revents = 0 };
        fds[1] = pollfd { .fd = _impl->wakePipe[0], .events = POLLIN, .revents = 0 };
        fds[2] = pollfd { .fd = _impl->stderrRead, .events = POLLIN, .revents = 0 }; // ignored when -1

        if (::poll(fds.data(), fds.size(), -1) < 0)
        {
            if (errno == EINTR)
                continue;
            _impl->connected = false;
            return makeError(ErrorCode::TransportError, std::format("poll failed: {}", std::strerror(errno)));
        }

        if (fds[1].revents != 0)
            return std::nullopt;

        if (fds[2].revents != 0)
            _impl->drainStderr();

        if (fds[0].revents == 0)
            continue;

        auto buf = std::array<char, 4096> {};
        auto const bytesRead = ::read(_impl->stdoutRead, buf.data(), buf.size());
        if (bytesRead < 0)
        {
            if (errno == EINTR)
                continue;
            _impl->connected = false;
            return makeError(ErrorCode::TransportError,
                             std::format("Failed to read process stdout: {}", std::strerror(errno)));
        }
        if (bytesRead == 0)
        {
            _impl->connected = false;
            _impl->drainRemainingStderr();
            _impl->reapChild(false);
            log::debug("MCP server '{}' closed its stdout", _impl->config.command);
            return std::nullopt;
        }
        _impl->readBuffer.append(buf.data(), static_cast<size_t>(bytesRead));
    }
}

void StdioTransport::close()
{
    if (_impl->closeRequested.exchange(true))
        return;

    _impl->connected = false;

    if (_impl->wakePipe[1] >= 0)
    {
        auto const wakeByte = char { 1 };
        (void) !::write(_impl->wakePipe[1], &wakeByte, 1);
    }

    {
        auto lock = std::lock_guard(_impl->writeMutex);
        closeFd(_impl->stdinWrite);
    }

    _impl->reapChild(true);
    log::debug("MCP stdio transport closed ({})", _impl->config.command);
}

auto StdioTransport::isOpen() const -> bool
{
    return _impl->connected;
}

auto StdioTransport::diagnostics() const -> std::vector<std::string>
{
    auto lock = std::lock_guard(_impl->diagnosticsMutex);
    return { _impl->diagnostics.begin(), _impl->diagnostics.end() };
}

} // namespace mcplink
