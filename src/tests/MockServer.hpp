// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/JsonRpc.hpp>
#include <mcp/ServerConnection.hpp>
#include <mcp/Transport.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace mcplink::test
{

/// @brief One open session of a MockTransport. The server answers into its inbox.
struct MockChannel
{
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::string> inbox;
    bool closed = false;

    void push(const nlohmann::json& message)
    {
        {
            auto lock = std::lock_guard(mutex);
            if (closed)
                return;
            inbox.push_back(jsonrpc::encode(message));
        }
        cv.notify_all();
    }

    void close()
    {
        {
            auto lock = std::lock_guard(mutex);
            closed = true;
        }
        cv.notify_all();
    }
};

/// @brief In-process MCP server answering over MockTransport.
///
/// Survives reconnects: every transport created by factory() talks to the same
/// server, so tests can change its catalog or behavior between sessions.
class MockServer
{
  public:
    void setTools(std::vector<std::string> names)
    {
        auto lock = std::lock_guard(_mutex);
        _toolNames = std::move(names);
    }

    /// Fails the next @p count open() calls; -1 fails them all.
    void failOpens(int count)
    {
        auto lock = std::lock_guard(_mutex);
        _failOpens = count;
    }

    void holdToolCalls(bool hold)
    {
        auto lock = std::lock_guard(_mutex);
        _holdToolCalls = hold;
    }

    void answerPings(bool answer)
    {
        auto lock = std::lock_guard(_mutex);
        _answerPings = answer;
    }

    /// Closes the current session as if the server process died.
    void dropConnection()
    {
        auto lock = std::lock_guard(_mutex);
        if (_current)
            _current->close();
        _held.clear();
    }

    /// Answers the held tools/call request at @p index.
    void releaseHeld(std::size_t index)
    {
        auto lock = std::lock_guard(_mutex);
        auto const request = _held.at(index);
        _held.erase(_held.begin() + static_cast<std::ptrdiff_t>(index));
        if (_current)
            _current->push(answerToolCall(request));
    }

    [[nodiscard]] auto heldCount() const -> std::size_t
    {
        auto lock = std::lock_guard(_mutex);
        return _held.size();
    }

    [[nodiscard]] auto opens() const -> int
    {
        auto lock = std::lock_guard(_mutex);
        return _opens;
    }

    [[nodiscard]] auto methods() const -> std::vector<std::string>
    {
        auto lock = std::lock_guard(_mutex);
        return _methods;
    }

    [[nodiscard]] auto countMethod(const std::string& method) const -> std::size_t
    {
        auto lock = std::lock_guard(_mutex);
        return static_cast<std::size_t>(std::count(_methods.begin(), _methods.end(), method));
    }

    auto open(const std::shared_ptr<MockChannel>& channel) -> VoidResult
    {
        auto lock = std::lock_guard(_mutex);
        ++_opens;
        if (_failOpens != 0)
        {
            if (_failOpens > 0)
                --_failOpens;
            return makeError(ErrorCode::ConnectionError, "mock server refused the connection");
        }
        _current = channel;
        return {};
    }

    void receive(const std::shared_ptr<MockChannel>& channel, std::string_view frame)
    {
        auto message = jsonrpc::decode(frame);
        if (!message || !std::holds_alternative<jsonrpc::Request>(*message))
            return;

        auto const& request = std::get<jsonrpc::Request>(*message);

        auto lock = std::lock_guard(_mutex);
        _methods.push_back(request.method);

        if (request.method == "initialize")
        {
            channel->push(jsonrpc::makeResult(
                request.id,
                { { "protocolVersion", "2024-11-05" },
                  { "capabilities", { { "tools", nlohmann::json::object() } } },
                  { "serverInfo", { { "name", "mock" }, { "version", "9.9" } } } }));
        }
        else if (request.method == "tools/list")
        {
            auto tools = nlohmann::json::array();
            for (auto const& name: _toolNames)
                tools.push_back({ { "name", name },
                                  { "description", "Mock tool " + name },
                                  { "inputSchema", { { "type", "object" }, { "properties", nlohmann::json::object() } } } });
            channel->push(jsonrpc::makeResult(request.id, { { "tools", tools } }));
        }
        else if (request.method == "ping")
        {
            if (_answerPings)
                channel->push(jsonrpc::makeResult(request.id, nlohmann::json::object()));
        }
        else if (request.method == "tools/call")
        {
            if (_holdToolCalls)
                _held.push_back(request);
            else
                channel->push(answerToolCall(request));
        }
    }

    /// Tool "fail" yields a JSON-RPC error, "broken" an isError result; any
    /// other tool echoes its "tag" argument as text.
    [[nodiscard]] static auto answerToolCall(const jsonrpc::Request& request) -> nlohmann::json
    {
        auto const name = request.params.value("name", std::string {});
        auto const arguments = request.params.value("arguments", nlohmann::json::object());

        if (name == "fail")
            return jsonrpc::makeErrorResponse(request.id, jsonrpc::codes::InternalError, "tool exploded");

        auto text = name == "broken" ? std::string("disk full") : arguments.value("tag", name);
        auto result = nlohmann::json {
            { "content", nlohmann::json::array({ { { "type", "text" }, { "text", text } } }) },
        };
        if (name == "broken")
            result["isError"] = true;
        return jsonrpc::makeResult(request.id, std::move(result));
    }

    [[nodiscard]] auto factory(const std::shared_ptr<MockServer>& self) -> TransportFactory;

  private:
    mutable std::mutex _mutex;
    std::vector<std::string> _toolNames { "echo" };
    int _failOpens = 0;
    bool _holdToolCalls = false;
    bool _answerPings = true;
    int _opens = 0;
    std::vector<std::string> _methods;
    std::vector<jsonrpc::Request> _held;
    std::shared_ptr<MockChannel> _current;
};

/// @brief Stream transport wired to a MockServer.
class MockTransport: public Transport
{
  public:
    explicit MockTransport(std::shared_ptr<MockServer> server): _server(std::move(server)) {}

    ~MockTransport() override { _channel->close(); }

    auto open() -> VoidResult override
    {
        auto opened = _server->open(_channel);
        _open = opened.has_value();
        return opened;
    }

    auto send(std::string_view frame) -> Result<std::optional<std::string>> override
    {
        {
            auto lock = std::lock_guard(_channel->mutex);
            if (_channel->closed)
                return makeError(ErrorCode::TransportError, "mock channel closed");
        }
        _server->receive(_channel, frame);
        return std::nullopt;
    }

    auto receive() -> Result<std::optional<std::string>> override
    {
        auto lock = std::unique_lock(_channel->mutex);
        _channel->cv.wait(lock, [this] { return _channel->closed || !_channel->inbox.empty(); });
        if (_channel->closed)
            return std::nullopt;
        auto frame = std::move(_channel->inbox.front());
        _channel->inbox.pop_front();
        return std::optional<std::string> { std::move(frame) };
    }

    void close() override
    {
        _open = false;
        _channel->close();
    }

    [[nodiscard]] auto isOpen() const -> bool override { return _open; }

  private:
    std::shared_ptr<MockServer> _server;
    std::shared_ptr<MockChannel> _channel = std::make_shared<MockChannel>();
    std::atomic<bool> _open = false;
};

inline auto MockServer::factory(const std::shared_ptr<MockServer>& self) -> TransportFactory
{
    return [self](const ServerDescriptor&) -> std::unique_ptr<Transport> { return std::make_unique<MockTransport>(self); };
}

/// @brief Polls @p predicate until it holds or @p timeout elapses.
template <typename Predicate>
auto eventually(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::seconds(5)) -> bool
{
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    while (!predicate())
    {
        if (std::chrono::steady_clock::now() >= deadline)
            return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

/// @brief Connection options with fast, deterministic reconnects.
inline auto fastOptions(int maxAttempts = 3) -> ConnectionOptions
{
    return ConnectionOptions {
        .requestTimeout = std::chrono::seconds(5),
        .initializeTimeout = std::chrono::seconds(5),
        .reconnect = { .baseDelay = std::chrono::milliseconds(10),
                       .maxDelay = std::chrono::milliseconds(50),
                       .maxAttempts = maxAttempts,
                       .jitter = 0.0 },
    };
}

inline auto mockDescriptor(std::string name) -> ServerDescriptor
{
    return ServerDescriptor { .name = std::move(name), .transport = StdioConfig { .command = "unused" } };
}

} // namespace mcplink::test
