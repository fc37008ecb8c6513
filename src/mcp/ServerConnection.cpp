// SPDX-License-Identifier: Apache-2.0
#include "ServerConnection.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/ToolSchema.hpp>

#include <atomic>
#include <condition_variable>
#include <future>
#include <map>
#include <mutex>
#include <stop_token>
#include <thread>
#include <utility>

namespace mcplink
{

namespace
{

    constexpr auto ProtocolVersion = std::string_view("2024-11-05");
    constexpr auto ClientName = std::string_view("mcplink");
    constexpr auto ClientVersion = std::string_view("0.1.0");

    /// @brief A request awaiting its reply.
    struct PendingCall
    {
        int64_t id = 0;
        std::string method;
        std::chrono::steady_clock::time_point issuedAt;
        std::promise<Result<jsonrpc::Response>> promise;
    };

    auto rpcErrorText(const jsonrpc::RpcError& error) -> std::string
    {
        return std::format("{} (code {})", error.message, error.code);
    }

} // namespace

struct ServerConnection::Impl
{
    ServerDescriptor descriptor;
    ToolRegistry& registry;
    ConnectionOptions options;
    TransportFactory factory;
    ConnectionEvents events;

    mutable std::mutex stateMutex;
    mutable std::condition_variable_any stateChanged;
    ConnectionState state = ConnectionState::Disconnected;
    bool lossPending = false;
    int completedAttempts = 0;
    std::optional<ServerCapabilities> capabilities;

    std::mutex transportMutex;
    std::shared_ptr<Transport> transport;
    std::jthread reader;

    mutable std::mutex pendingMutex;
    std::map<int64_t, std::shared_ptr<PendingCall>> pending;
    std::atomic<bool> closing = false;
    jsonrpc::IdGenerator ids;

    std::atomic<bool> stopped = false;
    std::jthread supervisor;

    Impl(ServerDescriptor descriptor,
         ToolRegistry& registry,
         ConnectionOptions options,
         TransportFactory factory,
         ConnectionEvents events):
        descriptor(std::move(descriptor)),
        registry(registry),
        options(options),
        factory(std::move(factory)),
        events(std::move(events))
    {
        if (!this->factory)
        {
            auto const timeout = this->options.requestTimeout;
            this->factory = [timeout](const ServerDescriptor& d) { return makeTransport(d, timeout); };
        }
    }

    [[nodiscard]] auto name() const -> const std::string& { return descriptor.name; }

    // {{{ state

    void announce(ConnectionState from, ConnectionState to, const std::string& reason)
    {
        stateChanged.notify_all();

        if (reason.empty())
            log::info("[{}] {} -> {}", name(), from, to);
        else if (to == ConnectionState::Degraded || to == ConnectionState::Closed)
            log::warning("[{}] {} -> {}: {}", name(), from, to, reason);
        else
            log::info("[{}] {} -> {}: {}", name(), from, to, reason);

        if (events.onStateChanged)
            events.onStateChanged(from, to, reason);
    }

    void setState(ConnectionState to, const std::string& reason = {})
    {
        auto from = ConnectionState::Disconnected;
        {
            auto lock = std::lock_guard(stateMutex);
            if (state == to)
                return;
            from = std::exchange(state, to);
        }
        announce(from, to, reason);
    }

    [[nodiscard]] auto currentState() const -> ConnectionState
    {
        auto lock = std::lock_guard(stateMutex);
        return state;
    }

    /// Called on any sign of a dead channel. Only a Ready connection becomes
    /// Degraded, so concurrent reporters cause a single transition.
    void markLost(const std::string& reason)
    {
        auto from = ConnectionState::Disconnected;
        auto degraded = false;
        {
            auto lock = std::lock_guard(stateMutex);
            lossPending = true;
            if (state == ConnectionState::Ready)
            {
                from = std::exchange(state, ConnectionState::Degraded);
                degraded = true;
            }
        }
        stateChanged.notify_all();

        if (degraded)
            announce(from, ConnectionState::Degraded, reason);

        failAllPending(ErrorCode::ConnectionLostError, std::format("Connection to '{}' lost: {}", name(), reason));
        closeTransport();
    }

    // }}}
    // {{{ pending calls

    void failAllPending(ErrorCode code, const std::string& reason)
    {
        auto taken = std::map<int64_t, std::shared_ptr<PendingCall>> {};
        {
            auto lock = std::lock_guard(pendingMutex);
            taken.swap(pending);
        }
        if (!taken.empty())
            log::debug("[{}] failing {} pending call(s): {}", name(), taken.size(), reason);
        for (auto& [id, call]: taken)
            call->promise.set_value(Result<jsonrpc::Response>(makeError(code, reason)));
    }

    auto erasePending(int64_t id) -> bool
    {
        auto lock = std::lock_guard(pendingMutex);
        return pending.erase(id) > 0;
    }

    void resolve(jsonrpc::Response response)
    {
        auto call = std::shared_ptr<PendingCall> {};
        {
            auto lock = std::lock_guard(pendingMutex);
            auto const it = pending.find(response.id);
            if (it == pending.end())
            {
                log::warning("[{}] dropping reply for unknown request id {}", name(), response.id);
                return;
            }
            call = std::move(it->second);
            pending.erase(it);
        }

        log::trace("[{}] {} (id {}) answered after {} ms",
                   name(),
                   call->method,
                   call->id,
                   std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now()
                                                                         - call->issuedAt)
                       .count());
        call->promise.set_value(std::move(response));
    }

    // }}}
    // {{{ transport

    [[nodiscard]] auto currentTransport() -> std::shared_ptr<Transport>
    {
        auto lock = std::lock_guard(transportMutex);
        return transport;
    }

    void closeTransport()
    {
        if (auto current = currentTransport())
            current->close();
    }

    void teardown()
    {
        if (reader.joinable())
            reader.request_stop();
        closeTransport();
        if (reader.joinable())
            reader.join();
        {
            auto lock = std::lock_guard(transportMutex);
            transport.reset();
        }
        failAllPending(ErrorCode::ConnectionLostError, std::format("Connection to '{}' closed", name()));
    }

    void handleFrame(const std::string& frame, Transport& channel)
    {
        log::trace("[{}] <- {}", name(), frame);

        auto message = jsonrpc::decode(frame);
        if (!message)
        {
            log::warning("[{}] dropping unparsable frame: {}", name(), message.error().message);
            return;
        }

        if (auto* response = std::get_if<jsonrpc::Response>(&*message))
        {
            resolve(std::move(*response));
        }
        else if (auto* request = std::get_if<jsonrpc::Request>(&*message))
        {
            auto const reply =
                request->method == "ping"
                    ? jsonrpc::makeResult(request->id, nlohmann::json::object())
                    : jsonrpc::makeErrorResponse(request->id,
                                                 jsonrpc::codes::MethodNotFound,
                                                 std::format("Method not found: {}", request->method));
            auto const text = jsonrpc::encode(reply);
            log::trace("[{}] -> {}", name(), text);
            if (auto sent = channel.send(text); !sent)
                log::warning("[{}] failed to answer '{}': {}", name(), request->method, sent.error().message);
        }
        else
        {
            auto const& notification = std::get<jsonrpc::Notification>(*message);
            log::debug("[{}] notification: {}", name(), notification.method);
        }
    }

    void readLoop(const std::stop_token& token, const std::shared_ptr<Transport>& channel)
    {
        while (!token.stop_requested())
        {
            auto frame = channel->receive();
            if (token.stop_requested())
                return;
            if (!frame)
            {
                markLost(frame.error().message);
                return;
            }
            if (!frame->has_value())
            {
                markLost("server closed the connection");
                return;
            }
            handleFrame(**frame, *channel);
        }
    }

    // }}}
    // {{{ requests

    [[nodiscard]] auto request(std::string_view method, nlohmann::json params, std::chrono::milliseconds timeout)
        -> Result<jsonrpc::Response>
    {
        auto channel = currentTransport();
        if (!channel)
            return makeError(ErrorCode::NotReadyError, std::format("Server '{}' is not connected", name()));

        auto call = std::make_shared<PendingCall>();
        call->id = ids.next();
        call->method = std::string(method);
        call->issuedAt = std::chrono::steady_clock::now();
        auto const id = call->id;
        auto future = call->promise.get_future();

        {
            auto lock = std::lock_guard(pendingMutex);
            pending.emplace(id, std::move(call));
        }
        if (closing)
        {
            erasePending(id);
            return makeError(ErrorCode::ConnectionLostError, std::format("Connection to '{}' closed", name()));
        }

        auto const frame = jsonrpc::encode(jsonrpc::makeRequest(id, method, std::move(params)));
        log::trace("[{}] -> {}", name(), frame);

        auto sent = channel->exchange(frame, timeout);
        if (!sent)
        {
            erasePending(id);
            if (sent.error().code == ErrorCode::TimeoutError)
                return makeError(ErrorCode::TimeoutError,
                                 std::format("{} on '{}' timed out: {}", method, name(), sent.error().message));
            markLost(sent.error().message);
            return makeError(ErrorCode::ConnectionLostError,
                             std::format("Connection to '{}' lost: {}", name(), sent.error().message));
        }

        if (!channel->hasReceiveStream())
        {
            // The reply to a POST is its response body.
            if (sent->has_value())
                handleFrame(**sent, *channel);
            if (erasePending(id))
                return makeError(ErrorCode::ProtocolError,
                                 std::format("{} on '{}': HTTP reply did not answer the request", method, name()));
        }
        else if (future.wait_for(timeout) == std::future_status::timeout && erasePending(id))
        {
            log::warning("[{}] {} (id {}) timed out after {} ms", name(), method, id, timeout.count());
            return makeError(ErrorCode::TimeoutError,
                             std::format("{} on '{}' timed out after {} ms", method, name(), timeout.count()));
        }

        return future.get();
    }

    [[nodiscard]] auto notify(std::string_view method) -> VoidResult
    {
        auto channel = currentTransport();
        if (!channel)
            return makeError(ErrorCode::NotReadyError, std::format("Server '{}' is not connected", name()));

        auto const frame = jsonrpc::encode(jsonrpc::makeNotification(method));
        log::trace("[{}] -> {}", name(), frame);

        auto sent = channel->send(frame);
        if (!sent)
            return std::unexpected(sent.error());
        if (sent->has_value())
            handleFrame(**sent, *channel);
        return {};
    }

    [[nodiscard]] auto fetchTools(std::chrono::milliseconds timeout) -> Result<std::vector<ToolDescriptor>>
    {
        auto response = request("tools/list", nullptr, timeout);
        if (!response)
            return std::unexpected(response.error());
        if (response->error)
            return makeError(ErrorCode::ProtocolError,
                             std::format("tools/list on '{}' failed: {}", name(), rpcErrorText(*response->error)));

        auto tools = std::vector<ToolDescriptor> {};
        auto const& result = *response->result;
        if (!result.is_object() || !result.contains("tools") || !result["tools"].is_array())
            return tools;

        for (auto const& item: result["tools"])
        {
            auto toolName = json::getStringOr(item, "name", "");
            if (toolName.empty())
            {
                log::warning("[{}] ignoring tool without a name", name());
                continue;
            }
            tools.push_back(ToolDescriptor {
                .serverName = name(),
                .toolName = std::move(toolName),
                .description = json::getStringOr(item, "description", ""),
                .inputSchema = item.value("inputSchema", nlohmann::json::object()),
            });
        }
        return tools;
    }

    [[nodiscard]] auto initialize() -> VoidResult
    {
        auto params = nlohmann::json {
            { "protocolVersion", ProtocolVersion },
            { "capabilities", nlohmann::json::object() },
            { "clientInfo",
              {
                  { "name", ClientName },
                  { "version", ClientVersion },
              } },
        };

        auto response = request("initialize", std::move(params), options.initializeTimeout);
        if (!response)
            return std::unexpected(response.error());
        if (response->error)
            return makeError(ErrorCode::ProtocolError,
                             std::format("initialize rejected by '{}': {}", name(), rpcErrorText(*response->error)));

        auto const& result = *response->result;
        auto const serverInfo = result.is_object() ? result.value("serverInfo", nlohmann::json::object())
                                                   : nlohmann::json::object();
        auto caps = ServerCapabilities {
            .protocolVersion = json::getStringOr(result, "protocolVersion", ""),
            .serverName = json::getStringOr(serverInfo, "name", "unknown"),
            .serverVersion = json::getStringOr(serverInfo, "version", "unknown"),
            .hasTools = result.is_object() && result.contains("capabilities") && result["capabilities"].contains("tools"),
        };
        log::info("[{}] initialized: {} v{} (protocol {})",
                  name(),
                  caps.serverName,
                  caps.serverVersion,
                  caps.protocolVersion.empty() ? "?" : caps.protocolVersion);
        {
            auto lock = std::lock_guard(stateMutex);
            capabilities = std::move(caps);
        }

        return notify("notifications/initialized");
    }

    // }}}
    // {{{ lifecycle

    [[nodiscard]] auto establish(const std::stop_token& token) -> VoidResult
    {
        {
            auto lock = std::lock_guard(stateMutex);
            lossPending = false;
            capabilities.reset();
        }
        setState(ConnectionState::Connecting);

        auto channel = std::shared_ptr<Transport>(factory(descriptor));
        if (!channel)
            return makeError(ErrorCode::ConnectionError, std::format("No transport for server '{}'", name()));

        if (auto opened = channel->open(); !opened)
            return std::unexpected(opened.error());

        {
            auto lock = std::lock_guard(transportMutex);
            if (token.stop_requested())
            {
                channel->close();
                return makeError(ErrorCode::ConnectionError, "Connection stopped");
            }
            transport = channel;
        }

        if (channel->hasReceiveStream())
            reader = std::jthread([this, channel](const std::stop_token& readerToken) { readLoop(readerToken, channel); });

        setState(ConnectionState::Initializing);

        if (auto initialized = initialize(); !initialized)
            return initialized;

        auto tools = fetchTools(options.initializeTimeout);
        if (!tools)
            return std::unexpected(tools.error());

        auto const toolCount = tools->size();
        registry.registerTools(name(), std::move(*tools));

        auto from = ConnectionState::Initializing;
        {
            auto lock = std::lock_guard(stateMutex);
            if (lossPending)
                return makeError(ErrorCode::ConnectionLostError, "Connection lost during initialization");
            from = std::exchange(state, ConnectionState::Ready);
        }
        announce(from, ConnectionState::Ready, std::format("{} tool(s)", toolCount));
        return {};
    }

    void giveUp()
    {
        auto const reason = std::format("gave up after {} reconnect attempt(s)", options.reconnect.maxAttempts);
        setState(ConnectionState::Closed, reason);
        registry.unregisterServer(name());
        log::error("[{}] server is permanently unavailable: {}", name(), reason);
        if (events.onUnavailable)
            events.onUnavailable(reason);
    }

    void run(const std::stop_token& token)
    {
        auto failures = 0;
        auto recovering = false;

        while (!token.stop_requested())
        {
            if (failures > 0)
            {
                if (failures > options.reconnect.maxAttempts)
                {
                    teardown();
                    giveUp();
                    return;
                }

                auto const delay = computeBackoffDelay(options.reconnect, failures);
                log::info("[{}] reconnect attempt {}/{} in {} ms",
                          name(),
                          failures,
                          options.reconnect.maxAttempts,
                          delay.count());

                auto lock = std::unique_lock(stateMutex);
                stateChanged.wait_for(lock, token, delay, [] { return false; });
                if (token.stop_requested())
                    return;
            }

            auto established = establish(token);
            {
                auto lock = std::lock_guard(stateMutex);
                ++completedAttempts;
            }
            stateChanged.notify_all();

            if (!established)
            {
                teardown();
                if (token.stop_requested())
                    return;
                log::warning("[{}] connection attempt failed: {}", name(), established.error());
                setState(recovering ? ConnectionState::Degraded : ConnectionState::Disconnected,
                         established.error().message);
                ++failures;
                continue;
            }

            failures = 0;
            {
                auto lock = std::unique_lock(stateMutex);
                stateChanged.wait(lock, token, [this] { return lossPending; });
            }
            if (token.stop_requested())
                return;

            teardown();
            recovering = true;
            failures = 1;
        }
    }

    void launch()
    {
        supervisor = std::jthread([this](const std::stop_token& token) { run(token); });
    }

    // }}}
};

ServerConnection::ServerConnection(ServerDescriptor descriptor,
                                   ToolRegistry& registry,
                                   ConnectionOptions options,
                                   TransportFactory factory,
                                   ConnectionEvents events):
    _impl(std::make_unique<Impl>(
        std::move(descriptor), registry, options, std::move(factory), std::move(events)))
{
}

ServerConnection::~ServerConnection()
{
    stop();
}

void ServerConnection::start()
{
    if (_impl->stopped || _impl->supervisor.joinable())
        return;
    _impl->launch();
}

void ServerConnection::stop()
{
    if (_impl->stopped.exchange(true))
        return;

    _impl->closing = true;
    _impl->supervisor.request_stop();
    _impl->failAllPending(ErrorCode::ConnectionLostError, std::format("Connection to '{}' closed", name()));
    _impl->closeTransport();
    if (_impl->supervisor.joinable())
        _impl->supervisor.join();

    _impl->teardown();
    _impl->setState(ConnectionState::Closed, "stopped");
    _impl->registry.unregisterServer(name());
}

auto ServerConnection::restart() -> VoidResult
{
    if (state() != ConnectionState::Closed)
        return makeError(ErrorCode::InvalidArgument, std::format("Server '{}' is not closed", name()));

    if (_impl->supervisor.joinable())
        _impl->supervisor.join();
    _impl->teardown();

    _impl->stopped = false;
    _impl->closing = false;
    _impl->setState(ConnectionState::Disconnected, "reset");
    _impl->launch();
    return {};
}

auto ServerConnection::name() const -> const std::string&
{
    return _impl->descriptor.name;
}

auto ServerConnection::descriptor() const -> const ServerDescriptor&
{
    return _impl->descriptor;
}

auto ServerConnection::state() const -> ConnectionState
{
    return _impl->currentState();
}

auto ServerConnection::awaitState(ConnectionState state, std::chrono::milliseconds timeout) const -> bool
{
    auto lock = std::unique_lock(_impl->stateMutex);
    return _impl->stateChanged.wait_for(lock, timeout, [&] { return _impl->state == state; });
}

auto ServerConnection::awaitSettled(std::chrono::milliseconds timeout) const -> bool
{
    auto lock = std::unique_lock(_impl->stateMutex);
    return _impl->stateChanged.wait_for(lock, timeout, [&] {
        if (_impl->state == ConnectionState::Closed)
            return true;
        return _impl->completedAttempts > 0 && _impl->state != ConnectionState::Connecting
               && _impl->state != ConnectionState::Initializing;
    });
}

auto ServerConnection::listTools() -> Result<std::vector<ToolDescriptor>>
{
    if (state() != ConnectionState::Ready)
        return makeError(ErrorCode::NotReadyError,
                         std::format("Server '{}' is {}", name(), connectionStateName(state())));

    auto tools = _impl->fetchTools(_impl->options.requestTimeout);
    if (tools)
        _impl->registry.registerTools(name(), *tools);
    return tools;
}

auto ServerConnection::callTool(std::string_view toolName,
                                const nlohmann::json& arguments,
                                std::optional<std::chrono::milliseconds> timeout) -> ToolInvocationResult
{
    if (auto const current = state(); current != ConnectionState::Ready)
        return ToolInvocationResult::failure(
            Error { ErrorCode::NotReadyError, std::format("Server '{}' is {}", name(), connectionStateName(current)) });

    auto params = nlohmann::json {
        { "name", toolName },
        { "arguments", arguments.is_null() ? nlohmann::json::object() : arguments },
    };

    auto response = _impl->request("tools/call", std::move(params), timeout.value_or(_impl->options.requestTimeout));
    if (!response)
        return ToolInvocationResult::failure(response.error());

    if (response->error)
        return ToolInvocationResult::failure(Error {
            ErrorCode::ToolCallError,
            std::format("Tool '{}' on '{}' failed: {}", toolName, name(), rpcErrorText(*response->error)) });

    auto const& result = *response->result;
    auto payload = result.is_object() && result.contains("content") ? result["content"] : result;

    if (json::getBoolOr(result, "isError", false))
    {
        auto failed = ToolInvocationResult {
            .success = false,
            .payload = payload,
            .errorMessage = resultToLlmText(ToolInvocationResult::ok(payload)),
            .errorCode = ErrorCode::ToolCallError,
        };
        log::debug("[{}] tool '{}' reported an error: {}", name(), toolName, failed.errorMessage);
        return failed;
    }

    return ToolInvocationResult::ok(std::move(payload));
}

auto ServerConnection::ping(std::chrono::milliseconds timeout) -> Result<std::chrono::milliseconds>
{
    if (auto const current = state(); current != ConnectionState::Ready)
        return makeError(ErrorCode::NotReadyError, std::format("Server '{}' is {}", name(), connectionStateName(current)));

    auto const started = std::chrono::steady_clock::now();
    auto response = _impl->request("ping", nullptr, timeout);
    auto const latency =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

    if (!response)
        return makeError(ErrorCode::HealthCheckError,
                         std::format("Ping to '{}' failed: {}", name(), response.error().message));
    if (response->error)
        return makeError(ErrorCode::HealthCheckError,
                         std::format("Ping to '{}' rejected: {}", name(), rpcErrorText(*response->error)));

    auto const& result = *response->result;
    if (result.is_object() && result.contains("message") && result["message"] != "pong")
        return makeError(ErrorCode::HealthCheckError,
                         std::format("Unexpected ping reply from '{}': {}", name(), result.dump()));

    return latency;
}

void ServerConnection::reportHealthFailure(std::string_view reason)
{
    if (state() != ConnectionState::Ready)
        return;
    _impl->markLost(std::string(reason));
}

auto ServerConnection::capabilities() const -> std::optional<ServerCapabilities>
{
    auto lock = std::lock_guard(_impl->stateMutex);
    return _impl->capabilities;
}

auto ServerConnection::pendingCallCount() const -> std::size_t
{
    auto lock = std::lock_guard(_impl->pendingMutex);
    return _impl->pending.size();
}

} // namespace mcplink
