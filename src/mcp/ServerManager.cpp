// SPDX-License-Identifier: Apache-2.0
#include "ServerManager.hpp"

#include <core/Log.hpp>

#include <format>
#include <set>

namespace mcplink
{

ServerManager::ServerManager(ManagerOptions options): _options(std::move(options))
{
    if (!_options.transportFactory)
    {
        auto const timeout = _options.connection.requestTimeout;
        _options.transportFactory = [timeout](const ServerDescriptor& d) { return makeTransport(d, timeout); };
    }

    _health = std::make_unique<HealthMonitor>(
        _options.health, [this](const std::string& server, const std::string& reason) {
            emit(ServerEvent {
                .server = server,
                .kind = ServerEventKind::HealthCheckFailed,
                .from = ConnectionState::Ready,
                .to = ConnectionState::Ready,
                .message = reason,
            });
        });
}

ServerManager::~ServerManager()
{
    stop();
}

void ServerManager::emit(ServerEvent event)
{
    if (!_options.onEvent)
        return;
    auto lock = std::lock_guard(_eventMutex);
    _options.onEvent(event);
}

auto ServerManager::start(std::vector<ServerDescriptor> descriptors) -> VoidResult
{
    auto lock = std::lock_guard(_mutex);
    if (_stopped)
        return makeError(ErrorCode::InvalidArgument, "Server manager has been stopped");

    auto names = std::set<std::string> {};
    for (auto const& descriptor: descriptors)
    {
        if (descriptor.name.empty())
            return makeError(ErrorCode::InvalidArgument, "Server descriptor without a name");
        if (_connections.contains(descriptor.name) || !names.insert(descriptor.name).second)
            return makeError(ErrorCode::InvalidArgument,
                             std::format("Duplicate server name '{}'", descriptor.name));
    }

    for (auto& descriptor: descriptors)
    {
        auto const serverName = descriptor.name;
        auto events = ConnectionEvents {
            .onStateChanged =
                [this, serverName](ConnectionState from, ConnectionState to, const std::string& reason) {
                    emit(ServerEvent {
                        .server = serverName,
                        .kind = ServerEventKind::StateChanged,
                        .from = from,
                        .to = to,
                        .message = reason,
                    });
                },
            .onUnavailable =
                [this, serverName](const std::string& reason) {
                    emit(ServerEvent {
                        .server = serverName,
                        .kind = ServerEventKind::Unavailable,
                        .from = ConnectionState::Closed,
                        .to = ConnectionState::Closed,
                        .message = reason,
                    });
                },
        };

        auto connection = std::make_shared<ServerConnection>(
            std::move(descriptor), _registry, _options.connection, _options.transportFactory, std::move(events));
        _connections.emplace(serverName, connection);

        // Under the lock, so a concurrent stop() sees either all of these or none.
        log::info("Starting MCP server '{}' ({})", serverName, transportKindToString(connection->descriptor().kind()));
        connection->start();
        _health->watch(std::move(connection));
    }

    return {};
}

void ServerManager::stop()
{
    auto connections = std::map<std::string, std::shared_ptr<ServerConnection>> {};
    {
        auto lock = std::lock_guard(_mutex);
        _stopped = true;
        connections.swap(_connections);
    }

    // Stopping the connections fails their outstanding calls, including pings
    // the health workers are blocked on, so joining the workers is immediate.
    _health->requestStop();
    for (auto& [name, connection]: connections)
        connection->stop();
    _health->stop();

    if (!connections.empty())
        log::info("Stopped {} MCP server(s)", connections.size());
}

auto ServerManager::listTools() const -> std::vector<ToolDescriptor>
{
    return _registry.listAll();
}

auto ServerManager::toolsByServer() const -> std::map<std::string, std::vector<ToolDescriptor>>
{
    return _registry.toolsByServer();
}

auto ServerManager::llmTools() const -> nlohmann::json
{
    return _registry.toLlmFormat();
}

auto ServerManager::callTool(const ToolInvocationRequest& request, std::optional<std::chrono::milliseconds> timeout)
    -> ToolInvocationResult
{
    auto target = connection(request.serverName);
    if (!target)
        return ToolInvocationResult::failure(
            Error { ErrorCode::UnknownServerError, std::format("Unknown server '{}'", request.serverName) });

    if (auto const state = target->state(); state != ConnectionState::Ready)
        return ToolInvocationResult::failure(Error {
            ErrorCode::NotReadyError, std::format("Server '{}' is {}", request.serverName, connectionStateName(state)) });

    if (!_registry.find(request.serverName, request.toolName))
        return ToolInvocationResult::failure(Error {
            ErrorCode::UnknownToolError,
            std::format("Server '{}' does not provide tool '{}'", request.serverName, request.toolName) });

    log::debug("Calling tool '{}' on server '{}'", request.toolName, request.serverName);
    auto result = target->callTool(request.toolName, request.arguments, timeout);
    if (!result.success)
        log::warning("Tool '{}' on server '{}' failed: [{}] {}",
                     request.toolName,
                     request.serverName,
                     errorCodeName(result.errorCode),
                     result.errorMessage);
    return result;
}

auto ServerManager::callTool(std::string serverName, std::string toolName, nlohmann::json arguments)
    -> ToolInvocationResult
{
    return callTool(ToolInvocationRequest {
        .serverName = std::move(serverName),
        .toolName = std::move(toolName),
        .arguments = std::move(arguments),
    });
}

auto ServerManager::callLlmTool(const LlmToolCall& call) -> ToolInvocationResult
{
    auto request = _registry.fromLlmToolCall(call);
    if (!request)
        return ToolInvocationResult::failure(request.error());
    return callTool(*request);
}

auto ServerManager::serverStates() const -> std::map<std::string, ConnectionState>
{
    auto lock = std::lock_guard(_mutex);
    auto states = std::map<std::string, ConnectionState> {};
    for (auto const& [name, connection]: _connections)
        states.emplace(name, connection->state());
    return states;
}

auto ServerManager::healthSummary() const -> HealthSummary
{
    return _health->summary();
}

auto ServerManager::healthStatus(const std::string& serverName) const -> std::optional<HealthStatus>
{
    return _health->status(serverName);
}

auto ServerManager::resetServer(const std::string& serverName) -> VoidResult
{
    auto target = connection(serverName);
    if (!target)
        return makeError(ErrorCode::UnknownServerError, std::format("Unknown server '{}'", serverName));

    log::info("Resetting MCP server '{}'", serverName);
    return target->restart();
}

auto ServerManager::awaitSettled(std::chrono::milliseconds timeout) const -> bool
{
    auto connections = std::vector<std::shared_ptr<ServerConnection>> {};
    {
        auto lock = std::lock_guard(_mutex);
        for (auto const& [name, connection]: _connections)
            connections.push_back(connection);
    }

    auto const deadline = std::chrono::steady_clock::now() + timeout;
    for (auto const& connection: connections)
    {
        auto const remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (!connection->awaitSettled(std::max(remaining, std::chrono::milliseconds(0))))
            return false;
    }
    return true;
}

auto ServerManager::connection(const std::string& serverName) const -> std::shared_ptr<ServerConnection>
{
    auto lock = std::lock_guard(_mutex);
    if (auto it = _connections.find(serverName); it != _connections.end())
        return it->second;
    return nullptr;
}

} // namespace mcplink
