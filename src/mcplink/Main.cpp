// SPDX-License-Identifier: Apache-2.0
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/ServerManager.hpp>
#include <mcp/ToolSchema.hpp>
#include <mcplink/Config.hpp>

#include <CLI/CLI.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <format>
#include <print>
#include <thread>

namespace
{

std::atomic<bool> interrupted = false;

void onSignal(int /*signal*/)
{
    interrupted = true;
}

void printTools(const mcplink::ServerManager& manager)
{
    auto const states = manager.serverStates();
    auto const grouped = manager.toolsByServer();

    for (auto const& [name, state]: states)
    {
        std::println("{} ({})", name, state);
        auto const it = grouped.find(name);
        if (it == grouped.end() || it->second.empty())
        {
            std::println("  (no tools)");
            continue;
        }
        for (auto const& tool: it->second)
            std::println("  {}: {}", tool.toolName, tool.description);
    }
}

auto runCall(mcplink::ServerManager& manager,
             std::string const& target,
             std::string const& argsText,
             std::chrono::milliseconds timeout) -> int
{
    auto arguments = mcplink::json::parse(argsText.empty() ? std::string_view("{}") : std::string_view(argsText));
    if (!arguments || !arguments->is_object())
    {
        mcplink::log::error("--args must be a JSON object");
        return 1;
    }

    auto result = mcplink::ToolInvocationResult {};
    if (auto const slash = target.find('/'); slash != std::string::npos)
    {
        auto request = mcplink::ToolInvocationRequest {
            .serverName = target.substr(0, slash),
            .toolName = target.substr(slash + 1),
            .arguments = std::move(*arguments),
        };
        result = manager.callTool(request, timeout);
    }
    else
    {
        // No server prefix: resolve as an LLM tool name.
        result = manager.callLlmTool(mcplink::LlmToolCall { .id = "cli", .name = target, .arguments = std::move(*arguments) });
    }

    if (!result.success)
    {
        std::println(stderr, "{}: {}", mcplink::errorCodeName(result.errorCode), mcplink::resultToLlmText(result));
        return 1;
    }

    std::println("{}", mcplink::resultToLlmText(result));
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    auto app = CLI::App { "mcplink - Model Context Protocol client runtime" };

    auto configPath = std::string {};
    auto verbosity = 0;
    auto listTools = false;
    auto showLlmTools = false;
    auto callTarget = std::string {};
    auto callArgs = std::string {};
    auto watch = false;
    auto timeoutMs = 10000;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_flag("-v,--verbose", verbosity, "Increase logging verbosity (-vv for protocol traffic)");
    app.add_flag("--list", listTools, "List the tools of all servers");
    app.add_flag("--llm", showLlmTools, "Print the tool declarations in LLM function-calling format");
    app.add_option("--call", callTarget, "Invoke a tool, as server/tool or by its LLM name");
    app.add_option("--args", callArgs, "Tool arguments as a JSON object")->needs("--call");
    app.add_flag("--watch", watch, "Print server events until interrupted");
    app.add_option("--timeout", timeoutMs, "Milliseconds to wait for servers and for a tool call")
        ->check(CLI::PositiveNumber);

    CLI11_PARSE(app, argc, argv);

    auto configResult = configPath.empty() ? mcplink::loadConfig() : mcplink::loadConfigFromFile(configPath);
    if (!configResult)
    {
        mcplink::log::error("Failed to load config: {}", configResult.error());
        return 1;
    }

    auto& config = *configResult;
    mcplink::log::setLevel(config.logLevel);
    if (verbosity == 1)
        mcplink::log::setLevel(std::max(config.logLevel, mcplink::log::Level::Debug));
    else if (verbosity > 1)
        mcplink::log::setLevel(mcplink::log::Level::Trace);

    auto const servers = config.enabledServers();
    if (servers.empty())
    {
        mcplink::log::error("No MCP servers configured");
        return 1;
    }

    auto options = mcplink::ManagerOptions {
        .connection = config.connection,
        .health = config.healthCheck,
    };
    if (watch)
    {
        options.onEvent = [](const mcplink::ServerEvent& event) {
            if (event.kind == mcplink::ServerEventKind::StateChanged)
                std::println("[{}] {} -> {}{}{}",
                             event.server,
                             event.from,
                             event.to,
                             event.message.empty() ? "" : ": ",
                             event.message);
            else
                std::println("[{}] {}: {}", event.server, mcplink::serverEventKindName(event.kind), event.message);
        };
    }

    auto manager = mcplink::ServerManager(std::move(options));
    if (auto started = manager.start(servers); !started)
    {
        mcplink::log::error("Failed to start servers: {}", started.error());
        return 1;
    }

    auto const timeout = std::chrono::milliseconds(timeoutMs);
    if (!manager.awaitSettled(timeout))
        mcplink::log::warning("Not all servers settled within {} ms", timeoutMs);

    auto exitCode = 0;

    if (!callTarget.empty())
        exitCode = runCall(manager, callTarget, callArgs, timeout);

    if (listTools || (callTarget.empty() && !showLlmTools && !watch))
        printTools(manager);

    if (showLlmTools)
        std::println("{}", manager.llmTools().dump(2));

    if (watch)
    {
        std::signal(SIGINT, onSignal);
        std::signal(SIGTERM, onSignal);
        while (!interrupted)
            std::this_thread::sleep_for(std::chrono::milliseconds(200));

        auto const summary = manager.healthSummary();
        std::println("{}/{} server(s) healthy, average latency {} ms",
                     summary.healthy,
                     summary.total,
                     summary.averageLatency.count());
    }

    manager.stop();
    return exitCode;
}
