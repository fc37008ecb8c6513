// SPDX-License-Identifier: Apache-2.0
#include "Transport.hpp"

#include <mcp/HttpTransport.hpp>
#include <mcp/StdioTransport.hpp>
#include <mcp/WebSocketTransport.hpp>

#include <type_traits>

namespace mcplink
{

auto makeTransport(const ServerDescriptor& descriptor, std::chrono::milliseconds requestTimeout)
    -> std::unique_ptr<Transport>
{
    return std::visit(
        [&](const auto& config) -> std::unique_ptr<Transport> {
            using T = std::decay_t<decltype(config)>;
            if constexpr (std::is_same_v<T, StdioConfig>)
                return std::make_unique<StdioTransport>(config);
            else if constexpr (std::is_same_v<T, WebSocketConfig>)
                return std::make_unique<WebSocketTransport>(config, requestTimeout);
            else
                return std::make_unique<HttpTransport>(config, requestTimeout);
        },
        descriptor.transport);
}

} // namespace mcplink
