// SPDX-License-Identifier: Apache-2.0
#include "WebSocketTransport.hpp"

#include <core/Log.hpp>

#include <libwebsockets.h>

#include <atomic>
#include <cstring>
#include <deque>
#include <format>
#include <mutex>
#include <vector>

namespace mcplink
{

struct WebSocketTransport::Impl
{
    WebSocketConfig config;
    std::chrono::milliseconds connectTimeout;

    lws_context* context = nullptr;
    lws* connection = nullptr;

    std::atomic<bool> established = false;
    std::atomic<bool> connectionFailed = false;
    std::atomic<bool> peerClosed = false;
    std::atomic<bool> closeRequested = false;
    std::string failureReason;

    std::mutex outboundMutex;
    std::deque<std::string> outbound;

    std::string fragmentBuffer;
    std::deque<std::string> inbound; // service thread only

    void destroyContext()
    {
        if (context)
        {
            lws_context_destroy(context);
            context = nullptr;
            connection = nullptr;
        }
    }

    auto writePending(lws* wsi) -> int
    {
        auto frame = std::string {};
        auto more = false;
        {
            auto lock = std::lock_guard(outboundMutex);
            if (outbound.empty())
                return 0;
            frame = std::move(outbound.front());
            outbound.pop_front();
            more = !outbound.empty();
        }

        // libwebsockets requires LWS_PRE bytes of headroom before the payload.
        auto buffer = std::vector<unsigned char>(LWS_PRE + frame.size());
        std::memcpy(buffer.data() + LWS_PRE, frame.data(), frame.size());
        auto const written = lws_write(wsi, buffer.data() + LWS_PRE, frame.size(), LWS_WRITE_TEXT);
        if (written < static_cast<int>(frame.size()))
        {
            log::warning("WebSocket write to {}:{} failed", config.host, config.port);
            return -1;
        }

        if (more)
            lws_callback_on_writable(wsi);
        return 0;
    }
};

namespace
{

    auto implFor(lws* wsi) -> WebSocketTransport::Impl*
    {
        return static_cast<WebSocketTransport::Impl*>(lws_context_user(lws_get_context(wsi)));
    }

    auto websocketCallback(lws* wsi, lws_callback_reasons reason, void* /*user*/, void* in, size_t len) -> int
    {
        auto* impl = implFor(wsi);
        if (!impl)
            return 0;

        switch (reason)
        {
            case LWS_CALLBACK_CLIENT_ESTABLISHED:
                impl->established = true;
                log::debug("WebSocket connected to {}:{}{}", impl->config.host, impl->config.port, impl->config.path);
                break;

            case LWS_CALLBACK_CLIENT_RECEIVE:
                impl->fragmentBuffer.append(static_cast<const char*>(in), len);
                if (lws_is_final_fragment(wsi) && lws_remaining_packet_payload(wsi) == 0)
                {
                    impl->inbound.push_back(std::move(impl->fragmentBuffer));
                    impl->fragmentBuffer.clear();
                }
                break;

            case LWS_CALLBACK_CLIENT_CONNECTION_ERROR:
                impl->failureReason = in ? std::string(static_cast<const char*>(in)) : "unknown";
                impl->connectionFailed = true;
                impl->peerClosed = true;
                impl->connection = nullptr;
                break;

            case LWS_CALLBACK_CLIENT_CLOSED:
                log::debug("WebSocket to {}:{} closed", impl->config.host, impl->config.port);
                impl->peerClosed = true;
                impl->connection = nullptr;
                break;

            case LWS_CALLBACK_CLIENT_WRITEABLE:
                if (impl->closeRequested)
                    return -1;
                return impl->writePending(wsi);

            case LWS_CALLBACK_EVENT_WAIT_CANCELLED:
                // Raised by lws_cancel_service() from send() or close().
                if (impl->connection)
                    lws_callback_on_writable(impl->connection);
                break;

            default: break;
        }

        return 0;
    }

    const lws_protocols WebSocketProtocols[] = {
        { "mcp", websocketCallback, 0, 65536, 0, nullptr, 0 },
        { nullptr, nullptr, 0, 0, 0, nullptr, 0 },
    };

    void routeLibraryLogs()
    {
        static auto once = std::once_flag {};
        std::call_once(once, [] {
            lws_set_log_level(LLL_ERR | LLL_WARN, [](int level, const char* line) {
                auto text = std::string_view(line);
                while (!text.empty() && (text.back() == '\n' || text.back() == '\r'))
                    text.remove_suffix(1);
                if (level == LLL_ERR)
                    log::debug("libwebsockets: {}", text);
                else
                    log::trace("libwebsockets: {}", text);
            });
        });
    }

} // namespace

WebSocketTransport::WebSocketTransport(WebSocketConfig config, std::chrono::milliseconds connectTimeout):
    _impl(std::make_unique<Impl>())
{
    _impl->config = std::move(config);
    _impl->connectTimeout = connectTimeout;
}

WebSocketTransport::~WebSocketTransport()
{
    close();
    _impl->destroyContext();
}

auto WebSocketTransport::open() -> VoidResult
{
    if (_impl->context)
        return makeError(ErrorCode::ConnectionError, "Transport already connected");
    if (_impl->config.host.empty() || _impl->config.port <= 0)
        return makeError(ErrorCode::ConnectionError, "WebSocket transport requires host and port");

    routeLibraryLogs();

    auto contextInfo = lws_context_creation_info {};
    std::memset(&contextInfo, 0, sizeof(contextInfo));
    contextInfo.port = CONTEXT_PORT_NO_LISTEN;
    contextInfo.protocols = WebSocketProtocols;
    contextInfo.gid = -1;
    contextInfo.uid = -1;
    contextInfo.user = _impl.get();
    if (_impl->config.secure)
        contextInfo.options |= LWS_SERVER_OPTION_DO_SSL_GLOBAL_INIT;

    _impl->context = lws_create_context(&contextInfo);
    if (!_impl->context)
        return makeError(ErrorCode::ConnectionError, "Failed to create libwebsockets context");

    auto const path = _impl->config.path.empty() ? std::string("/") : _impl->config.path;

    auto connectInfo = lws_client_connect_info {};
    std::memset(&connectInfo, 0, sizeof(connectInfo));
    connectInfo.context = _impl->context;
    connectInfo.address = _impl->config.host.c_str();
    connectInfo.port = _impl->config.port;
    connectInfo.path = path.c_str();
    connectInfo.host = _impl->config.host.c_str();
    connectInfo.origin = _impl->config.host.c_str();
    connectInfo.protocol = nullptr;
    connectInfo.ssl_connection = _impl->config.secure ? LCCSCF_USE_SSL : 0;

    _impl->connection = lws_client_connect_via_info(&connectInfo);
    if (!_impl->connection && !_impl->connectionFailed)
    {
        _impl->destroyContext();
        return makeError(
            ErrorCode::ConnectionError,
            std::format("Failed to initiate WebSocket connection to {}:{}", _impl->config.host, _impl->config.port));
    }

    auto const deadline = std::chrono::steady_clock::now() + _impl->connectTimeout;
    while (!_impl->established)
    {
        if (_impl->connectionFailed || _impl->closeRequested)
        {
            auto const reason = _impl->failureReason;
            _impl->destroyContext();
            return makeError(ErrorCode::ConnectionError,
                             std::format("WebSocket connection to {}:{} failed: {}",
                                         _impl->config.host,
                                         _impl->config.port,
                                         reason.empty() ? "closed" : reason));
        }
        if (std::chrono::steady_clock::now() >= deadline)
        {
            _impl->destroyContext();
            return makeError(ErrorCode::ConnectionError,
                             std::format("Timed out connecting to WebSocket {}:{}", _impl->config.host, _impl->config.port));
        }
        lws_service(_impl->context, 50);
    }

    log::info("MCP WebSocket connected: {}:{}{}", _impl->config.host, _impl->config.port, path);
    return {};
}

auto WebSocketTransport::send(std::string_view frame) -> Result<std::optional<std::string>>
{
    if (!isOpen())
        return makeError(ErrorCode::TransportError, "Transport not connected");

    {
        auto lock = std::lock_guard(_impl->outboundMutex);
        _impl->outbound.emplace_back(frame);
    }
    lws_cancel_service(_impl->context);
    return std::nullopt;
}

auto WebSocketTransport::receive() -> Result<std::optional<std::string>>
{
    if (!_impl->context)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    while (_impl->inbound.empty())
    {
        if (_impl->closeRequested || _impl->peerClosed)
            return std::nullopt;
        if (lws_service(_impl->context, 50) < 0)
        {
            _impl->peerClosed = true;
            return makeError(ErrorCode::TransportError, "WebSocket event loop failed");
        }
    }

    auto frame = std::move(_impl->inbound.front());
    _impl->inbound.pop_front();
    return frame;
}

void WebSocketTransport::close()
{
    if (_impl->closeRequested.exchange(true))
        return;
    if (_impl->context)
        lws_cancel_service(_impl->context);
}

auto WebSocketTransport::isOpen() const -> bool
{
    return _impl->context && _impl->established && !_impl->peerClosed && !_impl->closeRequested;
}

} // namespace mcplink
