// SPDX-License-Identifier: Apache-2.0
#include "HttpTransport.hpp"

#include <core/Log.hpp>

#include <httplib.h>

#include <atomic>
#include <format>

namespace mcplink
{

struct HttpTransport::Impl
{
    HttpConfig config;
    std::chrono::milliseconds requestTimeout;
    std::string base;
    std::string path;
    std::atomic<bool> connected = false;
};

HttpTransport::HttpTransport(HttpConfig config, std::chrono::milliseconds requestTimeout):
    _impl(std::make_unique<Impl>())
{
    _impl->config = std::move(config);
    _impl->requestTimeout = requestTimeout;
}

HttpTransport::~HttpTransport() = default;

auto HttpTransport::splitUrl(std::string_view url) -> Result<std::pair<std::string, std::string>>
{
    auto const schemeEnd = url.find("://");
    if (schemeEnd == std::string_view::npos)
        return makeError(ErrorCode::ConnectionError, std::format("Invalid HTTP URL: '{}'", url));

    auto const scheme = url.substr(0, schemeEnd);
    if (scheme != "http" && scheme != "https")
        return makeError(ErrorCode::ConnectionError, std::format("Unsupported URL scheme '{}'", scheme));

    auto const pathStart = url.find('/', schemeEnd + 3);
    if (pathStart == schemeEnd + 3)
        return makeError(ErrorCode::ConnectionError, std::format("HTTP URL without host: '{}'", url));
    if (pathStart == std::string_view::npos)
        return std::pair { std::string(url), std::string("/") };
    return std::pair { std::string(url.substr(0, pathStart)), std::string(url.substr(pathStart)) };
}

auto HttpTransport::open() -> VoidResult
{
    auto parts = splitUrl(_impl->config.url);
    if (!parts)
        return std::unexpected(parts.error());

    _impl->base = std::move(parts->first);
    _impl->path = std::move(parts->second);
    _impl->connected = true;
    log::info("MCP HTTP endpoint: {}{}", _impl->base, _impl->path);
    return {};
}

auto HttpTransport::send(std::string_view frame) -> Result<std::optional<std::string>>
{
    return exchange(frame, _impl->requestTimeout);
}

auto HttpTransport::exchange(std::string_view frame, std::chrono::milliseconds timeout)
    -> Result<std::optional<std::string>>
{
    if (!_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    auto const timeoutSeconds = std::chrono::duration_cast<std::chrono::seconds>(timeout).count();
    auto const timeoutRemainder =
        std::chrono::duration_cast<std::chrono::microseconds>(timeout - std::chrono::seconds(timeoutSeconds));

    httplib::Client cli(_impl->base);
    cli.set_connection_timeout(timeoutSeconds, timeoutRemainder.count());
    cli.set_read_timeout(timeoutSeconds, timeoutRemainder.count());
    cli.set_write_timeout(timeoutSeconds, timeoutRemainder.count());

    httplib::Headers headers = {
        { "Accept", "application/json" },
    };

    auto const started = std::chrono::steady_clock::now();
    auto res = cli.Post(_impl->path, headers, std::string(frame), "application/json");
    if (!res)
    {
        auto const error = res.error();
        auto const elapsed = std::chrono::steady_clock::now() - started;

        // A read error is also what a peer dropping the connection mid-response
        // produces; only one that ran into the deadline is a timeout.
        auto const timedOut = error == httplib::Error::Read && elapsed >= timeout - timeout / 10;
        return makeError(timedOut ? ErrorCode::TimeoutError : ErrorCode::TransportError,
                         std::format("HTTP request to {}{} failed: {}", _impl->base, _impl->path, httplib::to_string(error)));
    }

    if (res->status < 200 || res->status >= 300)
    {
        return makeError(ErrorCode::TransportError,
                         std::format("HTTP server returned status {}: {}", res->status, res->body));
    }

    if (res->body.find_first_not_of(" \t\r\n") == std::string::npos)
        return std::nullopt;

    return std::optional<std::string> { std::move(res->body) };
}

auto HttpTransport::receive() -> Result<std::optional<std::string>>
{
    return std::nullopt;
}

void HttpTransport::close()
{
    _impl->connected = false;
}

auto HttpTransport::isOpen() const -> bool
{
    return _impl->connected;
}

} // namespace mcplink
