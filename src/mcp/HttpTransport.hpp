// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>
#include <mcp/Transport.hpp>

#include <chrono>
#include <memory>

namespace mcplink
{

/// @brief Request/response transport: every frame is POSTed to the server URL.
///
/// There is no persistent channel and no receive stream. send() returns the HTTP
/// response body, which is the reply correlated with the posted request.
class HttpTransport: public Transport
{
  public:
    explicit HttpTransport(HttpConfig config, std::chrono::milliseconds requestTimeout = std::chrono::seconds(30));
    ~HttpTransport() override;

    [[nodiscard]] auto open() -> VoidResult override;
    [[nodiscard]] auto send(std::string_view frame) -> Result<std::optional<std::string>> override;
    [[nodiscard]] auto exchange(std::string_view frame, std::chrono::milliseconds timeout)
        -> Result<std::optional<std::string>> override;

    /// @brief Always reports end of sequence; HTTP has no inbound stream.
    [[nodiscard]] auto receive() -> Result<std::optional<std::string>> override;
    void close() override;
    [[nodiscard]] auto isOpen() const -> bool override;
    [[nodiscard]] auto hasReceiveStream() const -> bool override { return false; }

    /// @brief Splits an http(s) URL into its scheme-host-port base and request path.
    /// @return {base, path}, or a ConnectionError for anything that is not an http(s) URL.
    [[nodiscard]] static auto splitUrl(std::string_view url) -> Result<std::pair<std::string, std::string>>;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcplink
