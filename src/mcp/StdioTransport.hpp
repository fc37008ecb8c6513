// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>
#include <mcp/Transport.hpp>

#include <memory>
#include <string>
#include <vector>

namespace mcplink
{

/// @brief Transport that talks to an MCP server child process over its standard streams.
///
/// One JSON document per line is written to the child's stdin and read from its
/// stdout. The child's stderr is drained separately and kept as diagnostics; it is
/// never interpreted as protocol data. Exit of the child ends the receive sequence.
class StdioTransport: public Transport
{
  public:
    explicit StdioTransport(StdioConfig config);
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    [[nodiscard]] auto open() -> VoidResult override;
    [[nodiscard]] auto send(std::string_view frame) -> Result<std::optional<std::string>> override;
    [[nodiscard]] auto receive() -> Result<std::optional<std::string>> override;
    void close() override;
    [[nodiscard]] auto isOpen() const -> bool override;

    /// @brief Returns the most recent lines the child wrote to stderr.
    [[nodiscard]] auto diagnostics() const -> std::vector<std::string>;

    /// @brief Maximum number of stderr lines retained.
    static constexpr std::size_t MaxDiagnosticLines = 50;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcplink
