#pragma once

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string_view>

#include "mcpsrv/transport.hpp"

namespace mcpsrv {

class JsonRpcDispatcher;

struct StdioTransportConfig {
    std::istream* input{nullptr};
    std::ostream* output{nullptr};
    bool auto_flush{true};
    std::size_t max_line_length{1 << 20};  // 1 MiB default
};

/// Newline-delimited JSON-RPC over one input/output stream pair.
///
/// One implicit session, strictly synchronous: each line is parsed,
/// dispatched and answered (one line, flushed) before the next is read.
/// Unparseable lines are answered with a -32700 envelope (id null) and
/// skipped. run() returns on end of input, or with an error when the
/// output stream fails.
class StdioTransport {
public:
    StdioTransport(StdioTransportConfig config, const JsonRpcDispatcher& dispatcher);

    [[nodiscard]] TransportResult<void> run();

    /// Process one line; returns the envelope to write, if any.
    [[nodiscard]] std::optional<Json> handle_line(std::string_view line) const;

    [[nodiscard]] TransportResult<void> send(const Json& message);

    [[nodiscard]] const StdioTransportConfig& config() const noexcept;

private:
    StdioTransportConfig config_;
    const JsonRpcDispatcher& dispatcher_;
};

}  // namespace mcpsrv
