#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Transport Common Types
// ═══════════════════════════════════════════════════════════════════════════
// Shared types used by both server transports.
//
// For the stdio transport, use: #include "mcpsrv/transport/stdio_transport.hpp"
// For the HTTP+SSE transport, use: #include "mcpsrv/transport/http_sse_transport.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include <tl/expected.hpp>

namespace mcpsrv {

using Json = nlohmann::json;

/// Error type for transport operations
struct TransportError {
    enum class Category { Io, Bind, Protocol, State };

    Category category{};
    std::string message;
};

/// Result type for transport operations
template <typename T>
using TransportResult = tl::expected<T, TransportError>;

}  // namespace mcpsrv
