#pragma once

#include "mcpsrv/transport/http_types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace mcpsrv {

/// One outbound Server-Sent Event.
///
/// Wire format (https://html.spec.whatwg.org/multipage/server-sent-events.html):
///   event: <event-type>     (omitted -> client treats it as "message")
///   data: <payload line>    (one per line of payload)
///   <blank line>            (ends the event)
struct SseEvent {
    std::optional<std::string> event;
    std::string data;
};

/// Path clients POST JSON-RPC messages to for a given session.
inline constexpr std::string_view kMessagesPath = "/messages";

/// Comment frame written when a stream has been idle for the keepalive
/// interval. Clients ignore it.
inline constexpr std::string_view kSseKeepalive = ": keepalive\n\n";

[[nodiscard]] std::string format_sse_event(const SseEvent& event);

/// `event: endpoint` carrying "/messages?sessionId=<id>".
[[nodiscard]] std::string make_endpoint_event(std::string_view session_id);

/// `event: message` carrying one compact JSON envelope.
[[nodiscard]] std::string make_message_event(const Json& envelope);

/// text/event-stream response headers (no-cache, no-transform, keep-alive).
[[nodiscard]] HeaderMap sse_response_headers();

}  // namespace mcpsrv
