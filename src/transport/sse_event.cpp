#include "mcpsrv/transport/sse_event.hpp"

#include "mcpsrv/protocol/mcp_types.hpp"

namespace mcpsrv {

std::string format_sse_event(const SseEvent& event) {
    std::string out;
    out.reserve(event.data.size() + 32);

    if (event.event.has_value()) {
        out.append("event: ").append(*event.event).append("\n");
    }

    // A payload line break would end the field early; split into data lines
    std::string_view rest = event.data;
    while (true) {
        const auto newline = rest.find('\n');
        std::string_view line = rest.substr(0, newline);
        if ((line.empty() == false) && (line.back() == '\r')) {
            line.remove_suffix(1);
        }
        out.append("data: ").append(line).append("\n");
        if (newline == std::string_view::npos) {
            break;
        }
        rest.remove_prefix(newline + 1);
    }

    out.append("\n");
    return out;
}

std::string make_endpoint_event(std::string_view session_id) {
    std::string url(kMessagesPath);
    url.append("?sessionId=").append(session_id);
    return format_sse_event(SseEvent{"endpoint", std::move(url)});
}

std::string make_message_event(const Json& envelope) {
    return format_sse_event(SseEvent{"message", dump_json(envelope)});
}

HeaderMap sse_response_headers() {
    return HeaderMap{
        {"Content-Type", "text/event-stream"},
        {"Cache-Control", "no-cache, no-transform"},
        {"Connection", "keep-alive"},
        {"X-Accel-Buffering", "no"},
    };
}

}  // namespace mcpsrv
