#include "mcpsrv/transport/stdio_transport.hpp"

#include "mcpsrv/log/logger.hpp"
#include "mcpsrv/protocol/json_rpc.hpp"
#include "mcpsrv/protocol/mcp_types.hpp"
#include "mcpsrv/server/dispatcher.hpp"

#include <istream>
#include <ostream>
#include <string>
#include <utility>

namespace mcpsrv {
namespace {

TransportResult<void> state_error(std::string message) {
    return tl::unexpected(TransportError{
        TransportError::Category::State,
        std::move(message)});
}

TransportResult<void> io_error(std::string message) {
    return tl::unexpected(TransportError{
        TransportError::Category::Io,
        std::move(message)});
}

bool is_blank(std::string_view line) {
    return line.find_first_not_of(" \t\r\n") == std::string_view::npos;
}

}  // namespace

StdioTransport::StdioTransport(StdioTransportConfig config, const JsonRpcDispatcher& dispatcher)
    : config_(std::move(config)),
      dispatcher_(dispatcher) {}

const StdioTransportConfig& StdioTransport::config() const noexcept {
    return config_;
}

std::optional<Json> StdioTransport::handle_line(std::string_view line) const {
    if (is_blank(line)) {
        return std::nullopt;
    }

    if (line.size() > config_.max_line_length) {
        MCPSRV_LOG_WARN("Skipping {} byte line (limit {})", line.size(), config_.max_line_length);
        return make_error_response(nullptr, JsonRpcError::make(
            ErrorCode::InvalidRequest, "Invalid Request: message exceeds size limit"));
    }

    auto parsed = parse_json(line);
    if (!parsed) {
        MCPSRV_LOG_WARN("Parse error at byte {}: {}", parsed.error().position, parsed.error().message);
        return make_error_response(nullptr, JsonRpcError::make(ErrorCode::ParseError, "Parse error"));
    }

    MCPSRV_LOG_TRACE("<- {}", line);
    return dispatcher_.dispatch(*parsed);
}

TransportResult<void> StdioTransport::send(const Json& message) {
    if (config_.output == nullptr) {
        return state_error("output stream is not set");
    }

    const std::string body = dump_json(message);
    MCPSRV_LOG_TRACE("-> {}", body);

    std::ostream& out = *config_.output;
    out << body << '\n';
    if (config_.auto_flush) {
        out.flush();
    }
    if (!out) {
        return io_error("failed to write to output stream");
    }
    return {};
}

TransportResult<void> StdioTransport::run() {
    if ((config_.input == nullptr) || (config_.output == nullptr)) {
        return state_error("input and output streams must be set");
    }

    MCPSRV_LOG_INFO("Serving MCP over stdio");

    std::istream& in = *config_.input;
    std::string line;
    while (std::getline(in, line)) {
        if ((line.empty() == false) && (line.back() == '\r')) {
            line.pop_back();
        }

        auto response = handle_line(line);
        if (response.has_value() == false) {
            continue;
        }

        auto sent = send(*response);
        if (!sent) {
            MCPSRV_LOG_ERROR("stdio output failed: {}", sent.error().message);
            return sent;
        }
    }

    if (in.bad()) {
        return io_error("failed to read from input stream");
    }

    MCPSRV_LOG_INFO("stdio input closed");
    return {};
}

}  // namespace mcpsrv
