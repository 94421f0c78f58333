#include "mcpsrv/transport/http_types.hpp"

#include "mcpsrv/protocol/mcp_types.hpp"

#include <ada.h>

#include <charconv>

namespace mcpsrv {

namespace {

constexpr std::string_view kCrlf = "\r\n";

// Placeholder origin so ada can resolve an origin-form target
constexpr std::string_view kTargetBase = "http://localhost";

std::string_view trim_ows(std::string_view value) {
    while ((value.empty() == false) && ((value.front() == ' ') || (value.front() == '\t'))) {
        value.remove_prefix(1);
    }
    while ((value.empty() == false) && ((value.back() == ' ') || (value.back() == '\t'))) {
        value.remove_suffix(1);
    }
    return value;
}

bool is_token_char(char c) {
    if (std::isalnum(static_cast<unsigned char>(c)) != 0) {
        return true;
    }
    constexpr std::string_view kSpecials = "!#$%&'*+-.^_`|~";
    return kSpecials.find(c) != std::string_view::npos;
}

bool is_token(std::string_view text) {
    return (text.empty() == false) && std::ranges::all_of(text, is_token_char);
}

// Next line without its terminator; tolerates bare LF
std::string_view next_line(std::string_view& rest) {
    const auto end = rest.find('\n');
    std::string_view line = rest.substr(0, end);
    rest = (end == std::string_view::npos) ? std::string_view{} : rest.substr(end + 1);
    if ((line.empty() == false) && (line.back() == '\r')) {
        line.remove_suffix(1);
    }
    return line;
}

HttpResult<void> parse_request_line(std::string_view line, HttpRequest& request) {
    const auto first_space = line.find(' ');
    const auto last_space = line.rfind(' ');
    if ((first_space == std::string_view::npos) || (first_space == last_space)) {
        return tl::unexpected(HttpError::bad_request("Malformed request line"));
    }

    const std::string_view method = line.substr(0, first_space);
    const std::string_view target = line.substr(first_space + 1, last_space - first_space - 1);
    const std::string_view version = line.substr(last_space + 1);

    if (is_token(method) == false) {
        return tl::unexpected(HttpError::bad_request("Malformed request method"));
    }
    if ((version == "HTTP/1.1") == false && (version == "HTTP/1.0") == false) {
        return tl::unexpected(HttpError::bad_request("Unsupported HTTP version"));
    }

    auto parsed_target = parse_request_target(target);
    if (!parsed_target) {
        return tl::unexpected(parsed_target.error());
    }

    request.method_token = std::string(method);
    request.method = parse_method(method);
    request.target = std::string(target);
    request.path = std::move(parsed_target->path);
    request.query = std::move(parsed_target->query);
    request.version_minor = (version == "HTTP/1.1") ? 1 : 0;
    return {};
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Methods
// ─────────────────────────────────────────────────────────────────────────────

std::string_view to_string(HttpMethod method) noexcept {
    switch (method) {
        case HttpMethod::Get:     return "GET";
        case HttpMethod::Head:    return "HEAD";
        case HttpMethod::Post:    return "POST";
        case HttpMethod::Put:     return "PUT";
        case HttpMethod::Delete:  return "DELETE";
        case HttpMethod::Options: return "OPTIONS";
        case HttpMethod::Patch:   return "PATCH";
        case HttpMethod::Other:   return "OTHER";
    }
    return "OTHER";
}

HttpMethod parse_method(std::string_view token) noexcept {
    if (token == "GET")     { return HttpMethod::Get; }
    if (token == "HEAD")    { return HttpMethod::Head; }
    if (token == "POST")    { return HttpMethod::Post; }
    if (token == "PUT")     { return HttpMethod::Put; }
    if (token == "DELETE")  { return HttpMethod::Delete; }
    if (token == "OPTIONS") { return HttpMethod::Options; }
    if (token == "PATCH")   { return HttpMethod::Patch; }
    return HttpMethod::Other;
}

// ─────────────────────────────────────────────────────────────────────────────
// HttpRequest
// ─────────────────────────────────────────────────────────────────────────────

std::optional<std::string> HttpRequest::query_param(std::string_view name) const {
    if (query.empty()) {
        return std::nullopt;
    }
    ada::url_search_params params(query);
    const auto value = params.get(name);
    if (value.has_value() == false) {
        return std::nullopt;
    }
    return std::string(*value);
}

bool HttpRequest::keep_alive() const {
    const auto connection = header("Connection");
    if (version_minor >= 1) {
        return (connection.has_value() == false) || (iequals(*connection, "close") == false);
    }
    return connection.has_value() && iequals(*connection, "keep-alive");
}

// ─────────────────────────────────────────────────────────────────────────────
// HttpResponse
// ─────────────────────────────────────────────────────────────────────────────

HttpResponse HttpResponse::json(std::uint16_t status, const Json& payload, int indent) {
    HttpResponse response;
    response.status_code = status;
    response.headers["Content-Type"] = "application/json";
    response.body = dump_json(payload, indent);
    return response;
}

HttpResponse HttpResponse::text(std::uint16_t status, std::string content) {
    HttpResponse response;
    response.status_code = status;
    response.headers["Content-Type"] = "text/plain; charset=utf-8";
    response.body = std::move(content);
    return response;
}

HttpResponse HttpResponse::from_error(const HttpError& error) {
    auto response = json(error.status(), Json{{"error", error.message}});
    if ((error.code == HttpError::Code::MethodNotAllowed) && (error.allow.empty() == false)) {
        response.headers["Allow"] = error.allow;
    }
    return response;
}

std::string_view reason_phrase(std::uint16_t status) noexcept {
    switch (status) {
        case 200: return "OK";
        case 202: return "Accepted";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 503: return "Service Unavailable";
        default:  return "Unknown";
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Wire Format
// ─────────────────────────────────────────────────────────────────────────────

HttpResult<RequestTarget> parse_request_target(std::string_view target) {
    const bool origin_form = (target.empty() == false) && (target.front() == '/') &&
                             ((target.size() < 2) || (target[1] != '/'));
    if (origin_form == false) {
        return tl::unexpected(HttpError::bad_request("Request target must be an absolute path"));
    }

    std::string absolute(kTargetBase);
    absolute.append(target);
    auto parsed = ada::parse<ada::url>(absolute);
    if (!parsed) {
        return tl::unexpected(HttpError::bad_request("Malformed request target"));
    }

    RequestTarget result;
    result.path = std::string(parsed->get_pathname());
    result.query = std::string(parsed->get_search());
    if (result.path.empty()) {
        result.path = "/";
    }
    return result;
}

std::string decode_path_segment(std::string_view segment) {
    const auto first_percent = segment.find('%');
    if (first_percent == std::string_view::npos) {
        return std::string(segment);
    }
    return ada::unicode::percent_decode(segment, first_percent);
}

HttpResult<HttpRequest> parse_request_head(std::string_view head) {
    HttpRequest request;
    std::string_view rest = head;

    // RFC 7230 3.5: ignore leading empty lines
    std::string_view line = next_line(rest);
    while (line.empty() && (rest.empty() == false)) {
        line = next_line(rest);
    }
    if (line.empty()) {
        return tl::unexpected(HttpError::bad_request("Empty request"));
    }

    auto request_line = parse_request_line(line, request);
    if (!request_line) {
        return tl::unexpected(request_line.error());
    }

    while (rest.empty() == false) {
        line = next_line(rest);
        if (line.empty()) {
            break;
        }
        if ((line.front() == ' ') || (line.front() == '\t')) {
            return tl::unexpected(HttpError::bad_request("Obsolete header line folding"));
        }

        const auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            return tl::unexpected(HttpError::bad_request("Malformed header field"));
        }
        const std::string_view name = line.substr(0, colon);
        if (is_token(name) == false) {
            return tl::unexpected(HttpError::bad_request("Malformed header name"));
        }
        const std::string_view value = trim_ows(line.substr(colon + 1));

        // Repeated fields combine into one comma-separated value
        const auto existing = std::ranges::find_if(request.headers,
            [&name](const auto& pair) { return iequals(pair.first, name); });
        if (existing != request.headers.end()) {
            existing->second.append(", ").append(value);
        } else {
            request.headers.emplace(std::string(name), std::string(value));
        }
    }

    return request;
}

HttpResult<std::size_t> request_body_length(const HttpRequest& request, std::size_t max_body_size) {
    if (request.header("Transfer-Encoding").has_value()) {
        return tl::unexpected(HttpError::not_implemented("Transfer-Encoding is not supported"));
    }

    const auto content_length = request.header("Content-Length");
    if (content_length.has_value() == false) {
        return std::size_t{0};
    }

    std::size_t length = 0;
    const auto* const first = content_length->data();
    const auto* const last = first + content_length->size();
    const auto [ptr, ec] = std::from_chars(first, last, length);
    if ((ec != std::errc{}) || (ptr != last)) {
        // Also rejects a repeated header with differing values ("5, 7")
        return tl::unexpected(HttpError::bad_request("Invalid Content-Length"));
    }
    if (length > max_body_size) {
        return tl::unexpected(HttpError::payload_too_large(max_body_size));
    }
    return length;
}

std::string serialize_response(const HttpResponse& response, bool keep_alive) {
    std::string out;
    out.reserve(128 + response.body.size());

    out.append("HTTP/1.1 ")
       .append(std::to_string(response.status_code))
       .append(" ")
       .append(reason_phrase(response.status_code))
       .append(kCrlf);

    for (const auto& [name, value] : response.headers) {
        if (iequals(name, "Content-Length") || iequals(name, "Connection")) {
            continue;
        }
        out.append(name).append(": ").append(value).append(kCrlf);
    }
    out.append("Content-Length: ").append(std::to_string(response.body.size())).append(kCrlf);
    out.append("Connection: ").append(keep_alive ? "keep-alive" : "close").append(kCrlf);
    out.append(kCrlf);
    out.append(response.body);
    return out;
}

std::string serialize_stream_head(std::uint16_t status, const HeaderMap& headers) {
    std::string out;
    out.append("HTTP/1.1 ")
       .append(std::to_string(status))
       .append(" ")
       .append(reason_phrase(status))
       .append(kCrlf);
    for (const auto& [name, value] : headers) {
        out.append(name).append(": ").append(value).append(kCrlf);
    }
    out.append(kCrlf);
    return out;
}

}  // namespace mcpsrv
