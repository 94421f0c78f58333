#pragma once

#include "mcpsrv/transport/http_error.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <unordered_map>

namespace mcpsrv {

using Json = nlohmann::json;

// ─────────────────────────────────────────────────────────────────────────────
// Case-Insensitive Header Lookup
// ─────────────────────────────────────────────────────────────────────────────
// HTTP header names are case-insensitive per RFC 7230. Parsed requests keep
// the client's spelling, so every lookup goes through these helpers.

using HeaderMap = std::unordered_map<std::string, std::string>;

inline bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::ranges::equal(a, b,
               [](char x, char y) {
                   return std::tolower(static_cast<unsigned char>(x)) ==
                          std::tolower(static_cast<unsigned char>(y));
               });
}

/// Find a header by name (case-insensitive).
inline HeaderMap::const_iterator find_header(
    const HeaderMap& headers,
    std::string_view name
) {
    return std::ranges::find_if(headers,
        [&name](const auto& pair) { return iequals(pair.first, name); });
}

/// Get header value by name (case-insensitive).
inline std::optional<std::string> get_header(
    const HeaderMap& headers,
    std::string_view name
) {
    const auto it = find_header(headers, name);
    const bool found = (it != headers.end());
    if (found) {
        return it->second;
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Method
// ─────────────────────────────────────────────────────────────────────────────

enum class HttpMethod {
    Get,
    Head,
    Post,
    Put,
    Delete,
    Options,
    Patch,
    Other
};

[[nodiscard]] std::string_view to_string(HttpMethod method) noexcept;

/// Case-sensitive, as method tokens are. Unknown tokens map to Other.
[[nodiscard]] HttpMethod parse_method(std::string_view token) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// HttpRequest
// ─────────────────────────────────────────────────────────────────────────────
// An incoming request. The head is filled by parse_request_head(); the body
// is read separately once its length is known.

struct HttpRequest {
    HttpMethod method{HttpMethod::Get};
    std::string method_token;   // As sent, e.g. "GET"
    std::string target;         // Raw request-target, e.g. "/messages?sessionId=..."
    std::string path;           // Normalized path, e.g. "/messages"
    std::string query;          // "?sessionId=..." (empty when absent)
    int version_minor{1};       // HTTP/1.<minor>
    HeaderMap headers;
    std::string body;

    [[nodiscard]] std::optional<std::string> header(std::string_view name) const {
        return get_header(headers, name);
    }

    /// Value of a query parameter, percent-decoded.
    [[nodiscard]] std::optional<std::string> query_param(std::string_view name) const;

    /// HTTP/1.1 persists unless "Connection: close"; HTTP/1.0 only with
    /// "Connection: keep-alive".
    [[nodiscard]] bool keep_alive() const;
};

// ─────────────────────────────────────────────────────────────────────────────
// HttpResponse
// ─────────────────────────────────────────────────────────────────────────────

struct HttpResponse {
    std::uint16_t status_code{200};
    HeaderMap headers;
    std::string body;

    HttpResponse& with_header(const std::string& name, const std::string& value) {
        headers[name] = value;
        return *this;
    }

    /// application/json body. `indent` follows Json::dump().
    static HttpResponse json(std::uint16_t status, const Json& payload, int indent = -1);

    /// text/plain body.
    static HttpResponse text(std::uint16_t status, std::string content);

    /// `{"error": message}` with the error's status (and Allow for 405).
    static HttpResponse from_error(const HttpError& error);
};

[[nodiscard]] std::string_view reason_phrase(std::uint16_t status) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Wire Format
// ─────────────────────────────────────────────────────────────────────────────

struct RequestTarget {
    std::string path;
    std::string query;
};

/// Split an origin-form request-target into normalized path and query
/// using ada-url. Anything other than "/..." is rejected.
[[nodiscard]] HttpResult<RequestTarget> parse_request_target(std::string_view target);

/// Percent-decode one path segment ("my%20tool" -> "my tool"). The path from
/// parse_request_target() stays encoded so that "%2F" cannot split segments.
[[nodiscard]] std::string decode_path_segment(std::string_view segment);

/// Parse request line and header fields. `head` is everything before the
/// blank line (the terminating CRLFCRLF may be included).
[[nodiscard]] HttpResult<HttpRequest> parse_request_head(std::string_view head);

/// Body length announced by the head. Fails with 501 for Transfer-Encoding,
/// 400 for an invalid Content-Length, 413 above `max_body_size`.
[[nodiscard]] HttpResult<std::size_t> request_body_length(const HttpRequest& request,
                                                          std::size_t max_body_size);

/// Status line, headers (Content-Length and Connection added) and body.
[[nodiscard]] std::string serialize_response(const HttpResponse& response, bool keep_alive);

/// Status line and headers of a response whose body is streamed until the
/// connection closes (no Content-Length).
[[nodiscard]] std::string serialize_stream_head(std::uint16_t status, const HeaderMap& headers);

}  // namespace mcpsrv
