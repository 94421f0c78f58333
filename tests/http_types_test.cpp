#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "mcpsrv/transport/http_types.hpp"

using namespace mcpsrv;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;
using Catch::Matchers::EndsWith;

// ─────────────────────────────────────────────────────────────────────────────
// Header Helpers
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Header lookup is case-insensitive", "[http][headers]") {
    HeaderMap headers{{"Content-Type", "application/json"}};

    REQUIRE(get_header(headers, "content-type") == "application/json");
    REQUIRE(get_header(headers, "CONTENT-TYPE") == "application/json");
    REQUIRE_FALSE(get_header(headers, "Content-Length").has_value());
    REQUIRE(find_header(headers, "accept") == headers.end());
}

TEST_CASE("Method tokens are parsed case-sensitively", "[http]") {
    REQUIRE(parse_method("GET") == HttpMethod::Get);
    REQUIRE(parse_method("POST") == HttpMethod::Post);
    REQUIRE(parse_method("get") == HttpMethod::Other);
    REQUIRE(parse_method("BREW") == HttpMethod::Other);
    REQUIRE(to_string(HttpMethod::Delete) == "DELETE");
}

// ─────────────────────────────────────────────────────────────────────────────
// Request Head
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("parse_request_head reads request line and headers", "[http][parse]") {
    auto request = parse_request_head(
        "POST /messages?sessionId=abc HTTP/1.1\r\n"
        "Host: localhost:8000\r\n"
        "Content-Type:  application/json \r\n"
        "Content-Length: 12\r\n"
        "\r\n");

    REQUIRE(request.has_value());
    REQUIRE(request->method == HttpMethod::Post);
    REQUIRE(request->method_token == "POST");
    REQUIRE(request->target == "/messages?sessionId=abc");
    REQUIRE(request->path == "/messages");
    REQUIRE(request->query == "?sessionId=abc");
    REQUIRE(request->version_minor == 1);
    REQUIRE(request->header("content-type") == "application/json");
    REQUIRE(request->header("Content-Length") == "12");
}

TEST_CASE("parse_request_head tolerates leading blank lines and bare LF", "[http][parse]") {
    auto request = parse_request_head("\r\n\nGET /health HTTP/1.0\nAccept: */*\n\n");

    REQUIRE(request.has_value());
    REQUIRE(request->path == "/health");
    REQUIRE(request->version_minor == 0);
    REQUIRE(request->header("Accept") == "*/*");
}

TEST_CASE("parse_request_head combines repeated header fields", "[http][parse]") {
    auto request = parse_request_head(
        "GET /tools HTTP/1.1\r\n"
        "Accept: text/plain\r\n"
        "accept: application/json\r\n"
        "\r\n");

    REQUIRE(request.has_value());
    REQUIRE(request->headers.size() == 1);
    REQUIRE(request->header("Accept") == "text/plain, application/json");
}

TEST_CASE("parse_request_head rejects malformed heads with 400", "[http][parse][error]") {
    const char* bad_heads[] = {
        "",
        "GET\r\n\r\n",
        "GET /health\r\n\r\n",
        "GET /health HTTP/2.0\r\n\r\n",
        "G(T /health HTTP/1.1\r\n\r\n",
        "GET http://example.com/ HTTP/1.1\r\n\r\n",
        "GET /health HTTP/1.1\r\nNoColonHere\r\n\r\n",
        "GET /health HTTP/1.1\r\nBad Name: x\r\n\r\n",
        "GET /health HTTP/1.1\r\nX-One: a\r\n  folded\r\n\r\n",
    };

    for (const char* head : bad_heads) {
        CAPTURE(head);
        auto request = parse_request_head(head);
        REQUIRE_FALSE(request.has_value());
        REQUIRE(request.error().status() == 400);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Request Target
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("parse_request_target normalizes the path", "[http][target]") {
    auto plain = parse_request_target("/tools/get_usage");
    REQUIRE(plain.has_value());
    REQUIRE(plain->path == "/tools/get_usage");
    REQUIRE(plain->query.empty());

    auto dotted = parse_request_target("/tools/../health");
    REQUIRE(dotted.has_value());
    REQUIRE(dotted->path == "/health");

    REQUIRE_FALSE(parse_request_target("").has_value());
    REQUIRE_FALSE(parse_request_target("*").has_value());
    REQUIRE_FALSE(parse_request_target("//evil.example/x").has_value());
}

TEST_CASE("Path segments are percent-decoded on demand", "[http][target]") {
    auto target = parse_request_target("/tools/my%20tool");
    REQUIRE(target.has_value());
    REQUIRE(target->path == "/tools/my%20tool");

    REQUIRE(decode_path_segment("my%20tool") == "my tool");
    REQUIRE(decode_path_segment("caf%C3%A9") == "caf\xc3\xa9");
    REQUIRE(decode_path_segment("a%2Fb") == "a/b");
    REQUIRE(decode_path_segment("get_usage") == "get_usage");
    REQUIRE(decode_path_segment("") == "");
}

TEST_CASE("query_param decodes values", "[http][target]") {
    auto request = parse_request_head("POST /messages?sessionId=a%2Db&x=1 HTTP/1.1\r\n\r\n");
    REQUIRE(request.has_value());

    REQUIRE(request->query_param("sessionId") == "a-b");
    REQUIRE(request->query_param("x") == "1");
    REQUIRE_FALSE(request->query_param("missing").has_value());

    HttpRequest no_query;
    REQUIRE_FALSE(no_query.query_param("sessionId").has_value());
}

// ─────────────────────────────────────────────────────────────────────────────
// Connection Semantics
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("keep_alive follows the HTTP version defaults", "[http]") {
    HttpRequest request;

    request.version_minor = 1;
    REQUIRE(request.keep_alive());
    request.headers["Connection"] = "Close";
    REQUIRE_FALSE(request.keep_alive());

    request.headers.clear();
    request.version_minor = 0;
    REQUIRE_FALSE(request.keep_alive());
    request.headers["connection"] = "keep-alive";
    REQUIRE(request.keep_alive());
}

TEST_CASE("request_body_length validates framing", "[http][body]") {
    HttpRequest request;

    SECTION("No Content-Length means no body") {
        REQUIRE(*request_body_length(request, 1024) == 0);
    }

    SECTION("Valid length") {
        request.headers["Content-Length"] = "512";
        REQUIRE(*request_body_length(request, 1024) == 512);
    }

    SECTION("Above the limit is 413") {
        request.headers["Content-Length"] = "2048";
        auto length = request_body_length(request, 1024);
        REQUIRE_FALSE(length.has_value());
        REQUIRE(length.error().status() == 413);
    }

    SECTION("Non-numeric or conflicting values are 400") {
        for (const char* value : {"abc", "-1", "12 ", "5, 7"}) {
            request.headers["Content-Length"] = value;
            auto length = request_body_length(request, 1024);
            REQUIRE_FALSE(length.has_value());
            REQUIRE(length.error().status() == 400);
        }
    }

    SECTION("Transfer-Encoding is 501") {
        request.headers["Transfer-Encoding"] = "chunked";
        auto length = request_body_length(request, 1024);
        REQUIRE_FALSE(length.has_value());
        REQUIRE(length.error().status() == 501);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Responses
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("serialize_response frames the body", "[http][response]") {
    auto response = HttpResponse::text(202, "Accepted");

    const std::string wire = serialize_response(response, true);

    REQUIRE_THAT(wire, StartsWith("HTTP/1.1 202 Accepted\r\n"));
    REQUIRE_THAT(wire, ContainsSubstring("Content-Type: text/plain; charset=utf-8\r\n"));
    REQUIRE_THAT(wire, ContainsSubstring("Content-Length: 8\r\n"));
    REQUIRE_THAT(wire, ContainsSubstring("Connection: keep-alive\r\n"));
    REQUIRE_THAT(wire, EndsWith("\r\n\r\nAccepted"));

    REQUIRE_THAT(serialize_response(response, false), ContainsSubstring("Connection: close\r\n"));
}

TEST_CASE("serialize_response overrides caller framing headers", "[http][response]") {
    auto response = HttpResponse::json(200, Json{{"ok", true}});
    response.with_header("Content-Length", "999").with_header("Connection", "upgrade");

    const std::string wire = serialize_response(response, true);

    REQUIRE(wire.find("999") == std::string::npos);
    REQUIRE(wire.find("upgrade") == std::string::npos);
    REQUIRE_THAT(wire, ContainsSubstring("Content-Length: 11\r\n"));
}

TEST_CASE("from_error produces an error body and Allow for 405", "[http][response][error]") {
    auto not_found = HttpResponse::from_error(HttpError::not_found("Session not found"));
    REQUIRE(not_found.status_code == 404);
    REQUIRE(Json::parse(not_found.body) == Json{{"error", "Session not found"}});
    REQUIRE(get_header(not_found.headers, "Content-Type") == "application/json");
    REQUIRE_FALSE(get_header(not_found.headers, "Allow").has_value());

    auto not_allowed = HttpResponse::from_error(HttpError::method_not_allowed("POST"));
    REQUIRE(not_allowed.status_code == 405);
    REQUIRE(get_header(not_allowed.headers, "Allow") == "POST");
}

TEST_CASE("serialize_stream_head has no Content-Length", "[http][response]") {
    const std::string head = serialize_stream_head(200, HeaderMap{{"Content-Type", "text/event-stream"}});

    REQUIRE_THAT(head, StartsWith("HTTP/1.1 200 OK\r\n"));
    REQUIRE_THAT(head, ContainsSubstring("Content-Type: text/event-stream\r\n"));
    REQUIRE_THAT(head, EndsWith("\r\n\r\n"));
    REQUIRE(head.find("Content-Length") == std::string::npos);
}
