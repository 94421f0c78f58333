#ifndef MCPSRV_TRANSPORT_HTTP_ERROR_HPP
#define MCPSRV_TRANSPORT_HTTP_ERROR_HPP

#include <cstddef>
#include <cstdint>
#include <string>

#include <tl/expected.hpp>

namespace mcpsrv {

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Error Types
// ─────────────────────────────────────────────────────────────────────────────
// A request the server answers with a non-2xx status. The message becomes
// the `{"error": ...}` body.

struct HttpError {
    enum class Code {
        BadRequest,         // Malformed head, invalid JSON body
        NotFound,           // Unknown path, session or tool
        MethodNotAllowed,   // Known path, wrong method
        PayloadTooLarge,    // Body above max_body_size
        NotImplemented,     // Transfer-Encoding bodies
        Internal            // Dispatch or tool failure
    };

    Code code;
    std::string message;
    std::string allow{};  // Allowed methods, only for MethodNotAllowed

    [[nodiscard]] std::uint16_t status() const noexcept {
        switch (code) {
            case Code::BadRequest:       return 400;
            case Code::NotFound:         return 404;
            case Code::MethodNotAllowed: return 405;
            case Code::PayloadTooLarge:  return 413;
            case Code::NotImplemented:   return 501;
            case Code::Internal:         return 500;
        }
        return 500;
    }

    static HttpError bad_request(const std::string& msg) {
        return {Code::BadRequest, msg};
    }

    static HttpError not_found(const std::string& msg = "Not found") {
        return {Code::NotFound, msg};
    }

    static HttpError method_not_allowed(const std::string& allowed_methods) {
        return {Code::MethodNotAllowed, "Method not allowed", allowed_methods};
    }

    static HttpError payload_too_large(std::size_t limit) {
        return {Code::PayloadTooLarge, "Request body exceeds " + std::to_string(limit) + " bytes"};
    }

    static HttpError not_implemented(const std::string& msg) {
        return {Code::NotImplemented, msg};
    }

    static HttpError internal(const std::string& msg) {
        return {Code::Internal, msg};
    }
};

template <typename T>
using HttpResult = tl::expected<T, HttpError>;

}  // namespace mcpsrv

#endif  // MCPSRV_TRANSPORT_HTTP_ERROR_HPP
