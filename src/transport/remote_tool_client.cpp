#include "mcpsrv/transport/remote_tool_client.hpp"

#include "mcpsrv/log/logger.hpp"

#include <cpr/cpr.h>

#include <utility>

namespace mcpsrv {

namespace {

ToolError unknown_service(std::string_view service) {
    return ToolError{"Service '" + std::string(service) +
                     "' not found. Check " + kServicesEnv + " environment variable."};
}

std::string join_url(const std::string& base, std::string_view path) {
    std::string url = base;
    while ((url.empty() == false) && (url.back() == '/')) {
        url.pop_back();
    }
    url.append(path);
    return url;
}

// Transport failures carry no HTTP status
ToolError transport_failure(const cpr::Response& response) {
    return ToolError{"Remote server call failed: " + response.error.message};
}

// "<status> <error from body, or the status line>"
ToolError status_failure(const cpr::Response& response) {
    std::string detail = response.reason;
    if (detail.empty()) {
        detail = response.status_line;
    }
    auto body = Json::parse(response.text, nullptr, false);
    if (body.is_object()) {
        const auto it = body.find("error");
        if ((it != body.end()) && it->is_string()) {
            detail = it->get<std::string>();
        }
    }
    return ToolError{"Remote server call failed: " + std::to_string(response.status_code) + " " + detail};
}

}  // namespace

RemoteToolClient::RemoteToolClient(ServiceMap services, std::chrono::milliseconds timeout)
    : services_(std::move(services))
    , timeout_(timeout)
{}

std::optional<std::string> RemoteToolClient::endpoint(std::string_view service) const {
    const auto it = services_.find(service);
    if (it == services_.end()) {
        return std::nullopt;
    }
    return it->second;
}

ToolResult RemoteToolClient::call(std::string_view service, std::string_view tool, const Json& arguments) const {
    const auto base = endpoint(service);
    if (base.has_value() == false) {
        return tl::unexpected(unknown_service(service));
    }

    const std::string url = join_url(*base, "/tools/" + std::string(tool));
    const Json body{{"arguments", arguments.is_null() ? Json::object() : arguments}};
    MCPSRV_LOG_DEBUG("Calling {} on {}", tool, url);

    auto response = cpr::Post(
        cpr::Url{url},
        cpr::Header{{"Content-Type", "application/json"}},
        cpr::Body{dump_json(body)},
        cpr::Timeout{timeout_}
    );

    if (response.error.code != cpr::ErrorCode::OK) {
        MCPSRV_LOG_WARN("Remote call {} failed: {}", url, response.error.message);
        return tl::unexpected(transport_failure(response));
    }
    if (response.status_code != 200) {
        MCPSRV_LOG_WARN("Remote call {} returned {}", url, response.status_code);
        return tl::unexpected(status_failure(response));
    }

    auto result = Json::parse(response.text, nullptr, false);
    if (result.is_discarded()) {
        return tl::unexpected(ToolError{"Remote server call failed: response is not JSON"});
    }
    return result;
}

tl::expected<std::vector<Tool>, ToolError> RemoteToolClient::list_tools(std::string_view service) const {
    const auto base = endpoint(service);
    if (base.has_value() == false) {
        return tl::unexpected(unknown_service(service));
    }

    auto response = cpr::Get(cpr::Url{join_url(*base, "/tools")}, cpr::Timeout{timeout_});
    if (response.error.code != cpr::ErrorCode::OK) {
        return tl::unexpected(transport_failure(response));
    }
    if (response.status_code != 200) {
        return tl::unexpected(status_failure(response));
    }

    auto body = Json::parse(response.text, nullptr, false);
    if ((body.is_object() == false) || (body.contains("tools") == false) || (body["tools"].is_array() == false)) {
        return tl::unexpected(ToolError{"Remote server call failed: malformed tool list"});
    }

    std::vector<Tool> tools;
    for (const auto& entry : body["tools"]) {
        if (entry.is_object() == false) {
            continue;
        }
        tools.push_back(Tool::from_json(entry));
    }
    return tools;
}

}  // namespace mcpsrv
