#include "tool_handlers/service_request.hpp"
#include "net/http_client.hpp"
#include "utils/utf8_sanitize.hpp"

#include <regex>

namespace service_request {

using mcp_types::ToolFailureKind;
using mcp_types::ToolResult;

static json failure_detail(const std::string &service_label, const std::string &url, long status) {
    json detail;
    detail["service"] = service_label;
    detail["url"] = url;
    detail["status"] = status == 0 ? json(nullptr) : json(status);
    return detail;
}

// "Email service" from "email"; labels are plain ASCII words.
static std::string capitalized(const std::string &service_label) {
    std::string text = service_label;
    if (!text.empty() && text[0] >= 'a' && text[0] <= 'z') {
        text[0] = static_cast<char>(text[0] - 'a' + 'A');
    }
    return text;
}

ToolResult post(const std::string &service_label, const std::string &base_url, const std::string &path,
                const json &payload, const std::vector<std::string> &extra_headers, int timeout_seconds) {
    const std::string url = http_client::join_url(base_url, path);
    http_client::HttpResponse response =
        http_client::post_json(url, payload, extra_headers, static_cast<long>(timeout_seconds) * 1000L);

    if (!response.transport_ok) {
        std::string message;
        if (response.timed_out) {
            message = capitalized(service_label) + " service request timed out";
        } else {
            message = "Could not connect to " + service_label + " service at " + base_url + ": " +
                      response.network_error_message;
        }
        return ToolResult::fail(ToolFailureKind::UpstreamServiceError, message,
                                failure_detail(service_label, url, 0));
    }

    std::string body = response.body;
    utf8_sanitize::sanitize(body);
    json parsed_body = json::parse(body, nullptr, false);

    if (response.status != 200) {
        std::string message = capitalized(service_label) + " service returned status " + std::to_string(response.status);
        if (!parsed_body.is_discarded() && parsed_body.is_object() && parsed_body.contains("message") &&
            parsed_body["message"].is_string()) {
            message += ": " + parsed_body["message"].get<std::string>();
        } else if (!body.empty()) {
            message += ": " + body;
        }
        return ToolResult::fail(ToolFailureKind::UpstreamServiceError, message,
                                failure_detail(service_label, url, response.status));
    }

    if (parsed_body.is_discarded()) {
        json detail = failure_detail(service_label, url, response.status);
        detail["body"] = body;
        return ToolResult::fail(ToolFailureKind::UpstreamServiceError,
                                capitalized(service_label) + " service returned a body that is not JSON", detail);
    }
    return ToolResult::ok(parsed_body);
}

std::vector<std::string> bearer_headers(const std::string &token) {
    std::vector<std::string> headers;
    if (!token.empty()) {
        headers.push_back("Authorization: Bearer " + token);
    }
    return headers;
}

bool is_valid_email(const std::string &address) {
    static const std::regex email_pattern("^[a-zA-Z0-9._%+-]+@[a-zA-Z0-9.-]+\\.[a-zA-Z]{2,}$");
    return std::regex_match(address, email_pattern);
}

bool is_iso_datetime(const std::string &text) {
    static const std::regex datetime_pattern("^\\d{4}-\\d{2}-\\d{2}T\\d{2}:\\d{2}:\\d{2}(?:Z|[+-]\\d{2}:\\d{2})$");
    return std::regex_match(text, datetime_pattern);
}

bool is_iso_date(const std::string &text) {
    static const std::regex date_pattern("^\\d{4}-\\d{2}-\\d{2}$");
    return std::regex_match(text, date_pattern);
}

} // namespace service_request
