#ifndef MMCPS_SERVICE_REQUEST_HPP
#define MMCPS_SERVICE_REQUEST_HPP

// Forwarding of email and calendar tool calls to the companion HTTP service,
// and the input checks those tools share.

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "mcp/mcp_types.hpp"

namespace service_request {

using json = nlohmann::json;

// POST payload to base_url + path. A 200 response yields its JSON body;
// anything else (connect error, timeout, other status) is an
// upstream_service_error with detail {service, url, status}.
mcp_types::ToolResult post(const std::string &service_label, const std::string &base_url, const std::string &path,
                           const json &payload, const std::vector<std::string> &extra_headers,
                           int timeout_seconds);

// {"Authorization: Bearer <token>"}, or nothing when the token is empty.
std::vector<std::string> bearer_headers(const std::string &token);

// local@domain.tld
bool is_valid_email(const std::string &address);

// YYYY-MM-DDTHH:MM:SS followed by Z or +HH:MM / -HH:MM
bool is_iso_datetime(const std::string &text);

// YYYY-MM-DD
bool is_iso_date(const std::string &text);

} // namespace service_request

#endif // MMCPS_SERVICE_REQUEST_HPP
