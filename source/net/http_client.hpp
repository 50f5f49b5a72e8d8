#ifndef MMCPS_HTTP_CLIENT_HPP
#define MMCPS_HTTP_CLIENT_HPP

// Outbound HTTP (libcurl) for tools that forward to a companion service.

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace http_client {

using json = nlohmann::json;

struct HttpResponse {
    bool transport_ok = false; // a response (any status) was received
    long status = 0;
    std::string body;
    std::string network_error_message;
    bool timed_out = false;
};

// POST body as application/json. extra_headers are full "Name: value" lines.
HttpResponse post_json(const std::string &url, const json &body,
                       const std::vector<std::string> &extra_headers, long timeout_milliseconds);

// curl_global_init / curl_global_cleanup for the lifetime of the object.
// Create one in main before any worker thread can issue a request.
class CurlGlobalScope {
public:
    CurlGlobalScope();
    ~CurlGlobalScope();

    CurlGlobalScope(const CurlGlobalScope &) = delete;
    CurlGlobalScope &operator=(const CurlGlobalScope &) = delete;

    bool ok() const { return initialized; }

private:
    bool initialized = false;
};

// Join a base URL and a path with exactly one slash between them.
std::string join_url(const std::string &base_url, const std::string &path);

} // namespace http_client

#endif // MMCPS_HTTP_CLIENT_HPP
