#include "net/http_client.hpp"
#include "utils/server_log.hpp"

#include <curl/curl.h>

namespace http_client {

static size_t write_callback(char *data_pointer, size_t size, size_t count, void *user_data) {
    const size_t total = size * count;
    auto *output = static_cast<std::string *>(user_data);
    output->append(data_pointer, total);
    return total;
}

HttpResponse post_json(const std::string &url, const json &body,
                       const std::vector<std::string> &extra_headers, long timeout_milliseconds) {
    HttpResponse response;

    CURL *curl = curl_easy_init();
    if (curl == nullptr) {
        response.network_error_message = "curl_easy_init failed";
        return response;
    }

    const std::string serialized_body = body.dump(-1, ' ', false, json::error_handler_t::replace);

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_milliseconds);
    // Requests run on worker threads; signals must not be used for timeouts.
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "mmcps/0.1");
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, serialized_body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(serialized_body.size()));

    struct curl_slist *header_list = nullptr;
    header_list = curl_slist_append(header_list, "Content-Type: application/json");
    header_list = curl_slist_append(header_list, "Accept: application/json");
    // No "Expect: 100-continue" round trip for larger bodies.
    header_list = curl_slist_append(header_list, "Expect:");
    for (const std::string &line : extra_headers) {
        header_list = curl_slist_append(header_list, line.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);

    const CURLcode code = curl_easy_perform(curl);
    if (code != CURLE_OK) {
        response.network_error_message = curl_easy_strerror(code);
        response.timed_out = code == CURLE_OPERATION_TIMEDOUT;
        server_log::warning("POST " + url + " failed: " + response.network_error_message);
    } else {
        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        response.status = status;
        response.transport_ok = true;
        server_log::debug("POST " + url + " -> " + std::to_string(status));
    }

    curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);
    return response;
}

CurlGlobalScope::CurlGlobalScope() {
    initialized = curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
}

CurlGlobalScope::~CurlGlobalScope() {
    if (initialized) {
        curl_global_cleanup();
    }
}

std::string join_url(const std::string &base_url, const std::string &path) {
    std::string joined = base_url;
    while (!joined.empty() && joined.back() == '/') {
        joined.pop_back();
    }
    if (path.empty() || path.front() != '/') {
        joined += '/';
    }
    return joined + path;
}

} // namespace http_client
