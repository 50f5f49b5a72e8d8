#ifndef MMCPS_HTTP_TRANSPORT_HPP
#define MMCPS_HTTP_TRANSPORT_HPP

// MCP over HTTP: one JSON-RPC message per POST, served by libwebsockets.
//
// The libwebsockets service loop runs on its own thread and never blocks on a
// tool. Each request body is dispatched on a worker thread; when the worker is
// done it wakes the service loop (lws_cancel_service), which then writes the
// response on the connection if the client is still there.

#include <nlohmann/json.hpp>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "mcp/call_dispatcher.hpp"

struct lws;
struct lws_context;

namespace http_transport {

using json = nlohmann::json;

struct HttpOptions {
    std::string host = "0.0.0.0";
    int port = 8000;
    std::string endpoint_path = "/mcp";
    std::size_t max_message_bytes = 1048576;
};

struct HttpReply {
    int status = 200;
    std::string content_type = "application/json";
    std::string body;
};

// 200 + response envelope, 202 for notifications, 400 for undecodable bodies.
HttpReply build_mcp_reply(const call_dispatcher::Dispatcher &dispatcher, const std::string &request_body);

// GET /health: {"status":"ok","tools":N}.
HttpReply build_health_reply(const call_dispatcher::Dispatcher &dispatcher);

// Transport-level failure (404, 405, 413) with a small JSON error body.
HttpReply build_status_reply(int status, const std::string &message);

// What to do with a POST body once the headers are in.
enum class BodyPlan {
    None,     // Content-Length: 0, dispatch immediately
    Read,     // wait for LWS_CALLBACK_HTTP_BODY_COMPLETION
    TooLarge, // read and discard, then 413
};

// content_length is only meaningful when has_content_length is set. Without
// the header the body may still arrive chunked, so it is read.
BodyPlan plan_body(bool has_content_length, long long content_length, std::size_t max_message_bytes);

// One HTTP request/response on a connection.
struct HttpExchange {
    std::string path;
    int route_status = 0; // non-zero: answer with this status once the body is read
    std::string request_body;
    bool body_too_large = false;
    bool response_ready = false;
    bool headers_sent = false;
    bool abandoned = false; // client went away; drop the response
    HttpReply reply;
};

class HttpServer {
public:
    HttpServer(const call_dispatcher::Dispatcher &dispatcher, HttpOptions options);
    ~HttpServer();

    HttpServer(const HttpServer &) = delete;
    HttpServer &operator=(const HttpServer &) = delete;

    // Bind and start the service thread. False when the context could not be
    // created (port in use, bad interface).
    bool start();

    // Stop serving, wait for in-flight workers, release the context.
    void stop();

    bool is_running() const { return running; }

    // Entry point for the libwebsockets protocol callback.
    int handle_callback(struct lws *connection, int reason, void *incoming_data, std::size_t incoming_length);

private:
    int on_http_request(struct lws *connection, const char *uri);
    int on_body_complete(struct lws *connection);
    int on_writeable(struct lws *connection);
    void on_wake();

    // Queue a reply produced on the service thread.
    void reply_now(struct lws *connection, const std::shared_ptr<HttpExchange> &exchange, HttpReply reply);
    void start_worker(const std::shared_ptr<HttpExchange> &exchange);

    const call_dispatcher::Dispatcher &dispatcher;
    HttpOptions options;

    struct lws_context *context = nullptr;
    std::thread service_thread;
    std::atomic<bool> running{false};
    std::atomic<bool> stop_requested{false};

    std::mutex exchange_mutex;
    std::condition_variable workers_finished;
    std::map<struct lws *, std::shared_ptr<HttpExchange>> exchanges;
    std::size_t active_workers = 0;
};

} // namespace http_transport

#endif // MMCPS_HTTP_TRANSPORT_HPP
