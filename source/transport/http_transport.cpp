#include "transport/http_transport.hpp"
#include "mcp/error_normalizer.hpp"
#include "mcp/mcp_dispatch.hpp"
#include "utils/server_log.hpp"

#include <libwebsockets.h>
#include <cstdlib>
#include <cstring>
#include <system_error>
#include <vector>

namespace http_transport {

static std::string serialize(const json &message) {
    return message.dump(-1, ' ', false, json::error_handler_t::replace);
}

HttpReply build_mcp_reply(const call_dispatcher::Dispatcher &dispatcher, const std::string &request_body) {
    HttpReply reply;

    mcp_dispatch::DecodedMessage decoded = mcp_dispatch::decode_message(request_body);
    if (!decoded.success) {
        server_log::debug("Rejected HTTP body: " + decoded.error.message);
        reply.status = 400;
        reply.body = serialize(error_normalizer::build_error_response(decoded.error));
        return reply;
    }

    json response = mcp_dispatch::handle_request(dispatcher, decoded.request);
    if (response.is_null()) {
        reply.status = 202;
        return reply;
    }
    reply.status = 200;
    reply.body = serialize(response);
    return reply;
}

HttpReply build_health_reply(const call_dispatcher::Dispatcher &dispatcher) {
    json health;
    health["status"] = "ok";
    health["tools"] = dispatcher.get_registry().size();

    HttpReply reply;
    reply.status = 200;
    reply.body = serialize(health);
    return reply;
}

HttpReply build_status_reply(int status, const std::string &message) {
    json error_body;
    error_body["error"] = message;
    error_body["status"] = status;

    HttpReply reply;
    reply.status = status;
    reply.body = serialize(error_body);
    return reply;
}

BodyPlan plan_body(bool has_content_length, long long content_length, std::size_t max_message_bytes) {
    if (!has_content_length) {
        return BodyPlan::Read;
    }
    if (content_length <= 0) {
        return BodyPlan::None;
    }
    if (static_cast<unsigned long long>(content_length) > max_message_bytes) {
        return BodyPlan::TooLarge;
    }
    return BodyPlan::Read;
}

// --- libwebsockets glue ---

static const int BODY_TIMEOUT_SECONDS = 30;

static int http_callback(struct lws *connection, enum lws_callback_reasons reason,
                         void *user_data, void *incoming_data, size_t incoming_length) {
    struct lws_context *context = lws_get_context(connection);
    HttpServer *server = context != nullptr ? static_cast<HttpServer *>(lws_context_user(context)) : nullptr;
    if (server == nullptr) {
        return lws_callback_http_dummy(connection, reason, user_data, incoming_data, incoming_length);
    }
    return server->handle_callback(connection, static_cast<int>(reason), incoming_data, incoming_length);
}

static const struct lws_protocols http_protocols[] = {
    {
        "http",
        http_callback,
        0, // per-session data size
        0  // rx buffer size (default)
    },
    {nullptr, nullptr, 0, 0} // sentinel
};

HttpServer::HttpServer(const call_dispatcher::Dispatcher &dispatcher, HttpOptions options)
    : dispatcher(dispatcher), options(std::move(options)) {}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start() {
    if (running) {
        return true;
    }

    lws_set_log_level(LLL_ERR | LLL_WARN, nullptr);

    struct lws_context_creation_info context_info;
    memset(&context_info, 0, sizeof(context_info));
    context_info.port = options.port;
    // "0.0.0.0" means every interface, which libwebsockets spells as no iface.
    context_info.iface = (options.host.empty() || options.host == "0.0.0.0") ? nullptr : options.host.c_str();
    context_info.protocols = http_protocols;
    context_info.gid = -1;
    context_info.uid = -1;
    context_info.user = this;

    context = lws_create_context(&context_info);
    if (context == nullptr) {
        server_log::error("Failed to create libwebsockets context on " + options.host + ":" +
                          std::to_string(options.port) + " (port in use?)");
        return false;
    }

    stop_requested = false;
    running = true;
    try {
        service_thread = std::thread([this]() {
            while (!stop_requested) {
                if (lws_service(context, 50) < 0) {
                    server_log::error("libwebsockets service loop failed");
                    break;
                }
            }
        });
    } catch (const std::system_error &error) {
        server_log::error(std::string("Failed to start HTTP service thread: ") + error.what());
        lws_context_destroy(context);
        context = nullptr;
        running = false;
        return false;
    }

    server_log::info("HTTP transport listening on " + options.host + ":" + std::to_string(options.port) +
                     options.endpoint_path);
    return true;
}

void HttpServer::stop() {
    if (!running) {
        return;
    }
    stop_requested = true;
    lws_cancel_service(context);
    if (service_thread.joinable()) {
        service_thread.join();
    }

    {
        std::unique_lock<std::mutex> lock(exchange_mutex);
        workers_finished.wait(lock, [this]() { return active_workers == 0; });
        exchanges.clear();
    }

    lws_context_destroy(context);
    context = nullptr;
    running = false;
    server_log::info("HTTP transport stopped.");
}

void HttpServer::reply_now(struct lws *connection, const std::shared_ptr<HttpExchange> &exchange, HttpReply reply) {
    {
        std::lock_guard<std::mutex> lock(exchange_mutex);
        exchange->reply = std::move(reply);
        exchange->response_ready = true;
    }
    lws_callback_on_writable(connection);
}

void HttpServer::start_worker(const std::shared_ptr<HttpExchange> &exchange) {
    {
        std::lock_guard<std::mutex> lock(exchange_mutex);
        ++active_workers;
    }

    try {
        std::thread worker([this, exchange]() {
            HttpReply reply;
            try {
                reply = build_mcp_reply(dispatcher, exchange->request_body);
            } catch (const std::exception &exception) {
                server_log::error(std::string("HTTP worker failed: ") + exception.what());
                reply = build_status_reply(500, "Internal server error");
            }

            std::lock_guard<std::mutex> lock(exchange_mutex);
            if (!exchange->abandoned) {
                exchange->reply = std::move(reply);
                exchange->response_ready = true;
            }
            // The context outlives every worker: stop() waits for active_workers.
            lws_cancel_service(context);
            --active_workers;
            workers_finished.notify_all();
        });
        worker.detach();
    } catch (const std::system_error &error) {
        server_log::error(std::string("Failed to start HTTP worker: ") + error.what());
        std::lock_guard<std::mutex> lock(exchange_mutex);
        --active_workers;
        exchange->reply = build_status_reply(500, "Internal server error");
        exchange->response_ready = true;
        lws_cancel_service(context);
        workers_finished.notify_all();
    }
}

int HttpServer::on_http_request(struct lws *connection, const char *uri) {
    auto exchange = std::make_shared<HttpExchange>();
    exchange->path = uri != nullptr ? uri : "";
    {
        std::lock_guard<std::mutex> lock(exchange_mutex);
        exchanges[connection] = exchange;
    }

    bool is_post = lws_hdr_total_length(connection, WSI_TOKEN_POST_URI) > 0;
    bool is_get = lws_hdr_total_length(connection, WSI_TOKEN_GET_URI) > 0;

    if (!is_post) {
        if (exchange->path == "/health" && is_get) {
            reply_now(connection, exchange, build_health_reply(dispatcher));
        } else if (exchange->path == options.endpoint_path || exchange->path == "/health") {
            reply_now(connection, exchange, build_status_reply(405, "Method Not Allowed"));
        } else {
            reply_now(connection, exchange, build_status_reply(404, "Not Found"));
        }
        return 0;
    }

    if (exchange->path == "/health") {
        exchange->route_status = 405;
    } else if (exchange->path != options.endpoint_path) {
        exchange->route_status = 404;
    }

    char length_text[32];
    bool has_content_length = false;
    long long content_length = 0;
    if (lws_hdr_copy(connection, length_text, sizeof(length_text), WSI_TOKEN_HTTP_CONTENT_LENGTH) > 0) {
        has_content_length = true;
        content_length = std::atoll(length_text);
    }

    BodyPlan plan = plan_body(has_content_length, content_length, options.max_message_bytes);
    if (plan == BodyPlan::None) {
        if (exchange->route_status != 0) {
            reply_now(connection, exchange, build_status_reply(exchange->route_status,
                                                               exchange->route_status == 404 ? "Not Found"
                                                                                             : "Method Not Allowed"));
            return 0;
        }
        start_worker(exchange);
        return 0;
    }
    if (plan == BodyPlan::TooLarge) {
        exchange->body_too_large = true;
    }
    if (!has_content_length) {
        // A body that never completes would otherwise hold the connection forever.
        lws_set_timeout(connection, PENDING_TIMEOUT_HTTP_CONTENT, BODY_TIMEOUT_SECONDS);
    }
    return 0; // read the body
}

int HttpServer::on_body_complete(struct lws *connection) {
    std::shared_ptr<HttpExchange> exchange;
    {
        std::lock_guard<std::mutex> lock(exchange_mutex);
        auto iterator = exchanges.find(connection);
        if (iterator == exchanges.end()) {
            return 0;
        }
        exchange = iterator->second;
    }

    lws_set_timeout(connection, NO_PENDING_TIMEOUT, 0);
    if (exchange->route_status != 0) {
        reply_now(connection, exchange, build_status_reply(exchange->route_status,
                                                           exchange->route_status == 404 ? "Not Found"
                                                                                         : "Method Not Allowed"));
        return 0;
    }
    if (exchange->body_too_large) {
        server_log::warning("HTTP body exceeds " + std::to_string(options.max_message_bytes) + " bytes");
        reply_now(connection, exchange, build_status_reply(413, "Payload Too Large"));
        return 0;
    }
    start_worker(exchange);
    return 0;
}

int HttpServer::on_writeable(struct lws *connection) {
    std::shared_ptr<HttpExchange> exchange;
    {
        std::lock_guard<std::mutex> lock(exchange_mutex);
        auto iterator = exchanges.find(connection);
        if (iterator == exchanges.end() || !iterator->second->response_ready) {
            return 0;
        }
        exchange = iterator->second;
    }
    const HttpReply &reply = exchange->reply;

    // Phase one: status line and headers.
    if (!exchange->headers_sent) {
        unsigned char header_buffer[LWS_PRE + 1024];
        unsigned char *start = header_buffer + LWS_PRE;
        unsigned char *position = start;
        unsigned char *end = header_buffer + sizeof(header_buffer) - 1;

        if (lws_add_http_common_headers(connection, static_cast<unsigned int>(reply.status),
                                        reply.content_type.c_str(), reply.body.size(), &position, end)) {
            return 1;
        }
        if (lws_finalize_write_http_header(connection, start, &position, end)) {
            return 1;
        }
        exchange->headers_sent = true;
        lws_callback_on_writable(connection);
        return 0;
    }

    // Phase two: body. libwebsockets requires LWS_PRE bytes of padding before the data.
    std::vector<unsigned char> body_buffer(LWS_PRE + reply.body.size());
    if (!reply.body.empty()) {
        memcpy(body_buffer.data() + LWS_PRE, reply.body.data(), reply.body.size());
    }
    int bytes_written = lws_write(connection, body_buffer.data() + LWS_PRE, reply.body.size(), LWS_WRITE_HTTP_FINAL);
    if (bytes_written < static_cast<int>(reply.body.size())) {
        server_log::warning("Short write on HTTP response");
        return -1;
    }

    {
        std::lock_guard<std::mutex> lock(exchange_mutex);
        exchanges.erase(connection);
    }
    if (lws_http_transaction_completed(connection)) {
        return -1;
    }
    return 0;
}

void HttpServer::on_wake() {
    std::lock_guard<std::mutex> lock(exchange_mutex);
    for (auto &entry : exchanges) {
        if (entry.second->response_ready) {
            lws_callback_on_writable(entry.first);
        }
    }
}

int HttpServer::handle_callback(struct lws *connection, int reason, void *incoming_data, std::size_t incoming_length) {
    switch (static_cast<enum lws_callback_reasons>(reason)) {
    case LWS_CALLBACK_HTTP:
        return on_http_request(connection, static_cast<const char *>(incoming_data));

    case LWS_CALLBACK_HTTP_BODY: {
        std::lock_guard<std::mutex> lock(exchange_mutex);
        auto iterator = exchanges.find(connection);
        if (iterator == exchanges.end()) {
            return 0;
        }
        HttpExchange &exchange = *iterator->second;
        if (exchange.body_too_large || exchange.route_status != 0) {
            return 0; // drain and discard
        }
        exchange.request_body.append(static_cast<const char *>(incoming_data), incoming_length);
        if (exchange.request_body.size() > options.max_message_bytes) {
            exchange.body_too_large = true;
            exchange.request_body.clear();
        }
        return 0;
    }

    case LWS_CALLBACK_HTTP_BODY_COMPLETION:
        return on_body_complete(connection);

    case LWS_CALLBACK_HTTP_WRITEABLE:
        return on_writeable(connection);

    case LWS_CALLBACK_EVENT_WAIT_CANCELLED:
        on_wake();
        return 0;

    case LWS_CALLBACK_CLOSED_HTTP: {
        std::lock_guard<std::mutex> lock(exchange_mutex);
        auto iterator = exchanges.find(connection);
        if (iterator != exchanges.end()) {
            iterator->second->abandoned = true;
            exchanges.erase(iterator);
            server_log::debug("HTTP client disconnected before the response was sent");
        }
        return 0;
    }

    default:
        break;
    }
    return lws_callback_http_dummy(connection, static_cast<enum lws_callback_reasons>(reason), nullptr,
                                   incoming_data, incoming_length);
}

} // namespace http_transport
