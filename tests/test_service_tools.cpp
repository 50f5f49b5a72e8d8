// Tests for the email and calendar tools. Input checks are exercised without a
// service; forwarding is checked against a port nothing listens on and against
// a one-shot responder on a loopback port.

#include "tool_test_fixture.hpp"
#include "tool_handlers/service_request.hpp"
#include "test_support.hpp"

#include <arpa/inet.h>
#include <cstdlib>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <thread>
#include <unistd.h>

using json = nlohmann::json;
using mcp_types::Outcome;
using test_support::report;
using tool_test_fixture::ToolFixture;

namespace test_service_tools {

// Port 9 (discard) is closed on test machines, so connections are refused at once.
static tool_handlers::ServiceSettings unreachable_service() {
    tool_handlers::ServiceSettings settings;
    settings.email_service_url = "http://127.0.0.1:9";
    settings.calendar_service_url = "http://127.0.0.1:9/";
    settings.calendar_api_token = "secret";
    settings.timeout_seconds = 2;
    return settings;
}

// Accepts a single connection on 127.0.0.1, records the request and answers
// with a canned status and body.
class OneShotResponder {
public:
    OneShotResponder(int status, const std::string &body) {
        listen_fd = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in address{};
        address.sin_family = AF_INET;
        address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        address.sin_port = 0;
        socklen_t length = sizeof(address);
        if (listen_fd < 0 || ::bind(listen_fd, reinterpret_cast<sockaddr *>(&address), sizeof(address)) != 0 ||
            ::listen(listen_fd, 1) != 0 ||
            ::getsockname(listen_fd, reinterpret_cast<sockaddr *>(&address), &length) != 0) {
            return;
        }
        port = ntohs(address.sin_port);
        // accept() and recv() give up after ten seconds if the tool never connects.
        timeval limit{};
        limit.tv_sec = 10;
        ::setsockopt(listen_fd, SOL_SOCKET, SO_RCVTIMEO, &limit, sizeof(limit));
        std::string response = "HTTP/1.1 " + std::to_string(status) + " Canned\r\n"
                               "Content-Type: application/json\r\n"
                               "Content-Length: " + std::to_string(body.size()) + "\r\n"
                               "Connection: close\r\n\r\n" + body;
        worker = std::thread([this, response]() { serve(response); });
    }

    ~OneShotResponder() {
        finish();
        if (listen_fd >= 0) {
            ::close(listen_fd);
        }
    }

    // Waits until the exchange is over; request is complete afterwards.
    void finish() {
        if (worker.joinable()) {
            worker.join();
        }
    }

    std::string url() const { return "http://127.0.0.1:" + std::to_string(port); }

    int port = 0;
    std::string request;

private:
    void serve(const std::string &response) {
        int client = ::accept(listen_fd, nullptr, nullptr);
        if (client < 0) {
            return;
        }
        timeval limit{};
        limit.tv_sec = 10;
        ::setsockopt(client, SOL_SOCKET, SO_RCVTIMEO, &limit, sizeof(limit));
        char buffer[4096];
        std::size_t header_end = std::string::npos;
        std::size_t expected = 0;
        while (true) {
            ssize_t received = ::recv(client, buffer, sizeof(buffer), 0);
            if (received <= 0) {
                break;
            }
            request.append(buffer, static_cast<std::size_t>(received));
            if (header_end == std::string::npos) {
                header_end = request.find("\r\n\r\n");
                if (header_end == std::string::npos) {
                    continue;
                }
                header_end += 4;
                std::size_t field = request.find("Content-Length: ");
                if (field != std::string::npos && field < header_end) {
                    expected = std::strtoul(request.c_str() + field + 16, nullptr, 10);
                }
            }
            if (request.size() >= header_end + expected) {
                break;
            }
        }
        std::size_t sent = 0;
        while (sent < response.size()) {
            ssize_t written = ::send(client, response.data() + sent, response.size() - sent, MSG_NOSIGNAL);
            if (written <= 0) {
                break;
            }
            sent += static_cast<std::size_t>(written);
        }
        ::close(client);
    }

    int listen_fd = -1;
    std::thread worker;
};

static tool_handlers::ServiceSettings service_at(const std::string &url) {
    tool_handlers::ServiceSettings settings;
    settings.email_service_url = url;
    settings.calendar_service_url = url;
    settings.calendar_api_token = "secret";
    settings.timeout_seconds = 5;
    return settings;
}

static bool test_validators() {
    bool success = service_request::is_valid_email("ada@example.org") &&
                   !service_request::is_valid_email("ada@localhost") && !service_request::is_valid_email("ada") &&
                   service_request::is_iso_datetime("2025-10-21T10:00:00Z") &&
                   service_request::is_iso_datetime("2025-10-21T10:00:00+02:00") &&
                   !service_request::is_iso_datetime("2025-10-21 10:00") && service_request::is_iso_date("2025-10-21") &&
                   !service_request::is_iso_date("21/10/2025");
    return report(success, "Email address and ISO-8601 checks");
}

static bool test_bearer_headers() {
    std::vector<std::string> with_token = service_request::bearer_headers("abc");
    bool success = with_token.size() == 1 && with_token[0] == "Authorization: Bearer abc" &&
                   service_request::bearer_headers("").empty();
    return report(success, "Bearer header only when a token is set");
}

static bool test_send_email_validation() {
    ToolFixture fixture(unreachable_service());
    Outcome blank = fixture.call("send_email", {{"to", "a@b.co"}, {"subject", " "}, {"body", "x"}});
    Outcome bad_address = fixture.call("send_email", {{"to", "nobody"}, {"subject", "s"}, {"body", "x"}});
    bool success = ToolFixture::subkind(blank) == "invalid_input" &&
                   blank.error.detail["info"]["empty"] == json::array({"subject"}) &&
                   ToolFixture::subkind(bad_address) == "invalid_input";
    return report(success, "send_email rejects blank fields and bad addresses");
}

static bool test_send_email_unreachable() {
    ToolFixture fixture(unreachable_service());
    Outcome outcome = fixture.call("send_email", {{"to", "a@b.co"}, {"subject", "s"}, {"body", "x"}});
    bool success = ToolFixture::subkind(outcome) == "upstream_service_error" &&
                   outcome.error.detail["info"]["service"] == "email" &&
                   outcome.error.detail["info"]["url"] == "http://127.0.0.1:9/send-email" &&
                   outcome.error.detail["info"]["status"].is_null();
    return report(success, "send_email reports an unreachable service as upstream_service_error",
                  outcome.error.detail.dump());
}

static bool test_read_email_validation() {
    ToolFixture fixture(unreachable_service());
    Outcome bad_date = fixture.call("read_email", {{"after", "yesterday"}});
    Outcome bad_count = fixture.call("read_email", {{"maxResults", 0}});
    Outcome forwarded = fixture.call("read_email", {{"fromName", "Ada"}, {"maxResults", "5"}});
    bool success = ToolFixture::subkind(bad_date) == "invalid_input" &&
                   ToolFixture::subkind(bad_count) == "invalid_input" &&
                   ToolFixture::subkind(forwarded) == "upstream_service_error";
    return report(success, "read_email checks its filters before forwarding");
}

static bool test_schedule_meet_validation() {
    ToolFixture fixture(unreachable_service());
    json base = {{"title", "Sync"}, {"start", "2025-10-21T10:00:00Z"}, {"end", "2025-10-21T11:00:00Z"}};

    json bad_start = base;
    bad_start["start"] = "tomorrow";
    json no_attendees = base;
    no_attendees["attendees"] = json::array();
    json bad_attendee = base;
    bad_attendee["attendees"] = {"ok@example.com", "broken"};
    json bad_updates = base;
    bad_updates["sendUpdates"] = "everyone";

    bool success = ToolFixture::subkind(fixture.call("schedule_meet", bad_start)) == "invalid_input" &&
                   ToolFixture::subkind(fixture.call("schedule_meet", no_attendees)) == "invalid_input" &&
                   ToolFixture::subkind(fixture.call("schedule_meet", bad_attendee)) == "invalid_input" &&
                   ToolFixture::subkind(fixture.call("schedule_meet", bad_updates)) == "invalid_input";

    Outcome forwarded = fixture.call("schedule_meet", base);
    success &= ToolFixture::subkind(forwarded) == "upstream_service_error" &&
               forwarded.error.detail["info"]["url"] == "http://127.0.0.1:9/schedule-meet";
    return report(success, "schedule_meet checks times, attendees and sendUpdates");
}

static bool test_list_events_validation() {
    ToolFixture fixture(unreachable_service());
    Outcome bad_window = fixture.call("list_events", {{"timeMin", "2025-10-21"}, {"timeMax", "2025-10-22T00:00:00Z"}});
    Outcome forwarded =
        fixture.call("list_events", {{"timeMin", "2025-10-21T00:00:00Z"}, {"timeMax", "2025-10-22T00:00:00Z"}});
    bool success = ToolFixture::subkind(bad_window) == "invalid_input" &&
                   ToolFixture::subkind(forwarded) == "upstream_service_error" &&
                   forwarded.error.detail["info"]["service"] == "calendar";
    return report(success, "list_events checks its window before forwarding");
}

static bool test_send_email_delivered() {
    OneShotResponder responder(200, "{\"messageId\":\"m-1\"}");
    ToolFixture fixture(service_at(responder.url()));
    Outcome outcome =
        fixture.call("send_email", {{"to", "ada@example.org"}, {"subject", " Hi "}, {"body", "Hello"}});
    responder.finish();
    bool success = responder.request.compare(0, 16, "POST /send-email") == 0 && outcome.success &&
                   outcome.payload["messageId"] == "m-1" && outcome.payload["recipient"] == "ada@example.org" && outcome.payload["subject"] == "Hi" &&
                   outcome.payload["body_length"] == 5;
    return report(success, "send_email returns the service's message id", outcome.payload.dump());
}

static bool test_service_error_status() {
    OneShotResponder responder(503, "down\xff");
    ToolFixture fixture(service_at(responder.url()));
    Outcome outcome = fixture.call("send_email", {{"to", "ada@example.org"}, {"subject", "s"}, {"body", "x"}});
    bool success = ToolFixture::subkind(outcome) == "upstream_service_error" &&
                   outcome.error.detail["info"]["status"] == 503 &&
                   outcome.error.message.find("status 503: down\xEF\xBF\xBD") != std::string::npos;
    return report(success, "A non-200 service status is upstream_service_error with a readable body",
                  outcome.error.message);
}

static bool test_service_body_not_json() {
    OneShotResponder responder(200, "ok\xff");
    ToolFixture fixture(service_at(responder.url()));
    Outcome outcome = fixture.call("read_email", json::object());
    bool success = ToolFixture::subkind(outcome) == "upstream_service_error" &&
                   outcome.error.detail["info"]["body"] == "ok\xEF\xBF\xBD";
    return report(success, "A service body that is not JSON is upstream_service_error", outcome.error.detail.dump());
}

static bool test_calendar_sends_bearer_token() {
    OneShotResponder responder(200, "{\"events\":[]}");
    ToolFixture fixture(service_at(responder.url()));
    Outcome outcome =
        fixture.call("list_events", {{"timeMin", "2025-10-21T00:00:00Z"}, {"timeMax", "2025-10-22T00:00:00Z"}});
    responder.finish();
    bool success = outcome.success && outcome.payload["events"] == json::array() &&
                   responder.request.compare(0, 17, "POST /list-events") == 0 &&
                   responder.request.find("Authorization: Bearer secret\r\n") != std::string::npos;
    return report(success, "list_events forwards to the calendar service with the bearer token",
                  outcome.payload.dump());
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_validators();
    all_passed &= test_bearer_headers();
    all_passed &= test_send_email_validation();
    all_passed &= test_send_email_unreachable();
    all_passed &= test_read_email_validation();
    all_passed &= test_schedule_meet_validation();
    all_passed &= test_list_events_validation();
    all_passed &= test_send_email_delivered();
    all_passed &= test_service_error_status();
    all_passed &= test_service_body_not_json();
    all_passed &= test_calendar_sends_bearer_token();
    return all_passed;
}

} // namespace test_service_tools
