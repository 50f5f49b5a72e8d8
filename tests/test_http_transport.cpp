// Tests for the HTTP reply builders, without opening a socket.

#include "transport/http_transport.hpp"
#include "test_support.hpp"

using json = nlohmann::json;
using mcp_types::ToolResult;
using test_support::report;

namespace test_http_transport {

static void register_tools(tool_registry::ToolRegistry &registry) {
    mcp_types::ToolDescriptor answer;
    answer.name = "answer";
    registry.register_tool(answer, [](const mcp_types::ValidatedArguments &) {
        return ToolResult::ok(42);
    });

    mcp_types::ToolDescriptor bad_bytes;
    bad_bytes.name = "bad_bytes";
    registry.register_tool(bad_bytes, [](const mcp_types::ValidatedArguments &) {
        return ToolResult::ok(std::string("a\xc3(b"));
    });
    registry.seal();
}

static bool test_request_reply() {
    tool_registry::ToolRegistry registry;
    register_tools(registry);
    call_dispatcher::Dispatcher dispatcher(registry, std::chrono::milliseconds(1000));

    http_transport::HttpReply reply = http_transport::build_mcp_reply(
        dispatcher, R"({"jsonrpc":"2.0","id":"r1","method":"tools/call","params":{"name":"answer"}})");
    json body = json::parse(reply.body);
    bool success = reply.status == 200 && reply.content_type == "application/json" && body["id"] == "r1" &&
                   body["result"]["structuredContent"]["result"] == 42;
    return report(success, "POST body with a request gets a 200 JSON-RPC response");
}

static bool test_tool_error_is_200() {
    tool_registry::ToolRegistry registry;
    register_tools(registry);
    call_dispatcher::Dispatcher dispatcher(registry, std::chrono::milliseconds(1000));

    http_transport::HttpReply reply = http_transport::build_mcp_reply(
        dispatcher, R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"nothing"}})");
    json body = json::parse(reply.body);
    return report(reply.status == 200 && body["error"]["code"] == -32601,
                  "JSON-RPC level errors still use HTTP 200");
}

static bool test_malformed_body() {
    tool_registry::ToolRegistry registry;
    register_tools(registry);
    call_dispatcher::Dispatcher dispatcher(registry, std::chrono::milliseconds(1000));

    http_transport::HttpReply garbage = http_transport::build_mcp_reply(dispatcher, "<html>");
    http_transport::HttpReply envelope = http_transport::build_mcp_reply(dispatcher, R"({"id":1,"method":"ping"})");
    bool success = garbage.status == 400 && json::parse(garbage.body)["error"]["code"] == -32700 &&
                   envelope.status == 400 && json::parse(envelope.body)["error"]["code"] == -32600 &&
                   json::parse(envelope.body)["id"] == 1;
    return report(success, "Undecodable bodies get HTTP 400 with a JSON-RPC error");
}

static bool test_notification_accepted() {
    tool_registry::ToolRegistry registry;
    register_tools(registry);
    call_dispatcher::Dispatcher dispatcher(registry, std::chrono::milliseconds(1000));

    http_transport::HttpReply reply =
        http_transport::build_mcp_reply(dispatcher, R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    return report(reply.status == 202 && reply.body.empty(), "Notifications get 202 with no body");
}

static bool test_invalid_utf8_result() {
    tool_registry::ToolRegistry registry;
    register_tools(registry);
    call_dispatcher::Dispatcher dispatcher(registry, std::chrono::milliseconds(1000));

    http_transport::HttpReply reply = http_transport::build_mcp_reply(
        dispatcher, R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"bad_bytes"}})");
    json body = json::parse(reply.body, nullptr, false);
    return report(reply.status == 200 && !body.is_discarded() && body["id"] == 3,
                  "Invalid UTF-8 in a result still serializes");
}

static bool test_body_plan() {
    using http_transport::BodyPlan;
    bool success = http_transport::plan_body(true, 0, 4096) == BodyPlan::None &&
                   http_transport::plan_body(true, 120, 4096) == BodyPlan::Read &&
                   http_transport::plan_body(true, 4097, 4096) == BodyPlan::TooLarge &&
                   http_transport::plan_body(false, 0, 4096) == BodyPlan::Read;
    return report(success, "A POST without Content-Length waits for its body");
}

static bool test_health_and_status() {
    tool_registry::ToolRegistry registry;
    register_tools(registry);
    call_dispatcher::Dispatcher dispatcher(registry, std::chrono::milliseconds(1000));

    http_transport::HttpReply health = http_transport::build_health_reply(dispatcher);
    http_transport::HttpReply missing = http_transport::build_status_reply(404, "Not found");
    json health_body = json::parse(health.body);
    json missing_body = json::parse(missing.body);
    bool success = health.status == 200 && health_body["status"] == "ok" && health_body["tools"] == 2 &&
                   missing.status == 404 && missing_body["error"] == "Not found" && missing_body["status"] == 404;
    return report(success, "Health and status replies");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_request_reply();
    all_passed &= test_tool_error_is_200();
    all_passed &= test_malformed_body();
    all_passed &= test_notification_accepted();
    all_passed &= test_invalid_utf8_result();
    all_passed &= test_body_plan();
    all_passed &= test_health_and_status();
    return all_passed;
}

} // namespace test_http_transport
