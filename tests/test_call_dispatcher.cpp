// Tests for call dispatch: validation before execution, unknown tools,
// timeouts, exceptions and concurrent calls.

#include "mcp/call_dispatcher.hpp"
#include "test_support.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using json = nlohmann::json;
using mcp_types::Call;
using mcp_types::ErrorKind;
using mcp_types::Outcome;
using mcp_types::ToolResult;
using mcp_types::ValueType;
using test_support::report;

namespace test_call_dispatcher {

static std::atomic<int> add_invocations{0};

static mcp_types::ParameterSpec number_parameter(const std::string &name) {
    mcp_types::ParameterSpec spec;
    spec.name = name;
    spec.type = ValueType::Number;
    return spec;
}

static void register_test_tools(tool_registry::ToolRegistry &registry) {
    mcp_types::ToolDescriptor add;
    add.name = "add";
    add.description = "Add two numbers";
    add.parameters = {number_parameter("a"), number_parameter("b")};
    add.return_type = ValueType::Number;
    registry.register_tool(add, [](const mcp_types::ValidatedArguments &arguments) {
        ++add_invocations;
        return ToolResult::ok(arguments.get_number("a") + arguments.get_number("b"));
    });

    mcp_types::ToolDescriptor slow;
    slow.name = "slow";
    registry.register_tool(slow, [](const mcp_types::ValidatedArguments &) {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        return ToolResult::ok("done");
    });

    mcp_types::ToolDescriptor throwing;
    throwing.name = "throwing";
    registry.register_tool(throwing, [](const mcp_types::ValidatedArguments &) -> ToolResult {
        throw std::runtime_error("boom");
    });

    mcp_types::ToolDescriptor failing;
    failing.name = "failing";
    registry.register_tool(failing, [](const mcp_types::ValidatedArguments &) {
        return ToolResult::fail(mcp_types::ToolFailureKind::NotFound, "no such thing", {{"path", "/x"}});
    });

    registry.seal();
}

static Call make_call(const std::string &tool_name, json arguments, json id) {
    Call call;
    call.tool_name = tool_name;
    call.arguments = std::move(arguments);
    call.correlation_id = std::move(id);
    return call;
}

static bool test_successful_call() {
    tool_registry::ToolRegistry registry;
    register_test_tools(registry);
    call_dispatcher::Dispatcher dispatcher(registry, std::chrono::milliseconds(2000));

    Outcome outcome = dispatcher.dispatch(make_call("add", {{"a", 5}, {"b", 3}}, 1));
    return report(outcome.success && outcome.payload == 8 && outcome.correlation_id == 1,
                  "add(5, 3) succeeds with 8", outcome.payload.dump());
}

static bool test_invalid_arguments_never_reach_tool() {
    tool_registry::ToolRegistry registry;
    register_test_tools(registry);
    call_dispatcher::Dispatcher dispatcher(registry, std::chrono::milliseconds(2000));

    int before = add_invocations.load();
    Outcome outcome = dispatcher.dispatch(make_call("add", {{"a", 5}}, "req-2"));
    bool success = !outcome.success && outcome.error.kind == ErrorKind::ValidationError &&
                   outcome.error.detail["missing"] == json::array({"b"}) &&
                   outcome.error.correlation_id == "req-2" && add_invocations.load() == before;
    return report(success, "Missing argument yields ValidationError and the tool is not run");
}

static bool test_unknown_tool() {
    tool_registry::ToolRegistry registry;
    register_test_tools(registry);
    call_dispatcher::Dispatcher dispatcher(registry, std::chrono::milliseconds(2000));

    Outcome outcome = dispatcher.dispatch(make_call("unknown_tool", json::object(), 3));
    bool success = !outcome.success && outcome.error.kind == ErrorKind::NotFound &&
                   outcome.error.detail["tool"] == "unknown_tool";
    return report(success, "Unknown tool yields NotFound");
}

static bool test_timeout() {
    tool_registry::ToolRegistry registry;
    register_test_tools(registry);
    call_dispatcher::Dispatcher dispatcher(registry, std::chrono::milliseconds(50));

    auto start = std::chrono::steady_clock::now();
    Outcome outcome = dispatcher.dispatch(make_call("slow", json::object(), 4));
    auto elapsed = std::chrono::steady_clock::now() - start;
    bool success = !outcome.success && outcome.error.kind == ErrorKind::Timeout &&
                   outcome.error.detail["timeout_ms"] == 50 && elapsed < std::chrono::milliseconds(250);
    return report(success, "Slow tool yields Timeout without waiting for it to finish");
}

static bool test_exception_becomes_internal() {
    tool_registry::ToolRegistry registry;
    register_test_tools(registry);
    call_dispatcher::Dispatcher dispatcher(registry, std::chrono::milliseconds(2000));

    Outcome outcome = dispatcher.dispatch(make_call("throwing", json::object(), 5));
    bool success = !outcome.success && outcome.error.kind == ErrorKind::Internal &&
                   outcome.error.detail["cause"] == "boom";
    return report(success, "Exception in a tool becomes Internal with the cause kept");
}

static bool test_tool_failure_keeps_subkind() {
    tool_registry::ToolRegistry registry;
    register_test_tools(registry);
    call_dispatcher::Dispatcher dispatcher(registry, std::chrono::milliseconds(2000));

    Outcome outcome = dispatcher.dispatch(make_call("failing", json::object(), 6));
    bool success = !outcome.success && outcome.error.kind == ErrorKind::ToolExecutionError &&
                   outcome.error.detail["subkind"] == "not_found" && outcome.error.detail["info"]["path"] == "/x";
    return report(success, "Tool failure becomes ToolExecutionError with its subkind", outcome.error.detail.dump());
}

static bool test_discovery() {
    tool_registry::ToolRegistry registry;
    register_test_tools(registry);
    call_dispatcher::Dispatcher dispatcher(registry, std::chrono::milliseconds(2000));

    Outcome listed = dispatcher.dispatch(make_call(tool_registry::DISCOVERY_TOOL_NAME, json::object(), 7));
    Outcome rejected = dispatcher.dispatch(make_call(tool_registry::DISCOVERY_TOOL_NAME, {{"x", 1}}, 8));
    bool success = listed.success && listed.payload["tools"].size() == registry.size() &&
                   !rejected.success && rejected.error.kind == ErrorKind::ValidationError &&
                   rejected.error.detail["unexpected"] == json::array({"x"});
    return report(success, "Discovery lists every tool and rejects arguments");
}

static bool test_concurrent_calls_run_in_parallel() {
    tool_registry::ToolRegistry registry;
    register_test_tools(registry);
    call_dispatcher::Dispatcher dispatcher(registry, std::chrono::milliseconds(5000));

    std::vector<Outcome> outcomes(4);
    std::vector<std::thread> callers;
    auto start = std::chrono::steady_clock::now();
    for (std::size_t index = 0; index < outcomes.size(); ++index) {
        callers.emplace_back([&dispatcher, &outcomes, index]() {
            outcomes[index] = dispatcher.dispatch(make_call("slow", json::object(), static_cast<int>(index)));
        });
    }
    for (std::thread &caller : callers) {
        caller.join();
    }
    auto elapsed = std::chrono::steady_clock::now() - start;

    bool success = elapsed < std::chrono::milliseconds(1000);
    for (std::size_t index = 0; index < outcomes.size(); ++index) {
        success &= outcomes[index].success && outcomes[index].correlation_id == static_cast<int>(index);
    }
    return report(success, "Concurrent slow calls overlap and keep their own ids");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_successful_call();
    all_passed &= test_invalid_arguments_never_reach_tool();
    all_passed &= test_unknown_tool();
    all_passed &= test_timeout();
    all_passed &= test_exception_becomes_internal();
    all_passed &= test_tool_failure_keeps_subkind();
    all_passed &= test_discovery();
    all_passed &= test_concurrent_calls_run_in_parallel();
    return all_passed;
}

} // namespace test_call_dispatcher
