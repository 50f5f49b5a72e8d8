#include "mcp/call_dispatcher.hpp"
#include "mcp/argument_validator.hpp"
#include "mcp/error_normalizer.hpp"
#include "utils/server_log.hpp"

#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>

namespace call_dispatcher {

using mcp_types::Call;
using mcp_types::ErrorKind;
using mcp_types::Outcome;

// Shared between the waiting dispatcher and the worker thread. The worker may
// outlive the wait (timeout), so it is reference counted.
struct PendingInvocation {
    std::mutex mutex;
    std::condition_variable finished_signal;
    bool finished = false;
    Outcome outcome;
};

// Runs the tool body and converts everything it can do into an Outcome.
static Outcome run_tool_body(const std::string &tool_name,
                             const mcp_types::ToolImplementation &implementation,
                             const mcp_types::ValidatedArguments &arguments,
                             const json &correlation_id) {
    try {
        mcp_types::ToolResult tool_result = implementation(arguments);
        if (tool_result.success) {
            return Outcome::succeeded(correlation_id, std::move(tool_result.payload));
        }
        return Outcome::failed(error_normalizer::from_tool_failure(tool_name, tool_result.failure, correlation_id));
    } catch (const std::exception &exception) {
        server_log::error("Tool '" + tool_name + "' threw: " + exception.what());
        return Outcome::failed(error_normalizer::from_exception(exception, "tool " + tool_name, correlation_id));
    } catch (...) {
        server_log::error("Tool '" + tool_name + "' threw a non-standard exception");
        return Outcome::failed(error_normalizer::from_unknown_exception("tool " + tool_name, correlation_id));
    }
}

Dispatcher::Dispatcher(const tool_registry::ToolRegistry &registry, std::chrono::milliseconds call_timeout)
    : registry(registry), call_timeout(call_timeout) {}

json Dispatcher::describe_tools() const {
    return tool_registry::build_tools_list_response(registry);
}

Outcome Dispatcher::dispatch_discovery(const Call &call) const {
    if (!call.arguments.is_null() && !(call.arguments.is_object() && call.arguments.empty())) {
        json detail;
        detail["tool"] = tool_registry::DISCOVERY_TOOL_NAME;
        detail["missing"] = json::array();
        detail["unexpected"] = json::array();
        detail["type_mismatches"] = json::array();
        if (call.arguments.is_object()) {
            for (auto iterator = call.arguments.begin(); iterator != call.arguments.end(); ++iterator) {
                detail["unexpected"].push_back(iterator.key());
            }
        } else {
            json mismatch;
            mismatch["parameter"] = "";
            mismatch["expected"] = "object";
            mismatch["received"] = mcp_types::received_type_name(call.arguments);
            mismatch["reason"] = "arguments must be an object";
            detail["type_mismatches"].push_back(mismatch);
        }
        return Outcome::failed(error_normalizer::make_error(
            ErrorKind::ValidationError,
            std::string("Tool '") + tool_registry::DISCOVERY_TOOL_NAME + "' takes no arguments",
            call.correlation_id, detail));
    }
    return Outcome::succeeded(call.correlation_id, describe_tools());
}

Outcome Dispatcher::invoke_with_timeout(const tool_registry::RegisteredTool &tool,
                                        const mcp_types::ValidatedArguments &arguments,
                                        const json &correlation_id) const {
    auto pending = std::make_shared<PendingInvocation>();

    // The worker owns copies of everything it touches, so an abandoned
    // invocation never reads from the caller's frame.
    std::string tool_name = tool.descriptor.name;
    mcp_types::ToolImplementation implementation = tool.implementation;

    try {
        std::thread worker([pending, tool_name, implementation, arguments, correlation_id]() {
            Outcome outcome = run_tool_body(tool_name, implementation, arguments, correlation_id);
            std::lock_guard<std::mutex> lock(pending->mutex);
            pending->outcome = std::move(outcome);
            pending->finished = true;
            pending->finished_signal.notify_all();
        });
        worker.detach();
    } catch (const std::system_error &error) {
        server_log::error("Failed to start worker for tool '" + tool_name + "': " + error.what());
        return Outcome::failed(error_normalizer::from_exception(error, "starting tool " + tool_name, correlation_id));
    }

    std::unique_lock<std::mutex> lock(pending->mutex);
    if (call_timeout.count() <= 0) {
        pending->finished_signal.wait(lock, [&pending]() { return pending->finished; });
        return pending->outcome;
    }

    bool finished_in_time =
        pending->finished_signal.wait_for(lock, call_timeout, [&pending]() { return pending->finished; });
    if (finished_in_time) {
        return pending->outcome;
    }

    server_log::warning("Tool '" + tool_name + "' exceeded " + std::to_string(call_timeout.count()) +
                        " ms; its result will be discarded");
    json detail;
    detail["tool"] = tool_name;
    detail["timeout_ms"] = call_timeout.count();
    return Outcome::failed(error_normalizer::make_error(
        ErrorKind::Timeout, "Tool '" + tool_name + "' timed out after " + std::to_string(call_timeout.count()) + " ms",
        correlation_id, detail));
}

Outcome Dispatcher::dispatch(const Call &call) const {
    try {
        if (call.tool_name == tool_registry::DISCOVERY_TOOL_NAME) {
            return dispatch_discovery(call);
        }

        const tool_registry::RegisteredTool *tool = registry.lookup(call.tool_name);
        if (tool == nullptr) {
            json detail;
            detail["tool"] = call.tool_name;
            return Outcome::failed(error_normalizer::make_error(
                ErrorKind::NotFound, "Unknown tool: " + call.tool_name, call.correlation_id, detail));
        }

        argument_validator::ValidationResult validation =
            argument_validator::ArgumentValidator::validate(tool->descriptor, call.arguments, call.correlation_id);
        if (!validation.success()) {
            server_log::debug(validation.error.message);
            return Outcome::failed(validation.error);
        }

        server_log::debug("Calling tool: " + call.tool_name);
        return invoke_with_timeout(*tool, *validation.arguments, call.correlation_id);
    } catch (const std::exception &exception) {
        return Outcome::failed(error_normalizer::from_exception(exception, "dispatch " + call.tool_name,
                                                                call.correlation_id));
    } catch (...) {
        return Outcome::failed(error_normalizer::from_unknown_exception("dispatch " + call.tool_name,
                                                                        call.correlation_id));
    }
}

} // namespace call_dispatcher
