#include "tool_handlers/tool_handlers.hpp"
#include "utils/utf8_sanitize.hpp"

#include <chrono>

using json = nlohmann::json;
using mcp_types::ToolFailureKind;
using mcp_types::ToolResult;

// Average CPU share since the process started.
static double lifetime_cpu_percent(const platform::ProcessInfo &info) {
    double now = std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
    double elapsed = now - info.start_time_epoch;
    if (elapsed <= 0.0) {
        return 0.0;
    }
    return info.cpu_seconds / elapsed * 100.0;
}

static ToolResult handle_get_process_info(const mcp_types::ValidatedArguments &arguments) {
    int process_id = platform::current_process_id();
    if (arguments.has_value("pid")) {
        std::int64_t requested = arguments.get_integer("pid");
        if (requested <= 0 || requested > 0x7fffffff) {
            return ToolResult::fail(ToolFailureKind::InvalidInput, "pid must be a positive process ID",
                                    {{"field", "pid"}, {"value", requested}});
        }
        process_id = static_cast<int>(requested);
    }

    platform::ProcessInfo info;
    platform::FileResult read_result = platform::read_process_info(process_id, info);
    if (!read_result.success) {
        if (read_result.error_kind == platform::FileErrorKind::NotFound) {
            return ToolResult::fail(ToolFailureKind::NotFound, "Process " + std::to_string(process_id) + " not found",
                                    {{"pid", process_id}});
        }
        return tool_handlers::file_failure(read_result);
    }

    utf8_sanitize::sanitize(info.name);
    json command_line = json::array();
    for (std::string &argument : info.command_line) {
        utf8_sanitize::sanitize(argument);
        command_line.push_back(argument);
    }

    json result;
    result["pid"] = info.process_id;
    result["name"] = info.name;
    result["status"] = info.status;
    result["cpu_percent"] = lifetime_cpu_percent(info);
    result["memory_info"] = {{"rss", info.resident_bytes}, {"vms", info.virtual_bytes}};
    result["create_time"] = tool_handlers::format_utc_timestamp(info.start_time_epoch);
    result["num_threads"] = info.thread_count;
    result["cmdline"] = command_line;
    return ToolResult::ok(result);
}

namespace tool_get_process_info {

tool_registry::RegistrationResult register_tool(tool_registry::ToolRegistry &registry) {
    mcp_types::ToolDescriptor descriptor;
    descriptor.name = "get_process_info";
    descriptor.description = "Get information about a process. Defaults to the server process itself.";
    descriptor.parameters = {
        tool_handlers::optional_parameter("pid", mcp_types::ValueType::Integer, nullptr,
                                          "Process ID to inspect"),
    };
    descriptor.return_type = mcp_types::ValueType::Object;
    return registry.register_tool(descriptor, handle_get_process_info);
}

} // namespace tool_get_process_info
