#include "tool_handlers/tool_handlers.hpp"

using json = nlohmann::json;
using mcp_types::ToolResult;

static const int CPU_SAMPLE_MILLISECONDS = 200;

static ToolResult handle_get_system_stats(const mcp_types::ValidatedArguments &arguments) {
    (void)arguments;

    platform::SystemStats stats;
    platform::FileResult read_result = platform::read_system_stats(CPU_SAMPLE_MILLISECONDS, stats);
    if (!read_result.success) {
        return tool_handlers::file_failure(read_result);
    }

    json frequency = nullptr;
    if (stats.cpu.frequency_mhz > 0.0) {
        frequency = {{"current", stats.cpu.frequency_mhz}};
    }

    json result;
    result["timestamp"] = tool_handlers::current_utc_timestamp();
    result["uptime_seconds"] = stats.uptime_seconds;
    result["cpu"] = {
        {"percent", stats.cpu.percent},
        {"count", stats.cpu.count},
        {"frequency", frequency},
        {"load_average", {stats.cpu.load_average[0], stats.cpu.load_average[1], stats.cpu.load_average[2]}},
    };
    result["memory"] = {
        {"total", stats.memory.total},
        {"available", stats.memory.available},
        {"used", stats.memory.used},
        {"free", stats.memory.free},
        {"percent", stats.memory.percent},
    };
    result["swap"] = {
        {"total", stats.swap.total},
        {"used", stats.swap.used},
        {"free", stats.swap.free},
        {"percent", stats.swap.percent},
    };
    result["disk"] = {
        {"total", stats.disk.total},
        {"used", stats.disk.used},
        {"free", stats.disk.free},
        {"percent", stats.disk.percent},
    };
    result["network"] = {
        {"bytes_sent", stats.network.bytes_sent},
        {"bytes_recv", stats.network.bytes_received},
        {"packets_sent", stats.network.packets_sent},
        {"packets_recv", stats.network.packets_received},
    };
    return ToolResult::ok(result);
}

namespace tool_get_system_stats {

tool_registry::RegistrationResult register_tool(tool_registry::ToolRegistry &registry) {
    mcp_types::ToolDescriptor descriptor;
    descriptor.name = "get_system_stats";
    descriptor.description = "Get CPU, memory, swap, disk and network usage for the host.";
    descriptor.return_type = mcp_types::ValueType::Object;
    return registry.register_tool(descriptor, handle_get_system_stats);
}

} // namespace tool_get_system_stats
