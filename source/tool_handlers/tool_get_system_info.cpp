#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_dispatch.hpp"
#include "utils/utf8_sanitize.hpp"

using json = nlohmann::json;
using mcp_types::ToolResult;

static ToolResult handle_get_system_info(const mcp_types::ValidatedArguments &arguments) {
    (void)arguments;

    platform::SystemIdentity identity;
    platform::FileResult identity_result = platform::read_system_identity(identity);
    if (!identity_result.success) {
        return tool_handlers::file_failure(identity_result);
    }

    utf8_sanitize::sanitize(identity.node);

    json info;
    info["platform"] = identity.system + "-" + identity.release + "-" + identity.machine;
    info["system"] = identity.system;
    info["node"] = identity.node;
    info["release"] = identity.release;
    info["version"] = identity.version;
    info["architecture"] = identity.machine;
    info["processor"] = identity.machine;
    info["server"] = std::string(mcp_dispatch::SERVER_NAME) + " " + mcp_dispatch::SERVER_VERSION;
    info["timestamp"] = tool_handlers::current_utc_timestamp();
    return ToolResult::ok(info);
}

namespace tool_get_system_info {

tool_registry::RegistrationResult register_tool(tool_registry::ToolRegistry &registry) {
    mcp_types::ToolDescriptor descriptor;
    descriptor.name = "get_system_info";
    descriptor.description = "Get basic information about the host: operating system, release, "
                             "architecture and the current UTC time.";
    descriptor.return_type = mcp_types::ValueType::Object;
    return registry.register_tool(descriptor, handle_get_system_info);
}

} // namespace tool_get_system_info
