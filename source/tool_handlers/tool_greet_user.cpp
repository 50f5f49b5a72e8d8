#include "tool_handlers/tool_handlers.hpp"
#include "utils/server_log.hpp"

using mcp_types::ToolFailureKind;
using mcp_types::ToolResult;

static ToolResult handle_greet_user(const mcp_types::ValidatedArguments &arguments) {
    std::string name = tool_handlers::trim(arguments.get_string("name"));
    if (name.empty()) {
        return ToolResult::fail(ToolFailureKind::InvalidInput, "Name cannot be empty", {{"field", "name"}});
    }
    server_log::debug("User greeted: " + name);
    return ToolResult::ok("Hello, " + name + "! Nice to meet you.");
}

namespace tool_greet_user {

tool_registry::RegistrationResult register_tool(tool_registry::ToolRegistry &registry) {
    mcp_types::ToolDescriptor descriptor;
    descriptor.name = "greet_user";
    descriptor.description = "Greet a user by name.";
    descriptor.parameters = {
        tool_handlers::required_parameter("name", mcp_types::ValueType::String, "Name of the user to greet"),
    };
    descriptor.return_type = mcp_types::ValueType::String;
    return registry.register_tool(descriptor, handle_greet_user);
}

} // namespace tool_greet_user
