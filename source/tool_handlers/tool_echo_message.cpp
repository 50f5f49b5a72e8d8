#include "tool_handlers/tool_handlers.hpp"

using mcp_types::ToolFailureKind;
using mcp_types::ToolResult;

// Tool handler for "echo_message". Useful for checking a client round trip.

static ToolResult handle_echo_message(const mcp_types::ValidatedArguments &arguments) {
    std::string message = arguments.get_string("message");
    if (message.empty()) {
        return ToolResult::fail(ToolFailureKind::InvalidInput, "Message cannot be empty", {{"field", "message"}});
    }
    return ToolResult::ok("Echo: " + message);
}

namespace tool_echo_message {

tool_registry::RegistrationResult register_tool(tool_registry::ToolRegistry &registry) {
    mcp_types::ToolDescriptor descriptor;
    descriptor.name = "echo_message";
    descriptor.description = "Echo back a message, prefixed with \"Echo: \".";
    descriptor.parameters = {
        tool_handlers::required_parameter("message", mcp_types::ValueType::String, "Message to echo back"),
    };
    descriptor.return_type = mcp_types::ValueType::String;
    return registry.register_tool(descriptor, handle_echo_message);
}

} // namespace tool_echo_message
