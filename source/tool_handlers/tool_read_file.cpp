#include "tool_handlers/tool_handlers.hpp"

using mcp_types::ToolFailureKind;
using mcp_types::ToolResult;

static ToolResult handle_read_file(const mcp_types::ValidatedArguments &arguments) {
    std::string file_path = arguments.get_string("file_path");
    if (file_path.empty()) {
        return ToolResult::fail(ToolFailureKind::InvalidInput, "file_path cannot be empty", {{"field", "file_path"}});
    }
    return tool_handlers::read_text_file(file_path);
}

namespace tool_read_file {

tool_registry::RegistrationResult register_tool(tool_registry::ToolRegistry &registry) {
    mcp_types::ToolDescriptor descriptor;
    descriptor.name = "read_file";
    descriptor.description = "Read the contents of a text file.";
    descriptor.parameters = {
        tool_handlers::required_parameter("file_path", mcp_types::ValueType::String, "Path to the file to read"),
    };
    descriptor.return_type = mcp_types::ValueType::String;
    return registry.register_tool(descriptor, handle_read_file);
}

} // namespace tool_read_file
