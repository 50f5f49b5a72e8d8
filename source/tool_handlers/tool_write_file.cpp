#include "tool_handlers/tool_handlers.hpp"

using mcp_types::ToolFailureKind;
using mcp_types::ToolResult;

static ToolResult handle_write_file(const mcp_types::ValidatedArguments &arguments) {
    std::string file_path = arguments.get_string("file_path");
    if (file_path.empty()) {
        return ToolResult::fail(ToolFailureKind::InvalidInput, "file_path cannot be empty", {{"field", "file_path"}});
    }
    return tool_handlers::write_text_file(file_path, arguments.get_string("content"),
                                          arguments.get_boolean("overwrite"));
}

namespace tool_write_file {

tool_registry::RegistrationResult register_tool(tool_registry::ToolRegistry &registry) {
    mcp_types::ToolDescriptor descriptor;
    descriptor.name = "write_file";
    descriptor.description = "Write text content to a file. Missing parent directories are created. "
                             "An existing file is only replaced when overwrite is true.";
    descriptor.parameters = {
        tool_handlers::required_parameter("file_path", mcp_types::ValueType::String, "Path of the file to write"),
        tool_handlers::required_parameter("content", mcp_types::ValueType::String, "Text to write"),
        tool_handlers::optional_parameter("overwrite", mcp_types::ValueType::Boolean, false,
                                          "Replace the file if it already exists"),
    };
    descriptor.return_type = mcp_types::ValueType::Object;
    return registry.register_tool(descriptor, handle_write_file);
}

} // namespace tool_write_file
