#include "tool_handlers/tool_handlers.hpp"

using json = nlohmann::json;
using mcp_types::ToolFailureKind;
using mcp_types::ToolResult;

static ToolResult handle_write_json_file(const mcp_types::ValidatedArguments &arguments) {
    std::string file_path = arguments.get_string("file_path");
    std::int64_t indent = arguments.get_integer("indent");
    if (indent < 0 || indent > 16) {
        return ToolResult::fail(ToolFailureKind::InvalidInput, "indent must be between 0 and 16",
                                {{"field", "indent"}, {"value", indent}});
    }

    std::string text = arguments.get("data").dump(static_cast<int>(indent), ' ', false,
                                                  json::error_handler_t::replace);
    return tool_handlers::write_text_file(file_path, text + "\n", arguments.get_boolean("overwrite"));
}

namespace tool_write_json_file {

tool_registry::RegistrationResult register_tool(tool_registry::ToolRegistry &registry) {
    mcp_types::ToolDescriptor descriptor;
    descriptor.name = "write_json_file";
    descriptor.description = "Serialize a JSON object and write it to a file.";
    descriptor.parameters = {
        tool_handlers::required_parameter("file_path", mcp_types::ValueType::String, "Path of the file to write"),
        tool_handlers::required_parameter("data", mcp_types::ValueType::Object, "Object to serialize"),
        tool_handlers::optional_parameter("indent", mcp_types::ValueType::Integer, 2, "Spaces per indent level"),
        tool_handlers::optional_parameter("overwrite", mcp_types::ValueType::Boolean, false,
                                          "Replace the file if it already exists"),
    };
    descriptor.return_type = mcp_types::ValueType::Object;
    return registry.register_tool(descriptor, handle_write_json_file);
}

} // namespace tool_write_json_file
