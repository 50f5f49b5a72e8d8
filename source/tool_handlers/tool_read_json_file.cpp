#include "tool_handlers/tool_handlers.hpp"

using json = nlohmann::json;
using mcp_types::ToolFailureKind;
using mcp_types::ToolResult;

static ToolResult handle_read_json_file(const mcp_types::ValidatedArguments &arguments) {
    std::string file_path = arguments.get_string("file_path");
    ToolResult text = tool_handlers::read_text_file(file_path);
    if (!text.success) {
        return text;
    }

    try {
        return ToolResult::ok(json::parse(text.payload.get<std::string>()));
    } catch (const json::parse_error &e) {
        return ToolResult::fail(ToolFailureKind::InvalidInput, "Invalid JSON in file '" + file_path + "': " + e.what(),
                                {{"file_path", file_path}, {"byte", e.byte}});
    }
}

namespace tool_read_json_file {

tool_registry::RegistrationResult register_tool(tool_registry::ToolRegistry &registry) {
    mcp_types::ToolDescriptor descriptor;
    descriptor.name = "read_json_file";
    descriptor.description = "Read a file and parse its contents as JSON.";
    descriptor.parameters = {
        tool_handlers::required_parameter("file_path", mcp_types::ValueType::String, "Path to the JSON file"),
    };
    return registry.register_tool(descriptor, handle_read_json_file);
}

} // namespace tool_read_json_file
