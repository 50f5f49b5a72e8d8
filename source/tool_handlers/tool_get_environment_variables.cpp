#include "tool_handlers/tool_handlers.hpp"
#include "utils/utf8_sanitize.hpp"

using json = nlohmann::json;
using mcp_types::ToolResult;

static ToolResult handle_get_environment_variables(const mcp_types::ValidatedArguments &arguments) {
    std::string prefix;
    if (arguments.has_value("prefix")) {
        prefix = arguments.get_string("prefix");
    }

    json variables = json::object();
    for (const auto &entry : platform::environment_variables()) {
        if (entry.first.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        std::string name = entry.first;
        std::string value = entry.second;
        utf8_sanitize::sanitize(name);
        utf8_sanitize::sanitize(value);
        variables[name] = value;
    }
    return ToolResult::ok(variables);
}

namespace tool_get_environment_variables {

tool_registry::RegistrationResult register_tool(tool_registry::ToolRegistry &registry) {
    mcp_types::ToolDescriptor descriptor;
    descriptor.name = "get_environment_variables";
    descriptor.description = "Get the server's environment variables, optionally only those whose "
                             "name starts with a prefix.";
    descriptor.parameters = {
        tool_handlers::optional_parameter("prefix", mcp_types::ValueType::String, nullptr,
                                          "Only return variables whose name starts with this"),
    };
    descriptor.return_type = mcp_types::ValueType::Object;
    return registry.register_tool(descriptor, handle_get_environment_variables);
}

} // namespace tool_get_environment_variables
