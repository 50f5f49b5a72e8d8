#include "tool_handlers/tool_handlers.hpp"
#include "utils/server_log.hpp"

#include <cstdint>
#include <limits>

using json = nlohmann::json;
using mcp_types::ToolResult;

// Tool handler for "add_numbers".
// Integral inputs give an integral sum unless an input or the sum falls
// outside int64; those go through double.

static ToolResult handle_add_numbers(const mcp_types::ValidatedArguments &arguments) {
    const json &first = arguments.get("a");
    const json &second = arguments.get("b");

    if (tool_handlers::fits_int64(first) && tool_handlers::fits_int64(second)) {
        std::int64_t left = first.get<std::int64_t>();
        std::int64_t right = second.get<std::int64_t>();
        bool overflows = (right > 0 && left > std::numeric_limits<std::int64_t>::max() - right) ||
                         (right < 0 && left < std::numeric_limits<std::int64_t>::min() - right);
        if (!overflows) {
            server_log::debug("add_numbers: " + std::to_string(left + right));
            return ToolResult::ok(left + right);
        }
    }
    return ToolResult::ok(first.get<double>() + second.get<double>());
}

namespace tool_add_numbers {

tool_registry::RegistrationResult register_tool(tool_registry::ToolRegistry &registry) {
    mcp_types::ToolDescriptor descriptor;
    descriptor.name = "add_numbers";
    descriptor.description = "Add two numbers together and return the sum.";
    descriptor.parameters = {
        tool_handlers::required_parameter("a", mcp_types::ValueType::Number, "First number"),
        tool_handlers::required_parameter("b", mcp_types::ValueType::Number, "Second number"),
    };
    descriptor.return_type = mcp_types::ValueType::Number;
    return registry.register_tool(descriptor, handle_add_numbers);
}

} // namespace tool_add_numbers
