#include "tool_handlers/tool_handlers.hpp"

#include <cmath>
#include <cstdint>

using json = nlohmann::json;
using mcp_types::ToolResult;

// Integral inputs give an integral product when it is exactly representable.
static ToolResult handle_multiply_numbers(const mcp_types::ValidatedArguments &arguments) {
    const json &first = arguments.get("a");
    const json &second = arguments.get("b");

    double product = first.get<double>() * second.get<double>();
    if (tool_handlers::fits_int64(first) && tool_handlers::fits_int64(second) &&
        std::fabs(product) < 9007199254740992.0) {
        return ToolResult::ok(first.get<std::int64_t>() * second.get<std::int64_t>());
    }
    return ToolResult::ok(product);
}

namespace tool_multiply_numbers {

tool_registry::RegistrationResult register_tool(tool_registry::ToolRegistry &registry) {
    mcp_types::ToolDescriptor descriptor;
    descriptor.name = "multiply_numbers";
    descriptor.description = "Multiply two numbers together and return the product.";
    descriptor.parameters = {
        tool_handlers::required_parameter("a", mcp_types::ValueType::Number, "First number"),
        tool_handlers::required_parameter("b", mcp_types::ValueType::Number, "Second number"),
    };
    descriptor.return_type = mcp_types::ValueType::Number;
    return registry.register_tool(descriptor, handle_multiply_numbers);
}

} // namespace tool_multiply_numbers
