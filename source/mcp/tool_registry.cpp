#include "mcp/tool_registry.hpp"
#include "mcp/error_normalizer.hpp"
#include "utils/server_log.hpp"

#include <unordered_set>

namespace tool_registry {

using mcp_types::ErrorKind;
using mcp_types::ParameterSpec;
using mcp_types::ToolDescriptor;

static RegistrationResult registration_failure(ErrorKind kind, const std::string &message,
                                               const std::string &tool_name) {
    RegistrationResult result;
    result.success = false;
    result.error = error_normalizer::make_error(kind, message, nullptr, json{{"tool", tool_name}});
    return result;
}

// Empty string when the descriptor is usable, otherwise what is wrong with it.
static std::string find_descriptor_problem(const ToolDescriptor &descriptor) {
    if (descriptor.name.empty()) {
        return "tool name must not be empty";
    }

    std::unordered_set<std::string> seen_parameters;
    for (const ParameterSpec &parameter : descriptor.parameters) {
        if (parameter.name.empty()) {
            return "parameter names must not be empty";
        }
        if (!seen_parameters.insert(parameter.name).second) {
            return "parameter '" + parameter.name + "' is declared twice";
        }
        if (!parameter.required && !parameter.default_value.is_null() &&
            !mcp_types::value_matches_type(parameter.default_value, parameter.type)) {
            return std::string("default of parameter '") + parameter.name + "' is not of type " +
                   mcp_types::value_type_name(parameter.type);
        }
    }
    return "";
}

RegistrationResult ToolRegistry::register_tool(ToolDescriptor descriptor,
                                               mcp_types::ToolImplementation implementation) {
    const std::string tool_name = descriptor.name;

    if (sealed) {
        return registration_failure(ErrorKind::Internal,
                                    "Registry is sealed; cannot register '" + tool_name + "'", tool_name);
    }
    if (tool_name == DISCOVERY_TOOL_NAME) {
        return registration_failure(ErrorKind::DuplicateTool,
                                    "Tool name '" + tool_name + "' is reserved for discovery", tool_name);
    }
    if (index_by_name.count(tool_name) > 0) {
        return registration_failure(ErrorKind::DuplicateTool,
                                    "Tool '" + tool_name + "' is already registered", tool_name);
    }

    std::string problem = find_descriptor_problem(descriptor);
    if (!problem.empty()) {
        return registration_failure(ErrorKind::Internal,
                                    "Invalid descriptor for tool '" + tool_name + "': " + problem, tool_name);
    }
    if (!implementation) {
        return registration_failure(ErrorKind::Internal,
                                    "Tool '" + tool_name + "' has no implementation", tool_name);
    }

    index_by_name[tool_name] = tools.size();
    tools.push_back(RegisteredTool{std::move(descriptor), std::move(implementation)});
    server_log::debug("Registered tool: " + tool_name);

    RegistrationResult result;
    result.success = true;
    return result;
}

const RegisteredTool *ToolRegistry::lookup(const std::string &name) const {
    auto iterator = index_by_name.find(name);
    if (iterator == index_by_name.end()) {
        return nullptr;
    }
    return &tools[iterator->second];
}

DescriptorRange ToolRegistry::list() const {
    return DescriptorRange(tools.cbegin(), tools.cend());
}

json build_input_schema(const ToolDescriptor &descriptor) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["additionalProperties"] = false;

    json required_names = json::array();
    for (const ParameterSpec &parameter : descriptor.parameters) {
        json property;
        if (parameter.type != mcp_types::ValueType::Any) {
            property["type"] = mcp_types::value_type_name(parameter.type);
        }
        if (parameter.type == mcp_types::ValueType::Array &&
            parameter.item_type != mcp_types::ValueType::Any) {
            property["items"]["type"] = mcp_types::value_type_name(parameter.item_type);
        }
        if (!parameter.description.empty()) {
            property["description"] = parameter.description;
        }
        if (!parameter.required && !parameter.default_value.is_null()) {
            property["default"] = parameter.default_value;
        }
        input_schema["properties"][parameter.name] = property;

        if (parameter.required) {
            required_names.push_back(parameter.name);
        }
    }
    input_schema["required"] = required_names;
    return input_schema;
}

json describe_tool(const ToolDescriptor &descriptor) {
    json parameters = json::array();
    for (const ParameterSpec &parameter : descriptor.parameters) {
        json entry;
        entry["name"] = parameter.name;
        entry["type"] = mcp_types::value_type_name(parameter.type);
        entry["required"] = parameter.required;
        entry["default"] = parameter.default_value;
        entry["description"] = parameter.description;
        if (parameter.type == mcp_types::ValueType::Array) {
            entry["items"] = mcp_types::value_type_name(parameter.item_type);
        }
        parameters.push_back(entry);
    }

    json tool_entry;
    tool_entry["name"] = descriptor.name;
    tool_entry["description"] = descriptor.description;
    tool_entry["inputSchema"] = build_input_schema(descriptor);
    tool_entry["parameters"] = parameters;
    tool_entry["returnType"] = mcp_types::value_type_name(descriptor.return_type);
    return tool_entry;
}

json build_tools_list_response(const ToolRegistry &registry) {
    json tools_array = json::array();
    for (const ToolDescriptor &descriptor : registry.list()) {
        tools_array.push_back(describe_tool(descriptor));
    }

    json result;
    result["tools"] = tools_array;
    return result;
}

} // namespace tool_registry
