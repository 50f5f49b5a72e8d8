// Tests for tool registration, lookup and the discovery document.

#include "mcp/tool_registry.hpp"
#include "test_support.hpp"

#include <string>
#include <vector>

using json = nlohmann::json;
using mcp_types::ErrorKind;
using mcp_types::ToolResult;
using mcp_types::ValueType;
using test_support::report;

namespace test_tool_registry {

static mcp_types::ToolDescriptor make_descriptor(const std::string &name) {
    mcp_types::ToolDescriptor descriptor;
    descriptor.name = name;
    descriptor.description = "Test tool " + name;

    mcp_types::ParameterSpec required;
    required.name = "a";
    required.type = ValueType::Number;
    required.description = "First";

    mcp_types::ParameterSpec optional;
    optional.name = "label";
    optional.type = ValueType::String;
    optional.required = false;
    optional.default_value = "none";

    descriptor.parameters = {required, optional};
    descriptor.return_type = ValueType::Number;
    return descriptor;
}

static ToolResult noop(const mcp_types::ValidatedArguments &) {
    return ToolResult::ok(nullptr);
}

static bool test_register_and_lookup() {
    tool_registry::ToolRegistry registry;
    tool_registry::RegistrationResult result = registry.register_tool(make_descriptor("first"), noop);
    const tool_registry::RegisteredTool *tool = registry.lookup("first");
    return report(result.success && tool != nullptr && tool->descriptor.name == "first" &&
                      registry.lookup("missing") == nullptr && registry.size() == 1,
                  "Registered tool can be looked up, unknown name returns nullptr");
}

static bool test_duplicate_rejected() {
    tool_registry::ToolRegistry registry;
    registry.register_tool(make_descriptor("twice"), noop);
    tool_registry::RegistrationResult second = registry.register_tool(make_descriptor("twice"), noop);
    return report(!second.success && second.error.kind == ErrorKind::DuplicateTool && registry.size() == 1,
                  "Second registration of the same name fails with DuplicateTool");
}

static bool test_reserved_name_rejected() {
    tool_registry::ToolRegistry registry;
    tool_registry::RegistrationResult result =
        registry.register_tool(make_descriptor(tool_registry::DISCOVERY_TOOL_NAME), noop);
    return report(!result.success && result.error.kind == ErrorKind::DuplicateTool,
                  "The discovery tool name cannot be registered");
}

static bool test_sealed_registry_rejects() {
    tool_registry::ToolRegistry registry;
    registry.seal();
    tool_registry::RegistrationResult result = registry.register_tool(make_descriptor("late"), noop);
    return report(!result.success && registry.is_sealed() && registry.size() == 0,
                  "Registration after seal() fails");
}

static bool test_list_is_restartable_and_ordered() {
    tool_registry::ToolRegistry registry;
    registry.register_tool(make_descriptor("zeta"), noop);
    registry.register_tool(make_descriptor("alpha"), noop);

    std::vector<std::string> first_pass;
    std::vector<std::string> second_pass;
    tool_registry::DescriptorRange range = registry.list();
    for (const mcp_types::ToolDescriptor &descriptor : range) {
        first_pass.push_back(descriptor.name);
    }
    for (const mcp_types::ToolDescriptor &descriptor : range) {
        second_pass.push_back(descriptor.name);
    }
    std::vector<std::string> expected = {"zeta", "alpha"};
    return report(first_pass == expected && second_pass == expected,
                  "list() yields registration order on every pass");
}

static bool test_input_schema() {
    json schema = tool_registry::build_input_schema(make_descriptor("schema"));
    bool success = schema["type"] == "object" && schema["properties"]["a"]["type"] == "number" &&
                   schema["properties"]["label"]["type"] == "string" &&
                   schema["properties"]["label"]["default"] == "none" &&
                   schema["required"] == json::array({"a"}) && schema["additionalProperties"] == false;
    return report(success, "inputSchema lists properties, defaults and required names", schema.dump());
}

static bool test_tools_list_response() {
    tool_registry::ToolRegistry registry;
    registry.register_tool(make_descriptor("one"), noop);
    registry.register_tool(make_descriptor("two"), noop);
    json document = tool_registry::build_tools_list_response(registry);
    bool success = document["tools"].is_array() && document["tools"].size() == 2 &&
                   document["tools"][0]["name"] == "one" && document["tools"][0].contains("inputSchema") &&
                   document["tools"][1]["description"] == "Test tool two";
    return report(success, "tools/list payload carries one entry per tool", document.dump());
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_register_and_lookup();
    all_passed &= test_duplicate_rejected();
    all_passed &= test_reserved_name_rejected();
    all_passed &= test_sealed_registry_rejects();
    all_passed &= test_list_is_restartable_and_ordered();
    all_passed &= test_input_schema();
    all_passed &= test_tools_list_response();
    return all_passed;
}

} // namespace test_tool_registry
