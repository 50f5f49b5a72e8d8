#ifndef MMCPS_TOOL_REGISTRY_HPP
#define MMCPS_TOOL_REGISTRY_HPP

// MCP tool registry: registration, lookup and listing of tools.
//
// Tools are registered explicitly at startup, then the registry is sealed and
// becomes read-only. Transports only start after sealing, so lookups take no
// locks.

#include <nlohmann/json.hpp>
#include <cstddef>
#include <deque>
#include <string>
#include <unordered_map>

#include "mcp/mcp_types.hpp"

namespace tool_registry {

using json = nlohmann::json;

// Reserved tool name answered by the dispatcher with the tool catalogue.
constexpr const char *DISCOVERY_TOOL_NAME = "list_tools";

struct RegisteredTool {
    mcp_types::ToolDescriptor descriptor;
    mcp_types::ToolImplementation implementation;
};

struct RegistrationResult {
    bool success = false;
    mcp_types::StructuredError error;
};

// Restartable view over the registered descriptors, in registration order.
// Every begin() starts a fresh pass; nothing is copied.
class DescriptorRange {
public:
    using underlying_iterator = std::deque<RegisteredTool>::const_iterator;

    class iterator {
    public:
        explicit iterator(underlying_iterator position) : position(position) {}

        const mcp_types::ToolDescriptor &operator*() const { return position->descriptor; }
        const mcp_types::ToolDescriptor *operator->() const { return &position->descriptor; }

        iterator &operator++() {
            ++position;
            return *this;
        }

        bool operator==(const iterator &other) const { return position == other.position; }
        bool operator!=(const iterator &other) const { return position != other.position; }

    private:
        underlying_iterator position;
    };

    DescriptorRange(underlying_iterator first, underlying_iterator last) : first(first), last(last) {}

    iterator begin() const { return iterator(first); }
    iterator end() const { return iterator(last); }

private:
    underlying_iterator first;
    underlying_iterator last;
};

class ToolRegistry {
public:
    // Add a tool. Fails with DuplicateTool when the name is taken (or is the
    // reserved discovery name), with Internal when the descriptor is malformed
    // or the registry is sealed.
    RegistrationResult register_tool(mcp_types::ToolDescriptor descriptor,
                                     mcp_types::ToolImplementation implementation);

    // Returns nullptr when no tool has that name.
    const RegisteredTool *lookup(const std::string &name) const;

    DescriptorRange list() const;

    void seal() { sealed = true; }
    bool is_sealed() const { return sealed; }

    std::size_t size() const { return tools.size(); }

private:
    // deque: references handed out by lookup() survive later registrations.
    std::deque<RegisteredTool> tools;
    std::unordered_map<std::string, std::size_t> index_by_name;
    bool sealed = false;
};

// JSON Schema ("inputSchema") generated from a descriptor's parameters.
json build_input_schema(const mcp_types::ToolDescriptor &descriptor);

// One discovery entry: name, description, inputSchema, parameters, returnType.
json describe_tool(const mcp_types::ToolDescriptor &descriptor);

// Build the response payload for tools/list: {"tools": [...]}.
json build_tools_list_response(const ToolRegistry &registry);

} // namespace tool_registry

#endif // MMCPS_TOOL_REGISTRY_HPP
