#ifndef MMCPS_CALL_DISPATCHER_HPP
#define MMCPS_CALL_DISPATCHER_HPP

// Turns one Call into exactly one Outcome: lookup, validation, invocation
// under a per-call timeout, and normalization of whatever the tool did.
// Holds no transport state; one instance is shared by every adapter.

#include <nlohmann/json.hpp>
#include <chrono>

#include "mcp/mcp_types.hpp"
#include "mcp/tool_registry.hpp"

namespace call_dispatcher {

using json = nlohmann::json;

class Dispatcher {
public:
    // A timeout of zero waits for the tool without limit.
    Dispatcher(const tool_registry::ToolRegistry &registry, std::chrono::milliseconds call_timeout);

    // Never throws. The reserved discovery name is answered here.
    mcp_types::Outcome dispatch(const mcp_types::Call &call) const;

    // Discovery document: {"tools": [...]}.
    json describe_tools() const;

    const tool_registry::ToolRegistry &get_registry() const { return registry; }

private:
    mcp_types::Outcome dispatch_discovery(const mcp_types::Call &call) const;
    mcp_types::Outcome invoke_with_timeout(const tool_registry::RegisteredTool &tool,
                                           const mcp_types::ValidatedArguments &arguments,
                                           const json &correlation_id) const;

    const tool_registry::ToolRegistry &registry;
    std::chrono::milliseconds call_timeout;
};

} // namespace call_dispatcher

#endif // MMCPS_CALL_DISPATCHER_HPP
