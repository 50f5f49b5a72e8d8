#ifndef MMCPS_MCP_DISPATCH_HPP
#define MMCPS_MCP_DISPATCH_HPP

// MCP JSON-RPC method routing, shared by the stdio and HTTP transports.

#include <nlohmann/json.hpp>
#include <string>

#include "mcp/call_dispatcher.hpp"
#include "mcp/mcp_types.hpp"
#include "protocol/json_rpc.hpp"

namespace mcp_dispatch {

using json = nlohmann::json;

// Protocol version we support.
constexpr const char *PROTOCOL_VERSION = "2024-11-05";

constexpr const char *SERVER_NAME = "mmcps";
constexpr const char *SERVER_VERSION = "0.1.0";

struct DecodedMessage {
    bool success = false;
    json_rpc::Request request;
    mcp_types::StructuredError error; // TransportDecodeError when !success
};

// Parse one frame's text and check its JSON-RPC envelope.
DecodedMessage decode_message(const std::string &frame_text);

// Route a decoded request. Returns the response JSON, or a null json value
// for notifications (which require no response).
json handle_request(const call_dispatcher::Dispatcher &dispatcher, const json_rpc::Request &request);

} // namespace mcp_dispatch

#endif // MMCPS_MCP_DISPATCH_HPP
