#include "mcp/mcp_dispatch.hpp"
#include "mcp/error_normalizer.hpp"
#include "utils/server_log.hpp"

// MCP JSON-RPC method dispatch.
// Routes incoming MCP messages to the appropriate handler.

namespace mcp_dispatch {

// Description so that MCP clients can tell what kind of tools this server offers.
static const std::string SERVER_DESCRIPTION =
    "General-purpose MCP server: arithmetic and greeting utilities, local file "
    "read/write and directory listing, process and system statistics, shell "
    "command execution, environment inspection, and email/calendar operations "
    "forwarded to a companion HTTP service. Call list_tools or tools/list for "
    "the full catalogue with parameter types.";

// Handle the "initialize" request.
static json handle_initialize(const json &request_id, const json &params) {
    if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
        server_log::info("Client connected: " + params["clientInfo"].value("name", std::string("unknown")));
    }

    json capabilities;
    capabilities["tools"] = json::object(); // We expose tools.

    json server_info;
    server_info["name"] = SERVER_NAME;
    server_info["version"] = SERVER_VERSION;
    server_info["description"] = SERVER_DESCRIPTION;

    json result;
    result["protocolVersion"] = PROTOCOL_VERSION;
    result["capabilities"] = capabilities;
    result["serverInfo"] = server_info;

    return json_rpc::build_response(request_id, result);
}

// Handle the "tools/list" request.
static json handle_tools_list(const call_dispatcher::Dispatcher &dispatcher, const json &request_id) {
    return json_rpc::build_response(request_id, dispatcher.describe_tools());
}

// Handle the "tools/call" request. The envelope was checked by decode_request,
// so "name" is a string and "arguments" is an object or absent.
static json handle_tools_call(const call_dispatcher::Dispatcher &dispatcher, const json &request_id,
                              const json &params) {
    mcp_types::Call call;
    call.tool_name = params["name"].get<std::string>();
    call.arguments = params.contains("arguments") ? params["arguments"] : json(nullptr);
    call.correlation_id = request_id;

    mcp_types::Outcome outcome = dispatcher.dispatch(call);
    if (!outcome.success) {
        server_log::debug("tools/call " + call.tool_name + " failed: " + outcome.error.message);
    }
    return error_normalizer::build_outcome_response(outcome);
}

DecodedMessage decode_message(const std::string &frame_text) {
    DecodedMessage decoded;

    json parsed_message;
    try {
        parsed_message = json::parse(frame_text);
    } catch (const json::parse_error &error) {
        json detail;
        detail["cause"] = error.what();
        decoded.error = error_normalizer::decode_error("Parse error", nullptr, true, detail);
        return decoded;
    }

    json_rpc::DecodeResult envelope = json_rpc::decode_request(parsed_message);
    if (!envelope.success) {
        decoded.error = error_normalizer::decode_error(envelope.error_message, envelope.error_id, false);
        return decoded;
    }

    decoded.success = true;
    decoded.request = std::move(envelope.request);
    return decoded;
}

json handle_request(const call_dispatcher::Dispatcher &dispatcher, const json_rpc::Request &request) {
    // Notifications ("notifications/initialized", "notifications/cancelled", ...)
    // are acknowledged silently.
    if (request.is_notification) {
        server_log::debug("Notification: " + request.method);
        return nullptr;
    }

    if (request.method == "initialize") {
        return handle_initialize(request.id, request.params);
    }
    if (request.method == "ping") {
        return json_rpc::build_response(request.id, json::object());
    }
    if (request.method == "tools/list") {
        return handle_tools_list(dispatcher, request.id);
    }
    if (request.method == "tools/call") {
        return handle_tools_call(dispatcher, request.id, request.params);
    }

    json detail;
    detail["method"] = request.method;
    return error_normalizer::build_error_response(error_normalizer::make_error(
        mcp_types::ErrorKind::NotFound, "Unknown method: " + request.method, request.id, detail));
}

} // namespace mcp_dispatch
