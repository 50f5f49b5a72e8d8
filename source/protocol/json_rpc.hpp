#ifndef MMCPS_JSON_RPC_HPP
#define MMCPS_JSON_RPC_HPP

// JSON-RPC 2.0 helpers for MCP protocol communication.
// Uses nlohmann/json for parsing and serialization.

#include <nlohmann/json.hpp>
#include <string>

namespace json_rpc {

using json = nlohmann::json;

// Build a JSON-RPC 2.0 success response.
json build_response(const json &request_id, const json &result_payload);

// Build a JSON-RPC 2.0 error response.
json build_error_response(const json &request_id, int error_code, const std::string &error_message);

// Build a JSON-RPC 2.0 error response with additional data.
json build_error_response(const json &request_id, int error_code, const std::string &error_message, const json &error_data);

// Standard JSON-RPC error codes.
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

// A request whose envelope has been checked. params is always an object.
struct Request {
    std::string method;
    json id;                      // null for notifications
    bool is_notification = false; // no "id" member at all
    json params = json::object();
};

struct DecodeResult {
    bool success = false;
    Request request;
    std::string error_message;
    json error_id; // id to answer with when decoding fails (null if unknown)
};

// Check a parsed message against the JSON-RPC 2.0 request shape:
// object, "jsonrpc" == "2.0", string "method", string/number/null "id",
// object "params". For "tools/call" also require a string "name" and an
// object "arguments" when present.
DecodeResult decode_request(const json &message);

// Check if a message is a notification (no id field).
bool is_notification(const json &message);

} // namespace json_rpc

#endif // MMCPS_JSON_RPC_HPP
