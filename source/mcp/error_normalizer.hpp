#ifndef MMCPS_ERROR_NORMALIZER_HPP
#define MMCPS_ERROR_NORMALIZER_HPP

// Every failure, whatever produced it, leaves the server as one StructuredError
// shape and one JSON-RPC error envelope. Nothing unclassified crosses the
// transport boundary.

#include <nlohmann/json.hpp>
#include <exception>
#include <string>

#include "mcp/mcp_types.hpp"

namespace error_normalizer {

using json = nlohmann::json;
using mcp_types::ErrorKind;
using mcp_types::StructuredError;

// JSON-RPC error codes for the kinds that have no standard code.
constexpr int TOOL_EXECUTION_ERROR = -32000;
constexpr int TIMEOUT_ERROR = -32001;
constexpr int DUPLICATE_TOOL_ERROR = -32002;

// "NotFound", "ValidationError", ...
const char *kind_name(ErrorKind kind);

// JSON-RPC code for an error. TransportDecodeError maps to -32700 when the
// frame was not JSON at all (detail.stage == "parse"), -32600 otherwise.
int json_rpc_code(const StructuredError &error);

StructuredError make_error(ErrorKind kind, const std::string &message,
                           const json &correlation_id, json detail = nullptr);

// Tool body reported a typed failure: ToolExecutionError, subkind preserved.
StructuredError from_tool_failure(const std::string &tool_name,
                                  const mcp_types::ToolFailure &failure,
                                  const json &correlation_id);

// Anything thrown that we did not classify becomes Internal; the original
// message is kept in detail.cause.
StructuredError from_exception(const std::exception &exception, const std::string &context,
                               const json &correlation_id);

StructuredError from_unknown_exception(const std::string &context, const json &correlation_id);

// Malformed frame or envelope, produced by a transport adapter before any
// Call exists. parse_failure marks frames that were not valid JSON.
StructuredError decode_error(const std::string &message, const json &correlation_id,
                             bool parse_failure, json detail = nullptr);

// Full JSON-RPC error response for the error's correlation id.
json build_error_response(const StructuredError &error);

// JSON-RPC response for a tools/call outcome: MCP content on success,
// error envelope otherwise.
json build_outcome_response(const mcp_types::Outcome &outcome);

// Text rendering of a success payload for MCP "content" blocks.
std::string payload_text(const json &payload);

} // namespace error_normalizer

#endif // MMCPS_ERROR_NORMALIZER_HPP
