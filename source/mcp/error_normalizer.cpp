#include "mcp/error_normalizer.hpp"

#include "protocol/json_rpc.hpp"

namespace error_normalizer {

const char *kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NotFound:
        return "NotFound";
    case ErrorKind::ValidationError:
        return "ValidationError";
    case ErrorKind::ToolExecutionError:
        return "ToolExecutionError";
    case ErrorKind::Timeout:
        return "Timeout";
    case ErrorKind::DuplicateTool:
        return "DuplicateTool";
    case ErrorKind::TransportDecodeError:
        return "TransportDecodeError";
    case ErrorKind::Internal:
        return "Internal";
    }
    return "Internal";
}

int json_rpc_code(const StructuredError &error) {
    switch (error.kind) {
    case ErrorKind::NotFound:
        return json_rpc::METHOD_NOT_FOUND;
    case ErrorKind::ValidationError:
        return json_rpc::INVALID_PARAMS;
    case ErrorKind::ToolExecutionError:
        return TOOL_EXECUTION_ERROR;
    case ErrorKind::Timeout:
        return TIMEOUT_ERROR;
    case ErrorKind::DuplicateTool:
        return DUPLICATE_TOOL_ERROR;
    case ErrorKind::TransportDecodeError:
        if (error.detail.is_object() && error.detail.value("stage", "") == "parse") {
            return json_rpc::PARSE_ERROR;
        }
        return json_rpc::INVALID_REQUEST;
    case ErrorKind::Internal:
        return json_rpc::INTERNAL_ERROR;
    }
    return json_rpc::INTERNAL_ERROR;
}

StructuredError make_error(ErrorKind kind, const std::string &message,
                           const json &correlation_id, json detail) {
    StructuredError error;
    error.kind = kind;
    error.message = message;
    error.detail = std::move(detail);
    error.correlation_id = correlation_id;
    return error;
}

StructuredError from_tool_failure(const std::string &tool_name,
                                  const mcp_types::ToolFailure &failure,
                                  const json &correlation_id) {
    json detail;
    detail["tool"] = tool_name;
    detail["subkind"] = mcp_types::tool_failure_kind_name(failure.kind);
    if (!failure.detail.is_null()) {
        detail["info"] = failure.detail;
    }

    std::string message = failure.message;
    if (message.empty()) {
        message = "Tool '" + tool_name + "' failed";
    }
    return make_error(ErrorKind::ToolExecutionError, message, correlation_id, detail);
}

StructuredError from_exception(const std::exception &exception, const std::string &context,
                               const json &correlation_id) {
    json detail;
    detail["context"] = context;
    detail["cause"] = exception.what();
    return make_error(ErrorKind::Internal, "Internal error in " + context + ": " + exception.what(),
                      correlation_id, detail);
}

StructuredError from_unknown_exception(const std::string &context, const json &correlation_id) {
    json detail;
    detail["context"] = context;
    detail["cause"] = "non-standard exception";
    return make_error(ErrorKind::Internal, "Internal error in " + context + ": unknown exception",
                      correlation_id, detail);
}

StructuredError decode_error(const std::string &message, const json &correlation_id,
                             bool parse_failure, json detail) {
    if (!detail.is_object()) {
        detail = json::object();
    }
    detail["stage"] = parse_failure ? "parse" : "envelope";
    return make_error(ErrorKind::TransportDecodeError, message, correlation_id, detail);
}

json build_error_response(const StructuredError &error) {
    json data;
    data["kind"] = kind_name(error.kind);
    data["detail"] = error.detail;
    return json_rpc::build_error_response(error.correlation_id, json_rpc_code(error), error.message, data);
}

std::string payload_text(const json &payload) {
    if (payload.is_string()) {
        return payload.get<std::string>();
    }
    return payload.dump(2, ' ', false, json::error_handler_t::replace);
}

json build_outcome_response(const mcp_types::Outcome &outcome) {
    if (!outcome.success) {
        return build_error_response(outcome.error);
    }

    json text_content;
    text_content["type"] = "text";
    text_content["text"] = payload_text(outcome.payload);

    json result;
    result["content"] = json::array({text_content});
    result["structuredContent"]["result"] = outcome.payload;
    result["isError"] = false;
    return json_rpc::build_response(outcome.correlation_id, result);
}

} // namespace error_normalizer
