#include "mcp/mcp_types.hpp"

namespace mcp_types {

const char *value_type_name(ValueType type) {
    switch (type) {
    case ValueType::String:
        return "string";
    case ValueType::Number:
        return "number";
    case ValueType::Integer:
        return "integer";
    case ValueType::Boolean:
        return "boolean";
    case ValueType::Array:
        return "array";
    case ValueType::Object:
        return "object";
    case ValueType::Any:
        return "any";
    }
    return "any";
}

std::string received_type_name(const json &value) {
    if (value.is_number_integer()) {
        return "integer";
    }
    if (value.is_number_float()) {
        return "number";
    }
    return value.type_name();
}

bool value_matches_type(const json &value, ValueType type) {
    switch (type) {
    case ValueType::String:
        return value.is_string();
    case ValueType::Number:
        return value.is_number();
    case ValueType::Integer:
        return value.is_number_integer();
    case ValueType::Boolean:
        return value.is_boolean();
    case ValueType::Array:
        return value.is_array();
    case ValueType::Object:
        return value.is_object();
    case ValueType::Any:
        return true;
    }
    return false;
}

const char *tool_failure_kind_name(ToolFailureKind kind) {
    switch (kind) {
    case ToolFailureKind::NotFound:
        return "not_found";
    case ToolFailureKind::PermissionDenied:
        return "permission_denied";
    case ToolFailureKind::InvalidInput:
        return "invalid_input";
    case ToolFailureKind::UpstreamServiceError:
        return "upstream_service_error";
    case ToolFailureKind::Internal:
        return "internal";
    }
    return "internal";
}

ToolResult ToolResult::ok(json payload_value) {
    ToolResult result;
    result.success = true;
    result.payload = std::move(payload_value);
    return result;
}

ToolResult ToolResult::fail(ToolFailureKind kind, const std::string &message, json detail) {
    ToolResult result;
    result.success = false;
    result.failure.kind = kind;
    result.failure.message = message;
    result.failure.detail = std::move(detail);
    return result;
}

const json &ValidatedArguments::get(const std::string &name) const {
    return values.at(name);
}

bool ValidatedArguments::has_value(const std::string &name) const {
    auto iterator = values.find(name);
    return iterator != values.end() && !iterator->is_null();
}

std::string ValidatedArguments::get_string(const std::string &name) const {
    return values.at(name).get<std::string>();
}

double ValidatedArguments::get_number(const std::string &name) const {
    return values.at(name).get<double>();
}

std::int64_t ValidatedArguments::get_integer(const std::string &name) const {
    return values.at(name).get<std::int64_t>();
}

bool ValidatedArguments::get_boolean(const std::string &name) const {
    return values.at(name).get<bool>();
}

Outcome Outcome::succeeded(const json &correlation_id, json payload_value) {
    Outcome outcome;
    outcome.correlation_id = correlation_id;
    outcome.success = true;
    outcome.payload = std::move(payload_value);
    return outcome;
}

Outcome Outcome::failed(StructuredError structured_error) {
    Outcome outcome;
    outcome.correlation_id = structured_error.correlation_id;
    outcome.success = false;
    outcome.error = std::move(structured_error);
    return outcome;
}

} // namespace mcp_types
