#ifndef MMCPS_MCP_TYPES_HPP
#define MMCPS_MCP_TYPES_HPP

// Core data model shared by the registry, validator, dispatcher and both
// transports: tool descriptors, calls, outcomes and the structured error.

#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace argument_validator {
class ArgumentValidator;
}

namespace mcp_types {

using json = nlohmann::json;

// Error vocabulary visible to callers of either transport.
enum class ErrorKind {
    NotFound,
    ValidationError,
    ToolExecutionError,
    Timeout,
    DuplicateTool,
    TransportDecodeError,
    Internal
};

struct StructuredError {
    ErrorKind kind = ErrorKind::Internal;
    std::string message;
    json detail;          // null when there is nothing machine-readable to add
    json correlation_id;  // JSON-RPC id of the originating call, null if none
};

// Declared parameter / return types. "Any" accepts every JSON value.
enum class ValueType {
    String,
    Number,
    Integer,
    Boolean,
    Array,
    Object,
    Any
};

const char *value_type_name(ValueType type);

// Name used when reporting what a caller actually sent ("integer" vs "number"
// is distinguished for numbers).
std::string received_type_name(const json &value);

// Exact match, no coercion. Integer accepts only integral JSON numbers.
bool value_matches_type(const json &value, ValueType type);

struct ParameterSpec {
    std::string name;
    ValueType type = ValueType::Any;
    bool required = true;
    json default_value;   // used when an optional parameter is absent
    std::string description;
    ValueType item_type = ValueType::Any; // element type when type is Array
};

struct ToolDescriptor {
    std::string name;
    std::string description;
    std::vector<ParameterSpec> parameters;
    ValueType return_type = ValueType::Any;
};

// Failure subkinds a tool body can report.
enum class ToolFailureKind {
    NotFound,
    PermissionDenied,
    InvalidInput,
    UpstreamServiceError,
    Internal
};

const char *tool_failure_kind_name(ToolFailureKind kind);

struct ToolFailure {
    ToolFailureKind kind = ToolFailureKind::Internal;
    std::string message;
    json detail;
};

// What a tool body returns: a JSON payload on success, a typed failure otherwise.
struct ToolResult {
    bool success = false;
    json payload;
    ToolFailure failure;

    static ToolResult ok(json payload_value);
    static ToolResult fail(ToolFailureKind kind, const std::string &message, json detail = nullptr);
};

// Arguments that passed validation: one entry per declared parameter, coerced
// to the declared type, defaults filled in. Only the validator can build one.
class ValidatedArguments {
public:
    const json &get(const std::string &name) const;

    // False when the parameter's value is null (absent optional without default).
    bool has_value(const std::string &name) const;

    std::string get_string(const std::string &name) const;
    double get_number(const std::string &name) const;
    std::int64_t get_integer(const std::string &name) const;
    bool get_boolean(const std::string &name) const;

    const json &as_json() const { return values; }

private:
    friend class argument_validator::ArgumentValidator;

    explicit ValidatedArguments(json validated_values) : values(std::move(validated_values)) {}

    json values;
};

using ToolImplementation = std::function<ToolResult(const ValidatedArguments &arguments)>;

// One request to invoke a tool.
struct Call {
    std::string tool_name;
    json arguments;       // as received, before validation
    json correlation_id;
};

// Result of one Call: a success payload or a structured error.
struct Outcome {
    json correlation_id;
    bool success = false;
    json payload;
    StructuredError error;

    static Outcome succeeded(const json &correlation_id, json payload_value);
    static Outcome failed(StructuredError structured_error);
};

} // namespace mcp_types

#endif // MMCPS_MCP_TYPES_HPP
