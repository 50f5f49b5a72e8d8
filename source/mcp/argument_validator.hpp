#ifndef MMCPS_ARGUMENT_VALIDATOR_HPP
#define MMCPS_ARGUMENT_VALIDATOR_HPP

// Checks a call's raw arguments against a tool descriptor.
//
// Policy: closed schema (unknown names rejected), required names must be
// present, absent optionals take their declared default, and only lossless
// scalar coercions are applied (numeric strings to numbers, "true"/"false" to
// booleans, integral floats to integers). Every problem is reported at once;
// nothing is handed to the tool unless the whole set is valid.

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "mcp/mcp_types.hpp"

namespace argument_validator {

using json = nlohmann::json;

struct CoercionResult {
    bool success = false;
    json value;
    std::string reason; // why the value was rejected
};

// Coerce one value to the declared type (see policy above).
CoercionResult coerce_value(const json &value, mcp_types::ValueType expected_type,
                            mcp_types::ValueType item_type = mcp_types::ValueType::Any);

struct ValidationResult {
    std::optional<mcp_types::ValidatedArguments> arguments; // set only on success
    mcp_types::StructuredError error;                         // ValidationError otherwise

    bool success() const { return arguments.has_value(); }
};

class ArgumentValidator {
public:
    // error.detail on failure:
    //   {"tool": name,
    //    "missing": [names], "unexpected": [names],
    //    "type_mismatches": [{"parameter", "expected", "received", "reason"}]}
    static ValidationResult validate(const mcp_types::ToolDescriptor &descriptor,
                                     const json &raw_arguments,
                                     const json &correlation_id);
};

} // namespace argument_validator

#endif // MMCPS_ARGUMENT_VALIDATOR_HPP
