#include "mcp/argument_validator.hpp"
#include "mcp/error_normalizer.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <limits>
#include <unordered_set>

namespace argument_validator {

using mcp_types::ErrorKind;
using mcp_types::ParameterSpec;
using mcp_types::ValueType;

static CoercionResult accept(json value) {
    CoercionResult result;
    result.success = true;
    result.value = std::move(value);
    return result;
}

static CoercionResult reject(const std::string &reason) {
    CoercionResult result;
    result.success = false;
    result.reason = reason;
    return result;
}

// Parse text that must be exactly one JSON number (no whitespace, no sign
// tricks, no hex). Returns a discarded value when it is anything else.
static json parse_numeric_text(const std::string &text) {
    if (text.empty() ||
        std::isspace(static_cast<unsigned char>(text.front())) ||
        std::isspace(static_cast<unsigned char>(text.back()))) {
        return json(json::value_t::discarded);
    }
    json parsed = json::parse(text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_number()) {
        return json(json::value_t::discarded);
    }
    if (parsed.is_number_float() && !std::isfinite(parsed.get<double>())) {
        return json(json::value_t::discarded);
    }
    return parsed;
}

// Integer target: integral values only, within int64 range.
static CoercionResult coerce_number_to_integer(const json &number) {
    if (number.is_number_unsigned()) {
        if (number.get<std::uint64_t>() >
            static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return reject("integer out of range");
        }
        return accept(json(static_cast<std::int64_t>(number.get<std::uint64_t>())));
    }
    if (number.is_number_integer()) {
        return accept(number);
    }

    double floating_value = number.get<double>();
    if (!std::isfinite(floating_value)) {
        return reject("non-finite number");
    }
    if (std::trunc(floating_value) != floating_value) {
        return reject("non-integral number would be truncated");
    }
    // 2^63 is exactly representable as a double; anything at or above it overflows.
    if (floating_value < -9223372036854775808.0 || floating_value >= 9223372036854775808.0) {
        return reject("integer out of range");
    }
    return accept(json(static_cast<std::int64_t>(floating_value)));
}

CoercionResult coerce_value(const json &value, ValueType expected_type, ValueType item_type) {
    switch (expected_type) {
    case ValueType::Any:
        return accept(value);

    case ValueType::String:
        if (value.is_string()) {
            return accept(value);
        }
        return reject("expected a string");

    case ValueType::Number:
        if (value.is_number()) {
            return accept(value);
        }
        if (value.is_string()) {
            json parsed = parse_numeric_text(value.get<std::string>());
            if (parsed.is_discarded()) {
                return reject("string is not a number");
            }
            return accept(parsed);
        }
        return reject("expected a number");

    case ValueType::Integer:
        if (value.is_number()) {
            return coerce_number_to_integer(value);
        }
        if (value.is_string()) {
            json parsed = parse_numeric_text(value.get<std::string>());
            if (parsed.is_discarded()) {
                return reject("string is not a number");
            }
            return coerce_number_to_integer(parsed);
        }
        return reject("expected an integer");

    case ValueType::Boolean:
        if (value.is_boolean()) {
            return accept(value);
        }
        if (value.is_string()) {
            const std::string text = value.get<std::string>();
            if (text == "true") {
                return accept(json(true));
            }
            if (text == "false") {
                return accept(json(false));
            }
            return reject("string is not \"true\" or \"false\"");
        }
        return reject("expected a boolean");

    case ValueType::Object:
        if (value.is_object()) {
            return accept(value);
        }
        return reject("expected an object");

    case ValueType::Array: {
        if (!value.is_array()) {
            return reject("expected an array");
        }
        if (item_type == ValueType::Any) {
            return accept(value);
        }
        std::string bad_indexes;
        for (std::size_t index = 0; index < value.size(); ++index) {
            if (!mcp_types::value_matches_type(value[index], item_type)) {
                if (!bad_indexes.empty()) {
                    bad_indexes += ", ";
                }
                bad_indexes += std::to_string(index);
            }
        }
        if (!bad_indexes.empty()) {
            return reject(std::string("array elements must be ") + mcp_types::value_type_name(item_type) +
                          " (bad index: " + bad_indexes + ")");
        }
        return accept(value);
    }
    }
    return reject("unsupported declared type");
}

static std::string join_names(const json &names) {
    std::string joined;
    for (const auto &name : names) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += name.get<std::string>();
    }
    return joined;
}

ValidationResult ArgumentValidator::validate(const mcp_types::ToolDescriptor &descriptor,
                                             const json &raw_arguments,
                                             const json &correlation_id) {
    ValidationResult result;

    json detail;
    detail["tool"] = descriptor.name;
    detail["missing"] = json::array();
    detail["unexpected"] = json::array();
    detail["type_mismatches"] = json::array();

    // A missing "arguments" member in the envelope arrives here as null.
    json arguments = raw_arguments.is_null() ? json::object() : raw_arguments;
    if (!arguments.is_object()) {
        json mismatch;
        mismatch["parameter"] = "";
        mismatch["expected"] = "object";
        mismatch["received"] = mcp_types::received_type_name(arguments);
        mismatch["reason"] = "arguments must be an object";
        detail["type_mismatches"].push_back(mismatch);
        result.error = error_normalizer::make_error(
            ErrorKind::ValidationError,
            "Invalid arguments for tool '" + descriptor.name + "': arguments must be an object",
            correlation_id, detail);
        return result;
    }

    std::unordered_set<std::string> declared_names;
    for (const ParameterSpec &parameter : descriptor.parameters) {
        declared_names.insert(parameter.name);
    }
    for (auto iterator = arguments.begin(); iterator != arguments.end(); ++iterator) {
        if (declared_names.count(iterator.key()) == 0) {
            detail["unexpected"].push_back(iterator.key());
        }
    }

    // Coerced values are staged here and only published if nothing failed.
    json staged_values = json::object();
    for (const ParameterSpec &parameter : descriptor.parameters) {
        auto supplied = arguments.find(parameter.name);
        bool absent = (supplied == arguments.end());

        if (absent || (supplied->is_null() && !parameter.required)) {
            if (parameter.required) {
                detail["missing"].push_back(parameter.name);
            } else {
                staged_values[parameter.name] = parameter.default_value;
            }
            continue;
        }

        if (supplied->is_null()) {
            json mismatch;
            mismatch["parameter"] = parameter.name;
            mismatch["expected"] = mcp_types::value_type_name(parameter.type);
            mismatch["received"] = "null";
            mismatch["reason"] = "required parameter is null";
            detail["type_mismatches"].push_back(mismatch);
            continue;
        }

        CoercionResult coercion = coerce_value(*supplied, parameter.type, parameter.item_type);
        if (!coercion.success) {
            json mismatch;
            mismatch["parameter"] = parameter.name;
            mismatch["expected"] = mcp_types::value_type_name(parameter.type);
            mismatch["received"] = mcp_types::received_type_name(*supplied);
            mismatch["reason"] = coercion.reason;
            detail["type_mismatches"].push_back(mismatch);
            continue;
        }
        staged_values[parameter.name] = coercion.value;
    }

    if (detail["missing"].empty() && detail["unexpected"].empty() && detail["type_mismatches"].empty()) {
        result.arguments = mcp_types::ValidatedArguments(std::move(staged_values));
        return result;
    }

    std::string message = "Invalid arguments for tool '" + descriptor.name + "'";
    if (!detail["missing"].empty()) {
        message += "; missing required parameter(s): " + join_names(detail["missing"]);
    }
    if (!detail["unexpected"].empty()) {
        message += "; unexpected parameter(s): " + join_names(detail["unexpected"]);
    }
    if (!detail["type_mismatches"].empty()) {
        std::string mismatched;
        for (const auto &mismatch : detail["type_mismatches"]) {
            if (!mismatched.empty()) {
                mismatched += ", ";
            }
            mismatched += mismatch["parameter"].get<std::string>() + " (expected " +
                          mismatch["expected"].get<std::string>() + ", received " +
                          mismatch["received"].get<std::string>() + ")";
        }
        message += "; type mismatch: " + mismatched;
    }

    result.error = error_normalizer::make_error(ErrorKind::ValidationError, message, correlation_id, detail);
    return result;
}

} // namespace argument_validator
