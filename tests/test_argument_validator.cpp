// Tests for argument validation: missing, unexpected and mistyped parameters,
// defaults and lossless coercion.

#include "mcp/argument_validator.hpp"
#include "test_support.hpp"

using json = nlohmann::json;
using argument_validator::ArgumentValidator;
using argument_validator::ValidationResult;
using mcp_types::ErrorKind;
using mcp_types::ValueType;
using test_support::report;

namespace test_argument_validator {

static mcp_types::ParameterSpec parameter(const std::string &name, ValueType type, bool required,
                                          json default_value = nullptr) {
    mcp_types::ParameterSpec spec;
    spec.name = name;
    spec.type = type;
    spec.required = required;
    spec.default_value = std::move(default_value);
    return spec;
}

static mcp_types::ToolDescriptor sample_descriptor() {
    mcp_types::ToolDescriptor descriptor;
    descriptor.name = "sample";
    descriptor.parameters = {
        parameter("a", ValueType::Number, true),
        parameter("count", ValueType::Integer, false, 2),
        parameter("verbose", ValueType::Boolean, false, false),
        parameter("label", ValueType::String, false),
    };
    return descriptor;
}

static bool test_defaults_filled() {
    ValidationResult result = ArgumentValidator::validate(sample_descriptor(), {{"a", 1.5}}, 1);
    bool success = result.success() && result.arguments->get_number("a") == 1.5 &&
                   result.arguments->get_integer("count") == 2 && !result.arguments->get_boolean("verbose") &&
                   !result.arguments->has_value("label");
    return report(success, "Absent optionals take their declared default");
}

static bool test_missing_required() {
    ValidationResult result = ArgumentValidator::validate(sample_descriptor(), json::object(), 7);
    bool success = !result.success() && result.error.kind == ErrorKind::ValidationError &&
                   result.error.detail["missing"] == json::array({"a"}) && result.error.correlation_id == 7 &&
                   result.error.message.find("missing required parameter(s): a") != std::string::npos;
    return report(success, "Missing required parameter is reported by name", result.error.message);
}

static bool test_unexpected_rejected() {
    ValidationResult result = ArgumentValidator::validate(sample_descriptor(), {{"a", 1}, {"extra", true}}, 1);
    bool success = !result.success() && result.error.detail["unexpected"] == json::array({"extra"});
    return report(success, "Undeclared parameter is rejected");
}

static bool test_all_problems_reported_together() {
    json raw = {{"count", "many"}, {"bogus", 1}};
    ValidationResult result = ArgumentValidator::validate(sample_descriptor(), raw, 1);
    const json &detail = result.error.detail;
    bool success = !result.success() && detail["missing"].size() == 1 && detail["unexpected"].size() == 1 &&
                   detail["type_mismatches"].size() == 1 && detail["type_mismatches"][0]["parameter"] == "count" &&
                   detail["type_mismatches"][0]["expected"] == "integer" &&
                   detail["type_mismatches"][0]["received"] == "string";
    return report(success, "Missing, unexpected and mismatched parameters appear in one error", detail.dump());
}

static bool test_numeric_string_coerced() {
    ValidationResult result = ArgumentValidator::validate(sample_descriptor(), {{"a", "2.5"}, {"count", "4"}}, 1);
    bool success = result.success() && result.arguments->get("a").is_number() &&
                   result.arguments->get_number("a") == 2.5 && result.arguments->get_integer("count") == 4;
    return report(success, "Numeric strings are coerced to numbers");
}

static bool test_lossy_coercion_rejected() {
    ValidationResult fractional = ArgumentValidator::validate(sample_descriptor(), {{"a", 1}, {"count", 2.5}}, 1);
    ValidationResult padded = ArgumentValidator::validate(sample_descriptor(), {{"a", " 3"}}, 1);
    ValidationResult word = ArgumentValidator::validate(sample_descriptor(), {{"a", 1}, {"verbose", "yes"}}, 1);
    return report(!fractional.success() && !padded.success() && !word.success(),
                  "Fractional integers, padded numbers and loose booleans are rejected");
}

static bool test_integral_float_accepted() {
    ValidationResult result = ArgumentValidator::validate(sample_descriptor(), {{"a", 1}, {"count", 3.0}}, 1);
    bool success = result.success() && result.arguments->get("count").is_number_integer() &&
                   result.arguments->get_integer("count") == 3;
    return report(success, "Integral float is accepted as an integer");
}

static bool test_boolean_string_coerced() {
    ValidationResult result = ArgumentValidator::validate(sample_descriptor(), {{"a", 1}, {"verbose", "true"}}, 1);
    return report(result.success() && result.arguments->get_boolean("verbose"), "\"true\" is coerced to a boolean");
}

static bool test_null_optional_takes_default() {
    ValidationResult result = ArgumentValidator::validate(sample_descriptor(), {{"a", 1}, {"count", nullptr}}, 1);
    return report(result.success() && result.arguments->get_integer("count") == 2,
                  "Explicit null on an optional takes the default");
}

static bool test_null_required_rejected() {
    ValidationResult result = ArgumentValidator::validate(sample_descriptor(), {{"a", nullptr}}, 1);
    bool success = !result.success() && result.error.detail["type_mismatches"].size() == 1 &&
                   result.error.detail["type_mismatches"][0]["received"] == "null";
    return report(success, "Explicit null on a required parameter is a type mismatch");
}

static bool test_non_object_arguments() {
    ValidationResult result = ArgumentValidator::validate(sample_descriptor(), json::array({1, 2}), 1);
    return report(!result.success() && result.error.kind == ErrorKind::ValidationError,
                  "Non-object arguments are rejected");
}

static bool test_array_item_type() {
    mcp_types::ToolDescriptor descriptor;
    descriptor.name = "people";
    mcp_types::ParameterSpec names = parameter("names", ValueType::Array, true);
    names.item_type = ValueType::String;
    descriptor.parameters = {names};

    ValidationResult good = ArgumentValidator::validate(descriptor, {{"names", {"a", "b"}}}, 1);
    ValidationResult bad = ArgumentValidator::validate(descriptor, {{"names", {"a", 2}}}, 1);
    bool success = good.success() && !bad.success() &&
                   bad.error.detail["type_mismatches"][0]["reason"].get<std::string>().find("1") != std::string::npos;
    return report(success, "Array elements are checked against the item type");
}

static bool test_coerce_integer_range() {
    argument_validator::CoercionResult huge = argument_validator::coerce_value(1e19, ValueType::Integer);
    argument_validator::CoercionResult exact = argument_validator::coerce_value(json(-42), ValueType::Integer);
    return report(!huge.success && exact.success && exact.value == -42,
                  "Integer coercion rejects values outside int64");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_defaults_filled();
    all_passed &= test_missing_required();
    all_passed &= test_unexpected_rejected();
    all_passed &= test_all_problems_reported_together();
    all_passed &= test_numeric_string_coerced();
    all_passed &= test_lossy_coercion_rejected();
    all_passed &= test_integral_float_accepted();
    all_passed &= test_boolean_string_coerced();
    all_passed &= test_null_optional_takes_default();
    all_passed &= test_null_required_rejected();
    all_passed &= test_non_object_arguments();
    all_passed &= test_array_item_type();
    all_passed &= test_coerce_integer_range();
    return all_passed;
}

} // namespace test_argument_validator
