#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/service_request.hpp"

using json = nlohmann::json;
using mcp_types::ToolFailureKind;
using mcp_types::ToolResult;

// Copies a trimmed, non-empty string argument into the payload.
static void copy_filter(const mcp_types::ValidatedArguments &arguments, const char *name, json &payload) {
    if (!arguments.has_value(name)) {
        return;
    }
    std::string value = tool_handlers::trim(arguments.get_string(name));
    if (!value.empty()) {
        payload[name] = value;
    }
}

static ToolResult read_email(const tool_handlers::ServiceSettings &settings,
                             const mcp_types::ValidatedArguments &arguments) {
    json payload = json::object();
    copy_filter(arguments, "fromName", payload);
    copy_filter(arguments, "subjectContains", payload);
    copy_filter(arguments, "threadContains", payload);

    if (arguments.has_value("after")) {
        std::string after = tool_handlers::trim(arguments.get_string("after"));
        if (!service_request::is_iso_date(after)) {
            return ToolResult::fail(ToolFailureKind::InvalidInput, "after must be a date in YYYY-MM-DD format",
                                    {{"field", "after"}});
        }
        payload["after"] = after;
    }
    if (arguments.has_value("maxResults")) {
        std::int64_t max_results = arguments.get_integer("maxResults");
        if (max_results <= 0) {
            return ToolResult::fail(ToolFailureKind::InvalidInput, "maxResults must be greater than 0",
                                    {{"field", "maxResults"}, {"value", max_results}});
        }
        payload["maxResults"] = max_results;
    }
    if (arguments.has_value("includeBody")) {
        payload["includeBody"] = arguments.get_boolean("includeBody");
    }

    return service_request::post("email", settings.email_service_url, "/read-email", payload, {},
                                 settings.timeout_seconds);
}

namespace tool_read_email {

tool_registry::RegistrationResult register_tool(tool_registry::ToolRegistry &registry,
                                                const tool_handlers::ServiceSettings &settings) {
    using mcp_types::ValueType;
    mcp_types::ToolDescriptor descriptor;
    descriptor.name = "read_email";
    descriptor.description = "Search the mailbox through the email service. All filters are optional.";
    descriptor.parameters = {
        tool_handlers::optional_parameter("fromName", ValueType::String, nullptr, "Sender name to match"),
        tool_handlers::optional_parameter("subjectContains", ValueType::String, nullptr, "Text in the subject"),
        tool_handlers::optional_parameter("threadContains", ValueType::String, nullptr, "Text anywhere in the thread"),
        tool_handlers::optional_parameter("after", ValueType::String, nullptr, "Only mail after this date (YYYY-MM-DD)"),
        tool_handlers::optional_parameter("maxResults", ValueType::Integer, nullptr, "Maximum number of messages"),
        tool_handlers::optional_parameter("includeBody", ValueType::Boolean, nullptr, "Include message bodies"),
    };
    return registry.register_tool(descriptor, [settings](const mcp_types::ValidatedArguments &arguments) {
        return read_email(settings, arguments);
    });
}

} // namespace tool_read_email
