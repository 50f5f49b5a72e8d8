#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/service_request.hpp"
#include "utils/server_log.hpp"

using json = nlohmann::json;
using mcp_types::ToolFailureKind;
using mcp_types::ToolResult;

static ToolResult send_email(const tool_handlers::ServiceSettings &settings,
                             const mcp_types::ValidatedArguments &arguments) {
    std::string to = tool_handlers::trim(arguments.get_string("to"));
    std::string subject = tool_handlers::trim(arguments.get_string("subject"));
    std::string body = tool_handlers::trim(arguments.get_string("body"));

    json empty_fields = json::array();
    if (to.empty()) empty_fields.push_back("to");
    if (subject.empty()) empty_fields.push_back("subject");
    if (body.empty()) empty_fields.push_back("body");
    if (!empty_fields.empty()) {
        return ToolResult::fail(ToolFailureKind::InvalidInput, "to, subject and body must not be empty",
                                {{"empty", empty_fields}});
    }
    if (!service_request::is_valid_email(to)) {
        return ToolResult::fail(ToolFailureKind::InvalidInput, "Invalid email address: " + to, {{"field", "to"}});
    }

    json payload = {{"to", to}, {"subject", subject}, {"body", body}};
    ToolResult response = service_request::post("email", settings.email_service_url, "/send-email", payload, {},
                                                 settings.timeout_seconds);
    if (!response.success) {
        return response;
    }

    const json &details = response.payload;
    json result;
    result["success"] = true;
    result["message"] = "Email sent successfully";
    result["messageId"] = details.is_object() && details.contains("messageId") ? details["messageId"] : json(nullptr);
    result["recipient"] = to;
    result["subject"] = subject;
    result["body_length"] = body.size();
    result["details"] = details;
    server_log::info("Email sent to " + to);
    return ToolResult::ok(result);
}

namespace tool_send_email {

tool_registry::RegistrationResult register_tool(tool_registry::ToolRegistry &registry,
                                                const tool_handlers::ServiceSettings &settings) {
    mcp_types::ToolDescriptor descriptor;
    descriptor.name = "send_email";
    descriptor.description = "Send an email through the email service.";
    descriptor.parameters = {
        tool_handlers::required_parameter("to", mcp_types::ValueType::String, "Recipient email address"),
        tool_handlers::required_parameter("subject", mcp_types::ValueType::String, "Subject line"),
        tool_handlers::required_parameter("body", mcp_types::ValueType::String, "Plain text body"),
    };
    descriptor.return_type = mcp_types::ValueType::Object;
    return registry.register_tool(descriptor, [settings](const mcp_types::ValidatedArguments &arguments) {
        return send_email(settings, arguments);
    });
}

} // namespace tool_send_email
