#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/service_request.hpp"

using json = nlohmann::json;
using mcp_types::ToolFailureKind;
using mcp_types::ToolResult;

static ToolResult invalid_field(const std::string &field, const std::string &message) {
    return ToolResult::fail(ToolFailureKind::InvalidInput, message, {{"field", field}});
}

static ToolResult schedule_meet(const tool_handlers::ServiceSettings &settings,
                                const mcp_types::ValidatedArguments &arguments) {
    std::string title = tool_handlers::trim(arguments.get_string("title"));
    std::string start = tool_handlers::trim(arguments.get_string("start"));
    std::string end = tool_handlers::trim(arguments.get_string("end"));

    if (title.empty()) {
        return invalid_field("title", "title must not be empty");
    }
    if (!service_request::is_iso_datetime(start)) {
        return invalid_field("start", "start must be an ISO-8601 date-time such as 2025-10-21T10:00:00Z");
    }
    if (!service_request::is_iso_datetime(end)) {
        return invalid_field("end", "end must be an ISO-8601 date-time such as 2025-10-21T11:00:00Z");
    }

    json payload = {{"title", title}, {"start", start}, {"end", end}};
    if (arguments.has_value("description")) {
        payload["description"] = arguments.get_string("description");
    }
    if (arguments.has_value("timeZone")) {
        std::string time_zone = tool_handlers::trim(arguments.get_string("timeZone"));
        if (!time_zone.empty()) {
            payload["timeZone"] = time_zone;
        }
    }
    if (arguments.has_value("attendees")) {
        const json &attendees = arguments.get("attendees");
        if (attendees.empty()) {
            return invalid_field("attendees", "attendees must not be an empty list");
        }
        json addresses = json::array();
        for (const json &attendee : attendees) {
            std::string address = tool_handlers::trim(attendee.get<std::string>());
            if (!service_request::is_valid_email(address)) {
                return ToolResult::fail(ToolFailureKind::InvalidInput, "Invalid attendee email address: " + address,
                                        {{"field", "attendees"}, {"value", address}});
            }
            addresses.push_back(address);
        }
        payload["attendees"] = addresses;
    }
    if (arguments.has_value("sendUpdates")) {
        std::string send_updates = arguments.get_string("sendUpdates");
        if (send_updates != "all" && send_updates != "externalOnly" && send_updates != "none") {
            return invalid_field("sendUpdates", "sendUpdates must be one of: all, externalOnly, none");
        }
        payload["sendUpdates"] = send_updates;
    }

    return service_request::post("calendar", settings.calendar_service_url, "/schedule-meet", payload,
                                 service_request::bearer_headers(settings.calendar_api_token),
                                 settings.timeout_seconds);
}

namespace tool_schedule_meet {

tool_registry::RegistrationResult register_tool(tool_registry::ToolRegistry &registry,
                                                const tool_handlers::ServiceSettings &settings) {
    using mcp_types::ValueType;
    mcp_types::ToolDescriptor descriptor;
    descriptor.name = "schedule_meet";
    descriptor.description = "Create a calendar event with a video meeting link through the calendar service.";

    mcp_types::ParameterSpec attendees =
        tool_handlers::optional_parameter("attendees", ValueType::Array, nullptr, "Attendee email addresses");
    attendees.item_type = ValueType::String;

    descriptor.parameters = {
        tool_handlers::required_parameter("title", ValueType::String, "Event title"),
        tool_handlers::required_parameter("start", ValueType::String, "Start time, ISO-8601"),
        tool_handlers::required_parameter("end", ValueType::String, "End time, ISO-8601"),
        tool_handlers::optional_parameter("description", ValueType::String, nullptr, "Event description"),
        tool_handlers::optional_parameter("timeZone", ValueType::String, nullptr, "IANA time zone name"),
        attendees,
        tool_handlers::optional_parameter("sendUpdates", ValueType::String, nullptr,
                                          "Who gets notified: all, externalOnly or none"),
    };
    return registry.register_tool(descriptor, [settings](const mcp_types::ValidatedArguments &arguments) {
        return schedule_meet(settings, arguments);
    });
}

} // namespace tool_schedule_meet
