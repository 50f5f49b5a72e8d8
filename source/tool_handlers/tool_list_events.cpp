#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/service_request.hpp"

using json = nlohmann::json;
using mcp_types::ToolFailureKind;
using mcp_types::ToolResult;

static ToolResult list_events(const tool_handlers::ServiceSettings &settings,
                              const mcp_types::ValidatedArguments &arguments) {
    std::string time_min = tool_handlers::trim(arguments.get_string("timeMin"));
    std::string time_max = tool_handlers::trim(arguments.get_string("timeMax"));
    if (!service_request::is_iso_datetime(time_min)) {
        return ToolResult::fail(ToolFailureKind::InvalidInput, "timeMin must be an ISO-8601 date-time",
                                {{"field", "timeMin"}});
    }
    if (!service_request::is_iso_datetime(time_max)) {
        return ToolResult::fail(ToolFailureKind::InvalidInput, "timeMax must be an ISO-8601 date-time",
                                {{"field", "timeMax"}});
    }

    json payload = {{"timeMin", time_min}, {"timeMax", time_max}};
    if (arguments.has_value("maxResults")) {
        std::int64_t max_results = arguments.get_integer("maxResults");
        if (max_results <= 0) {
            return ToolResult::fail(ToolFailureKind::InvalidInput, "maxResults must be greater than 0",
                                    {{"field", "maxResults"}, {"value", max_results}});
        }
        payload["maxResults"] = max_results;
    }
    if (arguments.has_value("q")) {
        std::string query = tool_handlers::trim(arguments.get_string("q"));
        if (!query.empty()) {
            payload["q"] = query;
        }
    }

    return service_request::post("calendar", settings.calendar_service_url, "/list-events", payload,
                                 service_request::bearer_headers(settings.calendar_api_token),
                                 settings.timeout_seconds);
}

namespace tool_list_events {

tool_registry::RegistrationResult register_tool(tool_registry::ToolRegistry &registry,
                                                const tool_handlers::ServiceSettings &settings) {
    using mcp_types::ValueType;
    mcp_types::ToolDescriptor descriptor;
    descriptor.name = "list_events";
    descriptor.description = "List calendar events between two instants through the calendar service.";
    descriptor.parameters = {
        tool_handlers::required_parameter("timeMin", ValueType::String, "Window start, ISO-8601"),
        tool_handlers::required_parameter("timeMax", ValueType::String, "Window end, ISO-8601"),
        tool_handlers::optional_parameter("maxResults", ValueType::Integer, nullptr, "Maximum number of events"),
        tool_handlers::optional_parameter("q", ValueType::String, nullptr, "Free-text search"),
    };
    return registry.register_tool(descriptor, [settings](const mcp_types::ValidatedArguments &arguments) {
        return list_events(settings, arguments);
    });
}

} // namespace tool_list_events
