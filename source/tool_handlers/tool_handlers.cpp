#include "tool_handlers/tool_handlers.hpp"
#include "utils/server_log.hpp"
#include "utils/utf8_sanitize.hpp"

#include <cctype>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <functional>
#include <limits>
#include <vector>

// Forward declarations of individual tool registration functions.
// Each tool_*.cpp defines its own namespace with a register_tool() function.

using tool_registry::RegistrationResult;
using tool_registry::ToolRegistry;

namespace tool_add_numbers { RegistrationResult register_tool(ToolRegistry &registry); }
namespace tool_multiply_numbers { RegistrationResult register_tool(ToolRegistry &registry); }
namespace tool_greet_user { RegistrationResult register_tool(ToolRegistry &registry); }
namespace tool_echo_message { RegistrationResult register_tool(ToolRegistry &registry); }
namespace tool_get_system_info { RegistrationResult register_tool(ToolRegistry &registry); }
namespace tool_read_file { RegistrationResult register_tool(ToolRegistry &registry); }
namespace tool_write_file { RegistrationResult register_tool(ToolRegistry &registry); }
namespace tool_list_directory { RegistrationResult register_tool(ToolRegistry &registry); }
namespace tool_read_json_file { RegistrationResult register_tool(ToolRegistry &registry); }
namespace tool_write_json_file { RegistrationResult register_tool(ToolRegistry &registry); }
namespace tool_get_process_info { RegistrationResult register_tool(ToolRegistry &registry); }
namespace tool_get_system_stats { RegistrationResult register_tool(ToolRegistry &registry); }
namespace tool_execute_command { RegistrationResult register_tool(ToolRegistry &registry); }
namespace tool_get_environment_variables { RegistrationResult register_tool(ToolRegistry &registry); }
namespace tool_get_runtime_info { RegistrationResult register_tool(ToolRegistry &registry); }
namespace tool_send_email { RegistrationResult register_tool(ToolRegistry &registry, const tool_handlers::ServiceSettings &settings); }
namespace tool_read_email { RegistrationResult register_tool(ToolRegistry &registry, const tool_handlers::ServiceSettings &settings); }
namespace tool_schedule_meet { RegistrationResult register_tool(ToolRegistry &registry, const tool_handlers::ServiceSettings &settings); }
namespace tool_list_events { RegistrationResult register_tool(ToolRegistry &registry, const tool_handlers::ServiceSettings &settings); }

namespace tool_handlers {

RegistrationResult register_all_tools(ToolRegistry &registry, const ServiceSettings &settings) {
    const std::vector<std::function<RegistrationResult()>> registrations = {
        [&registry]() { return tool_add_numbers::register_tool(registry); },
        [&registry]() { return tool_multiply_numbers::register_tool(registry); },
        [&registry]() { return tool_greet_user::register_tool(registry); },
        [&registry]() { return tool_echo_message::register_tool(registry); },
        [&registry]() { return tool_get_system_info::register_tool(registry); },
        [&registry]() { return tool_read_file::register_tool(registry); },
        [&registry]() { return tool_write_file::register_tool(registry); },
        [&registry]() { return tool_list_directory::register_tool(registry); },
        [&registry]() { return tool_read_json_file::register_tool(registry); },
        [&registry]() { return tool_write_json_file::register_tool(registry); },
        [&registry]() { return tool_get_process_info::register_tool(registry); },
        [&registry]() { return tool_get_system_stats::register_tool(registry); },
        [&registry]() { return tool_execute_command::register_tool(registry); },
        [&registry]() { return tool_get_environment_variables::register_tool(registry); },
        [&registry]() { return tool_get_runtime_info::register_tool(registry); },
        [&registry, &settings]() { return tool_send_email::register_tool(registry, settings); },
        [&registry, &settings]() { return tool_read_email::register_tool(registry, settings); },
        [&registry, &settings]() { return tool_schedule_meet::register_tool(registry, settings); },
        [&registry, &settings]() { return tool_list_events::register_tool(registry, settings); },
    };

    for (const auto &registration : registrations) {
        RegistrationResult result = registration();
        if (!result.success) {
            server_log::error("Tool registration failed: " + result.error.message);
            return result;
        }
    }

    server_log::info("Registered " + std::to_string(registry.size()) + " tools");
    RegistrationResult result;
    result.success = true;
    return result;
}

mcp_types::ParameterSpec required_parameter(const std::string &name, mcp_types::ValueType type,
                                            const std::string &description) {
    mcp_types::ParameterSpec parameter;
    parameter.name = name;
    parameter.type = type;
    parameter.required = true;
    parameter.description = description;
    return parameter;
}

mcp_types::ParameterSpec optional_parameter(const std::string &name, mcp_types::ValueType type,
                                            json default_value, const std::string &description) {
    mcp_types::ParameterSpec parameter;
    parameter.name = name;
    parameter.type = type;
    parameter.required = false;
    parameter.default_value = std::move(default_value);
    parameter.description = description;
    return parameter;
}

std::string trim(const std::string &text) {
    std::size_t first = 0;
    std::size_t last = text.size();
    while (first < last && std::isspace(static_cast<unsigned char>(text[first]))) {
        ++first;
    }
    while (last > first && std::isspace(static_cast<unsigned char>(text[last - 1]))) {
        --last;
    }
    return text.substr(first, last - first);
}

bool fits_int64(const json &value) {
    if (value.is_number_unsigned()) {
        return value.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    }
    return value.is_number_integer();
}

std::string format_utc_timestamp(double epoch_seconds) {
    std::time_t whole_seconds = static_cast<std::time_t>(epoch_seconds);
    std::tm utc_time;
    gmtime_r(&whole_seconds, &utc_time);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc_time);
    return buffer;
}

std::string current_utc_timestamp() {
    auto now = std::chrono::system_clock::now();
    return format_utc_timestamp(static_cast<double>(std::chrono::system_clock::to_time_t(now)));
}

mcp_types::ToolResult file_failure(const platform::FileResult &result) {
    using mcp_types::ToolFailureKind;
    switch (result.error_kind) {
    case platform::FileErrorKind::NotFound:
        return mcp_types::ToolResult::fail(ToolFailureKind::NotFound, result.error_message);
    case platform::FileErrorKind::PermissionDenied:
        return mcp_types::ToolResult::fail(ToolFailureKind::PermissionDenied, result.error_message);
    case platform::FileErrorKind::WrongType:
    case platform::FileErrorKind::AlreadyExists:
        return mcp_types::ToolResult::fail(ToolFailureKind::InvalidInput, result.error_message);
    case platform::FileErrorKind::None:
    case platform::FileErrorKind::Other:
        break;
    }
    return mcp_types::ToolResult::fail(ToolFailureKind::Internal, result.error_message);
}

mcp_types::ToolResult read_text_file(const std::string &file_path) {
    std::string contents;
    platform::FileResult read_result = platform::read_file_contents(file_path, contents);
    if (!read_result.success) {
        return file_failure(read_result);
    }
    utf8_sanitize::sanitize(contents);
    server_log::debug("File read: " + file_path + " (" + std::to_string(contents.size()) + " bytes)");
    return mcp_types::ToolResult::ok(contents);
}

mcp_types::ToolResult write_text_file(const std::string &file_path, const std::string &content, bool overwrite) {
    bool existed = false;
    platform::FileResult write_result = platform::write_file_contents(file_path, content, overwrite, existed);
    if (!write_result.success) {
        return file_failure(write_result);
    }

    std::error_code error;
    std::filesystem::path absolute_path = std::filesystem::absolute(file_path, error);

    json result;
    result["success"] = true;
    result["file_path"] = error ? file_path : absolute_path.string();
    result["size"] = content.size();
    result["overwritten"] = existed;
    server_log::debug("File written: " + file_path);
    return mcp_types::ToolResult::ok(result);
}

} // namespace tool_handlers
