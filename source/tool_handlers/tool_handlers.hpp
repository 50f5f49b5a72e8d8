#ifndef MMCPS_TOOL_HANDLERS_HPP
#define MMCPS_TOOL_HANDLERS_HPP

// Tool handler registration.
// Each tool_*.cpp file provides a register function that is called during startup,
// plus the helpers those files share.

#include <nlohmann/json.hpp>
#include <string>

#include "mcp/mcp_types.hpp"
#include "mcp/tool_registry.hpp"
#include "platform/platform_abi.hpp"

namespace tool_handlers {

using json = nlohmann::json;

// Where the email and calendar tools send their requests.
struct ServiceSettings {
    std::string email_service_url = "http://localhost:3000";
    std::string calendar_service_url = "http://localhost:3000";
    std::string calendar_api_token; // sent as a bearer token when set
    int timeout_seconds = 30;
};

// Register all available tool handlers. Stops at the first failure.
tool_registry::RegistrationResult register_all_tools(tool_registry::ToolRegistry &registry,
                                                     const ServiceSettings &settings);

// --- descriptor helpers ---

mcp_types::ParameterSpec required_parameter(const std::string &name, mcp_types::ValueType type,
                                            const std::string &description);

mcp_types::ParameterSpec optional_parameter(const std::string &name, mcp_types::ValueType type,
                                            json default_value, const std::string &description);

// --- helpers shared by tool bodies ---

std::string trim(const std::string &text);

// True for JSON integers that get<std::int64_t>() returns unchanged.
// Unsigned values above INT64_MAX are excluded.
bool fits_int64(const json &value);

// "2025-10-21T10:00:00Z"
std::string format_utc_timestamp(double epoch_seconds);
std::string current_utc_timestamp();

// Map a platform failure onto the tool failure vocabulary.
mcp_types::ToolResult file_failure(const platform::FileResult &result);

// Read a whole text file; invalid UTF-8 is replaced so the result is always
// serializable.
mcp_types::ToolResult read_text_file(const std::string &file_path);

// Write a text file, returning {success, file_path, size, overwritten}.
mcp_types::ToolResult write_text_file(const std::string &file_path, const std::string &content, bool overwrite);

} // namespace tool_handlers

#endif // MMCPS_TOOL_HANDLERS_HPP
