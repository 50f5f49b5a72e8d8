#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_dispatch.hpp"
#include "utils/utf8_sanitize.hpp"

#include <curl/curl.h>
#include <libwebsockets.h>
#include <filesystem>
#include <system_error>

using json = nlohmann::json;
using mcp_types::ToolResult;

static std::string compiler_description() {
#if defined(__clang__)
    return "clang " __clang_version__;
#elif defined(__GNUC__)
    return "gcc " __VERSION__;
#else
    return "unknown";
#endif
}

static ToolResult handle_get_runtime_info(const mcp_types::ValidatedArguments &arguments) {
    (void)arguments;

    std::error_code error;
    std::string working_directory = std::filesystem::current_path(error).string();

    std::string executable = platform::executable_path();
    utf8_sanitize::sanitize(executable);
    utf8_sanitize::sanitize(working_directory);

    json result;
    result["server_name"] = mcp_dispatch::SERVER_NAME;
    result["server_version"] = mcp_dispatch::SERVER_VERSION;
    result["protocol_version"] = mcp_dispatch::PROTOCOL_VERSION;
    result["executable"] = executable;
    result["working_directory"] = error ? json(nullptr) : json(working_directory);
    result["pid"] = platform::current_process_id();
    result["compiler"] = compiler_description();
    result["cplusplus"] = static_cast<long>(__cplusplus);
    result["libraries"] = {
        {"nlohmann_json", std::to_string(NLOHMANN_JSON_VERSION_MAJOR) + "." +
                              std::to_string(NLOHMANN_JSON_VERSION_MINOR) + "." +
                              std::to_string(NLOHMANN_JSON_VERSION_PATCH)},
        {"libcurl", curl_version_info(CURLVERSION_NOW)->version},
        {"libwebsockets", lws_get_library_version()},
    };
    return ToolResult::ok(result);
}

namespace tool_get_runtime_info {

tool_registry::RegistrationResult register_tool(tool_registry::ToolRegistry &registry) {
    mcp_types::ToolDescriptor descriptor;
    descriptor.name = "get_runtime_info";
    descriptor.description = "Get information about the server runtime: version, executable, "
                             "working directory and linked library versions.";
    descriptor.return_type = mcp_types::ValueType::Object;
    return registry.register_tool(descriptor, handle_get_runtime_info);
}

} // namespace tool_get_runtime_info
