#include "tool_handlers/tool_handlers.hpp"
#include "utils/server_log.hpp"
#include "utils/utf8_sanitize.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

using json = nlohmann::json;
using mcp_types::ToolFailureKind;
using mcp_types::ToolResult;

// Matched anywhere in the lower-cased command.
static const char *const BLOCKED_FRAGMENTS[] = {"rm -rf", "chmod 777", "dd if=", "mkfs"};
// Matched only as whole words, so "subst" or "issue" stay allowed.
static const char *const BLOCKED_WORDS[] = {"sudo", "su"};

static std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

static bool contains_word(const std::string &text, const std::string &word) {
    std::string normalized = text;
    for (char &c : normalized) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') {
            c = ' ';
        }
    }
    std::istringstream words(normalized);
    std::string token;
    while (words >> token) {
        if (token == word) {
            return true;
        }
    }
    return false;
}

static const char *find_blocked_pattern(const std::string &command) {
    std::string lowered = lowercase(command);
    for (const char *fragment : BLOCKED_FRAGMENTS) {
        if (lowered.find(fragment) != std::string::npos) {
            return fragment;
        }
    }
    for (const char *word : BLOCKED_WORDS) {
        if (contains_word(lowered, word)) {
            return word;
        }
    }
    return nullptr;
}

static ToolResult handle_execute_command(const mcp_types::ValidatedArguments &arguments) {
    std::string command = arguments.get_string("command");
    std::int64_t timeout_seconds = arguments.get_integer("timeout");

    if (tool_handlers::trim(command).empty()) {
        return ToolResult::fail(ToolFailureKind::InvalidInput, "Command cannot be empty", {{"field", "command"}});
    }
    if (timeout_seconds <= 0 || timeout_seconds > 3600) {
        return ToolResult::fail(ToolFailureKind::InvalidInput, "timeout must be between 1 and 3600 seconds",
                                {{"field", "timeout"}, {"value", timeout_seconds}});
    }

    const char *blocked = find_blocked_pattern(command);
    if (blocked != nullptr) {
        server_log::warning("Refused dangerous command: " + command);
        return ToolResult::fail(ToolFailureKind::PermissionDenied, "Command contains a dangerous pattern: " +
                                std::string(blocked), {{"pattern", blocked}});
    }

    server_log::debug("Executing command: " + command);
    platform::CommandResult run = platform::run_command(command, static_cast<int>(timeout_seconds * 1000));
    if (!run.started) {
        return ToolResult::fail(ToolFailureKind::Internal, "Failed to start command: " + run.error_message);
    }
    if (run.timed_out) {
        return ToolResult::fail(ToolFailureKind::Internal,
                                "Command timed out after " + std::to_string(timeout_seconds) + " seconds",
                                {{"timeout", timeout_seconds}});
    }

    utf8_sanitize::sanitize(command);
    utf8_sanitize::sanitize(run.stdout_text);
    utf8_sanitize::sanitize(run.stderr_text);

    json result;
    result["command"] = command;
    result["return_code"] = run.exit_code;
    result["stdout"] = run.stdout_text;
    result["stderr"] = run.stderr_text;
    result["success"] = run.exit_code == 0;
    return ToolResult::ok(result);
}

namespace tool_execute_command {

tool_registry::RegistrationResult register_tool(tool_registry::ToolRegistry &registry) {
    mcp_types::ToolDescriptor descriptor;
    descriptor.name = "execute_command";
    descriptor.description = "Run a shell command and return its exit code and output. "
                             "Commands with dangerous patterns are refused.";
    descriptor.parameters = {
        tool_handlers::required_parameter("command", mcp_types::ValueType::String, "Shell command to run"),
        tool_handlers::optional_parameter("timeout", mcp_types::ValueType::Integer, 30, "Timeout in seconds"),
    };
    descriptor.return_type = mcp_types::ValueType::Object;
    return registry.register_tool(descriptor, handle_execute_command);
}

} // namespace tool_execute_command
