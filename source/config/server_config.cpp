#include "config/server_config.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>

namespace server_config {

const char *transport_mode_name(TransportMode mode) {
    switch (mode) {
    case TransportMode::Stdio:
        return "stdio";
    case TransportMode::Http:
        return "http";
    case TransportMode::Both:
        return "both";
    }
    return "stdio";
}

const std::vector<std::string> &known_keys() {
    static const std::vector<std::string> keys = {
        "MCP_TRANSPORT",       "SERVER_HOST",          "SERVER_PORT",        "MCP_ENDPOINT_PATH",
        "CALL_TIMEOUT_SECONDS", "STDIO_FRAMING",        "STDIO_MAX_IN_FLIGHT", "MAX_MESSAGE_BYTES",
        "LOG_LEVEL",           "DEBUG",                "EMAIL_SERVICE_URL",  "CALENDAR_SERVICE_URL",
        "CALENDAR_API_TOKEN",  "SERVICE_TIMEOUT_SECONDS"};
    return keys;
}

static std::string trim(const std::string &text) {
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

static std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return text;
}

DotenvResult parse_dotenv_text(const std::string &text) {
    DotenvResult result;
    result.found = true;

    std::istringstream lines(text);
    std::string line;
    int line_number = 0;
    while (std::getline(lines, line)) {
        ++line_number;
        std::string content = trim(line);
        if (content.empty() || content[0] == '#') {
            continue;
        }
        if (content.compare(0, 7, "export ") == 0) {
            content = trim(content.substr(7));
        }

        std::size_t equals = content.find('=');
        if (equals == std::string::npos || equals == 0) {
            result.warnings.push_back("line " + std::to_string(line_number) + ": expected KEY=VALUE");
            continue;
        }

        std::string key = trim(content.substr(0, equals));
        std::string value = trim(content.substr(equals + 1));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        } else {
            // Unquoted values may carry a trailing comment.
            std::size_t comment = value.find(" #");
            if (comment != std::string::npos) {
                value = trim(value.substr(0, comment));
            }
        }
        result.values[key] = value;
    }
    return result;
}

DotenvResult read_dotenv(const std::string &path) {
    std::ifstream file(path);
    if (!file) {
        return DotenvResult();
    }
    std::stringstream contents;
    contents << file.rdbuf();
    return parse_dotenv_text(contents.str());
}

Settings read_environment() {
    Settings settings;
    for (const std::string &key : known_keys()) {
        const char *value = std::getenv(key.c_str());
        if (value != nullptr) {
            settings[key] = value;
        }
    }
    return settings;
}

// --- command line ---

struct FlagSpec {
    const char *flag;
    const char *key;
};

static const FlagSpec VALUE_FLAGS[] = {
    {"--transport", "MCP_TRANSPORT"},
    {"--host", "SERVER_HOST"},
    {"--port", "SERVER_PORT"},
    {"--endpoint", "MCP_ENDPOINT_PATH"},
    {"--timeout", "CALL_TIMEOUT_SECONDS"},
    {"--framing", "STDIO_FRAMING"},
    {"--log-level", "LOG_LEVEL"},
};

CommandLineResult parse_command_line(int argc, const char *const argv[]) {
    CommandLineResult result;
    CommandLine &command_line = result.command_line;

    for (int index = 1; index < argc; ++index) {
        std::string argument = argv[index];

        // --flag=value is accepted as well as --flag value.
        std::string inline_value;
        bool has_inline_value = false;
        std::size_t equals = argument.find('=');
        if (argument.compare(0, 2, "--") == 0 && equals != std::string::npos) {
            inline_value = argument.substr(equals + 1);
            argument = argument.substr(0, equals);
            has_inline_value = true;
        }

        if (argument == "--help" || argument == "-h") {
            command_line.show_help = true;
            continue;
        }
        if (argument == "--version") {
            command_line.show_version = true;
            continue;
        }
        if (argument == "--debug") {
            command_line.overrides["DEBUG"] = has_inline_value ? inline_value : "true";
            continue;
        }

        const char *target_key = nullptr;
        bool is_env_file = argument == "--env-file";
        for (const FlagSpec &spec : VALUE_FLAGS) {
            if (argument == spec.flag) {
                target_key = spec.key;
                break;
            }
        }
        if (target_key == nullptr && !is_env_file) {
            result.error_message = "Unknown argument: " + argument;
            return result;
        }

        std::string value;
        if (has_inline_value) {
            value = inline_value;
        } else if (index + 1 < argc) {
            value = argv[++index];
        } else {
            result.error_message = "Missing value for " + argument;
            return result;
        }

        if (is_env_file) {
            command_line.env_file = value;
        } else {
            command_line.overrides[target_key] = value;
        }
    }

    result.success = true;
    return result;
}

// --- validation ---

static bool parse_integer(const std::string &text, long long minimum, long long maximum, long long &output) {
    long long value = 0;
    const char *begin = text.data();
    const char *end = text.data() + text.size();
    auto [pointer, error] = std::from_chars(begin, end, value);
    if (text.empty() || error != std::errc() || pointer != end) {
        return false;
    }
    if (value < minimum || value > maximum) {
        return false;
    }
    output = value;
    return true;
}

static bool parse_boolean(const std::string &text, bool &output) {
    const std::string lowered = to_lower(trim(text));
    if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
        output = true;
        return true;
    }
    if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off" || lowered.empty()) {
        output = false;
        return true;
    }
    return false;
}

static ConfigResult invalid(const std::string &key, const std::string &value, const std::string &expected) {
    ConfigResult result;
    result.error_message = "Invalid value for " + key + ": '" + value + "' (expected " + expected + ")";
    return result;
}

ConfigResult build_config(const Settings &settings) {
    ConfigResult result;
    ServerConfig &config = result.config;
    long long number = 0;

    for (const auto &entry : settings) {
        const std::string &key = entry.first;
        const std::string value = trim(entry.second);

        if (key == "MCP_TRANSPORT") {
            const std::string lowered = to_lower(value);
            if (lowered == "stdio") {
                config.transport = TransportMode::Stdio;
            } else if (lowered == "http" || lowered == "streamable-http") {
                config.transport = TransportMode::Http;
            } else if (lowered == "both") {
                config.transport = TransportMode::Both;
            } else {
                return invalid(key, value, "stdio, http or both");
            }
        } else if (key == "SERVER_HOST") {
            if (value.empty()) {
                return invalid(key, value, "a host name or address");
            }
            config.host = value;
        } else if (key == "SERVER_PORT") {
            if (!parse_integer(value, 1, 65535, number)) {
                return invalid(key, value, "a port between 1 and 65535");
            }
            config.port = static_cast<int>(number);
        } else if (key == "MCP_ENDPOINT_PATH") {
            if (value.empty() || value[0] != '/' || value == "/health") {
                return invalid(key, value, "a path starting with '/' other than /health");
            }
            config.endpoint_path = value;
        } else if (key == "CALL_TIMEOUT_SECONDS") {
            if (!parse_integer(value, 1, 86400, number)) {
                return invalid(key, value, "seconds between 1 and 86400");
            }
            config.call_timeout_seconds = static_cast<int>(number);
        } else if (key == "STDIO_FRAMING") {
            if (!stdio_transport::parse_framing(value, config.stdio_framing)) {
                return invalid(key, value, "newline or content-length");
            }
        } else if (key == "STDIO_MAX_IN_FLIGHT") {
            if (!parse_integer(value, 1, 1024, number)) {
                return invalid(key, value, "an integer between 1 and 1024");
            }
            config.stdio_max_in_flight = static_cast<std::size_t>(number);
        } else if (key == "MAX_MESSAGE_BYTES") {
            if (!parse_integer(value, 1024, 1LL << 30, number)) {
                return invalid(key, value, "bytes between 1024 and 1073741824");
            }
            config.max_message_bytes = static_cast<std::size_t>(number);
        } else if (key == "LOG_LEVEL") {
            if (!server_log::parse_level(value, config.log_level)) {
                return invalid(key, value, "DEBUG, INFO, WARNING or ERROR");
            }
        } else if (key == "DEBUG") {
            if (!parse_boolean(value, config.debug)) {
                return invalid(key, value, "true or false");
            }
        } else if (key == "EMAIL_SERVICE_URL") {
            if (value.empty()) {
                return invalid(key, value, "a URL");
            }
            config.email_service_url = value;
        } else if (key == "CALENDAR_SERVICE_URL") {
            config.calendar_service_url = value;
        } else if (key == "CALENDAR_API_TOKEN") {
            config.calendar_api_token = value;
        } else if (key == "SERVICE_TIMEOUT_SECONDS") {
            if (!parse_integer(value, 1, 3600, number)) {
                return invalid(key, value, "seconds between 1 and 3600");
            }
            config.service_timeout_seconds = static_cast<int>(number);
        }
        // Anything else in a .env file belongs to someone else.
    }

    if (config.calendar_service_url.empty()) {
        config.calendar_service_url = config.email_service_url;
    }
    if (config.debug) {
        config.log_level = server_log::Level::Debug;
    }

    result.success = true;
    return result;
}

ConfigResult load(const CommandLine &command_line) {
    Settings merged;

    DotenvResult dotenv = read_dotenv(command_line.env_file);
    for (const std::string &warning : dotenv.warnings) {
        server_log::warning(command_line.env_file + ": " + warning);
    }
    for (const auto &entry : dotenv.values) {
        merged[entry.first] = entry.second;
    }
    for (const auto &entry : read_environment()) {
        merged[entry.first] = entry.second;
    }
    for (const auto &entry : command_line.overrides) {
        merged[entry.first] = entry.second;
    }

    ConfigResult result = build_config(merged);
    if (result.success && server_log::is_debug_env_enabled()) {
        result.config.log_level = server_log::Level::Debug;
    }
    return result;
}

std::string usage(const std::string &program_name) {
    std::ostringstream text;
    text << "Usage: " << program_name << " [options]\n"
         << "\n"
         << "MCP server exposing local utility, file, system, email and calendar tools.\n"
         << "\n"
         << "Options:\n"
         << "  --transport stdio|http|both   transport(s) to serve (MCP_TRANSPORT, default stdio)\n"
         << "  --host HOST                   HTTP bind address (SERVER_HOST, default 0.0.0.0)\n"
         << "  --port PORT                   HTTP port (SERVER_PORT, default 8000)\n"
         << "  --endpoint PATH               HTTP endpoint path (MCP_ENDPOINT_PATH, default /mcp)\n"
         << "  --timeout SECONDS             per-call tool timeout (CALL_TIMEOUT_SECONDS, default 60)\n"
         << "  --framing newline|content-length\n"
         << "                                stdio framing (STDIO_FRAMING, default newline)\n"
         << "  --log-level LEVEL             DEBUG, INFO, WARNING or ERROR (LOG_LEVEL, default INFO)\n"
         << "  --debug                       debug logging (DEBUG)\n"
         << "  --env-file PATH               settings file (default ./.env)\n"
         << "  --help                        show this help\n"
         << "  --version                     show the version\n"
         << "\n"
         << "Other settings (environment or .env only): STDIO_MAX_IN_FLIGHT, MAX_MESSAGE_BYTES,\n"
         << "EMAIL_SERVICE_URL, CALENDAR_SERVICE_URL, CALENDAR_API_TOKEN, SERVICE_TIMEOUT_SECONDS.\n";
    return text.str();
}

} // namespace server_config
