#ifndef MMCPS_SERVER_CONFIG_HPP
#define MMCPS_SERVER_CONFIG_HPP

// Server configuration.
//
// Sources, lowest precedence first: built-in defaults, a .env file, the
// process environment, the command line. Every source is reduced to the same
// key/value map (environment variable names as keys) before validation.

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "transport/stdio_transport.hpp"
#include "utils/server_log.hpp"

namespace server_config {

enum class TransportMode {
    Stdio,
    Http,
    Both
};

const char *transport_mode_name(TransportMode mode);

struct ServerConfig {
    TransportMode transport = TransportMode::Stdio;

    std::string host = "0.0.0.0";
    int port = 8000;
    std::string endpoint_path = "/mcp";

    int call_timeout_seconds = 60;
    stdio_transport::Framing stdio_framing = stdio_transport::Framing::Newline;
    std::size_t stdio_max_in_flight = 8;
    std::size_t max_message_bytes = 1048576;

    server_log::Level log_level = server_log::Level::Info;
    bool debug = false;

    // Passed through to the email and calendar tools.
    std::string email_service_url = "http://localhost:3000";
    std::string calendar_service_url; // empty: same as email_service_url
    std::string calendar_api_token;
    int service_timeout_seconds = 30;
};

using Settings = std::map<std::string, std::string>;

// Every key the server reads.
const std::vector<std::string> &known_keys();

struct DotenvResult {
    bool found = false;
    Settings values;
    std::vector<std::string> warnings; // malformed lines, skipped
};

// Parse KEY=VALUE lines ("export " prefix, quotes and # comments allowed).
// A missing file is not an error.
DotenvResult read_dotenv(const std::string &path);

DotenvResult parse_dotenv_text(const std::string &text);

// Known keys present in the process environment.
Settings read_environment();

struct CommandLine {
    Settings overrides;
    std::string env_file = ".env";
    bool show_help = false;
    bool show_version = false;
};

struct CommandLineResult {
    bool success = false;
    CommandLine command_line;
    std::string error_message;
};

CommandLineResult parse_command_line(int argc, const char *const argv[]);

struct ConfigResult {
    bool success = false;
    ServerConfig config;
    std::string error_message;
};

// Validate a merged settings map on top of the defaults.
ConfigResult build_config(const Settings &settings);

// Merge all sources in precedence order and validate.
ConfigResult load(const CommandLine &command_line);

std::string usage(const std::string &program_name);

} // namespace server_config

#endif // MMCPS_SERVER_CONFIG_HPP
