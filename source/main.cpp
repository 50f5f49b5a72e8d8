// MMCP Server – Model Context Protocol tool server
// Entry point: loads configuration, registers tools and runs the configured
// transports (stdio, HTTP or both) until the client disconnects or a signal
// arrives.
//
// stdout belongs to the stdio transport; all logs go to stderr.

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <unistd.h>

#include "config/server_config.hpp"
#include "mcp/call_dispatcher.hpp"
#include "mcp/mcp_dispatch.hpp"
#include "mcp/tool_registry.hpp"
#include "net/http_client.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "transport/http_transport.hpp"
#include "transport/stdio_transport.hpp"
#include "utils/server_log.hpp"

// Exit codes.
static const int EXIT_STARTUP_FAILURE = 1;
static const int EXIT_USAGE = 2;

// Global flag for graceful shutdown.
static volatile std::sig_atomic_t shutdown_requested = 0;

static void signal_handler(int signal_number) {
    (void)signal_number;
    shutdown_requested = 1;
    // Unblocks the stdio read loop; close() is async-signal-safe.
    close(STDIN_FILENO);
}

static tool_handlers::ServiceSettings service_settings(const server_config::ServerConfig &config) {
    tool_handlers::ServiceSettings settings;
    settings.email_service_url = config.email_service_url;
    settings.calendar_service_url = config.calendar_service_url;
    settings.calendar_api_token = config.calendar_api_token;
    settings.timeout_seconds = config.service_timeout_seconds;
    return settings;
}

int main(int argc, char *argv[]) {
    const std::string program_name = argc > 0 ? argv[0] : "mmcps";

    server_config::CommandLineResult command_line = server_config::parse_command_line(argc, argv);
    if (!command_line.success) {
        std::cerr << program_name << ": " << command_line.error_message << "\n\n"
                  << server_config::usage(program_name);
        return EXIT_USAGE;
    }
    if (command_line.command_line.show_help) {
        std::cerr << server_config::usage(program_name);
        return 0;
    }
    if (command_line.command_line.show_version) {
        std::cerr << mcp_dispatch::SERVER_NAME << " " << mcp_dispatch::SERVER_VERSION << std::endl;
        return 0;
    }

    server_config::ConfigResult loaded = server_config::load(command_line.command_line);
    if (!loaded.success) {
        std::cerr << program_name << ": " << loaded.error_message << std::endl;
        return EXIT_USAGE;
    }
    const server_config::ServerConfig &config = loaded.config;
    server_log::set_threshold(config.log_level);

    server_log::info(std::string(mcp_dispatch::SERVER_NAME) + " " + mcp_dispatch::SERVER_VERSION + ", build " +
                     __DATE__ + " " + __TIME__ + ", transport " + server_config::transport_mode_name(config.transport));

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    http_client::CurlGlobalScope curl_scope;
    if (!curl_scope.ok()) {
        server_log::error("libcurl initialization failed");
        return EXIT_STARTUP_FAILURE;
    }

    tool_registry::ToolRegistry registry;
    tool_registry::RegistrationResult registration = tool_handlers::register_all_tools(registry, service_settings(config));
    if (!registration.success) {
        return EXIT_STARTUP_FAILURE;
    }
    registry.seal();

    call_dispatcher::Dispatcher dispatcher(registry, std::chrono::milliseconds(
                                                         static_cast<long long>(config.call_timeout_seconds) * 1000));

    const bool serve_http = config.transport != server_config::TransportMode::Stdio;
    const bool serve_stdio = config.transport != server_config::TransportMode::Http;

    http_transport::HttpOptions http_options;
    http_options.host = config.host;
    http_options.port = config.port;
    http_options.endpoint_path = config.endpoint_path;
    http_options.max_message_bytes = config.max_message_bytes;
    http_transport::HttpServer http_server(dispatcher, http_options);

    if (serve_http) {
        if (!http_server.start()) {
            server_log::error("Could not listen on " + config.host + ":" + std::to_string(config.port));
            return EXIT_STARTUP_FAILURE;
        }
    }

    if (serve_stdio) {
        stdio_transport::StdioOptions stdio_options;
        stdio_options.framing = config.stdio_framing;
        stdio_options.max_message_bytes = config.max_message_bytes;
        stdio_options.max_in_flight = config.stdio_max_in_flight;

        server_log::info("Waiting for MCP messages on stdin");
        stdio_transport::StdioServer stdio_server(dispatcher, std::cin, std::cout, stdio_options);
        std::size_t frames = stdio_server.run();
        server_log::info("stdin closed after " + std::to_string(frames) + " message(s)");
    } else {
        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    }

    if (serve_http) {
        http_server.stop();
    }
    server_log::info("Server shut down");
    return 0;
}
