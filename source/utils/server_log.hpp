#ifndef MMCPS_SERVER_LOG_HPP
#define MMCPS_SERVER_LOG_HPP

// Leveled logging to stderr. stdout is reserved for the stdio transport, so
// nothing in the server may log there.

#include <string>

namespace server_log {

enum class Level {
    Debug,
    Info,
    Warning,
    Error
};

// Set the minimum level that is written. Defaults to Info.
void set_threshold(Level threshold);

// Parse "debug", "info", "warning"/"warn", "error" (case-insensitive).
// Returns false and leaves output_level untouched on unknown input.
bool parse_level(const std::string &text, Level &output_level);

const char *level_name(Level level);

// Returns true if MMCPS_DEBUG env is set to a truthy value (1, true, yes).
bool is_debug_env_enabled();

bool is_enabled(Level level);

// Writes "[mmcps] [LEVEL] message" to stderr when level passes the threshold.
void write(Level level, const std::string &message);

void debug(const std::string &message);
void info(const std::string &message);
void warning(const std::string &message);
void error(const std::string &message);

} // namespace server_log

#endif // MMCPS_SERVER_LOG_HPP
