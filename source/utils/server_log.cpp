#include "utils/server_log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>

namespace server_log {

static std::atomic<int> threshold_value{static_cast<int>(Level::Info)};

// Serializes whole lines; HTTP and stdio workers log concurrently.
static std::mutex output_mutex;

static std::string to_lower(const std::string &input) {
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return result;
}

void set_threshold(Level threshold) {
    threshold_value.store(static_cast<int>(threshold));
}

bool parse_level(const std::string &text, Level &output_level) {
    std::string normalized = to_lower(text);
    if (normalized == "debug") {
        output_level = Level::Debug;
    } else if (normalized == "info") {
        output_level = Level::Info;
    } else if (normalized == "warning" || normalized == "warn") {
        output_level = Level::Warning;
    } else if (normalized == "error" || normalized == "critical") {
        output_level = Level::Error;
    } else {
        return false;
    }
    return true;
}

const char *level_name(Level level) {
    switch (level) {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warning:
        return "WARNING";
    case Level::Error:
        return "ERROR";
    }
    return "UNKNOWN";
}

bool is_debug_env_enabled() {
    const char *value = std::getenv("MMCPS_DEBUG");
    if (value == nullptr || value[0] == '\0') {
        return false;
    }
    std::string normalized = to_lower(std::string(value));
    return (normalized == "1" || normalized == "true" || normalized == "yes");
}

bool is_enabled(Level level) {
    return static_cast<int>(level) >= threshold_value.load();
}

void write(Level level, const std::string &message) {
    if (!is_enabled(level)) {
        return;
    }
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cerr << "[mmcps] [" << level_name(level) << "] " << message << std::endl;
}

void debug(const std::string &message) {
    write(Level::Debug, message);
}

void info(const std::string &message) {
    write(Level::Info, message);
}

void warning(const std::string &message) {
    write(Level::Warning, message);
}

void error(const std::string &message) {
    write(Level::Error, message);
}

} // namespace server_log
