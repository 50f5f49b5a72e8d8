#ifndef MMCPS_UTF8_SANITIZE_HPP
#define MMCPS_UTF8_SANITIZE_HPP

// nlohmann::json refuses to serialize strings that are not valid UTF-8, so
// anything a tool reads from the outside world (file contents, process output,
// environment values) goes through here before it lands in a payload.

#include <string>

namespace utf8_sanitize {

// True if text is well-formed UTF-8 (no overlong forms, no surrogates,
// nothing above U+10FFFF).
bool is_valid(const std::string &text);

// Replaces each invalid byte with U+FFFD. In-place version.
void sanitize(std::string &text);

// Replaces each invalid byte with U+FFFD. Returns a new string.
std::string sanitize(const std::string &text);

} // namespace utf8_sanitize

#endif // MMCPS_UTF8_SANITIZE_HPP
