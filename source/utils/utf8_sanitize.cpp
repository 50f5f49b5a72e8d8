#include "utils/utf8_sanitize.hpp"

#include <cstddef>

namespace utf8_sanitize {

namespace {

const char kReplacementUtf8[] = "\xEF\xBF\xBD"; // U+FFFD

// Length of the well-formed sequence starting at position, or 0 if the bytes
// there do not form one. Second-byte ranges follow RFC 3629 table 3-7.
size_t sequence_length(const unsigned char *position, const unsigned char *end) {
    unsigned char lead = position[0];
    if (lead < 0x80u) {
        return 1;
    }

    size_t length = 0;
    unsigned char second_minimum = 0x80u;
    unsigned char second_maximum = 0xBFu;

    if (lead >= 0xC2u && lead <= 0xDFu) {
        length = 2;
    } else if (lead == 0xE0u) {
        length = 3;
        second_minimum = 0xA0u;
    } else if (lead == 0xEDu) {
        length = 3;
        second_maximum = 0x9Fu;
    } else if (lead >= 0xE1u && lead <= 0xEFu) {
        length = 3;
    } else if (lead == 0xF0u) {
        length = 4;
        second_minimum = 0x90u;
    } else if (lead == 0xF4u) {
        length = 4;
        second_maximum = 0x8Fu;
    } else if (lead >= 0xF1u && lead <= 0xF3u) {
        length = 4;
    } else {
        return 0;
    }

    if (static_cast<size_t>(end - position) < length) {
        return 0;
    }
    if (position[1] < second_minimum || position[1] > second_maximum) {
        return 0;
    }
    for (size_t index = 2; index < length; ++index) {
        if ((position[index] & 0xC0u) != 0x80u) {
            return 0;
        }
    }
    return length;
}

} // namespace

bool is_valid(const std::string &text) {
    const unsigned char *pointer = reinterpret_cast<const unsigned char *>(text.data());
    const unsigned char *end = pointer + text.size();
    while (pointer < end) {
        size_t length = sequence_length(pointer, end);
        if (length == 0) {
            return false;
        }
        pointer += length;
    }
    return true;
}

void sanitize(std::string &text) {
    if (is_valid(text)) {
        return;
    }

    std::string result;
    result.reserve(text.size() + 8);

    const unsigned char *pointer = reinterpret_cast<const unsigned char *>(text.data());
    const unsigned char *end = pointer + text.size();

    while (pointer < end) {
        size_t length = sequence_length(pointer, end);
        if (length == 0) {
            result.append(kReplacementUtf8, 3);
            ++pointer;
            continue;
        }
        result.append(reinterpret_cast<const char *>(pointer), length);
        pointer += length;
    }

    text = std::move(result);
}

std::string sanitize(const std::string &text) {
    std::string copy = text;
    sanitize(copy);
    return copy;
}

} // namespace utf8_sanitize
