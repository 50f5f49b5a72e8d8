#ifndef MMCPS_TEST_SUPPORT_HPP
#define MMCPS_TEST_SUPPORT_HPP

// Shared reporting for the test suites: one "  OK:" or "  FAIL:" line per check.

#include <iostream>
#include <string>

namespace test_support {

inline bool report(bool success, const std::string &description, const std::string &failure_detail = "") {
    if (success) {
        std::cout << "  OK: " << description << std::endl;
    } else {
        std::cout << "  FAIL: " << description;
        if (!failure_detail.empty()) {
            std::cout << " (" << failure_detail << ")";
        }
        std::cout << std::endl;
    }
    return success;
}

} // namespace test_support

#endif // MMCPS_TEST_SUPPORT_HPP
