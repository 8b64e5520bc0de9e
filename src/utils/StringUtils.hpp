// Stevedore - String Utilities
// Formatting helpers for rendered operations and progress reports

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace stevedore::utils {

/**
 * @brief String formatting utilities
 */
class StringUtils {
public:
    static std::string toLower(const std::string& str);

    // "1.5 MB"
    static std::string formatBytes(int64_t bytes);

    // RFC 3339 in UTC with millisecond precision, e.g. "2024-05-01T10:20:30.123Z"
    static std::string formatRfc3339(std::chrono::system_clock::time_point time);
};

} // namespace stevedore::utils
