// Surge - String Utilities
// String manipulation, validation and formatting

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <chrono>

namespace surge::utils {

/**
 * @brief String manipulation utilities
 */
class StringUtils {
public:
    // Trimming
    static std::string trim(const std::string& str);

    // Case conversion
    static std::string toLower(const std::string& str);

    // Splitting and joining
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string join(const std::vector<std::string>& parts, const std::string& separator);

    // Search
    static bool startsWith(const std::string& str, const std::string& prefix);
    static bool endsWith(const std::string& str, const std::string& suffix);

    // Formatting
    static std::string formatBytes(uint64_t bytes);
    static std::string formatSpeed(double bytesPerSecond);
    static std::string formatPercentage(double fraction, int precision = 1);
    static std::string truncate(const std::string& str, size_t maxLength, const std::string& suffix = "...");

    // UUID
    static std::string generateUUID();
    static bool isValidUUID(const std::string& str);

    // Validation
    static bool isUrl(const std::string& str);
    static bool isBlank(const std::string& str);
    static bool isValidUtf8(const std::string& str);

    // File names
    static std::string fileExtension(const std::string& filename);
};

} // namespace surge::utils
