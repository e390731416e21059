/**
 * StringUtils.cpp
 *
 * String manipulation and formatting utilities.
 */

#include "StringUtils.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace surge::utils {

// -- Trimming --

std::string StringUtils::trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(start, end - start + 1);
}

// -- Case conversion --

std::string StringUtils::toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// -- Split/Join --

std::vector<std::string> StringUtils::split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream iss(str);
    std::string part;
    while (std::getline(iss, part, delimiter)) parts.push_back(part);
    return parts;
}

std::string StringUtils::join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += separator;
        result += parts[i];
    }
    return result;
}

// -- Search --

bool StringUtils::startsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::endsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// -- Formatting --

std::string StringUtils::formatBytes(uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(bytes);
    int unit = 0;
    while (size >= 1024.0 && unit < 4) { size /= 1024.0; ++unit; }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(unit == 0 ? 0 : 1) << size << " " << units[unit];
    return oss.str();
}

std::string StringUtils::formatSpeed(double bytesPerSecond) {
    if (bytesPerSecond <= 0.0) return "0 B/s";
    return formatBytes(static_cast<uint64_t>(bytesPerSecond)) + "/s";
}

std::string StringUtils::formatPercentage(double fraction, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << (fraction * 100.0) << "%";
    return oss.str();
}

std::string StringUtils::truncate(const std::string& str, size_t maxLength, const std::string& suffix) {
    if (str.size() <= maxLength) return str;
    if (maxLength <= suffix.size()) return str.substr(0, maxLength);
    return str.substr(0, maxLength - suffix.size()) + suffix;
}

// -- UUID --

std::string StringUtils::generateUUID() {
    static std::mutex mutex;
    static std::random_device rd;
    static std::mt19937_64 gen(rd());
    static std::uniform_int_distribution<> dis(0, 15);
    static const char hex[] = "0123456789abcdef";

    std::lock_guard<std::mutex> lock(mutex);

    std::string uuid(36, '-');
    for (int i = 0; i < 36; ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) continue;
        uuid[i] = hex[dis(gen)];
    }
    uuid[14] = '4'; // version 4
    uuid[19] = hex[(dis(gen) & 0x3) | 0x8]; // variant
    return uuid;
}

bool StringUtils::isValidUUID(const std::string& str) {
    if (str.size() != 36) return false;
    for (int i = 0; i < 36; ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (str[i] != '-') return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(str[i]))) {
            return false;
        }
    }
    return true;
}

// -- Validation --

bool StringUtils::isUrl(const std::string& str) {
    std::string rest;
    const std::string lower = toLower(str);
    if (startsWith(lower, "http://")) {
        rest = str.substr(7);
    } else if (startsWith(lower, "https://")) {
        rest = str.substr(8);
    } else {
        return false;
    }

    if (std::any_of(str.begin(), str.end(), [](unsigned char c) {
            return std::isspace(c) || std::iscntrl(c);
        })) {
        return false;
    }

    // Authority ends at the first '/', '?' or '#'
    std::string authority = rest.substr(0, rest.find_first_of("/?#"));
    auto at = authority.rfind('@');
    if (at != std::string::npos) authority = authority.substr(at + 1);

    std::string host = authority;
    if (!host.empty() && host.front() == '[') {
        auto close = host.find(']');
        if (close == std::string::npos || close == 1) return false;
        return true;
    }

    auto colon = host.find(':');
    if (colon != std::string::npos) {
        std::string port = host.substr(colon + 1);
        host = host.substr(0, colon);
        if (port.empty() || port.size() > 5 ||
            !std::all_of(port.begin(), port.end(), [](unsigned char c) { return std::isdigit(c); })) {
            return false;
        }
    }

    if (host.empty() || host.front() == '.' || host.back() == '.') return false;
    return std::all_of(host.begin(), host.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '.';
    });
}

bool StringUtils::isBlank(const std::string& str) { return trim(str).empty(); }

bool StringUtils::isValidUtf8(const std::string& str) {
    size_t i = 0;
    while (i < str.size()) {
        unsigned char c = static_cast<unsigned char>(str[i]);

        size_t length = 0;
        uint32_t codepoint = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            length = 2;
            codepoint = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            length = 3;
            codepoint = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            length = 4;
            codepoint = c & 0x07;
        } else {
            return false;
        }

        if (i + length > str.size()) return false;
        for (size_t k = 1; k < length; ++k) {
            unsigned char next = static_cast<unsigned char>(str[i + k]);
            if ((next & 0xC0) != 0x80) return false;
            codepoint = (codepoint << 6) | (next & 0x3F);
        }

        // Overlong forms, surrogates and values past U+10FFFF
        if ((length == 2 && codepoint < 0x80) ||
            (length == 3 && codepoint < 0x800) ||
            (length == 4 && codepoint < 0x10000) ||
            (codepoint >= 0xD800 && codepoint <= 0xDFFF) ||
            codepoint > 0x10FFFF) {
            return false;
        }
        i += length;
    }
    return true;
}

// -- File names --

std::string StringUtils::fileExtension(const std::string& filename) {
    auto dot = filename.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == filename.size()) return "";
    return toLower(filename.substr(dot + 1));
}

} // namespace surge::utils
