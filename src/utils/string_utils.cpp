/**
 * @file string_utils.cpp
 * @brief Implementation of string helpers and runtime output parsers
 *
 * The size parser understands both the IEC units docker prints for memory
 * ("MiB", "GiB") and the SI units it prints for I/O ("kB", "MB").
 *
 * @date 2025
 */

#include "faasbox/utils/string_utils.hpp"

#include <sstream>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <map>

namespace faasbox {
namespace utils {

// ============================================================================
// STRING MANIPULATION UTILITIES
// ============================================================================
// Basic string operations: trimming, casing, splitting, joining

// Trim whitespace
std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

std::string StringUtils::TrimRight(const std::string& str) {
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return std::string(str.begin(), end);
}

// Convert to lowercase
std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return result;
}

// Split by delimiter
std::vector<std::string> StringUtils::Split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream token_stream(str);

    while (std::getline(token_stream, token, delimiter)) {
        if (!token.empty()) {  // Skip empty tokens
            tokens.push_back(token);
        }
    }

    return tokens;
}

bool StringUtils::Contains(const std::string& str, const std::string& substring) {
    return str.find(substring) != std::string::npos;
}

// ============================================================================
// RUNTIME OUTPUT PARSING
// ============================================================================
// docker stats prints "MemUsage": "12.5MiB / 1.944GiB", "CPUPerc": "0.07%"

std::optional<std::uint64_t> StringUtils::ParseSizeToBytes(const std::string& text) {
    static const std::map<std::string, double> multipliers = {
        {"", 1.0},
        {"b", 1.0},
        {"kb", 1e3}, {"kib", 1024.0},
        {"mb", 1e6}, {"mib", 1024.0 * 1024.0},
        {"gb", 1e9}, {"gib", 1024.0 * 1024.0 * 1024.0},
        {"tb", 1e12}, {"tib", 1024.0 * 1024.0 * 1024.0 * 1024.0},
    };

    std::string trimmed = Trim(text);
    if (trimmed.empty()) {
        return std::nullopt;
    }

    const char* begin = trimmed.c_str();
    char* end = nullptr;
    double value = std::strtod(begin, &end);
    if (end == begin || value < 0.0 || !std::isfinite(value)) {
        return std::nullopt;
    }

    std::string unit = ToLower(Trim(std::string(end)));
    auto it = multipliers.find(unit);
    if (it == multipliers.end()) {
        return std::nullopt;
    }

    return static_cast<std::uint64_t>(std::llround(value * it->second));
}

std::optional<double> StringUtils::ParsePercent(const std::string& text) {
    std::string cleaned = Trim(text);
    cleaned.erase(std::remove(cleaned.begin(), cleaned.end(), '%'), cleaned.end());
    if (cleaned.empty()) {
        return std::nullopt;
    }

    const char* begin = cleaned.c_str();
    char* end = nullptr;
    double value = std::strtod(begin, &end);
    if (end == begin || *end != '\0' || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::string StringUtils::ShortId(const std::string& container_id) {
    return container_id.substr(0, 12);
}

} // namespace utils
} // namespace faasbox
