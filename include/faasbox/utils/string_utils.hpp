/**
 * @file string_utils.hpp
 * @brief String helpers shared by the container driver and the engine
 *
 * Trimming, casing and splitting for CLI output handling, plus parsers for
 * the human-readable quantities the container runtime prints in its
 * statistics ("12.34%", "123.4MiB / 1.944GiB").
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace faasbox {
namespace utils {

/**
 * @class StringUtils
 * @brief Stateless string utilities
 *
 * All methods are static - no instantiation required.
 *
 * **Usage Example**:
 * @code
 * auto bytes = StringUtils::ParseSizeToBytes("123.4MiB");   // 129394278
 * auto cpu = StringUtils::ParsePercent("12.34%");           // 12.34
 * auto id = StringUtils::ShortId(container_id);             // "3f2a9c1d0b7e"
 * @endcode
 */
class StringUtils {
public:
    /***************************************************************************
     * Basic String Manipulation
     ***************************************************************************/

    /**
     * @brief Trim whitespace from both ends of string
     * @param str Input string
     * @return Trimmed string
     */
    static std::string Trim(const std::string& str);

    /**
     * @brief Trim trailing whitespace only
     *
     * Used for program output, where leading indentation is significant.
     */
    static std::string TrimRight(const std::string& str);

    static std::string ToLower(const std::string& str);

    /**
     * @brief Split string by delimiter
     *
     * @param str Input string
     * @param delimiter Character to split on
     * @return Vector of non-empty substrings
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    static bool Contains(const std::string& str, const std::string& substring);

    /***************************************************************************
     * Runtime Output Parsing
     ***************************************************************************/

    /**
     * @brief Parse a size with a binary or decimal unit suffix
     *
     * Accepts "512B", "1.5kB", "20KiB", "123.4MiB", "2GB", "1.944GiB", "1TiB".
     * A bare number is taken as bytes.
     *
     * @param text Size text
     * @return Size in bytes, or nullopt if unparsable
     */
    static std::optional<std::uint64_t> ParseSizeToBytes(const std::string& text);

    /**
     * @brief Parse "12.34%" into 12.34
     * @return Percentage, or nullopt if unparsable
     */
    static std::optional<double> ParsePercent(const std::string& text);

    /// First 12 characters of a container id
    static std::string ShortId(const std::string& container_id);
};

} // namespace utils
} // namespace faasbox
