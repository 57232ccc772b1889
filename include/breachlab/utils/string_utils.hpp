/**
 * @file string_utils.hpp
 * @brief String manipulation helpers shared across the engine
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace breachlab {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string helpers (trim, split, replace, timestamps)
 *
 * **Usage Example**:
 * @code
 * auto tokens = StringUtils::SplitWhitespace("spawn web-xss-01 alice");
 * std::string env = StringUtils::ReplaceAll("/u/{{USER_ID}}", "{{USER_ID}}", "alice");
 * @endcode
 */
class StringUtils {
public:
    /**
     * @brief Remove leading and trailing whitespace
     */
    static std::string Trim(const std::string& str);

    /**
     * @brief Lowercase ASCII characters
     */
    static std::string ToLower(const std::string& str);

    /**
     * @brief Uppercase ASCII characters
     */
    static std::string ToUpper(const std::string& str);

    /**
     * @brief Split on runs of whitespace, dropping empty tokens
     */
    static std::vector<std::string> SplitWhitespace(const std::string& str);

    /**
     * @brief Replace every occurrence of @p from with @p to
     * @param str Input string
     * @param from Substring to replace (empty returns input unchanged)
     * @param to Replacement
     * @return Resulting string
     */
    static std::string ReplaceAll(std::string str, const std::string& from, const std::string& to);

    /**
     * @brief Case-sensitive substring test
     */
    static bool Contains(const std::string& str, const std::string& needle);

    /**
     * @brief Format a time point as ISO-8601 UTC (e.g. 2025-01-31T12:00:00Z)
     */
    static std::string FormatTimestamp(std::chrono::system_clock::time_point tp);
};

} // namespace utils
} // namespace breachlab
