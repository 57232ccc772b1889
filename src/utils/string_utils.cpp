/**
 * @file string_utils.cpp
 * @brief Implementation of string helpers
 *
 * @date 2025
 */

#include "breachlab/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace breachlab {
namespace utils {

std::string StringUtils::Trim(const std::string& str) {
    const char* whitespace = " \t\n\r\f\v";
    auto start = str.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    auto end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string StringUtils::ToUpper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

std::vector<std::string> StringUtils::SplitWhitespace(const std::string& str) {
    std::vector<std::string> tokens;
    std::istringstream iss(str);
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

std::string StringUtils::ReplaceAll(std::string str, const std::string& from, const std::string& to) {
    if (from.empty()) {
        return str;
    }
    std::size_t pos = 0;
    while ((pos = str.find(from, pos)) != std::string::npos) {
        str.replace(pos, from.length(), to);
        pos += to.length();
    }
    return str;
}

bool StringUtils::Contains(const std::string& str, const std::string& needle) {
    return str.find(needle) != std::string::npos;
}

std::string StringUtils::FormatTimestamp(std::chrono::system_clock::time_point tp) {
    auto time_t_value = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_value{};
    gmtime_r(&time_t_value, &tm_value);

    std::ostringstream oss;
    oss << std::put_time(&tm_value, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace utils
} // namespace breachlab
