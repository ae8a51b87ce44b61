/**
 * @file string_utils.cpp
 * @brief String helper implementation
 */

#include "ddd/utils/string_utils.h"
#include <algorithm>
#include <cctype>

namespace ddd {
namespace utils {

std::string toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string trim(const std::string& str) {
    size_t start = 0;
    while (start < str.length() && std::isspace(static_cast<unsigned char>(str[start]))) {
        ++start;
    }

    if (start == str.length()) {
        return "";
    }

    size_t end = str.length();
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        --end;
    }

    return str.substr(start, end - start);
}

bool isBlank(const std::string& str) {
    return std::all_of(str.begin(), str.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace utils
} // namespace ddd
