/**
 * @file string_utils.h
 * @brief String helpers used for argument validation and configuration parsing
 */

#pragma once

#include <string>

namespace ddd {
namespace utils {

/**
 * @brief Convert string to lowercase
 *
 * @param str Input string
 * @return Lowercase string
 */
std::string toLower(const std::string& str);

/**
 * @brief Trim whitespace from both ends
 *
 * @param str Input string
 * @return Trimmed string
 */
std::string trim(const std::string& str);

/**
 * @brief Check if string is empty or consists only of whitespace
 *
 * @param str Input string
 * @return true if str has no non-whitespace character
 */
bool isBlank(const std::string& str);

} // namespace utils
} // namespace ddd
