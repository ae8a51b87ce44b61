/**
 * @file DomainException.hpp
 * @brief Root of the domain base types exception hierarchy
 */

#pragma once

#include <stdexcept>
#include <string>

namespace ddd::exception {

/**
 * @brief Exception for domain modeling errors
 *
 * Raised when a domain type is constructed with invalid arguments, looked up
 * by an unknown key, or declared inconsistently.
 */
class DomainException : public std::runtime_error {
private:
    std::string code_;
    std::string message_;

public:
    /**
     * @brief Construct a new Domain Exception
     * @param code Error code (e.g., "LOOKUP_FAILED")
     * @param message Human-readable error message
     */
    DomainException(std::string code, std::string message)
        : std::runtime_error(message),
          code_(std::move(code)),
          message_(std::move(message)) {}

    /**
     * @brief Get the error code
     */
    [[nodiscard]] const std::string& getCode() const noexcept {
        return code_;
    }

    /**
     * @brief Get the error message
     */
    [[nodiscard]] const std::string& getMessage() const noexcept {
        return message_;
    }
};

} // namespace ddd::exception
