/**
 * @file exceptions.hpp
 * @brief Failure taxonomy of the domain base types
 */

#pragma once

#include "ddd/exception/DomainException.hpp"

#include <string>

namespace ddd::exception {

/**
 * @brief A constructor argument violates its precondition
 *
 * The message ends with the offending parameter name, e.g.
 * "Invalid enumeration value: '-1'. Expected a non-negative value. (Parameter 'value')"
 */
class InvalidArgumentException : public DomainException {
private:
    std::string paramName_;

public:
    InvalidArgumentException(const std::string& message, std::string paramName)
        : DomainException("INVALID_ARGUMENT", message + " (Parameter '" + paramName + "')"),
          paramName_(std::move(paramName)) {}

    [[nodiscard]] const std::string& getParamName() const noexcept {
        return paramName_;
    }
};

/**
 * @brief No instance matches the requested key
 */
class LookupException : public DomainException {
public:
    explicit LookupException(const std::string& message)
        : DomainException("LOOKUP_FAILED", message) {}
};

/**
 * @brief A closed set is declared inconsistently (duplicate value or name)
 */
class ConfigurationException : public DomainException {
public:
    explicit ConfigurationException(const std::string& message)
        : DomainException("INVALID_CONFIGURATION", message) {}
};

/**
 * @brief Comparison against an object of an incompatible type
 */
class TypeMismatchException : public DomainException {
public:
    explicit TypeMismatchException(const std::string& message)
        : DomainException("TYPE_MISMATCH", message) {}
};

} // namespace ddd::exception
