/**
 * @file Error.hpp
 * @brief Structured error value
 */

#pragma once

#include "ddd/domain/ValueObject.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace ddd::domain {

/**
 * @brief Immutable error carrying a code and a descriptive message
 *
 * Errors are equal by code alone; the message is informational.
 * An absent code is allowed, and all errors with an absent code are equal.
 */
class Error : public ValueObject {
private:
    std::optional<std::string> code_;
    std::string message_;

protected:
    std::vector<EqualityComponent> getEqualityComponents() const override;

public:
    /**
     * @brief Construct a new Error
     * @param code Error code (e.g., "404"), may be std::nullopt
     * @param message Human-readable error message
     */
    Error(std::optional<std::string> code, std::string message)
        : code_(std::move(code)),
          message_(std::move(message)) {}

    [[nodiscard]] const std::optional<std::string>& getCode() const noexcept {
        return code_;
    }

    [[nodiscard]] const std::string& getMessage() const noexcept {
        return message_;
    }

    /**
     * @brief Render as "{code}: {message}"
     */
    [[nodiscard]] std::string toString() const;
};

inline std::ostream& operator<<(std::ostream& os, const Error& error) {
    return os << error.toString();
}

} // namespace ddd::domain

namespace std {
    template<>
    struct hash<ddd::domain::Error> {
        size_t operator()(const ddd::domain::Error& error) const {
            return error.getHashCode();
        }
    };
}
