/**
 * @file Enumeration.hpp
 * @brief Closed sets of named singleton constants ("smart enums")
 */

#pragma once

#include "ddd/domain/ValueObject.hpp"
#include "ddd/exception/exceptions.hpp"
#include "ddd/utils/string_utils.h"
#include "ddd/utils/type_name.h"

#include <spdlog/spdlog.h>

#include <ostream>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace ddd::domain {

/**
 * @brief Base template class for Enumerations
 *
 * Each derived type T declares its closed set of instances as static
 * singletons and lists them, in declaration order, from a static factory:
 *
 * @code
 * class OrderStatus : public Enumeration<OrderStatus> {
 * public:
 *     static const OrderStatus Pending;
 *     static const OrderStatus Shipped;
 *
 *     static std::vector<const OrderStatus*> declaredInstances() {
 *         return {&Pending, &Shipped};
 *     }
 *
 * private:
 *     using Enumeration::Enumeration;
 * };
 *
 * inline const OrderStatus OrderStatus::Pending{1, "Pending"};
 * inline const OrderStatus OrderStatus::Shipped{2, "Shipped"};
 * @endcode
 *
 * The set is validated (unique values, unique names) and indexed on the
 * first lookup and cached for the lifetime of the process. Equality and
 * hashing use the value only.
 *
 * @tparam T The derived enumeration type
 */
template<typename T>
class Enumeration : public ValueObject {
private:
    int value_;
    std::string name_;

    /**
     * @brief Validated lookup tables of one closed set
     */
    struct Registry {
        std::vector<const T*> all;
        std::unordered_map<int, const T*> byValue;
        std::unordered_map<std::string, const T*> byName;

        Registry() : all(T::declaredInstances()) {
            std::unordered_set<int> seenValues;
            for (const T* e : all) {
                if (!seenValues.insert(e->getValue()).second) {
                    spdlog::error("Duplicate enumeration value in {}: {}",
                                  utils::typeName<T>(), e->getValue());
                    throw exception::ConfigurationException(
                        "Duplicate enumeration value detected: '" + std::to_string(e->getValue()) +
                        "'. Value must be unique.");
                }
            }

            std::unordered_set<std::string> seenNames;
            for (const T* e : all) {
                if (!seenNames.insert(e->getName()).second) {
                    spdlog::error("Duplicate enumeration name in {}: {}",
                                  utils::typeName<T>(), e->getName());
                    throw exception::ConfigurationException(
                        "Duplicate enumeration name detected: '" + e->getName() +
                        "'. Name must be unique.");
                }
            }

            for (const T* e : all) {
                byValue.emplace(e->getValue(), e);
                byName.emplace(e->getName(), e);
            }

            spdlog::debug("Enumeration registry built: type={}, count={}",
                          utils::typeName<T>(), all.size());
        }
    };

    /**
     * @brief Per-type registry, built once on first use
     *
     * Concurrent first callers block until construction completes. If
     * construction throws, the next call attempts it again.
     */
    static const Registry& registry() {
        static const Registry instance;
        return instance;
    }

    static void validate(int value, const std::string& name) {
        if (value < 0) {
            throw exception::InvalidArgumentException(
                "Invalid enumeration value: '" + std::to_string(value) +
                "'. Expected a non-negative value.", "value");
        }
        if (utils::isBlank(name)) {
            throw exception::InvalidArgumentException(
                "Enumeration name should not be null, empty, or contain only whitespace.", "name");
        }
    }

protected:
    /**
     * @brief Construct an instance of the closed set
     * @param value Non-negative identifier, unique within T
     * @param name Non-blank display name, unique within T
     * @throws ddd::exception::InvalidArgumentException on a negative value or blank name
     */
    Enumeration(int value, std::string name)
        : value_(value), name_(std::move(name)) {
        validate(value_, name_);
    }

    std::vector<EqualityComponent> getEqualityComponents() const override {
        return {value_};
    }

public:
    [[nodiscard]] int getValue() const noexcept {
        return value_;
    }

    [[nodiscard]] const std::string& getName() const noexcept {
        return name_;
    }

    /**
     * @brief Get the instance with the given value
     * @throws ddd::exception::LookupException if value is negative or unknown
     */
    static const T& fromValue(int value) {
        const T* enumeration = tryGetFromValue(value);
        if (!enumeration) {
            throw exception::LookupException(
                "Enumeration value '" + std::to_string(value) + "' is not valid for " +
                utils::typeName<T>() + ".");
        }
        return *enumeration;
    }

    /**
     * @brief Find the instance with the given value
     * @return The instance, or nullptr if value is negative or unknown
     */
    static const T* tryGetFromValue(int value) {
        if (value < 0) {
            return nullptr;
        }
        const auto& byValue = registry().byValue;
        auto it = byValue.find(value);
        return it != byValue.end() ? it->second : nullptr;
    }

    /**
     * @brief Get the instance with the given name (case-sensitive)
     * @throws ddd::exception::LookupException if name is blank or unknown
     */
    static const T& fromName(const std::string& name) {
        const T* enumeration = tryGetFromName(name);
        if (!enumeration) {
            throw exception::LookupException(
                "Enumeration name '" + name + "' is not valid for " +
                utils::typeName<T>() + ".");
        }
        return *enumeration;
    }

    /**
     * @brief Find the instance with the given name
     * @return The instance, or nullptr if name is blank or unknown
     */
    static const T* tryGetFromName(const std::string& name) {
        if (utils::isBlank(name)) {
            return nullptr;
        }
        const auto& byName = registry().byName;
        auto it = byName.find(name);
        return it != byName.end() ? it->second : nullptr;
    }

    static bool exists(int value) {
        return tryGetFromValue(value) != nullptr;
    }

    static bool exists(const std::string& name) {
        return tryGetFromName(name) != nullptr;
    }

    static bool exists(const char* name) {
        return name != nullptr && exists(std::string(name));
    }

    /**
     * @brief All instances of T in declaration order
     */
    static const std::vector<const T*>& getAll() {
        return registry().all;
    }

    /**
     * @brief Order by value
     * @return negative, zero or positive as this is less, equal or greater
     */
    int compareTo(const Enumeration& other) const noexcept {
        if (value_ < other.value_) {
            return -1;
        }
        return value_ > other.value_ ? 1 : 0;
    }

    /**
     * @brief Order against an arbitrary value object
     * @throws ddd::exception::TypeMismatchException if other is not an Enumeration<T>
     */
    int compareTo(const ValueObject& other) const {
        const auto* enumeration = dynamic_cast<const Enumeration*>(&other);
        if (!enumeration) {
            throw exception::TypeMismatchException(
                "Object type mismatch. Expected " + utils::typeName<T>() + ".");
        }
        return compareTo(*enumeration);
    }

    /**
     * @brief Order against a possibly absent object; nullptr sorts first
     */
    int compareTo(const ValueObject* other) const {
        return other ? compareTo(*other) : 1;
    }

    [[nodiscard]] std::string toString() const {
        return name_;
    }

    friend bool operator<(const Enumeration& left, const Enumeration& right) noexcept {
        return left.compareTo(right) < 0;
    }

    friend bool operator>(const Enumeration& left, const Enumeration& right) noexcept {
        return right < left;
    }

    friend bool operator<=(const Enumeration& left, const Enumeration& right) noexcept {
        return !(right < left);
    }

    friend bool operator>=(const Enumeration& left, const Enumeration& right) noexcept {
        return !(left < right);
    }

    friend std::ostream& operator<<(std::ostream& os, const Enumeration& enumeration) {
        return os << enumeration.name_;
    }
};

} // namespace ddd::domain
