/**
 * @file ValueObject.hpp
 * @brief Base class for Value Objects in DDD
 */

#pragma once

#include "ddd/domain/EqualityComponent.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <typeindex>
#include <typeinfo>
#include <vector>

namespace ddd::domain {

/**
 * @brief Base class for Value Objects
 *
 * Value Objects are immutable objects that are defined by their attributes.
 * Two Value Objects are equal when they have the same unproxied type and
 * their equality components are pairwise equal, in order.
 *
 * Derived classes validate their arguments in the constructor and never
 * change the equality components afterwards: the hash code is computed once
 * and cached.
 *
 * @code
 * class Money : public ValueObject {
 * public:
 *     Money(long amount, std::string currency)
 *         : amount_(amount), currency_(std::move(currency)) {}
 *
 * protected:
 *     std::vector<EqualityComponent> getEqualityComponents() const override {
 *         return {amount_, currency_};
 *     }
 *
 * private:
 *     long amount_;
 *     std::string currency_;
 * };
 * @endcode
 */
class ValueObject {
private:
    mutable std::atomic<bool> hashComputed_{false};
    mutable std::atomic<std::size_t> cachedHashCode_{0};

    bool satisfiesStructuralEquality(const ValueObject& other) const;

protected:
    ValueObject() = default;

    ValueObject(const ValueObject& other) noexcept;

    /**
     * @brief Ordered values that define structural equality
     *
     * Must be free of side effects and return the same sequence for the
     * whole lifetime of the instance.
     */
    virtual std::vector<EqualityComponent> getEqualityComponents() const = 0;

    /**
     * @brief Logical type used for equality and hashing
     *
     * Defaults to the dynamic type. Override to see through a proxy or
     * wrapper subclass, or to unify a family of subtypes under one type.
     */
    virtual std::type_index getUnproxiedType() const {
        return typeid(*this);
    }

public:
    virtual ~ValueObject() = default;

    // Immutable: copyable, never reassigned
    ValueObject& operator=(const ValueObject&) = delete;

    /**
     * @brief Structural equality
     * @return true if other has the same unproxied type and equality components
     */
    virtual bool equals(const ValueObject& other) const;

    /**
     * @brief Structural equality against a possibly absent object
     * @return false if other is nullptr
     */
    bool equals(const ValueObject* other) const;

    /**
     * @brief Hash of the unproxied type and all equality components
     */
    [[nodiscard]] std::size_t getHashCode() const;

    /**
     * @brief Absent-aware equality
     *
     * Both absent compare equal, exactly one absent compares unequal,
     * otherwise delegates to equals().
     */
    static bool areEqual(const ValueObject* left, const ValueObject* right);
};

inline bool operator==(const ValueObject& left, const ValueObject& right) {
    return left.equals(right);
}

inline bool operator!=(const ValueObject& left, const ValueObject& right) {
    return !(left == right);
}

/**
 * @brief Hash functor for value objects held by reference or pointer
 */
struct ValueObjectHash {
    std::size_t operator()(const ValueObject& vo) const {
        return vo.getHashCode();
    }

    std::size_t operator()(const ValueObject* vo) const {
        return vo ? vo->getHashCode() : 0;
    }

    std::size_t operator()(const std::shared_ptr<const ValueObject>& vo) const {
        return (*this)(vo.get());
    }
};

/**
 * @brief Equality functor matching ValueObjectHash
 */
struct ValueObjectEqual {
    bool operator()(const ValueObject& left, const ValueObject& right) const {
        return left.equals(right);
    }

    bool operator()(const ValueObject* left, const ValueObject* right) const {
        return ValueObject::areEqual(left, right);
    }

    bool operator()(const std::shared_ptr<const ValueObject>& left,
                    const std::shared_ptr<const ValueObject>& right) const {
        return ValueObject::areEqual(left.get(), right.get());
    }
};

} // namespace ddd::domain

// Hash function support for use in unordered containers
namespace std {
    template<>
    struct hash<ddd::domain::ValueObject> {
        size_t operator()(const ddd::domain::ValueObject& vo) const {
            return vo.getHashCode();
        }
    };
}
