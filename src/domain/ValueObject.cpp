/**
 * @file ValueObject.cpp
 * @brief Structural equality and cached hashing for Value Objects
 */

#include "ddd/domain/ValueObject.hpp"
#include "ddd/utils/hash_utils.h"

namespace ddd::domain {

ValueObject::ValueObject(const ValueObject& other) noexcept
    : hashComputed_(other.hashComputed_.load(std::memory_order_acquire)),
      cachedHashCode_(other.cachedHashCode_.load(std::memory_order_relaxed)) {}

bool ValueObject::equals(const ValueObject& other) const {
    if (this == &other) {
        return true;
    }
    if (getUnproxiedType() != other.getUnproxiedType()) {
        return false;
    }
    return satisfiesStructuralEquality(other);
}

bool ValueObject::equals(const ValueObject* other) const {
    return other != nullptr && equals(*other);
}

std::size_t ValueObject::getHashCode() const {
    if (hashComputed_.load(std::memory_order_acquire)) {
        return cachedHashCode_.load(std::memory_order_relaxed);
    }

    std::size_t seed = std::hash<std::type_index>{}(getUnproxiedType());
    for (const auto& component : getEqualityComponents()) {
        utils::hashCombine(seed, component.getHashCode());
    }

    // Concurrent first callers compute the same value
    cachedHashCode_.store(seed, std::memory_order_relaxed);
    hashComputed_.store(true, std::memory_order_release);
    return seed;
}

bool ValueObject::areEqual(const ValueObject* left, const ValueObject* right) {
    if (left == nullptr) {
        return right == nullptr;
    }
    return left->equals(right);
}

bool ValueObject::satisfiesStructuralEquality(const ValueObject& other) const {
    const auto components = getEqualityComponents();
    const auto otherComponents = other.getEqualityComponents();

    if (components.size() != otherComponents.size()) {
        return false;
    }
    for (std::size_t i = 0; i < components.size(); ++i) {
        if (components[i] != otherComponents[i]) {
            return false;
        }
    }
    return true;
}

} // namespace ddd::domain
