/**
 * @file Entity.hpp
 * @brief Base class for Entities in DDD
 */

#pragma once

#include "ddd/exception/exceptions.hpp"
#include "ddd/utils/hash_utils.h"

#include <cstddef>
#include <functional>
#include <memory>
#include <typeindex>
#include <typeinfo>

namespace ddd::domain {

/**
 * @brief Base template class for Entities
 *
 * Entities are objects that are defined by their identity (ID),
 * not by their attributes. An entity whose ID still equals IdType{} is
 * transient: it has not been assigned an identity yet (typically pending
 * persistence). Use std::optional<U> as IdType for a nullable identifier.
 *
 * Entities deliberately have no operator==. Identity comparison is opt-in
 * through IdEqualityComparer.
 *
 * @tparam IdType The type of the entity's identifier (==, default
 *         constructible, std::hash)
 */
template<typename IdType>
class Entity {
private:
    IdType id_{};

protected:
    /**
     * @brief Construct a transient Entity
     */
    Entity() = default;

    /**
     * @brief Construct a new Entity with the given ID
     * @throws ddd::exception::InvalidArgumentException if id is the default value
     */
    explicit Entity(IdType id)
        : id_(std::move(id)) {
        if (id_ == IdType{}) {
            throw exception::InvalidArgumentException(
                "Entity Id should not be null or default value.", "id");
        }
    }

    /**
     * @brief Assign the identifier (used when persistence populates identity)
     */
    void setId(IdType id) {
        id_ = std::move(id);
    }

    /**
     * @brief Logical type used for identity comparison
     *
     * Defaults to the dynamic type. Override in proxy or wrapper subclasses to
     * report the wrapped domain type.
     */
    virtual std::type_index getUnproxiedType() const {
        return typeid(*this);
    }

public:
    virtual ~Entity() = default;

    // Entities should not be copied, only moved
    Entity(const Entity&) = delete;
    Entity& operator=(const Entity&) = delete;
    Entity(Entity&&) noexcept = default;
    Entity& operator=(Entity&&) noexcept = default;

    /**
     * @brief Get the entity's ID
     */
    [[nodiscard]] const IdType& getId() const noexcept {
        return id_;
    }

    /**
     * @brief Check whether the entity has no identity yet
     */
    [[nodiscard]] bool isTransient() const {
        return id_ == IdType{};
    }

    /**
     * @brief Identity comparer for entities sharing the same IdType
     *
     * Two entities are equal when both are present, report the same
     * unproxied type and have equal identifiers. Transient entities of the
     * same type are equal to each other and never equal to a non-transient
     * entity.
     */
    struct IdEqualityComparer {
        bool operator()(const Entity& x, const Entity& y) const {
            if (&x == &y) {
                return true;
            }
            return x.getUnproxiedType() == y.getUnproxiedType() && x.id_ == y.id_;
        }

        bool operator()(const Entity* x, const Entity* y) const {
            if (x == nullptr || y == nullptr) {
                return x == y;
            }
            return (*this)(*x, *y);
        }

        bool operator()(const std::shared_ptr<const Entity>& x,
                        const std::shared_ptr<const Entity>& y) const {
            return (*this)(x.get(), y.get());
        }

        bool equals(const Entity* x, const Entity* y) const {
            return (*this)(x, y);
        }

        std::size_t hash(const Entity& entity) const {
            std::size_t seed = std::hash<std::type_index>{}(entity.getUnproxiedType());
            utils::hashCombine(seed, std::hash<IdType>{}(entity.id_));
            return seed;
        }

        std::size_t hash(const Entity* entity) const {
            return entity ? hash(*entity) : 0;
        }
    };

    /**
     * @brief Hash functor consistent with IdEqualityComparer
     */
    struct IdHash {
        std::size_t operator()(const Entity& entity) const {
            return IdEqualityComparer{}.hash(entity);
        }

        std::size_t operator()(const Entity* entity) const {
            return IdEqualityComparer{}.hash(entity);
        }

        std::size_t operator()(const std::shared_ptr<const Entity>& entity) const {
            return IdEqualityComparer{}.hash(entity.get());
        }
    };

    /**
     * @brief Shared comparer instance for this IdType
     */
    static const IdEqualityComparer& idEqualityComparer() noexcept {
        static const IdEqualityComparer comparer{};
        return comparer;
    }
};

} // namespace ddd::domain
