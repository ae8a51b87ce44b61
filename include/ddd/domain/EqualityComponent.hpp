/**
 * @file EqualityComponent.hpp
 * @brief Type-erased member of a value object's equality sequence
 */

#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <type_traits>
#include <utility>

namespace ddd::domain {

/**
 * @brief One semantic value that takes part in structural equality
 *
 * Holds any copyable value that supports operator== and either a
 * getHashCode() member (value objects, Unit) or std::hash. Components holding
 * different C++ types never compare equal, even when the underlying values
 * would convert. Use std::optional<T> for a component that may be absent; two
 * absent components of the same type are equal.
 *
 * Character arrays are stored as std::string. Character pointers are stored
 * as std::optional<std::string>, a null pointer being the absent value.
 */
class EqualityComponent {
private:
    template<typename T, typename = void>
    struct HasHashCode : std::false_type {};

    template<typename T>
    struct HasHashCode<T, std::void_t<decltype(std::declval<const T&>().getHashCode())>>
        : std::true_type {};

    template<typename T>
    static constexpr bool isCharArray =
        std::is_array_v<std::remove_reference_t<T>> && std::is_convertible_v<T, const char*>;

    template<typename T>
    using StoredType = std::conditional_t<
        isCharArray<T>, std::string,
        std::conditional_t<std::is_convertible_v<T, const char*>,
                           std::optional<std::string>, std::decay_t<T>>>;

    template<typename Stored, typename T>
    static Stored store(T&& value) {
        if constexpr (!isCharArray<T> && std::is_convertible_v<T, const char*>) {
            const char* text = value;
            return text ? Stored(std::string(text)) : Stored(std::nullopt);
        } else {
            return Stored(std::forward<T>(value));
        }
    }

    struct Concept {
        virtual ~Concept() = default;
        virtual std::type_index type() const noexcept = 0;
        virtual bool equals(const Concept& other) const = 0;
        virtual std::size_t hash() const = 0;
    };

    template<typename T>
    struct Model final : Concept {
        T value;

        explicit Model(T v) : value(std::move(v)) {}

        std::type_index type() const noexcept override {
            return typeid(T);
        }

        bool equals(const Concept& other) const override {
            return other.type() == type() &&
                   value == static_cast<const Model<T>&>(other).value;
        }

        std::size_t hash() const override {
            if constexpr (HasHashCode<T>::value) {
                return value.getHashCode();
            } else {
                return std::hash<T>{}(value);
            }
        }
    };

    std::shared_ptr<const Concept> self_;

public:
    /**
     * @brief Wrap a value
     */
    template<typename T,
             typename Stored = StoredType<T>,
             typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, EqualityComponent>>>
    EqualityComponent(T&& value)
        : self_(std::make_shared<Model<Stored>>(store<Stored>(std::forward<T>(value)))) {}

    /**
     * @brief Type of the wrapped value
     */
    [[nodiscard]] std::type_index getType() const noexcept {
        return self_->type();
    }

    /**
     * @brief Hash of the wrapped value
     */
    [[nodiscard]] std::size_t getHashCode() const {
        return self_->hash();
    }

    bool operator==(const EqualityComponent& other) const {
        return self_ == other.self_ || self_->equals(*other.self_);
    }

    bool operator!=(const EqualityComponent& other) const {
        return !(*this == other);
    }
};

} // namespace ddd::domain
