/**
 * @file Unit.hpp
 * @brief Unit type - represents "no meaningful value"
 */

#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>

namespace ddd::domain {

/**
 * @brief Zero-information marker with a single canonical value
 *
 * Used instead of void wherever a function must still produce a typed result,
 * e.g. as the success type of a result channel or as the value of a future.
 */
struct Unit {
    /**
     * @brief The canonical Unit value
     */
    static const Unit value;

    /**
     * @brief Every Unit is equal to every other Unit
     */
    constexpr bool equals(const Unit&) const noexcept {
        return true;
    }

    /**
     * @brief Nothing but a Unit equals a Unit
     */
    template<typename Other>
    constexpr bool equals(const Other&) const noexcept {
        return std::is_same_v<std::decay_t<Other>, Unit>;
    }

    [[nodiscard]] constexpr std::size_t getHashCode() const noexcept {
        return 0;
    }

    [[nodiscard]] std::string toString() const {
        return "()";
    }
};

inline const Unit Unit::value{};

constexpr bool operator==(const Unit&, const Unit&) noexcept {
    return true;
}

constexpr bool operator!=(const Unit&, const Unit&) noexcept {
    return false;
}

inline std::ostream& operator<<(std::ostream& os, const Unit& unit) {
    return os << unit.toString();
}

/**
 * @brief Wrap a side-effecting action so that it returns Unit
 *
 * Usage:
 *   std::function<Unit()> step = asUnitFunc([&] { repository.flush(); });
 */
template<typename Action>
auto asUnitFunc(Action action) {
    return [action = std::move(action)]() mutable -> Unit {
        action();
        return Unit::value;
    };
}

/**
 * @brief Wrap a side-effecting single-argument action so that it returns Unit
 *
 * @tparam TArg Argument type of the resulting callable
 */
template<typename TArg, typename Action>
std::function<Unit(TArg)> asUnitFunc(Action action) {
    return [action = std::move(action)](TArg arg) mutable -> Unit {
        action(std::forward<TArg>(arg));
        return Unit::value;
    };
}

/**
 * @brief Project the completion of an asynchronous operation to a Unit result
 *
 * A worker waits for the source, so the returned future becomes ready as soon
 * as the source completes. An exception stored in the source future is
 * rethrown from the returned one.
 */
inline std::future<Unit> asUnitFuture(std::future<void> completion) {
    return std::async(std::launch::async,
                      [completion = std::move(completion)]() mutable -> Unit {
                          completion.get();
                          return Unit::value;
                      });
}

} // namespace ddd::domain

namespace std {
    template<>
    struct hash<ddd::domain::Unit> {
        size_t operator()(const ddd::domain::Unit& unit) const noexcept {
            return unit.getHashCode();
        }
    };
}
