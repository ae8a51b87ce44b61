/**
 * @file hash_utils.h
 * @brief Hash combination for multi-part keys
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace ddd {
namespace utils {

/**
 * @brief Mix value into seed (order-sensitive)
 */
inline void hashCombine(std::size_t& seed, std::size_t value) noexcept {
    seed ^= value + static_cast<std::size_t>(0x9e3779b97f4a7c15ULL) + (seed << 6) + (seed >> 2);
}

} // namespace utils
} // namespace ddd
