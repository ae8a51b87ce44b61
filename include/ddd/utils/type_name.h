/**
 * @file type_name.h
 * @brief Human-readable C++ type names for diagnostics
 */

#pragma once

#include <string>
#include <typeindex>
#include <typeinfo>

namespace ddd {
namespace utils {

/**
 * @brief Demangle a compiler type name
 *
 * @param mangledName Name as returned by std::type_info::name()
 * @return Demangled name, or the input unchanged if it cannot be demangled
 */
std::string demangle(const char* mangledName);

/**
 * @brief Readable name of a runtime type
 */
inline std::string typeName(std::type_index type) {
    return demangle(type.name());
}

/**
 * @brief Readable name of a static type, e.g. "app::OrderStatus"
 */
template<typename T>
std::string typeName() {
    return demangle(typeid(T).name());
}

} // namespace utils
} // namespace ddd
