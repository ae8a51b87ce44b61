/**
 * @file type_name.cpp
 * @brief Type name demangling via the Itanium C++ ABI
 */

#include "ddd/utils/type_name.h"

#include <cstdlib>
#include <memory>

#if defined(__GNUG__)
#include <cxxabi.h>
#endif

namespace ddd {
namespace utils {

std::string demangle(const char* mangledName) {
    if (!mangledName) {
        return "";
    }

#if defined(__GNUG__)
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> demangled(
        abi::__cxa_demangle(mangledName, nullptr, nullptr, &status), std::free);
    if (status == 0 && demangled) {
        return std::string(demangled.get());
    }
#endif

    // MSVC names are already readable
    return std::string(mangledName);
}

} // namespace utils
} // namespace ddd
