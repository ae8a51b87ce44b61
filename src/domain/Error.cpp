/**
 * @file Error.cpp
 */

#include "ddd/domain/Error.hpp"

namespace ddd::domain {

std::vector<EqualityComponent> Error::getEqualityComponents() const {
    return {code_};
}

std::string Error::toString() const {
    return code_.value_or("") + ": " + message_;
}

} // namespace ddd::domain
