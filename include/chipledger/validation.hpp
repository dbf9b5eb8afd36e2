#pragma once

#include <cmath>
#include <string>
#include "errors.hpp"

namespace chipledger {
namespace validation {

/**
 * Require that a string is not empty.
 */
inline void require_not_empty(const std::string& value, const std::string& field_name = "value") {
    if (value.empty()) {
        throw InvalidRecordError(field_name + " must not be empty");
    }
}

/**
 * Require that a monetary amount is a finite number.
 */
inline void require_finite(double value, const std::string& field_name = "value") {
    if (!std::isfinite(value)) {
        throw InvalidRecordError(field_name + " must be a finite number");
    }
}

/**
 * Require that a value is non-negative (zero or greater).
 */
template<typename T>
void require_non_negative(T value, const std::string& field_name = "value") {
    if (value < 0) {
        throw InvalidRecordError(field_name + " must be non-negative");
    }
}

} // namespace validation
} // namespace chipledger
