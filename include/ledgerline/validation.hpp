#pragma once

#include <initializer_list>
#include <string>
#include <vector>
#include "errors.hpp"

namespace ledgerline {
namespace validation {

/**
 * Require that a value is positive (greater than zero).
 */
template<typename T>
void require_positive(T value, const std::string& field_name = "value") {
    if (value <= 0) {
        throw ValidationError(field_name + " must be positive");
    }
}

/**
 * Require that a value is non-negative (zero or greater).
 */
template<typename T>
void require_non_negative(T value, const std::string& field_name = "value") {
    if (value < 0) {
        throw ValidationError(field_name + " must be non-negative");
    }
}

/**
 * Require that a string is not empty.
 */
inline void require_not_empty(const std::string& value, const std::string& field_name = "value") {
    if (value.empty()) {
        throw ValidationError(field_name + " must not be empty");
    }
}

/**
 * Require that a collection is not empty.
 */
template<typename T>
void require_not_empty(const std::vector<T>& collection, const std::string& field_name = "collection") {
    if (collection.empty()) {
        throw ValidationError(field_name + " must not be empty");
    }
}

/**
 * Require that a stage/status matches an expected value.
 */
template<typename T>
void require_status(T actual, T expected, const std::string& message) {
    if (actual != expected) {
        throw InvalidStateTransitionError(message);
    }
}

/**
 * Require that a stage/status is one of the allowed values.
 */
template<typename T>
void require_status_in(T actual, std::initializer_list<T> allowed, const std::string& message) {
    for (const auto& candidate : allowed) {
        if (actual == candidate) return;
    }
    throw InvalidStateTransitionError(message);
}

} // namespace validation
} // namespace ledgerline
