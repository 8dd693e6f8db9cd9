#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>

#include "hyperslab/common.hpp"

namespace hyperslab {

// Exact integer arithmetic. The *_overflow functions store the wrapped
// result and return true when the infinite precision result does not fit
// in T; the checked_* functions throw ArithmeticOverflow instead.

template <typename T>
inline bool add_overflow(T a, T b, T* result) {
    static_assert(std::is_integral<T>::value, "integral type required");
    return __builtin_add_overflow(a, b, result);
}

template <typename T>
inline bool sub_overflow(T a, T b, T* result) {
    static_assert(std::is_integral<T>::value, "integral type required");
    return __builtin_sub_overflow(a, b, result);
}

template <typename T>
inline bool mul_overflow(T a, T b, T* result) {
    static_assert(std::is_integral<T>::value, "integral type required");
    return __builtin_mul_overflow(a, b, result);
}

template <typename T>
inline T checked_add(T a, T b) {
    T r;
    if (add_overflow(a, b, &r)) {
        throw ArithmeticOverflow(
            "integer overflow: " + std::to_string(a) + " + " +
            std::to_string(b));
    }
    return r;
}

template <typename T>
inline T checked_mul(T a, T b) {
    T r;
    if (mul_overflow(a, b, &r)) {
        throw ArithmeticOverflow(
            "integer overflow: " + std::to_string(a) + " * " +
            std::to_string(b));
    }
    return r;
}

template <typename To, typename From>
inline To checked_cast(From v) {
    static_assert(std::is_integral<To>::value && std::is_integral<From>::value,
                  "integral types required");
    To r;
    // __builtin_add_overflow with a zero addend checks representability
    // across signedness and width in one step.
    if (__builtin_add_overflow(v, From(0), &r)) {
        throw ArithmeticOverflow(
            "value " + std::to_string(v) + " out of range for " +
            std::to_string(sizeof(To) * 8) + "-bit integer");
    }
    return r;
}

// ceil(a / b) for a >= 0, b > 0.
template <typename T>
constexpr T ceil_div(T a, T b) {
    return a / b + (a % b != 0 ? 1 : 0);
}

}  // namespace hyperslab
