#pragma once

#include <concepts>
#include <cstddef>
#include <utility> // IWYU pragma: keep - std::to_underlying

namespace sm {
    template<std::integral T>
    constexpr T roundup(T value, T multiple) {
        return (value + multiple - 1) / multiple * multiple;
    }

    template<std::integral T>
    constexpr T rounddown(T value, T multiple) {
        return value / multiple * multiple;
    }

    constexpr bool isPowerOf2(std::integral auto value) {
        return value && !(value & (value - 1));
    }

    /// @brief Add two values, reporting overflow instead of wrapping.
    ///
    /// @return True if the addition overflowed, @p result is unspecified in that case.
    template<std::integral T>
    [[nodiscard]]
    constexpr bool addOverflow(T lhs, T rhs, T *result) {
        return __builtin_add_overflow(lhs, rhs, result);
    }

    template<std::integral T>
    [[nodiscard]]
    constexpr bool subOverflow(T lhs, T rhs, T *result) {
        return __builtin_sub_overflow(lhs, rhs, result);
    }

    template<std::integral T>
    [[nodiscard]]
    constexpr bool mulOverflow(T lhs, T rhs, T *result) {
        return __builtin_mul_overflow(lhs, rhs, result);
    }
}

#define UTIL_NOCOPY(it) \
    it(const it&) = delete; \
    it& operator=(const it&) = delete;

#define UTIL_NOMOVE(it) \
    it(it&&) = delete; \
    it& operator=(it&&) = delete;
