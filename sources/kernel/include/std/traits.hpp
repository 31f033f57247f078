#pragma once

#include <concepts>
#include <iterator>
#include <type_traits>

#include <stdint.h>
#include <stddef.h>
#include <limits.h>

namespace stdx {
    template<std::integral T>
    using Signed = std::make_signed_t<T>;

    template<std::integral T>
    using Unsigned = std::make_unsigned_t<T>;

    template<std::integral T>
    consteval bool isSigned(void) {
        return std::is_signed_v<T>;
    }

    template<std::integral T>
    struct NumericTraits {
        static constexpr T kMin = isSigned<T>() ? T(T(1) << (sizeof(T) * CHAR_BIT - 1)) : 0;
        static constexpr T kMax = isSigned<T>() ? T(~kMin) : T(~T(0));
        static constexpr int kMaxDigits2 = sizeof(T) * CHAR_BIT;
        static constexpr int kMaxDigits10 = sizeof(T) * 3;
        static constexpr int kMaxDigits16 = sizeof(T) * 2;
    };

    template<typename T, typename C>
    concept IsRange = requires(const C& range) {
        { std::begin(range) } -> std::convertible_to<T*>;
        { std::end(range) } -> std::convertible_to<T*>;
    };

    namespace detail {
        template<size_t N>
        using ArraySize = std::conditional_t<(N <= UINT8_MAX), uint8_t,
            std::conditional_t<(N <= UINT16_MAX), uint16_t,
            std::conditional_t<(N <= UINT32_MAX), uint32_t, uint64_t>>>;
    }
}
