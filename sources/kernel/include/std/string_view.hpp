#pragma once

#include "std/traits.hpp"

#include <algorithm>
#include <compare>
#include <iterator>
#include <string_view>

namespace stdx {
    template<typename T>
    class StringViewBase {
        static constexpr T kEmpty[] = { T() };
        const T *mFront;
        const T *mBack;

    public:
        constexpr StringViewBase()
            : StringViewBase(kEmpty, kEmpty)
        { }

        template<size_t N> requires (N > 0)
        constexpr StringViewBase(const T (&str)[N])
            : StringViewBase(std::begin(str), std::end(str) - 1)
        { }

        template<typename R> requires IsRange<const T, R>
        constexpr StringViewBase(const R& range)
            : StringViewBase(std::begin(range), std::end(range))
        { }

        constexpr StringViewBase(const T *front [[gnu::nonnull]], const T *back [[gnu::nonnull]])
            : mFront(front)
            , mBack(back)
        { }

        static constexpr StringViewBase ofString(const T *str [[gnu::nonnull]]) {
            return StringViewBase(str, str + std::char_traits<T>::length(str));
        }

        constexpr size_t count() const { return mBack - mFront; }
        constexpr size_t sizeInBytes() const { return count() * sizeof(T); }
        constexpr bool isEmpty() const { return mBack == mFront; }

        constexpr const T *begin() const { return mFront; }
        constexpr const T *end() const { return mBack; }
        constexpr const T *data() const { return mFront; }

        constexpr const T& operator[](size_t index) const {
            return mFront[index];
        }

        constexpr bool startsWith(StringViewBase prefix) const {
            return prefix.count() <= count() && std::equal(prefix.begin(), prefix.end(), begin());
        }

        constexpr bool contains(StringViewBase other) const {
            return std::search(begin(), end(), other.begin(), other.end()) != end();
        }

        constexpr operator std::basic_string_view<T>() const {
            return std::basic_string_view<T>(mFront, count());
        }

        friend constexpr bool operator==(StringViewBase lhs, StringViewBase rhs) {
            return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end());
        }

        friend constexpr auto operator<=>(StringViewBase lhs, StringViewBase rhs) {
            return std::lexicographical_compare_three_way(lhs.begin(), lhs.end(), rhs.begin(), rhs.end());
        }
    };

    using StringView = StringViewBase<char>;

    namespace literals {
        constexpr StringView operator""_sv(const char *str, size_t length) {
            return StringView(str, str + length);
        }
    }
}
