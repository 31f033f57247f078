#pragma once

#include "std/traits.hpp"

#include "std/string_view.hpp"

#include <algorithm>

namespace stdx {
    template<typename T, size_t N>
    class StaticStringBase {
        using SizeType = detail::ArraySize<N>;

        SizeType mSize;
        T mStorage[N];

        constexpr void init(const T *front, const T *back) {
            mSize = std::min<size_t>(back - front, N);
            std::copy_n(front, mSize, mStorage);
        }

    public:
        constexpr StaticStringBase()
            : mSize(0)
            , mStorage()
        { }

        template<size_t S> requires (S <= N + 1)
        constexpr StaticStringBase(const T (&str)[S])
            : StaticStringBase(str, str + S - 1)
        { }

        template<typename R> requires IsRange<const T, R>
        constexpr StaticStringBase(const R& range)
            : StaticStringBase(std::begin(range), std::end(range))
        { }

        constexpr StaticStringBase(const T *front [[gnu::nonnull]], const T *back [[gnu::nonnull]])
            : mSize(0)
            , mStorage()
        {
            init(front, back);
        }

        constexpr size_t count() const { return mSize; }
        constexpr size_t capacity() const { return N; }

        constexpr bool isEmpty() const { return mSize == 0; }
        constexpr bool isFull() const { return mSize == N; }

        constexpr T *begin() { return mStorage; }
        constexpr T *end() { return mStorage + mSize; }

        constexpr const T *begin() const { return mStorage; }
        constexpr const T *end() const { return mStorage + mSize; }

        constexpr void clear() {
            mSize = 0;
        }

        template<typename R> requires IsRange<const T, R>
        constexpr void add(const R& range) {
            add(std::begin(range), std::end(range));
        }

        constexpr void add(T elem) {
            if (mSize < N) {
                mStorage[mSize++] = elem;
            }
        }

        constexpr void add(const T *front [[gnu::nonnull]], const T *back [[gnu::nonnull]]) {
            size_t size = std::min<size_t>(back - front, N - mSize);
            std::copy_n(front, size, mStorage + mSize);
            mSize += size;
        }

        constexpr const T& operator[](size_t index) const {
            return mStorage[index];
        }

        constexpr operator StringViewBase<T>() const {
            return StringViewBase<T>(begin(), end());
        }

        template<typename R> requires IsRange<const T, R>
        constexpr bool operator==(const R& other) const {
            return std::equal(begin(), end(), std::begin(other), std::end(other));
        }
    };

    template<size_t N>
    using StaticString = StaticStringBase<char, N>;
}
