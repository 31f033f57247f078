#pragma once

#include "panic.hpp"

#include "std/traits.hpp"

#include <algorithm>
#include <initializer_list>
#include <memory>
#include <span>

namespace stdx {
    /// @brief Fixed capacity vector backed by inline storage.
    ///
    /// Used wherever a list must exist before any allocator does. Element
    /// access is bounds checked, running out of capacity is reported to the caller.
    template<typename T, size_t N>
    class StaticVector {
        T mStorage[N];
        size_t mSize;

    public:
        constexpr StaticVector()
            : mStorage()
            , mSize(0)
        { }

        constexpr StaticVector(std::span<const T> range)
            : StaticVector()
        {
            addRange(range);
        }

        constexpr StaticVector(std::initializer_list<T> list)
            : StaticVector(std::span<const T>(list.begin(), list.size()))
        { }

        constexpr bool operator==(const StaticVector& other) const {
            return std::equal(begin(), end(), other.begin(), other.end());
        }

        constexpr size_t count() const { return mSize; }
        constexpr size_t capacity() const { return N; }
        constexpr bool isEmpty() const { return mSize == 0; }
        constexpr bool isFull() const { return mSize == N; }

        constexpr T *begin() { return mStorage; }
        constexpr T *end() { return mStorage + mSize; }

        constexpr const T *begin() const { return mStorage; }
        constexpr const T *end() const { return mStorage + mSize; }

        constexpr T *data() { return mStorage; }
        constexpr const T *data() const { return mStorage; }

        constexpr std::span<T> span() { return std::span(mStorage, mSize); }
        constexpr std::span<const T> span() const { return std::span(mStorage, mSize); }

        constexpr void clear() {
            mSize = 0;
        }

        [[nodiscard]]
        constexpr bool add(T value) {
            if (isFull()) return false;

            mStorage[mSize++] = value;
            return true;
        }

        /// @return The number of elements added, may be less than the range size.
        constexpr size_t addRange(std::span<const T> range) {
            size_t count = std::min(range.size(), N - mSize);
            std::copy_n(range.begin(), count, mStorage + mSize);
            mSize += count;
            return count;
        }

        constexpr void remove(size_t index) {
            if (index < mSize) {
                std::move(mStorage + index + 1, mStorage + mSize, mStorage + index);
                mSize -= 1;
            }
        }

        constexpr void removeIf(const T& value) {
            T *it = std::remove(begin(), end(), value);
            mSize = it - begin();
        }

        constexpr T& back() {
            CM_ASSERT(!isEmpty());
            return mStorage[mSize - 1];
        }

        constexpr const T& back() const {
            CM_ASSERT(!isEmpty());
            return mStorage[mSize - 1];
        }

        constexpr T& operator[](size_t index) {
            CM_ASSERT(index < mSize);
            return mStorage[index];
        }

        constexpr const T& operator[](size_t index) const {
            CM_ASSERT(index < mSize);
            return mStorage[index];
        }
    };
}
