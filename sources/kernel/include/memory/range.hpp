#pragma once

#include <algorithm>
#include <bit>
#include <compare> // IWYU pragma: keep
#include <span>

#include <cstdint>

#include "panic.hpp"
#include "util/format.hpp"

#include "common/util/util.hpp"

namespace cm {
    /// @brief A byte address in physical memory.
    ///
    /// Plain arithmetic wraps like the underlying integer, use @a checkedAdd and
    /// @a checkedSub wherever the operands come from firmware or another untrusted source.
    struct PhysicalAddress {
        uintptr_t address;

        constexpr PhysicalAddress() = default;

        constexpr PhysicalAddress(uintptr_t address)
            : address(address)
        { }

        constexpr auto operator<=>(const PhysicalAddress&) const = default;

        constexpr PhysicalAddress operator+(uintptr_t offset) const {
            return PhysicalAddress { address + offset };
        }

        constexpr PhysicalAddress operator-(uintptr_t offset) const {
            return PhysicalAddress { address - offset };
        }

        constexpr uintptr_t operator-(PhysicalAddress other) const {
            return address - other.address;
        }

        constexpr bool isAlignedTo(uintptr_t align) const {
            return address % align == 0;
        }

        constexpr PhysicalAddress alignUp(uintptr_t align) const {
            return sm::roundup(address, align);
        }

        constexpr PhysicalAddress alignDown(uintptr_t align) const {
            return sm::rounddown(address, align);
        }

        /// @return True if the result fit, @p result is unspecified otherwise.
        [[nodiscard]]
        constexpr bool checkedAdd(uintptr_t offset, PhysicalAddress *result) const {
            uintptr_t value;
            if (sm::addOverflow(address, offset, &value)) {
                return false;
            }

            *result = value;
            return true;
        }

        [[nodiscard]]
        constexpr bool checkedSub(uintptr_t offset, PhysicalAddress *result) const {
            uintptr_t value;
            if (sm::subOverflow(address, offset, &value)) {
                return false;
            }

            *result = value;
            return true;
        }
    };

    /// @brief A range of address space.
    ///
    /// Represents a range of [front, back) addresses. The range is inclusive of the front address
    /// and exclusive of the back address.
    ///
    /// The terminology used for dealing with ranges is as follows:
    /// - front: The start of the range, this is the first byte in the range.
    /// - back: The end of the range, this is the first byte after the range.
    /// - size: The number of bytes in the range.
    /// - empty: A range where the front and back are the same.
    /// - contains: A range that is totally contained within another range.
    /// - intersects: A range that shares any area with another range, not including touching.
    /// - adjacent: Two ranges that share no area, but are next to each other.
    ///
    /// @pre @a AnyRange::front <= @a AnyRange::back
    template<typename T>
    struct AnyRange {
        using ValueType = T;

        T front;
        T back;

        constexpr uintptr_t size() const {
            CM_ASSERT(isValid());
            return std::bit_cast<uintptr_t>(back) - std::bit_cast<uintptr_t>(front);
        }

        constexpr bool isEmpty() const {
            return front == back;
        }

        constexpr bool isValid() const {
            return front <= back;
        }

        /// @brief Checks if the given address is within the range.
        constexpr bool contains(ValueType addr) const {
            return addr >= front && addr < back;
        }

        /// @brief Checks if the given range is totally contained within this range.
        constexpr bool contains(AnyRange range) const {
            return range.front >= front && range.back <= back;
        }

        /// @brief Checks if the given range shares any area with this range.
        ///
        /// Ranges that only touch are not considered to intersect.
        constexpr bool intersects(AnyRange range) const {
            return front < range.back && range.front < back;
        }

        constexpr bool operator==(const AnyRange& other) const = default;

        constexpr static AnyRange of(T front, uintptr_t size) {
            T back = std::bit_cast<T>(std::bit_cast<uintptr_t>(front) + size);
            return {front, back};
        }

        template<typename U>
        constexpr AnyRange<U> cast() const {
            return {std::bit_cast<U>(front), std::bit_cast<U>(back)};
        }
    };

    /// @brief Find the intersection of two ranges.
    ///
    /// Finds the intersecting area of two ranges. If one range
    /// is a subset of the other the subset is returned. If there
    /// is no overlap the empty range is returned.
    template<typename T>
    constexpr AnyRange<T> intersection(AnyRange<T> a, AnyRange<T> b) {
        T front = std::max(a.front, b.front);
        T back = std::min(a.back, b.back);

        if (front >= back) {
            return AnyRange<T>{};
        }

        return {front, back};
    }

    /// @brief Tests if the given ranges are adjacent.
    ///
    /// Adjacent ranges have a touching front or back, but do not overlap.
    template<typename T>
    constexpr bool outerAdjacent(AnyRange<T> a, AnyRange<T> b) {
        return a.back == b.front || b.back == a.front;
    }

    /// @brief Aligns the given memory range to the given alignment.
    ///
    /// Aligns the range by shrinking it to the next multiple of the given alignment.
    /// A range too small to hold an aligned block becomes the empty range.
    template<typename T>
    constexpr AnyRange<T> aligned(AnyRange<T> range, size_t align) {
        uintptr_t front = std::bit_cast<uintptr_t>(range.front);
        uintptr_t back = std::bit_cast<uintptr_t>(range.back);

        uintptr_t alignedFront;
        if (sm::addOverflow(front, uintptr_t(align - 1), &alignedFront)) {
            return AnyRange<T>{};
        }

        alignedFront = sm::rounddown(alignedFront, align);
        uintptr_t alignedBack = sm::rounddown(back, align);

        if (alignedFront >= alignedBack) {
            return AnyRange<T>{};
        }

        return {std::bit_cast<T>(alignedFront), std::bit_cast<T>(alignedBack)};
    }

    /// @brief Aligns the given range to the given alignment.
    ///
    /// Aligns the range by expanding its size to the next multiple of the given alignment.
    template<typename T>
    constexpr AnyRange<T> alignedOut(AnyRange<T> range, size_t align) {
        T front = std::bit_cast<T>(sm::rounddown(std::bit_cast<uintptr_t>(range.front), align));
        T back = std::bit_cast<T>(sm::roundup(std::bit_cast<uintptr_t>(range.back), align));

        return {front, back};
    }

    using MemoryRange = AnyRange<PhysicalAddress>;
}

template<>
struct cm::Format<cm::PhysicalAddress> {
    static constexpr size_t kStringSize = cm::kFormatSize<Hex<uintptr_t>>;

    static void format(cm::IOutStream& out, cm::PhysicalAddress value) {
        out.write(Hex(value.address).pad(16, '0'));
    }
};

template<typename T>
struct cm::Format<cm::AnyRange<T>> {
    static constexpr size_t kStringSize = cm::kFormatSize<T> * 2 + 1;

    static void format(cm::IOutStream& out, cm::AnyRange<T> value) {
        out.format(value.front, "-", value.back);
    }
};
