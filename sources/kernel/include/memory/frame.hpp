#pragma once

#include "memory/range.hpp"

#include <iterator>

namespace cm {
    static constexpr size_t kFrameSize = 0x1000;

    /// @brief A 4KiB aligned block of physical memory, identified by its frame number.
    class PhysicalFrame {
        uint64_t mNumber;

        constexpr explicit PhysicalFrame(uint64_t number)
            : mNumber(number)
        { }

    public:
        constexpr PhysicalFrame()
            : mNumber(0)
        { }

        static constexpr PhysicalFrame containing(PhysicalAddress address) {
            return PhysicalFrame(address.address / kFrameSize);
        }

        static constexpr PhysicalFrame fromNumber(uint64_t number) {
            return PhysicalFrame(number);
        }

        /// @pre @p address is frame aligned.
        static constexpr PhysicalFrame fromAddress(PhysicalAddress address) {
            CM_ASSERT(address.isAlignedTo(kFrameSize));
            return PhysicalFrame(address.address / kFrameSize);
        }

        constexpr uint64_t number() const { return mNumber; }
        constexpr PhysicalAddress address() const { return mNumber * kFrameSize; }
        constexpr MemoryRange memory() const { return MemoryRange::of(address(), kFrameSize); }

        constexpr auto operator<=>(const PhysicalFrame&) const = default;

        constexpr PhysicalFrame operator+(uint64_t count) const {
            return PhysicalFrame(mNumber + count);
        }

        constexpr PhysicalFrame operator-(uint64_t count) const {
            return PhysicalFrame(mNumber - count);
        }

        constexpr uint64_t operator-(PhysicalFrame other) const {
            return mNumber - other.mNumber;
        }

        constexpr PhysicalFrame& operator++() {
            mNumber += 1;
            return *this;
        }
    };

    /// @brief A half open range of frames.
    ///
    /// Iterating produces each frame in ascending order, the range is never consumed.
    class PhysicalFrameRange {
        PhysicalFrame mStart;
        PhysicalFrame mEnd;

    public:
        class Iterator {
            PhysicalFrame mCurrent;

        public:
            using value_type = PhysicalFrame;
            using difference_type = std::ptrdiff_t;

            constexpr Iterator() = default;

            constexpr Iterator(PhysicalFrame current)
                : mCurrent(current)
            { }

            constexpr PhysicalFrame operator*() const { return mCurrent; }

            constexpr Iterator& operator++() {
                ++mCurrent;
                return *this;
            }

            constexpr Iterator operator++(int) {
                Iterator copy = *this;
                ++mCurrent;
                return copy;
            }

            constexpr bool operator==(const Iterator&) const = default;
        };

        constexpr PhysicalFrameRange() = default;

        constexpr PhysicalFrameRange(PhysicalFrame start, PhysicalFrame end)
            : mStart(start)
            , mEnd(end)
        { }

        /// @brief The frames wholly inside @p range.
        static constexpr PhysicalFrameRange of(MemoryRange range) {
            MemoryRange inner = aligned(range, kFrameSize);
            if (inner.isEmpty()) {
                return PhysicalFrameRange{};
            }

            return PhysicalFrameRange(PhysicalFrame::fromAddress(inner.front), PhysicalFrame::fromAddress(inner.back));
        }

        /// @brief The first frame in the range.
        constexpr PhysicalFrame front() const { return mStart; }

        /// @brief The first frame after the range.
        constexpr PhysicalFrame back() const { return mEnd; }

        constexpr bool isEmpty() const { return mStart >= mEnd; }
        constexpr uint64_t count() const { return isEmpty() ? 0 : mEnd - mStart; }

        constexpr bool contains(PhysicalFrame frame) const {
            return frame >= mStart && frame < mEnd;
        }

        constexpr MemoryRange memory() const {
            return isEmpty() ? MemoryRange{} : MemoryRange { mStart.address(), mEnd.address() };
        }

        /// @brief A copy of this range with frames before @p frame removed.
        constexpr PhysicalFrameRange startingAt(PhysicalFrame frame) const {
            return PhysicalFrameRange(std::max(mStart, frame), mEnd);
        }

        constexpr Iterator begin() const { return Iterator(mStart); }
        constexpr Iterator end() const { return Iterator(isEmpty() ? mStart : mEnd); }

        constexpr bool operator==(const PhysicalFrameRange&) const = default;
    };
}

template<>
struct cm::Format<cm::PhysicalFrame> {
    static void format(cm::IOutStream& out, cm::PhysicalFrame value) {
        out.format("#", value.number(), " (", value.address(), ")");
    }
};

template<>
struct cm::Format<cm::PhysicalFrameRange> {
    static void format(cm::IOutStream& out, cm::PhysicalFrameRange value) {
        out.format(value.memory(), " (", value.count(), " frames)");
    }
};
