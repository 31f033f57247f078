#pragma once

#include <cosmos/status.h>

#include "memory/range.hpp"

#include <cstddef>
#include <span>
#include <type_traits>

namespace cm {
    /// @brief Access to a window of physical memory.
    ///
    /// The only place physical addresses become host pointers. The host address of a physical
    /// address is the physical address plus the slide. Both boot phases run identity mapped
    /// and use a slide of 0, tests back the window with a host buffer.
    ///
    /// Every access is checked against the window and the alignment of the accessed type.
    /// - OsStatusInvalidSpan is returned when any part of the access falls outside the window.
    /// - OsStatusInvalidAddress is returned when the address is misaligned for the type.
    class PhysicalMemory {
        MemoryRange mWindow;
        uintptr_t mSlide;

        OsStatus resolve(PhysicalAddress address, size_t size, size_t align, std::byte **result) const;

    public:
        constexpr PhysicalMemory()
            : mWindow()
            , mSlide(0)
        { }

        constexpr PhysicalMemory(MemoryRange window, uintptr_t slide)
            : mWindow(window)
            , mSlide(slide)
        { }

        /// @brief A window where physical addresses are host addresses.
        static constexpr PhysicalMemory identity(MemoryRange window) {
            return PhysicalMemory(window, 0);
        }

        constexpr MemoryRange window() const { return mWindow; }

        /// @brief The same memory with the window narrowed to @p range.
        constexpr PhysicalMemory subwindow(MemoryRange range) const {
            return PhysicalMemory(intersection(mWindow, range), mSlide);
        }

        constexpr bool covers(MemoryRange range) const {
            return range.isValid() && mWindow.contains(range);
        }

        OsStatus read(PhysicalAddress address, std::span<std::byte> dst) const;
        OsStatus write(PhysicalAddress address, std::span<const std::byte> src) const;

        OsStatus fill(MemoryRange range, uint8_t value) const;
        OsStatus zero(MemoryRange range) const;

        /// @brief Test if the memory at @p address holds exactly @p expected.
        OsStatus compare(PhysicalAddress address, std::span<const std::byte> expected, bool *equal [[gnu::nonnull]]) const;

        /// @brief Get a host pointer to the start of @p range.
        ///
        /// Used to hand whole ranges to allocators that manage host memory.
        OsStatus map(MemoryRange range, void **result [[gnu::nonnull]]) const;

        template<typename T> requires (std::is_trivially_copyable_v<T>)
        OsStatus load(PhysicalAddress address, T *result [[gnu::nonnull]]) const {
            std::byte *ptr = nullptr;
            if (OsStatus status = resolve(address, sizeof(T), alignof(T), &ptr)) {
                return status;
            }

            __builtin_memcpy(result, ptr, sizeof(T));
            return OsStatusSuccess;
        }

        template<typename T> requires (std::is_trivially_copyable_v<T>)
        OsStatus store(PhysicalAddress address, const T& value) const {
            std::byte *ptr = nullptr;
            if (OsStatus status = resolve(address, sizeof(T), alignof(T), &ptr)) {
                return status;
            }

            __builtin_memcpy(ptr, &value, sizeof(T));
            return OsStatusSuccess;
        }
    };
}
