#pragma once

#include "util/memory.hpp"

#include <stdint.h>

namespace x64 {
    constexpr void setmask(uint64_t& value, uint64_t mask, bool state) noexcept {
        if (state) {
            value |= mask;
        } else {
            value &= ~mask;
        }
    }

    constexpr uintptr_t kPageSize = sm::kilobytes(4).bytes();
    constexpr uintptr_t kLargePageSize = sm::megabytes(2).bytes();

    namespace paging {
        constexpr uint64_t kMaxPhysicalAddress = 48;
        constexpr uint64_t kPresentBit   = 1ull << 0;
        constexpr uint64_t kWriteableBit = 1ull << 1;

        constexpr uintptr_t addressMask(uintptr_t width) {
            return ((1ull << width) - 1) & ~(kPageSize - 1);
        }

        static_assert(addressMask(40) == 0x0000'00ff'ffff'f000ull);
        static_assert(addressMask(48) == 0x0000'ffff'ffff'f000ull);
    }

    struct Entry {
        uint64_t underlying;

        constexpr bool present() const noexcept { return underlying & paging::kPresentBit; }
        constexpr void setPresent(bool present) noexcept { setmask(underlying, paging::kPresentBit, present); }

        constexpr bool writeable() const noexcept { return underlying & paging::kWriteableBit; }
        constexpr void setWriteable(bool writeable) noexcept { setmask(underlying, paging::kWriteableBit, writeable); }

        constexpr uintptr_t address() const noexcept { return underlying & paging::addressMask(paging::kMaxPhysicalAddress); }
        constexpr void setAddress(uintptr_t address) noexcept {
            constexpr uintptr_t kMask = paging::addressMask(paging::kMaxPhysicalAddress);
            underlying = (underlying & ~kMask) | (address & kMask);
        }
    };

    /// @brief Page directory entry
    struct pdte : Entry {
        static constexpr uint64_t kLargePage = 1ull << 7;

        constexpr bool is2m() const noexcept { return underlying & kLargePage; }
        constexpr void set2m(bool large) noexcept { setmask(underlying, kLargePage, large); }
    };

    /// @brief Page directory pointer table entry
    struct pdpte : Entry { };

    /// @brief Page map level 4 entry
    struct pml4e : Entry { };

    static constexpr size_t kEntryCount = kPageSize / sizeof(Entry);

    struct alignas(kPageSize) PageMapLevel3 {
        pdpte entries[kEntryCount];
    };

    struct alignas(kPageSize) PageMapLevel4 {
        pml4e entries[kEntryCount];
    };

    static_assert(sizeof(PageMapLevel3) == kPageSize);
    static_assert(sizeof(PageMapLevel4) == kPageSize);
}
