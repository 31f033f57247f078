#pragma once

#include <cosmos/status.h>

#include "arch/paging.hpp"
#include "handoff/handoff.hpp"
#include "memory/physical_memory.hpp"

#include "std/spinlock.hpp"

#include <algorithm>

namespace cm {
    /// @brief The smallest identity map the bootloader builds.
    static constexpr uint64_t kMinIdentityMap = sm::megabytes(128).bytes();

    /// @brief The largest identity map, enough for everything below 4GiB.
    static constexpr uint64_t kMaxIdentityMap = sm::gigabytes(4).bytes();

    /// @brief Where the identity map tables live.
    struct PageTableLayout {
        PhysicalAddress pml4;
        PhysicalAddress pdpt;
        PhysicalAddress pdBase;
        uint32_t maxDirectories;

        constexpr PhysicalAddress directory(size_t index) const {
            return pdBase + (index * x64::kPageSize);
        }

        constexpr MemoryRange range() const {
            return MemoryRange { pml4, directory(maxDirectories) };
        }

        /// @brief The most memory the tables can identity map.
        constexpr uint64_t capacity() const {
            return uint64_t(maxDirectories) * x64::kEntryCount * x64::kLargePageSize;
        }

        static constexpr PageTableLayout of(const HandoffLayout& layout) {
            return PageTableLayout {
                .pml4 = layout.pml4,
                .pdpt = layout.pdpt,
                .pdBase = layout.pdBase,
                .maxDirectories = layout.maxDirectories,
            };
        }
    };

    /// @brief How much memory to identity map for @p totalMemory bytes of RAM.
    ///
    /// Rounded down to whole 2MiB pages, no less than 128MiB and no more than 4GiB.
    constexpr uint64_t ComputeIdentityMapSize(uint64_t totalMemory) {
        uint64_t size = sm::rounddown<uint64_t>(totalMemory, x64::kLargePageSize);
        return std::clamp(size, kMinIdentityMap, kMaxIdentityMap);
    }

    /// @brief Builds the identity map the kernel starts on.
    ///
    /// Maps physical memory from 0 with 2MiB pages, present and writable. A single PDPT
    /// is used, the first PML4 entry points to it, and each PDPT entry points at the next
    /// page directory in the layout.
    class PageTableBuilder {
        const PhysicalMemory& mMemory;
        PageTableLayout mLayout;

    public:
        PageTableBuilder(const PhysicalMemory& memory, PageTableLayout layout);

        /// @brief Zero the tables and identity map enough memory for @p totalMemory.
        ///
        /// @return The number of bytes that are mapped.
        uint64_t build(uint64_t totalMemory);
    };

    /// @brief Count how much memory the existing identity map covers.
    ///
    /// Stops at the first absent entry at each level.
    OsStatus CountMappedBytes(const PhysicalMemory& memory, const PageTableLayout& layout, uint64_t *bytes [[gnu::nonnull]]);

    /// @brief The identity map shared by the boot and kernel phases.
    ///
    /// Initialized once, either by building the tables or by adopting the tables
    /// the bootloader left behind.
    class PageTables {
        stdx::SpinLock mLock;
        PageTableLayout mLayout GUARDED_BY(mLock) {};
        uint64_t mMappedBytes GUARDED_BY(mLock) = 0;
        bool mInitialized GUARDED_BY(mLock) = false;

    public:
        constexpr PageTables() = default;

        UTIL_NOCOPY(PageTables);
        UTIL_NOMOVE(PageTables);

        /// @retval OsStatusAlreadyInitialized The tables were already built or adopted.
        OsStatus build(const PhysicalMemory& memory, PageTableLayout layout, uint64_t totalMemory);

        /// @retval OsStatusAlreadyInitialized The tables were already built or adopted.
        OsStatus adopt(const PhysicalMemory& memory, PageTableLayout layout);

        bool isInitialized();

        PhysicalAddress root();
        uint64_t mappedBytes();
    };
}
