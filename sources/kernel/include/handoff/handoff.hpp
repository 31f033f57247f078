#pragma once

#include "arch/paging.hpp"
#include "memory/range.hpp"
#include "util/memory.hpp"

#include <stdint.h>

namespace cm {
    /// @brief A memory map entry in the legacy E820 format.
    ///
    /// Written by the bootloader and read by the kernel, this layout is shared with
    /// anything else that produces a hand-off record.
    struct [[gnu::packed]] E820Entry {
        uint64_t base;
        uint64_t length;
        uint32_t type;
        uint32_t attribute;
    };

    static_assert(sizeof(E820Entry) == 24);

    namespace e820 {
        static constexpr uint32_t kUsable = 1;
        static constexpr uint32_t kReserved = 2;
        static constexpr uint32_t kAcpiReclaimable = 3;
        static constexpr uint32_t kAcpiNvs = 4;
        static constexpr uint32_t kBad = 5;

        /// @brief The attribute value marking an entry as enabled.
        static constexpr uint32_t kEnabled = 1;
    }

    /// @brief The layout version this build of the kernel understands.
    static constexpr uint32_t kHandoffVersion = 1;

    /// @brief Where the bootloader leaves each piece of state for the kernel.
    ///
    /// Both phases agree on this layout at compile time. The kernel refuses to set up
    /// memory from a layout whose version is not @a kHandoffVersion.
    struct HandoffLayout {
        uint32_t version;

        /// @brief A 32 bit entry count followed by up to @a maxMapEntries packed @a E820Entry records.
        PhysicalAddress memoryMap;
        uint32_t maxMapEntries;

        /// @brief The root of the identity map.
        PhysicalAddress pml4;

        /// @brief The single page directory pointer table, covering the first 512GiB.
        PhysicalAddress pdpt;

        /// @brief The first of the page directories, each following page holds the next.
        PhysicalAddress pdBase;
        uint32_t maxDirectories;

        PhysicalAddress kernelBase;
        size_t kernelMaxSize;

        PhysicalAddress stackTop;
        size_t stackSize;

        PhysicalAddress heapStart;

        constexpr MemoryRange memoryMapRange() const {
            return MemoryRange::of(memoryMap, sizeof(uint32_t) + (maxMapEntries * sizeof(E820Entry)));
        }

        constexpr MemoryRange pageTableRange() const {
            return MemoryRange { pml4, pdBase + (maxDirectories * x64::kPageSize) };
        }

        constexpr MemoryRange kernelRange() const {
            return MemoryRange::of(kernelBase, kernelMaxSize);
        }

        constexpr MemoryRange stackRange() const {
            return MemoryRange { stackTop - stackSize, stackTop };
        }

        /// @brief Check the layout describes non overlapping, suitably aligned areas.
        constexpr bool isValid() const {
            if (!pml4.isAlignedTo(x64::kPageSize) || !pdpt.isAlignedTo(x64::kPageSize) || !pdBase.isAlignedTo(x64::kPageSize)) {
                return false;
            }

            if (pdpt != pml4 + x64::kPageSize || pdBase != pdpt + x64::kPageSize) {
                return false;
            }

            if (maxMapEntries == 0 || maxDirectories == 0) {
                return false;
            }

            return !memoryMapRange().intersects(pageTableRange())
                && !kernelRange().intersects(pageTableRange())
                && !memoryMapRange().intersects(kernelRange())
                && kernelRange().back <= heapStart;
        }
    };

    static constexpr HandoffLayout kHandoffLayout = {
        .version = kHandoffVersion,
        .memoryMap = 0x9000,
        .maxMapEntries = 64,
        .pml4 = 0x70000,
        .pdpt = 0x71000,
        .pdBase = 0x72000,
        .maxDirectories = 4,
        .kernelBase = 0x200000,
        .kernelMaxSize = sm::megabytes(2).bytes(),
        .stackTop = 0xA0000,
        .stackSize = sm::kilobytes(64).bytes(),
        .heapStart = 0x400000,
    };

    static_assert(kHandoffLayout.isValid());
}
