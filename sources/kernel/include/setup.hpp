#pragma once

#include <cosmos/status.h>

#include "handoff/handoff.hpp"
#include "memory/frame_allocator.hpp"
#include "memory/heap.hpp"
#include "memory/memory_map.hpp"
#include "memory/page_tables.hpp"

namespace cm {
    enum class BootMode {
        eUefi,
        eLegacyBios,
    };

    /// @brief Everything the kernel owns after memory setup.
    struct KernelMemory {
        MemoryMap map;
        PageTables tables;
        FrameAllocatorContext frames;
        KernelHeap heap;

        KernelMemory(HeapConfig config = kDefaultHeapConfig)
            : heap(config)
        { }
    };

    /// @brief Bring up kernel memory from the state the bootloader left behind.
    ///
    /// Reads the hand-off memory map, using the fallback map if it is missing or malformed,
    /// adopts the bootloader page tables, and then initializes the frame allocator and heap.
    ///
    /// @param memory Access to physical memory, the frame allocator is restricted to the mapped part.
    /// @param layout Where the bootloader left its state.
    /// @param result The memory state to initialize.
    ///
    /// @retval OsStatusInvalidInput The layout version is not @a kHandoffVersion or the layout is invalid.
    OsStatus SetupKernelMemory(const PhysicalMemory& memory, const HandoffLayout& layout, KernelMemory *result [[gnu::nonnull]]);

    /// @brief Allocate a block from @p heap, write a signature through it, and release it.
    ///
    /// @retval OsStatusOutOfMemory The heap could not provide the block.
    /// @retval OsStatusCorruptionDetected The block was not zeroed or did not hold what was written.
    OsStatus VerifyHeap(KernelHeap& heap);

    /// @brief Read the boot mode from the BIOS data area word at 0x400.
    OsStatus DetectBootMode(const PhysicalMemory& memory, BootMode *mode [[gnu::nonnull]]);

    /// @brief Route global operator new and delete to @p heap.
    void InitGlobalAllocator(KernelHeap *heap);
}

template<>
struct cm::Format<cm::BootMode> {
    static stdx::StringView toString(cm::BootMode mode) {
        switch (mode) {
        case cm::BootMode::eUefi: return "UEFI";
        case cm::BootMode::eLegacyBios: return "Legacy BIOS";
        default: return "Unknown";
        }
    }
};
