#pragma once

#include <cosmos/status.h>

#include "allocator/tlsf.hpp"
#include "memory/frame_allocator.hpp"
#include "memory/page_tables.hpp"

#include "std/spinlock.hpp"

namespace cm {
    struct HeapConfig {
        /// @brief Where the heap starts, must be frame aligned.
        PhysicalAddress start;

        /// @brief The heap fails to initialize if it would be smaller than this.
        uint64_t minSize;

        /// @brief The heap never grows past this.
        uint64_t maxSize;
    };

    static constexpr HeapConfig kDefaultHeapConfig = {
        .start = 0x400000,
        .minSize = sm::megabytes(4).bytes(),
        .maxSize = sm::megabytes(256).bytes(),
    };

    /// @brief Pattern freed secure allocations are filled with.
    static constexpr uint8_t kPoisonByte = 0xDE;

    struct HeapStats {
        size_t total;
        size_t used;
        size_t free;
        PhysicalAddress start;
    };

    /// @brief Size the heap to fit below @p mappedBytes.
    ///
    /// @retval OsStatusInvalidConfiguration The mapped memory above the heap start is smaller
    ///         than the minimum heap size, or the config itself is invalid.
    OsStatus ComputeHeapSize(uint64_t mappedBytes, const HeapConfig& config, uint64_t *size [[gnu::nonnull]]);

    /// @brief Test if every byte of a block holds the poison pattern.
    bool IsPoisoned(const void *ptr, size_t size);

    /// @brief The kernel heap, backed by frames claimed from the frame allocator.
    ///
    /// Can only be initialized once. Every operation is safe to call from any thread, and
    /// allocation before initialization fails rather than faulting.
    class KernelHeap {
        HeapConfig mConfig;

        stdx::SpinLock mLock;
        mem::TlsfAllocator mAllocator GUARDED_BY(mLock);
        MemoryRange mRange GUARDED_BY(mLock) {};
        bool mInitialized GUARDED_BY(mLock) = false;

        OsStatus claimFrames(FrameAllocatorContext& frames, MemoryRange range) REQUIRES(mLock);

    public:
        KernelHeap(HeapConfig config = kDefaultHeapConfig)
            : mConfig(config)
        { }

        UTIL_NOCOPY(KernelHeap);
        UTIL_NOMOVE(KernelHeap);

        /// @brief Claim frames for the heap and create the allocator over them.
        ///
        /// The heap is clamped to the usable run of frames that holds its start.
        ///
        /// @param frames Where to claim backing frames from.
        /// @param tables The identity map the heap must fit inside.
        /// @param memory Access to the heap memory.
        /// @param totalUsableMemory How much usable memory the memory map reports.
        ///
        /// @retval OsStatusAlreadyInitialized The heap is already initialized, nothing was changed.
        /// @retval OsStatusInvalidConfiguration The heap does not fit in mapped memory.
        /// @retval OsStatusFrameAllocationFailed The heap start is not usable or the backing frames could not be claimed.
        OsStatus init(FrameAllocatorContext& frames, PageTables& tables, const PhysicalMemory& memory, uint64_t totalUsableMemory);

        bool isInitialized();

        void *allocate(size_t size);
        void *allocateAligned(size_t size, size_t align);
        void deallocate(void *ptr);

        /// @brief Allocate zeroed memory aligned to 8 bytes.
        void *secureAlloc(size_t size);

        /// @brief Poison and release memory from @a secureAlloc.
        ///
        /// @retval OsStatusCorruptionDetected The poison did not stick, the block was not released.
        OsStatus secureDealloc(void *ptr, size_t size);

        /// @brief Walk the heap and report its usage.
        HeapStats stats();
    };
}
