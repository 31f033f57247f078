#include "memory/heap.hpp"

#include "logger/categories.hpp"

#include <algorithm>

#include <string.h>

static constexpr size_t kSecureAlign = 8;

OsStatus cm::ComputeHeapSize(uint64_t mappedBytes, const HeapConfig& config, uint64_t *size [[gnu::nonnull]]) {
    if (!config.start.isAlignedTo(kFrameSize) || config.minSize > config.maxSize) {
        return OsStatusInvalidConfiguration;
    }

    uint64_t available = (mappedBytes > config.start.address) ? mappedBytes - config.start.address : 0;
    if (available < config.minSize) {
        return OsStatusInvalidConfiguration;
    }

    *size = sm::rounddown<uint64_t>(std::min(available, config.maxSize), kFrameSize);
    return OsStatusSuccess;
}

bool cm::IsPoisoned(const void *ptr, size_t size) {
    const uint8_t *bytes = static_cast<const uint8_t*>(ptr);
    for (size_t i = 0; i < size; i++) {
        if (bytes[i] != kPoisonByte) {
            return false;
        }
    }

    return true;
}

OsStatus cm::KernelHeap::claimFrames(FrameAllocatorContext& frames, MemoryRange range) {
    uint64_t count = range.size() / kFrameSize;
    for (uint64_t i = 0; i < count; i++) {
        PhysicalFrame frame;
        if (OsStatus status = frames.allocate(&frame)) {
            MemLog.errorf("Failed to claim heap frame ", i, " of ", count, ": ", OsStatusId(status));
            return OsStatusFrameAllocationFailed;
        }

        if (!range.contains(frame.memory())) {
            MemLog.errorf("Heap frame ", frame, " is outside of the heap ", range);
            return OsStatusFrameAllocationFailed;
        }
    }

    return OsStatusSuccess;
}

OsStatus cm::KernelHeap::init(FrameAllocatorContext& frames, PageTables& tables, const PhysicalMemory& memory, uint64_t totalUsableMemory) {
    stdx::LockGuard guard(mLock);
    if (mInitialized) {
        return OsStatusAlreadyInitialized;
    }

    uint64_t usableLimit;
    if (sm::addOverflow<uint64_t>(mConfig.start.address, totalUsableMemory, &usableLimit)) {
        usableLimit = UINT64_MAX;
    }

    // Frames are claimed in order, so the heap cannot span a hole in usable memory
    PhysicalFrameRange run;
    if (OsStatus status = frames.rangeContaining(PhysicalFrame::containing(mConfig.start), &run)) {
        MemLog.errorf("Heap start ", mConfig.start, " is not in usable memory: ", OsStatusId(status));
        return OsStatusFrameAllocationFailed;
    }

    uint64_t limit = std::min({ tables.mappedBytes(), usableLimit, run.memory().back.address });

    uint64_t size = 0;
    if (OsStatus status = ComputeHeapSize(limit, mConfig, &size)) {
        MemLog.errorf("Heap does not fit in ", sm::bytes(limit), " of mapped memory");
        return status;
    }

    MemoryRange range = MemoryRange::of(mConfig.start, size);
    if (OsStatus status = claimFrames(frames, range)) {
        return status;
    }

    void *base = nullptr;
    if (OsStatus status = memory.map(range, &base)) {
        MemLog.errorf("Heap range ", range, " is not accessible: ", OsStatusId(status));
        return OsStatusFrameAllocationFailed;
    }

    mem::TlsfAllocator allocator { base, size };
    if (!allocator.isValid()) {
        return OsStatusInvalidConfiguration;
    }

    mAllocator = std::move(allocator);
    mRange = range;
    mInitialized = true;

    MemLog.infof("Heap initialized at ", range, " (", sm::bytes(size), ")");

    return OsStatusSuccess;
}

bool cm::KernelHeap::isInitialized() {
    stdx::LockGuard guard(mLock);
    return mInitialized;
}

void *cm::KernelHeap::allocate(size_t size) {
    stdx::LockGuard guard(mLock);
    if (!mInitialized) return nullptr;

    return mAllocator.allocate(size);
}

void *cm::KernelHeap::allocateAligned(size_t size, size_t align) {
    stdx::LockGuard guard(mLock);
    if (!mInitialized) return nullptr;

    return mAllocator.allocateAligned(size, align);
}

void cm::KernelHeap::deallocate(void *ptr) {
    if (ptr == nullptr) return;

    stdx::LockGuard guard(mLock);
    CM_CHECK(mInitialized, "Freeing memory before the heap is initialized");
    mAllocator.deallocate(ptr, 0);
}

void *cm::KernelHeap::secureAlloc(size_t size) {
    void *ptr = allocateAligned(size, kSecureAlign);
    if (ptr != nullptr) {
        memset(ptr, 0, size);
    }

    return ptr;
}

OsStatus cm::KernelHeap::secureDealloc(void *ptr, size_t size) {
    if (ptr == nullptr) {
        return OsStatusSuccess;
    }

    memset(ptr, kPoisonByte, size);
    if (!IsPoisoned(ptr, size)) {
        MemLog.errorf("Poisoned block at ", ptr, " does not hold the poison pattern");
        return OsStatusCorruptionDetected;
    }

    deallocate(ptr);
    return OsStatusSuccess;
}

cm::HeapStats cm::KernelHeap::stats() {
    stdx::LockGuard guard(mLock);
    if (!mInitialized) {
        return HeapStats { .start = mConfig.start };
    }

    size_t used = 0;
    size_t free = 0;
    mAllocator.walk([&](void *, size_t size, bool inUse) {
        if (inUse) {
            used += size;
        } else {
            free += size;
        }
    });

    return HeapStats {
        .total = mRange.size(),
        .used = used,
        .free = free,
        .start = mRange.front,
    };
}
