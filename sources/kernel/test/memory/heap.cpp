#include <gtest/gtest.h>

#include <algorithm>
#include <thread>

#include "memory/heap.hpp"

#include "test_memory.hpp"

using cm::HeapConfig;
using cm::KernelHeap;

static constexpr uint64_t kMiB = sm::megabytes(1).bytes();

TEST(ComputeHeapSizeTest, CappedAtMaximum) {
    uint64_t size = 0;
    ASSERT_EQ(cm::ComputeHeapSize(300 * kMiB, cm::kDefaultHeapConfig, &size), OsStatusSuccess);
    ASSERT_EQ(size, 256 * kMiB);
}

TEST(ComputeHeapSizeTest, FitsBelowMapped) {
    uint64_t size = 0;
    ASSERT_EQ(cm::ComputeHeapSize(10 * kMiB + 123, cm::kDefaultHeapConfig, &size), OsStatusSuccess);
    ASSERT_EQ(size, 6 * kMiB);
}

TEST(ComputeHeapSizeTest, BelowMinimum) {
    uint64_t size = 0;
    ASSERT_EQ(cm::ComputeHeapSize(6 * kMiB, cm::kDefaultHeapConfig, &size), OsStatusInvalidConfiguration);
    ASSERT_EQ(cm::ComputeHeapSize(2 * kMiB, cm::kDefaultHeapConfig, &size), OsStatusInvalidConfiguration);
}

TEST(ComputeHeapSizeTest, InvalidConfig) {
    uint64_t size = 0;

    HeapConfig misaligned { .start = 0x400800, .minSize = kMiB, .maxSize = 4 * kMiB };
    ASSERT_EQ(cm::ComputeHeapSize(64 * kMiB, misaligned, &size), OsStatusInvalidConfiguration);

    HeapConfig inverted { .start = 0x400000, .minSize = 8 * kMiB, .maxSize = 4 * kMiB };
    ASSERT_EQ(cm::ComputeHeapSize(64 * kMiB, inverted, &size), OsStatusInvalidConfiguration);
}

TEST(IsPoisonedTest, Pattern) {
    uint8_t buffer[32];
    memset(buffer, cm::kPoisonByte, sizeof(buffer));
    ASSERT_TRUE(cm::IsPoisoned(buffer, sizeof(buffer)));
    ASSERT_TRUE(cm::IsPoisoned(buffer, 0));

    buffer[17] = 0;
    ASSERT_FALSE(cm::IsPoisoned(buffer, sizeof(buffer)));
}

TEST(TlsfAllocatorTest, ThroughInterface) {
    alignas(16) static std::byte buffer[0x10000];

    mem::TlsfAllocator tlsf { buffer, sizeof(buffer) };
    ASSERT_TRUE(tlsf.isValid());

    mem::IAllocator& allocator = tlsf;

    void *ptr = allocator.allocate(100);
    ASSERT_NE(ptr, nullptr);

    void *aligned = allocator.allocateAligned(64, 128);
    ASSERT_NE(aligned, nullptr);
    ASSERT_EQ((uintptr_t)aligned % 128, 0);

    size_t used = 0;
    tlsf.walk([&](void *, size_t, bool inUse) { used += inUse ? 1 : 0; });
    ASSERT_EQ(used, 2);

    allocator.deallocate(ptr, 100);
    allocator.deallocate(aligned, 64);

    used = 0;
    tlsf.walk([&](void *, size_t, bool inUse) { used += inUse ? 1 : 0; });
    ASSERT_EQ(used, 0);
}

class HeapTest : public testing::Test {
public:
    // | 0x000000 - 0x100000 | Reserved, holds the page tables
    // | 0x100000 - 0x800000 | Usable
    static constexpr HeapConfig kConfig = {
        .start = 0x400000,
        .minSize = 1 * kMiB,
        .maxSize = 4 * kMiB,
    };

    TestMemory memory { 0x0uz, 8 * kMiB, 0xCC };
    cm::MemoryMap map;
    cm::PageTables tables;
    cm::FrameAllocatorContext frames;

    void SetUp() override {
        cm::MemoryRegion regions[] = {
            cm::MemoryRegion::of(cm::RegionKind::eReserved, 0x0uz, 0x100000),
            cm::MemoryRegion::of(cm::RegionKind::eUsable, 0x100000, 7 * kMiB),
        };

        ASSERT_EQ(cm::MemoryMap::create(regions, &map), OsStatusSuccess);
        ASSERT_EQ(tables.build(memory.physical(), cm::PageTableLayout::of(cm::kHandoffLayout), 8 * kMiB), OsStatusSuccess);
    }

    void InitFrames(cm::PhysicalFrame first = cm::PhysicalFrame::containing(kConfig.start)) {
        ASSERT_EQ(frames.init(map, memory.physical(), first), OsStatusSuccess);
    }

    OsStatus InitHeap(KernelHeap& heap, uint64_t usable = 7 * kMiB) {
        return heap.init(frames, tables, memory.physical(), usable);
    }

    bool InHeap(const void *ptr) {
        cm::PhysicalAddress address = memory.physicalOf(ptr);
        return address >= kConfig.start && address < kConfig.start + kConfig.maxSize;
    }
};

TEST_F(HeapTest, Init) {
    InitFrames();

    KernelHeap heap { kConfig };
    ASSERT_FALSE(heap.isInitialized());
    ASSERT_EQ(InitHeap(heap), OsStatusSuccess);
    ASSERT_TRUE(heap.isInitialized());

    cm::HeapStats stats = heap.stats();
    ASSERT_EQ(stats.total, 4 * kMiB);
    ASSERT_EQ(stats.start, kConfig.start);
    ASSERT_EQ(stats.used, 0);
    ASSERT_GT(stats.free, 0);
    ASSERT_LE(stats.free, stats.total);

    cm::FrameAllocatorStats frameStats;
    ASSERT_EQ(frames.stats(&frameStats), OsStatusSuccess);
    ASSERT_EQ(frameStats.allocatedFrames, (4 * kMiB) / cm::kFrameSize);
}

TEST_F(HeapTest, AllocateBeforeInit) {
    KernelHeap heap { kConfig };

    ASSERT_EQ(heap.allocate(64), nullptr);
    ASSERT_EQ(heap.allocateAligned(64, 64), nullptr);
    ASSERT_EQ(heap.secureAlloc(64), nullptr);
    heap.deallocate(nullptr);

    cm::HeapStats stats = heap.stats();
    ASSERT_EQ(stats.total, 0);
    ASSERT_EQ(stats.start, kConfig.start);
}

TEST_F(HeapTest, AllocateAndFree) {
    InitFrames();

    KernelHeap heap { kConfig };
    ASSERT_EQ(InitHeap(heap), OsStatusSuccess);

    void *ptr = heap.allocate(1024);
    ASSERT_NE(ptr, nullptr);
    ASSERT_TRUE(InHeap(ptr));
    ASSERT_GE(heap.stats().used, 1024);

    void *aligned = heap.allocateAligned(256, 256);
    ASSERT_NE(aligned, nullptr);
    ASSERT_EQ((uintptr_t)aligned % 256, 0);

    heap.deallocate(ptr);
    heap.deallocate(aligned);
    ASSERT_EQ(heap.stats().used, 0);
}

TEST_F(HeapTest, Exhaust) {
    InitFrames();

    KernelHeap heap { kConfig };
    ASSERT_EQ(InitHeap(heap), OsStatusSuccess);

    ASSERT_EQ(heap.allocate(8 * kMiB), nullptr);
}

TEST_F(HeapTest, DoubleInit) {
    InitFrames();

    KernelHeap heap { kConfig };
    ASSERT_EQ(InitHeap(heap), OsStatusSuccess);

    void *ptr = heap.allocate(4096);
    ASSERT_NE(ptr, nullptr);
    cm::HeapStats before = heap.stats();

    ASSERT_EQ(InitHeap(heap), OsStatusAlreadyInitialized);

    cm::HeapStats after = heap.stats();
    ASSERT_EQ(before.total, after.total);
    ASSERT_EQ(before.used, after.used);
    ASSERT_EQ(before.free, after.free);

    heap.deallocate(ptr);
}

TEST_F(HeapTest, TooLittleUsableMemory) {
    InitFrames();

    KernelHeap heap { HeapConfig { .start = 0x400000, .minSize = 2 * kMiB, .maxSize = 4 * kMiB } };
    ASSERT_EQ(InitHeap(heap, 1 * kMiB), OsStatusInvalidConfiguration);
    ASSERT_FALSE(heap.isInitialized());
}

TEST_F(HeapTest, SizedToUsableMemory) {
    InitFrames();

    KernelHeap heap { kConfig };
    ASSERT_EQ(InitHeap(heap, 2 * kMiB), OsStatusSuccess);
    ASSERT_EQ(heap.stats().total, 2 * kMiB);
}

TEST_F(HeapTest, NoFrameAllocator) {
    KernelHeap heap { kConfig };
    ASSERT_EQ(InitHeap(heap), OsStatusFrameAllocationFailed);
    ASSERT_FALSE(heap.isInitialized());
}

TEST_F(HeapTest, FramesOutsideHeap) {
    InitFrames(cm::PhysicalFrame::containing(0x100000));

    KernelHeap heap { kConfig };
    ASSERT_EQ(InitHeap(heap), OsStatusFrameAllocationFailed);
    ASSERT_FALSE(heap.isInitialized());
}

TEST_F(HeapTest, ClampedBeforeReservedHole) {
    // | 0x100000 - 0x600000 | Usable
    // | 0x600000 - 0x680000 | Reserved
    // | 0x680000 - 0x800000 | Usable
    cm::MemoryRegion regions[] = {
        cm::MemoryRegion::of(cm::RegionKind::eReserved, 0x0uz, 0x100000),
        cm::MemoryRegion::of(cm::RegionKind::eUsable, 0x100000, 5 * kMiB),
        cm::MemoryRegion::of(cm::RegionKind::eReserved, 0x600000, 0x80000),
        cm::MemoryRegion::of(cm::RegionKind::eUsable, 0x680000, 0x180000),
    };

    ASSERT_EQ(cm::MemoryMap::create(regions, &map), OsStatusSuccess);
    InitFrames();

    KernelHeap heap { kConfig };
    ASSERT_EQ(InitHeap(heap), OsStatusSuccess);

    cm::HeapStats stats = heap.stats();
    ASSERT_EQ(stats.start, kConfig.start);
    ASSERT_EQ(stats.total, 2 * kMiB);

    cm::FrameAllocatorStats frameStats;
    ASSERT_EQ(frames.stats(&frameStats), OsStatusSuccess);
    ASSERT_EQ(frameStats.allocatedFrames, (2 * kMiB) / cm::kFrameSize);

    void *ptr = heap.allocate(kMiB);
    ASSERT_NE(ptr, nullptr);
    ASSERT_LT(memory.physicalOf(ptr), cm::PhysicalAddress(0x600000));
    heap.deallocate(ptr);
}

TEST_F(HeapTest, RunBeforeHoleTooSmall) {
    cm::MemoryRegion regions[] = {
        cm::MemoryRegion::of(cm::RegionKind::eReserved, 0x0uz, 0x100000),
        cm::MemoryRegion::of(cm::RegionKind::eUsable, 0x100000, 0x380000),
        cm::MemoryRegion::of(cm::RegionKind::eReserved, 0x480000, 0x80000),
        cm::MemoryRegion::of(cm::RegionKind::eUsable, 0x500000, 3 * kMiB),
    };

    ASSERT_EQ(cm::MemoryMap::create(regions, &map), OsStatusSuccess);
    InitFrames();

    KernelHeap heap { kConfig };
    ASSERT_EQ(InitHeap(heap), OsStatusInvalidConfiguration);
    ASSERT_FALSE(heap.isInitialized());

    cm::FrameAllocatorStats frameStats;
    ASSERT_EQ(frames.stats(&frameStats), OsStatusSuccess);
    ASSERT_EQ(frameStats.allocatedFrames, 0);
}

TEST_F(HeapTest, StartNotUsable) {
    cm::MemoryRegion regions[] = {
        cm::MemoryRegion::of(cm::RegionKind::eUsable, 0x100000, 0x200000),
        cm::MemoryRegion::of(cm::RegionKind::eReserved, 0x300000, 0x200000),
        cm::MemoryRegion::of(cm::RegionKind::eUsable, 0x500000, 3 * kMiB),
    };

    ASSERT_EQ(cm::MemoryMap::create(regions, &map), OsStatusSuccess);
    InitFrames(cm::PhysicalFrame::containing(0x100000));

    KernelHeap heap { kConfig };
    ASSERT_EQ(InitHeap(heap), OsStatusFrameAllocationFailed);
    ASSERT_FALSE(heap.isInitialized());
}

TEST_F(HeapTest, SecureAllocIsZeroed) {
    InitFrames();

    KernelHeap heap { kConfig };
    ASSERT_EQ(InitHeap(heap), OsStatusSuccess);

    void *dirty = heap.allocate(128);
    ASSERT_NE(dirty, nullptr);
    memset(dirty, 0xAB, 128);
    heap.deallocate(dirty);

    uint8_t *ptr = static_cast<uint8_t*>(heap.secureAlloc(128));
    ASSERT_NE(ptr, nullptr);
    ASSERT_EQ((uintptr_t)ptr % 8, 0);
    ASSERT_TRUE(std::all_of(ptr, ptr + 128, [](uint8_t b) { return b == 0; }));

    ASSERT_EQ(heap.secureDealloc(ptr, 128), OsStatusSuccess);
}

TEST_F(HeapTest, SecureDeallocPoisons) {
    InitFrames();

    KernelHeap heap { kConfig };
    ASSERT_EQ(InitHeap(heap), OsStatusSuccess);

    uint8_t *ptr = static_cast<uint8_t*>(heap.secureAlloc(256));
    ASSERT_NE(ptr, nullptr);
    memset(ptr, 0x42, 256);

    ASSERT_EQ(heap.secureDealloc(ptr, 256), OsStatusSuccess);

    // The allocator reuses the edges of a free block for its own bookkeeping
    ASSERT_TRUE(cm::IsPoisoned(ptr + 32, 128));
    ASSERT_EQ(heap.stats().used, 0);
}

TEST_F(HeapTest, SecureDeallocNull) {
    KernelHeap heap { kConfig };
    ASSERT_EQ(heap.secureDealloc(nullptr, 64), OsStatusSuccess);
}

TEST_F(HeapTest, ConcurrentAllocation) {
    InitFrames();

    KernelHeap heap { kConfig };
    ASSERT_EQ(InitHeap(heap), OsStatusSuccess);

    std::vector<std::thread> threads;
    for (size_t i = 0; i < 4; i++) {
        threads.emplace_back([&heap, i] {
            for (size_t j = 0; j < 1000; j++) {
                size_t size = 16 + ((i * 1000 + j) % 512);
                void *ptr = heap.allocate(size);
                if (ptr != nullptr) {
                    memset(ptr, int(i), size);
                    heap.deallocate(ptr);
                }
            }
        });
    }

    for (std::thread& thread : threads) {
        thread.join();
    }

    ASSERT_EQ(heap.stats().used, 0);
}
