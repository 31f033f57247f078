#include "setup.hpp"

#include "handoff/memory_map.hpp"
#include "logger/categories.hpp"

static constexpr cm::PhysicalAddress kBootModeAddress = 0x400;

static void LogMemoryMap(const cm::MemoryMap& map) {
    MemLog.println("/-----+------------------------------------+------------------");
    MemLog.println("| Idx | Range                              | Kind");
    MemLog.println("|-----+------------------------------------+------------------");

    for (size_t i = 0; i < map.count(); i++) {
        const cm::MemoryRegion& region = map[i];
        MemLog.println("| ", cm::Int(i).pad(3), " | ", region.range, " | ", region.kind);
    }

    cm::MemoryMapStats stats = map.stats();
    MemLog.infof("Usable memory: ", sm::bytes(map.totalUsableBytes()), " in ", stats.usableRegions, " regions");
    MemLog.infof("Reserved memory: ", sm::bytes(stats.reservedMemory), ", ACPI memory: ", sm::bytes(stats.acpiMemory));
}

OsStatus cm::SetupKernelMemory(const PhysicalMemory& memory, const HandoffLayout& layout, KernelMemory *result [[gnu::nonnull]]) {
    if (layout.version != kHandoffVersion) {
        MemLog.errorf("Hand-off layout version ", layout.version, " does not match kernel version ", kHandoffVersion);
        return OsStatusInvalidInput;
    }

    if (!layout.isValid()) {
        MemLog.errorf("Hand-off layout is invalid");
        return OsStatusInvalidInput;
    }

    if (OsStatus status = ParseHandoffMemoryMap(memory, layout, &result->map)) {
        MemLog.warnf("Failed to read hand-off memory map: ", OsStatusId(status), ", using fallback map");
        result->map = MemoryMap::fallback();
    }

    LogMemoryMap(result->map);

    if (OsStatus status = result->tables.adopt(memory, PageTableLayout::of(layout))) {
        MemLog.errorf("Failed to adopt boot page tables: ", OsStatusId(status));
        return status;
    }

    uint64_t mapped = result->tables.mappedBytes();
    MemLog.infof("Boot page tables at ", result->tables.root(), " map ", sm::bytes(mapped));

    PhysicalMemory mappedMemory = memory.subwindow(MemoryRange { 0zu, mapped });
    if (OsStatus status = result->frames.init(result->map, mappedMemory, PhysicalFrame::containing(layout.heapStart))) {
        MemLog.errorf("Failed to initialize frame allocator: ", OsStatusId(status));
        return status;
    }

    if (OsStatus status = result->heap.init(result->frames, result->tables, mappedMemory, result->map.totalUsableBytes())) {
        MemLog.errorf("Failed to initialize heap: ", OsStatusId(status));
        return status;
    }

    FrameAllocatorStats frames{};
    if (OsStatus status = result->frames.stats(&frames)) {
        return status;
    }

    HeapStats heap = result->heap.stats();

    MemLog.infof("Frames: ", frames.allocatedFrames, " of ", frames.totalFrames, " in use (", sm::bytes(frames.allocatedMemory), ")");
    MemLog.infof("Heap: ", sm::bytes(heap.total), " at ", heap.start, ", ", sm::bytes(heap.free), " free");

    return OsStatusSuccess;
}

OsStatus cm::VerifyHeap(KernelHeap& heap) {
    static constexpr size_t kWordCount = 8;
    static constexpr uint64_t kSignature = 0xC05'305C'0FFE'E000;

    uint64_t *words = static_cast<uint64_t*>(heap.secureAlloc(kWordCount * sizeof(uint64_t)));
    if (words == nullptr) {
        InitLog.errorf("Heap self test could not allocate");
        return OsStatusOutOfMemory;
    }

    for (size_t i = 0; i < kWordCount; i++) {
        if (words[i] != 0) {
            InitLog.errorf("Heap self test block at ", (void*)words, " was not zeroed");
            heap.deallocate(words);
            return OsStatusCorruptionDetected;
        }

        words[i] = kSignature + i;
    }

    for (size_t i = 0; i < kWordCount; i++) {
        if (words[i] != kSignature + i) {
            InitLog.errorf("Heap self test read back ", Hex(words[i]), " at word ", i);
            heap.deallocate(words);
            return OsStatusCorruptionDetected;
        }
    }

    if (OsStatus status = heap.secureDealloc(words, kWordCount * sizeof(uint64_t))) {
        InitLog.errorf("Heap self test release failed: ", OsStatusId(status));
        return status;
    }

    InitLog.infof("Heap self test passed");
    return OsStatusSuccess;
}

OsStatus cm::DetectBootMode(const PhysicalMemory& memory, BootMode *mode [[gnu::nonnull]]) {
    uint16_t word = 0;
    if (OsStatus status = memory.load(kBootModeAddress, &word)) {
        return status;
    }

    *mode = (word == 0) ? BootMode::eUefi : BootMode::eLegacyBios;
    return OsStatusSuccess;
}
