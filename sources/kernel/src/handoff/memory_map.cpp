#include "handoff/memory_map.hpp"

#include "logger/categories.hpp"

#include <algorithm>

static constexpr uint64_t k4GiB = 0x1'0000'0000;
static constexpr uint64_t kLowestValidBase = 0x1000;
static constexpr uint32_t kNoMapSentinel = 0xFFFF'FFFF;

static cm::RegionKind ClassifyEntry(const cm::E820Entry& entry) {
    using enum cm::RegionKind;

    switch (entry.type) {
    case cm::e820::kUsable:
        // Usable entries only count when enabled, otherwise nothing may allocate from them
        return (entry.attribute == cm::e820::kEnabled) ? eUsable : eReserved;
    case cm::e820::kReserved:
        return eReserved;
    case cm::e820::kAcpiReclaimable:
        return eAcpiReclaimable;
    case cm::e820::kAcpiNvs:
        return eAcpiNvs;
    case cm::e820::kBad:
        return eBad;
    default:
        return eUnknown;
    }
}

static uint64_t SaturatingMul(uint64_t lhs, uint64_t rhs) {
    uint64_t result;
    return sm::mulOverflow(lhs, rhs, &result) ? UINT64_MAX : result;
}

static uint64_t SaturatingAdd(uint64_t lhs, uint64_t rhs) {
    uint64_t result;
    return sm::addOverflow(lhs, rhs, &result) ? UINT64_MAX : result;
}

// value * numerator / denominator without overflowing on the full product
static uint64_t ScaleBy(uint64_t value, uint64_t numerator, uint64_t denominator) {
    uint64_t whole = SaturatingMul(value / denominator, numerator);
    uint64_t part = SaturatingMul(value % denominator, numerator) / denominator;
    return SaturatingAdd(whole, part);
}

uint64_t cm::EstimateUsableMemory(uint64_t usable, uint64_t highest, const UsableMemoryEstimate& estimate) {
    if (usable >= estimate.threshold && highest <= SaturatingMul(usable, estimate.spread)) {
        return usable;
    }

    if (highest > 0) {
        usable = ScaleBy(highest, estimate.numerator, estimate.denominator);
    }

    return std::max(usable, estimate.floor);
}

OsStatus cm::ParseHandoffMemoryMap(const PhysicalMemory& memory, const HandoffLayout& layout, MemoryMap *map [[gnu::nonnull]]) {
    if (layout.maxMapEntries > MemoryMap::kMaxRegions) {
        return OsStatusInvalidInput;
    }

    if (!memory.covers(layout.memoryMapRange())) {
        HandoffLog.errorf("Hand-off memory map ", layout.memoryMapRange(), " is outside of accessible memory ", memory.window());
        return OsStatusInvalidMemoryMap;
    }

    uint32_t count = 0;
    if (OsStatus status = memory.load(layout.memoryMap, &count)) {
        return status;
    }

    if (count == 0 || count == kNoMapSentinel) {
        HandoffLog.warnf("No memory map at ", layout.memoryMap, ", count = ", Hex(count));
        return OsStatusNoMemoryMap;
    }

    if (count > layout.maxMapEntries) {
        HandoffLog.warnf("Memory map has ", count, " entries, at most ", layout.maxMapEntries, " are allowed");
        return OsStatusInvalidMemoryMap;
    }

    MemoryRegion regions[MemoryMap::kMaxRegions];
    size_t valid = 0;
    uint64_t usable = 0;
    uint64_t highest = 0;

    PhysicalAddress entries = layout.memoryMap + sizeof(uint32_t);
    for (uint32_t i = 0; i < count; i++) {
        E820Entry entry;
        if (OsStatus status = memory.load(entries + (i * sizeof(E820Entry)), &entry)) {
            return status;
        }

        if (entry.length == 0) {
            continue;
        }

        PhysicalAddress end;
        if (!PhysicalAddress(entry.base).checkedAdd(entry.length, &end)) {
            HandoffLog.warnf("Skipping entry ", i, " that overflows, base ", Hex(entry.base), " length ", Hex(entry.length));
            continue;
        }

        if (entry.base < kLowestValidBase && entry.base != 0) {
            HandoffLog.warnf("Skipping entry ", i, " with suspicious base ", Hex(entry.base));
            continue;
        }

        RegionKind kind = ClassifyEntry(entry);
        MemoryRegion region = MemoryRegion::of(kind, MemoryRange { entry.base, end });

        if (region.isUsable() || region.reclaimable) {
            if (end.address > highest && end.address < k4GiB) {
                highest = end.address;
            }
        }

        if (region.isUsable()) {
            usable = SaturatingAdd(usable, entry.length);
        }

        regions[valid++] = region;
    }

    if (valid == 0) {
        HandoffLog.warnf("Memory map contains no valid entries");
        return OsStatusInvalidMemoryMap;
    }

    uint64_t estimate = EstimateUsableMemory(usable, highest);
    if (estimate != usable) {
        HandoffLog.infof("Usable memory estimated as ", sm::bytes(estimate), ", map reports ", sm::bytes(usable));
    }

    return MemoryMap::create(std::span(regions, valid), estimate, map);
}
