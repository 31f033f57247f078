#include "boot/handoff.hpp"

#include "logger/categories.hpp"

using cm::E820Entry;
using cm::RegionKind;

uint32_t boot::E820Type(RegionKind kind) {
    switch (kind) {
    case RegionKind::eUsable: return cm::e820::kUsable;
    case RegionKind::eAcpiReclaimable: return cm::e820::kAcpiReclaimable;
    case RegionKind::eAcpiNvs: return cm::e820::kAcpiNvs;
    case RegionKind::eBad: return cm::e820::kBad;
    default: return cm::e820::kReserved;
    }
}

OsStatus boot::WriteHandoffMemoryMap(const cm::PhysicalMemory& memory, const cm::MemoryMap& map, const cm::HandoffLayout& layout) {
    size_t count = map.count();
    if (count > layout.maxMapEntries) {
        HandoffLog.warnf("Memory map has ", count, " regions, only the first ", layout.maxMapEntries, " are handed off");
        count = layout.maxMapEntries;
    }

    cm::PhysicalAddress entries = layout.memoryMap + sizeof(uint32_t);
    for (size_t i = 0; i < count; i++) {
        const cm::MemoryRegion& region = map[i];
        E820Entry entry {
            .base = region.range.front.address,
            .length = region.size(),
            .type = E820Type(region.kind),
            .attribute = cm::e820::kEnabled,
        };

        if (OsStatus status = memory.store(entries + (i * sizeof(E820Entry)), entry)) {
            return status;
        }
    }

    if (OsStatus status = memory.store(layout.memoryMap, uint32_t(count))) {
        return status;
    }

    HandoffLog.infof("Wrote ", count, " memory map entries at ", layout.memoryMap);
    return OsStatusSuccess;
}
