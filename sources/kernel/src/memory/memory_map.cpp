#include "memory/memory_map.hpp"

#include <algorithm>

using cm::MemoryRegion;
using cm::RegionKind;

static constexpr uint64_t k4GiB = 0x1'0000'0000;

static constexpr MemoryRegion kFallbackRegions[] = {
    MemoryRegion::of(RegionKind::eUsable, 0x0, 0x9FC00),
    MemoryRegion::of(RegionKind::eUsable, 0x100000, 0x7F00000),
};

static constexpr uint64_t kFallbackUsable = 0x9FC00 + 0x7F00000;

OsStatus cm::NormalizeRegions(std::span<const MemoryRegion> input, std::span<MemoryRegion> output, size_t *count [[gnu::nonnull]]) {
    size_t used = 0;
    for (const MemoryRegion& region : input) {
        if (region.isEmpty()) continue;

        if (used >= output.size()) {
            return OsStatusBufferTooSmall;
        }

        output[used++] = region;
    }

    std::span<MemoryRegion> regions = output.first(used);
    std::sort(regions.begin(), regions.end(), [](const MemoryRegion& lhs, const MemoryRegion& rhs) {
        return lhs.range.front < rhs.range.front;
    });

    size_t merged = 0;
    for (size_t i = 0; i < used; i++) {
        if (merged > 0) {
            MemoryRegion& previous = regions[merged - 1];
            const MemoryRegion& next = regions[i];
            if (previous.kind == next.kind && previous.range.back == next.range.front) {
                previous.range.back = next.range.back;
                continue;
            }
        }

        regions[merged++] = regions[i];
    }

    *count = merged;
    return OsStatusSuccess;
}

OsStatus cm::MemoryMap::create(std::span<const MemoryRegion> regions, uint64_t usableBytes, MemoryMap *map [[gnu::nonnull]]) {
    for (const MemoryRegion& region : regions) {
        if (!region.range.isValid()) {
            return OsStatusInvalidMemoryMap;
        }
    }

    MemoryRegion scratch[kMaxRegions];
    size_t count = 0;
    if (OsStatus status = NormalizeRegions(regions, scratch, &count)) {
        return status;
    }

    MemoryMap result;
    result.mRegions.addRange(std::span(scratch, count));
    result.mTotalUsable = usableBytes;

    *map = result;
    return OsStatusSuccess;
}

OsStatus cm::MemoryMap::create(std::span<const MemoryRegion> regions, MemoryMap *map [[gnu::nonnull]]) {
    MemoryMap result;
    if (OsStatus status = create(regions, 0, &result)) {
        return status;
    }

    uint64_t usable = 0;
    for (const MemoryRegion& region : result.regions()) {
        if (region.isUsable()) {
            usable += region.size();
        }
    }

    result.mTotalUsable = usable;

    *map = result;
    return OsStatusSuccess;
}

cm::MemoryMap cm::MemoryMap::fallback() {
    MemoryMap map;
    OsStatus status = create(kFallbackRegions, kFallbackUsable, &map);
    CM_CHECK(status == OsStatusSuccess, "Fallback memory map is invalid");
    return map;
}

cm::MemoryMapStats cm::MemoryMap::stats() const {
    MemoryMapStats stats{};

    for (const MemoryRegion& region : mRegions) {
        uint64_t size = region.size();
        switch (region.kind) {
        case RegionKind::eUsable:
            stats.usableRegions += 1;
            stats.usableMemory += size;
            break;
        case RegionKind::eReserved:
            stats.reservedRegions += 1;
            stats.reservedMemory += size;
            break;
        case RegionKind::eAcpiReclaimable:
        case RegionKind::eAcpiNvs:
            stats.acpiRegions += 1;
            stats.acpiMemory += size;
            break;
        case RegionKind::eBad:
            stats.badRegions += 1;
            stats.badMemory += size;
            break;
        default:
            stats.unknownRegions += 1;
            stats.unknownMemory += size;
            break;
        }
    }

    return stats;
}

const MemoryRegion *cm::MemoryMap::largestUsableRegion() const {
    const MemoryRegion *largest = nullptr;
    for (const MemoryRegion& region : mRegions) {
        if (!region.isUsable()) continue;

        if (largest == nullptr || region.size() > largest->size()) {
            largest = &region;
        }
    }

    return largest;
}

uint64_t cm::MemoryMap::totalPhysicalMemory() const {
    uint64_t total = 0;
    for (const MemoryRegion& region : mRegions) {
        if (region.range.front.address < k4GiB) {
            total += region.size();
        }
    }

    return total;
}

cm::PhysicalAddress cm::MemoryMap::memoryCeiling() const {
    PhysicalAddress ceiling = 0;
    for (const MemoryRegion& region : mRegions) {
        if (!region.isUsable() && !region.reclaimable) continue;

        PhysicalAddress end = region.range.back;
        if (end.address < k4GiB) {
            ceiling = std::max(ceiling, end);
        }
    }

    return ceiling;
}

OsStatus cm::MemoryMap::validate() const {
    for (const MemoryRegion& region : mRegions) {
        if (!region.range.isValid()) {
            return OsStatusInvalidMemoryMap;
        }

        if (region.kind == RegionKind::eUnknown || region.kind > RegionKind::eUnknown) {
            return OsStatusInvalidMemoryMap;
        }
    }

    return OsStatusSuccess;
}
