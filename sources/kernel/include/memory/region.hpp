#pragma once

#include "memory/range.hpp"

namespace cm {
    enum class RegionKind : uint8_t {
        eUsable,
        eReserved,
        eAcpiReclaimable,
        eAcpiNvs,
        eBad,
        eUnknown,
    };

    struct MemoryRegion {
        RegionKind kind;
        MemoryRange range;

        /// @brief Whether the region can be returned to the allocator once the kernel is done with it.
        ///
        /// Only ACPI reclaimable memory is.
        bool reclaimable;

        static constexpr MemoryRegion of(RegionKind kind, MemoryRange range) {
            return MemoryRegion { kind, range, kind == RegionKind::eAcpiReclaimable };
        }

        static constexpr MemoryRegion of(RegionKind kind, PhysicalAddress base, uintptr_t length) {
            return of(kind, MemoryRange::of(base, length));
        }

        constexpr uintptr_t size() const { return range.size(); }
        constexpr bool isEmpty() const { return range.isEmpty(); }
        constexpr bool isUsable() const { return kind == RegionKind::eUsable; }
        constexpr bool isAcpi() const { return kind == RegionKind::eAcpiReclaimable || kind == RegionKind::eAcpiNvs; }

        constexpr bool operator==(const MemoryRegion&) const = default;
    };
}

template<>
struct cm::Format<cm::RegionKind> {
    static stdx::StringView toString(cm::RegionKind kind) {
        using enum cm::RegionKind;
        switch (kind) {
        case eUsable: return "Usable";
        case eReserved: return "Reserved";
        case eAcpiReclaimable: return "ACPI Reclaimable";
        case eAcpiNvs: return "ACPI NVS";
        case eBad: return "Bad Memory";
        case eUnknown: return "Unknown";
        default: return "Invalid";
        }
    }
};

template<>
struct cm::Format<cm::MemoryRegion> {
    static void format(cm::IOutStream& out, const cm::MemoryRegion& region) {
        out.format(region.range, " ", region.kind);
    }
};
