#pragma once

#include <cosmos/status.h>

#include "handoff/handoff.hpp"
#include "memory/memory_map.hpp"
#include "memory/physical_memory.hpp"

namespace boot {
    /// @brief The E820 type a region is recorded as, unknown kinds are recorded as reserved.
    uint32_t E820Type(cm::RegionKind kind);

    /// @brief Write @p map to the hand-off location for the kernel to read.
    ///
    /// Writes the entry count followed by one enabled entry per region. Only the first
    /// @a HandoffLayout::maxMapEntries regions are written if the map holds more.
    OsStatus WriteHandoffMemoryMap(const cm::PhysicalMemory& memory, const cm::MemoryMap& map, const cm::HandoffLayout& layout);
}
