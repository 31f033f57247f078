#pragma once

#include <cosmos/status.h>

#include "handoff/handoff.hpp"
#include "memory/memory_map.hpp"
#include "memory/physical_memory.hpp"

namespace cm {
    /// @brief Tunables for guessing usable memory when the map looks incomplete.
    ///
    /// Some firmware report far less usable memory than is installed. When the usable total is
    /// below @a threshold, or the highest RAM address is more than @a spread times the usable
    /// total, the usable total is re-estimated as a fraction of the highest RAM address below 4GiB.
    struct UsableMemoryEstimate {
        uint64_t threshold;
        uint64_t spread;
        uint64_t numerator;
        uint64_t denominator;

        /// @brief The least the estimate will ever report.
        uint64_t floor;
    };

    static constexpr UsableMemoryEstimate kDefaultUsableEstimate = {
        .threshold = sm::megabytes(16).bytes(),
        .spread = 2,
        .numerator = 3,
        .denominator = 4,
        .floor = sm::megabytes(128).bytes(),
    };

    /// @brief Apply the usable memory heuristic.
    ///
    /// Intermediate products saturate rather than wrap.
    ///
    /// @param usable The sum of the lengths of all usable entries.
    /// @param highest The highest end of any usable or reclaimable entry below 4GiB.
    /// @param estimate The heuristic tunables.
    ///
    /// @return The usable memory the kernel should assume.
    uint64_t EstimateUsableMemory(uint64_t usable, uint64_t highest, const UsableMemoryEstimate& estimate = kDefaultUsableEstimate);

    /// @brief Read the memory map the bootloader left at the hand-off location.
    ///
    /// @retval OsStatusNoMemoryMap The entry count is 0 or all ones.
    /// @retval OsStatusInvalidMemoryMap The entry count exceeds the layout, or no entry is valid.
    OsStatus ParseHandoffMemoryMap(const PhysicalMemory& memory, const HandoffLayout& layout, MemoryMap *map [[gnu::nonnull]]);
}
