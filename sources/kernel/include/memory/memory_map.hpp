#pragma once

#include <cosmos/status.h>

#include "memory/frame.hpp"
#include "memory/region.hpp"

#include "std/static_vector.hpp"

namespace cm {
    /// @brief Region counts and sizes by kind.
    ///
    /// Both ACPI kinds are counted together.
    struct MemoryMapStats {
        size_t usableRegions;
        size_t reservedRegions;
        size_t acpiRegions;
        size_t badRegions;
        size_t unknownRegions;

        uint64_t usableMemory;
        uint64_t reservedMemory;
        uint64_t acpiMemory;
        uint64_t badMemory;
        uint64_t unknownMemory;
    };

    /// @brief Drop empty regions, sort by base, then merge touching regions of the same kind.
    ///
    /// The result never has more entries than the input. Normalizing a normalized list
    /// is a no-op. Overlapping regions are left in place.
    ///
    /// @param input The regions to normalize.
    /// @param output Storage for the result, may not alias @p input.
    /// @param count The number of regions written to @p output.
    ///
    /// @retval OsStatusBufferTooSmall @p output cannot hold every non-empty region.
    OsStatus NormalizeRegions(std::span<const MemoryRegion> input, std::span<MemoryRegion> output, size_t *count [[gnu::nonnull]]);

    /// @brief An ordered and normalized list of physical memory regions.
    ///
    /// Immutable once created, replacing the map means building a new one.
    class MemoryMap {
    public:
        static constexpr size_t kMaxRegions = 128;

    private:
        using RegionList = stdx::StaticVector<MemoryRegion, kMaxRegions>;

        RegionList mRegions;
        uint64_t mTotalUsable = 0;

    public:
        constexpr MemoryMap() = default;

        /// @brief Build a map from firmware regions, summing the usable bytes.
        ///
        /// @retval OsStatusBufferTooSmall More than @a kMaxRegions regions remain after normalizing.
        static OsStatus create(std::span<const MemoryRegion> regions, MemoryMap *map [[gnu::nonnull]]);

        /// @brief Build a map that reports an externally estimated usable total.
        static OsStatus create(std::span<const MemoryRegion> regions, uint64_t usableBytes, MemoryMap *map [[gnu::nonnull]]);

        /// @brief The map used when no usable map was handed to the kernel.
        ///
        /// Conventional memory below the EBDA, and 127MiB above the ISA hole.
        static MemoryMap fallback();

        std::span<const MemoryRegion> regions() const { return mRegions.span(); }
        size_t count() const { return mRegions.count(); }
        bool isEmpty() const { return mRegions.isEmpty(); }

        const MemoryRegion& operator[](size_t index) const {
            return mRegions[index];
        }

        uint64_t totalUsableBytes() const { return mTotalUsable; }

        MemoryMapStats stats() const;

        /// @return The largest usable region, or nullptr if there are none.
        const MemoryRegion *largestUsableRegion() const;

        /// @brief Bytes in regions that start below 4GiB.
        uint64_t totalPhysicalMemory() const;

        /// @brief The highest end of any usable or reclaimable region below 4GiB.
        PhysicalAddress memoryCeiling() const;

        /// @retval OsStatusInvalidMemoryMap A region overflows or has an unknown kind.
        OsStatus validate() const;

        /// @brief Call @p fn with the frames wholly inside each usable region.
        template<typename F>
        void forEachUsableFrameRange(F&& fn) const {
            for (const MemoryRegion& region : mRegions) {
                if (!region.isUsable()) continue;

                PhysicalFrameRange frames = PhysicalFrameRange::of(region.range);
                if (!frames.isEmpty()) {
                    fn(frames);
                }
            }
        }
    };
}
