#pragma once

#include <cosmos/status.h>

#include "memory/memory_map.hpp"
#include "memory/physical_memory.hpp"

#include "std/spinlock.hpp"
#include "std/static_vector.hpp"
#include "util/memory.hpp"

namespace cm {
    /// @brief The first frame handed out, below this is the kernel image and boot data.
    static constexpr PhysicalFrame kDefaultFirstFrame = PhysicalFrame::containing(sm::megabytes(4).bytes());

    /// @brief The most frames that can be retired before frees start being refused.
    static constexpr size_t kMaxRetiredFrames = 64;

    struct FrameAllocatorStats {
        uint64_t totalFrames;
        uint64_t allocatedFrames;
        uint64_t freeFrames;
        uint64_t totalMemory;
        uint64_t allocatedMemory;
    };

    /// @brief Hands out physical frames from the usable regions of a memory map.
    ///
    /// Frames are handed out in ascending order from a cursor. Freeing a frame below the
    /// cursor rewinds it so the frame is handed out next, after which the cursor resumes
    /// from the highest frame ever handed out. Every frame is zeroed before it is handed
    /// out and again when it is freed.
    ///
    /// Only one freed frame is remembered at a time. Freeing a second frame while one is
    /// pending keeps the lower of the two and retires the other from the allocator. A retired
    /// frame is never handed out again and freeing it again is rejected. Once
    /// @a kMaxRetiredFrames frames are retired a free that would retire another is refused
    /// and the frame stays allocated.
    ///
    /// @note Not thread safe, see @a FrameAllocatorContext.
    class FrameAllocator {
        using RangeList = stdx::StaticVector<PhysicalFrameRange, MemoryMap::kMaxRegions>;
        using RetiredList = stdx::StaticVector<PhysicalFrame, kMaxRetiredFrames>;

        MemoryMap mMap;
        PhysicalMemory mMemory;
        RangeList mRanges;
        RetiredList mRetired;

        /// @brief The next frame to try.
        PhysicalFrame mCursor;

        /// @brief One past the highest frame ever handed out.
        PhysicalFrame mHighWater;

        uint64_t mAllocated = 0;
        uint64_t mTotal = 0;

        bool hasPendingFrame() const { return mCursor < mHighWater; }
        bool isUsableFrame(PhysicalFrame frame) const;
        bool isRetiredFrame(PhysicalFrame frame) const;

    public:
        constexpr FrameAllocator() = default;

        /// @brief Create a frame allocator over the usable frames of @p map.
        ///
        /// Usable regions are shrunk to whole frames and clipped to the window of @p memory
        /// and to frames at or above @p firstFrame.
        ///
        /// @retval OsStatusOutOfMemory There are no usable frames.
        static OsStatus create(const MemoryMap& map, const PhysicalMemory& memory, PhysicalFrame firstFrame, FrameAllocator *allocator [[gnu::nonnull]]);

        /// @retval OsStatusOutOfMemory Every usable frame is in use.
        OsStatus allocate(PhysicalFrame *frame [[gnu::nonnull]]);

        /// @retval OsStatusInvalidFrame The frame is not usable, was never handed out, or is already free.
        /// @retval OsStatusOutOfMemory Freeing the frame would retire one more frame than the allocator can track.
        OsStatus deallocate(PhysicalFrame frame);

        FrameAllocatorStats stats() const;

        /// @brief Find the usable frame range that holds @p frame.
        ///
        /// @retval OsStatusNotFound The frame is not usable.
        OsStatus rangeContaining(PhysicalFrame frame, PhysicalFrameRange *range [[gnu::nonnull]]) const;

        const MemoryMap& map() const { return mMap; }
        std::span<const PhysicalFrameRange> ranges() const { return mRanges.span(); }
    };

    /// @brief Lock protected frame allocator that can only be initialized once.
    ///
    /// Before initialization allocation reports no memory and every free is rejected.
    class FrameAllocatorContext {
        stdx::SpinLock mLock;
        FrameAllocator mAllocator GUARDED_BY(mLock);
        bool mInitialized GUARDED_BY(mLock) = false;

    public:
        constexpr FrameAllocatorContext() = default;

        UTIL_NOCOPY(FrameAllocatorContext);
        UTIL_NOMOVE(FrameAllocatorContext);

        /// @retval OsStatusAlreadyInitialized The context has already been initialized.
        OsStatus init(const MemoryMap& map, const PhysicalMemory& memory, PhysicalFrame firstFrame = kDefaultFirstFrame);

        bool isInitialized();

        OsStatus allocate(PhysicalFrame *frame [[gnu::nonnull]]);
        OsStatus deallocate(PhysicalFrame frame);

        /// @retval OsStatusNotFound The context has not been initialized.
        OsStatus stats(FrameAllocatorStats *stats [[gnu::nonnull]]);

        /// @retval OsStatusNotFound The context has not been initialized or the frame is not usable.
        OsStatus rangeContaining(PhysicalFrame frame, PhysicalFrameRange *range [[gnu::nonnull]]);
    };
}
