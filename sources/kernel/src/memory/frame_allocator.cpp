#include "memory/frame_allocator.hpp"

#include "logger/categories.hpp"

#include <algorithm>

OsStatus cm::FrameAllocator::create(const MemoryMap& map, const PhysicalMemory& memory, PhysicalFrame firstFrame, FrameAllocator *allocator [[gnu::nonnull]]) {
    RangeList ranges;
    uint64_t total = 0;

    map.forEachUsableFrameRange([&](PhysicalFrameRange range) {
        MemoryRange accessible = intersection(range.memory(), memory.window());
        PhysicalFrameRange frames = PhysicalFrameRange::of(accessible).startingAt(firstFrame);
        if (frames.isEmpty()) {
            return;
        }

        // The map holds at most as many usable regions as the range list has room for
        CM_CHECK(ranges.add(frames), "Too many usable frame ranges");
        total += frames.count();
    });

    if (total == 0) {
        MemLog.errorf("No usable frames at or above ", firstFrame.address(), " in ", memory.window());
        return OsStatusOutOfMemory;
    }

    FrameAllocator result;
    result.mMap = map;
    result.mMemory = memory;
    result.mRanges = ranges;
    result.mCursor = firstFrame;
    result.mHighWater = firstFrame;
    result.mTotal = total;

    *allocator = result;
    return OsStatusSuccess;
}

bool cm::FrameAllocator::isUsableFrame(PhysicalFrame frame) const {
    for (const PhysicalFrameRange& range : mRanges) {
        if (range.contains(frame)) {
            return true;
        }
    }

    return false;
}

OsStatus cm::FrameAllocator::rangeContaining(PhysicalFrame frame, PhysicalFrameRange *range [[gnu::nonnull]]) const {
    for (const PhysicalFrameRange& it : mRanges) {
        if (it.contains(frame)) {
            *range = it;
            return OsStatusSuccess;
        }
    }

    return OsStatusNotFound;
}

bool cm::FrameAllocator::isRetiredFrame(PhysicalFrame frame) const {
    return std::find(mRetired.begin(), mRetired.end(), frame) != mRetired.end();
}

OsStatus cm::FrameAllocator::allocate(PhysicalFrame *frame [[gnu::nonnull]]) {
    if (mAllocated >= mTotal) {
        return OsStatusOutOfMemory;
    }

    const PhysicalFrameRange *found = nullptr;
    PhysicalFrame result;
    for (const PhysicalFrameRange& range : mRanges) {
        if (range.contains(mCursor)) {
            found = &range;
            result = mCursor;
            break;
        }

        if (mCursor < range.front()) {
            found = &range;
            result = range.front();
            break;
        }
    }

    if (found == nullptr) {
        return OsStatusOutOfMemory;
    }

    if (OsStatus status = mMemory.zero(result.memory())) {
        MemLog.errorf("Failed to clear frame ", result, ": ", OsStatusId(status));
        return status;
    }

    if (result < mHighWater) {
        // A freed frame was handed back out, resume from where fresh frames start
        mCursor = mHighWater;
    } else {
        mHighWater = result + 1;
        mCursor = mHighWater;
    }

    mAllocated += 1;
    *frame = result;
    return OsStatusSuccess;
}

OsStatus cm::FrameAllocator::deallocate(PhysicalFrame frame) {
    if (!isUsableFrame(frame)) {
        return OsStatusInvalidFrame;
    }

    if (frame >= mHighWater) {
        return OsStatusInvalidFrame;
    }

    if (hasPendingFrame() && frame == mCursor) {
        return OsStatusInvalidFrame;
    }

    if (isRetiredFrame(frame)) {
        return OsStatusInvalidFrame;
    }

    if (hasPendingFrame() && mRetired.isFull()) {
        MemLog.warnf("Frame ", frame, " not freed, ", mRetired.count(), " frames are already retired");
        return OsStatusOutOfMemory;
    }

    if (OsStatus status = mMemory.zero(frame.memory())) {
        return status;
    }

    mAllocated -= 1;

    if (hasPendingFrame()) {
        PhysicalFrame retired = std::max(frame, mCursor);
        mCursor = std::min(frame, mCursor);

        CM_CHECK(mRetired.add(retired), "Retired frame list overflow");
        mTotal -= 1;

        MemLog.warnf("Frame ", retired, " retired, another freed frame is pending");
    } else {
        mCursor = frame;
    }

    return OsStatusSuccess;
}

cm::FrameAllocatorStats cm::FrameAllocator::stats() const {
    return FrameAllocatorStats {
        .totalFrames = mTotal,
        .allocatedFrames = mAllocated,
        .freeFrames = mTotal - mAllocated,
        .totalMemory = mMap.totalUsableBytes(),
        .allocatedMemory = mAllocated * kFrameSize,
    };
}

OsStatus cm::FrameAllocatorContext::init(const MemoryMap& map, const PhysicalMemory& memory, PhysicalFrame firstFrame) {
    stdx::LockGuard guard(mLock);
    if (mInitialized) {
        return OsStatusAlreadyInitialized;
    }

    if (OsStatus status = FrameAllocator::create(map, memory, firstFrame, &mAllocator)) {
        return status;
    }

    mInitialized = true;
    return OsStatusSuccess;
}

bool cm::FrameAllocatorContext::isInitialized() {
    stdx::LockGuard guard(mLock);
    return mInitialized;
}

OsStatus cm::FrameAllocatorContext::allocate(PhysicalFrame *frame [[gnu::nonnull]]) {
    stdx::LockGuard guard(mLock);
    if (!mInitialized) {
        return OsStatusOutOfMemory;
    }

    return mAllocator.allocate(frame);
}

OsStatus cm::FrameAllocatorContext::deallocate(PhysicalFrame frame) {
    stdx::LockGuard guard(mLock);
    if (!mInitialized) {
        return OsStatusInvalidFrame;
    }

    return mAllocator.deallocate(frame);
}

OsStatus cm::FrameAllocatorContext::stats(FrameAllocatorStats *stats [[gnu::nonnull]]) {
    stdx::LockGuard guard(mLock);
    if (!mInitialized) {
        return OsStatusNotFound;
    }

    *stats = mAllocator.stats();
    return OsStatusSuccess;
}

OsStatus cm::FrameAllocatorContext::rangeContaining(PhysicalFrame frame, PhysicalFrameRange *range [[gnu::nonnull]]) {
    stdx::LockGuard guard(mLock);
    if (!mInitialized) {
        return OsStatusNotFound;
    }

    return mAllocator.rangeContaining(frame, range);
}
