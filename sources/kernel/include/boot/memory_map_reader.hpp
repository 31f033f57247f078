#pragma once

#include <cosmos/status.h>

#include "boot/firmware.hpp"
#include "memory/memory_map.hpp"
#include "util/memory.hpp"

#include <span>

namespace boot {
    /// @brief The memory map as read from firmware.
    struct FirmwareMemoryMap {
        cm::MemoryMap map;

        /// @brief The key needed to exit boot services with this map.
        uintptr_t mapKey;

        size_t descriptorCount;
        size_t descriptorSize;

        /// @brief The status of the last firmware call, for diagnostics.
        EfiStatus lastStatus;
    };

    /// @brief Bounds checked access to descriptors in a firmware map buffer.
    class DescriptorView {
        std::span<const std::byte> mBuffer;
        size_t mStride;

    public:
        /// @pre @p stride is at least the size of @a EfiMemoryDescriptor.
        DescriptorView(std::span<const std::byte> buffer, size_t stride);

        size_t count() const { return mBuffer.size() / mStride; }
        size_t stride() const { return mStride; }

        EfiMemoryDescriptor operator[](size_t index) const;
    };

    /// @brief Map a UEFI memory type to a region kind.
    cm::RegionKind ClassifyDescriptor(uint32_t type);

    /// @brief Reads the firmware memory map through a fixed scratch buffer.
    class MemoryMapReader {
    public:
        static constexpr size_t kBufferSize = sm::kilobytes(8).bytes();
        static constexpr size_t kMaxDescriptors = kBufferSize / sizeof(EfiMemoryDescriptor);

    private:
        IBootServices& mFirmware;
        EfiStatus mLastStatus = efi::kSuccess;

        alignas(EfiMemoryDescriptor) std::byte mBuffer[kBufferSize];

        OsStatus query(DescriptorView *view, uintptr_t *key);

    public:
        MemoryMapReader(IBootServices& firmware)
            : mFirmware(firmware)
        { }

        UTIL_NOCOPY(MemoryMapReader);
        UTIL_NOMOVE(MemoryMapReader);

        /// @brief Read and normalize the current memory map.
        ///
        /// @retval OsStatusBufferTooSmall The map does not fit in the scratch buffer or the region list.
        /// @retval OsStatusFirmwareError The firmware call failed or returned malformed descriptors.
        /// @retval OsStatusEmptyMap The map contains no non-empty descriptors.
        OsStatus read(FirmwareMemoryMap *result [[gnu::nonnull]]);

        /// @brief Query the firmware again only to get a fresh map key.
        OsStatus refreshMapKey(uintptr_t *key [[gnu::nonnull]]);

        EfiStatus lastStatus() const { return mLastStatus; }
    };
}
