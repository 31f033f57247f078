#pragma once

#include "std/string_view.hpp"

#include <stddef.h>
#include <stdint.h>

namespace boot {
    /// @brief A UEFI status code, errors have the high bit set.
    using EfiStatus = uint64_t;

    namespace efi {
        static constexpr EfiStatus kErrorBit = 1ull << 63;

        static constexpr EfiStatus kSuccess = 0;
        static constexpr EfiStatus kLoadError = kErrorBit | 1;
        static constexpr EfiStatus kInvalidParameter = kErrorBit | 2;
        static constexpr EfiStatus kUnsupported = kErrorBit | 3;
        static constexpr EfiStatus kBadBufferSize = kErrorBit | 4;
        static constexpr EfiStatus kBufferTooSmall = kErrorBit | 5;
        static constexpr EfiStatus kNotReady = kErrorBit | 6;
        static constexpr EfiStatus kDeviceError = kErrorBit | 7;
        static constexpr EfiStatus kWriteProtected = kErrorBit | 8;
        static constexpr EfiStatus kOutOfResources = kErrorBit | 9;
        static constexpr EfiStatus kNotFound = kErrorBit | 14;

        constexpr bool isError(EfiStatus status) {
            return (status & kErrorBit) != 0;
        }

        /// @brief Memory types in a UEFI memory descriptor.
        enum MemoryType : uint32_t {
            eReservedMemoryType = 0,
            eLoaderCode = 1,
            eLoaderData = 2,
            eBootServicesCode = 3,
            eBootServicesData = 4,
            eRuntimeServicesCode = 5,
            eRuntimeServicesData = 6,
            eConventionalMemory = 7,
            eUnusableMemory = 8,
            eAcpiReclaimMemory = 9,
            eAcpiMemoryNvs = 10,
            eMemoryMappedIo = 11,
            eMemoryMappedIoPortSpace = 12,
            ePalCode = 13,
            ePersistentMemory = 14,
        };

        static constexpr size_t kPageSize = 0x1000;
    }

    /// @brief A UEFI memory descriptor.
    ///
    /// Firmware may report descriptors larger than this, they are always addressed by
    /// the reported descriptor size.
    struct EfiMemoryDescriptor {
        uint32_t type;
        uint32_t reserved;
        uint64_t physicalStart;
        uint64_t virtualStart;
        uint64_t numberOfPages;
        uint64_t attribute;
    };

    static_assert(sizeof(EfiMemoryDescriptor) == 40);

    /// @brief The firmware services used before the kernel takes over.
    ///
    /// Every call is synchronous. After a successful @a exitBootServices no other
    /// method may be called.
    class IBootServices {
    public:
        virtual ~IBootServices() = default;

        /// @brief Copy the current memory map into @p buffer.
        ///
        /// @param size The size of @p buffer on entry, the size of the map on return.
        /// @param buffer Where to write the descriptors.
        /// @param key The key identifying this version of the memory map.
        /// @param descriptorSize The stride between descriptors.
        /// @param descriptorVersion The descriptor format version.
        virtual EfiStatus getMemoryMap(size_t *size, void *buffer, uintptr_t *key, size_t *descriptorSize, uint32_t *descriptorVersion) = 0;

        /// @brief Release firmware control of the machine.
        ///
        /// Fails when @p key does not match the current memory map.
        virtual EfiStatus exitBootServices(uintptr_t key) = 0;

        virtual EfiStatus allocatePool(size_t size, void **buffer) = 0;
        virtual EfiStatus freePool(void *buffer) = 0;
    };

    /// @brief A short description of a firmware status.
    stdx::StringView EfiStatusString(EfiStatus status);
}
