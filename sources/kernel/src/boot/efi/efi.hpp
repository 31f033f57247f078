#pragma once

extern "C" {
#include <efi.h>
#include <efilib.h>
}

#include "boot/firmware.hpp"

namespace boot::efi {
    /// @brief Boot services backed by the UEFI system table.
    class EfiBootServices final : public IBootServices {
        EFI_HANDLE mImageHandle;
        EFI_BOOT_SERVICES *mBootServices;

    public:
        EfiBootServices(EFI_HANDLE image, EFI_BOOT_SERVICES *services)
            : mImageHandle(image)
            , mBootServices(services)
        { }

        EfiStatus getMemoryMap(size_t *size, void *buffer, uintptr_t *key, size_t *descriptorSize, uint32_t *descriptorVersion) override;
        EfiStatus exitBootServices(uintptr_t key) override;
        EfiStatus allocatePool(size_t size, void **buffer) override;
        EfiStatus freePool(void *buffer) override;
    };

    /// @brief Read the kernel image from the root of the boot volume.
    ///
    /// The image is read into pool memory that is never freed, it is copied to its
    /// load address before boot services exit.
    EfiStatus LoadKernelFile(EFI_HANDLE image, IBootServices& firmware, const CHAR16 *path, void **data, size_t *size);
}
