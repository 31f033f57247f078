#include "efi.hpp"

#include "logger/categories.hpp"

namespace efi = boot::efi;

using boot::EfiStatus;

EfiStatus efi::EfiBootServices::getMemoryMap(size_t *size, void *buffer, uintptr_t *key, size_t *descriptorSize, uint32_t *descriptorVersion) {
    UINTN mapSize = *size;
    UINTN mapKey = 0;
    UINTN stride = 0;
    UINT32 version = 0;

    EFI_STATUS status = uefi_call_wrapper(mBootServices->GetMemoryMap, 5, &mapSize, (EFI_MEMORY_DESCRIPTOR*)buffer, &mapKey, &stride, &version);

    *size = mapSize;
    *key = mapKey;
    *descriptorSize = stride;
    *descriptorVersion = version;

    return status;
}

EfiStatus efi::EfiBootServices::exitBootServices(uintptr_t key) {
    return uefi_call_wrapper(mBootServices->ExitBootServices, 2, mImageHandle, UINTN(key));
}

EfiStatus efi::EfiBootServices::allocatePool(size_t size, void **buffer) {
    return uefi_call_wrapper(mBootServices->AllocatePool, 3, EfiLoaderData, UINTN(size), buffer);
}

EfiStatus efi::EfiBootServices::freePool(void *buffer) {
    return uefi_call_wrapper(mBootServices->FreePool, 1, buffer);
}

static void CloseFile(EFI_FILE_HANDLE file) {
    EFI_STATUS status = uefi_call_wrapper(file->Close, 1, file);
    if (EFI_ERROR(status)) {
        BootLog.warnf("Failed to close file: ", boot::EfiStatusString(status));
    }
}

EfiStatus efi::LoadKernelFile(EFI_HANDLE image, IBootServices& firmware, const CHAR16 *path, void **data, size_t *size) {
    EFI_LOADED_IMAGE *loaded = nullptr;
    EFI_STATUS status = uefi_call_wrapper(BS->HandleProtocol, 3, image, &LoadedImageProtocol, (void**)&loaded);
    if (EFI_ERROR(status)) {
        return status;
    }

    EFI_FILE_HANDLE root = LibOpenRoot(loaded->DeviceHandle);
    if (root == nullptr) {
        return kNotFound;
    }

    EFI_FILE_HANDLE file = nullptr;
    status = uefi_call_wrapper(root->Open, 5, root, &file, (CHAR16*)path, EFI_FILE_MODE_READ, UINT64(0));
    CloseFile(root);
    if (EFI_ERROR(status)) {
        return status;
    }

    EFI_FILE_INFO *info = LibFileInfo(file);
    if (info == nullptr) {
        CloseFile(file);
        return kDeviceError;
    }

    UINTN fileSize = info->FileSize;
    EfiStatus freeStatus = firmware.freePool(info);
    if (isError(freeStatus)) {
        CloseFile(file);
        return freeStatus;
    }

    if (fileSize == 0) {
        CloseFile(file);
        return kLoadError;
    }

    void *buffer = nullptr;
    if (EfiStatus allocStatus = firmware.allocatePool(fileSize, &buffer); isError(allocStatus)) {
        CloseFile(file);
        return allocStatus;
    }

    UINTN readSize = fileSize;
    status = uefi_call_wrapper(file->Read, 3, file, &readSize, buffer);
    CloseFile(file);

    if (EFI_ERROR(status) || readSize != fileSize) {
        EfiStatus releaseStatus = firmware.freePool(buffer);
        if (isError(releaseStatus)) {
            return releaseStatus;
        }

        return EFI_ERROR(status) ? status : kLoadError;
    }

    *data = buffer;
    *size = fileSize;
    return kSuccess;
}
