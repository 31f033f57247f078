#include "efi.hpp"
#include "console_appender.hpp"

#include "boot/bootloader.hpp"
#include "boot/error.hpp"

#include "logger/categories.hpp"
#include "memory/page_tables.hpp"

namespace efi = boot::efi;

constinit static efi::ConsoleAppender gConsoleAppender;

extern "C" EFI_STATUS EFIAPI efi_main(EFI_HANDLE image, EFI_SYSTEM_TABLE *system) {
    if (system == nullptr) {
        return EFI_LOAD_ERROR;
    }

    InitializeLib(image, system);

    if (system->ConOut != nullptr) {
        gConsoleAppender = efi::ConsoleAppender { system->ConOut };
        if (cm::LogQueue::addGlobalAppender(&gConsoleAppender) != OsStatusSuccess) {
            return EFI_OUT_OF_RESOURCES;
        }
    }

    if (system->BootServices == nullptr) {
        boot::DisplaySimpleErrorAndHalt("Boot services not available");
    }

    BootLog.infof("Initializing...");

    efi::EfiBootServices firmware { image, system->BootServices };

    boot::KernelImage kernel{};
    if (boot::EfiStatus status = efi::LoadKernelFile(image, firmware, (const CHAR16*)u"kernel.bin", (void**)&kernel.data, &kernel.size); boot::efi::isError(status)) {
        boot::DisplayErrorAndHalt("Failed to load kernel.bin from the boot volume", status);
    }

    BootLog.infof("Kernel loaded at ", kernel.data, " (", sm::bytes(kernel.size), ")");

    //
    // UEFI identity maps all memory, the window only needs to cover the hand-off layout
    // and the memory the page tables will map.
    //
    cm::PhysicalMemory memory = cm::PhysicalMemory::identity(cm::MemoryRange { 0zu, cm::kMaxIdentityMap });

    boot::BootMain(firmware, memory, kernel, &gConsoleAppender);
}
