#pragma once

#include <cosmos/status.h>

#include "handoff/handoff.hpp"
#include "memory/physical_memory.hpp"

#include <stddef.h>

namespace boot {
    /// @brief The kernel image as loaded by firmware, before relocation.
    struct KernelImage {
        const void *data;
        size_t size;
    };

    /// @brief The number of leading bytes compared after the kernel is copied.
    static constexpr size_t kKernelVerifySize = 16;

    /// @brief Copy the kernel to its load address and verify the copy.
    ///
    /// @retval OsStatusInvalidInput The image is null or empty.
    /// @retval OsStatusOutOfBounds The image is larger than the layout allows.
    /// @retval OsStatusCorruptionDetected The copy does not match the image.
    OsStatus RelocateKernel(const cm::PhysicalMemory& memory, KernelImage image, const cm::HandoffLayout& layout);
}
