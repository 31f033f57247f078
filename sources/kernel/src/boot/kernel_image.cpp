#include "boot/kernel_image.hpp"

#include "logger/categories.hpp"

#include <algorithm>
#include <span>

OsStatus boot::RelocateKernel(const cm::PhysicalMemory& memory, KernelImage image, const cm::HandoffLayout& layout) {
    if (image.data == nullptr || image.size == 0) {
        BootLog.errorf("Kernel image is empty");
        return OsStatusInvalidInput;
    }

    if (image.size > layout.kernelMaxSize) {
        BootLog.errorf("Kernel image of ", sm::bytes(image.size), " exceeds maximum of ", sm::bytes(layout.kernelMaxSize));
        return OsStatusOutOfBounds;
    }

    std::span<const std::byte> bytes { static_cast<const std::byte*>(image.data), image.size };
    if (OsStatus status = memory.write(layout.kernelBase, bytes)) {
        return status;
    }

    bool equal = false;
    if (OsStatus status = memory.compare(layout.kernelBase, bytes.first(std::min(kKernelVerifySize, image.size)), &equal)) {
        return status;
    }

    if (!equal) {
        BootLog.errorf("Kernel copy at ", layout.kernelBase, " does not match the image");
        return OsStatusCorruptionDetected;
    }

    BootLog.infof("Kernel of ", sm::bytes(image.size), " copied to ", layout.kernelBase);
    return OsStatusSuccess;
}
