#pragma once

#include "boot/firmware.hpp"
#include "boot/kernel_image.hpp"

#include "logger/appender.hpp"
#include "memory/physical_memory.hpp"

namespace boot {
    /// @brief Prepare the machine for the kernel and jump to it.
    ///
    /// Reads the memory map, writes the hand-off map, relocates the kernel, builds the
    /// identity map, and exits boot services. The firmware console appender is replaced by
    /// a serial appender once boot services are gone. Any failure halts.
    ///
    /// @param firmware The firmware boot services.
    /// @param memory Access to physical memory covering the hand-off layout.
    /// @param image The kernel image as loaded by firmware.
    /// @param console The appender writing to the firmware console, may be null.
    [[noreturn]]
    void BootMain(IBootServices& firmware, const cm::PhysicalMemory& memory, KernelImage image, cm::ILogAppender *console);
}
