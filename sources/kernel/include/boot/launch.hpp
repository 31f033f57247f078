#pragma once

#include "memory/range.hpp"

namespace boot {
    struct LaunchInfo {
        cm::PhysicalAddress pageTableRoot;
        cm::PhysicalAddress stackTop;
        cm::PhysicalAddress entry;
    };

    /// @brief Switch to the kernel page tables and stack, then jump to the kernel.
    ///
    /// Interrupts are disabled first and stay disabled. Every general purpose register
    /// other than the stack pointer is zero at the kernel entry point.
    [[noreturn]]
    void LaunchKernel(LaunchInfo info);
}
