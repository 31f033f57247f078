#pragma once

#include <stdint.h>

namespace arch {
    /// @brief Register state the kernel entry sequence installs.
    ///
    /// All general purpose registers other than the stack pointer are cleared
    /// before control reaches @a entry.
    struct KernelEntry {
        uintptr_t pageTableRoot;
        uintptr_t stackTop;
        uintptr_t entry;
    };

    struct GenericIntrin {
        /// @brief No operation. Does nothing.
        [[gnu::error("nop not implemented by platform")]]
        static void nop() noexcept;

        /// @brief Halt the CPU until the next interrupt.
        [[gnu::error("hlt not implemented by platform")]]
        static void halt() noexcept;

        /// @brief Disable interrupts.
        [[gnu::error("cli not implemented by platform")]]
        static void cli() noexcept;

        [[gnu::error("outbyte not implemented by platform")]]
        static void outbyte(uint16_t port, uint8_t value) noexcept;

        [[gnu::error("inbyte not implemented by platform")]]
        static uint8_t inbyte(uint16_t port) noexcept;

        /// @brief Switch to the kernel address space and stack, then jump to the kernel.
        [[gnu::error("enterKernel not implemented by platform"), noreturn]]
        static void enterKernel(KernelEntry entry);
    };
}
