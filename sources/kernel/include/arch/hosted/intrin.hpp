#pragma once

#include "arch/generic/intrin.hpp"

namespace arch {
    /// @brief Replaceable CPU operations for hosted builds.
    ///
    /// Tests install their own implementation to observe port traffic, interrupt
    /// state changes, and the final jump into the kernel.
    class IHostedIntrin {
    public:
        virtual ~IHostedIntrin() = default;

        virtual void nop() noexcept { }
        virtual void halt() noexcept { }
        virtual void cli() noexcept { }
        virtual void sti() noexcept { }
        virtual void outbyte(uint16_t, uint8_t) noexcept { }
        virtual uint8_t inbyte(uint16_t) noexcept { return 0xFF; }

        /// @brief Transfer control to the kernel.
        ///
        /// There is nothing to jump to in a hosted build, the default spins. Implementations
        /// may throw to unwind back into a test.
        virtual void enterKernel(KernelEntry) {
            for (;;) { }
        }

        static IHostedIntrin *GetDefault() noexcept {
            static IHostedIntrin sInstance;
            return &sInstance;
        }
    };

    struct HostedIntrin {
        static IHostedIntrin *gImpl;

        static void nop() noexcept {
            gImpl->nop();
        }

        static void halt() noexcept {
            gImpl->halt();
        }

        static void cli() noexcept {
            gImpl->cli();
        }

        static void sti() noexcept {
            gImpl->sti();
        }

        static void outbyte(uint16_t port, uint8_t value) noexcept {
            gImpl->outbyte(port, value);
        }

        static uint8_t inbyte(uint16_t port) noexcept {
            return gImpl->inbyte(port);
        }

        static void enterKernel(KernelEntry entry) {
            gImpl->enterKernel(entry);
        }
    };

    using Intrin = HostedIntrin;
}
