#pragma once

#include "arch/generic/intrin.hpp"

namespace arch {
    struct IntrinX86_64 : GenericIntrin {
        [[gnu::always_inline, gnu::nodebug]]
        static void nop() noexcept {
            asm volatile("nop");
        }

        [[gnu::always_inline, gnu::nodebug]]
        static void halt() noexcept {
            asm volatile("hlt");
        }

        [[gnu::always_inline, gnu::nodebug]]
        static void cli() noexcept {
            asm volatile("cli");
        }

        [[gnu::always_inline, gnu::nodebug]]
        static void outbyte(uint16_t port, uint8_t data) noexcept {
            asm volatile("outb %b0, %w1" : : "a"(data), "Nd"(port));
        }

        [[gnu::always_inline, gnu::nodebug]]
        static uint8_t inbyte(uint16_t port) noexcept {
            uint8_t ret;
            asm volatile("inb %w1, %b0" : "=a"(ret) : "Nd"(port));
            return ret;
        }

        // The stack is replaced part way through, so this must be a single asm block
        // with no compiler generated code between the stack switch and the jump.
        [[gnu::always_inline, gnu::nodebug, noreturn]]
        static void enterKernel(KernelEntry entry) {
            asm volatile(
                "mov %0, %%cr3\n"
                "mov %1, %%rsp\n"
                "cld\n"
                "mov %2, %%rax\n"
                "push %%rax\n"
                "xor %%eax, %%eax\n"
                "xor %%ebx, %%ebx\n"
                "xor %%ecx, %%ecx\n"
                "xor %%edx, %%edx\n"
                "xor %%esi, %%esi\n"
                "xor %%edi, %%edi\n"
                "xor %%ebp, %%ebp\n"
                "xor %%r8d, %%r8d\n"
                "xor %%r9d, %%r9d\n"
                "xor %%r10d, %%r10d\n"
                "xor %%r11d, %%r11d\n"
                "xor %%r12d, %%r12d\n"
                "xor %%r13d, %%r13d\n"
                "xor %%r14d, %%r14d\n"
                "xor %%r15d, %%r15d\n"
                "ret\n"
                :
                : "r"(entry.pageTableRoot), "r"(entry.stackTop), "r"(entry.entry)
                : "memory"
            );
            __builtin_unreachable();
        }
    };

    using Intrin = IntrinX86_64;
}
