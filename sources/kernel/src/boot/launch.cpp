#include "boot/launch.hpp"

#include "arch/intrin.hpp"
#include "panic.hpp"

void boot::LaunchKernel(LaunchInfo info) {
    arch::Intrin::cli();

    arch::Intrin::enterKernel(arch::KernelEntry {
        .pageTableRoot = info.pageTableRoot.address,
        .stackTop = info.stackTop.address,
        .entry = info.entry.address,
    });

    CM_PANIC("Kernel entry returned.");
}
