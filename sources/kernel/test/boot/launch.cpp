#include <gtest/gtest.h>

#include "boot/launch.hpp"

#include "ports.hpp"

using kmtest::TestIntrin;

TEST(LaunchTest, EntersKernelWithInterruptsDisabled) {
    TestIntrin intrin;
    kmtest::ScopedIntrin scope { &intrin };

    try {
        boot::LaunchKernel(boot::LaunchInfo {
            .pageTableRoot = 0x70000,
            .stackTop = 0xA0000,
            .entry = 0x200000,
        });
        FAIL() << "LaunchKernel returned";
    } catch (const TestIntrin::KernelEntered& entered) {
        ASSERT_FALSE(entered.interruptsEnabled);
        ASSERT_EQ(entered.entry.pageTableRoot, 0x70000);
        ASSERT_EQ(entered.entry.stackTop, 0xA0000);
        ASSERT_EQ(entered.entry.entry, 0x200000);
    }

    ASSERT_EQ(intrin.cliCount, 1);
    ASSERT_FALSE(intrin.interruptsEnabled);
}
