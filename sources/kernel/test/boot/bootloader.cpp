#include <gtest/gtest.h>

#include "boot/bootloader.hpp"
#include "boot/error.hpp"

#include "handoff/memory_map.hpp"
#include "logger/queue.hpp"
#include "arch/paging.hpp"

#include "firmware_stub.hpp"
#include "ports.hpp"
#include "test_memory.hpp"

using namespace boot;
using kmtest::TestIntrin;

class ConsoleAppender final : public cm::ILogAppender {
public:
    std::vector<std::string> lines;

    void write(const cm::LogMessageView& message) override {
        lines.emplace_back(std::string_view(message.message));
    }
};

class BootMainTest : public testing::Test {
public:
    kmtest::StubBootServices firmware;
    TestMemory memory { 0x0uz, 0x400000 };
    std::vector<uint8_t> kernel;

    TestIntrin intrin;
    kmtest::ScopedIntrin scope { &intrin };

    ConsoleAppender console;

    void SetUp() override {
        firmware.add(efi::eBootServicesCode, 0x0, 0x9F);
        firmware.add(efi::eReservedMemoryType, 0xF0000, 0x10);
        firmware.add(efi::eConventionalMemory, 0x100000, 0x7F00);

        kernel.resize(0x2000);
        for (size_t i = 0; i < kernel.size(); i++) {
            kernel[i] = uint8_t(0xC3 ^ i);
        }

        ASSERT_EQ(cm::LogQueue::addGlobalAppender(&console), OsStatusSuccess);
    }

    void TearDown() override {
        cm::LogQueue::removeGlobalAppender(&console);
    }

    KernelImage Image() const {
        return KernelImage { kernel.data(), kernel.size() };
    }

    TestIntrin::KernelEntered Boot() {
        try {
            BootMain(firmware, memory.physical(), Image(), &console);
        } catch (const TestIntrin::KernelEntered& entered) {
            return entered;
        }

        ADD_FAILURE() << "BootMain returned";
        return {};
    }
};

TEST_F(BootMainTest, HandsOffToKernel) {
    TestIntrin::KernelEntered entered = Boot();

    ASSERT_FALSE(entered.interruptsEnabled);
    ASSERT_EQ(entered.entry.entry, cm::kHandoffLayout.kernelBase.address);
    ASSERT_EQ(entered.entry.stackTop, cm::kHandoffLayout.stackTop.address);
    ASSERT_EQ(entered.entry.pageTableRoot, cm::kHandoffLayout.pml4.address);

    ASSERT_TRUE(firmware.exited);
    ASSERT_EQ(firmware.exitKeys.size(), 1);
    ASSERT_EQ(intrin.cliCount, 1);
}

TEST_F(BootMainTest, KernelCopied) {
    Boot();

    ASSERT_EQ(memcmp(memory.host(cm::kHandoffLayout.kernelBase), kernel.data(), kernel.size()), 0);
}

TEST_F(BootMainTest, HandoffMapWritten) {
    Boot();

    cm::MemoryMap map;
    ASSERT_EQ(cm::ParseHandoffMemoryMap(memory.physical(), cm::kHandoffLayout, &map), OsStatusSuccess);

    ASSERT_EQ(map.count(), 3);
    ASSERT_EQ(map[0], cm::MemoryRegion::of(cm::RegionKind::eUsable, 0x0uz, 0x9F000));
    ASSERT_EQ(map[1].kind, cm::RegionKind::eReserved);
    ASSERT_EQ(map[2], cm::MemoryRegion::of(cm::RegionKind::eUsable, 0x100000, 0x7F00000));
}

TEST_F(BootMainTest, IdentityMapBuilt) {
    Boot();

    // The map ends at 128MiB, which needs a single page directory
    x64::PageMapLevel4 *pml4 = memory.host<x64::PageMapLevel4>(cm::kHandoffLayout.pml4);
    ASSERT_TRUE(pml4->entries[0].present());
    ASSERT_EQ(pml4->entries[0].address(), cm::kHandoffLayout.pdpt.address);

    x64::PageMapLevel3 *pdpt = memory.host<x64::PageMapLevel3>(cm::kHandoffLayout.pdpt);
    ASSERT_TRUE(pdpt->entries[0].present());
    ASSERT_FALSE(pdpt->entries[1].present());
}

TEST_F(BootMainTest, ExitRetried) {
    firmware.exitResults = { efi::kInvalidParameter };

    TestIntrin::KernelEntered entered = Boot();
    ASSERT_EQ(entered.entry.entry, cm::kHandoffLayout.kernelBase.address);

    ASSERT_EQ(firmware.exitKeys.size(), 2);
    ASSERT_EQ(firmware.exitKeys.back(), firmware.issuedKeys.back());
}

TEST_F(BootMainTest, ConsoleDetachedAfterExit) {
    Boot();

    ASSERT_FALSE(console.lines.empty());
    ASSERT_EQ(console.lines.front().find("CosmOS bootloader"), 0);

    // Exiting boot services is the last thing the firmware console sees
    ASSERT_EQ(console.lines.back(), "Exiting boot services");
}

TEST_F(BootMainTest, MemoryMapFailureHalts) {
    firmware.mapStatus = efi::kDeviceError;

    ASSERT_DEATH(Boot(), "");
}

TEST_F(BootMainTest, ExitAlwaysRejectedHalts) {
    firmware.exitResults = { efi::kInvalidParameter, efi::kInvalidParameter, efi::kInvalidParameter };

    ASSERT_DEATH(Boot(), "");
}

TEST_F(BootMainTest, MissingKernelHalts) {
    kernel.clear();

    ASSERT_DEATH(Boot(), "");
}

TEST(BootErrorTest, DisplayErrorAndHalt) {
    ASSERT_DEATH(DisplayErrorAndHalt("Failed to retrieve UEFI memory map", efi::kDeviceError), "");
}

TEST(BootErrorTest, DisplaySimpleErrorAndHalt) {
    ASSERT_DEATH(DisplaySimpleErrorAndHalt("Failed to build page tables"), "");
}

TEST(EfiStatusTest, Strings) {
    ASSERT_EQ(std::string_view(EfiStatusString(efi::kSuccess)), "Success");
    ASSERT_EQ(std::string_view(EfiStatusString(efi::kInvalidParameter)), "Invalid Parameter");
    ASSERT_EQ(std::string_view(EfiStatusString(efi::kBufferTooSmall)), "Buffer Too Small");
    ASSERT_EQ(std::string_view(EfiStatusString(efi::kDeviceError)), "Device Error");
}
