#include "boot/bootloader.hpp"

#include "boot/error.hpp"
#include "boot/handoff.hpp"
#include "boot/launch.hpp"
#include "boot/memory_map_reader.hpp"
#include "boot/teardown.hpp"

#include "logger/categories.hpp"
#include "logger/serial_appender.hpp"
#include "memory/page_tables.hpp"
#include "uart.hpp"

using namespace boot;

constinit static cm::SerialAppender gSerialAppender;

static void displayMemoryMap(const FirmwareMemoryMap& firmware) {
    BootLog.infof("Memory map: ", firmware.descriptorCount, " descriptors of ", firmware.descriptorSize, " bytes, ", firmware.map.count(), " regions");
    for (const cm::MemoryRegion& region : firmware.map.regions()) {
        BootLog.println("| ", region.range, " | ", region.kind);
    }

    BootLog.infof("Usable memory: ", sm::bytes(firmware.map.totalUsableBytes()));
}

//
// Boot services are gone, so the firmware console must not be written to again.
//
static void switchToSerialLog(cm::ILogAppender *console) {
    if (console != nullptr) {
        cm::LogQueue::removeGlobalAppender(console);
    }

    // If any of these fail there is nothing left to report the failure to.
    cm::SerialPort port;
    if (cm::SerialPort::create(cm::com::kDefaultPort, &port) != OsStatusSuccess) {
        return;
    }

    if (cm::SerialAppender::create(port, &gSerialAppender) != OsStatusSuccess) {
        return;
    }

    (void)cm::LogQueue::addGlobalAppender(&gSerialAppender);
}

void boot::BootMain(IBootServices& firmware, const cm::PhysicalMemory& memory, KernelImage image, cm::ILogAppender *console) {
    const cm::HandoffLayout& layout = cm::kHandoffLayout;

    BootLog.infof("CosmOS bootloader, hand-off layout version ", layout.version);

    MemoryMapReader reader { firmware };
    FirmwareMemoryMap map{};
    if (OsStatus status = reader.read(&map)) {
        BootLog.errorf("Failed to read memory map: ", OsStatusId(status));
        DisplayErrorAndHalt("Failed to retrieve UEFI memory map", reader.lastStatus());
    }

    displayMemoryMap(map);

    if (OsStatus status = WriteHandoffMemoryMap(memory, map.map, layout)) {
        BootLog.errorf("Failed to write memory map: ", OsStatusId(status));
        DisplaySimpleErrorAndHalt("Failed to store hand-off memory map");
    }

    if (OsStatus status = RelocateKernel(memory, image, layout)) {
        BootLog.errorf("Failed to relocate kernel: ", OsStatusId(status));
        DisplaySimpleErrorAndHalt("Failed to copy kernel to its load address");
    }

    cm::PageTables tables;
    if (OsStatus status = tables.build(memory, cm::PageTableLayout::of(layout), map.map.memoryCeiling().address)) {
        BootLog.errorf("Failed to build page tables: ", OsStatusId(status));
        DisplaySimpleErrorAndHalt("Failed to build page tables");
    }

    BootLog.infof("Exiting boot services");

    ExitBootServicesState state = ExitBootServices(firmware, reader, map.mapKey);
    if (state.phase != ExitPhase::eSuccess) {
        DisplayErrorAndHalt("Failed to exit UEFI boot services", state.lastStatus);
    }

    switchToSerialLog(console);

    BootLog.infof("Boot services exited after ", state.attempts, " attempts, jumping to kernel at ", layout.kernelBase);

    LaunchKernel(LaunchInfo {
        .pageTableRoot = tables.root(),
        .stackTop = layout.stackTop,
        .entry = layout.kernelBase,
    });
}
