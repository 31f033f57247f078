#include <stdint.h>

#include "arch/intrin.hpp"

#include "logger/categories.hpp"
#include "logger/e9_appender.hpp"
#include "logger/serial_appender.hpp"

#include "handoff/handoff.hpp"
#include "panic.hpp"
#include "setup.hpp"
#include "uart.hpp"

using namespace cm;

constinit static cm::SerialAppender gSerialAppender;
constinit static cm::E9Appender gDebugPortAppender;

static void initSerialPort(ComPortInfo info) {
    SerialPort port;
    if (OsStatus status = SerialPort::create(info, &port)) {
        InitLog.warnf("Failed to open serial port ", Hex(info.port), ": ", OsStatusId(status));
        return;
    }

    if (OsStatus status = SerialAppender::create(port, &gSerialAppender)) {
        InitLog.warnf("Failed to create serial appender: ", OsStatusId(status));
        return;
    }

    if (OsStatus status = LogQueue::addGlobalAppender(&gSerialAppender)) {
        InitLog.warnf("Failed to add serial appender: ", OsStatusId(status));
    }
}

static void initDebugPort() {
    if (!E9Appender::isAvailable()) {
        return;
    }

    if (OsStatus status = LogQueue::addGlobalAppender(&gDebugPortAppender)) {
        InitLog.warnf("Failed to add debug port appender: ", OsStatusId(status));
    }
}

static void displayBootMode(const PhysicalMemory& memory) {
    BootMode mode;
    if (OsStatus status = DetectBootMode(memory, &mode)) {
        InitLog.warnf("Failed to detect boot mode: ", OsStatusId(status));
        return;
    }

    InitLog.infof("Boot mode: ", mode);
}

extern "C" [[noreturn]] void KmMain(void) {
    initDebugPort();
    initSerialPort(com::kDefaultPort);

    InitLog.infof("Entered kernel at ", kHandoffLayout.kernelBase, ", hand-off layout version ", kHandoffLayout.version);

    //
    // The bootloader identity maps at least the first 128MiB, the window is narrowed to
    // the mapped part once the page tables have been walked.
    //
    PhysicalMemory memory = PhysicalMemory::identity(MemoryRange { 0zu, kMaxIdentityMap });

    KernelMemory kernel;
    if (OsStatus status = SetupKernelMemory(memory, kHandoffLayout, &kernel)) {
        InitLog.fatalf("Kernel memory setup failed: ", OsStatusId(status));
        CM_PANIC("Failed to setup kernel memory.");
    }

    if (OsStatus status = VerifyHeap(kernel.heap)) {
        InitLog.fatalf("Heap self test failed: ", OsStatusId(status));
        CM_PANIC("Kernel heap is not usable.");
    }

    InitGlobalAllocator(&kernel.heap);

    displayBootMode(memory);

    InitLog.infof("Kernel initialized, halting.");
    CmHalt();
}
