#include "boot/error.hpp"

#include "logger/categories.hpp"
#include "panic.hpp"

void boot::DisplayErrorAndHalt(stdx::StringView operation, EfiStatus status, std::source_location where) {
    BootLog.fatalf("BOOTLOADER ERROR");
    BootLog.fatalf("Operation: ", operation);
    BootLog.fatalf("Status Code: ", cm::Hex(status).pad(16));
    BootLog.fatalf("Description: ", EfiStatusString(status));
    BootLog.fatalf("System halted.");
    cm::BugCheck(operation, where);
}

void boot::DisplaySimpleErrorAndHalt(stdx::StringView message, std::source_location where) {
    BootLog.fatalf("BOOTLOADER ERROR");
    BootLog.fatalf(message);
    BootLog.fatalf("System halted.");
    cm::BugCheck(message, where);
}
