#include "util/format.hpp"
#include "util/memory.hpp"

#include <string.h>

using OsStatusFormat = cm::Format<OsStatusId>;

static constexpr const char *kUnitNames[sm::Memory::eCount] = {
    "b", "kb", "mb", "gb", "tb",
};

stdx::StringView sm::toString(char buffer[Memory::kStringSize], Memory value) {
    size_t bytes = value.bytes();
    if (bytes == 0) {
        memcpy(buffer, "0b", 2);
        return stdx::StringView(buffer, buffer + 2);
    }

    size_t total = bytes;
    char *ptr = buffer;

    // seperate each part with a +
    for (int fmt = Memory::eCount - 1; fmt >= 0; fmt--) {
        size_t size = total / Memory::kSizes[fmt];
        if (size > 0) {
            char num[stdx::NumericTraits<size_t>::kMaxDigits10];
            stdx::StringView result = cm::FormatInt(std::span(num), size, 10);
            memcpy(ptr, result.data(), result.count());
            ptr += result.count();

            size_t nameLength = strlen(kUnitNames[fmt]);
            memcpy(ptr, kUnitNames[fmt], nameLength);
            ptr += nameLength;

            total %= Memory::kSizes[fmt];

            if (total > 0) {
                *ptr++ = '+';
            }
        }
    }

    return stdx::StringView(buffer, ptr);
}

void OsStatusFormat::format(IOutStream& out, OsStatusId value) {
    auto result = [&](stdx::StringView message) {
        out.format(message, " (", cm::Hex(OsStatus(value)).pad(8, '0'), ")");
    };

    switch (value) {
    case OsStatusSuccess:
        result("Success");
        break;
    case OsStatusOutOfMemory:
        result("Out of memory");
        break;
    case OsStatusNotFound:
        result("Not found");
        break;
    case OsStatusInvalidInput:
        result("Invalid input");
        break;
    case OsStatusNotSupported:
        result("Not supported");
        break;
    case OsStatusAlreadyExists:
        result("Already exists");
        break;
    case OsStatusInvalidData:
        result("Invalid data");
        break;
    case OsStatusTimeout:
        result("Timeout");
        break;
    case OsStatusOutOfBounds:
        result("Out of bounds");
        break;
    case OsStatusInvalidAddress:
        result("Invalid address");
        break;
    case OsStatusInvalidSpan:
        result("Invalid span");
        break;
    case OsStatusDeviceFault:
        result("Device fault");
        break;
    case OsStatusDeviceBusy:
        result("Device busy");
        break;
    case OsStatusBufferTooSmall:
        result("Buffer too small");
        break;
    case OsStatusFirmwareError:
        result("Firmware error");
        break;
    case OsStatusEmptyMap:
        result("Empty memory map");
        break;
    case OsStatusInvalidFrame:
        result("Invalid frame");
        break;
    case OsStatusAlreadyInitialized:
        result("Already initialized");
        break;
    case OsStatusInvalidConfiguration:
        result("Invalid configuration");
        break;
    case OsStatusFrameAllocationFailed:
        result("Frame allocation failed");
        break;
    case OsStatusCorruptionDetected:
        result("Corruption detected");
        break;
    case OsStatusNoMemoryMap:
        result("No memory map");
        break;
    case OsStatusInvalidMemoryMap:
        result("Invalid memory map");
        break;
    default:
        result("Unknown");
        break;
    }
}
