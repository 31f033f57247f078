#include "memory/physical_memory.hpp"

#include <string.h>

OsStatus cm::PhysicalMemory::resolve(PhysicalAddress address, size_t size, size_t align, std::byte **result) const {
    PhysicalAddress end;
    if (!address.checkedAdd(size, &end)) {
        return OsStatusInvalidSpan;
    }

    if (!covers(MemoryRange { address, end })) {
        return OsStatusInvalidSpan;
    }

    if (!address.isAlignedTo(align)) {
        return OsStatusInvalidAddress;
    }

    *result = reinterpret_cast<std::byte*>(address.address + mSlide);
    return OsStatusSuccess;
}

OsStatus cm::PhysicalMemory::read(PhysicalAddress address, std::span<std::byte> dst) const {
    std::byte *ptr = nullptr;
    if (OsStatus status = resolve(address, dst.size_bytes(), 1, &ptr)) {
        return status;
    }

    memcpy(dst.data(), ptr, dst.size_bytes());
    return OsStatusSuccess;
}

OsStatus cm::PhysicalMemory::write(PhysicalAddress address, std::span<const std::byte> src) const {
    std::byte *ptr = nullptr;
    if (OsStatus status = resolve(address, src.size_bytes(), 1, &ptr)) {
        return status;
    }

    memcpy(ptr, src.data(), src.size_bytes());
    return OsStatusSuccess;
}

OsStatus cm::PhysicalMemory::fill(MemoryRange range, uint8_t value) const {
    if (!range.isValid()) {
        return OsStatusInvalidSpan;
    }

    std::byte *ptr = nullptr;
    if (OsStatus status = resolve(range.front, range.size(), 1, &ptr)) {
        return status;
    }

    memset(ptr, value, range.size());
    return OsStatusSuccess;
}

OsStatus cm::PhysicalMemory::zero(MemoryRange range) const {
    return fill(range, 0);
}

OsStatus cm::PhysicalMemory::compare(PhysicalAddress address, std::span<const std::byte> expected, bool *equal [[gnu::nonnull]]) const {
    std::byte *ptr = nullptr;
    if (OsStatus status = resolve(address, expected.size_bytes(), 1, &ptr)) {
        return status;
    }

    *equal = memcmp(ptr, expected.data(), expected.size_bytes()) == 0;
    return OsStatusSuccess;
}

OsStatus cm::PhysicalMemory::map(MemoryRange range, void **result [[gnu::nonnull]]) const {
    if (!range.isValid()) {
        return OsStatusInvalidSpan;
    }

    std::byte *ptr = nullptr;
    if (OsStatus status = resolve(range.front, range.size(), 1, &ptr)) {
        return status;
    }

    *result = ptr;
    return OsStatusSuccess;
}
