#include "boot/memory_map_reader.hpp"

#include "logger/categories.hpp"

using cm::MemoryRegion;
using cm::RegionKind;

boot::DescriptorView::DescriptorView(std::span<const std::byte> buffer, size_t stride)
    : mBuffer(buffer)
    , mStride(stride)
{
    CM_CHECK(stride >= sizeof(EfiMemoryDescriptor), "Descriptor stride is smaller than a descriptor");
}

boot::EfiMemoryDescriptor boot::DescriptorView::operator[](size_t index) const {
    CM_ASSERT(index < count());

    EfiMemoryDescriptor descriptor;
    __builtin_memcpy(&descriptor, mBuffer.data() + (index * mStride), sizeof(EfiMemoryDescriptor));
    return descriptor;
}

RegionKind boot::ClassifyDescriptor(uint32_t type) {
    switch (type) {
    case efi::eConventionalMemory:
    case efi::eLoaderCode:
    case efi::eLoaderData:
    case efi::eBootServicesCode:
    case efi::eBootServicesData:
        return RegionKind::eUsable;
    case efi::eAcpiReclaimMemory:
        return RegionKind::eAcpiReclaimable;
    case efi::eAcpiMemoryNvs:
        return RegionKind::eAcpiNvs;
    default:
        return RegionKind::eReserved;
    }
}

OsStatus boot::MemoryMapReader::query(DescriptorView *view, uintptr_t *key) {
    size_t size = kBufferSize;
    size_t descriptorSize = 0;
    uint32_t descriptorVersion = 0;

    mLastStatus = mFirmware.getMemoryMap(&size, mBuffer, key, &descriptorSize, &descriptorVersion);
    if (mLastStatus == efi::kBufferTooSmall) {
        BootLog.errorf("Memory map of ", sm::bytes(size), " does not fit in ", sm::bytes(kBufferSize), " buffer");
        return OsStatusBufferTooSmall;
    }

    if (mLastStatus != efi::kSuccess) {
        BootLog.errorf("GetMemoryMap failed: ", EfiStatusString(mLastStatus), " (", cm::Hex(mLastStatus), ")");
        return OsStatusFirmwareError;
    }

    if (size > kBufferSize) {
        return OsStatusBufferTooSmall;
    }

    if (descriptorSize < sizeof(EfiMemoryDescriptor)) {
        BootLog.errorf("Memory descriptor size ", descriptorSize, " is smaller than ", sizeof(EfiMemoryDescriptor));
        return OsStatusFirmwareError;
    }

    *view = DescriptorView(std::span(mBuffer, size), descriptorSize);
    return OsStatusSuccess;
}

OsStatus boot::MemoryMapReader::read(FirmwareMemoryMap *result [[gnu::nonnull]]) {
    DescriptorView view { {}, sizeof(EfiMemoryDescriptor) };
    uintptr_t key = 0;
    if (OsStatus status = query(&view, &key)) {
        return status;
    }

    size_t count = view.count();
    if (count == 0) {
        return OsStatusEmptyMap;
    }

    MemoryRegion staging[kMaxDescriptors];
    size_t used = 0;

    for (size_t i = 0; i < count; i++) {
        EfiMemoryDescriptor descriptor = view[i];
        if (descriptor.numberOfPages == 0) {
            continue;
        }

        uint64_t length;
        cm::PhysicalAddress end;
        if (__builtin_mul_overflow(descriptor.numberOfPages, efi::kPageSize, &length)
            || !cm::PhysicalAddress(descriptor.physicalStart).checkedAdd(length, &end)) {
            BootLog.warnf("Skipping descriptor ", i, " at ", cm::Hex(descriptor.physicalStart), " that overflows");
            continue;
        }

        staging[used++] = MemoryRegion::of(ClassifyDescriptor(descriptor.type), cm::MemoryRange { descriptor.physicalStart, end });
    }

    if (used == 0) {
        return OsStatusEmptyMap;
    }

    MemoryRegion normalized[kMaxDescriptors];
    size_t regions = 0;
    if (OsStatus status = cm::NormalizeRegions(std::span(staging, used), normalized, &regions)) {
        return status;
    }

    cm::MemoryMap map;
    if (OsStatus status = cm::MemoryMap::create(std::span(normalized, regions), &map)) {
        BootLog.errorf(regions, " regions do not fit in the memory map: ", OsStatusId(status));
        return status;
    }

    *result = FirmwareMemoryMap {
        .map = map,
        .mapKey = key,
        .descriptorCount = count,
        .descriptorSize = view.stride(),
        .lastStatus = mLastStatus,
    };

    return OsStatusSuccess;
}

OsStatus boot::MemoryMapReader::refreshMapKey(uintptr_t *key [[gnu::nonnull]]) {
    DescriptorView view { {}, sizeof(EfiMemoryDescriptor) };
    return query(&view, key);
}
