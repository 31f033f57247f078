#include "memory/page_tables.hpp"

#include "logger/categories.hpp"


cm::PageTableBuilder::PageTableBuilder(const PhysicalMemory& memory, PageTableLayout layout)
    : mMemory(memory)
    , mLayout(layout)
{
    CM_CHECK(mMemory.covers(mLayout.range()), "Page table area is not accessible");
}

uint64_t cm::PageTableBuilder::build(uint64_t totalMemory) {
    uint64_t mapSize = std::min(ComputeIdentityMapSize(totalMemory), mLayout.capacity());
    uint64_t pageCount = mapSize / x64::kLargePageSize;
    size_t directoryCount = sm::roundup<uint64_t>(pageCount, x64::kEntryCount) / x64::kEntryCount;

    auto store = [&](PhysicalAddress address, x64::Entry entry) {
        OsStatus status = mMemory.store(address, entry);
        CM_CHECK(status == OsStatusSuccess, "Failed to write page table entry");
    };

    OsStatus status = mMemory.zero(MemoryRange { mLayout.pml4, mLayout.directory(directoryCount) });
    CM_CHECK(status == OsStatusSuccess, "Failed to clear page tables");

    x64::Entry root{};
    root.setAddress(mLayout.pdpt.address);
    root.setPresent(true);
    root.setWriteable(true);
    store(mLayout.pml4, root);

    for (size_t i = 0; i < directoryCount; i++) {
        x64::pdpte pdpte{};
        pdpte.setAddress(mLayout.directory(i).address);
        pdpte.setPresent(true);
        pdpte.setWriteable(true);
        store(mLayout.pdpt + (i * sizeof(x64::pdpte)), pdpte);

        uint64_t first = i * x64::kEntryCount;
        uint64_t last = std::min<uint64_t>(first + x64::kEntryCount, pageCount);
        for (uint64_t page = first; page < last; page++) {
            x64::pdte pdte{};
            pdte.setAddress(page * x64::kLargePageSize);
            pdte.setPresent(true);
            pdte.setWriteable(true);
            pdte.set2m(true);
            store(mLayout.directory(i) + ((page - first) * sizeof(x64::pdte)), pdte);
        }
    }

    MemLog.infof("Identity mapped ", sm::bytes(pageCount * x64::kLargePageSize), " with ", directoryCount, " page directories");

    return pageCount * x64::kLargePageSize;
}

OsStatus cm::CountMappedBytes(const PhysicalMemory& memory, const PageTableLayout& layout, uint64_t *bytes [[gnu::nonnull]]) {
    x64::pml4e root;
    if (OsStatus status = memory.load(layout.pml4, &root)) {
        return status;
    }

    if (!root.present()) {
        *bytes = 0;
        return OsStatusSuccess;
    }

    uint64_t pages = 0;
    for (size_t i = 0; i < layout.maxDirectories; i++) {
        x64::pdpte pdpte;
        if (OsStatus status = memory.load(layout.pdpt + (i * sizeof(x64::pdpte)), &pdpte)) {
            return status;
        }

        if (!pdpte.present()) {
            break;
        }

        for (size_t j = 0; j < x64::kEntryCount; j++) {
            x64::pdte pdte;
            if (OsStatus status = memory.load(layout.directory(i) + (j * sizeof(x64::pdte)), &pdte)) {
                return status;
            }

            if (!pdte.present()) {
                break;
            }

            pages += 1;
        }
    }

    *bytes = pages * x64::kLargePageSize;
    return OsStatusSuccess;
}

OsStatus cm::PageTables::build(const PhysicalMemory& memory, PageTableLayout layout, uint64_t totalMemory) {
    stdx::LockGuard guard(mLock);
    if (mInitialized) {
        return OsStatusAlreadyInitialized;
    }

    PageTableBuilder builder { memory, layout };
    mMappedBytes = builder.build(totalMemory);
    mLayout = layout;
    mInitialized = true;

    return OsStatusSuccess;
}

OsStatus cm::PageTables::adopt(const PhysicalMemory& memory, PageTableLayout layout) {
    stdx::LockGuard guard(mLock);
    if (mInitialized) {
        return OsStatusAlreadyInitialized;
    }

    uint64_t mapped = 0;
    if (OsStatus status = CountMappedBytes(memory, layout, &mapped)) {
        return status;
    }

    mMappedBytes = mapped;
    mLayout = layout;
    mInitialized = true;

    return OsStatusSuccess;
}

bool cm::PageTables::isInitialized() {
    stdx::LockGuard guard(mLock);
    return mInitialized;
}

cm::PhysicalAddress cm::PageTables::root() {
    stdx::LockGuard guard(mLock);
    return mLayout.pml4;
}

uint64_t cm::PageTables::mappedBytes() {
    stdx::LockGuard guard(mLock);
    return mMappedBytes;
}
