#include <gtest/gtest.h>

#include "boot/handoff.hpp"
#include "handoff/memory_map.hpp"

#include "test_memory.hpp"

using cm::E820Entry;
using cm::MemoryRegion;
using cm::RegionKind;

class HandoffWriteTest : public testing::Test {
public:
    TestMemory memory { 0x0uz, 0x100000, 0xFF };
    cm::HandoffLayout layout = cm::kHandoffLayout;
    cm::MemoryMap map;

    void SetUp() override {
        MemoryRegion regions[] = {
            MemoryRegion::of(RegionKind::eUsable, 0x0uz, 0x9F000),
            MemoryRegion::of(RegionKind::eReserved, 0xF0000, 0x10000),
            MemoryRegion::of(RegionKind::eUsable, 0x100000, 0x3FF00000),
            MemoryRegion::of(RegionKind::eAcpiNvs, 0x40000000, 0x10000),
            MemoryRegion::of(RegionKind::eBad, 0x40010000, 0x1000),
        };

        ASSERT_EQ(cm::MemoryMap::create(regions, &map), OsStatusSuccess);
    }

    uint32_t Count() {
        return *memory.host<uint32_t>(layout.memoryMap);
    }

    E820Entry Entry(size_t index) {
        E820Entry entry;
        memcpy(&entry, memory.host(layout.memoryMap + sizeof(uint32_t) + (index * sizeof(E820Entry))), sizeof(entry));
        return entry;
    }
};

TEST(E820TypeTest, Kinds) {
    ASSERT_EQ(boot::E820Type(RegionKind::eUsable), cm::e820::kUsable);
    ASSERT_EQ(boot::E820Type(RegionKind::eReserved), cm::e820::kReserved);
    ASSERT_EQ(boot::E820Type(RegionKind::eAcpiReclaimable), cm::e820::kAcpiReclaimable);
    ASSERT_EQ(boot::E820Type(RegionKind::eAcpiNvs), cm::e820::kAcpiNvs);
    ASSERT_EQ(boot::E820Type(RegionKind::eBad), cm::e820::kBad);
    ASSERT_EQ(boot::E820Type(RegionKind::eUnknown), cm::e820::kReserved);
}

TEST_F(HandoffWriteTest, Write) {
    ASSERT_EQ(boot::WriteHandoffMemoryMap(memory.physical(), map, layout), OsStatusSuccess);

    ASSERT_EQ(Count(), 5);

    E820Entry usable = Entry(2);
    ASSERT_EQ(usable.base, 0x100000);
    ASSERT_EQ(usable.length, 0x3FF00000);
    ASSERT_EQ(usable.type, cm::e820::kUsable);
    ASSERT_EQ(usable.attribute, cm::e820::kEnabled);

    ASSERT_EQ(Entry(3).type, cm::e820::kAcpiNvs);
    ASSERT_EQ(Entry(4).type, cm::e820::kBad);
}

TEST_F(HandoffWriteTest, KernelReadsWhatBootloaderWrote) {
    ASSERT_EQ(boot::WriteHandoffMemoryMap(memory.physical(), map, layout), OsStatusSuccess);

    cm::MemoryMap parsed;
    ASSERT_EQ(cm::ParseHandoffMemoryMap(memory.physical(), layout, &parsed), OsStatusSuccess);

    ASSERT_EQ(parsed.count(), map.count());
    for (size_t i = 0; i < map.count(); i++) {
        ASSERT_EQ(parsed[i], map[i]) << "at " << i;
    }

    ASSERT_EQ(parsed.totalUsableBytes(), map.totalUsableBytes());
}

TEST_F(HandoffWriteTest, Truncated) {
    layout.maxMapEntries = 2;

    ASSERT_EQ(boot::WriteHandoffMemoryMap(memory.physical(), map, layout), OsStatusSuccess);
    ASSERT_EQ(Count(), 2);
    ASSERT_EQ(Entry(1).type, cm::e820::kReserved);

    // The slot after the last written entry is untouched
    ASSERT_EQ(Entry(2).base, UINT64_MAX);
}

TEST_F(HandoffWriteTest, OutsideMemory) {
    TestMemory small { 0x0uz, 0x9000 };

    ASSERT_EQ(boot::WriteHandoffMemoryMap(small.physical(), map, layout), OsStatusInvalidSpan);
}
