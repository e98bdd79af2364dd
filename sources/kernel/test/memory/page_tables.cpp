#include <gtest/gtest.h>

#include "memory/page_tables.hpp"

#include "test_memory.hpp"

using vsp::PageFlags;

class PageTablesTest : public testing::Test {
public:
    static constexpr size_t kPages = 64;

    void SetUp() override {
        OsStatus status = vsp::PageAllocator::create(memory.range(), memory.window(), &heap, &allocator);
        ASSERT_EQ(status, OsStatusSuccess);

        status = vsp::PageTables::create(&allocator, &tables);
        ASSERT_EQ(status, OsStatusSuccess);
    }

    sm::PhysicalAddress frame() {
        sm::PhysicalAddress result;
        EXPECT_EQ(allocator.allocate(&result), OsStatusSuccess);
        return result;
    }

    TestMemory memory { vsp::PageBytes(kPages) };
    SynchronizedTestHeap heap;
    vsp::PageAllocator allocator;
    vsp::PageTables tables;
};

TEST_F(PageTablesTest, Construct) {
    EXPECT_TRUE(tables.isValid());
    EXPECT_EQ(tables.tableCount(), 0);
    EXPECT_TRUE(allocator.contains(tables.root()));
    EXPECT_EQ(allocator.stats().freePages, kPages - 1);
}

TEST_F(PageTablesTest, MapPage) {
    sm::PhysicalAddress paddr = frame();
    sm::VirtualAddress vaddr { 0x400000 };

    ASSERT_EQ(tables.map(vaddr, paddr, PageFlags::eUserData), OsStatusSuccess);
    EXPECT_EQ(tables.tableCount(), 1);

    x86::pte pte = tables.resolve(vaddr);
    EXPECT_TRUE(pte.present());
    EXPECT_TRUE(pte.writeable());
    EXPECT_TRUE(pte.user());
    EXPECT_EQ(pte.address(), paddr.address);

    EXPECT_EQ(tables.getBackingAddress(vaddr + 0x123), paddr + 0x123);
    EXPECT_EQ(tables.getBackingAddress(vaddr + x86::kPageSize), sm::PhysicalAddress::invalid());
}

TEST_F(PageTablesTest, SharedTable) {
    ASSERT_EQ(tables.map(sm::VirtualAddress(0x1000), frame(), PageFlags::eUserRead), OsStatusSuccess);
    ASSERT_EQ(tables.map(sm::VirtualAddress(0x3ff000), frame(), PageFlags::eUserRead), OsStatusSuccess);
    EXPECT_EQ(tables.tableCount(), 1);

    ASSERT_EQ(tables.map(sm::VirtualAddress(0x400000), frame(), PageFlags::eUserRead), OsStatusSuccess);
    EXPECT_EQ(tables.tableCount(), 2);
}

TEST_F(PageTablesTest, Unmap) {
    sm::PhysicalAddress paddr = frame();
    sm::VirtualAddress vaddr { 0x5000 };

    ASSERT_EQ(tables.map(vaddr, paddr, PageFlags::eUserData), OsStatusSuccess);

    x86::pte old = tables.unmap(vaddr);
    EXPECT_TRUE(old.present());
    EXPECT_EQ(old.address(), paddr.address);
    EXPECT_FALSE(tables.resolve(vaddr).present());

    EXPECT_FALSE(tables.unmap(sm::VirtualAddress(0x8000'0000)).present());
}

TEST_F(PageTablesTest, Protect) {
    sm::VirtualAddress base { 0x10000 };
    for (size_t i = 0; i < 4; i++) {
        ASSERT_EQ(tables.map(base + vsp::PageBytes(i), frame(), PageFlags::eUserData), OsStatusSuccess);
    }

    tables.protect(vsp::VirtualRange::of(base + vsp::PageBytes(1), vsp::PageBytes(2)), PageFlags::eUserRead);

    EXPECT_TRUE(tables.resolve(base).writeable());
    EXPECT_FALSE(tables.resolve(base + vsp::PageBytes(1)).writeable());
    EXPECT_FALSE(tables.resolve(base + vsp::PageBytes(2)).writeable());
    EXPECT_TRUE(tables.resolve(base + vsp::PageBytes(3)).writeable());

    // Protection never maps new pages.
    tables.protect(vsp::VirtualRange::of(base + vsp::PageBytes(8), vsp::PageBytes(8)), PageFlags::eUserData);
    EXPECT_FALSE(tables.resolve(base + vsp::PageBytes(8)).present());
}

TEST_F(PageTablesTest, ForEachMapping) {
    sm::VirtualAddress first { 0x2000 };
    sm::VirtualAddress second { 0x802000 };
    ASSERT_EQ(tables.map(first, frame(), PageFlags::eUserData), OsStatusSuccess);
    ASSERT_EQ(tables.map(second, frame(), PageFlags::eUserData), OsStatusSuccess);

    std::vector<sm::VirtualAddress> pages;
    tables.forEachMapping(vsp::VirtualRange { sm::VirtualAddress(0x1000), sm::VirtualAddress(0x1000000) }, [&](sm::VirtualAddress page, x86::pte pte) {
        EXPECT_TRUE(pte.present());
        pages.push_back(page);
    });

    ASSERT_EQ(pages.size(), 2);
    EXPECT_EQ(pages[0], first);
    EXPECT_EQ(pages[1], second);
}

TEST_F(PageTablesTest, Clone) {
    sm::PhysicalAddress paddr = frame();
    sm::VirtualAddress vaddr { 0x7000 };
    ASSERT_EQ(tables.map(vaddr, paddr, PageFlags::eUserData), OsStatusSuccess);

    vsp::PageTables copy;
    ASSERT_EQ(vsp::PageTables::clone(tables, &copy), OsStatusSuccess);
    EXPECT_NE(copy.root(), tables.root());
    EXPECT_EQ(copy.tableCount(), tables.tableCount());
    EXPECT_EQ(copy.resolve(vaddr).underlying, tables.resolve(vaddr).underlying);

    // The copies are independent.
    copy.unmap(vaddr);
    EXPECT_TRUE(tables.resolve(vaddr).present());
}

TEST_F(PageTablesTest, CloneOutOfMemory) {
    ASSERT_EQ(tables.map(sm::VirtualAddress(0x1000), frame(), PageFlags::eUserData), OsStatusSuccess);
    ASSERT_EQ(tables.map(sm::VirtualAddress(0x400000), frame(), PageFlags::eUserData), OsStatusSuccess);

    // Leave room for the directory and one table.
    std::vector<sm::PhysicalAddress> drained;
    while (allocator.stats().freePages > 2) {
        drained.push_back(frame());
    }

    size_t before = allocator.stats().freePages;
    vsp::PageTables copy;
    EXPECT_EQ(vsp::PageTables::clone(tables, &copy), OsStatusOutOfMemory);
    EXPECT_FALSE(copy.isValid());
    EXPECT_EQ(allocator.stats().freePages, before);

    for (sm::PhysicalAddress it : drained) {
        allocator.free(it);
    }
}

TEST_F(PageTablesTest, Destroy) {
    ASSERT_EQ(tables.map(sm::VirtualAddress(0x1000), frame(), PageFlags::eUserData), OsStatusSuccess);
    size_t free = allocator.stats().freePages;

    tables.destroy();
    EXPECT_FALSE(tables.isValid());

    // The directory and table are released, the mapped frame is not.
    EXPECT_EQ(allocator.stats().freePages, free + 2);
}
