#include <gtest/gtest.h>

#include <latch>
#include <random>
#include <thread>
#include <vector>

#include "system/address_space.hpp"

#include "test_memory.hpp"

using sys::AddressSpace;
using sys::AddressSpaceStats;
using sys::FaultResult;
using sys::RegionFlags;
using sys::RegionInfo;

static constexpr size_t P = x86::kPageSize;

static void ExpectSameStructure(const AddressSpaceStats& expected, const AddressSpaceStats& actual) {
    EXPECT_EQ(expected.regions, actual.regions);
    EXPECT_EQ(expected.gaps, actual.gaps);
    EXPECT_EQ(expected.committedPages, actual.committedPages);
    EXPECT_EQ(expected.residentPages, actual.residentPages);
    EXPECT_EQ(expected.freePages, actual.freePages);
}

class AddressSpaceTest : public MemoryContextTest {
public:
    AddressSpace *space = nullptr;

    void SetUp() override {
        MemoryContextTest::SetUp();
        ASSERT_EQ(AddressSpace::create(context, &space), OsStatusSuccess);
    }

    void TearDown() override {
        if (space != nullptr) {
            EXPECT_EQ(space->validate(), OsStatusSuccess);
            AddressSpace::destroy(space);
        }

        MemoryContextTest::TearDown();
    }

    sm::VirtualAddress allocate(size_t pages, RegionFlags flags = RegionFlags::eUserData) {
        sm::VirtualAddress address;
        EXPECT_EQ(space->allocate(pages, flags, &address), OsStatusSuccess);
        return address;
    }

    RegionInfo query(sm::VirtualAddress address) {
        RegionInfo info{};
        EXPECT_EQ(space->query(address, &info), OsStatusSuccess);
        return info;
    }

    sm::VirtualAddress base;

    /// @brief Free 4 pages at @p page of a resident 16 page region under every heap budget.
    ///
    /// @param kept First page of the 12 pages left mapped after the free.
    void expectFreeRollback(size_t page, size_t kept) {
        base = allocate(16);
        vsp::VirtualRange remaining = vsp::VirtualRange::of(at(base, kept), 12 * P);
        for (size_t i = 0; i < 16; i++) {
            ASSERT_EQ(touch(space, at(base, i), true), FaultResult::eHandled);
        }

        for (ptrdiff_t budget = 0; budget < 64; budget++) {
            AddressSpaceStats before = space->stats();
            size_t frames = freeFrames();

            heap.failAfter(budget);
            OsStatus status = space->free(at(base, page), 4);
            heap.unlimited();

            ASSERT_EQ(space->validate(), OsStatusSuccess);
            if (status == OsStatusSuccess) {
                EXPECT_EQ(space->stats().regions, 1);
                EXPECT_EQ(query(remaining.front).range, remaining);
                EXPECT_EQ(freeFrames(), frames + 4);
                EXPECT_EQ(touch(space, at(base, page)), FaultResult::eNotHandled);
                return;
            }

            ASSERT_EQ(status, OsStatusOutOfMemory);
            ExpectSameStructure(before, space->stats());
            EXPECT_EQ(freeFrames(), frames);
            EXPECT_EQ(query(base).range, vsp::VirtualRange::of(base, 16 * P));
        }

        FAIL() << "Free never succeeded";
    }
};

TEST_F(AddressSpaceTest, Construct) {
    AddressSpaceStats stats = space->stats();
    EXPECT_EQ(stats.regions, 0);
    EXPECT_EQ(stats.gaps, 1);
    EXPECT_EQ(stats.committedPages, 0);
    EXPECT_EQ(stats.residentPages, 0);
    EXPECT_EQ(stats.freePages, vsp::kUserSpacePages);
    EXPECT_EQ(space->range(), vsp::kUserSpace);
    EXPECT_EQ(space->validate(), OsStatusSuccess);
}

TEST_F(AddressSpaceTest, CreateInvalidRange) {
    AddressSpace *other = nullptr;

    vsp::VirtualRange empty { sm::VirtualAddress(0x1000), sm::VirtualAddress(0x1000) };
    EXPECT_EQ(AddressSpace::create(context, empty, &other), OsStatusInvalidInput);

    vsp::VirtualRange unaligned { sm::VirtualAddress(0x1000), sm::VirtualAddress(0x1800) };
    EXPECT_EQ(AddressSpace::create(context, unaligned, &other), OsStatusInvalidInput);

    vsp::VirtualRange null { sm::VirtualAddress(), sm::VirtualAddress(0x4000) };
    EXPECT_EQ(AddressSpace::create(context, null, &other), OsStatusInvalidInput);
}

TEST_F(AddressSpaceTest, CreateOutOfMemory) {
    for (ptrdiff_t budget = 0; budget < 64; budget++) {
        AddressSpace *other = nullptr;
        size_t frames = freeFrames();

        heap.failAfter(budget);
        OsStatus status = AddressSpace::create(context, &other);
        heap.unlimited();

        if (status == OsStatusSuccess) {
            EXPECT_EQ(other->validate(), OsStatusSuccess);
            AddressSpace::destroy(other);
            return;
        }

        ASSERT_EQ(status, OsStatusOutOfMemory);
        EXPECT_EQ(freeFrames(), frames);
    }

    FAIL() << "Address space creation never succeeded";
}

TEST_F(AddressSpaceTest, DestroyEmpty) {
    AddressSpace::destroy(space);
    space = nullptr;

    EXPECT_EQ(context->spaceCache().count(), 0);
    EXPECT_EQ(context->gapCache().count(), 0);
}

TEST_F(AddressSpaceTest, AllocateZero) {
    sm::VirtualAddress address;
    EXPECT_EQ(space->allocate(0, &address), OsStatusInvalidInput);
    EXPECT_EQ(space->allocateStack(0, &address), OsStatusInvalidInput);
}

TEST_F(AddressSpaceTest, AllocateAdvancesGap) {
    sm::VirtualAddress a = allocate(3);
    EXPECT_EQ(a, vsp::kUserSpace.front);

    AddressSpaceStats stats = space->stats();
    EXPECT_EQ(stats.regions, 1);
    EXPECT_EQ(stats.gaps, 1);
    EXPECT_EQ(stats.committedPages, 3);
    EXPECT_EQ(stats.freePages, vsp::kUserSpacePages - 3);

    // The remaining gap starts right after the region.
    EXPECT_EQ(allocate(1), a + 3 * P);
}

TEST_F(AddressSpaceTest, QueryRegion) {
    sm::VirtualAddress a = allocate(5, RegionFlags::eUser);

    RegionInfo info = query(a + 2 * P + 17);
    EXPECT_EQ(info.range, vsp::VirtualRange::of(a, 5 * P));
    EXPECT_EQ(info.flags, RegionFlags::eUser);
    EXPECT_EQ(info.committedPages, 5);
    EXPECT_EQ(info.mirrors, 0);

    RegionInfo missing{};
    EXPECT_EQ(space->query(a + 5 * P, &missing), OsStatusNotFound);
}

TEST_F(AddressSpaceTest, ReuseFreedAddress) {
    sm::VirtualAddress first = allocate(10);
    ASSERT_EQ(space->free(first, 10), OsStatusSuccess);

    sm::VirtualAddress second = allocate(10);
    EXPECT_EQ(first, second);
}

TEST_F(AddressSpaceTest, FreeRestoresStructure) {
    allocate(2);
    sm::VirtualAddress middle = allocate(7);
    allocate(3);

    AddressSpaceStats before = space->stats();

    sm::VirtualAddress a = allocate(6);
    ASSERT_EQ(space->validate(), OsStatusSuccess);
    ASSERT_EQ(space->free(a, 6), OsStatusSuccess);

    ExpectSameStructure(before, space->stats());

    ASSERT_EQ(space->free(middle, 7), OsStatusSuccess);
    ASSERT_EQ(space->validate(), OsStatusSuccess);
    EXPECT_EQ(space->stats().gaps, 2);
}

TEST_F(AddressSpaceTest, BestFit) {
    sm::VirtualAddress a = allocate(4);
    allocate(1);
    sm::VirtualAddress c = allocate(8);
    allocate(1);

    ASSERT_EQ(space->free(a, 4), OsStatusSuccess);
    ASSERT_EQ(space->free(c, 8), OsStatusSuccess);

    // The smallest gap that fits, not the first.
    EXPECT_EQ(allocate(5), c);
    EXPECT_EQ(allocate(4), a);
    EXPECT_EQ(allocate(1), c + 5 * P);
}

TEST_F(AddressSpaceTest, BestFitLowestAddress) {
    sm::VirtualAddress a = allocate(2);
    allocate(1);
    sm::VirtualAddress c = allocate(2);
    allocate(1);

    ASSERT_EQ(space->free(c, 2), OsStatusSuccess);
    ASSERT_EQ(space->free(a, 2), OsStatusSuccess);

    EXPECT_EQ(allocate(2), a);
    EXPECT_EQ(allocate(2), c);
}

TEST_F(AddressSpaceTest, NoSpace) {
    AddressSpace *small = nullptr;
    vsp::VirtualRange range = vsp::VirtualRange::of(sm::VirtualAddress(0x10000), 16 * P);
    ASSERT_EQ(AddressSpace::create(context, range, &small), OsStatusSuccess);

    sm::VirtualAddress address;
    EXPECT_EQ(small->allocate(17, &address), OsStatusNoSpace);

    ASSERT_EQ(small->allocate(16, &address), OsStatusSuccess);
    EXPECT_EQ(address, range.front);
    EXPECT_EQ(small->stats().gaps, 0);
    EXPECT_EQ(small->validate(), OsStatusSuccess);

    EXPECT_EQ(small->allocate(1, &address), OsStatusNoSpace);

    ASSERT_EQ(small->free(range.front, 16), OsStatusSuccess);
    EXPECT_EQ(small->stats().gaps, 1);
    EXPECT_EQ(small->validate(), OsStatusSuccess);

    AddressSpace::destroy(small);
}

TEST_F(AddressSpaceTest, FreeInvalid) {
    sm::VirtualAddress a = allocate(4);

    EXPECT_EQ(space->free(a + 1, 1), OsStatusInvalidInput);
    EXPECT_EQ(space->free(a, 0), OsStatusInvalidInput);
    EXPECT_EQ(space->free(a + P, 4), OsStatusInvalidInput);
    EXPECT_EQ(space->free(a + 4 * P, 1), OsStatusNotFound);
    EXPECT_EQ(space->free(sm::VirtualAddress(0x8000'0000), 1), OsStatusNotFound);

    EXPECT_EQ(query(a).range, vsp::VirtualRange::of(a, 4 * P));
}

TEST_F(AddressSpaceTest, FreeHead) {
    sm::VirtualAddress a = allocate(8);
    ASSERT_EQ(touch(space, a + 4 * P, true), FaultResult::eHandled);
    sm::PhysicalAddress backing = space->getBackingAddress(a + 4 * P);

    ASSERT_EQ(space->free(a, 3), OsStatusSuccess);
    ASSERT_EQ(space->validate(), OsStatusSuccess);

    RegionInfo info = query(a + 3 * P);
    EXPECT_EQ(info.range, vsp::VirtualRange::of(a + 3 * P, 5 * P));
    EXPECT_EQ(info.committedPages, 5);

    // Mapped pages outside of the freed extent are untouched.
    EXPECT_EQ(space->getBackingAddress(a + 4 * P), backing);

    EXPECT_EQ(touch(space, a), FaultResult::eNotHandled);
    EXPECT_EQ(allocate(3), a);
}

TEST_F(AddressSpaceTest, FreeTail) {
    sm::VirtualAddress a = allocate(8);
    ASSERT_EQ(touch(space, a + 7 * P, true), FaultResult::eHandled);
    size_t frames = freeFrames();

    ASSERT_EQ(space->free(a + 5 * P, 3), OsStatusSuccess);
    ASSERT_EQ(space->validate(), OsStatusSuccess);

    RegionInfo info = query(a);
    EXPECT_EQ(info.range, vsp::VirtualRange::of(a, 5 * P));
    EXPECT_EQ(info.committedPages, 5);

    // The frame backing the freed page was released.
    EXPECT_EQ(freeFrames(), frames + 1);
    EXPECT_EQ(space->getBackingAddress(a + 7 * P), sm::PhysicalAddress::invalid());
    EXPECT_EQ(touch(space, a + 5 * P), FaultResult::eNotHandled);

    EXPECT_EQ(space->stats().gaps, 1);
}

TEST_F(AddressSpaceTest, FreeMiddle) {
    sm::VirtualAddress a = allocate(8);
    for (size_t i = 0; i < 8; i++) {
        ASSERT_EQ(touch(space, a + i * P, true), FaultResult::eHandled);
    }

    ASSERT_EQ(space->free(a + 2 * P, 3), OsStatusSuccess);
    ASSERT_EQ(space->validate(), OsStatusSuccess);

    AddressSpaceStats stats = space->stats();
    EXPECT_EQ(stats.regions, 2);
    EXPECT_EQ(stats.gaps, 2);
    EXPECT_EQ(stats.committedPages, 5);
    EXPECT_EQ(stats.residentPages, 5);

    EXPECT_EQ(query(a).range, vsp::VirtualRange::of(a, 2 * P));
    EXPECT_EQ(query(a + 6 * P).range, vsp::VirtualRange::of(a + 5 * P, 3 * P));

    // The split is not a mirror in another space.
    EXPECT_EQ(query(a + 6 * P).mirrors, 0);

    EXPECT_EQ(touch(space, a + 3 * P), FaultResult::eNotHandled);
    EXPECT_EQ(touch(space, a + 5 * P), FaultResult::eHandled);

    ASSERT_EQ(space->free(a + 5 * P, 3), OsStatusSuccess);
    ASSERT_EQ(space->free(a, 2), OsStatusSuccess);
    EXPECT_EQ(space->stats().gaps, 1);
}

TEST_F(AddressSpaceTest, FreeMergesNeighbours) {
    sm::VirtualAddress a = allocate(2);
    sm::VirtualAddress b = allocate(3);
    sm::VirtualAddress c = allocate(4);
    sm::VirtualAddress d = allocate(1);

    ASSERT_EQ(space->free(b, 3), OsStatusSuccess);
    EXPECT_EQ(space->stats().gaps, 2);

    ASSERT_EQ(space->free(c, 4), OsStatusSuccess);
    EXPECT_EQ(space->stats().gaps, 2);
    ASSERT_EQ(space->validate(), OsStatusSuccess);

    ASSERT_EQ(space->free(a, 2), OsStatusSuccess);
    EXPECT_EQ(space->stats().gaps, 2);

    ASSERT_EQ(space->free(d, 1), OsStatusSuccess);
    EXPECT_EQ(space->stats().gaps, 1);
    EXPECT_EQ(space->stats().freePages, vsp::kUserSpacePages);
}

TEST_F(AddressSpaceTest, Stack) {
    sm::VirtualAddress top;
    ASSERT_EQ(space->allocateStack(4, &top), OsStatusSuccess);

    RegionInfo info = query(top);
    EXPECT_EQ(info.flags, RegionFlags::eUserStack);
    EXPECT_EQ(top, info.range.front + 4 * P - 1);

    EXPECT_EQ(touch(space, top, true), FaultResult::eHandled);

    EXPECT_EQ(space->freeStack(top - 1), OsStatusInvalidInput);
    EXPECT_EQ(space->freeStack(top + 1), OsStatusNotFound);

    ASSERT_EQ(space->freeStack(top), OsStatusSuccess);
    EXPECT_EQ(space->stats().regions, 0);
    EXPECT_EQ(space->stats().gaps, 1);
}

TEST_F(AddressSpaceTest, FreeStackNotStack) {
    sm::VirtualAddress a = allocate(4);
    EXPECT_EQ(space->freeStack(a + 4 * P - 1), OsStatusInvalidInput);
    EXPECT_EQ(space->stats().regions, 1);
}

TEST_F(AddressSpaceTest, DestroyReleasesFrames) {
    size_t frames = freeFrames();

    AddressSpace *other = nullptr;
    ASSERT_EQ(AddressSpace::create(context, &other), OsStatusSuccess);

    sm::VirtualAddress a;
    ASSERT_EQ(other->allocate(16, &a), OsStatusSuccess);
    for (size_t i = 0; i < 16; i++) {
        ASSERT_EQ(touch(other, a + i * P, true), FaultResult::eHandled);
    }

    sm::VirtualAddress high;
    ASSERT_EQ(other->allocateStack(8, &high), OsStatusSuccess);
    ASSERT_EQ(touch(other, high, true), FaultResult::eHandled);

    EXPECT_LT(freeFrames(), frames);
    AddressSpace::destroy(other);
    EXPECT_EQ(freeFrames(), frames);
}

TEST_F(AddressSpaceTest, Dump) {
    allocate(2);
    allocate(3, RegionFlags::eUser);
    space->dump();
}

TEST_F(AddressSpaceTest, AllocateRollback) {
    allocate(4);
    allocate(2);

    for (ptrdiff_t budget = 0; budget < 64; budget++) {
        AddressSpaceStats before = space->stats();

        heap.failAfter(budget);
        sm::VirtualAddress address;
        OsStatus status = space->allocate(5, &address);
        heap.unlimited();

        ASSERT_EQ(space->validate(), OsStatusSuccess);
        if (status == OsStatusSuccess) {
            EXPECT_EQ(query(address).range.size(), 5 * P);
            return;
        }

        ASSERT_EQ(status, OsStatusOutOfMemory);
        ExpectSameStructure(before, space->stats());
    }

    FAIL() << "Allocation never succeeded";
}

TEST_F(AddressSpaceTest, FreeMiddleRollback) {
    sm::VirtualAddress a = allocate(16);
    for (size_t i = 0; i < 16; i++) {
        ASSERT_EQ(touch(space, a + i * P, true), FaultResult::eHandled);
    }

    for (ptrdiff_t budget = 0; budget < 64; budget++) {
        AddressSpaceStats before = space->stats();
        size_t frames = freeFrames();

        heap.failAfter(budget);
        OsStatus status = space->free(a + 4 * P, 4);
        heap.unlimited();

        ASSERT_EQ(space->validate(), OsStatusSuccess);
        if (status == OsStatusSuccess) {
            EXPECT_EQ(space->stats().regions, 2);
            EXPECT_EQ(freeFrames(), frames + 4);
            return;
        }

        ASSERT_EQ(status, OsStatusOutOfMemory);
        ExpectSameStructure(before, space->stats());
        EXPECT_EQ(freeFrames(), frames);
        EXPECT_EQ(query(a).range, vsp::VirtualRange::of(a, 16 * P));
    }

    FAIL() << "Free never succeeded";
}

TEST_F(AddressSpaceTest, FreeHeadRollback) {
    expectFreeRollback(0, 4);
}

TEST_F(AddressSpaceTest, FreeTailRollback) {
    expectFreeRollback(12, 0);
}

TEST_F(AddressSpaceTest, ConcurrentAllocate) {
    static constexpr size_t kThreadCount = 4;
    static constexpr size_t kIterations = 200;

    std::latch latch(kThreadCount + 1);
    std::vector<std::jthread> threads;
    for (size_t i = 0; i < kThreadCount; i++) {
        threads.emplace_back([&, seed = i] {
            std::mt19937 random(seed);
            std::uniform_int_distribution<size_t> pages(1, 8);
            std::vector<std::pair<sm::VirtualAddress, size_t>> live;

            latch.arrive_and_wait();
            for (size_t j = 0; j < kIterations; j++) {
                size_t count = pages(random);
                sm::VirtualAddress address;
                if (space->allocate(count, &address) == OsStatusSuccess) {
                    EXPECT_EQ(touch(space, address, true), FaultResult::eHandled);
                    live.push_back({ address, count });
                }

                if (live.size() > 4) {
                    auto [front, size] = live.front();
                    EXPECT_EQ(space->free(front, size), OsStatusSuccess);
                    live.erase(live.begin());
                }
            }

            for (auto [front, size] : live) {
                EXPECT_EQ(space->free(front, size), OsStatusSuccess);
            }
        });
    }

    latch.arrive_and_wait();
    threads.clear();

    EXPECT_EQ(space->validate(), OsStatusSuccess);
    AddressSpaceStats stats = space->stats();
    EXPECT_EQ(stats.regions, 0);
    EXPECT_EQ(stats.gaps, 1);
    EXPECT_EQ(stats.residentPages, 0);
}
