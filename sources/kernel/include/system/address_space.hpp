#pragma once

#include "arch/paging.hpp"
#include "memory/layout.hpp"
#include "memory/page_tables.hpp"
#include "std/spinlock.hpp"
#include "system/detail/interval_index.hpp"
#include "system/region.hpp"

#include <span>

namespace sys {
    class MemoryContext;

    enum class FaultResult {
        /// @brief The faulting page is now mapped with the access the fault required.
        eHandled,

        /// @brief The fault is a real access violation.
        eNotHandled,
    };

    enum class MemoryAccess : uint8_t {
        eNone = 0,

        eRead = 1 << 0,
        eWrite = 1 << 1,
        eUser = 1 << 2,

        eUserRead = eRead | eUser,
        eUserWrite = eRead | eWrite | eUser,
    };

    UTIL_BITFLAGS(MemoryAccess);

    struct AddressSpaceStats {
        size_t regions;
        size_t gaps;

        /// @brief Pages marked present in a region.
        size_t committedPages;

        /// @brief Committed pages that have a frame mapped.
        size_t residentPages;

        /// @brief Pages covered by gaps.
        size_t freePages;

        /// @brief Page tables allocated for this space.
        size_t pageTables;
    };

    struct RegionInfo {
        vsp::VirtualRange range;
        RegionFlags flags;
        size_t committedPages;

        /// @brief Number of regions in other address spaces mirroring this one.
        size_t mirrors;
    };

    /// @brief The virtual memory of one process.
    ///
    /// The managed range is tiled by regions and gaps. Regions hold allocations, gaps hold
    /// the free space between them and are always coalesced. Every operation either applies
    /// completely or leaves the space unchanged.
    class AddressSpace {
        using RegionIndex = detail::IntervalIndex<Region, RegionOrder>;
        using GapIndex = detail::IntervalIndex<Gap, GapOrder>;

        mutable stdx::SpinLock mLock;

        MemoryContext *mContext;
        vsp::VirtualRange mRange;

        RegionIndex mRegions GUARDED_BY(mLock);
        GapIndex mGaps GUARDED_BY(mLock);
        vsp::PageTables mTables GUARDED_BY(mLock);

        /// @brief Create a region record with its presence map and mirror node.
        ///
        /// The region joins the mirror ring of @p sibling if it is valid, otherwise it gets a new ring.
        ///
        /// @return The region, or nullptr if any allocation failed.
        Region *newRegion(sm::VirtualAddress begin, size_t pages, RegionFlags flags, MirrorHandle sibling) REQUIRES(mLock);
        void deleteRegion(Region *region) noexcept REQUIRES(mLock);

        Gap *newGap(sm::VirtualAddress begin, size_t pages) REQUIRES(mLock);
        void deleteGap(Gap *gap) noexcept REQUIRES(mLock);

        /// @brief Find the region containing @p address.
        Region *findRegion(sm::VirtualAddress address) const noexcept REQUIRES(mLock);

        /// @brief Find the gap that exactly covers [front, back), nullptr if the range is empty.
        Gap *findGap(sm::VirtualAddress front, sm::VirtualAddress back) const noexcept REQUIRES(mLock);

        /// @brief Unmap pages [first, first + count) of @p region and drop their frames.
        void releasePages(Region *region, size_t first, size_t count) noexcept REQUIRES(mLock);

        /// @brief Make a page of @p region accessible for @p access.
        FaultResult resolvePage(Region *region, sm::VirtualAddress page, bool write, bool user) REQUIRES(mLock);

        OsStatus allocateRegion(size_t pages, RegionFlags flags, Region **result) REQUIRES(mLock);

        /// @brief Release @p extent, a page aligned subrange of @p region.
        OsStatus releaseExtent(Region *region, vsp::VirtualRange extent) REQUIRES(mLock);

        /// @brief Copy the region and gap records of this space into @p clone.
        OsStatus cloneRecords(AddressSpace *clone) REQUIRES(mLock, clone->mLock);

        /// @brief Create the page directory and the gap covering the whole range.
        OsStatus initialize() REQUIRES(mLock);

        /// @brief Release every record, frame and page table of this space.
        void releaseAll() noexcept REQUIRES(mLock);

        bool validateUnlocked() const REQUIRES(mLock);

        /// @brief Copy between a buffer and the memory of this space, resolving pages as needed.
        template<typename F>
        OsStatus transfer(sm::VirtualAddress address, size_t size, bool write, F&& fn) REQUIRES(mLock);

    public:
        UTIL_NOCOPY(AddressSpace);
        UTIL_NOMOVE(AddressSpace);

        /// @warning Use @a create, the constructed space has no page tables.
        AddressSpace(MemoryContext *context, vsp::VirtualRange range);

        MemoryContext *context() const noexcept { return mContext; }
        vsp::VirtualRange range() const noexcept { return mRange; }

        /// @brief Physical address of the page directory of this space.
        sm::PhysicalAddress root();

        /// @brief Allocate a new region.
        ///
        /// The region is placed in the smallest gap that fits, the lowest such gap if several
        /// are the same size. All pages are committed, frames are provided on first access.
        ///
        /// @param pages Number of pages to allocate, must be greater than zero.
        /// @param flags Protection of the region.
        /// @param address The first address of the region.
        ///
        /// @retval OsStatusInvalidInput @p pages is zero.
        /// @retval OsStatusNoSpace No gap is large enough.
        /// @retval OsStatusOutOfMemory Metadata could not be allocated.
        [[nodiscard]]
        OsStatus allocate(size_t pages, RegionFlags flags, sm::VirtualAddress *address);

        [[nodiscard]]
        OsStatus allocate(size_t pages, sm::VirtualAddress *address) {
            return allocate(pages, RegionFlags::eUserData, address);
        }

        /// @brief Allocate a stack region.
        ///
        /// @param top The highest usable byte of the stack.
        [[nodiscard]]
        OsStatus allocateStack(size_t pages, sm::VirtualAddress *top);

        /// @brief Release @p pages pages starting at @p address.
        ///
        /// The pages must lie within a single region. Releasing the head, tail or middle of a
        /// region shrinks or splits it.
        ///
        /// @retval OsStatusInvalidInput @p address is not page aligned, or @p pages is zero or
        ///                              extends past the end of the region.
        /// @retval OsStatusNotFound No region contains @p address.
        /// @retval OsStatusOutOfMemory Metadata could not be allocated, nothing was released.
        [[nodiscard]]
        OsStatus free(sm::VirtualAddress address, size_t pages);

        /// @brief Release a stack allocated with @a allocateStack.
        ///
        /// @param top The value returned by @a allocateStack.
        [[nodiscard]]
        OsStatus freeStack(sm::VirtualAddress top);

        /// @brief Test if every byte in [address, address + size) can be accessed with @p access.
        ///
        /// An empty range tests the single byte at @p address.
        bool canAccess(sm::VirtualAddress address, size_t size, MemoryAccess access);

        /// @brief Resolve a page fault taken in this address space.
        ///
        /// Maps a zeroed frame on first touch and breaks copy on write sharing on write faults.
        FaultResult handlePageFault(sm::VirtualAddress address, x86::PageFaultCode code);

        /// @brief Copy @p buffer.size() bytes out of this space as a user access would.
        ///
        /// @retval OsStatusInvalidAddress A page in the range is not readable by user code.
        [[nodiscard]]
        OsStatus read(sm::VirtualAddress address, std::span<std::byte> buffer);

        /// @brief Copy @p buffer into this space as a user access would.
        ///
        /// @retval OsStatusInvalidAddress A page in the range is not writable by user code.
        [[nodiscard]]
        OsStatus write(sm::VirtualAddress address, std::span<const std::byte> buffer);

        /// @brief Physical address currently mapped at @p address.
        ///
        /// @return The physical address, or @a sm::PhysicalAddress::invalid if no frame is mapped.
        sm::PhysicalAddress getBackingAddress(sm::VirtualAddress address);

        AddressSpaceStats stats();

        /// @retval OsStatusNotFound No region contains @p address.
        [[nodiscard]]
        OsStatus query(sm::VirtualAddress address, RegionInfo *info);

        /// @brief Check the structural invariants of this space.
        ///
        /// @retval OsStatusInvalidData An invariant does not hold, details are logged.
        [[nodiscard]]
        OsStatus validate();

        /// @brief Log every region and gap.
        void dump();

        /// @brief Create an empty address space.
        ///
        /// @param range The managed range, page aligned and not empty.
        ///
        /// @retval OsStatusInvalidInput @p range is not usable.
        /// @retval OsStatusOutOfMemory Metadata or page tables could not be allocated.
        [[nodiscard]]
        static OsStatus create(MemoryContext *context, vsp::VirtualRange range, AddressSpace **space);

        [[nodiscard]]
        static OsStatus create(MemoryContext *context, AddressSpace **space) {
            return create(context, vsp::kUserSpace, space);
        }

        /// @brief Create a copy on write duplicate of @p source.
        ///
        /// Both spaces keep sharing frames until either of them writes to a page.
        ///
        /// @retval OsStatusOutOfMemory The clone could not be built, @p source is unchanged.
        [[nodiscard]]
        static OsStatus clone(AddressSpace *source, AddressSpace **space);

        /// @brief Release every region and the space itself.
        static void destroy(AddressSpace *space) noexcept;
    };
}
