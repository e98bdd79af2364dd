#include "system/address_space.hpp"

#include "logger/categories.hpp"
#include "system/context.hpp"

using sys::AddressSpace;
using sys::Region;
using sys::Gap;

static size_t PagesBetween(sm::VirtualAddress front, sm::VirtualAddress back) {
    return (back - front) / x86::kPageSize;
}

AddressSpace::AddressSpace(MemoryContext *context, vsp::VirtualRange range)
    : mContext(context)
    , mRange(range)
    , mRegions(context->heap())
    , mGaps(context->heap())
{ }

Region *AddressSpace::newRegion(sm::VirtualAddress begin, size_t pages, RegionFlags flags, MirrorHandle sibling) {
    mem::IAllocator *heap = mContext->heap();
    size_t words = Region::presenceWords(pages);
    uint32_t *presence = heap->allocateArray<uint32_t>(words);
    if (presence == nullptr) {
        return nullptr;
    }

    Region *region = mContext->regionCache().construct(this, begin, pages, presence, words, flags);
    if (region == nullptr) {
        heap->deallocateArray(presence, words);
        return nullptr;
    }

    MirrorTable& mirrors = mContext->mirrors();
    OsStatus status = (sibling != kInvalidMirror)
        ? mirrors.link(sibling, region, &region->mMirror)
        : mirrors.create(region, &region->mMirror);

    if (status != OsStatusSuccess) {
        mContext->regionCache().destroy(region);
        heap->deallocateArray(presence, words);
        return nullptr;
    }

    return region;
}

void AddressSpace::deleteRegion(Region *region) noexcept {
    if (region->mMirror != kInvalidMirror) {
        mContext->mirrors().unlink(region->mMirror);
    }

    mContext->heap()->deallocateArray(region->mPresence, region->mPresenceWords);
    mContext->regionCache().destroy(region);
}

Gap *AddressSpace::newGap(sm::VirtualAddress begin, size_t pages) {
    return mContext->gapCache().construct(begin, pages);
}

void AddressSpace::deleteGap(Gap *gap) noexcept {
    mContext->gapCache().destroy(gap);
}

Region *AddressSpace::findRegion(sm::VirtualAddress address) const noexcept {
    Region *region = mRegions.floor(address);
    if (region == nullptr || !region->range().contains(address)) {
        return nullptr;
    }

    return region;
}

Gap *AddressSpace::findGap(sm::VirtualAddress front, sm::VirtualAddress back) const noexcept {
    if (front >= back) {
        return nullptr;
    }

    Gap *gap = mGaps.find(GapKey { PagesBetween(front, back), front });
    VSP_CHECK(gap != nullptr, "Free space is not covered by a gap");
    return gap;
}

void AddressSpace::releasePages(Region *region, size_t first, size_t count) noexcept {
    MemoryManager& memory = mContext->memoryManager();
    sm::VirtualAddress front = region->begin() + vsp::PageBytes(first);
    vsp::VirtualRange extent = vsp::VirtualRange::of(front, vsp::PageBytes(count));

    mTables.forEachMapping(extent, [&](sm::VirtualAddress page, x86::pte) {
        x86::pte old = mTables.unmap(page);
        memory.release(sm::PhysicalAddress(old.address()));
    });

    for (size_t i = 0; i < count; i++) {
        region->setPresent(first + i, false);
    }
}

OsStatus AddressSpace::allocateRegion(size_t pages, RegionFlags flags, Region **result) {
    Gap *gap = mGaps.lowerBound(GapKey { pages, sm::VirtualAddress() });
    if (gap == nullptr) {
        return OsStatusNoSpace;
    }

    Region *region = newRegion(gap->begin, pages, flags, kInvalidMirror);
    if (region == nullptr) {
        return OsStatusOutOfMemory;
    }

    for (size_t i = 0; i < pages; i++) {
        region->setPresent(i, true);
    }

    Gap *rest = nullptr;
    if (gap->pages > pages) {
        rest = newGap(region->end(), gap->pages - pages);
        if (rest == nullptr) {
            deleteRegion(region);
            return OsStatusOutOfMemory;
        }
    }

    if (OsStatus status = mRegions.insert(region)) {
        deleteGap(rest);
        deleteRegion(region);
        return status;
    }

    if (rest != nullptr) {
        if (OsStatus status = mGaps.insert(rest)) {
            mRegions.remove(region);
            deleteGap(rest);
            deleteRegion(region);
            return status;
        }
    }

    mGaps.remove(gap);
    deleteGap(gap);

    *result = region;
    return OsStatusSuccess;
}

OsStatus AddressSpace::releaseExtent(Region *region, vsp::VirtualRange extent) {
    vsp::VirtualRange bounds = region->range();
    bool head = extent.front == bounds.front;
    bool tail = extent.back == bounds.back;

    size_t first = region->pageIndex(extent.front);
    size_t count = PagesBetween(extent.front, extent.back);

    // The free space on either side of the extent, known from the tiling of the space.
    Gap *left = nullptr;
    Gap *right = nullptr;

    if (head) {
        Region *prev = mRegions.prev(region);
        left = findGap(prev ? prev->end() : mRange.front, bounds.front);
    }

    if (tail) {
        Region *next = mRegions.next(region);
        right = findGap(bounds.back, next ? next->begin() : mRange.back);
    }

    sm::VirtualAddress gapFront = left ? left->begin : extent.front;
    sm::VirtualAddress gapBack = right ? right->end() : extent.back;

    Gap *merged = newGap(gapFront, PagesBetween(gapFront, gapBack));
    if (merged == nullptr) {
        return OsStatusOutOfMemory;
    }

    // Releasing the head moves the region start, which changes its key. The pages after the
    // extent move to a new record in the same mirror ring.
    Region *remainder = nullptr;
    if (!tail) {
        size_t offset = first + count;
        remainder = newRegion(extent.back, region->pages() - offset, region->flags(), region->mirror());
        if (remainder == nullptr) {
            deleteGap(merged);
            return OsStatusOutOfMemory;
        }

        for (size_t i = 0; i < remainder->pages(); i++) {
            remainder->setPresent(i, region->isPresent(offset + i));
        }

        if (OsStatus status = mRegions.insert(remainder)) {
            deleteRegion(remainder);
            deleteGap(merged);
            return status;
        }
    }

    if (OsStatus status = mGaps.insert(merged)) {
        if (remainder != nullptr) {
            mRegions.remove(remainder);
            deleteRegion(remainder);
        }

        deleteGap(merged);
        return status;
    }

    // Nothing below can fail.

    releasePages(region, first, count);

    if (left != nullptr) {
        mGaps.remove(left);
        deleteGap(left);
    }

    if (right != nullptr) {
        mGaps.remove(right);
        deleteGap(right);
    }

    if (head) {
        mRegions.remove(region);
        deleteRegion(region);
    } else {
        for (size_t i = first; i < region->pages(); i++) {
            region->setPresent(i, false);
        }

        region->mPages = first;
    }

    return OsStatusSuccess;
}

void AddressSpace::releaseAll() noexcept {
    mRegions.forEach([&](Region *region) {
        releasePages(region, 0, region->pages());
        deleteRegion(region);
    });

    mRegions.clear();

    mGaps.forEach([&](Gap *gap) {
        deleteGap(gap);
    });

    mGaps.clear();

    mTables.destroy();
}

OsStatus AddressSpace::initialize() {
    if (OsStatus status = vsp::PageTables::create(&mContext->pageAllocator(), &mTables)) {
        return status;
    }

    Gap *gap = newGap(mRange.front, PagesBetween(mRange.front, mRange.back));
    if (gap == nullptr) {
        return OsStatusOutOfMemory;
    }

    if (OsStatus status = mGaps.insert(gap)) {
        deleteGap(gap);
        return status;
    }

    return OsStatusSuccess;
}

sm::PhysicalAddress AddressSpace::root() {
    stdx::LockGuard guard(mLock);
    return mTables.root();
}

OsStatus AddressSpace::allocate(size_t pages, RegionFlags flags, sm::VirtualAddress *address) {
    if (pages == 0) {
        return OsStatusInvalidInput;
    }

    stdx::LockGuard guard(mLock);

    Region *region = nullptr;
    if (OsStatus status = allocateRegion(pages, flags, &region)) {
        MemLog.warnf("Failed to allocate ", pages, " pages: ", OsStatusId(status));
        return status;
    }

    *address = region->begin();
    return OsStatusSuccess;
}

OsStatus AddressSpace::allocateStack(size_t pages, sm::VirtualAddress *top) {
    if (pages == 0) {
        return OsStatusInvalidInput;
    }

    stdx::LockGuard guard(mLock);

    Region *region = nullptr;
    if (OsStatus status = allocateRegion(pages, RegionFlags::eUserStack, &region)) {
        MemLog.warnf("Failed to allocate ", pages, " page stack: ", OsStatusId(status));
        return status;
    }

    *top = region->end() - 1;
    return OsStatusSuccess;
}

OsStatus AddressSpace::free(sm::VirtualAddress address, size_t pages) {
    if (pages == 0 || !address.isAlignedTo(x86::kPageSize)) {
        return OsStatusInvalidInput;
    }

    stdx::LockGuard guard(mLock);

    Region *region = findRegion(address);
    if (region == nullptr) {
        return OsStatusNotFound;
    }

    if (pages > region->pages() - region->pageIndex(address)) {
        return OsStatusInvalidInput;
    }

    vsp::VirtualRange extent = vsp::VirtualRange::of(address, vsp::PageBytes(pages));
    if (OsStatus status = releaseExtent(region, extent)) {
        MemLog.warnf("Failed to free ", extent, ": ", OsStatusId(status));
        return status;
    }

    return OsStatusSuccess;
}

OsStatus AddressSpace::freeStack(sm::VirtualAddress top) {
    stdx::LockGuard guard(mLock);

    Region *region = findRegion(top);
    if (region == nullptr) {
        return OsStatusNotFound;
    }

    if (!region->isStack() || top != region->end() - 1) {
        return OsStatusInvalidInput;
    }

    if (OsStatus status = releaseExtent(region, region->range())) {
        MemLog.warnf("Failed to free stack ", region->range(), ": ", OsStatusId(status));
        return status;
    }

    return OsStatusSuccess;
}

sys::AddressSpaceStats AddressSpace::stats() {
    stdx::LockGuard guard(mLock);

    AddressSpaceStats result {
        .regions = mRegions.count(),
        .gaps = mGaps.count(),
        .committedPages = 0,
        .residentPages = 0,
        .freePages = 0,
        .pageTables = mTables.tableCount(),
    };

    mRegions.forEach([&](const Region *region) {
        result.committedPages += region->usedPages();
        mTables.forEachMapping(region->range(), [&](sm::VirtualAddress, x86::pte) {
            result.residentPages += 1;
        });
    });

    mGaps.forEach([&](const Gap *gap) {
        result.freePages += gap->pages;
    });

    return result;
}

OsStatus AddressSpace::query(sm::VirtualAddress address, RegionInfo *info) {
    stdx::LockGuard guard(mLock);

    Region *region = findRegion(address);
    if (region == nullptr) {
        return OsStatusNotFound;
    }

    size_t mirrors = 0;
    mContext->mirrors().forEachSibling(region->mirror(), [&](const Region *sibling) {
        if (sibling->owner() != this) {
            mirrors += 1;
        }
    });

    *info = RegionInfo {
        .range = region->range(),
        .flags = region->flags(),
        .committedPages = region->usedPages(),
        .mirrors = mirrors,
    };

    return OsStatusSuccess;
}

bool AddressSpace::validateUnlocked() const {
    bool valid = true;
    size_t gaps = 0;
    sm::VirtualAddress cursor = mRange.front;

    auto checkGap = [&](sm::VirtualAddress front, sm::VirtualAddress back) {
        if (front >= back) {
            return;
        }

        if (mGaps.find(GapKey { PagesBetween(front, back), front }) == nullptr) {
            MemLog.errorf("Free space ", vsp::VirtualRange { front, back }, " is not covered by a single gap");
            valid = false;
        } else {
            gaps += 1;
        }
    };

    mRegions.forEach([&](const Region *region) {
        vsp::VirtualRange range = region->range();
        if (region->pages() == 0) {
            MemLog.errorf("Region ", range, " is empty");
            valid = false;
        }

        if (!mRange.contains(range)) {
            MemLog.errorf("Region ", range, " is outside of ", mRange);
            valid = false;
        }

        if (range.front < cursor) {
            MemLog.errorf("Region ", range, " overlaps the previous region ending at ", cursor);
            valid = false;
        } else {
            checkGap(cursor, range.front);
        }

        size_t used = 0;
        for (size_t i = 0; i < region->pages(); i++) {
            used += region->isPresent(i) ? 1 : 0;
        }

        if (used != region->usedPages()) {
            MemLog.errorf("Region ", range, " counts ", region->usedPages(), " present pages but has ", used);
            valid = false;
        }

        if (region->mirror() == kInvalidMirror) {
            MemLog.errorf("Region ", range, " has no mirror node");
            valid = false;
        }

        cursor = range.back;
    });

    checkGap(cursor, mRange.back);

    if (gaps != mGaps.count()) {
        MemLog.errorf("Expected ", gaps, " gaps but the index holds ", mGaps.count());
        valid = false;
    }

    return valid;
}

OsStatus AddressSpace::validate() {
    stdx::LockGuard guard(mLock);
    return validateUnlocked() ? OsStatusSuccess : OsStatusInvalidData;
}

void AddressSpace::dump() {
    stdx::LockGuard guard(mLock);

    MemLog.infof("Address space ", mRange, " regions: ", mRegions.count(), " gaps: ", mGaps.count());
    mRegions.forEach([&](const Region *region) {
        MemLog.infof("  region ", region->range(), " ", region->flags(), " used: ", region->usedPages());
    });

    mGaps.forEach([&](const Gap *gap) {
        MemLog.infof("  gap ", gap->range(), " pages: ", gap->pages);
    });
}

OsStatus AddressSpace::create(MemoryContext *context, vsp::VirtualRange range, AddressSpace **space) {
    if (range.isEmpty() || !range.isValid()
        || !range.front.isAlignedTo(x86::kPageSize)
        || !range.back.isAlignedTo(x86::kPageSize)
        || range.front.isNull()) {
        return OsStatusInvalidInput;
    }

    AddressSpace *result = context->spaceCache().construct(context, range);
    if (result == nullptr) {
        return OsStatusOutOfMemory;
    }

    OsStatus status = OsStatusSuccess;
    {
        stdx::LockGuard guard(result->mLock);
        status = result->initialize();
        if (status != OsStatusSuccess) {
            result->releaseAll();
        }
    }

    if (status != OsStatusSuccess) {
        MemLog.warnf("Failed to create address space ", range, ": ", OsStatusId(status));
        context->spaceCache().destroy(result);
        return status;
    }

    *space = result;
    return OsStatusSuccess;
}

void AddressSpace::destroy(AddressSpace *space) noexcept {
    if (space == nullptr) {
        return;
    }

    MemoryContext *context = space->mContext;
    {
        stdx::LockGuard guard(space->mLock);
        space->releaseAll();
    }

    context->spaceCache().destroy(space);
}
