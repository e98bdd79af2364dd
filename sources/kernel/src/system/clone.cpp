#include "system/address_space.hpp"

#include "logger/categories.hpp"
#include "system/context.hpp"

using sys::AddressSpace;

OsStatus AddressSpace::cloneRecords(AddressSpace *clone) {
    for (const Region *region : mRegions) {
        Region *copy = clone->newRegion(region->begin(), region->pages(), region->flags(), region->mirror());
        if (copy == nullptr) {
            return OsStatusOutOfMemory;
        }

        for (size_t i = 0; i < region->pages(); i++) {
            copy->setPresent(i, region->isPresent(i));
        }

        if (OsStatus status = clone->mRegions.insert(copy)) {
            clone->deleteRegion(copy);
            return status;
        }
    }

    for (const Gap *gap : mGaps) {
        Gap *copy = clone->newGap(gap->begin, gap->pages);
        if (copy == nullptr) {
            return OsStatusOutOfMemory;
        }

        if (OsStatus status = clone->mGaps.insert(copy)) {
            clone->deleteGap(copy);
            return status;
        }
    }

    return vsp::PageTables::clone(mTables, &clone->mTables);
}

OsStatus AddressSpace::clone(AddressSpace *source, AddressSpace **space) {
    MemoryContext *context = source->mContext;

    stdx::LockGuard guard(source->mLock);

    AddressSpace *result = context->spaceCache().construct(context, source->mRange);
    if (result == nullptr) {
        return OsStatusOutOfMemory;
    }

    OsStatus status = OsStatusSuccess;
    {
        // The clone is not visible to any other thread yet.
        stdx::LockGuard cloneGuard(result->mLock);

        status = source->cloneRecords(result);
        if (status != OsStatusSuccess) {
            // No frame has been retained for the clone yet.
            result->releaseAll();
        } else {
            // Nothing below can fail.
            MemoryManager& memory = context->memoryManager();
            for (const Region *region : source->mRegions) {
                if (region->writeable()) {
                    vsp::PageFlags flags = region->pageFlags() & ~vsp::PageFlags::eWrite;
                    source->mTables.protect(region->range(), flags);
                    result->mTables.protect(region->range(), flags);
                }

                source->mTables.forEachMapping(region->range(), [&](sm::VirtualAddress, x86::pte pte) {
                    memory.retain(sm::PhysicalAddress(pte.address()));
                });
            }
        }
    }

    if (status != OsStatusSuccess) {
        MemLog.warnf("Failed to clone address space ", source->mRange, ": ", OsStatusId(status));
        context->spaceCache().destroy(result);
        return status;
    }

    *space = result;
    return OsStatusSuccess;
}
