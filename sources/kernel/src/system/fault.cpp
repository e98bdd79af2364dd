#include "system/address_space.hpp"

#include "logger/categories.hpp"
#include "system/context.hpp"

#include <algorithm>

#include <string.h>

using sys::AddressSpace;
using sys::FaultResult;

FaultResult AddressSpace::resolvePage(Region *region, sm::VirtualAddress page, bool write, bool user) {
    if (!region->isPresent(region->pageIndex(page))) {
        return FaultResult::eNotHandled;
    }

    if ((write && !region->writeable()) || (user && !region->user())) {
        return FaultResult::eNotHandled;
    }

    MemoryManager& memory = mContext->memoryManager();
    x86::pte pte = mTables.resolve(page);

    if (!pte.present()) {
        sm::PhysicalAddress frame;
        if (OsStatus status = memory.allocateZeroed(&frame)) {
            VmLog.warnf("No frame for ", page, ": ", OsStatusId(status));
            return FaultResult::eNotHandled;
        }

        if (OsStatus status = mTables.map(page, frame, region->pageFlags())) {
            VmLog.warnf("Failed to map ", page, ": ", OsStatusId(status));
            memory.release(frame);
            return FaultResult::eNotHandled;
        }

        return FaultResult::eHandled;
    }

    if (!write || pte.writeable()) {
        return FaultResult::eHandled;
    }

    // Write to a copy on write page.
    sm::PhysicalAddress shared(pte.address());
    if (memory.owners(shared) == 1) {
        // The other owners have already taken private copies.
        mTables.protect(vsp::VirtualRange::of(page, x86::kPageSize), region->pageFlags());
        return FaultResult::eHandled;
    }

    sm::PhysicalAddress copy;
    if (OsStatus status = memory.allocateZeroed(&copy)) {
        VmLog.warnf("No frame to copy ", page, ": ", OsStatusId(status));
        return FaultResult::eNotHandled;
    }

    memcpy(memory.mapped(copy), memory.mapped(shared), x86::kPageSize);

    // The page table for this page exists so remapping cannot fail.
    OsStatus status = mTables.map(page, copy, region->pageFlags());
    VSP_CHECK(status == OsStatusSuccess, "Failed to remap a present page");

    memory.release(shared);
    return FaultResult::eHandled;
}

FaultResult AddressSpace::handlePageFault(sm::VirtualAddress address, x86::PageFaultCode code) {
    sm::VirtualAddress page = address.alignDown(x86::kPageSize);

    stdx::LockGuard guard(mLock);

    Region *region = findRegion(page);
    if (region == nullptr) {
        VmLog.warnf("Fault at ", address, " outside of any region");
        return FaultResult::eNotHandled;
    }

    FaultResult result = resolvePage(region, page, code.write(), code.user());
    if (result != FaultResult::eHandled) {
        VmLog.warnf("Unhandled fault at ", address, " in ", region->range(), " ", region->flags(),
                    " write: ", code.write(), " user: ", code.user());
    }

    return result;
}

bool AddressSpace::canAccess(sm::VirtualAddress address, size_t size, MemoryAccess access) {
    size = std::max<size_t>(size, 1);
    if (size > UINTPTR_MAX - address.address) {
        return false;
    }

    bool write = bool(access & MemoryAccess::eWrite);
    bool user = bool(access & MemoryAccess::eUser);

    stdx::LockGuard guard(mLock);

    sm::VirtualAddress cursor = address;
    sm::VirtualAddress end = address + size;
    while (cursor < end) {
        Region *region = findRegion(cursor);
        if (region == nullptr) {
            return false;
        }

        if ((write && !region->writeable()) || (user && !region->user())) {
            return false;
        }

        sm::VirtualAddress stop = std::min(end, region->end());
        for (sm::VirtualAddress page = cursor.alignDown(x86::kPageSize); page < stop; page += x86::kPageSize) {
            if (!region->isPresent(region->pageIndex(page))) {
                return false;
            }
        }

        cursor = stop;
    }

    return true;
}

sm::PhysicalAddress AddressSpace::getBackingAddress(sm::VirtualAddress address) {
    stdx::LockGuard guard(mLock);
    return mTables.getBackingAddress(address);
}

template<typename F>
OsStatus AddressSpace::transfer(sm::VirtualAddress address, size_t size, bool write, F&& fn) {
    if (size > UINTPTR_MAX - address.address) {
        return OsStatusInvalidAddress;
    }

    MemoryManager& memory = mContext->memoryManager();
    size_t done = 0;
    while (done < size) {
        sm::VirtualAddress cursor = address + done;
        sm::VirtualAddress page = cursor.alignDown(x86::kPageSize);
        size_t offset = cursor - page;
        size_t chunk = std::min(x86::kPageSize - offset, size - done);

        Region *region = findRegion(page);
        if (region == nullptr || resolvePage(region, page, write, true) != FaultResult::eHandled) {
            return OsStatusInvalidAddress;
        }

        std::byte *frame = memory.mapped<std::byte>(sm::PhysicalAddress(mTables.resolve(page).address()));
        fn(frame + offset, done, chunk);
        done += chunk;
    }

    return OsStatusSuccess;
}

OsStatus AddressSpace::read(sm::VirtualAddress address, std::span<std::byte> buffer) {
    stdx::LockGuard guard(mLock);

    return transfer(address, buffer.size(), false, [&](const std::byte *src, size_t offset, size_t size) {
        memcpy(buffer.data() + offset, src, size);
    });
}

OsStatus AddressSpace::write(sm::VirtualAddress address, std::span<const std::byte> buffer) {
    stdx::LockGuard guard(mLock);

    return transfer(address, buffer.size(), true, [&](std::byte *dst, size_t offset, size_t size) {
        memcpy(dst, buffer.data() + offset, size);
    });
}
