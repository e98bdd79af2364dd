#include "memory/page_tables.hpp"

#include "logger/categories.hpp"

#include <string.h>
#include <utility>

using namespace vsp;

void *PageTables::alloc4k() {
    sm::PhysicalAddress frame;
    if (mAllocator->allocate(&frame) != OsStatusSuccess) {
        return nullptr;
    }

    void *it = asVirtual<void>(frame);
    memset(it, 0, x86::kPageSize);
    return it;
}

void PageTables::free4k(void *table) noexcept {
    mAllocator->free(mAllocator->physicalOf(table));
}

void PageTables::setEntryFlags(x86::Entry& entry, PageFlags flags, sm::PhysicalAddress address) noexcept {
    if (address.address > UINT32_MAX) {
        VSP_PANIC("Physical address out of range.");
    }

    entry.setAddress(uint32_t(address.address));

    entry.setWriteable(bool(flags & PageFlags::eWrite));
    entry.setUser(bool(flags & PageFlags::eUser));

    entry.setPresent(true);
}

x86::PT *PageTables::findPageTable(sm::VirtualAddress vaddr) const noexcept {
    if (mRoot == nullptr) {
        return nullptr;
    }

    const x86::pde& pde = mRoot->entries[x86::paging::pdIndex(vaddr.address)];
    if (!pde.present()) {
        return nullptr;
    }

    return asVirtual<x86::PT>(sm::PhysicalAddress(pde.address()));
}

OsStatus PageTables::getPageTable(sm::VirtualAddress vaddr, x86::PT **table) {
    if (x86::PT *pt = findPageTable(vaddr)) {
        *table = pt;
        return OsStatusSuccess;
    }

    x86::PT *pt = static_cast<x86::PT*>(alloc4k());
    if (pt == nullptr) {
        return OsStatusOutOfMemory;
    }

    // The leaf entry decides the final protection.
    x86::pde& pde = mRoot->entries[x86::paging::pdIndex(vaddr.address)];
    setEntryFlags(pde, PageFlags::eUserData, mAllocator->physicalOf(pt));
    mTableCount += 1;

    *table = pt;
    return OsStatusSuccess;
}

PageTables::PageTables(PageTables&& other) noexcept
    : mAllocator(std::exchange(other.mAllocator, nullptr))
    , mRoot(std::exchange(other.mRoot, nullptr))
    , mTableCount(std::exchange(other.mTableCount, 0))
{ }

PageTables& PageTables::operator=(PageTables&& other) noexcept {
    if (this != &other) {
        destroy();
        mAllocator = std::exchange(other.mAllocator, nullptr);
        mRoot = std::exchange(other.mRoot, nullptr);
        mTableCount = std::exchange(other.mTableCount, 0);
    }

    return *this;
}

PageTables::~PageTables() noexcept {
    destroy();
}

sm::PhysicalAddress PageTables::root() const noexcept {
    return mAllocator->physicalOf(mRoot);
}

OsStatus PageTables::map(sm::VirtualAddress vaddr, sm::PhysicalAddress paddr, PageFlags flags) {
    x86::PT *pt = nullptr;
    if (OsStatus status = getPageTable(vaddr, &pt)) {
        return status;
    }

    x86::pte& pte = pt->entries[x86::paging::ptIndex(vaddr.address)];
    pte.underlying = 0;
    setEntryFlags(pte, flags, paddr);
    return OsStatusSuccess;
}

x86::pte PageTables::resolve(sm::VirtualAddress vaddr) const noexcept {
    if (const x86::PT *pt = findPageTable(vaddr)) {
        return pt->entries[x86::paging::ptIndex(vaddr.address)];
    }

    return x86::pte { };
}

sm::PhysicalAddress PageTables::getBackingAddress(sm::VirtualAddress vaddr) const noexcept {
    x86::pte pte = resolve(vaddr);
    if (!pte.present()) {
        return sm::PhysicalAddress::invalid();
    }

    return sm::PhysicalAddress(pte.address()) + (vaddr % x86::kPageSize);
}

x86::pte PageTables::unmap(sm::VirtualAddress vaddr) noexcept {
    x86::PT *pt = findPageTable(vaddr);
    if (pt == nullptr) {
        return x86::pte { };
    }

    x86::pte& pte = pt->entries[x86::paging::ptIndex(vaddr.address)];
    x86::pte old = pte;
    pte.underlying = 0;
    return old;
}

void PageTables::protect(VirtualRange range, PageFlags flags) noexcept {
    sm::VirtualAddress it = range.front;
    while (it < range.back) {
        sm::VirtualAddress stop = std::min(it.alignDown(kTableSpan) + kTableSpan, range.back);
        if (x86::PT *pt = findPageTable(it)) {
            for (; it < stop; it += x86::kPageSize) {
                x86::pte& pte = pt->entries[x86::paging::ptIndex(it.address)];
                if (pte.present()) {
                    pte.setWriteable(bool(flags & PageFlags::eWrite));
                    pte.setUser(bool(flags & PageFlags::eUser));
                }
            }
        }

        it = stop;
    }
}

void PageTables::destroy() noexcept {
    if (mRoot == nullptr) {
        return;
    }

    for (x86::pde& pde : mRoot->entries) {
        if (pde.present()) {
            mAllocator->free(sm::PhysicalAddress(pde.address()));
            pde.underlying = 0;
        }
    }

    free4k(mRoot);
    mRoot = nullptr;
    mTableCount = 0;
}

OsStatus PageTables::create(PageAllocator *allocator, PageTables *tables) {
    PageTables result;
    result.mAllocator = allocator;
    result.mRoot = static_cast<x86::PD*>(result.alloc4k());
    if (result.mRoot == nullptr) {
        return OsStatusOutOfMemory;
    }

    *tables = std::move(result);
    return OsStatusSuccess;
}

OsStatus PageTables::clone(const PageTables& source, PageTables *tables) {
    PageTables result;
    if (OsStatus status = PageTables::create(source.mAllocator, &result)) {
        return status;
    }

    for (size_t i = 0; i < x86::paging::kEntryCount; i++) {
        const x86::pde& pde = source.mRoot->entries[i];
        if (!pde.present()) continue;

        x86::PT *pt = static_cast<x86::PT*>(result.alloc4k());
        if (pt == nullptr) {
            VmLog.warnf("Out of memory cloning page table ", i, " of ", source.mTableCount);
            // Destructor of result releases the partial copy.
            return OsStatusOutOfMemory;
        }

        memcpy(pt, source.asVirtual<x86::PT>(sm::PhysicalAddress(pde.address())), sizeof(x86::PT));

        x86::pde& entry = result.mRoot->entries[i];
        entry.underlying = pde.underlying;
        entry.setAddress(uint32_t(result.mAllocator->physicalOf(pt).address));
        result.mTableCount += 1;
    }

    *tables = std::move(result);
    return OsStatusSuccess;
}
