#include "memory/page_allocator.hpp"

#include "arch/paging.hpp"
#include "logger/categories.hpp"
#include "memory/layout.hpp"

using vsp::PageAllocator;

static constexpr uint64_t kPhysicalLimit = 0x1'0000'0000;

int PageAllocator::orderOf(size_t pages) noexcept {
    int order = 0;
    while ((size_t(1) << order) < pages) {
        order++;
    }

    return order;
}

PageAllocator::~PageAllocator() noexcept {
    if (mHeap != nullptr) {
        mHeap->deallocateArray(mStorage, mStorageSize);
    }
}

OsStatus PageAllocator::allocate(size_t pages, MemoryRange *range) {
    if (pages == 0) {
        return OsStatusInvalidInput;
    }

    int order = orderOf(pages);

    stdx::LockGuard guard(mLock);
    size_t index = mTree.allocate(order);
    if (index == detail::BuddyTree::kInvalidIndex) {
        return OsStatusOutOfMemory;
    }

    mFreePages -= (size_t(1) << order);

    sm::PhysicalAddress front = mRange.front + PageBytes(index);
    *range = MemoryRange::of(front, PageBytes(pages));
    return OsStatusSuccess;
}

OsStatus PageAllocator::allocate(sm::PhysicalAddress *frame) {
    MemoryRange range;
    if (OsStatus status = allocate(1, &range)) {
        return status;
    }

    *frame = range.front;
    return OsStatusSuccess;
}

void PageAllocator::free(MemoryRange range) noexcept {
    VSP_CHECK(mRange.contains(range), "Freeing memory not owned by the allocator");

    size_t index = (range.front - mRange.front) / x86::kPageSize;
    int order = orderOf(Pages(range.size()));

    stdx::LockGuard guard(mLock);
    mTree.free(index, order);
    mFreePages += (size_t(1) << order);
}

void PageAllocator::free(sm::PhysicalAddress frame) noexcept {
    free(MemoryRange::of(frame, x86::kPageSize));
}

vsp::PageAllocatorStats PageAllocator::stats() {
    stdx::LockGuard guard(mLock);
    return PageAllocatorStats {
        .totalPages = mTree.pages(),
        .freePages = mFreePages,
    };
}

bool PageAllocator::verify() {
    stdx::LockGuard guard(mLock);
    return mTree.verify();
}

OsStatus PageAllocator::create(MemoryRange range, void *window, mem::IAllocator *heap, PageAllocator *allocator) {
    if (range.isEmpty() || !range.isValid() || window == nullptr) {
        return OsStatusInvalidInput;
    }

    if (!range.front.isAlignedTo(x86::kPageSize) || !range.back.isAlignedTo(x86::kPageSize)) {
        return OsStatusInvalidInput;
    }

    if (range.back.address > kPhysicalLimit) {
        return OsStatusInvalidInput;
    }

    size_t pages = Pages(range.size());
    int order = detail::BuddyTree::suitableOrder(pages);
    size_t roots = pages >> order;
    size_t size = detail::BuddyTree::storageSize(roots, order);

    int8_t *storage = heap->allocateArray<int8_t>(size);
    if (storage == nullptr) {
        MemLog.warnf("Failed to allocate buddy tree for ", range);
        return OsStatusOutOfMemory;
    }

    // Pages past the last complete root are not managed.
    allocator->mRange = MemoryRange::of(range.front, PageBytes(roots << order));
    allocator->mSlide = reinterpret_cast<uintptr_t>(window) - range.front.address;
    allocator->mHeap = heap;
    allocator->mStorage = storage;
    allocator->mStorageSize = size;

    stdx::LockGuard guard(allocator->mLock);
    allocator->mTree = detail::BuddyTree(storage, roots, order);
    allocator->mFreePages = allocator->mTree.pages();

    return OsStatusSuccess;
}
