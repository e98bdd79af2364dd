#include "system/pmm.hpp"

#include "arch/paging.hpp"
#include "logger/categories.hpp"
#include "memory/layout.hpp"

#include <string.h>

sys::MemoryManager::~MemoryManager() noexcept {
    if (mAllocator != nullptr) {
        mAllocator->deallocateArray(mOwners, mFrameCount);
    }
}

sys::MemoryManager::Counter& sys::MemoryManager::counterOf(sm::PhysicalAddress frame) noexcept {
    VSP_CHECK(mHeap->contains(frame), "Frame is not managed by this memory manager");
    VSP_ASSERT(frame.isAlignedTo(x86::kPageSize));

    size_t index = (frame - mHeap->range().front) / x86::kPageSize;
    return mOwners[index];
}

OsStatus sys::MemoryManager::allocateZeroed(sm::PhysicalAddress *frame) {
    sm::PhysicalAddress result;
    if (OsStatus status = mHeap->allocate(&result)) {
        return status;
    }

    memset(mapped(result), 0, x86::kPageSize);

    stdx::LockGuard guard(mLock);
    Counter& counter = counterOf(result);
    VSP_ASSERT(counter.load() == 0);
    counter.store(1);
    mFrames += 1;

    *frame = result;
    return OsStatusSuccess;
}

void sys::MemoryManager::retain(sm::PhysicalAddress frame) noexcept {
    stdx::LockGuard guard(mLock);
    Counter& counter = counterOf(frame);
    VSP_CHECK(counter.load() != 0, "Retaining a frame without an owner");
    counter += 1;
}

bool sys::MemoryManager::release(sm::PhysicalAddress frame) noexcept {
    {
        stdx::LockGuard guard(mLock);
        Counter& counter = counterOf(frame);
        VSP_CHECK(counter.load() != 0, "Releasing a frame without an owner");
        if (counter.fetch_sub(1) != 1) {
            return false;
        }

        mFrames -= 1;
    }

    mHeap->free(frame);
    return true;
}

uint32_t sys::MemoryManager::owners(sm::PhysicalAddress frame) noexcept {
    stdx::LockGuard guard(mLock);
    return counterOf(frame).load();
}

sys::MemoryManagerStats sys::MemoryManager::stats() noexcept {
    stdx::LockGuard guard(mLock);
    size_t shared = 0;
    for (size_t i = 0; i < mFrameCount; i++) {
        if (mOwners[i].load(std::memory_order_relaxed) > 1) {
            shared += 1;
        }
    }

    return MemoryManagerStats {
        .frames = mFrames,
        .sharedFrames = shared,
    };
}

OsStatus sys::MemoryManager::create(vsp::PageAllocator *heap, mem::IAllocator *allocator, MemoryManager *manager) {
    size_t count = vsp::Pages(heap->range().size());
    Counter *owners = allocator->allocateArray<Counter>(count);
    if (owners == nullptr) {
        MemLog.warnf("Failed to allocate owner table for ", count, " frames");
        return OsStatusOutOfMemory;
    }

    manager->mHeap = heap;
    manager->mAllocator = allocator;
    manager->mOwners = owners;
    manager->mFrameCount = count;

    return OsStatusSuccess;
}
