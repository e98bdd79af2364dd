#include "system/context.hpp"

#include "system/address_space.hpp"

#include "logger/categories.hpp"

sys::MemoryContext::MemoryContext(mem::IAllocator *heap) noexcept
    : mHeap(heap)
    , mRegionCache(heap)
    , mGapCache(heap)
    , mSpaceCache(heap)
    , mMirrors(heap)
{ }

OsStatus sys::MemoryContext::create(vsp::MemoryRange memory, void *window, mem::IAllocator *heap, MemoryContext **context) {
    MemoryContext *result = heap->construct<MemoryContext>(heap);
    if (result == nullptr) {
        return OsStatusOutOfMemory;
    }

    if (OsStatus status = vsp::PageAllocator::create(memory, window, heap, &result->mPageAllocator)) {
        MemLog.warnf("Failed to create page allocator for ", memory, ": ", OsStatusId(status));
        heap->destroy(result);
        return status;
    }

    if (OsStatus status = MemoryManager::create(&result->mPageAllocator, heap, &result->mMemoryManager)) {
        heap->destroy(result);
        return status;
    }

    *context = result;
    return OsStatusSuccess;
}

void sys::MemoryContext::destroy(MemoryContext *context) noexcept {
    if (context != nullptr) {
        context->mHeap->destroy(context);
    }
}
