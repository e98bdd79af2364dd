#include "memory/object_cache.hpp"

#include "panic.hpp"

#include <algorithm>

using vsp::detail::SlabCache;

SlabCache::SlabCache(mem::IAllocator *heap, size_t size, size_t align) noexcept
    : mHeap(heap)
    , mItemSize(sm::roundup(std::max(size, sizeof(Item)), std::max(align, alignof(Item))))
    , mItemAlign(std::max(align, alignof(Item)))
{
    mItemsPerBlock = std::max<size_t>((kBlockSize - headerSize()) / mItemSize, 1);
}

SlabCache::~SlabCache() noexcept {
    stdx::LockGuard guard(mLock);
    VSP_CHECK(mLiveCount == 0, "Object cache destroyed with live objects");

    while (mBlocks != nullptr) {
        Block *next = mBlocks->next;
        mHeap->deallocate(mBlocks, blockSize());
        mBlocks = next;
    }
}

size_t SlabCache::headerSize() const noexcept {
    return sm::roundup(sizeof(Block), mItemAlign);
}

size_t SlabCache::blockSize() const noexcept {
    return headerSize() + mItemSize * mItemsPerBlock;
}

bool SlabCache::grow() {
    void *memory = mHeap->allocateAligned(blockSize(), std::max(mItemAlign, alignof(Block)));
    if (memory == nullptr) {
        return false;
    }

    Block *block = new (memory) Block { mBlocks };
    mBlocks = block;
    mBlockCount += 1;

    char *items = static_cast<char*>(memory) + headerSize();
    for (size_t i = mItemsPerBlock; i > 0; i--) {
        Item *item = new (items + (i - 1) * mItemSize) Item { mFreeList };
        mFreeList = item;
    }

    return true;
}

void *SlabCache::allocate() {
    stdx::LockGuard guard(mLock);
    if (mFreeList == nullptr && !grow()) {
        return nullptr;
    }

    Item *item = mFreeList;
    mFreeList = item->next;
    mLiveCount += 1;
    return item;
}

void SlabCache::deallocate(void *ptr) noexcept {
    stdx::LockGuard guard(mLock);
    Item *item = new (ptr) Item { mFreeList };
    mFreeList = item;
    mLiveCount -= 1;
}

size_t SlabCache::liveCount() {
    stdx::LockGuard guard(mLock);
    return mLiveCount;
}

size_t SlabCache::blockCount() {
    stdx::LockGuard guard(mLock);
    return mBlockCount;
}
