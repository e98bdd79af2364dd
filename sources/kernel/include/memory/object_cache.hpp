#pragma once

#include "allocator/allocator.hpp"
#include "common/util/util.hpp"
#include "std/spinlock.hpp"

#include <new>
#include <utility>

namespace vsp {
    namespace detail {
        /// @brief Untyped fixed size object cache.
        ///
        /// Objects are carved from blocks allocated from the heap. Freed objects are kept
        /// on a free list and reused, blocks are returned to the heap when the cache is destroyed.
        class SlabCache {
            union Item {
                Item *next;
            };

            struct Block {
                Block *next;
            };

            static constexpr size_t kBlockSize = 0x1000;

            stdx::SpinLock mLock;

            mem::IAllocator *mHeap;
            size_t mItemSize;
            size_t mItemAlign;
            size_t mItemsPerBlock;

            Block *mBlocks GUARDED_BY(mLock) = nullptr;
            Item *mFreeList GUARDED_BY(mLock) = nullptr;
            size_t mBlockCount GUARDED_BY(mLock) = 0;
            size_t mLiveCount GUARDED_BY(mLock) = 0;

            size_t blockSize() const noexcept;
            size_t headerSize() const noexcept;

            bool grow() REQUIRES(mLock);

        public:
            UTIL_NOCOPY(SlabCache);
            UTIL_NOMOVE(SlabCache);

            SlabCache(mem::IAllocator *heap, size_t size, size_t align) noexcept;
            ~SlabCache() noexcept;

            void *allocate();
            void deallocate(void *ptr) noexcept;

            size_t liveCount();
            size_t blockCount();
        };
    }

    /// @brief Allocates objects of one type with amortized O(1) cost.
    template<typename T>
    class ObjectCache {
        detail::SlabCache mCache;

    public:
        ObjectCache(mem::IAllocator *heap) noexcept
            : mCache(heap, sizeof(T), alignof(T))
        { }

        /// @return The new object, or nullptr if the heap is exhausted.
        template<typename... Args>
        T *construct(Args&&... args) {
            if (void *ptr = mCache.allocate()) {
                return new (ptr) T(std::forward<Args>(args)...);
            }

            return nullptr;
        }

        void destroy(T *ptr) noexcept {
            if (ptr != nullptr) {
                ptr->~T();
                mCache.deallocate(ptr);
            }
        }

        /// @brief Number of live objects.
        size_t count() { return mCache.liveCount(); }
    };
}
