#pragma once

#include "allocator/allocator.hpp"
#include "memory/detail/buddy.hpp"
#include "memory/range.hpp"
#include "std/spinlock.hpp"

#include <vesper/status.h>

namespace vsp {
    struct PageAllocatorStats {
        /// @brief Pages managed by the allocator.
        size_t totalPages;

        /// @brief Pages not currently allocated.
        size_t freePages;
    };

    /// @brief Buddy allocator for physical memory.
    ///
    /// The managed physical range is addressable by the kernel through a window with
    /// a fixed offset between physical and virtual addresses.
    class PageAllocator {
        stdx::SpinLock mLock;

        MemoryRange mRange;
        uintptr_t mSlide = 0;

        mem::IAllocator *mHeap = nullptr;
        int8_t *mStorage = nullptr;
        size_t mStorageSize = 0;

        detail::BuddyTree mTree GUARDED_BY(mLock);
        size_t mFreePages GUARDED_BY(mLock) = 0;

        static int orderOf(size_t pages) noexcept;

    public:
        UTIL_NOCOPY(PageAllocator);
        UTIL_NOMOVE(PageAllocator);

        constexpr PageAllocator() noexcept = default;
        ~PageAllocator() noexcept;

        /// @brief Allocate a number of contiguous physical pages.
        ///
        /// @param pages The number of contiguous pages to allocate.
        /// @param range The allocated range.
        ///
        /// @retval OsStatusInvalidInput @p pages was zero.
        /// @retval OsStatusOutOfMemory No contiguous chunk is large enough.
        [[nodiscard]]
        OsStatus allocate(size_t pages, MemoryRange *range);

        /// @brief Allocate a single page.
        [[nodiscard]]
        OsStatus allocate(sm::PhysicalAddress *frame);

        /// @brief Return a range allocated by @a allocate.
        void free(MemoryRange range) noexcept;

        void free(sm::PhysicalAddress frame) noexcept;

        bool contains(sm::PhysicalAddress address) const noexcept {
            return mRange.contains(address);
        }

        MemoryRange range() const noexcept { return mRange; }

        /// @brief Kernel pointer to the memory at @p address.
        template<typename T = void>
        T *mapped(sm::PhysicalAddress address) const noexcept {
            return reinterpret_cast<T*>(address.address + mSlide);
        }

        sm::PhysicalAddress physicalOf(const void *ptr) const noexcept {
            return sm::PhysicalAddress { reinterpret_cast<uintptr_t>(ptr) - mSlide };
        }

        PageAllocatorStats stats();

        /// @brief Verify the buddy tree.
        bool verify();

        /// @brief Create an allocator over @p range.
        ///
        /// @param range The physical memory to manage, must be page aligned and below 4G.
        /// @param window Kernel pointer to the first byte of @p range.
        /// @param heap The heap to allocate the buddy tree from.
        /// @param allocator The allocator to initialize.
        ///
        /// @retval OsStatusInvalidInput The range is empty, unaligned or above 4G.
        /// @retval OsStatusOutOfMemory The buddy tree could not be allocated.
        [[nodiscard]]
        static OsStatus create(MemoryRange range, void *window, mem::IAllocator *heap, PageAllocator *allocator);
    };
}
