#pragma once

#include "memory/object_cache.hpp"
#include "memory/page_allocator.hpp"
#include "system/mirror.hpp"
#include "system/pmm.hpp"
#include "system/region.hpp"

namespace sys {
    class AddressSpace;

    /// @brief Collaborators shared by every address space.
    ///
    /// Created once by kernel initialization and passed to @a AddressSpace::create.
    /// Every cache and table has its own lock that nests inside the address space lock.
    class MemoryContext {
        mem::IAllocator *mHeap;

        vsp::PageAllocator mPageAllocator;
        MemoryManager mMemoryManager;

        vsp::ObjectCache<Region> mRegionCache;
        vsp::ObjectCache<Gap> mGapCache;
        vsp::ObjectCache<AddressSpace> mSpaceCache;

        MirrorTable mMirrors;

    public:
        UTIL_NOCOPY(MemoryContext);
        UTIL_NOMOVE(MemoryContext);

        MemoryContext(mem::IAllocator *heap) noexcept;

        mem::IAllocator *heap() const noexcept { return mHeap; }
        vsp::PageAllocator& pageAllocator() noexcept { return mPageAllocator; }
        MemoryManager& memoryManager() noexcept { return mMemoryManager; }
        vsp::ObjectCache<Region>& regionCache() noexcept { return mRegionCache; }
        vsp::ObjectCache<Gap>& gapCache() noexcept { return mGapCache; }
        vsp::ObjectCache<AddressSpace>& spaceCache() noexcept { return mSpaceCache; }
        MirrorTable& mirrors() noexcept { return mMirrors; }

        /// @brief Create a context managing the physical memory in @p memory.
        ///
        /// @param memory The physical memory available for page tables and user frames.
        /// @param window Kernel pointer to the first byte of @p memory.
        /// @param heap The heap for metadata, must be safe to call from multiple threads.
        /// @param context The new context.
        ///
        /// @retval OsStatusInvalidInput @p memory is not usable.
        /// @retval OsStatusOutOfMemory The metadata heap is exhausted.
        [[nodiscard]]
        static OsStatus create(vsp::MemoryRange memory, void *window, mem::IAllocator *heap, MemoryContext **context);

        /// @brief Destroy a context, every address space must have been destroyed.
        static void destroy(MemoryContext *context) noexcept;
    };
}
