#pragma once

#include "memory/page_allocator.hpp"
#include "memory/range.hpp"
#include "std/spinlock.hpp"

#include <atomic>

namespace sys {
    struct MemoryManagerStats {
        /// @brief Frames with at least one owner.
        size_t frames;

        /// @brief Frames with more than one owner.
        size_t sharedFrames;
    };

    /// @brief Tracks how many page tables reference each physical frame.
    ///
    /// A frame is returned to the page allocator when its last owner releases it.
    class MemoryManager {
        using Counter = std::atomic<uint32_t>;

        stdx::SpinLock mLock;

        vsp::PageAllocator *mHeap = nullptr;
        mem::IAllocator *mAllocator = nullptr;

        /// @brief One counter per frame managed by @a mHeap.
        Counter *mOwners = nullptr;
        size_t mFrameCount = 0;

        size_t mFrames GUARDED_BY(mLock) = 0;

        Counter& counterOf(sm::PhysicalAddress frame) noexcept;

    public:
        UTIL_NOCOPY(MemoryManager);
        UTIL_NOMOVE(MemoryManager);

        constexpr MemoryManager() noexcept = default;
        ~MemoryManager() noexcept;

        /// @brief Allocate a zeroed frame with one owner.
        ///
        /// @retval OsStatusOutOfMemory No frame is available.
        [[nodiscard]]
        OsStatus allocateZeroed(sm::PhysicalAddress *frame);

        /// @brief Add an owner to a frame that already has one.
        void retain(sm::PhysicalAddress frame) noexcept;

        /// @brief Drop an owner of a frame.
        ///
        /// @return true if the frame had no other owners and was freed.
        bool release(sm::PhysicalAddress frame) noexcept;

        uint32_t owners(sm::PhysicalAddress frame) noexcept;

        vsp::PageAllocator *heap() const noexcept { return mHeap; }

        template<typename T = void>
        T *mapped(sm::PhysicalAddress frame) const noexcept {
            return mHeap->mapped<T>(frame);
        }

        MemoryManagerStats stats() noexcept;

        [[nodiscard]]
        static OsStatus create(vsp::PageAllocator *heap, mem::IAllocator *allocator, MemoryManager *manager);
    };
}
