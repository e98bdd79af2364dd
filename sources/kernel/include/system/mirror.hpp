#pragma once

#include "allocator/allocator.hpp"
#include "common/util/util.hpp"
#include "std/spinlock.hpp"

#include <vesper/status.h>

#include <stdint.h>

namespace sys {
    class Region;

    /// @brief Index of a ring node in a @a MirrorTable.
    using MirrorHandle = uint32_t;

    static constexpr MirrorHandle kInvalidMirror = UINT32_MAX;

    /// @brief Arena of mirror rings.
    ///
    /// Regions cloned from one another are linked into a circular ring, one node per region.
    /// Nodes are addressed by index so the arena can be resized without invalidating handles.
    class MirrorTable {
        struct Node {
            /// @brief The region this node belongs to, nullptr if the node is free.
            Region *region;
            MirrorHandle prev;
            MirrorHandle next;
        };

        static constexpr uint32_t kInitialCapacity = 64;

        stdx::SpinLock mLock;

        mem::IAllocator *mHeap;

        Node *mNodes GUARDED_BY(mLock) = nullptr;
        uint32_t mCapacity GUARDED_BY(mLock) = 0;
        uint32_t mLiveCount GUARDED_BY(mLock) = 0;

        /// @brief Head of the free node list, linked through @a Node::next.
        MirrorHandle mFreeHead GUARDED_BY(mLock) = kInvalidMirror;

        bool grow() REQUIRES(mLock);
        OsStatus allocateNode(Region *region, MirrorHandle *handle) REQUIRES(mLock);
        Node& nodeAt(MirrorHandle handle) REQUIRES(mLock);

    public:
        UTIL_NOCOPY(MirrorTable);
        UTIL_NOMOVE(MirrorTable);

        MirrorTable(mem::IAllocator *heap) noexcept
            : mHeap(heap)
        { }

        ~MirrorTable() noexcept;

        /// @brief Create a ring containing only @p region.
        [[nodiscard]]
        OsStatus create(Region *region, MirrorHandle *handle);

        /// @brief Add @p region to the ring of @p sibling.
        [[nodiscard]]
        OsStatus link(MirrorHandle sibling, Region *region, MirrorHandle *handle);

        /// @brief Remove a node from its ring and release it.
        void unlink(MirrorHandle handle) noexcept;

        /// @brief Number of regions in the ring of @p handle.
        size_t ringSize(MirrorHandle handle);

        /// @brief Visit the other regions in the ring of @p handle.
        template<typename F>
        void forEachSibling(MirrorHandle handle, F&& fn) {
            stdx::LockGuard guard(mLock);
            for (MirrorHandle it = nodeAt(handle).next; it != handle; it = nodeAt(it).next) {
                fn(static_cast<const Region*>(nodeAt(it).region));
            }
        }

        /// @brief Number of live nodes.
        size_t count();
    };
}
