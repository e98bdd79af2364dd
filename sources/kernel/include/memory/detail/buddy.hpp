#pragma once

#include <stddef.h>
#include <stdint.h>

namespace vsp::detail {
    /// @brief Binary buddy tree over a contiguous run of pages.
    ///
    /// The tree is stored as one array per order, each element holds the largest
    /// free order below it or -1 if the chunk is fully allocated. The storage is
    /// provided by the owner and must be @a BuddyTree::storageSize bytes.
    class BuddyTree {
        int8_t *mTree = nullptr;
        size_t mRoots = 0;
        int mOrder = 0;

        int8_t *slice(int order) const noexcept;

        static int scanFreeChunks(const int8_t *slice, size_t base, int order) noexcept;

    public:
        static constexpr size_t kInvalidIndex = SIZE_MAX;

        /// @brief Largest chunk a single root covers, 4MiB of 4k pages.
        static constexpr int kMaxOrder = 10;

        constexpr BuddyTree() noexcept = default;

        BuddyTree(int8_t *storage, size_t roots, int order) noexcept;

        /// @brief The largest order whose chunk fits in @p pages, capped at @a kMaxOrder.
        static int suitableOrder(size_t pages) noexcept;

        static size_t storageSize(size_t roots, int order) noexcept;

        int order() const noexcept { return mOrder; }
        size_t roots() const noexcept { return mRoots; }

        /// @brief Number of pages managed by the tree.
        size_t pages() const noexcept { return mRoots << mOrder; }

        /// @brief Allocate a chunk of 2^order pages.
        ///
        /// @return The index of the first page, or @a kInvalidIndex.
        size_t allocate(int order) noexcept;

        /// @brief Free a chunk previously returned by @a allocate with the same order.
        void free(size_t index, int order) noexcept;

        /// @brief Verify every parent records the largest free order of its children.
        bool verify() const noexcept;
    };
}
