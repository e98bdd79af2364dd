#pragma once

#include "panic.hpp"
#include "util/absl.hpp"

#include <vesper/status.h>

#include <new>

namespace sys::detail {
    /// @brief Ordered index of disjoint intervals.
    ///
    /// Stores non-owning pointers ordered by @p TCompare, which must be transparent
    /// so lookups can be done by key without a record.
    template<typename T, typename TCompare>
    class IntervalIndex {
        using Set = sm::BTreeSet<T*, TCompare>;

        Set mItems;

    public:
        using Iterator = typename Set::const_iterator;

        IntervalIndex(mem::IAllocator *heap)
            : mItems(TCompare(), mem::AllocatorPointer<T*>(heap))
        { }

        /// @retval OsStatusOutOfMemory The index could not grow, it is unchanged.
        /// @retval OsStatusAlreadyExists An item with an equal key is already present.
        [[nodiscard]]
        OsStatus insert(T *item) {
            try {
                auto [_, inserted] = mItems.insert(item);
                return inserted ? OsStatusSuccess : OsStatusAlreadyExists;
            } catch (const std::bad_alloc&) {
                return OsStatusOutOfMemory;
            }
        }

        void remove(T *item) noexcept {
            [[maybe_unused]] size_t count = mItems.erase(item);
            VSP_CHECK(count == 1, "Removing an item that is not in the index");
        }

        /// @brief Find the item with a key equal to @p key.
        template<typename K>
        T *find(const K& key) const noexcept {
            auto it = mItems.find(key);
            return (it != mItems.end()) ? *it : nullptr;
        }

        /// @brief Find the first item not ordered before @p key.
        template<typename K>
        T *lowerBound(const K& key) const noexcept {
            auto it = mItems.lower_bound(key);
            return (it != mItems.end()) ? *it : nullptr;
        }

        /// @brief Find the last item not ordered after @p key.
        template<typename K>
        T *floor(const K& key) const noexcept {
            auto it = mItems.upper_bound(key);
            if (it == mItems.begin()) {
                return nullptr;
            }

            return *--it;
        }

        /// @brief The item ordered after @p item.
        T *next(const T *item) const noexcept {
            auto it = mItems.upper_bound(const_cast<T*>(item));
            return (it != mItems.end()) ? *it : nullptr;
        }

        /// @brief The item ordered before @p item.
        T *prev(const T *item) const noexcept {
            auto it = mItems.lower_bound(const_cast<T*>(item));
            if (it == mItems.begin()) {
                return nullptr;
            }

            return *--it;
        }

        template<typename F>
        void forEach(F&& fn) const {
            for (T *item : mItems) {
                fn(item);
            }
        }

        Iterator begin() const noexcept { return mItems.begin(); }
        Iterator end() const noexcept { return mItems.end(); }

        T *first() const noexcept { return mItems.empty() ? nullptr : *mItems.begin(); }
        T *last() const noexcept { return mItems.empty() ? nullptr : *mItems.rbegin(); }

        size_t count() const noexcept { return mItems.size(); }
        bool isEmpty() const noexcept { return mItems.empty(); }

        void clear() noexcept { mItems.clear(); }
    };
}
