#pragma once

#include "allocator/allocator.hpp"

#include <absl/container/btree_set.h>

namespace sm {
    template<typename TKey, typename TCompare = std::less<TKey>, typename TAllocator = mem::AllocatorPointer<TKey>>
    using BTreeSet = absl::btree_set<TKey, TCompare, TAllocator>;
}
