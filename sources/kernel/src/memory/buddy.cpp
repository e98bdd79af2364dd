#include "memory/detail/buddy.hpp"

#include "panic.hpp"

using vsp::detail::BuddyTree;

BuddyTree::BuddyTree(int8_t *storage, size_t roots, int order) noexcept
    : mTree(storage)
    , mRoots(roots)
    , mOrder(order)
{
    int8_t *it = mTree;
    for (int current = mOrder; current >= 0; current--) {
        size_t chunks = mRoots << (mOrder - current);
        for (size_t i = 0; i < chunks; i++) {
            it[i] = int8_t(current);
        }

        it += chunks;
    }
}

int BuddyTree::suitableOrder(size_t pages) noexcept {
    int order = 0;
    while (order < kMaxOrder && (pages >> (order + 1)) != 0) {
        order++;
    }

    return order;
}

size_t BuddyTree::storageSize(size_t roots, int order) noexcept {
    size_t size = 0;
    for (int current = 0; current <= order; current++) {
        size += roots << (order - current);
    }

    return size;
}

int8_t *BuddyTree::slice(int order) const noexcept {
    int8_t *it = mTree;
    for (int current = mOrder; current > order; current--) {
        it += mRoots << (mOrder - current);
    }

    return it;
}

int BuddyTree::scanFreeChunks(const int8_t *slice, size_t base, int order) noexcept {
    int8_t lo = slice[base];
    int8_t hi = slice[base + 1];

    if (lo == order && hi == order) {
        return order + 1;
    }

    return lo > hi ? lo : hi;
}

size_t BuddyTree::allocate(int order) noexcept {
    if (order < 0 || order > mOrder) {
        return kInvalidIndex;
    }

    int current = mOrder;
    int8_t *it = slice(current);

    size_t index = 0;
    while (index < mRoots && it[index] < order) {
        index++;
    }

    if (index == mRoots) {
        return kInvalidIndex;
    }

    while (current > order) {
        current--;
        it = slice(current);
        size_t base = index * 2;
        if (it[base] >= order) {
            index = base;
        } else {
            VSP_ASSERT(it[base + 1] >= order);
            index = base + 1;
        }
    }

    VSP_ASSERT(it[index] == order);
    it[index] = -1;

    size_t update = index;
    for (int level = order; level < mOrder; level++) {
        update /= 2;
        int freeOrder = scanFreeChunks(slice(level), update * 2, level);
        slice(level + 1)[update] = int8_t(freeOrder);
    }

    return index << order;
}

void BuddyTree::free(size_t index, int order) noexcept {
    VSP_ASSERT(order >= 0 && order <= mOrder);
    VSP_ASSERT(index % (size_t(1) << order) == 0);

    size_t update = index >> order;
    int8_t *it = slice(order);
    VSP_CHECK(it[update] == -1, "Buddy chunk freed twice");
    it[update] = int8_t(order);

    for (int level = order; level < mOrder; level++) {
        update /= 2;
        int freeOrder = scanFreeChunks(slice(level), update * 2, level);
        slice(level + 1)[update] = int8_t(freeOrder);
    }
}

bool BuddyTree::verify() const noexcept {
    for (int level = mOrder; level > 0; level--) {
        const int8_t *parents = slice(level);
        const int8_t *children = slice(level - 1);
        size_t count = mRoots << (mOrder - level);

        for (size_t i = 0; i < count; i++) {
            // Children of an allocated chunk are not tracked.
            if (parents[i] == -1) continue;

            if (parents[i] != scanFreeChunks(children, i * 2, level - 1)) {
                return false;
            }
        }
    }

    return true;
}
