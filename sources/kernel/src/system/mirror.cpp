#include "system/mirror.hpp"

#include "logger/categories.hpp"
#include "panic.hpp"

sys::MirrorTable::~MirrorTable() noexcept {
    stdx::LockGuard guard(mLock);
    VSP_CHECK(mLiveCount == 0, "Mirror table destroyed with live rings");
    mHeap->deallocateArray(mNodes, mCapacity);
}

sys::MirrorTable::Node& sys::MirrorTable::nodeAt(MirrorHandle handle) {
    VSP_ASSERT(handle < mCapacity);
    return mNodes[handle];
}

bool sys::MirrorTable::grow() {
    uint32_t capacity = (mCapacity == 0) ? kInitialCapacity : mCapacity * 2;
    Node *nodes = mHeap->reallocateArray(mNodes, mCapacity, capacity);
    if (nodes == nullptr) {
        MemLog.warnf("Failed to grow mirror table to ", capacity, " nodes");
        return false;
    }

    for (uint32_t i = capacity; i > mCapacity; i--) {
        nodes[i - 1] = Node { nullptr, kInvalidMirror, mFreeHead };
        mFreeHead = i - 1;
    }

    mNodes = nodes;
    mCapacity = capacity;
    return true;
}

OsStatus sys::MirrorTable::allocateNode(Region *region, MirrorHandle *handle) {
    if (mFreeHead == kInvalidMirror && !grow()) {
        return OsStatusOutOfMemory;
    }

    MirrorHandle result = mFreeHead;
    Node& node = nodeAt(result);
    mFreeHead = node.next;

    node = Node { region, result, result };
    mLiveCount += 1;

    *handle = result;
    return OsStatusSuccess;
}

OsStatus sys::MirrorTable::create(Region *region, MirrorHandle *handle) {
    stdx::LockGuard guard(mLock);
    return allocateNode(region, handle);
}

OsStatus sys::MirrorTable::link(MirrorHandle sibling, Region *region, MirrorHandle *handle) {
    stdx::LockGuard guard(mLock);

    MirrorHandle result = kInvalidMirror;
    if (OsStatus status = allocateNode(region, &result)) {
        return status;
    }

    // Insert after the sibling.
    Node& head = nodeAt(sibling);
    MirrorHandle next = head.next;

    nodeAt(result).prev = sibling;
    nodeAt(result).next = next;
    nodeAt(next).prev = result;
    head.next = result;

    *handle = result;
    return OsStatusSuccess;
}

void sys::MirrorTable::unlink(MirrorHandle handle) noexcept {
    stdx::LockGuard guard(mLock);

    Node& node = nodeAt(handle);
    VSP_CHECK(node.region != nullptr, "Unlinking a free mirror node");

    nodeAt(node.prev).next = node.next;
    nodeAt(node.next).prev = node.prev;

    node = Node { nullptr, kInvalidMirror, mFreeHead };
    mFreeHead = handle;
    mLiveCount -= 1;
}

size_t sys::MirrorTable::ringSize(MirrorHandle handle) {
    stdx::LockGuard guard(mLock);

    size_t size = 1;
    for (MirrorHandle it = nodeAt(handle).next; it != handle; it = nodeAt(it).next) {
        size += 1;
    }

    return size;
}

size_t sys::MirrorTable::count() {
    stdx::LockGuard guard(mLock);
    return mLiveCount;
}
