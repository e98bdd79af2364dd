#pragma once

#include "memory/layout.hpp"
#include "system/mirror.hpp"

namespace sys {
    class AddressSpace;

    enum class RegionFlags : uint8_t {
        eNone = 0,

        eWrite = 1 << 0,
        eUser = 1 << 1,
        eStack = 1 << 2,

        eUserData = eWrite | eUser,
        eUserStack = eWrite | eUser | eStack,
    };

    UTIL_BITFLAGS(RegionFlags);

    /// @brief An allocated interval of virtual address space.
    ///
    /// Pages are committed in the presence map when the region is allocated, frames are
    /// mapped lazily on the first fault.
    class Region {
        friend class AddressSpace;

        AddressSpace *mOwner;
        sm::VirtualAddress mBegin;
        size_t mPages;
        size_t mUsedPages;

        /// @brief One bit per page, owned by the address space heap.
        uint32_t *mPresence;
        size_t mPresenceWords;

        RegionFlags mFlags;
        MirrorHandle mMirror = kInvalidMirror;

    public:
        UTIL_NOCOPY(Region);
        UTIL_NOMOVE(Region);

        static constexpr size_t kBitsPerWord = sizeof(uint32_t) * 8;

        Region(AddressSpace *owner, sm::VirtualAddress begin, size_t pages, uint32_t *presence, size_t words, RegionFlags flags) noexcept;

        static constexpr size_t presenceWords(size_t pages) noexcept {
            return (pages + kBitsPerWord - 1) / kBitsPerWord;
        }

        AddressSpace *owner() const noexcept { return mOwner; }

        sm::VirtualAddress begin() const noexcept { return mBegin; }
        sm::VirtualAddress end() const noexcept { return mBegin + vsp::PageBytes(mPages); }

        vsp::VirtualRange range() const noexcept { return { begin(), end() }; }

        size_t pages() const noexcept { return mPages; }
        size_t usedPages() const noexcept { return mUsedPages; }

        RegionFlags flags() const noexcept { return mFlags; }
        bool writeable() const noexcept { return bool(mFlags & RegionFlags::eWrite); }
        bool user() const noexcept { return bool(mFlags & RegionFlags::eUser); }
        bool isStack() const noexcept { return bool(mFlags & RegionFlags::eStack); }

        MirrorHandle mirror() const noexcept { return mMirror; }

        /// @brief Protection of a resolved page of this region.
        vsp::PageFlags pageFlags() const noexcept;

        size_t pageIndex(sm::VirtualAddress address) const noexcept {
            return (address - mBegin) / x86::kPageSize;
        }

        bool isPresent(size_t page) const noexcept;
        void setPresent(size_t page, bool present) noexcept;
    };

    /// @brief A free interval of virtual address space.
    struct Gap {
        sm::VirtualAddress begin;
        size_t pages;

        sm::VirtualAddress end() const noexcept { return begin + vsp::PageBytes(pages); }
        vsp::VirtualRange range() const noexcept { return { begin, end() }; }
    };

    /// @brief Gaps are ordered by size then address.
    struct GapKey {
        size_t pages;
        sm::VirtualAddress begin;

        constexpr auto operator<=>(const GapKey&) const noexcept = default;
    };

    struct RegionOrder {
        using is_transparent = void;

        bool operator()(const Region *lhs, const Region *rhs) const noexcept { return lhs->begin() < rhs->begin(); }
        bool operator()(const Region *lhs, sm::VirtualAddress rhs) const noexcept { return lhs->begin() < rhs; }
        bool operator()(sm::VirtualAddress lhs, const Region *rhs) const noexcept { return lhs < rhs->begin(); }
    };

    struct GapOrder {
        using is_transparent = void;

        static GapKey keyOf(const Gap *gap) noexcept { return GapKey { gap->pages, gap->begin }; }

        bool operator()(const Gap *lhs, const Gap *rhs) const noexcept { return keyOf(lhs) < keyOf(rhs); }
        bool operator()(const Gap *lhs, const GapKey& rhs) const noexcept { return keyOf(lhs) < rhs; }
        bool operator()(const GapKey& lhs, const Gap *rhs) const noexcept { return lhs < keyOf(rhs); }
    };
}

template<>
struct vsp::Format<sys::RegionFlags> {
    static constexpr size_t kStringSize = 3;

    static void format(vsp::IOutStream& out, sys::RegionFlags value) {
        out.write(bool(value & sys::RegionFlags::eWrite) ? 'w' : '-');
        out.write(bool(value & sys::RegionFlags::eUser) ? 'u' : '-');
        out.write(bool(value & sys::RegionFlags::eStack) ? 's' : '-');
    }
};
