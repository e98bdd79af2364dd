#include "system/region.hpp"

#include "panic.hpp"

sys::Region::Region(AddressSpace *owner, sm::VirtualAddress begin, size_t pages, uint32_t *presence, size_t words, RegionFlags flags) noexcept
    : mOwner(owner)
    , mBegin(begin)
    , mPages(pages)
    , mUsedPages(0)
    , mPresence(presence)
    , mPresenceWords(words)
    , mFlags(flags)
{
    VSP_ASSERT(words >= presenceWords(pages));
}

vsp::PageFlags sys::Region::pageFlags() const noexcept {
    vsp::PageFlags flags = vsp::PageFlags::eRead;
    if (writeable()) flags |= vsp::PageFlags::eWrite;
    if (user()) flags |= vsp::PageFlags::eUser;
    return flags;
}

bool sys::Region::isPresent(size_t page) const noexcept {
    VSP_ASSERT(page < mPages);
    return mPresence[page / kBitsPerWord] & (1u << (page % kBitsPerWord));
}

void sys::Region::setPresent(size_t page, bool present) noexcept {
    VSP_ASSERT(page < mPages);
    uint32_t mask = 1u << (page % kBitsPerWord);
    uint32_t& word = mPresence[page / kBitsPerWord];
    bool old = word & mask;
    if (old == present) {
        return;
    }

    if (present) {
        word |= mask;
        mUsedPages += 1;
    } else {
        word &= ~mask;
        mUsedPages -= 1;
    }
}
