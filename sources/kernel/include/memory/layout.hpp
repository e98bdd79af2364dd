#pragma once

#include "memory/range.hpp"

#include "common/util/util.hpp"

#include "arch/paging.hpp"

#include <stddef.h>
#include <stdint.h>

namespace vsp {
    /// @brief First user address, the null page is never handed out.
    static constexpr uintptr_t kUserSpaceBase = 0x1000;

    /// @brief Number of pages managed by a user address space.
    ///
    /// The last page of the 4GiB space is reserved so the exclusive end of the
    /// range is representable in a 32-bit @a uintptr_t.
    static constexpr size_t kUserSpacePages = 0xffffe;

    static constexpr VirtualRange kUserSpace = VirtualRange::of(sm::VirtualAddress(kUserSpaceBase), kUserSpacePages * x86::kPageSize);

    static_assert(uint64_t(kUserSpaceBase) + uint64_t(kUserSpacePages) * x86::kPageSize <= UINT32_MAX);

    /// @brief Returns the number of pages required to store the given number of bytes.
    constexpr size_t Pages(size_t bytes) {
        return sm::roundup(bytes, x86::kPageSize) / x86::kPageSize;
    }

    constexpr size_t PageBytes(size_t pages) {
        return pages * x86::kPageSize;
    }

    enum class PageFlags : uint8_t {
        eNone = 0,

        eRead = 1 << 0,
        eWrite = 1 << 1,
        eUser = 1 << 2,

        eData = eRead | eWrite,

        eUserRead = eRead | eUser,
        eUserData = eData | eUser,
    };

    UTIL_BITFLAGS(PageFlags);
}
