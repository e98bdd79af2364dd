#pragma once

#include "common/util/util.hpp"

#include <stddef.h>
#include <stdint.h>

namespace x86 {
    constexpr void setmask(uint32_t& value, uint32_t mask, bool state) noexcept {
        if (state) {
            value |= mask;
        } else {
            value &= ~mask;
        }
    }

    constexpr uintptr_t kPageSize = 0x1000;
    constexpr size_t kPageShift = 12;

    namespace paging {
        constexpr uint32_t kPresentBit  = 1u << 0;
        constexpr uint32_t kWriteBit    = 1u << 1;
        constexpr uint32_t kUserBit     = 1u << 2;
        constexpr uint32_t kAccessedBit = 1u << 5;
        constexpr uint32_t kWrittenBit  = 1u << 6;
        constexpr uint32_t kAddressMask = ~uint32_t(kPageSize - 1);

        /// @brief Entries per page directory and per page table.
        constexpr size_t kEntryCount = 1024;

        constexpr size_t pdIndex(uintptr_t address) noexcept { return (address >> 22) & 0x3ff; }
        constexpr size_t ptIndex(uintptr_t address) noexcept { return (address >> 12) & 0x3ff; }

        static_assert(pdIndex(0xffc0'0000) == 1023);
        static_assert(ptIndex(0x0040'1000) == 1);
    }

    struct Entry {
        uint32_t underlying;

        bool present() const noexcept { return underlying & paging::kPresentBit; }
        void setPresent(bool present) noexcept { setmask(underlying, paging::kPresentBit, present); }

        bool writeable() const noexcept { return underlying & paging::kWriteBit; }
        void setWriteable(bool writeable) noexcept { setmask(underlying, paging::kWriteBit, writeable); }

        bool user() const noexcept { return underlying & paging::kUserBit; }
        void setUser(bool user) noexcept { setmask(underlying, paging::kUserBit, user); }

        bool accessed() const { return underlying & paging::kAccessedBit; }
        void setAccessed(bool accessed) { setmask(underlying, paging::kAccessedBit, accessed); }

        bool written() const { return underlying & paging::kWrittenBit; }
        void setWritten(bool written) { setmask(underlying, paging::kWrittenBit, written); }

        uint32_t address() const noexcept { return underlying & paging::kAddressMask; }
        void setAddress(uint32_t address) noexcept {
            underlying = (underlying & ~paging::kAddressMask) | (address & paging::kAddressMask);
        }
    };

    /// @brief Page table entry, maps one 4k page.
    struct pte : Entry { };

    /// @brief Page directory entry, references one page table.
    struct pde : Entry { };

    static_assert(sizeof(pte) == sizeof(uint32_t));
    static_assert(sizeof(pde) == sizeof(uint32_t));

    struct alignas(kPageSize) PT {
        pte entries[paging::kEntryCount];
    };

    struct alignas(kPageSize) PD {
        pde entries[paging::kEntryCount];
    };

    static_assert(sizeof(PT) == kPageSize);
    static_assert(sizeof(PD) == kPageSize);

    /// @brief The error code pushed by the cpu for a page fault (vector 14).
    struct PageFaultCode {
        static constexpr uint32_t kPresentBit = 1u << 0;
        static constexpr uint32_t kWriteBit   = 1u << 1;
        static constexpr uint32_t kUserBit    = 1u << 2;

        uint32_t underlying;

        /// @brief The fault was a protection violation on a present page.
        constexpr bool present() const noexcept { return underlying & kPresentBit; }

        constexpr bool write() const noexcept { return underlying & kWriteBit; }

        /// @brief The access originated in ring 3.
        constexpr bool user() const noexcept { return underlying & kUserBit; }

        static constexpr PageFaultCode of(bool present, bool write, bool user) noexcept {
            return PageFaultCode {
                (present ? kPresentBit : 0u) | (write ? kWriteBit : 0u) | (user ? kUserBit : 0u)
            };
        }
    };
}
