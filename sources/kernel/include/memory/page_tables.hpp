#pragma once

#include "arch/paging.hpp"
#include "memory/layout.hpp"
#include "memory/page_allocator.hpp"
#include "memory/range.hpp"

#include <algorithm>

namespace vsp {
    /// @brief Two level x86 page tables for one address space.
    ///
    /// @details All tables are allocated from @a PageAllocator and accessed through its window.
    ///          The tables are externally synchronized by the owning address space.
    class PageTables {
        PageAllocator *mAllocator = nullptr;
        x86::PD *mRoot = nullptr;

        /// @brief Number of page tables referenced by the page directory.
        size_t mTableCount = 0;

        /// @brief Allocate a new zeroed 4k table.
        void *alloc4k();

        void free4k(void *table) noexcept;

        void setEntryFlags(x86::Entry& entry, PageFlags flags, sm::PhysicalAddress address) noexcept;

        x86::PT *findPageTable(sm::VirtualAddress vaddr) const noexcept;

        [[nodiscard]]
        OsStatus getPageTable(sm::VirtualAddress vaddr, x86::PT **table);

        template<typename T>
        T *asVirtual(sm::PhysicalAddress address) const noexcept {
            return mAllocator->mapped<T>(address);
        }

    public:
        /// @brief Bytes of address space covered by one page table.
        static constexpr uintptr_t kTableSpan = x86::kPageSize * x86::paging::kEntryCount;

        UTIL_NOCOPY(PageTables);

        constexpr PageTables() noexcept = default;

        PageTables(PageTables&& other) noexcept;
        PageTables& operator=(PageTables&& other) noexcept;

        ~PageTables() noexcept;

        bool isValid() const noexcept { return mRoot != nullptr; }

        /// @brief Physical address of the page directory, the value loaded into cr3.
        sm::PhysicalAddress root() const noexcept;

        size_t tableCount() const noexcept { return mTableCount; }

        /// @brief Map one page.
        ///
        /// Replaces any existing mapping of @p vaddr.
        ///
        /// @retval OsStatusOutOfMemory A page table could not be allocated, nothing was changed.
        [[nodiscard]]
        OsStatus map(sm::VirtualAddress vaddr, sm::PhysicalAddress paddr, PageFlags flags);

        /// @brief Get the page table entry of the page containing @p vaddr.
        ///
        /// @return The entry, a non-present entry if there is no page table.
        x86::pte resolve(sm::VirtualAddress vaddr) const noexcept;

        /// @brief Get the backing physical address of @p vaddr including the page offset.
        ///
        /// @return The physical address, or @a sm::PhysicalAddress::invalid if unmapped.
        sm::PhysicalAddress getBackingAddress(sm::VirtualAddress vaddr) const noexcept;

        /// @brief Remove the mapping of one page.
        ///
        /// @return The previous entry.
        x86::pte unmap(sm::VirtualAddress vaddr) noexcept;

        /// @brief Visit every present entry in @p range.
        ///
        /// @p fn is called with the page address and a copy of its entry, ranges without
        /// a page table are skipped.
        template<typename F>
        void forEachMapping(VirtualRange range, F&& fn) const {
            sm::VirtualAddress it = range.front;
            while (it < range.back) {
                sm::VirtualAddress stop = std::min(it.alignDown(kTableSpan) + kTableSpan, range.back);
                if (const x86::PT *pt = findPageTable(it)) {
                    for (; it < stop; it += x86::kPageSize) {
                        x86::pte pte = pt->entries[x86::paging::ptIndex(it.address)];
                        if (pte.present()) {
                            fn(it, pte);
                        }
                    }
                }

                it = stop;
            }
        }

        /// @brief Change the protection of every present page in @p range.
        void protect(VirtualRange range, PageFlags flags) noexcept;

        /// @brief Release every page table and the page directory.
        ///
        /// Frames mapped by the tables are not released.
        void destroy() noexcept;

        [[nodiscard]]
        static OsStatus create(PageAllocator *allocator, PageTables *tables);

        /// @brief Create a copy of @p source that maps the same frames with the same protection.
        ///
        /// @retval OsStatusOutOfMemory Not every table could be copied, @p tables is unchanged.
        [[nodiscard]]
        static OsStatus clone(const PageTables& source, PageTables *tables);
    };
}
