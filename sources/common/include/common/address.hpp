#pragma once

#include <compare> // IWYU pragma: keep - std::strong_ordering
#include <bit>

#include <cstddef>
#include <cstdint>

namespace sm {
    /// @brief Strongly typed address of one address space.
    ///
    /// @tparam Self The derived address type, arithmetic returns this type.
    template<typename Self, typename TStorage = uintptr_t>
    struct Address {
        using Storage = TStorage;

        Storage address;

        constexpr Address() noexcept = default;

        constexpr Address(Storage address) noexcept
            : address(address)
        { }

        constexpr Address(std::nullptr_t) noexcept
            : address(0)
        { }

        constexpr auto operator<=>(const Address& other) const noexcept = default;

        constexpr bool isNull() const noexcept {
            return address == 0;
        }

        constexpr bool isAlignedTo(size_t alignment) const noexcept {
            return (address % alignment) == 0;
        }

        constexpr Self& operator+=(ptrdiff_t offset) noexcept {
            address += offset;
            return self();
        }

        constexpr Self& operator-=(ptrdiff_t offset) noexcept {
            address -= offset;
            return self();
        }

        constexpr Self operator+(ptrdiff_t offset) const noexcept {
            return Self { Storage(address + offset) };
        }

        constexpr Self operator-(ptrdiff_t offset) const noexcept {
            return Self { Storage(address - offset) };
        }

        constexpr ptrdiff_t operator-(Address other) const noexcept {
            return address - other.address;
        }

        constexpr uintptr_t operator%(uintptr_t offset) const noexcept {
            return address % offset;
        }

    private:
        constexpr Self& self() noexcept {
            return static_cast<Self&>(*this);
        }
    };

    struct PhysicalAddress : public Address<PhysicalAddress> {
        using Address::Address;

        constexpr PhysicalAddress() noexcept = default;

        static constexpr PhysicalAddress invalid() noexcept {
            return PhysicalAddress { UINTPTR_MAX };
        }
    };

    struct VirtualAddress : public Address<VirtualAddress> {
        using Address::Address;

        constexpr VirtualAddress() noexcept = default;

        VirtualAddress(const void *pointer) noexcept
            : Address(std::bit_cast<uintptr_t>(pointer))
        { }

        /// @brief Round down to the start of the containing @p alignment sized block.
        constexpr VirtualAddress alignDown(uintptr_t alignment) const noexcept {
            return VirtualAddress { address - (address % alignment) };
        }
    };
}
