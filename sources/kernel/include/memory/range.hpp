#pragma once

#include <algorithm>
#include <compare> // IWYU pragma: keep

#include <cstdint>

#include "panic.hpp"
#include "util/format.hpp"

#include "common/util/util.hpp"
#include "common/address.hpp"

namespace vsp {
    /// @brief A range of address space.
    ///
    /// Represents a range of [front, back) addresses. The range is inclusive of the front address
    /// and exclusive of the back address.
    ///
    /// The terminology used for dealing with ranges is as follows:
    /// - front: The start of the range, this is the first byte in the range.
    /// - back: The end of the range, this is the first byte after the range.
    /// - size: The number of bytes in the range.
    /// - empty: A range where the front and back are the same.
    /// - contains: A range that is totally contained within another range.
    /// - intersects: Two ranges that share at least one address.
    ///
    /// @pre @a AnyRange::front <= @a AnyRange::back
    template<typename T>
    struct AnyRange {
        using ValueType = T;

        T front;
        T back;

        constexpr uintptr_t size() const {
            VSP_ASSERT(isValid());
            return back.address - front.address;
        }

        constexpr bool isEmpty() const {
            return front == back;
        }

        constexpr bool isValid() const {
            return front <= back;
        }

        /// @brief Checks if the given address is within the range.
        constexpr bool contains(ValueType addr) const {
            return addr >= front && addr < back;
        }

        /// @brief Checks if the given range is totally contained within this range.
        constexpr bool contains(AnyRange range) const {
            return range.front >= front && range.back <= back;
        }

        /// @brief Checks if the two ranges share at least one address.
        constexpr bool intersects(AnyRange range) const {
            return front < range.back && range.front < back;
        }

        constexpr bool operator==(const AnyRange& other) const = default;

        constexpr static AnyRange of(T front, uintptr_t size) {
            return {front, front + size};
        }
    };

    using VirtualRange = AnyRange<sm::VirtualAddress>;
    using MemoryRange = AnyRange<sm::PhysicalAddress>;
}

template<>
struct vsp::Format<sm::PhysicalAddress> {
    static constexpr size_t kStringSize = vsp::kFormatSize<Hex<uintptr_t>>;

    static void format(vsp::IOutStream& out, sm::PhysicalAddress value) {
        out.write(Hex(value.address).pad(8, '0'));
    }
};

template<>
struct vsp::Format<sm::VirtualAddress> {
    static constexpr size_t kStringSize = vsp::kFormatSize<Hex<uintptr_t>>;

    static void format(vsp::IOutStream& out, sm::VirtualAddress value) {
        out.write(Hex(value.address).pad(8, '0'));
    }
};

template<typename T>
struct vsp::Format<vsp::AnyRange<T>> {
    static constexpr size_t kStringSize = vsp::kFormatSize<T> * 2 + 1;

    static void format(vsp::IOutStream& out, vsp::AnyRange<T> value) {
        out.format(value.front, "-", value.back);
    }
};
