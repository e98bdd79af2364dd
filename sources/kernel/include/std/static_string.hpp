#pragma once

#include <algorithm>
#include <iterator>
#include <type_traits>
#include <string_view>

#include <stddef.h>
#include <stdint.h>

namespace stdx {
    /// @brief A string stored inline with a fixed capacity.
    ///
    /// Writes past the capacity are truncated, never allocate.
    template<typename T, size_t N>
    class StaticStringBase {
        using SizeType = std::conditional_t<(N <= UINT8_MAX), uint8_t, std::conditional_t<(N <= UINT16_MAX), uint16_t, uint32_t>>;

        SizeType mSize;
        T mStorage[N];

        constexpr void init(const T *front, const T *back) noexcept {
            mSize = std::clamp<size_t>(back - front, 0, std::size(mStorage));
            std::copy_n(front, mSize, mStorage);
        }

    public:
        constexpr StaticStringBase() noexcept
            : mSize(0)
        { }

        template<size_t S> requires (S <= N + 1)
        constexpr StaticStringBase(const T (&str)[S]) noexcept
            : StaticStringBase(str, str + S - 1)
        { }

        constexpr StaticStringBase(std::basic_string_view<T> view) noexcept
            : StaticStringBase(view.data(), view.data() + view.size())
        { }

        constexpr StaticStringBase(const T *front, const T *back) noexcept {
            init(front, back);
        }

        constexpr size_t count() const { return mSize; }
        constexpr size_t capacity() const { return N; }

        constexpr bool isEmpty() const { return mSize == 0; }
        constexpr bool isFull() const { return mSize == N; }

        constexpr T *begin() { return mStorage; }
        constexpr T *end() { return mStorage + mSize; }

        constexpr const T *begin() const { return mStorage; }
        constexpr const T *end() const { return mStorage + mSize; }

        constexpr void clear() {
            mSize = 0;
        }

        constexpr void add(T elem) {
            if (mSize < N) {
                mStorage[mSize++] = elem;
            }
        }

        constexpr void add(std::basic_string_view<T> view) {
            add(view.data(), view.data() + view.size());
        }

        constexpr void add(const T *front, const T *back) {
            size_t size = back - front;
            size_t newSize = mSize + size;
            if (newSize > N) {
                size = N - mSize;
            }

            std::copy_n(front, size, mStorage + mSize);
            mSize += size;
        }

        constexpr T& operator[](size_t index) {
            return mStorage[index];
        }

        constexpr const T& operator[](size_t index) const {
            return mStorage[index];
        }

        constexpr operator std::basic_string_view<T>() const {
            return std::basic_string_view<T>(mStorage, mSize);
        }

        constexpr bool operator==(std::basic_string_view<T> other) const {
            return std::basic_string_view<T>(*this) == other;
        }
    };

    template<size_t N>
    using StaticString = StaticStringBase<char, N>;

    static_assert(sizeof(StaticString<16>) == 17);
    static_assert(sizeof(StaticString<64>) == 65);
}
