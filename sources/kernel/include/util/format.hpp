#pragma once

#include <vesper/status.h>

#include "std/static_string.hpp"

#include <algorithm>
#include <concepts>
#include <limits>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>

namespace vsp {
    class IOutStream;

    template<typename T>
    struct Format;

    namespace detail {
        template<std::integral T>
        constexpr size_t kMaxDigits10 = std::numeric_limits<T>::digits10 + 2;

        template<std::integral T>
        constexpr size_t kMaxDigits16 = sizeof(T) * 2;
    }

    template<typename T>
    concept IsFormatSize = requires {
        { Format<T>::kStringSize } -> std::convertible_to<size_t>;
    };

    template<typename T>
    concept IsStreamFormat = requires(T it) {
        { Format<T>::format(std::declval<IOutStream&>(), it) };
    };

    class IOutStream {
    public:
        virtual ~IOutStream() = default;

        virtual void write(std::string_view message) = 0;

        virtual void write(char c) {
            write(std::string_view(&c, 1));
        }

        template<typename T> requires (!std::convertible_to<T, std::string_view>)
        void write(const T& value);

        template<typename... T>
        void format(T&&... args) {
            (write(std::forward<T>(args)), ...);
        }
    };

    template<std::integral T>
    struct Int {
        T value;
        int width = 0;
        char fill = '\0';

        Int(T value) noexcept : value(value) {}

        Int pad(size_t width, char fill = '0') const {
            Int copy = *this;
            copy.width = width;
            copy.fill = fill;
            return copy;
        }
    };

    template<std::integral T>
    struct Hex {
        T value;
        int width = 0;
        char fill = '\0';
        bool prefix = true;

        Hex(T value) noexcept : value(value) {}

        Hex pad(size_t width, char fill = '0', bool prefix = true) const {
            Hex copy = *this;
            copy.width = width;
            copy.fill = fill;
            copy.prefix = prefix;
            return copy;
        }
    };

    template<std::integral T>
    std::string_view FormatInt(std::span<char> buffer, T input, int base, int width = 0, char fill = '\0') {
        static constexpr char kHex[] = "0123456789ABCDEF";
        using Unsigned = std::make_unsigned_t<T>;
        bool negative = input < 0;

        char *end = buffer.data() + buffer.size();
        char *ptr = end - 1;

        Unsigned value = negative ? Unsigned(Unsigned(0) - Unsigned(input)) : Unsigned(input);
        if (value != 0) {
            while (value != 0) {
                *ptr-- = kHex[value % base];
                value /= base;
            }
        } else {
            *ptr-- = '0';
        }

        if (fill != '\0') {
            if (negative) {
                width--;
            }

            int remaining = width - int(end - ptr) + 1;
            while (remaining-- > 0 && ptr > buffer.data()) {
                *ptr-- = fill;
            }
        }

        if (negative) {
            *ptr-- = '-';
        }

        return std::string_view(ptr + 1, end);
    }

    template<>
    struct Format<char> {
        static constexpr size_t kStringSize = 1;

        static void format(IOutStream& out, char value) {
            out.write(value);
        }
    };

    template<>
    struct Format<bool> {
        static constexpr size_t kStringSize = 5;

        static void format(IOutStream& out, bool value) {
            out.write(value ? std::string_view("True") : std::string_view("False"));
        }
    };

    template<std::integral T>
    struct Format<T> {
        static constexpr size_t kStringSize = detail::kMaxDigits10<T>;

        static void format(IOutStream& out, T value) {
            char buffer[kStringSize];
            out.write(FormatInt(std::span(buffer), value, 10));
        }
    };

    template<std::integral T>
    struct Format<Int<T>> {
        static constexpr size_t kStringSize = detail::kMaxDigits10<T> + 16;

        static void format(IOutStream& out, Int<T> value) {
            char buffer[kStringSize];
            out.write(FormatInt(std::span(buffer), value.value, 10, value.width, value.fill));
        }
    };

    template<std::integral T>
    struct Format<Hex<T>> {
        static constexpr size_t kStringSize = detail::kMaxDigits16<T> + 2;

        static void format(IOutStream& out, Hex<T> value) {
            char buffer[detail::kMaxDigits16<T>];
            if (value.prefix) {
                out.write("0x");
            }

            out.write(FormatInt(std::span(buffer), value.value, 16, value.width, value.fill));
        }
    };

    template<>
    struct Format<const void*> {
        static constexpr size_t kStringSize = detail::kMaxDigits16<uintptr_t> + 2;

        static void format(IOutStream& out, const void *value) {
            Format<Hex<uintptr_t>>::format(out, Hex(reinterpret_cast<uintptr_t>(value)));
        }
    };

    template<>
    struct Format<void*> {
        static constexpr size_t kStringSize = detail::kMaxDigits16<uintptr_t> + 2;

        static void format(IOutStream& out, const void *value) {
            Format<const void*>::format(out, value);
        }
    };

    template<>
    struct Format<OsStatusId> {
        // Name of the status followed by its hex code.
        static constexpr size_t kStringSize = detail::kMaxDigits16<OsStatus> + 32;

        static void format(IOutStream& out, OsStatusId value);
    };

    template<IsFormatSize T>
    inline constexpr size_t kFormatSize = Format<T>::kStringSize;

    template<IsStreamFormat T>
    inline void format(IOutStream& out, const T& value) {
        Format<T>::format(out, value);
    }

    inline void format(IOutStream& out, std::string_view value) {
        out.write(value);
    }

    template<typename T> requires (!std::convertible_to<T, std::string_view>)
    void IOutStream::write(const T& value) {
        vsp::format(*this, value);
    }

    template<size_t N, typename... T>
    inline stdx::StaticString<N> concat(T&&... args) noexcept {
        struct OutStream final : public IOutStream {
            stdx::StaticString<N> result;

            void write(std::string_view message) override {
                result.add(message);
            }

            using IOutStream::write;
        };

        OutStream out;
        (out.format(args), ...);

        return out.result;
    }

    template<typename T> requires (IsStreamFormat<T> && IsFormatSize<T>)
    inline stdx::StaticString<kFormatSize<T>> format(const T& value) {
        return concat<kFormatSize<T>>(value);
    }
}
