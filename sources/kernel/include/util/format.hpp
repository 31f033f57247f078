#pragma once

#include <cosmos/status.h>

#include "std/string_view.hpp"
#include "std/static_string.hpp"
#include "std/traits.hpp"

#include <algorithm>
#include <array>
#include <span>
#include <utility>

namespace cm {
    template<typename T>
    struct Format;

    template<typename T>
    concept IsFormatSize = requires {
        { Format<T>::kStringSize } -> std::convertible_to<size_t>;
    };

    template<typename T>
    concept IsFormat = IsFormatSize<T> && requires(T it) {
        { Format<T>::toString(std::declval<char*>(), it) } -> std::same_as<stdx::StringView>;
    };

    /// @brief Types that format to a string view without a caller provided buffer.
    template<typename T>
    concept IsFormatEx = requires(T it) {
        { Format<T>::toString(it) } -> std::convertible_to<stdx::StringView>;
    };

    template<typename T>
    concept IsStreamFormat = requires(T it) {
        { Format<T>::format(std::declval<class IOutStream&>(), it) };
    };

    class IOutStream {
    public:
        virtual ~IOutStream() = default;

        virtual void write(stdx::StringView message) = 0;
        virtual void write(char c) {
            write(std::to_array({ c }));
        }

        template<typename T> requires (!std::convertible_to<T, stdx::StringView>)
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
    constexpr stdx::StringView FormatInt(std::span<char> buffer, T input, int base, int width = 0, char fill = '\0') {
        constexpr char kHex[] = "0123456789ABCDEF";
        bool negative = input < 0;

        char *end = buffer.data() + buffer.size();
        char *ptr = end - 1;
        if (input != 0) {
            stdx::Unsigned<T> value;

            if (negative) {
                value = stdx::Unsigned<T>(0) - stdx::Unsigned<T>(input);
            } else {
                value = input;
            }

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

            int remaining = width - (end - ptr) + 1;
            while (remaining-- > 0 && ptr >= buffer.data()) {
                *ptr-- = fill;
            }
        }

        if (negative) {
            *ptr-- = '-';
        }

        return stdx::StringView(ptr + 1, end);
    }

    template<>
    struct Format<char> {
        static constexpr size_t kStringSize = 1;
        static constexpr stdx::StringView toString(char *buffer, char value) {
            buffer[0] = value;
            return stdx::StringView(buffer, buffer + 1);
        }

        static void format(IOutStream& out, char value) {
            out.write(value);
        }
    };

    template<std::integral T>
    struct Format<T> {
        static constexpr size_t kStringSize = stdx::NumericTraits<T>::kMaxDigits10 + 1;
        static constexpr stdx::StringView toString(char *buffer, T value) {
            return FormatInt(std::span(buffer, kStringSize), value, 10);
        }

        static void format(IOutStream& out, T value) {
            char buffer[kStringSize];
            out.write(toString(buffer, value));
        }
    };

    template<std::integral T>
    struct Format<Hex<T>> {
        static constexpr size_t kStringSize = stdx::NumericTraits<T>::kMaxDigits16 + 2;
        static stdx::StringView toString(char *buffer, Hex<T> value) {
            char temp[stdx::NumericTraits<T>::kMaxDigits16];
            stdx::StringView result = FormatInt(std::span(temp), value.value, 16, value.width, value.fill);

            int offset = 0;
            if (value.prefix) {
                buffer[offset++] = '0';
                buffer[offset++] = 'x';
            }

            std::copy(result.begin(), result.end(), buffer + offset);
            return stdx::StringView(buffer, buffer + offset + result.count());
        }

        static void format(IOutStream& out, Hex<T> value) {
            char buffer[kStringSize];
            out.write(toString(buffer, value));
        }
    };

    template<std::integral T>
    struct Format<Int<T>> {
        static constexpr size_t kStringSize = stdx::NumericTraits<T>::kMaxDigits10 + 1;
        static stdx::StringView toString(char *buffer, Int<T> value) {
            return FormatInt(std::span(buffer, kStringSize), value.value, 10, value.width, value.fill);
        }

        static void format(IOutStream& out, Int<T> value) {
            char buffer[kStringSize];
            out.write(toString(buffer, value));
        }
    };

    template<>
    struct Format<const void*> {
        static constexpr size_t kStringSize = stdx::NumericTraits<uintptr_t>::kMaxDigits16 + 2;
        static stdx::StringView toString(char *buffer, const void *value) {
            return Format<Hex<uintptr_t>>::toString(buffer, Hex<uintptr_t>(reinterpret_cast<uintptr_t>(value)).pad(16));
        }

        static void format(IOutStream& out, const void *value) {
            char buffer[kStringSize];
            out.write(toString(buffer, value));
        }
    };

    template<>
    struct Format<void*> : Format<const void*> { };

    template<>
    struct Format<bool> {
        static stdx::StringView toString(bool value) {
            using namespace stdx::literals;
            return value ? "True"_sv : "False"_sv;
        }

        static void format(IOutStream& out, bool value) {
            out.write(toString(value));
        }
    };

    template<IsFormatSize T>
    inline constexpr size_t kFormatSize = Format<T>::kStringSize;

    template<IsFormat T>
    inline constexpr stdx::StringView format(char *buffer, T value) {
        return Format<T>::toString(buffer, value);
    }

    template<IsFormatEx T>
    inline constexpr auto format(T value) {
        return Format<T>::toString(value);
    }

    template<IsStreamFormat T>
    inline void format(IOutStream& out, const T& value) noexcept {
        Format<T>::format(out, value);
    }

    inline void format(IOutStream& out, stdx::StringView value) noexcept {
        out.write(value);
    }

    template<size_t N, typename... T>
    inline stdx::StaticString<N> concat(T&&... args) noexcept {
        struct OutStream final : public IOutStream {
            stdx::StaticString<N> result;

            void write(stdx::StringView message) noexcept override {
                result.add(message);
            }
        };

        OutStream out;
        (out.format(args), ...);

        return out.result;
    }

    template<IsFormatEx T> requires (!IsStreamFormat<T>)
    inline void format(IOutStream& out, const T& value) {
        out.write(Format<T>::toString(value));
    }

    template<IsFormat T> requires (!IsStreamFormat<T>)
    inline void format(IOutStream& out, const T& value) {
        char buffer[kFormatSize<T>];
        out.write(Format<T>::toString(buffer, value));
    }

    template<typename T> requires (!std::convertible_to<T, stdx::StringView>)
    void IOutStream::write(const T& value) {
        cm::format(*this, value);
    }

    template<>
    struct Format<OsStatusId> {
        // longest name plus the hex code
        static constexpr size_t kStringSize = kFormatSize<cm::Hex<OsStatus>> + 32;

        static void format(IOutStream& out, OsStatusId value);
    };
}
