#pragma once

#include "utils.hpp"

#include <array>
#include <concepts>
#include <format>
#include <type_traits>

namespace keel {

    // Enums that name themselves through a to_string(E) -> std::string_view overload found by ADL
    // (errc, connection_state, execution_error_kind, protocol::method, ...).
    template <typename T, typename U = std::remove_cvref_t<T>>
    concept named_enum = std::is_enum_v<U> && requires(U v) {
        { to_string(v) } -> std::same_as<std::string_view>;
    };

    namespace detail {
        template <size_t N>
        struct fixed_format {
            std::array<char, N> chars;

            consteval fixed_format(const char (&s)[N]) { std::ranges::copy(s, s + N, chars.begin()); }
            constexpr std::string_view view() const { return {chars.data(), N - 1}; }
        };

        template <fixed_format Format>
        struct bound_format {
            template <typename... T>
            std::string operator()(T&&... args) const {
                return std::format(Format.view(), std::forward<T>(args)...);
            }
        };
    }  // namespace detail

    namespace literals {
        // "client {} owns {}"_format(a, b); the format string is checked at compile time
        template <detail::fixed_format Format>
        consteval auto operator""_format() {
            return detail::bound_format<Format>{};
        }
    }  // namespace literals

}  // namespace keel

template <keel::named_enum T>
struct std::formatter<T, char> : std::formatter<std::string_view, char> {
    template <typename FormatContext>
    auto format(const T& val, FormatContext& ctx) const {
        return std::formatter<std::string_view, char>::format(to_string(val), ctx);
    }
};
