#pragma once

#include <algorithm>
#include <atomic>
#include <charconv>
#include <iostream>
#include <optional>
#include <ranges>
#include <source_location>
#include <string>
#include <string_view>

namespace keel {

    constexpr std::string_view sloc_fname(const std::source_location& loc) {
        std::string_view sv{loc.file_name()};
        if (auto p = sv.rfind('/'); p != sv.npos)
            sv.remove_prefix(p + 1);
        return sv;
    }

    inline void prepend_location(std::ostream& os, const std::source_location& loc) {
        os << '[' << sloc_fname(loc) << ':' << loc.line() << "] ";
    }

// Debug logger; no-op on release builds
#ifndef NDEBUG
    template <typename... Args>
    struct debug_log {
        constexpr explicit debug_log(
                Args&&... args, const std::source_location& loc = std::source_location::current()) {
            prepend_location(std::cerr, loc);
            (std::cerr << ... << std::forward<Args>(args)) << std::endl;
        }
    };
#else
    template <typename... Args>
    struct debug_log {
        constexpr explicit debug_log(Args&&...) {}
    };
#endif

    // deduction guide
    template <typename... Args>
    debug_log(Args&&...) -> debug_log<Args...>;

    // Leveled loggers share the debug_log prefix. stdout belongs to the stdio transport, so everything goes to
    // stderr.
    namespace log {
        enum class level : int { error = 0, warn = 1, info = 2, debug = 3 };

        inline std::atomic<int>& threshold() {
            static std::atomic<int> value{static_cast<int>(level::info)};
            return value;
        }

        inline void set_threshold(level lvl) {
            threshold().store(static_cast<int>(lvl), std::memory_order_relaxed);
        }

        inline bool enabled(level lvl) {
            return static_cast<int>(lvl) <= threshold().load(std::memory_order_relaxed);
        }

        inline constexpr std::string_view tag(level lvl) {
            switch (lvl) {
                case level::error:
                    return "error: ";
                case level::warn:
                    return "warn: ";
                case level::info:
                    return "info: ";
                case level::debug:
                    return "debug: ";
            }
            return "";
        }

        template <typename... Args>
        void emit(level lvl, const std::source_location& loc, Args&&... args) {
            if (!enabled(lvl)) {
                return;
            }
            prepend_location(std::cerr, loc);
            std::cerr << tag(lvl);
            (std::cerr << ... << std::forward<Args>(args)) << std::endl;
        }

        // Brace-construct at call sites (log::warn{"...", x}) so a single identifier argument is never parsed as a
        // declaration.
        template <typename... Args>
        struct error {
            explicit error(Args&&... args, const std::source_location& loc = std::source_location::current()) {
                emit(level::error, loc, std::forward<Args>(args)...);
            }
        };
        template <typename... Args>
        error(Args&&...) -> error<Args...>;

        template <typename... Args>
        struct warn {
            explicit warn(Args&&... args, const std::source_location& loc = std::source_location::current()) {
                emit(level::warn, loc, std::forward<Args>(args)...);
            }
        };
        template <typename... Args>
        warn(Args&&...) -> warn<Args...>;

        template <typename... Args>
        struct info {
            explicit info(Args&&... args, const std::source_location& loc = std::source_location::current()) {
                emit(level::info, loc, std::forward<Args>(args)...);
            }
        };
        template <typename... Args>
        info(Args&&...) -> info<Args...>;

        // runtime-filtered, unlike debug_log which is compiled out
        template <typename... Args>
        struct debug {
            explicit debug(Args&&... args, const std::source_location& loc = std::source_location::current()) {
                emit(level::debug, loc, std::forward<Args>(args)...);
            }
        };
        template <typename... Args>
        debug(Args&&...) -> debug<Args...>;
    }  // namespace log

    namespace utils {
        constexpr char char_tolower(char c) {
            if (c >= 'A' && c <= 'Z') {
                return c + ('a' - 'A');
            }
            return c;
        }

        constexpr bool str_case_eq(std::string_view lhs, std::string_view rhs) {
            return std::ranges::equal(
                    lhs | std::views::transform(char_tolower), rhs | std::views::transform(char_tolower));
        }

        namespace detail {
            template <typename T>
            concept arithmetic_type = std::integral<T> || std::floating_point<T>;
        }

        template <detail::arithmetic_type T>
        constexpr std::optional<T> parse_arithmetic(std::string_view input, [[maybe_unused]] int base = 10) {
            T value{};
            std::from_chars_result result;

            if constexpr (std::integral<T>) {
                result = std::from_chars(input.data(), input.data() + input.size(), value, base);
            }
            else {
                result = std::from_chars(input.data(), input.data() + input.size(), value);
            }

            if (result.ec != std::errc{} || result.ptr != input.data() + input.size()) {
                return std::nullopt;
            }

            return {value};
        }

    }  // namespace utils

}  // namespace keel
