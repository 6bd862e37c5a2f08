#pragma once

#include "svcscan/utils.hpp"

#include <cstddef>
#include <string_view>

namespace svcscan::internal::text {

    using namespace std::string_view_literals;

    // Leading whitespace as the scanner sees it (\s minus newlines)
    inline constexpr bool ascii_is_indent(char c) noexcept {
        return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
    }

    inline constexpr bool ascii_is_space(char c) noexcept { return ascii_is_indent(c) || c == '\n'; }

    inline constexpr bool ascii_is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

    inline constexpr bool ascii_is_alpha(char c) noexcept { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }

    inline constexpr bool ascii_is_hex_digit(char c) noexcept {
        auto lower = utils::char_tolower(c);
        return ascii_is_digit(c) || (lower >= 'a' && lower <= 'f');
    }

    // [A-Za-z0-9_]
    inline constexpr bool ascii_is_word(char c) noexcept { return ascii_is_alpha(c) || ascii_is_digit(c) || c == '_'; }

    // [A-Za-z0-9_-], the header key alphabet
    inline constexpr bool is_key_char(char c) noexcept { return ascii_is_word(c) || c == '-'; }

    // [A-Za-z0-9_.-], the scalar key alphabet
    inline constexpr bool is_scalar_key_char(char c) noexcept { return is_key_char(c) || c == '.'; }

    inline constexpr bool is_quote(char c) noexcept { return c == '"' || c == '\''; }

    inline constexpr std::string_view trim_left(std::string_view value) noexcept {
        while (!value.empty() && ascii_is_space(value.front())) {
            value.remove_prefix(1U);
        }
        return value;
    }

    inline constexpr std::string_view trim_right(std::string_view value) noexcept {
        while (!value.empty() && ascii_is_space(value.back())) {
            value.remove_suffix(1U);
        }
        return value;
    }

    inline constexpr std::string_view trim_ascii(std::string_view value) noexcept {
        return trim_right(trim_left(value));
    }

    // Length of the longest prefix made of `pred` characters
    template <typename Pred>
    inline constexpr std::size_t span_of(std::string_view value, Pred pred) noexcept {
        std::size_t n = 0U;
        while (n < value.size() && pred(value[n])) {
            ++n;
        }
        return n;
    }

    inline constexpr bool all_of(std::string_view value, bool (*pred)(char) noexcept) noexcept {
        for (auto c : value) {
            if (!pred(c)) {
                return false;
            }
        }
        return true;
    }

}  // namespace svcscan::internal::text
