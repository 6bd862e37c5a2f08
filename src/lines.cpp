#include "svcscan/lines.hpp"

#include "internal/text.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace svcscan {
    namespace detail {

        using namespace internal::text;

        struct list_marker_split {
            bool list_item{false};
            std::string_view body{};
        };

        // `- key...` -> body after the dash and any whitespace
        static constexpr list_marker_split split_list_marker(std::string_view rest) {
            if (rest.empty() || rest.front() != '-') {
                return {false, rest};
            }
            auto body = rest.substr(1U);
            body.remove_prefix(span_of(body, ascii_is_space));
            return {true, body};
        }

        // name:\s*("|')?([A-Za-z0-9_-]+)\1\s*$
        static constexpr std::optional<std::string_view> match_name_field(std::string_view body) {
            if (!body.starts_with("name:"sv)) {
                return std::nullopt;
            }
            auto rest = trim_left(body.substr(5U));
            char quote = '\0';
            if (!rest.empty() && is_quote(rest.front())) {
                quote = rest.front();
                rest.remove_prefix(1U);
            }
            auto n = span_of(rest, is_key_char);
            if (n == 0U) {
                return std::nullopt;
            }
            auto token = rest.substr(0U, n);
            rest.remove_prefix(n);
            if (quote != '\0') {
                if (rest.empty() || rest.front() != quote) {
                    return std::nullopt;
                }
                rest.remove_prefix(1U);
            }
            if (!trim_left(rest).empty()) {
                return std::nullopt;
            }
            return token;
        }

        // ([A-Za-z0-9_-]+):\s*$
        static constexpr std::optional<std::string_view> match_bare_header(std::string_view body) {
            auto n = span_of(body, is_key_char);
            if (n == 0U || n >= body.size() || body[n] != ':') {
                return std::nullopt;
            }
            if (!trim_left(body.substr(n + 1U)).empty()) {
                return std::nullopt;
            }
            return body.substr(0U, n);
        }

        struct scalar_match {
            std::string_view key{};
            std::string_view value{};
        };

        // ([A-Za-z0-9_.-]+)\s*:\s*(.+)$
        static constexpr std::optional<scalar_match> match_scalar(std::string_view body) {
            auto n = span_of(body, is_scalar_key_char);
            if (n == 0U) {
                return std::nullopt;
            }
            auto key = body.substr(0U, n);
            auto rest = trim_left(body.substr(n));
            if (rest.empty() || rest.front() != ':') {
                return std::nullopt;
            }
            auto value = trim_ascii(rest.substr(1U));
            if (value.empty()) {
                return std::nullopt;
            }
            return scalar_match{key, value};
        }

        static bool is_excluded(std::string_view key, const std::vector<std::string>& excluded_keys) {
            return std::ranges::any_of(excluded_keys, [key](const std::string& word) { return word == key; });
        }

    }  // namespace detail

    std::size_t indent_width(std::string_view line) {
        return internal::text::span_of(line, internal::text::ascii_is_indent);
    }

    std::string_view strip_quotes(std::string_view value) {
        value = internal::text::trim_ascii(value);
        while (!value.empty() && internal::text::is_quote(value.front())) {
            value.remove_prefix(1U);
        }
        while (!value.empty() && internal::text::is_quote(value.back())) {
            value.remove_suffix(1U);
        }
        return value;
    }

    classified_line classify_line(std::string_view line, const std::vector<std::string>& excluded_keys) {
        classified_line out{};
        out.indent = indent_width(line);
        out.key_column = out.indent;

        auto rest = internal::text::trim_right(line.substr(out.indent));
        if (rest.empty()) {
            out.kind = line_kind::blank;
            return out;
        }
        if (rest.front() == '#') {
            out.kind = line_kind::comment;
            return out;
        }

        auto [list_item, body] = detail::split_list_marker(rest);
        out.list_item = list_item;
        out.key_column = out.indent + (rest.size() - body.size());
        auto header_kind = list_item ? line_kind::list_block_header : line_kind::block_header;

        if (auto declared = detail::match_name_field(body)) {
            out.kind = header_kind;
            out.named_by_field = true;
            out.key = "name";
            out.name = std::string{*declared};
            out.value = out.name;
            out.raw_value = out.name;
            return out;
        }

        if (auto key = detail::match_bare_header(body)) {
            out.kind = header_kind;
            out.key = std::string{*key};
            out.name = out.key;
            out.excluded = detail::is_excluded(*key, excluded_keys);
            return out;
        }

        if (auto scalar = detail::match_scalar(body)) {
            out.kind = line_kind::scalar;
            out.key = std::string{scalar->key};
            out.raw_value = std::string{scalar->value};
            out.value = std::string{strip_quotes(scalar->value)};
            return out;
        }

        out.kind = line_kind::unrecognized;
        return out;
    }

}  // namespace svcscan
