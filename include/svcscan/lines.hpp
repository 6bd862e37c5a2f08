#pragma once

#include "utils.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace svcscan {

    using namespace std::string_view_literals;

    enum class line_kind : uint8_t {
        blank,
        comment,
        block_header,
        list_block_header,
        scalar,
        unrecognized,
    };

    inline constexpr std::string_view to_string(line_kind kind) {
        switch (kind) {
            case line_kind::blank:
                return "blank"sv;
            case line_kind::comment:
                return "comment"sv;
            case line_kind::block_header:
                return "block_header"sv;
            case line_kind::list_block_header:
                return "list_block_header"sv;
            case line_kind::scalar:
                return "scalar"sv;
            case line_kind::unrecognized:
                return "unrecognized"sv;
        }
        return "unrecognized"sv;
    }

    /*
     * One physical line, categorized by shape alone.
     *
     * Headers come in two flavours: `key:` with nothing after the colon (the key names the block)
     * and `name: value` (the value names the block). Both may carry a leading `- ` list marker.
     * `key_column` is where the key starts, i.e. `indent` plus the width of any list marker.
     */
    struct classified_line {
        std::size_t indent{};
        std::size_t key_column{};
        line_kind kind{line_kind::unrecognized};
        bool list_item{false};
        bool named_by_field{false};
        bool excluded{false};
        std::string key{};
        std::string name{};
        std::string value{};
        std::string raw_value{};

        constexpr bool is_header() const {
            return kind == line_kind::block_header || kind == line_kind::list_block_header;
        }

        constexpr bool is_content() const { return kind != line_kind::blank && kind != line_kind::comment; }

        // Header that may name a service (not part of the structural vocabulary)
        constexpr bool names_block() const { return is_header() && !excluded; }
    };

    std::size_t indent_width(std::string_view line);

    // Trims whitespace, then any run of single/double quotes on either end
    std::string_view strip_quotes(std::string_view value);

    classified_line classify_line(std::string_view line, const std::vector<std::string>& excluded_keys);

}  // namespace svcscan
