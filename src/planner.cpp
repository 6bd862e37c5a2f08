#include "svcscan/mutation.hpp"

#include "internal/text.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace svcscan {
    namespace detail {

        using namespace internal::text;

        struct scalar_parts {
            std::string_view prefix{};  // indent, key, colon and the spacing after it
            char quote{'\0'};
            std::string_view items{};   // list text without quotes
            std::string_view suffix{};  // trailing whitespace and comment
        };

        static constexpr bool has_carriage_return(std::string_view line) {
            return !line.empty() && line.back() == '\r';
        }

        // Position of a ` #` comment outside quotes
        static constexpr std::size_t find_comment(std::string_view rest, bool after_space) {
            char quote = '\0';
            for (std::size_t i = 0U; i < rest.size(); ++i) {
                auto c = rest[i];
                if (quote != '\0') {
                    if (c == quote) {
                        quote = '\0';
                    }
                    continue;
                }
                if (is_quote(c)) {
                    quote = c;
                    continue;
                }
                auto spaced = i == 0U ? after_space : (rest[i - 1U] == ' ' || rest[i - 1U] == '\t');
                if (c == '#' && spaced) {
                    return i;
                }
            }
            return std::string_view::npos;
        }

        static constexpr scalar_parts split_scalar(std::string_view body, std::size_t key_column) {
            scalar_parts parts{};
            auto colon = body.find(':', key_column);
            if (colon == std::string_view::npos) {
                parts.prefix = body;
                return parts;
            }
            auto value_start = colon + 1U;
            while (value_start < body.size() && (body[value_start] == ' ' || body[value_start] == '\t')) {
                ++value_start;
            }
            parts.prefix = body.substr(0U, value_start);

            auto rest = body.substr(value_start);
            auto value = rest;
            if (auto comment = find_comment(rest, value_start > colon + 1U); comment != std::string_view::npos) {
                value = rest.substr(0U, comment);
            }
            value = trim_right(value);
            parts.suffix = rest.substr(value.size());

            if (value.size() >= 2U && is_quote(value.front()) && value.back() == value.front()) {
                parts.quote = value.front();
                value = value.substr(1U, value.size() - 2U);
            }
            parts.items = value;
            return parts;
        }

        static std::vector<std::string_view> split_items(std::string_view items) {
            std::vector<std::string_view> out{};
            while (true) {
                auto comma = items.find(',');
                auto item = strip_quotes(items.substr(0U, comma));
                if (!item.empty()) {
                    out.push_back(item);
                }
                if (comma == std::string_view::npos) {
                    break;
                }
                items.remove_prefix(comma + 1U);
            }
            return out;
        }

        // Indent of the first body line, i.e. the level of the service's own fields
        static std::optional<std::size_t> child_indent(
                const source_file& source, const service_location& location) {
            for (auto i = location.line_start + 1U; i <= location.line_end; ++i) {
                auto line = classify_line(source.lines[i], {});
                if (line.is_content() && line.indent > location.indent) {
                    return line.indent;
                }
            }
            return std::nullopt;
        }

        static bool has_children(const source_file& source, std::size_t header, std::size_t last, std::size_t indent) {
            for (auto i = header + 1U; i <= last; ++i) {
                auto line = classify_line(source.lines[i], {});
                if (!line.is_content()) {
                    continue;
                }
                return line.indent > indent;
            }
            return false;
        }

        // Column for a new field: the body's own level, else one step inside the header's key
        static std::size_t insert_indent(const source_file& source, const service_location& location) {
            if (auto level = child_indent(source, location)) {
                return *level;
            }
            auto header = classify_line(source.lines[location.line_start], {});
            if (!header.list_item) {
                return location.indent + 2U;
            }
            return header.named_by_field ? header.key_column : header.key_column + 2U;
        }

        static plan_result update_existing(
                const source_file& source,
                const service_location& location,
                std::size_t index,
                const classified_line& line,
                const list_append_request& request) {
            plan_result result{};
            result.service = location.service;
            result.header_line = location.line_start + 1U;

            std::string_view raw = source.lines[index];
            auto cr = has_carriage_return(raw);
            auto body = cr ? raw.substr(0U, raw.size() - 1U) : raw;
            auto parts = split_scalar(body, line.key_column);
            auto items = split_items(parts.items);

            if (std::ranges::find(items, std::string_view{request.value}) != items.end()) {
                debug_log("'", request.value, "' already in ", request.field, " of ", location.service);
                result.status = plan_status::already_present;
                return result;
            }

            auto current = trim_right(parts.items);
            auto separator = parts.items.find(", "sv) != std::string_view::npos ? ", "sv : ","sv;

            std::string text{parts.prefix};
            if (current.empty() && parts.quote == '\0' && parts.prefix.size() == body.find(':', line.key_column) + 1U) {
                // bare `field:` gets the usual single space
                text.push_back(' ');
            }
            if (parts.quote != '\0') {
                text.push_back(parts.quote);
            }
            text.append(current);
            if (!items.empty()) {
                text.append(separator);
            }
            text.append(request.value);
            if (parts.quote != '\0') {
                text.push_back(parts.quote);
            }
            if (!parts.suffix.empty() && parts.suffix.front() != ' ' && parts.suffix.front() != '\t') {
                // a comment that stood alone after the colon
                text.push_back(' ');
            }
            text.append(parts.suffix);
            if (cr) {
                text.push_back('\r');
            }

            result.status = plan_status::planned;
            result.previous = std::string{raw};
            result.change = edit{source.path, index, edit_action::update, std::move(text)};
            return result;
        }

    }  // namespace detail

    plan_result plan_list_append(
            const source_file& source, const service_location& location, const list_append_request& request) {
        plan_result result{};
        result.service = location.service;
        if (location.line_end >= source.lines.size() || location.line_start > location.line_end) {
            return result;
        }
        result.header_line = location.line_start + 1U;

        // the field may sit on the item's own dash line
        if (auto header = classify_line(source.lines[location.line_start], {});
                header.list_item && header.kind == line_kind::scalar && header.key == request.field) {
            return detail::update_existing(source, location, location.line_start, header, request);
        }

        if (auto level = detail::child_indent(source, location)) {
            for (auto i = location.line_start + 1U; i <= location.line_end; ++i) {
                auto line = classify_line(source.lines[i], {});
                if (!line.is_content() || line.indent != *level || line.list_item || line.key != request.field) {
                    continue;
                }
                if (line.kind == line_kind::scalar || line.named_by_field) {
                    return detail::update_existing(source, location, i, line, request);
                }
                if (line.kind == line_kind::block_header) {
                    if (detail::has_children(source, i, location.line_end, line.indent)) {
                        result.status = plan_status::field_not_scalar;
                        return result;
                    }
                    return detail::update_existing(source, location, i, line, request);
                }
            }
        }

        std::string_view header = source.lines[location.line_start];
        std::string text(detail::insert_indent(source, location), ' ');
        text.append(request.field);
        text.append(": ");
        text.append(request.value);
        if (detail::has_carriage_return(header)) {
            text.push_back('\r');
        }

        debug_log("insert ", request.field, " after line ", location.line_start, " of ", location.service);
        result.status = plan_status::planned;
        result.change = edit{source.path, location.line_start, edit_action::insert_after, std::move(text)};
        return result;
    }

    plan_result plan_list_append(
            const source_file& source,
            const location_index& locations,
            std::string_view service,
            const list_append_request& request) {
        auto location = locations.find(source.path, service);
        if (!location) {
            plan_result result{};
            result.service = std::string{service};
            return result;
        }
        return plan_list_append(source, *location, request);
    }

    std::vector<plan_result> plan_list_append_all(
            const source_file& source,
            const location_index& locations,
            std::string_view service,
            const list_append_request& request) {
        std::vector<plan_result> results{};
        for (const auto& location : locations.occurrences(source.path, service)) {
            results.push_back(plan_list_append(source, location, request));
        }
        if (results.empty()) {
            plan_result missing{};
            missing.service = std::string{service};
            results.push_back(std::move(missing));
        }
        return results;
    }

}  // namespace svcscan
