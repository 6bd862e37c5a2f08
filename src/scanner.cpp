#include "svcscan/scanner.hpp"

#include "svcscan/format.hpp"

#include "internal/text.hpp"

#include <algorithm>
#include <exception>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace svcscan::literals;

namespace svcscan {
    namespace detail {

        using namespace internal::text;

        // ^v?\d+\.\d+(\.\d+)?(-\w+)?$
        static constexpr bool looks_like_version(std::string_view tag) noexcept {
            if (!tag.empty() && tag.front() == 'v') {
                tag.remove_prefix(1U);
            }
            auto take_digits = [&tag]() noexcept {
                auto n = span_of(tag, ascii_is_digit);
                tag.remove_prefix(n);
                return n > 0U;
            };
            auto take_char = [&tag](char c) noexcept {
                if (tag.empty() || tag.front() != c) {
                    return false;
                }
                tag.remove_prefix(1U);
                return true;
            };

            if (!take_digits() || !take_char('.') || !take_digits()) {
                return false;
            }
            if (take_char('.') && !take_digits()) {
                return false;
            }
            if (take_char('-')) {
                auto n = span_of(tag, ascii_is_word);
                if (n == 0U) {
                    return false;
                }
                tag.remove_prefix(n);
            }
            return tag.empty();
        }

        // ^[0-9a-f]{7,40}$, case-insensitive
        static constexpr bool looks_like_commit_hash(std::string_view tag) noexcept {
            return tag.size() >= 7U && tag.size() <= 40U && all_of(tag, ascii_is_hex_digit);
        }

        static constexpr bool starts_with_quote(std::string_view token) noexcept {
            return !token.empty() && is_quote(token.front());
        }

        static constexpr bool ends_with_quote(std::string_view token) noexcept {
            return !token.empty() && is_quote(token.back());
        }

        static std::vector<std::string_view> split_whitespace(std::string_view value) {
            std::vector<std::string_view> tokens{};
            while (true) {
                value = trim_left(value);
                if (value.empty()) {
                    break;
                }
                auto n = span_of(value, [](char c) { return !ascii_is_space(c); });
                tokens.push_back(value.substr(0U, n));
                value.remove_prefix(n);
            }
            return tokens;
        }

        static void push_option(std::vector<std::string>& out, std::string_view token) {
            auto stripped = strip_quotes(token);
            if (!stripped.empty()) {
                out.emplace_back(stripped);
            }
        }

        static service_record& record_for(
                file_scan& scan, std::map<std::string, std::size_t, std::less<>>& by_name, std::string_view name) {
            if (auto it = by_name.find(name); it != by_name.end()) {
                return scan.services[it->second];
            }
            by_name.emplace(std::string{name}, scan.services.size());
            auto& record = scan.services.emplace_back();
            record.name = std::string{name};
            return record;
        }

    }  // namespace detail

    void location_index::record(const std::filesystem::path& file, service_location location) {
        auto& slot = entries_[key_type{file.string(), location.service}];
        slot.push_back(std::move(location));
        ++count_;
    }

    std::optional<service_location> location_index::find(
            const std::filesystem::path& file, std::string_view service) const {
        auto it = entries_.find(key_type{file.string(), std::string{service}});
        if (it == entries_.end() || it->second.empty()) {
            return std::nullopt;
        }
        return it->second.back();
    }

    std::vector<service_location> location_index::occurrences(
            const std::filesystem::path& file, std::string_view service) const {
        auto it = entries_.find(key_type{file.string(), std::string{service}});
        if (it == entries_.end()) {
            return {};
        }
        return it->second;
    }

    std::vector<service_location> location_index::in_file(const std::filesystem::path& file) const {
        std::vector<service_location> out{};
        auto name = file.string();
        for (const auto& [key, locations] : entries_) {
            if (key.first == name) {
                out.insert(out.end(), locations.begin(), locations.end());
            }
        }
        std::ranges::sort(out, {}, &service_location::line_start);
        return out;
    }

    const service_record* file_scan::find_service(std::string_view name) const {
        auto it = std::ranges::find(services, name, &service_record::name);
        return it == services.end() ? nullptr : &*it;
    }

    void scan_aggregate::add(file_scan scan, const scan_config& cfg) {
        ++files_scanned;
        for (const auto& location : scan.locations) {
            locations.record(scan.path, location);
        }
        for (const auto& record : scan.services) {
            services_by_label[scan.label].insert(record.name);
            labels_by_service[record.name].insert(scan.label);

            if (!matches_service_filter(record.name, cfg.service_filter)) {
                continue;
            }
            distinct_options.insert(record.options.begin(), record.options.end());
            for (const auto& tag : record.tags) {
                distinct_tags.insert(tag.value);
            }
        }
        files.push_back(std::move(scan));
    }

    const file_scan* scan_aggregate::find_file(const std::filesystem::path& path) const {
        auto it = std::ranges::find(files, path, &file_scan::path);
        return it == files.end() ? nullptr : &*it;
    }

    bool is_custom_tag(std::string_view tag) noexcept {
        static const std::vector<std::string> generic = default_generic_tags();
        return is_custom_tag(tag, generic);
    }

    bool is_custom_tag(std::string_view tag, const std::vector<std::string>& generic_tags) noexcept {
        auto value = strip_quotes(tag);
        if (value.empty()) {
            return false;
        }
        if (detail::looks_like_version(value) || detail::looks_like_commit_hash(value)) {
            return false;
        }
        if (std::ranges::any_of(
                    generic_tags, [value](const std::string& word) { return utils::str_case_eq(word, value); })) {
            return false;
        }
        return value.find('/') != std::string_view::npos;
    }

    std::vector<std::string> split_options(std::string_view value) {
        std::vector<std::string> out{};
        std::vector<std::string> quoted{};

        for (auto token : detail::split_whitespace(strip_quotes(value))) {
            if (!quoted.empty()) {
                quoted.emplace_back(token);
                if (detail::ends_with_quote(token)) {
                    detail::push_option(out, utils::join_with_separator(quoted, " "sv));
                    quoted.clear();
                }
                continue;
            }
            if (detail::starts_with_quote(token) && !(token.size() > 1U && detail::ends_with_quote(token))) {
                quoted.emplace_back(token);
                continue;
            }
            detail::push_option(out, token);
        }

        // unterminated quote: keep what was buffered
        if (!quoted.empty()) {
            detail::push_option(out, utils::join_with_separator(quoted, " "sv));
        }
        return out;
    }

    bool matches_service_filter(std::string_view service, std::string_view filter) {
        return utils::contains_case_insensitive(service, filter);
    }

    bool is_skipped_service(std::string_view service, const scan_config& cfg) {
        return std::ranges::any_of(cfg.skipped_service_suffixes, [service](const std::string& suffix) {
            return !suffix.empty() && service.ends_with(suffix);
        });
    }

    file_scan scan_source(const source_file& source, std::string label, const scan_config& cfg) {
        file_scan scan{};
        scan.path = source.path;
        scan.label = std::move(label);
        scan.line_count = source.lines.size();

        indentation_tracker tracker{tracker_options{cfg.root_name, cfg.root_indent}};
        std::map<std::string, std::size_t, std::less<>> by_name{};

        for (std::size_t i = 0U; i < source.lines.size(); ++i) {
            auto line = classify_line(source.lines[i], cfg.excluded_keys);
            auto step = tracker.advance(i, line);

            if (step.closed) {
                scan.locations.push_back(std::move(*step.closed));
            }

            if (step.opened_service) {
                const auto& opened = *tracker.open_location();
                auto& record = detail::record_for(scan, by_name, line.name);
                if (record.occurrences == 0U) {
                    record.indent = opened.indent;
                }
                ++record.occurrences;
                record.header_line = opened.line_start + 1U;
                continue;
            }

            if (line.kind != line_kind::scalar || step.scope == fact_scope::none) {
                continue;
            }
            if (step.scope == fact_scope::nested && cfg.depth == fact_depth::direct) {
                continue;
            }

            auto service = tracker.current_service();
            if (!service) {
                continue;
            }
            auto& record = detail::record_for(scan, by_name, *service);

            if (line.key == cfg.tag_key) {
                tag_occurrence tag{i + 1U, record.name, line.value};
                record.tags.push_back(tag);
                scan.tags.push_back(std::move(tag));
            }
            else if (line.key == cfg.options_key) {
                auto options = split_options(line.raw_value);
                record.options.insert(record.options.end(), options.begin(), options.end());
            }
        }

        if (auto closed = tracker.finish(source.lines.size())) {
            scan.locations.push_back(std::move(*closed));
        }

        debug_log("scanned ", scan.path.string(), ": ", scan.services.size(), " services, ", scan.tags.size(), " tags");
        return scan;
    }

    bool scan_file(const std::filesystem::path& path, const scan_config& cfg, scan_aggregate& aggregate) {
        try {
            auto source = load_source_file(path);
            auto label = file_label(path.filename().string(), cfg.selection);
            aggregate.add(scan_source(source, std::move(label), cfg), cfg);
            return true;
        } catch (const std::exception& e) {
            aggregate.errors.push_back(file_error{path, e.what()});
            debug_log("skipping ", path.string(), ": ", e.what());
            return false;
        }
    }

    void scan_directory(const std::filesystem::path& dir, const scan_config& cfg, scan_aggregate& aggregate) {
        for (const auto& path : select_files(dir, cfg.selection)) {
            (void)scan_file(path, cfg, aggregate);
        }
    }

}  // namespace svcscan
