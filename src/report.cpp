#include "svcscan/report.hpp"

#include "svcscan/format.hpp"

#include <glaze/glaze.hpp>

#include <algorithm>
#include <iterator>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace svcscan::literals;

namespace svcscan::report::detail {

    struct tag_payload {
        int schema_version{1};
        bool custom_only{true};
        std::size_t files_scanned{};
        std::vector<tag_row> tags{};
    };

    struct option_payload {
        int schema_version{1};
        std::string filter{};
        std::size_t files_scanned{};
        std::vector<option_row> options{};
        std::vector<std::string> distinct{};
    };

    struct service_payload {
        int schema_version{1};
        std::string filter{};
        std::size_t files_scanned{};
        std::vector<service_row> services{};
    };

}  // namespace svcscan::report::detail

namespace glz {

    template <>
    struct meta<svcscan::report::tag_row> {
        using T = svcscan::report::tag_row;
        static constexpr auto value = object(
                "label", &T::label, "file", &T::file, "path", &T::path, "service", &T::service, "tag", &T::tag,
                "line", &T::line);
    };

    template <>
    struct meta<svcscan::report::option_row> {
        using T = svcscan::report::option_row;
        static constexpr auto value = object("label", &T::label, "service", &T::service, "option", &T::option);
    };

    template <>
    struct meta<svcscan::report::service_row> {
        using T = svcscan::report::service_row;
        static constexpr auto value = object("service", &T::service, "labels", &T::labels);
    };

    template <>
    struct meta<svcscan::report::detail::tag_payload> {
        using T = svcscan::report::detail::tag_payload;
        static constexpr auto value =
                object("schema_version",
                       &T::schema_version,
                       "custom_only",
                       &T::custom_only,
                       "files_scanned",
                       &T::files_scanned,
                       "tags",
                       &T::tags);
    };

    template <>
    struct meta<svcscan::report::detail::option_payload> {
        using T = svcscan::report::detail::option_payload;
        static constexpr auto value =
                object("schema_version",
                       &T::schema_version,
                       "filter",
                       &T::filter,
                       "files_scanned",
                       &T::files_scanned,
                       "options",
                       &T::options,
                       "distinct",
                       &T::distinct);
    };

    template <>
    struct meta<svcscan::report::detail::service_payload> {
        using T = svcscan::report::detail::service_payload;
        static constexpr auto value =
                object("schema_version",
                       &T::schema_version,
                       "filter",
                       &T::filter,
                       "files_scanned",
                       &T::files_scanned,
                       "services",
                       &T::services);
    };

}  // namespace glz

namespace svcscan::report {

    namespace detail {

        using namespace std::string_view_literals;

        static constexpr std::size_t rule_width = 80U;

        static std::string rule(char c = '=') {
            return std::string(rule_width, c);
        }

        template <typename T>
        static void write_json(std::ostream& os, const T& payload) {
            std::string json{};
            auto ec = glz::write<glz::opts{.prettify = true}>(payload, json);
            if (ec) {
                throw std::runtime_error("failed to serialize report");
            }
            os << json << '\n';
        }

        static std::string filter_note(std::string_view filter) {
            if (filter.empty()) {
                return {};
            }
            return " (filter: '{}')"_format(filter);
        }

        template <typename Row>
        using label_group = std::pair<std::string, std::vector<const Row*>>;

        // Groups rows by label, keeping first-seen label order
        template <typename Row>
        static std::vector<label_group<Row>> group_by_label(const std::vector<Row>& rows) {
            std::vector<label_group<Row>> groups{};
            for (const auto& row : rows) {
                auto it = std::ranges::find(groups, row.label, &label_group<Row>::first);
                if (it == groups.end()) {
                    groups.emplace_back(row.label, std::vector<const Row*>{});
                    it = std::prev(groups.end());
                }
                it->second.push_back(&row);
            }
            return groups;
        }

        static void write_tags_txt(
                std::ostream& os, const std::vector<tag_row>& rows, std::size_t files_scanned, bool custom_only, bool brief) {
            auto title = custom_only ? "custom tags"sv : "tags"sv;
            os << rule() << '\n' << title << '\n' << rule() << '\n';

            if (rows.empty()) {
                os << "\nno " << title << " found\n";
                os << "files scanned: " << files_scanned << '\n';
                return;
            }

            auto groups = group_by_label(rows);
            for (const auto& [label, group] : groups) {
                const auto& first = *group.front();
                os << '\n' << "file: " << first.file << " (" << label << ")\n";
                os << "path: " << first.path << '\n';
                os << "tags: " << group.size() << '\n';
                os << rule('-') << '\n';
                for (const auto* row : group) {
                    if (brief) {
                        os << "  {:<8} | service: {:<30} | tag: {}\n"_format(row->label, row->service, row->tag);
                    }
                    else {
                        os << "  line {:>4} | {:<8} | service: {:<30} | tag: {}\n"_format(
                                row->line, row->label, row->service, row->tag);
                    }
                }
            }

            os << '\n' << rule() << '\n' << "statistics\n" << rule() << '\n';
            os << "  files scanned: " << files_scanned << '\n';
            os << "  files with tags: " << groups.size() << '\n';
            os << "  tags found: " << rows.size() << '\n';
        }

        static void write_tags_csv(std::ostream& os, const std::vector<tag_row>& rows) {
            os << "label,file,service,tag,line,path\n";
            for (const auto& row : rows) {
                os << csv_escape(row.label) << ',' << csv_escape(row.file) << ',' << csv_escape(row.service) << ','
                   << csv_escape(row.tag) << ',' << row.line << ',' << csv_escape(row.path) << '\n';
            }
        }

        static void write_tags_md(
                std::ostream& os, const std::vector<tag_row>& rows, std::size_t files_scanned, bool custom_only) {
            os << (custom_only ? "# Custom tags\n\n"sv : "# Tags\n\n"sv);
            if (rows.empty()) {
                os << "**No tags found**\n\n";
                os << "Files scanned: " << files_scanned << '\n';
                return;
            }

            auto groups = group_by_label(rows);
            for (const auto& [label, group] : groups) {
                os << "## " << group.front()->file << " (" << label << ")\n\n";
                os << "| Line | Label | Service | Tag |\n";
                os << "|------|-------|---------|-----|\n";
                for (const auto* row : group) {
                    os << "| {} | {} | `{}` | `{}` |\n"_format(
                            row->line, md_cell(row->label), md_cell(row->service), md_cell(row->tag));
                }
                os << '\n';
            }

            os << "## Statistics\n\n";
            os << "- **Files scanned:** " << files_scanned << '\n';
            os << "- **Files with tags:** " << groups.size() << '\n';
            os << "- **Tags found:** " << rows.size() << '\n';
        }

        static std::vector<std::string> sorted_labels(const scan_aggregate& aggregate) {
            std::vector<std::string> labels{};
            for (const auto& file : aggregate.files) {
                labels.push_back(file.label);
            }
            std::ranges::sort(labels);
            labels.erase(std::ranges::unique(labels).begin(), labels.end());
            return labels;
        }

    }  // namespace detail

    std::string csv_escape(std::string_view value) {
        if (value.find_first_of(",\"\n\r") == std::string_view::npos) {
            return std::string{value};
        }
        std::string out{"\""};
        for (auto c : value) {
            if (c == '"') {
                out.push_back('"');
            }
            out.push_back(c);
        }
        out.push_back('"');
        return out;
    }

    std::string md_cell(std::string_view value) {
        std::string out{};
        out.reserve(value.size());
        for (auto c : value) {
            if (c == '|') {
                out.push_back('\\');
            }
            out.push_back(c);
        }
        return out;
    }

    std::vector<tag_row> collect_tags(const scan_aggregate& aggregate, const scan_config& cfg, bool custom_only) {
        std::vector<tag_row> rows{};
        for (const auto& file : aggregate.files) {
            for (const auto& tag : file.tags) {
                if (!matches_service_filter(tag.service, cfg.service_filter)) {
                    continue;
                }
                if (custom_only && (is_skipped_service(tag.service, cfg) || !is_custom_tag(tag.value, cfg.generic_tags))) {
                    continue;
                }
                rows.push_back(tag_row{
                        file.label,
                        file.path.filename().string(),
                        std::filesystem::absolute(file.path).string(),
                        tag.service,
                        tag.value,
                        tag.line});
            }
        }
        return rows;
    }

    std::vector<option_row> collect_options(const scan_aggregate& aggregate, const scan_config& cfg) {
        std::vector<const file_scan*> files{};
        for (const auto& file : aggregate.files) {
            files.push_back(&file);
        }
        std::ranges::stable_sort(files, {}, [](const file_scan* file) { return file->label; });

        std::vector<option_row> rows{};
        for (const auto* file : files) {
            std::vector<const service_record*> services{};
            for (const auto& record : file->services) {
                if (!record.options.empty() && matches_service_filter(record.name, cfg.service_filter)) {
                    services.push_back(&record);
                }
            }
            std::ranges::sort(services, {}, &service_record::name);
            for (const auto* record : services) {
                for (const auto& option : record->options) {
                    rows.push_back(option_row{file->label, record->name, option});
                }
            }
        }
        return rows;
    }

    std::vector<service_row> collect_services(const scan_aggregate& aggregate, std::string_view filter) {
        std::vector<service_row> rows{};
        for (const auto& [service, labels] : aggregate.labels_by_service) {
            if (!matches_service_filter(service, filter)) {
                continue;
            }
            rows.push_back(service_row{service, std::vector<std::string>{labels.begin(), labels.end()}});
        }
        return rows;
    }

    void write_tag_report(
            std::ostream& os,
            const scan_aggregate& aggregate,
            const scan_config& cfg,
            bool custom_only,
            report_format format) {
        auto rows = collect_tags(aggregate, cfg, custom_only);
        switch (format) {
            case report_format::txt:
                detail::write_tags_txt(os, rows, aggregate.files_scanned, custom_only, cfg.brief);
                break;
            case report_format::csv:
                detail::write_tags_csv(os, rows);
                break;
            case report_format::md:
                detail::write_tags_md(os, rows, aggregate.files_scanned, custom_only);
                break;
            case report_format::json:
                detail::write_json(os, detail::tag_payload{1, custom_only, aggregate.files_scanned, std::move(rows)});
                break;
        }
    }

    void write_option_report(
            std::ostream& os, const scan_aggregate& aggregate, const scan_config& cfg, report_format format) {
        auto rows = collect_options(aggregate, cfg);
        auto note = detail::filter_note(cfg.service_filter);
        std::vector<std::string> distinct{aggregate.distinct_options.begin(), aggregate.distinct_options.end()};

        // (label, service) pairs with options, in row order
        std::vector<std::pair<std::string, std::string>> services{};
        for (const auto& row : rows) {
            if (services.empty() || services.back() != std::pair{row.label, row.service}) {
                services.emplace_back(row.label, row.service);
            }
        }

        switch (format) {
            case report_format::txt: {
                if (rows.empty()) {
                    os << cfg.options_key << " not found in services" << note << '\n';
                    os << "\nfiles scanned: " << aggregate.files_scanned << '\n';
                    return;
                }
                os << detail::rule() << '\n' << cfg.options_key << " in services" << note << '\n' << detail::rule() << "\n";
                std::string_view label{};
                std::string_view service{};
                for (const auto& row : rows) {
                    if (row.label != label) {
                        os << (label.empty() ? "\n" : "\n\n") << "file: " << row.label << '\n';
                        label = row.label;
                        service = {};
                    }
                    if (row.service != service) {
                        os << "  service: " << row.service << '\n';
                        os << "    " << cfg.options_key << ":\n";
                        service = row.service;
                    }
                    os << "      " << row.option << '\n';
                }

                os << '\n' << detail::rule() << "\ndistinct options\n" << detail::rule() << "\n\n";
                for (const auto& option : distinct) {
                    os << "  " << option << '\n';
                }

                os << '\n' << detail::rule() << "\nstatistics\n" << detail::rule() << '\n';
                os << "  files scanned: " << aggregate.files_scanned << '\n';
                os << "  services with options: " << services.size() << '\n';
                os << "  distinct options: " << distinct.size() << '\n';
                if (!cfg.service_filter.empty()) {
                    os << "  service filter: '" << cfg.service_filter << "'\n";
                }
                break;
            }
            case report_format::csv:
                os << "file,service,option\n";
                for (const auto& row : rows) {
                    os << csv_escape(row.label) << ',' << csv_escape(row.service) << ',' << csv_escape(row.option)
                       << '\n';
                }
                break;
            case report_format::md: {
                if (rows.empty()) {
                    os << "**" << cfg.options_key << " not found in services" << note << "**\n\n";
                    os << "Files scanned: " << aggregate.files_scanned << '\n';
                    return;
                }
                os << "# " << cfg.options_key << " in services" << note << "\n\n";
                std::string_view label{};
                std::string_view service{};
                bool open_block = false;
                for (const auto& row : rows) {
                    if (row.label != label || row.service != service) {
                        if (open_block) {
                            os << "```\n\n";
                        }
                        if (row.label != label) {
                            os << "## File: " << row.label << "\n\n";
                            label = row.label;
                        }
                        os << "### Service: `" << row.service << "`\n\n```\n";
                        service = row.service;
                        open_block = true;
                    }
                    os << row.option << '\n';
                }
                if (open_block) {
                    os << "```\n\n";
                }
                os << "## Distinct options\n\n```\n";
                for (const auto& option : distinct) {
                    os << option << '\n';
                }
                os << "```\n\n## Statistics\n\n";
                os << "- **Files scanned:** " << aggregate.files_scanned << '\n';
                os << "- **Services with options:** " << services.size() << '\n';
                os << "- **Distinct options:** " << distinct.size() << '\n';
                break;
            }
            case report_format::json:
                detail::write_json(
                        os,
                        detail::option_payload{
                                1, cfg.service_filter, aggregate.files_scanned, std::move(rows), std::move(distinct)});
                break;
        }
    }

    void write_service_list(std::ostream& os, const scan_aggregate& aggregate) {
        if (aggregate.services_by_label.empty()) {
            os << "no services found\n";
            return;
        }
        os << detail::rule() << "\nall services\n" << detail::rule() << "\n\n";
        std::size_t total = 0U;
        for (const auto& [label, services] : aggregate.services_by_label) {
            os << "file: " << label << '\n';
            for (const auto& service : services) {
                os << "  - " << service << '\n';
            }
            os << '\n';
            total += services.size();
        }
        os << "services found: " << total << '\n' << detail::rule() << '\n';
    }

    void write_services_matching(
            std::ostream& os, const scan_aggregate& aggregate, std::string_view filter, report_format format) {
        auto rows = collect_services(aggregate, filter);

        if (format == report_format::json) {
            detail::write_json(
                    os, detail::service_payload{1, std::string{filter}, aggregate.files_scanned, std::move(rows)});
            return;
        }
        if (format == report_format::csv) {
            write_service_csv(os, aggregate, csv_mode::services, filter);
            return;
        }

        auto md = format == report_format::md;
        if (rows.empty()) {
            os << "no services matching '" << filter << "'\n";
            os << "\nfiles scanned: " << aggregate.files_scanned << '\n';
            return;
        }

        if (md) {
            os << "# Files with service" << detail::filter_note(filter) << "\n\n";
            os << "| Service | Files | Count |\n|---------|-------|-------|\n";
            for (const auto& row : rows) {
                os << "| `{}` | {} | {} |\n"_format(
                        md_cell(row.service), md_cell(utils::join_with_separator(row.labels, ", "sv)), row.labels.size());
            }
            os << "\nFiles scanned: " << aggregate.files_scanned << '\n';
            return;
        }

        os << detail::rule() << "\nfiles with service" << detail::filter_note(filter) << '\n' << detail::rule() << "\n\n";
        for (const auto& row : rows) {
            os << "service: " << row.service << '\n';
            os << "  found in " << row.labels.size() << " file(s):\n";
            for (const auto& label : row.labels) {
                os << "    - " << label << '\n';
            }
            os << '\n';
        }
        os << detail::rule() << "\nfiles scanned: " << aggregate.files_scanned << '\n' << detail::rule() << '\n';
    }

    bool write_services_on(std::ostream& os, const scan_aggregate& aggregate, std::string_view label) {
        auto it = aggregate.services_by_label.find(std::string{label});
        if (it == aggregate.services_by_label.end()) {
            os << "file '" << label << "' not found\n";
            auto labels = detail::sorted_labels(aggregate);
            if (!labels.empty()) {
                os << "\navailable (first 10):\n";
                for (std::size_t i = 0U; i < labels.size() && i < 10U; ++i) {
                    os << "  - " << labels[i] << '\n';
                }
            }
            return false;
        }

        os << detail::rule() << "\nservices in " << label << '\n' << detail::rule() << "\n\n";
        for (const auto& service : it->second) {
            os << "  - " << service << '\n';
        }
        os << "\nservices: " << it->second.size() << '\n' << detail::rule() << '\n';
        return true;
    }

    namespace detail {

        static std::vector<std::pair<std::string, std::size_t>> by_count(
                const std::map<std::string, std::set<std::string>>& groups) {
            std::vector<std::pair<std::string, std::size_t>> out{};
            for (const auto& [name, members] : groups) {
                out.emplace_back(name, members.size());
            }
            std::ranges::stable_sort(out, [](const auto& lhs, const auto& rhs) { return lhs.second > rhs.second; });
            return out;
        }

        static void write_summary(
                std::ostream& os,
                std::string_view title,
                std::string_view name_column,
                std::string_view count_column,
                const std::map<std::string, std::set<std::string>>& groups) {
            if (groups.empty()) {
                os << "nothing found\n";
                return;
            }
            os << rule() << '\n' << title << '\n' << rule() << "\n\n";
            os << "{:<40} {:>15}\n"_format(name_column, count_column);
            os << rule('-') << '\n';
            for (const auto& [name, count] : by_count(groups)) {
                os << "{:<40} {:>15}\n"_format(name, count);
            }
            os << '\n' << rule() << '\n';
        }

    }  // namespace detail

    void write_services_summary(std::ostream& os, const scan_aggregate& aggregate) {
        detail::write_summary(os, "summary by service"sv, "service"sv, "files"sv, aggregate.labels_by_service);
        if (!aggregate.labels_by_service.empty()) {
            os << "distinct services: " << aggregate.labels_by_service.size() << '\n';
            os << "files: " << aggregate.services_by_label.size() << '\n';
        }
    }

    void write_labels_summary(std::ostream& os, const scan_aggregate& aggregate) {
        detail::write_summary(os, "summary by file"sv, "file"sv, "services"sv, aggregate.services_by_label);
        if (!aggregate.services_by_label.empty()) {
            os << "files: " << aggregate.services_by_label.size() << '\n';
            os << "distinct services: " << aggregate.labels_by_service.size() << '\n';
        }
    }

    void write_service_csv(std::ostream& os, const scan_aggregate& aggregate, csv_mode mode, std::string_view filter) {
        switch (mode) {
            case csv_mode::services:
                os << "service,file\n";
                for (const auto& row : collect_services(aggregate, filter)) {
                    for (const auto& label : row.labels) {
                        os << csv_escape(row.service) << ',' << csv_escape(label) << '\n';
                    }
                }
                break;
            case csv_mode::prods:
                os << "file,service\n";
                for (const auto& [label, services] : aggregate.services_by_label) {
                    for (const auto& service : services) {
                        if (matches_service_filter(service, filter)) {
                            os << csv_escape(label) << ',' << csv_escape(service) << '\n';
                        }
                    }
                }
                break;
            case csv_mode::summary:
                os << "service,file_count\n";
                for (const auto& [service, count] : detail::by_count(aggregate.labels_by_service)) {
                    if (matches_service_filter(service, filter)) {
                        os << csv_escape(service) << ',' << count << '\n';
                    }
                }
                break;
        }
    }

    void write_mutation_report(
            std::ostream& os, const mutation_summary& summary, const list_append_request& request, bool dry_run) {
        os << detail::rule() << '\n';
        os << "add '" << request.value << "' to " << request.field << (dry_run ? " (dry run, nothing written)" : "")
           << '\n';
        os << detail::rule() << '\n';

        for (const auto& file : summary.files) {
            if (file.plans.empty()) {
                continue;
            }
            os << "\nfile: " << file.path.filename().string() << " (" << file.label << ")\n";
            for (const auto& plan : file.plans) {
                switch (plan.status) {
                    case plan_status::planned: {
                        const auto& change = *plan.change;
                        os << "  {:<30} line {:>4} | {} | {}\n"_format(
                                plan.service, change.line + 1U, change.action, utils::trim_view(change.text));
                        break;
                    }
                    case plan_status::already_present:
                        os << "  {:<30} line {:>4} | already present\n"_format(plan.service, plan.header_line);
                        break;
                    case plan_status::location_not_found:
                        os << "  {:<30}           | service not found\n"_format(plan.service);
                        break;
                    case plan_status::field_not_scalar:
                        os << "  {:<30} line {:>4} | {} is not a scalar, skipped\n"_format(
                                plan.service, plan.header_line, request.field);
                        break;
                }
            }
            if (file.outcome.written) {
                os << "  written: " << file.outcome.applied.size() << " edit(s)\n";
            }
        }

        os << '\n' << detail::rule() << "\nstatistics\n" << detail::rule() << '\n';
        os << "  files scanned: " << summary.files.size() << '\n';
        os << "  planned edits: " << summary.planned << '\n';
        os << "  already present: " << summary.already_present << '\n';
        os << "  not found: " << summary.not_found << '\n';
        if (summary.not_scalar > 0U) {
            os << "  not scalar: " << summary.not_scalar << '\n';
        }
    }

    void write_errors(std::ostream& os, const std::vector<file_error>& errors) {
        for (const auto& error : errors) {
            auto path = error.path.string();
            if (error.message.starts_with(path)) {
                os << "warning: " << error.message << '\n';
            }
            else {
                os << "warning: " << path << ": " << error.message << '\n';
            }
        }
    }

}  // namespace svcscan::report
