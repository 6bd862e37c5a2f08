#pragma once

#include "mutation.hpp"
#include "scanner.hpp"

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace svcscan::report {

    struct tag_row {
        std::string label{};
        std::string file{};
        std::string path{};
        std::string service{};
        std::string tag{};
        std::size_t line{};
    };

    struct option_row {
        std::string label{};
        std::string service{};
        std::string option{};
    };

    struct service_row {
        std::string service{};
        std::vector<std::string> labels{};
    };

    // Quotes values holding a comma, quote or newline; embedded quotes are doubled
    std::string csv_escape(std::string_view value);

    // Backslash-escapes `|` so a value stays inside one markdown table cell
    std::string md_cell(std::string_view value);

    std::vector<tag_row> collect_tags(const scan_aggregate& aggregate, const scan_config& cfg, bool custom_only);
    std::vector<option_row> collect_options(const scan_aggregate& aggregate, const scan_config& cfg);
    std::vector<service_row> collect_services(const scan_aggregate& aggregate, std::string_view filter);

    void write_tag_report(
            std::ostream& os,
            const scan_aggregate& aggregate,
            const scan_config& cfg,
            bool custom_only,
            report_format format);

    void write_option_report(
            std::ostream& os, const scan_aggregate& aggregate, const scan_config& cfg, report_format format);

    void write_service_list(std::ostream& os, const scan_aggregate& aggregate);

    void write_services_matching(
            std::ostream& os, const scan_aggregate& aggregate, std::string_view filter, report_format format);

    // False when no scanned file carries `label`
    bool write_services_on(std::ostream& os, const scan_aggregate& aggregate, std::string_view label);

    void write_services_summary(std::ostream& os, const scan_aggregate& aggregate);
    void write_labels_summary(std::ostream& os, const scan_aggregate& aggregate);

    void write_service_csv(std::ostream& os, const scan_aggregate& aggregate, csv_mode mode, std::string_view filter);

    void write_mutation_report(
            std::ostream& os, const mutation_summary& summary, const list_append_request& request, bool dry_run);

    void write_errors(std::ostream& os, const std::vector<file_error>& errors);

}  // namespace svcscan::report
