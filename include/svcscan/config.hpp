#pragma once

#include "utils.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace svcscan {

    using namespace std::string_view_literals;

    /*
     * svcscan scan configuration
     *
     * Structure recognition
     * - root_name: Header that opens the block whose immediate children are services.
     * - root_indent: Only accept the root header at this indent (any indent when unset).
     * - excluded_keys: Structural keys that never name a service; they still nest.
     * - depth: Which scalar lines inside a service body count as facts about it.
     *
     * Facts of interest
     * - tag_key: Scalar key whose value is a deployed tag.
     * - options_key: Scalar key whose value is a whitespace separated option list.
     * - generic_tags: Labels that are never custom tags.
     * - skipped_service_suffixes: Services left out of custom tag reports.
     *
     * Input and output
     * - selection: Which files of the search directory are scanned.
     * - service_filter: Case-insensitive substring filter on service names.
     * - format / output_path: Report shape and optional report file.
     * - quiet / brief / verbose: Console verbosity knobs.
     */

    enum class report_format { txt, csv, md, json };
    enum class file_selection { prod, yaml };
    enum class fact_depth { direct, nested };
    enum class csv_mode { services, prods, summary };

    inline constexpr std::string_view to_string(report_format format) {
        switch (format) {
            case report_format::txt:
                return "txt"sv;
            case report_format::csv:
                return "csv"sv;
            case report_format::md:
                return "md"sv;
            case report_format::json:
                return "json"sv;
        }
        return "txt"sv;
    }

    inline constexpr std::string_view to_string(file_selection selection) {
        switch (selection) {
            case file_selection::prod:
                return "prod"sv;
            case file_selection::yaml:
                return "yaml"sv;
        }
        return "yaml"sv;
    }

    inline constexpr std::string_view to_string(fact_depth depth) {
        switch (depth) {
            case fact_depth::direct:
                return "direct"sv;
            case fact_depth::nested:
                return "nested"sv;
        }
        return "direct"sv;
    }

    inline constexpr std::string_view to_string(csv_mode mode) {
        switch (mode) {
            case csv_mode::services:
                return "services"sv;
            case csv_mode::prods:
                return "prods"sv;
            case csv_mode::summary:
                return "summary"sv;
        }
        return "services"sv;
    }

    inline constexpr bool try_parse_report_format(std::string_view text, report_format& out) {
        if (utils::str_case_eq(text, "txt"sv) || utils::str_case_eq(text, "text"sv)) {
            out = report_format::txt;
            return true;
        }
        if (utils::str_case_eq(text, "csv"sv)) {
            out = report_format::csv;
            return true;
        }
        if (utils::str_case_eq(text, "md"sv) || utils::str_case_eq(text, "markdown"sv)) {
            out = report_format::md;
            return true;
        }
        if (utils::str_case_eq(text, "json"sv)) {
            out = report_format::json;
            return true;
        }
        return false;
    }

    inline constexpr bool try_parse_file_selection(std::string_view text, file_selection& out) {
        if (utils::str_case_eq(text, "prod"sv)) {
            out = file_selection::prod;
            return true;
        }
        if (utils::str_case_eq(text, "yaml"sv) || utils::str_case_eq(text, "yml"sv)) {
            out = file_selection::yaml;
            return true;
        }
        return false;
    }

    inline constexpr bool try_parse_fact_depth(std::string_view text, fact_depth& out) {
        if (utils::str_case_eq(text, "direct"sv)) {
            out = fact_depth::direct;
            return true;
        }
        if (utils::str_case_eq(text, "nested"sv)) {
            out = fact_depth::nested;
            return true;
        }
        return false;
    }

    inline constexpr bool try_parse_csv_mode(std::string_view text, csv_mode& out) {
        if (utils::str_case_eq(text, "services"sv)) {
            out = csv_mode::services;
            return true;
        }
        if (utils::str_case_eq(text, "prods"sv)) {
            out = csv_mode::prods;
            return true;
        }
        if (utils::str_case_eq(text, "summary"sv)) {
            out = csv_mode::summary;
            return true;
        }
        return false;
    }

    inline std::vector<std::string> default_excluded_keys() {
        return {"services",
                "volumes",
                "networks",
                "configs",
                "secrets",
                "environment",
                "labels",
                "ports",
                "image",
                "deploy",
                "version",
                "build",
                "depends_on",
                "restart",
                "command",
                "entrypoint",
                "healthcheck",
                "logging"};
    }

    inline std::vector<std::string> default_generic_tags() {
        return {"latest", "stable", "production", "main", "master", "develop"};
    }

    struct scan_config {
        std::string root_name{"services"};
        std::optional<std::size_t> root_indent{};
        std::vector<std::string> excluded_keys{default_excluded_keys()};
        fact_depth depth{fact_depth::direct};

        std::string tag_key{"tag"};
        std::string options_key{"jvm_run_opts"};
        std::vector<std::string> generic_tags{default_generic_tags()};
        std::vector<std::string> skipped_service_suffixes{"-limited"};

        file_selection selection{file_selection::yaml};
        std::string service_filter{};
        report_format format{report_format::txt};
        std::optional<std::filesystem::path> output_path{};
        bool quiet{false};
        bool brief{false};
        bool verbose{false};
    };

    // Loads a JSON config file over `cfg`; throws std::runtime_error on unreadable or invalid input
    void load_config_file(const std::filesystem::path& path, scan_config& cfg);

    std::string config_to_json(const scan_config& cfg);

}  // namespace svcscan
