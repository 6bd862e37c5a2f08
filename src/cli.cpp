#include "svcscan/cli.hpp"

#include "svcscan/format.hpp"
#include "svcscan/mutation.hpp"
#include "svcscan/report.hpp"
#include "svcscan/scanner.hpp"

#include <CLI/CLI.hpp>

#include <exception>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using namespace svcscan::literals;

namespace svcscan::cli {

    namespace detail {

        namespace fs = std::filesystem;

        struct global_args {
            std::string config_path{};
            std::string root{};
            std::vector<std::string> exclude_keys{};
            bool verbose{false};
            bool show_version{false};
            bool print_config{false};
        };

        struct tags_args {
            std::string path{};
            bool all{false};
            bool prod_files{false};
            std::string filter{};
            std::string output{};
            std::string format{};
            bool brief{false};
            bool quiet{false};
        };

        struct options_args {
            std::string path{};
            std::string filter{};
            bool list_services{false};
            std::string output{};
            std::string format{};
            bool quiet{false};
        };

        struct services_args {
            std::string path{};
            std::string filter{};
            std::string prod{};
            bool services_summary{false};
            bool prods_summary{false};
            std::string output{};
            std::string csv{};
        };

        struct add_args {
            std::string path{};
            std::string field{"active_profiles"};
            std::string value{};
            std::string filter{};
            bool dry_run{false};
            bool quiet{false};
        };

        static std::optional<int> check_path(const fs::path& dir, std::ostream& err) {
            switch (check_search_path(dir)) {
                case search_path_status::ok:
                    return std::nullopt;
                case search_path_status::missing:
                    err << "error: path does not exist: " << dir.string() << '\n';
                    return 1;
                case search_path_status::not_directory:
                    err << "error: path is not a directory: " << dir.string() << '\n';
                    return 1;
            }
            return 1;
        }

        static bool apply_format(std::string_view arg, scan_config& cfg, std::ostream& err) {
            if (arg.empty()) {
                return true;
            }
            if (!try_parse_report_format(arg, cfg.format)) {
                err << "invalid --format value: " << arg << " (expected txt|csv|md|json)\n";
                return false;
            }
            return true;
        }

        static void apply_output(const std::string& arg, scan_config& cfg) {
            if (!arg.empty()) {
                cfg.output_path = fs::path{arg};
            }
        }

        static void write_report_file(const fs::path& path, const std::string& content) {
            std::ofstream out{path, std::ios::binary | std::ios::trunc};
            if (!out) {
                throw std::runtime_error("failed to open {}"_format(path.string()));
            }
            out << content;
            if (!out) {
                throw std::runtime_error("failed to write {}"_format(path.string()));
            }
        }

        static scan_aggregate scan_all(const fs::path& dir, const scan_config& cfg, std::ostream& err) {
            scan_aggregate aggregate{};
            auto files = select_files(dir, cfg.selection);
            if (files.empty()) {
                err << "warning: no matching files in " << dir.string() << " (selection: " << to_string(cfg.selection)
                    << ")\n";
                return aggregate;
            }
            for (const auto& path : files) {
                if (scan_file(path, cfg, aggregate) && cfg.verbose) {
                    err << "scanned " << path.filename().string() << '\n';
                }
            }
            report::write_errors(err, aggregate.errors);
            return aggregate;
        }

        // The report file gets the configured format; the console gets it too unless a file was requested
        template <typename Writer>
        static void emit(const scan_config& cfg, std::ostream& out, std::ostream& err, Writer&& writer) {
            if (cfg.output_path) {
                std::ostringstream ss{};
                writer(ss, cfg.format);
                write_report_file(*cfg.output_path, ss.str());
                if (!cfg.quiet) {
                    writer(out, report_format::txt);
                }
                err << "report written to " << cfg.output_path->string() << '\n';
                return;
            }
            if (!cfg.quiet) {
                writer(out, cfg.format);
            }
        }

        static int run_tags(const tags_args& args, scan_config cfg, std::ostream& out, std::ostream& err) {
            fs::path dir{args.path};
            if (auto rc = check_path(dir, err)) {
                return *rc;
            }
            if (!apply_format(args.format, cfg, err)) {
                return 2;
            }
            apply_output(args.output, cfg);
            if (args.prod_files) {
                cfg.selection = file_selection::prod;
            }
            cfg.service_filter = args.filter;
            cfg.brief = args.brief;
            cfg.quiet = args.quiet;

            auto aggregate = scan_all(dir, cfg, err);
            emit(cfg, out, err, [&](std::ostream& os, report_format format) {
                report::write_tag_report(os, aggregate, cfg, !args.all, format);
            });
            return 0;
        }

        static int run_options(const options_args& args, scan_config cfg, std::ostream& out, std::ostream& err) {
            fs::path dir{args.path};
            if (auto rc = check_path(dir, err)) {
                return *rc;
            }
            if (!apply_format(args.format, cfg, err)) {
                return 2;
            }
            apply_output(args.output, cfg);
            cfg.service_filter = args.filter;
            cfg.quiet = args.quiet;

            auto aggregate = scan_all(dir, cfg, err);
            if (args.list_services) {
                report::write_service_list(out, aggregate);
                return 0;
            }
            emit(cfg, out, err, [&](std::ostream& os, report_format format) {
                report::write_option_report(os, aggregate, cfg, format);
            });
            return 0;
        }

        static int run_services(const services_args& args, scan_config cfg, std::ostream& out, std::ostream& err) {
            fs::path dir{args.path};
            if (auto rc = check_path(dir, err)) {
                return *rc;
            }
            std::optional<csv_mode> mode{};
            if (!args.csv.empty()) {
                csv_mode parsed{};
                if (!try_parse_csv_mode(args.csv, parsed)) {
                    err << "invalid --csv-mode value: " << args.csv << " (expected services|prods|summary)\n";
                    return 2;
                }
                mode = parsed;
            }
            apply_output(args.output, cfg);
            cfg.service_filter = args.filter;

            auto aggregate = scan_all(dir, cfg, err);

            if (cfg.output_path) {
                std::ostringstream ss{};
                report::write_service_csv(ss, aggregate, mode.value_or(csv_mode::services), cfg.service_filter);
                write_report_file(*cfg.output_path, ss.str());
                err << "report written to " << cfg.output_path->string() << '\n';
            }
            else if (mode) {
                report::write_service_csv(out, aggregate, *mode, cfg.service_filter);
                return 0;
            }

            if (!args.prod.empty()) {
                (void)report::write_services_on(out, aggregate, args.prod);
            }
            else if (args.services_summary) {
                report::write_services_summary(out, aggregate);
            }
            else if (args.prods_summary) {
                report::write_labels_summary(out, aggregate);
            }
            else if (!cfg.service_filter.empty()) {
                report::write_services_matching(out, aggregate, cfg.service_filter, report_format::txt);
            }
            else {
                report::write_service_list(out, aggregate);
            }
            return 0;
        }

        static int run_add(const add_args& args, scan_config cfg, std::ostream& out, std::ostream& err) {
            fs::path dir{args.path};
            if (auto rc = check_path(dir, err)) {
                return *rc;
            }
            if (args.field.empty() || args.value.empty()) {
                err << "--field and --value must be non-empty\n";
                return 2;
            }
            cfg.service_filter = args.filter;
            cfg.quiet = args.quiet;

            list_append_request request{args.field, args.value};
            auto summary = add_list_value(dir, cfg, request, args.dry_run);
            if (summary.files.empty() && summary.errors.empty()) {
                err << "warning: no matching files in " << dir.string() << " (selection: " << to_string(cfg.selection)
                    << ")\n";
            }
            if (cfg.verbose) {
                for (const auto& file : summary.files) {
                    err << (file.outcome.written ? "updated " : "checked ") << file.path.filename().string() << '\n';
                }
            }
            report::write_errors(err, summary.errors);
            if (!cfg.quiet) {
                report::write_mutation_report(out, summary, request, args.dry_run);
            }
            return 0;
        }

    }  // namespace detail

    int run(int argc, const char* const* argv, std::ostream& out, std::ostream& err) {
        CLI::App app{"scan YAML deployment descriptors for per-service facts", "svcscan"};
        app.require_subcommand(0, 1);

        detail::global_args global{};
        app.add_option("--config", global.config_path, "JSON config file");
        app.add_option("--root", global.root, "Name of the block holding services");
        app.add_option("--exclude-key", global.exclude_keys, "Extra structural key that never names a service");
        app.add_flag("--verbose", global.verbose, "Print one progress line per file");
        app.add_flag("--version", global.show_version, "Print version and exit");
        app.add_flag("--print-config", global.print_config, "Print resolved config as JSON and exit");

        detail::tags_args tags{};
        auto* tags_cmd = app.add_subcommand("tags", "Report tag values per service");
        tags_cmd->add_option("path", tags.path, "Directory to scan")->required();
        tags_cmd->add_flag("--all", tags.all, "Report every tag, not only custom ones");
        tags_cmd->add_flag("--prod-files", tags.prod_files, "Only scan prodN.yml files");
        tags_cmd->add_option("-s,--service", tags.filter, "Service name filter");
        tags_cmd->add_option("-o,--output", tags.output, "Report file");
        tags_cmd->add_option("-f,--format", tags.format, "Report format: txt|csv|md|json");
        tags_cmd->add_flag("-b,--brief", tags.brief, "Omit line numbers");
        tags_cmd->add_flag("-q,--quiet", tags.quiet, "No console report");

        detail::options_args options{};
        auto* options_cmd = app.add_subcommand("options", "Report option tokens per service");
        options_cmd->add_option("path", options.path, "Directory to scan")->required();
        options_cmd->add_option("-s,--service", options.filter, "Service name filter");
        options_cmd->add_flag("--list-services", options.list_services, "List every discovered service");
        options_cmd->add_option("-o,--output", options.output, "Report file");
        options_cmd->add_option("-f,--format", options.format, "Report format: txt|csv|md|json");
        options_cmd->add_flag("-q,--quiet", options.quiet, "No console report");

        detail::services_args services{};
        auto* services_cmd = app.add_subcommand("services", "Report where services are deployed");
        services_cmd->add_option("path", services.path, "Directory to scan")->required();
        services_cmd->add_option("-s,--service", services.filter, "Service name filter");
        services_cmd->add_option("--prod", services.prod, "List services of one file label");
        services_cmd->add_flag("--services-summary", services.services_summary, "File count per service");
        services_cmd->add_flag("--prods-summary", services.prods_summary, "Service count per file");
        services_cmd->add_option("-o,--output", services.output, "CSV report file");
        services_cmd->add_option("--csv-mode", services.csv, "CSV layout: services|prods|summary");

        detail::add_args add{};
        auto* add_cmd = app.add_subcommand("add", "Append a value to a comma separated list field");
        add_cmd->add_option("path", add.path, "Directory to scan")->required();
        add_cmd->add_option("--field", add.field, "Scalar list field")->capture_default_str();
        add_cmd->add_option("--value", add.value, "Value to append")->required();
        add_cmd->add_option("-s,--service", add.filter, "Service name filter");
        add_cmd->add_flag("--dry-run", add.dry_run, "Plan only, write nothing");
        add_cmd->add_flag("-q,--quiet", add.quiet, "No console report");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return app.exit(e, out, err);
        }

        if (global.show_version) {
            out << version << '\n';
            return 0;
        }

        scan_config cfg{};
        if (!global.config_path.empty()) {
            load_config_file(global.config_path, cfg);
        }
        if (!global.root.empty()) {
            cfg.root_name = global.root;
        }
        for (auto& key : global.exclude_keys) {
            cfg.excluded_keys.push_back(std::move(key));
        }
        cfg.verbose = global.verbose;

        if (global.print_config) {
            out << config_to_json(cfg) << '\n';
            return 0;
        }

        debug_log("root=", cfg.root_name, " depth=", to_string(cfg.depth), " selection=", to_string(cfg.selection));

        if (tags_cmd->parsed()) {
            return detail::run_tags(tags, cfg, out, err);
        }
        if (options_cmd->parsed()) {
            return detail::run_options(options, cfg, out, err);
        }
        if (services_cmd->parsed()) {
            return detail::run_services(services, cfg, out, err);
        }
        if (add_cmd->parsed()) {
            return detail::run_add(add, cfg, out, err);
        }

        out << app.help();
        return 0;
    }

}  // namespace svcscan::cli
