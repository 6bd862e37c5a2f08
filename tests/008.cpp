#include "utils.hpp"

namespace svcscan::test {
    using namespace std::string_view_literals;

    namespace detail {
        constexpr auto prod1_text =
                "version: \"3\"\n"
                "services:\n"
                "  web:\n"
                "    tag: org/web:feature\n"
                "    jvm_run_opts: -Xmx1g\n"
                "  db:\n"
                "    tag: 2.1.0\n"
                "    active_profiles: base\n"sv;

        constexpr auto prod2_text =
                "services:\n"
                "  - name: web\n"
                "    tag: latest\n"sv;

        void write_fixture(const fs::path& dir) {
            write_text_file(dir / "prod1.yml", prod1_text);
            write_text_file(dir / "prod2.yml", prod2_text);
            write_text_file(dir / "readme.txt", "services:\n  ghost:\n");
        }
    }  // namespace detail

    TEST_CASE("008: version and help exit cleanly", "[008][cli]") {
        auto version = detail::run_cli({"--version"});
        CHECK(version.rc == 0);
        CHECK(version.out.find("svcscan 0.1.0") != std::string::npos);

        auto help = detail::run_cli({"--help"});
        CHECK(help.rc == 0);
        CHECK(help.out.find("tags") != std::string::npos);

        auto bare = detail::run_cli({});
        CHECK(bare.rc == 0);
    }

    TEST_CASE("008: bad arguments and paths", "[008][cli]") {
        detail::temp_dir temp{"svcscan_008_paths"};
        detail::write_text_file(temp.path / "prod1.yml", "services:\n");

        auto missing = detail::run_cli({"tags", (temp.path / "nope").string()});
        CHECK(missing.rc == 1);
        CHECK(missing.err.find("does not exist") != std::string::npos);

        auto file = detail::run_cli({"services", (temp.path / "prod1.yml").string()});
        CHECK(file.rc == 1);
        CHECK(file.err.find("not a directory") != std::string::npos);

        CHECK(detail::run_cli({"tags"}).rc != 0);
        CHECK(detail::run_cli({"tags", temp.path.string(), "--bogus"}).rc != 0);
        CHECK(detail::run_cli({"add", temp.path.string()}).rc != 0);
        CHECK(detail::run_cli({"tags", temp.path.string(), "-f", "xml"}).rc != 0);
    }

    TEST_CASE("008: empty directory is a warning", "[008][cli]") {
        detail::temp_dir temp{"svcscan_008_empty"};
        auto result = detail::run_cli({"tags", temp.path.string()});
        CHECK(result.rc == 0);
        CHECK(result.err.find("warning: no matching files") != std::string::npos);
    }

    TEST_CASE("008: tags command", "[008][cli][tags]") {
        detail::temp_dir temp{"svcscan_008_tags"};
        detail::write_fixture(temp.path);

        auto csv = detail::run_cli({"tags", temp.path.string(), "-f", "csv"});
        CHECK(csv.rc == 0);
        CHECK(csv.out.starts_with("label,file,service,tag,line,path\n"));
        CHECK(csv.out.find("prod1,prod1.yml,web,org/web:feature,4,") != std::string::npos);
        CHECK(csv.out.find("ghost") == std::string::npos);

        auto all = detail::run_cli({"tags", temp.path.string(), "--all", "-f", "csv", "-s", "WEB"});
        CHECK(all.out.find(",latest,") != std::string::npos);
        CHECK(all.out.find(",2.1.0,") == std::string::npos);

        auto report = temp.path / "report.md";
        auto quiet = detail::run_cli({"tags", temp.path.string(), "-o", report.string(), "-f", "md", "-q"});
        CHECK(quiet.rc == 0);
        CHECK(quiet.out.empty());
        CHECK(detail::read_text_file(report).starts_with("# Custom tags"));
    }

    TEST_CASE("008: options and services commands", "[008][cli]") {
        detail::temp_dir temp{"svcscan_008_services"};
        detail::write_fixture(temp.path);

        auto options = detail::run_cli({"options", temp.path.string(), "-f", "csv"});
        CHECK(options.rc == 0);
        CHECK(options.out == "file,service,option\nprod1,web,-Xmx1g\n");

        auto listed = detail::run_cli({"options", temp.path.string(), "--list-services"});
        CHECK(listed.out.find("  - db") != std::string::npos);

        auto csv = detail::run_cli({"services", temp.path.string(), "--csv-mode", "summary"});
        CHECK(csv.rc == 0);
        CHECK(csv.out == "service,file_count\nweb,2\ndb,1\n");

        auto on = detail::run_cli({"services", temp.path.string(), "--prod", "prod2"});
        CHECK(on.out.find("  - web") != std::string::npos);

        auto verbose = detail::run_cli({"--verbose", "services", temp.path.string(), "-s", "db"});
        CHECK(verbose.err.find("scanned prod1.yml") != std::string::npos);
        CHECK(verbose.out.find("service: db") != std::string::npos);
    }

    TEST_CASE("008: add command writes once and then reports present", "[008][cli][add]") {
        detail::temp_dir temp{"svcscan_008_add"};
        detail::write_fixture(temp.path);
        auto prod1 = temp.path / "prod1.yml";

        auto dry = detail::run_cli({"add", temp.path.string(), "--value", "canary", "-s", "db", "--dry-run"});
        CHECK(dry.rc == 0);
        CHECK(dry.out.find("dry run") != std::string::npos);
        CHECK(detail::read_text_file(prod1) == detail::prod1_text);

        auto first = detail::run_cli({"add", temp.path.string(), "--value", "canary", "-s", "db"});
        CHECK(first.rc == 0);
        auto updated = detail::read_text_file(prod1);
        CHECK(updated.find("    active_profiles: base,canary\n") != std::string::npos);

        auto second = detail::run_cli({"add", temp.path.string(), "--value", "canary", "-s", "db"});
        CHECK(second.out.find("already present") != std::string::npos);
        CHECK(detail::read_text_file(prod1) == updated);

        auto web = detail::run_cli({"add", temp.path.string(), "--value", "canary", "-s", "web", "-q"});
        CHECK(web.out.empty());
        CHECK(detail::read_text_file(prod1).find("  web:\n    active_profiles: canary\n") != std::string::npos);
        CHECK(detail::read_text_file(temp.path / "prod2.yml") ==
              "services:\n  - name: web\n    active_profiles: canary\n    tag: latest\n");
    }

    TEST_CASE("008: config file and print-config", "[008][cli][config]") {
        detail::temp_dir temp{"svcscan_008_config"};
        auto config = temp.path / "svcscan.json";
        detail::write_text_file(config, R"({"root":"apps","format":"csv"})");

        auto printed = detail::run_cli({"--config", config.string(), "--print-config"});
        CHECK(printed.rc == 0);
        CHECK(printed.out.find("\"apps\"") != std::string::npos);

        auto overridden = detail::run_cli({"--config", config.string(), "--root", "jobs", "--print-config"});
        CHECK(overridden.out.find("\"jobs\"") != std::string::npos);

        detail::write_text_file(temp.path / "prod1.yml", "apps:\n  runner:\n    tag: ci/runner:1\n");
        auto tags = detail::run_cli({"--config", config.string(), "tags", temp.path.string()});
        CHECK(tags.rc == 0);
        CHECK(tags.out.find("prod1,prod1.yml,runner,ci/runner:1,3,") != std::string::npos);
    }

}  // namespace svcscan::test
