#include "utils.hpp"

namespace svcscan::test {
    using namespace std::string_view_literals;

    TEST_CASE("001: report_format and file_selection parsing", "[001][config]") {
        report_format format = report_format::txt;
        file_selection selection = file_selection::yaml;

        REQUIRE(try_parse_report_format("CSV"sv, format));
        CHECK(format == report_format::csv);
        REQUIRE(try_parse_report_format("markdown"sv, format));
        CHECK(format == report_format::md);
        REQUIRE(try_parse_report_format("text"sv, format));
        CHECK(format == report_format::txt);
        REQUIRE(try_parse_report_format("json"sv, format));
        CHECK(format == report_format::json);
        CHECK_FALSE(try_parse_report_format("html"sv, format));
        CHECK(format == report_format::json);

        REQUIRE(try_parse_file_selection("PROD"sv, selection));
        CHECK(selection == file_selection::prod);
        REQUIRE(try_parse_file_selection("yml"sv, selection));
        CHECK(selection == file_selection::yaml);
        CHECK_FALSE(try_parse_file_selection("all"sv, selection));
    }

    TEST_CASE("001: depth and csv mode parsing", "[001][config]") {
        fact_depth depth = fact_depth::direct;
        csv_mode mode = csv_mode::services;

        REQUIRE(try_parse_fact_depth("Nested"sv, depth));
        CHECK(depth == fact_depth::nested);
        CHECK_FALSE(try_parse_fact_depth("deep"sv, depth));

        REQUIRE(try_parse_csv_mode("summary"sv, mode));
        CHECK(mode == csv_mode::summary);
        REQUIRE(try_parse_csv_mode("PRODS"sv, mode));
        CHECK(mode == csv_mode::prods);
        CHECK_FALSE(try_parse_csv_mode("files"sv, mode));
    }

    TEST_CASE("001: enum string conversion", "[001][config]") {
        CHECK(to_string(report_format::md) == "md"sv);
        CHECK(to_string(file_selection::prod) == "prod"sv);
        CHECK(to_string(fact_depth::nested) == "nested"sv);
        CHECK(to_string(csv_mode::prods) == "prods"sv);
        CHECK(to_string(plan_status::location_not_found) == "not_found"sv);
        CHECK(to_string(edit_action::insert_after) == "insert"sv);
    }

    TEST_CASE("001: default config", "[001][config]") {
        scan_config cfg{};
        CHECK(cfg.root_name == "services");
        CHECK_FALSE(cfg.root_indent);
        CHECK(cfg.tag_key == "tag");
        CHECK(cfg.options_key == "jvm_run_opts");
        CHECK(cfg.depth == fact_depth::direct);
        CHECK(cfg.selection == file_selection::yaml);
        CHECK(cfg.excluded_keys.size() == 18U);
        CHECK(cfg.excluded_keys.front() == "services");
        CHECK(cfg.excluded_keys.back() == "logging");
        CHECK(cfg.skipped_service_suffixes == std::vector<std::string>{"-limited"});
    }

    TEST_CASE("001: json config file overrides defaults", "[001][config][json]") {
        detail::temp_dir temp{"svcscan_001_config"};
        auto path = temp.path / "svcscan.json";
        detail::write_text_file(
                path,
                R"({"schema_version":1,"root":"apps","depth":"nested","tag_key":"image_tag","future_key":true})");

        scan_config cfg{};
        load_config_file(path, cfg);
        CHECK(cfg.root_name == "apps");
        CHECK(cfg.depth == fact_depth::nested);
        CHECK(cfg.tag_key == "image_tag");
        CHECK(cfg.options_key == "jvm_run_opts");
        CHECK(cfg.excluded_keys.size() == 18U);
    }

    TEST_CASE("001: json config file rejects bad input", "[001][config][json]") {
        detail::temp_dir temp{"svcscan_001_config_bad"};
        scan_config cfg{};

        auto newer = temp.path / "newer.json";
        detail::write_text_file(newer, R"({"schema_version":2})");
        CHECK_THROWS_AS(load_config_file(newer, cfg), std::runtime_error);

        auto bad_depth = temp.path / "depth.json";
        detail::write_text_file(bad_depth, R"({"depth":"everywhere"})");
        CHECK_THROWS_AS(load_config_file(bad_depth, cfg), std::runtime_error);

        auto empty_root = temp.path / "root.json";
        detail::write_text_file(empty_root, R"({"root":""})");
        CHECK_THROWS_AS(load_config_file(empty_root, cfg), std::runtime_error);

        auto broken = temp.path / "broken.json";
        detail::write_text_file(broken, "{\"root\": ");
        CHECK_THROWS_AS(load_config_file(broken, cfg), std::runtime_error);

        CHECK_THROWS_AS(load_config_file(temp.path / "missing.json", cfg), std::runtime_error);
        CHECK(cfg.root_name == "services");
    }

    TEST_CASE("001: printed config loads back", "[001][config][json]") {
        detail::temp_dir temp{"svcscan_001_config_print"};

        scan_config cfg{};
        cfg.root_name = "deployments";
        cfg.root_indent = 2U;
        cfg.format = report_format::csv;
        cfg.generic_tags = {"edge"};

        auto path = temp.path / "printed.json";
        detail::write_text_file(path, config_to_json(cfg));

        scan_config loaded{};
        load_config_file(path, loaded);
        CHECK(loaded.root_name == "deployments");
        REQUIRE(loaded.root_indent);
        CHECK(*loaded.root_indent == 2U);
        CHECK(loaded.format == report_format::csv);
        CHECK(loaded.generic_tags == std::vector<std::string>{"edge"});
        CHECK(loaded.excluded_keys == cfg.excluded_keys);
    }

}  // namespace svcscan::test
