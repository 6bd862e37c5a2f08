#include "utils.hpp"

namespace svcscan::test {
    using namespace std::string_view_literals;
    using namespace std::string_literals;

    namespace detail {
        std::string numbered_lines(std::size_t count) {
            std::string out{};
            for (std::size_t i = 0U; i < count; ++i) {
                out += "l" + std::to_string(i) + "\n";
            }
            return out;
        }
    }  // namespace detail

    TEST_CASE("006: edits apply bottom-up so earlier indices stay valid", "[006][applier]") {
        detail::temp_dir temp{"svcscan_006_order"};
        auto path = temp.path / "prod1.yml";
        detail::write_text_file(path, detail::numbered_lines(12U));

        std::vector<edit> edits{
                edit{path, 10U, edit_action::update, "X"},
                edit{path, 3U, edit_action::insert_after, "I"},
        };
        auto result = apply_edits(path, edits, false);
        REQUIRE(result.ok());
        CHECK(result.written);
        REQUIRE(result.applied.size() == 2U);
        CHECK(result.applied[0].line == 10U);
        CHECK(result.applied[1].line == 3U);

        auto expected = "l0\nl1\nl2\nl3\nI\nl4\nl5\nl6\nl7\nl8\nl9\nX\nl11\n"s;
        CHECK(result.content == expected);
        CHECK(detail::read_text_file(path) == expected);
    }

    TEST_CASE("006: inserts after one line keep planning order", "[006][applier]") {
        std::vector<std::string> lines{"a", "b", "c"};
        std::vector<edit> edits{
                edit{{}, 1U, edit_action::insert_after, "first"},
                edit{{}, 1U, edit_action::insert_after, "second"},
                edit{{}, 0U, edit_action::update, "A"},
        };
        apply_to_lines(lines, order_for_apply(edits));
        CHECK(lines == std::vector<std::string>{"A", "b", "first", "second", "c"});
    }

    TEST_CASE("006: out of range edits are rejected", "[006][applier]") {
        std::vector<std::string> lines{"a"};
        std::vector<edit> past_end{edit{{}, 1U, edit_action::update, "x"}};
        CHECK_THROWS_AS(apply_to_lines(lines, past_end), std::out_of_range);

        detail::temp_dir temp{"svcscan_006_range"};
        auto path = temp.path / "prod1.yml";
        detail::write_text_file(path, "a\nb\n");

        auto result = apply_edits(path, {edit{path, 5U, edit_action::insert_after, "x"}}, false);
        CHECK_FALSE(result.ok());
        CHECK_FALSE(result.written);
        CHECK(detail::read_text_file(path) == "a\nb\n");
    }

    TEST_CASE("006: dry run matches a real run and writes nothing", "[006][applier][dry-run]") {
        detail::temp_dir temp{"svcscan_006_dry"};
        auto dry_path = temp.path / "dry.yml";
        auto real_path = temp.path / "real.yml";
        constexpr auto original = "services:\r\n  web:\r\n    tag: a/b"sv;
        detail::write_text_file(dry_path, original);
        detail::write_text_file(real_path, original);

        auto dry = apply_edits(dry_path, {edit{dry_path, 1U, edit_action::insert_after, "    x: 1\r"}}, true);
        auto real = apply_edits(real_path, {edit{real_path, 1U, edit_action::insert_after, "    x: 1\r"}}, false);

        REQUIRE(dry.ok());
        REQUIRE(real.ok());
        CHECK(dry.dry_run);
        CHECK_FALSE(dry.written);
        CHECK(real.written);
        CHECK(dry.content == real.content);
        CHECK(dry.content == "services:\r\n  web:\r\n    x: 1\r\n    tag: a/b");
        CHECK(detail::read_text_file(dry_path) == original);
        CHECK(detail::read_text_file(real_path) == real.content);
    }

    TEST_CASE("006: no edits leaves the file untouched", "[006][applier]") {
        detail::temp_dir temp{"svcscan_006_noop"};
        auto path = temp.path / "prod1.yml";
        constexpr auto original = "services:\r\n\r\n  web:\n    tag: a/b  \n\n"sv;
        detail::write_text_file(path, original);
        auto before = std::filesystem::last_write_time(path);

        auto result = apply_edits(path, {}, false);
        REQUIRE(result.ok());
        CHECK_FALSE(result.written);
        CHECK(result.content == original);
        CHECK(std::filesystem::last_write_time(path) == before);
    }

    TEST_CASE("006: failures are reported per file", "[006][applier]") {
        detail::temp_dir temp{"svcscan_006_errors"};
        auto missing = temp.path / "missing.yml";

        auto result = apply_edits(missing, {edit{missing, 0U, edit_action::update, "x"}}, false);
        CHECK_FALSE(result.ok());
        REQUIRE(result.error);
        CHECK(result.error->find(missing.string()) != std::string::npos);

        auto path = temp.path / "prod1.yml";
        detail::write_text_file(path, "a\n");
        auto mismatched = apply_edits(path, {edit{missing, 0U, edit_action::update, "x"}}, false);
        CHECK_FALSE(mismatched.ok());
        CHECK(detail::read_text_file(path) == "a\n");
    }

    TEST_CASE("006: writes replace the file in place", "[006][applier]") {
        namespace fs = std::filesystem;
        detail::temp_dir temp{"svcscan_006_replace"};
        auto path = temp.path / "prod1.yml";
        detail::write_text_file(path, "a\nb\n");
        fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read,
                        fs::perm_options::replace);

        auto result = apply_edits(path, {edit{path, 1U, edit_action::update, "c"}}, false);
        REQUIRE(result.ok());
        CHECK(detail::read_text_file(path) == "a\nc\n");
        CHECK(fs::status(path).permissions() ==
              (fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read));

        std::size_t entries = 0U;
        for ([[maybe_unused]] const auto& entry : fs::directory_iterator{temp.path}) {
            ++entries;
        }
        CHECK(entries == 1U);
    }

    TEST_CASE("006: source files render byte for byte", "[006][source]") {
        for (auto text : {"a\r\nb"sv, "a\n\nb\n"sv, "\n"sv, ""sv, "x\r\n\r\n"sv}) {
            auto source = parse_source_text("/tmp/x.yml", text);
            CHECK(source.render() == text);
        }
        auto crlf = parse_source_text("/tmp/x.yml", "a\r\nb"sv);
        REQUIRE(crlf.lines.size() == 2U);
        CHECK(crlf.lines[0] == "a\r");
        CHECK_FALSE(crlf.trailing_newline);

        CHECK_THROWS_AS(load_source_file("/nonexistent/svcscan/prod1.yml"), std::runtime_error);
    }

}  // namespace svcscan::test
