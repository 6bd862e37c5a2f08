#include "utils.hpp"

namespace svcscan::test {
    using namespace std::string_view_literals;

    namespace detail {
        classified_line classify(std::string_view line) {
            static const auto excluded = default_excluded_keys();
            return classify_line(line, excluded);
        }
    }  // namespace detail

    TEST_CASE("002: blank and comment lines", "[002][lines]") {
        CHECK(detail::classify(""sv).kind == line_kind::blank);
        CHECK(detail::classify("    "sv).kind == line_kind::blank);
        CHECK(detail::classify("\r"sv).kind == line_kind::blank);

        auto comment = detail::classify("  # tag: org/app:1"sv);
        CHECK(comment.kind == line_kind::comment);
        CHECK(comment.indent == 2U);
        CHECK_FALSE(comment.is_content());
    }

    TEST_CASE("002: bare block headers", "[002][lines]") {
        auto root = detail::classify("services:"sv);
        CHECK(root.kind == line_kind::block_header);
        CHECK(root.key == "services");
        CHECK(root.excluded);
        CHECK_FALSE(root.names_block());

        auto service = detail::classify("  web-app:  "sv);
        CHECK(service.kind == line_kind::block_header);
        CHECK(service.indent == 2U);
        CHECK(service.key_column == 2U);
        CHECK(service.name == "web-app");
        CHECK_FALSE(service.excluded);
        CHECK(service.names_block());

        auto crlf = detail::classify("  api:\r"sv);
        CHECK(crlf.kind == line_kind::block_header);
        CHECK(crlf.name == "api");

        CHECK(detail::classify("    environment:"sv).excluded);
    }

    TEST_CASE("002: name field headers", "[002][lines]") {
        auto listed = detail::classify("  - name: \"api\""sv);
        CHECK(listed.kind == line_kind::list_block_header);
        CHECK(listed.list_item);
        CHECK(listed.named_by_field);
        CHECK(listed.name == "api");
        CHECK(listed.indent == 2U);
        CHECK(listed.key_column == 4U);

        auto plain = detail::classify("    name: worker_2"sv);
        CHECK(plain.kind == line_kind::block_header);
        CHECK(plain.named_by_field);
        CHECK(plain.name == "worker_2");

        // mismatched quotes and extra words fall through to a scalar
        auto mismatched = detail::classify("  name: 'x\""sv);
        CHECK(mismatched.kind == line_kind::scalar);
        auto sentence = detail::classify("  name: two words"sv);
        CHECK(sentence.kind == line_kind::scalar);
        CHECK(sentence.value == "two words");
    }

    TEST_CASE("002: scalar lines", "[002][lines]") {
        auto tag = detail::classify("    tag: 'org/app:1.2'  "sv);
        CHECK(tag.kind == line_kind::scalar);
        CHECK(tag.indent == 4U);
        CHECK(tag.key == "tag");
        CHECK(tag.value == "org/app:1.2");
        CHECK(tag.raw_value == "'org/app:1.2'");

        auto spaced = detail::classify("  key :value"sv);
        CHECK(spaced.kind == line_kind::scalar);
        CHECK(spaced.key == "key");
        CHECK(spaced.value == "value");

        auto dotted = detail::classify("  spring.profiles: a,b"sv);
        CHECK(dotted.kind == line_kind::scalar);
        CHECK(dotted.key == "spring.profiles");

        CHECK(detail::classify("- just text"sv).kind == line_kind::unrecognized);
        CHECK(detail::classify("  - item"sv).kind == line_kind::unrecognized);
        CHECK(detail::classify("  ?weird"sv).kind == line_kind::unrecognized);
    }

    TEST_CASE("002: indentation and quote helpers", "[002][lines]") {
        CHECK(indent_width("\t  x"sv) == 3U);
        CHECK(indent_width("x"sv) == 0U);
        CHECK(strip_quotes("  \"'v1'\" "sv) == "v1"sv);
        CHECK(strip_quotes("plain"sv) == "plain"sv);
        CHECK(strip_quotes("''"sv).empty());
    }

}  // namespace svcscan::test
