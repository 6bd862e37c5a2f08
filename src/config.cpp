#include "svcscan/config.hpp"

#include "svcscan/format.hpp"

#include <glaze/glaze.hpp>

#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace svcscan::literals;

namespace svcscan::detail {

    struct persisted_config {
        int schema_version{1};
        std::optional<std::string> root{};
        std::optional<std::size_t> root_indent{};
        std::optional<std::vector<std::string>> excluded_keys{};
        std::optional<std::string> depth{};
        std::optional<std::string> tag_key{};
        std::optional<std::string> options_key{};
        std::optional<std::vector<std::string>> generic_tags{};
        std::optional<std::vector<std::string>> skipped_service_suffixes{};
        std::optional<std::string> selection{};
        std::optional<std::string> format{};
    };

}  // namespace svcscan::detail

namespace glz {

    template <>
    struct meta<svcscan::detail::persisted_config> {
        using T = svcscan::detail::persisted_config;
        static constexpr auto value =
                object("schema_version",
                       &T::schema_version,
                       "root",
                       &T::root,
                       "root_indent",
                       &T::root_indent,
                       "excluded_keys",
                       &T::excluded_keys,
                       "depth",
                       &T::depth,
                       "tag_key",
                       &T::tag_key,
                       "options_key",
                       &T::options_key,
                       "generic_tags",
                       &T::generic_tags,
                       "skipped_service_suffixes",
                       &T::skipped_service_suffixes,
                       "selection",
                       &T::selection,
                       "format",
                       &T::format);
    };

}  // namespace glz

namespace svcscan {

    namespace detail {

        namespace fs = std::filesystem;

        static constexpr int supported_schema_version = 1;

        static std::string read_text_file(const fs::path& path) {
            std::ifstream in{path};
            if (!in) {
                throw std::runtime_error("failed to open {}"_format(path.string()));
            }
            std::ostringstream ss{};
            ss << in.rdbuf();
            if (!in.good() && !in.eof()) {
                throw std::runtime_error("failed to read {}"_format(path.string()));
            }
            return ss.str();
        }

        static void apply_persisted_config(const persisted_config& data, const fs::path& path, scan_config& cfg) {
            if (data.schema_version > supported_schema_version) {
                throw std::runtime_error(
                        "unsupported schema_version in {}: {} > {}"_format(
                                path.string(), data.schema_version, supported_schema_version));
            }
            if (data.root) {
                if (data.root->empty()) {
                    throw std::runtime_error("empty root in {}"_format(path.string()));
                }
                cfg.root_name = *data.root;
            }
            if (data.root_indent) {
                cfg.root_indent = data.root_indent;
            }
            if (data.excluded_keys) {
                cfg.excluded_keys = *data.excluded_keys;
            }
            if (data.depth && !try_parse_fact_depth(*data.depth, cfg.depth)) {
                throw std::runtime_error("invalid depth in {}: {}"_format(path.string(), *data.depth));
            }
            if (data.tag_key) {
                cfg.tag_key = *data.tag_key;
            }
            if (data.options_key) {
                cfg.options_key = *data.options_key;
            }
            if (data.generic_tags) {
                cfg.generic_tags = *data.generic_tags;
            }
            if (data.skipped_service_suffixes) {
                cfg.skipped_service_suffixes = *data.skipped_service_suffixes;
            }
            if (data.selection && !try_parse_file_selection(*data.selection, cfg.selection)) {
                throw std::runtime_error("invalid selection in {}: {}"_format(path.string(), *data.selection));
            }
            if (data.format && !try_parse_report_format(*data.format, cfg.format)) {
                throw std::runtime_error("invalid format in {}: {}"_format(path.string(), *data.format));
            }
        }

    }  // namespace detail

    void load_config_file(const std::filesystem::path& path, scan_config& cfg) {
        detail::persisted_config data{};
        auto json = detail::read_text_file(path);
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(data, json);
        if (ec) {
            throw std::runtime_error("failed to parse json file {}"_format(path.string()));
        }
        detail::apply_persisted_config(data, path, cfg);
    }

    std::string config_to_json(const scan_config& cfg) {
        detail::persisted_config data{};
        data.root = cfg.root_name;
        data.root_indent = cfg.root_indent;
        data.excluded_keys = cfg.excluded_keys;
        data.depth = std::string{to_string(cfg.depth)};
        data.tag_key = cfg.tag_key;
        data.options_key = cfg.options_key;
        data.generic_tags = cfg.generic_tags;
        data.skipped_service_suffixes = cfg.skipped_service_suffixes;
        data.selection = std::string{to_string(cfg.selection)};
        data.format = std::string{to_string(cfg.format)};

        std::string json{};
        auto ec = glz::write<glz::opts{.prettify = true}>(data, json);
        if (ec) {
            throw std::runtime_error("failed to serialize config");
        }
        return json;
    }

}  // namespace svcscan
