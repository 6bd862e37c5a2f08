#include "svcscan/source.hpp"

#include "svcscan/format.hpp"

#include "internal/text.hpp"

extern "C" {
#include <unistd.h>
}

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

using namespace svcscan::literals;

namespace svcscan {
    namespace detail {

        namespace fs = std::filesystem;

        static constexpr std::string_view strip_yaml_extension(std::string_view filename) {
            for (auto ext : {".yml"sv, ".yaml"sv}) {
                if (utils::ends_with_case_insensitive(filename, ext)) {
                    return filename.substr(0U, filename.size() - ext.size());
                }
            }
            return filename;
        }

        // ^.+\.(yml|yaml)$
        static constexpr bool is_yaml_name(std::string_view filename) {
            auto stem = strip_yaml_extension(filename);
            return stem.size() != filename.size() && !stem.empty();
        }

        // ^prod\d+\.(yml|yaml)$
        static constexpr bool is_prod_name(std::string_view filename) {
            if (!is_yaml_name(filename)) {
                return false;
            }
            auto stem = strip_yaml_extension(filename);
            if (stem.size() < 5U || !utils::str_case_eq(stem.substr(0U, 4U), "prod"sv)) {
                return false;
            }
            return internal::text::all_of(stem.substr(4U), internal::text::ascii_is_digit);
        }

        static fs::path temporary_sibling(const fs::path& path) {
            auto name = path.filename().string();
            return path.parent_path() / ".{}.svcscan.{}.tmp"_format(name, static_cast<long>(::getpid()));
        }

    }  // namespace detail

    std::string source_file::render() const {
        std::string out{};
        for (std::size_t i = 0U; i < lines.size(); ++i) {
            out.append(lines[i]);
            if (i + 1U < lines.size() || trailing_newline) {
                out.push_back('\n');
            }
        }
        return out;
    }

    source_file parse_source_text(std::filesystem::path path, std::string_view text) {
        source_file file{};
        file.path = std::move(path);
        if (text.empty()) {
            return file;
        }

        file.trailing_newline = text.back() == '\n';
        if (file.trailing_newline) {
            text.remove_suffix(1U);
        }

        std::size_t start = 0U;
        while (true) {
            auto end = text.find('\n', start);
            if (end == std::string_view::npos) {
                file.lines.emplace_back(text.substr(start));
                break;
            }
            file.lines.emplace_back(text.substr(start, end - start));
            start = end + 1U;
        }
        return file;
    }

    source_file load_source_file(const std::filesystem::path& path) {
        std::ifstream in{path, std::ios::binary};
        if (!in) {
            throw std::runtime_error("failed to open {}"_format(path.string()));
        }
        std::ostringstream ss{};
        ss << in.rdbuf();
        if (!in.good() && !in.eof()) {
            throw std::runtime_error("failed to read {}"_format(path.string()));
        }
        return parse_source_text(path, ss.str());
    }

    void write_source_file(const source_file& file) {
        namespace fs = std::filesystem;

        auto tmp = detail::temporary_sibling(file.path);
        {
            std::ofstream out{tmp, std::ios::binary | std::ios::trunc};
            if (!out) {
                throw std::runtime_error("failed to open {}"_format(tmp.string()));
            }
            out << file.render();
            out.flush();
            if (!out) {
                std::error_code ignored{};
                fs::remove(tmp, ignored);
                throw std::runtime_error("failed to write {}"_format(tmp.string()));
            }
        }

        std::error_code ec{};
        auto perms = fs::status(file.path, ec).permissions();
        if (!ec) {
            fs::permissions(tmp, perms, fs::perm_options::replace, ec);
        }

        fs::rename(tmp, file.path, ec);
        if (ec) {
            std::error_code ignored{};
            fs::remove(tmp, ignored);
            throw std::runtime_error("failed to replace {}: {}"_format(file.path.string(), ec.message()));
        }
    }

    search_path_status check_search_path(const std::filesystem::path& dir) {
        std::error_code ec{};
        if (!std::filesystem::exists(dir, ec)) {
            return search_path_status::missing;
        }
        if (!std::filesystem::is_directory(dir, ec)) {
            return search_path_status::not_directory;
        }
        return search_path_status::ok;
    }

    bool matches_selection(std::string_view filename, file_selection selection) {
        switch (selection) {
            case file_selection::prod:
                return detail::is_prod_name(filename);
            case file_selection::yaml:
                return detail::is_yaml_name(filename);
        }
        return false;
    }

    std::string file_label(std::string_view filename, file_selection selection) {
        if (selection == file_selection::prod) {
            // (prod\d+), lower-cased
            auto stem = detail::strip_yaml_extension(filename);
            if (detail::is_prod_name(filename)) {
                return utils::to_lower(stem);
            }
            return "unknown";
        }
        auto stem = detail::strip_yaml_extension(filename);
        if (stem.empty()) {
            return "unknown";
        }
        return std::string{stem};
    }

    std::vector<std::filesystem::path> select_files(const std::filesystem::path& dir, file_selection selection) {
        std::vector<std::filesystem::path> files{};
        for (const auto& entry : std::filesystem::directory_iterator{dir}) {
            std::error_code ec{};
            if (!entry.is_regular_file(ec)) {
                continue;
            }
            if (matches_selection(entry.path().filename().string(), selection)) {
                files.push_back(entry.path());
            }
        }
        std::ranges::sort(files, [](const auto& lhs, const auto& rhs) {
            return lhs.filename().string() < rhs.filename().string();
        });
        return files;
    }

}  // namespace svcscan
