#pragma once

#include "config.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace svcscan {

    // Line sequence of one file; `render()` reproduces the original bytes
    struct source_file {
        std::filesystem::path path{};
        std::vector<std::string> lines{};
        bool trailing_newline{false};

        std::string render() const;
    };

    enum class search_path_status : uint8_t { ok, missing, not_directory };

    inline constexpr std::string_view to_string(search_path_status status) {
        switch (status) {
            case search_path_status::ok:
                return "ok"sv;
            case search_path_status::missing:
                return "missing"sv;
            case search_path_status::not_directory:
                return "not_directory"sv;
        }
        return "missing"sv;
    }

    source_file parse_source_text(std::filesystem::path path, std::string_view text);

    source_file load_source_file(const std::filesystem::path& path);

    // Writes a sibling temporary file and renames it over `file.path`
    void write_source_file(const source_file& file);

    search_path_status check_search_path(const std::filesystem::path& dir);

    bool matches_selection(std::string_view filename, file_selection selection);

    std::string file_label(std::string_view filename, file_selection selection);

    // Regular files of `dir` (non-recursive) matching `selection`, sorted by file name
    std::vector<std::filesystem::path> select_files(const std::filesystem::path& dir, file_selection selection);

}  // namespace svcscan
