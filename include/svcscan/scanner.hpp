#pragma once

#include "config.hpp"
#include "source.hpp"
#include "tracker.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace svcscan {

    struct tag_occurrence {
        std::size_t line{};  // 1-based
        std::string service{};
        std::string value{};
    };

    struct service_record {
        std::string name{};
        std::size_t indent{};       // first occurrence
        std::size_t header_line{};  // latest occurrence, 1-based
        std::size_t occurrences{};
        std::vector<tag_occurrence> tags{};
        std::vector<std::string> options{};
    };

    // (file, service) -> every recorded block of that service, in file order
    class location_index {
      public:
        void record(const std::filesystem::path& file, service_location location);

        // Latest block of `service` in `file`; nullopt when the service was never seen there
        std::optional<service_location> find(const std::filesystem::path& file, std::string_view service) const;

        std::vector<service_location> occurrences(const std::filesystem::path& file, std::string_view service) const;

        // All blocks of one file ordered by first line
        std::vector<service_location> in_file(const std::filesystem::path& file) const;

        std::size_t size() const { return count_; }
        bool empty() const { return count_ == 0U; }

      private:
        using key_type = std::pair<std::string, std::string>;
        std::map<key_type, std::vector<service_location>> entries_{};
        std::size_t count_{};
    };

    struct file_scan {
        std::filesystem::path path{};
        std::string label{};
        std::size_t line_count{};
        std::vector<service_record> services{};
        std::vector<tag_occurrence> tags{};
        std::vector<service_location> locations{};

        const service_record* find_service(std::string_view name) const;
    };

    struct file_error {
        std::filesystem::path path{};
        std::string message{};
    };

    // Process-wide results; passed explicitly into every per-file scan
    struct scan_aggregate {
        std::vector<file_scan> files{};
        std::vector<file_error> errors{};
        location_index locations{};

        std::set<std::string> distinct_options{};
        std::set<std::string> distinct_tags{};
        std::map<std::string, std::set<std::string>> services_by_label{};
        std::map<std::string, std::set<std::string>> labels_by_service{};
        std::size_t files_scanned{};

        void add(file_scan scan, const scan_config& cfg);
        const file_scan* find_file(const std::filesystem::path& path) const;
    };

    // Version strings, commit hashes and generic labels are not custom; anything else with a '/' is
    bool is_custom_tag(std::string_view tag) noexcept;
    bool is_custom_tag(std::string_view tag, const std::vector<std::string>& generic_tags) noexcept;

    // Whitespace separated tokens; a quoted run stays one token even with spaces inside
    std::vector<std::string> split_options(std::string_view value);

    bool matches_service_filter(std::string_view service, std::string_view filter);

    bool is_skipped_service(std::string_view service, const scan_config& cfg);

    file_scan scan_source(const source_file& source, std::string label, const scan_config& cfg);

    // Reads and scans one file into `aggregate`; read failures are recorded, never thrown
    bool scan_file(const std::filesystem::path& path, const scan_config& cfg, scan_aggregate& aggregate);

    // Every selected file of `dir` in name order
    void scan_directory(const std::filesystem::path& dir, const scan_config& cfg, scan_aggregate& aggregate);

}  // namespace svcscan
