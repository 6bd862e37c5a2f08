#pragma once

#include "scanner.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace svcscan {

    enum class edit_action : uint8_t { update, insert_after };

    inline constexpr std::string_view to_string(edit_action action) {
        switch (action) {
            case edit_action::update:
                return "update"sv;
            case edit_action::insert_after:
                return "insert"sv;
        }
        return "update"sv;
    }

    // A single planned line change; `line` is 0-based
    struct edit {
        std::filesystem::path file{};
        std::size_t line{};
        edit_action action{edit_action::update};
        std::string text{};

        bool operator==(const edit&) const = default;
    };

    enum class plan_status : uint8_t {
        planned,
        already_present,
        location_not_found,
        field_not_scalar,
    };

    inline constexpr std::string_view to_string(plan_status status) {
        switch (status) {
            case plan_status::planned:
                return "planned"sv;
            case plan_status::already_present:
                return "already_present"sv;
            case plan_status::location_not_found:
                return "not_found"sv;
            case plan_status::field_not_scalar:
                return "not_scalar"sv;
        }
        return "not_found"sv;
    }

    // Add `value` to the comma separated list held by `field`
    struct list_append_request {
        std::string field{"active_profiles"};
        std::string value{};
    };

    struct plan_result {
        plan_status status{plan_status::location_not_found};
        std::string service{};
        std::size_t header_line{};  // 1-based, 0 when not found
        std::optional<std::string> previous{};
        std::optional<edit> change{};
    };

    plan_result plan_list_append(
            const source_file& source, const service_location& location, const list_append_request& request);

    // Plans against the latest recorded block of `service`
    plan_result plan_list_append(
            const source_file& source,
            const location_index& locations,
            std::string_view service,
            const list_append_request& request);

    // One result per recorded block of `service`; a single not-found result when there is none
    std::vector<plan_result> plan_list_append_all(
            const source_file& source,
            const location_index& locations,
            std::string_view service,
            const list_append_request& request);

    struct apply_result {
        std::filesystem::path path{};
        std::vector<edit> applied{};
        std::string content{};
        bool dry_run{false};
        bool written{false};
        std::optional<std::string> error{};

        bool ok() const { return !error.has_value(); }
    };

    // Descending line order; edits on the same line keep their relative outcome
    std::vector<edit> order_for_apply(std::vector<edit> edits);

    // Throws std::out_of_range when an edit targets a line past the end
    void apply_to_lines(std::vector<std::string>& lines, const std::vector<edit>& ordered);

    // Read once, apply in descending order, write back through a temporary file unless `dry_run`
    apply_result apply_edits(const std::filesystem::path& path, std::vector<edit> edits, bool dry_run);

    struct file_mutation {
        std::filesystem::path path{};
        std::string label{};
        std::vector<plan_result> plans{};
        apply_result outcome{};
    };

    struct mutation_summary {
        std::vector<file_mutation> files{};
        std::vector<file_error> errors{};
        std::size_t planned{};
        std::size_t already_present{};
        std::size_t not_found{};
        std::size_t not_scalar{};
    };

    mutation_summary add_list_value(
            const std::filesystem::path& dir,
            const scan_config& cfg,
            const list_append_request& request,
            bool dry_run);

}  // namespace svcscan
