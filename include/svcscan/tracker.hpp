#pragma once

#include "lines.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace svcscan {

    // One open block inside the root: children of this block are indented deeper than `indent`
    struct block_context {
        std::size_t indent{};
        std::string name{};
    };

    // Inclusive, 0-based line range of one service block, header line included
    struct service_location {
        std::string service{};
        std::size_t line_start{};
        std::size_t line_end{};
        std::size_t indent{};

        constexpr bool empty_body() const { return line_end <= line_start; }
        constexpr std::size_t line_count() const { return line_end - line_start + 1U; }
        constexpr bool contains(std::size_t line) const { return line >= line_start && line <= line_end; }
    };

    enum class tracker_phase : uint8_t { outside_root, inside_root };

    // How a content line relates to the open service
    enum class fact_scope : uint8_t { none, direct, nested };

    inline constexpr std::string_view to_string(tracker_phase phase) {
        switch (phase) {
            case tracker_phase::outside_root:
                return "outside_root"sv;
            case tracker_phase::inside_root:
                return "inside_root"sv;
        }
        return "outside_root"sv;
    }

    inline constexpr std::string_view to_string(fact_scope scope) {
        switch (scope) {
            case fact_scope::none:
                return "none"sv;
            case fact_scope::direct:
                return "direct"sv;
            case fact_scope::nested:
                return "nested"sv;
        }
        return "none"sv;
    }

    // Most recent `- ` line inside the root; a later `name:` field at its key column names the item
    struct list_item_anchor {
        std::size_t index{};
        std::size_t indent{};
        std::size_t key_column{};
    };

    struct tracker_options {
        std::string root_name{"services"};
        std::optional<std::size_t> root_indent{};
    };

    struct tracker_step {
        std::optional<service_location> closed{};
        bool entered_root{false};
        bool left_root{false};
        bool opened_service{false};
        fact_scope scope{fact_scope::none};
    };

    /*
     * Streaming state machine that rebuilds the block hierarchy from indentation.
     *
     * Lines are fed top to bottom with their 0-based index. While inside the root block every
     * non-excluded header at or above the open service's indent starts a new service; the
     * previous one is closed on the line before. Leaving the root (a non-list header at or
     * above the root's indent) or `finish()` closes the last one. At most one service is open.
     *
     * A list item whose `name:` field is not its first key is anchored on the item's dash line,
     * and the next dash at or above that indent closes it.
     */
    class indentation_tracker {
      public:
        explicit indentation_tracker(tracker_options options);

        tracker_step advance(std::size_t index, const classified_line& line);

        // End of input; closes the open service on the last line
        std::optional<service_location> finish(std::size_t line_count);

        tracker_phase phase() const { return phase_; }
        std::optional<std::string_view> current_service() const;
        const std::optional<service_location>& open_location() const { return open_; }
        const std::vector<block_context>& frames() const { return frames_; }

      private:
        tracker_options options_;
        tracker_phase phase_{tracker_phase::outside_root};
        std::size_t root_indent_{};
        std::optional<service_location> open_{};
        bool service_frame_{false};
        std::vector<block_context> frames_{};
        std::optional<list_item_anchor> item_{};

        bool is_root_header(const classified_line& line) const;
        bool leaves_root(const classified_line& line) const;
        bool opens_service(const classified_line& line) const;
        bool closes_on_item(const classified_line& line) const;
        void track_item(std::size_t index, const classified_line& line);
        void pop_frames(std::size_t indent);
        std::optional<service_location> close_open(std::size_t index);
    };

}  // namespace svcscan
