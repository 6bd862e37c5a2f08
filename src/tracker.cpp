#include "svcscan/tracker.hpp"

#include <algorithm>
#include <utility>

namespace svcscan {

    indentation_tracker::indentation_tracker(tracker_options options) : options_{std::move(options)} {}

    std::optional<std::string_view> indentation_tracker::current_service() const {
        if (!open_) {
            return std::nullopt;
        }
        return std::string_view{open_->service};
    }

    bool indentation_tracker::is_root_header(const classified_line& line) const {
        if (line.kind != line_kind::block_header || line.named_by_field) {
            return false;
        }
        if (line.key != options_.root_name) {
            return false;
        }
        return !options_.root_indent || *options_.root_indent == line.indent;
    }

    bool indentation_tracker::leaves_root(const classified_line& line) const {
        return line.is_header() && !line.list_item && line.indent <= root_indent_;
    }

    bool indentation_tracker::opens_service(const classified_line& line) const {
        if (!line.names_block() || line.key_column <= root_indent_) {
            return false;
        }
        return !open_ || line.indent <= open_->indent;
    }

    bool indentation_tracker::closes_on_item(const classified_line& line) const {
        return line.list_item && open_ && line.indent <= open_->indent && !opens_service(line);
    }

    void indentation_tracker::track_item(std::size_t index, const classified_line& line) {
        if (line.list_item) {
            item_ = list_item_anchor{index, line.indent, line.key_column};
        }
        else if (item_ && line.indent <= item_->indent) {
            item_.reset();
        }
    }

    void indentation_tracker::pop_frames(std::size_t indent) {
        while (!frames_.empty() && frames_.back().indent >= indent) {
            frames_.pop_back();
        }
        if (frames_.empty()) {
            service_frame_ = false;
        }
    }

    std::optional<service_location> indentation_tracker::close_open(std::size_t index) {
        if (!open_) {
            return std::nullopt;
        }
        auto closed = std::move(*open_);
        open_.reset();
        closed.line_end = index > closed.line_start ? index - 1U : closed.line_start;
        debug_log("close service '", closed.service, "' [", closed.line_start, ", ", closed.line_end, "]");
        return closed;
    }

    tracker_step indentation_tracker::advance(std::size_t index, const classified_line& line) {
        tracker_step step{};
        if (!line.is_content()) {
            return step;
        }

        if (phase_ == tracker_phase::inside_root && leaves_root(line)) {
            step.closed = close_open(index);
            step.left_root = true;
            phase_ = tracker_phase::outside_root;
            frames_.clear();
            service_frame_ = false;
            item_.reset();
        }

        if (phase_ == tracker_phase::outside_root) {
            if (is_root_header(line)) {
                debug_log("enter root '", line.key, "' at line ", index, " indent ", line.indent);
                phase_ = tracker_phase::inside_root;
                root_indent_ = line.indent;
                step.entered_root = true;
            }
            return step;
        }

        pop_frames(line.indent);

        if (closes_on_item(line)) {
            step.closed = close_open(index);
            frames_.clear();
            service_frame_ = false;
        }

        if (line.is_header()) {
            if (opens_service(line)) {
                auto start = index;
                auto indent = line.indent;
                if (!line.list_item && line.named_by_field && item_ && item_->key_column == line.indent) {
                    start = item_->index;
                    indent = item_->indent;
                }
                if (auto closed = close_open(start)) {
                    step.closed = std::move(closed);
                }
                open_ = service_location{line.name, start, index, indent};
                frames_.assign(1U, block_context{indent, line.name});
                service_frame_ = true;
                step.opened_service = true;
                debug_log("open service '", line.name, "' at line ", start, " indent ", indent);
            }
            else if (!line.named_by_field || line.list_item) {
                // structural or nested block; the open service keeps its identity
                frames_.push_back(block_context{line.indent, line.name});
            }
            track_item(index, line);
            return step;
        }

        if (open_ && service_frame_) {
            step.scope = frames_.size() == 1U ? fact_scope::direct : fact_scope::nested;
        }
        track_item(index, line);
        return step;
    }

    std::optional<service_location> indentation_tracker::finish(std::size_t line_count) {
        frames_.clear();
        service_frame_ = false;
        item_.reset();
        phase_ = tracker_phase::outside_root;
        if (!open_) {
            return std::nullopt;
        }
        auto closed = std::move(*open_);
        open_.reset();
        closed.line_end = std::max(closed.line_start, line_count > 0U ? line_count - 1U : 0U);
        debug_log("close service '", closed.service, "' at end of input [", closed.line_start, ", ", closed.line_end, "]");
        return closed;
    }

}  // namespace svcscan
