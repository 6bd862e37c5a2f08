#include "svcscan/mutation.hpp"

#include "svcscan/format.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace svcscan::literals;

namespace svcscan {

    std::vector<edit> order_for_apply(std::vector<edit> edits) {
        struct sequenced {
            std::size_t seq{};
            edit change{};
        };

        std::vector<sequenced> pending{};
        pending.reserve(edits.size());
        for (std::size_t i = 0U; i < edits.size(); ++i) {
            pending.push_back(sequenced{i, std::move(edits[i])});
        }

        // later-planned inserts after the same line go in first so planning order survives
        std::ranges::sort(pending, [](const sequenced& lhs, const sequenced& rhs) {
            if (lhs.change.line != rhs.change.line) {
                return lhs.change.line > rhs.change.line;
            }
            return lhs.seq > rhs.seq;
        });

        std::vector<edit> ordered{};
        ordered.reserve(pending.size());
        for (auto& entry : pending) {
            ordered.push_back(std::move(entry.change));
        }
        return ordered;
    }

    void apply_to_lines(std::vector<std::string>& lines, const std::vector<edit>& ordered) {
        for (const auto& change : ordered) {
            if (change.line >= lines.size()) {
                throw std::out_of_range(
                        "{} edit at line {} is past the end ({} lines)"_format(
                                change.action, change.line + 1U, lines.size()));
            }
            switch (change.action) {
                case edit_action::update:
                    lines[change.line] = change.text;
                    break;
                case edit_action::insert_after:
                    lines.insert(lines.begin() + static_cast<std::ptrdiff_t>(change.line + 1U), change.text);
                    break;
            }
        }
    }

    apply_result apply_edits(const std::filesystem::path& path, std::vector<edit> edits, bool dry_run) {
        apply_result result{};
        result.path = path;
        result.dry_run = dry_run;

        try {
            for (const auto& change : edits) {
                if (!change.file.empty() && change.file != path) {
                    throw std::invalid_argument(
                            "edit for {} handed to {}"_format(change.file.string(), path.string()));
                }
            }

            auto source = load_source_file(path);
            result.applied = order_for_apply(std::move(edits));
            apply_to_lines(source.lines, result.applied);
            result.content = source.render();

            if (!dry_run && !result.applied.empty()) {
                write_source_file(source);
                result.written = true;
            }
            debug_log(dry_run ? "planned " : "applied ", result.applied.size(), " edits to ", path.string());
        } catch (const std::exception& e) {
            result.error = "{}: {}"_format(path.string(), e.what());
        }
        return result;
    }

}  // namespace svcscan
