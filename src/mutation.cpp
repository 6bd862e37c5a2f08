#include "svcscan/mutation.hpp"

#include <exception>
#include <string>
#include <utility>
#include <vector>

namespace svcscan {
    namespace detail {

        static void tally(mutation_summary& summary, const plan_result& plan) {
            switch (plan.status) {
                case plan_status::planned:
                    ++summary.planned;
                    break;
                case plan_status::already_present:
                    ++summary.already_present;
                    break;
                case plan_status::location_not_found:
                    ++summary.not_found;
                    break;
                case plan_status::field_not_scalar:
                    ++summary.not_scalar;
                    break;
            }
        }

        static file_mutation mutate_file(
                const std::filesystem::path& path,
                const scan_config& cfg,
                const list_append_request& request,
                bool dry_run) {
            file_mutation mutation{};
            mutation.path = path;
            mutation.label = file_label(path.filename().string(), cfg.selection);

            auto source = load_source_file(path);
            auto scan = scan_source(source, mutation.label, cfg);

            location_index locations{};
            for (const auto& location : scan.locations) {
                locations.record(path, location);
            }

            std::vector<edit> edits{};
            bool any_match = false;
            for (const auto& record : scan.services) {
                if (!matches_service_filter(record.name, cfg.service_filter)) {
                    continue;
                }
                any_match = true;
                for (auto& plan : plan_list_append_all(source, locations, record.name, request)) {
                    if (plan.change) {
                        edits.push_back(*plan.change);
                    }
                    mutation.plans.push_back(std::move(plan));
                }
            }

            if (!any_match && !cfg.service_filter.empty()) {
                plan_result missing{};
                missing.service = cfg.service_filter;
                mutation.plans.push_back(std::move(missing));
            }

            mutation.outcome = apply_edits(path, std::move(edits), dry_run);
            return mutation;
        }

    }  // namespace detail

    mutation_summary add_list_value(
            const std::filesystem::path& dir,
            const scan_config& cfg,
            const list_append_request& request,
            bool dry_run) {
        mutation_summary summary{};
        for (const auto& path : select_files(dir, cfg.selection)) {
            try {
                auto mutation = detail::mutate_file(path, cfg, request, dry_run);
                for (const auto& plan : mutation.plans) {
                    detail::tally(summary, plan);
                }
                if (!mutation.outcome.ok()) {
                    summary.errors.push_back(file_error{path, *mutation.outcome.error});
                }
                summary.files.push_back(std::move(mutation));
            } catch (const std::exception& e) {
                summary.errors.push_back(file_error{path, e.what()});
            }
        }
        return summary;
    }

}  // namespace svcscan
