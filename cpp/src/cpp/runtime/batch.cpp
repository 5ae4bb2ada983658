#include <opbridge/runtime/batch.h>
#include <opbridge/util/log.h>

namespace opbridge {

    using value::Mapping;

    TargetSet resolve_targets(const ObjectResolver &resolver, std::string_view pattern, bool use_regex,
                              size_t max_results) {
        TargetSet set;
        set.targets = resolver.find_by_pattern(pattern, use_regex);
        set.total_count = set.targets.size();
        set.truncated = set.total_count > max_results;
        if (set.truncated) set.targets.resize(max_results);
        return set;
    }

    Mapping BatchResult::to_mapping() const {
        Mapping mapping{
            {"totalCount", total_count},
            {"successCount", success_count},
            {"errorCount", error_count},
            {"results", results},
            {"errors", errors},
        };
        if (stopped) mapping.emplace("stopped", true);
        return mapping;
    }

    BatchResult run_batched(const std::vector<Instance> &targets, const BatchOperation &operation, bool stop_on_error,
                            const InstanceLabeler &labeler) {
        BatchResult result;
        result.total_count = targets.size();

        for (const auto &target : targets) {
            auto label = labeler ? labeler(target) : target.label();
            try {
                Mapping entry = operation(target);
                entry.insert_or_assign("target", label);
                entry.try_emplace("success", true);
                result.results.emplace_back(std::move(entry));
                ++result.success_count;
            } catch (const std::exception &e) {
                log_warning("Batch operation failed on {}: {}", label, e.what());
                result.errors.emplace_back(Mapping{
                    {"target", label},
                    {"success", false},
                    {"error", e.what()},
                    {"errorType", error_type_name(e)},
                });
                ++result.error_count;
                if (stop_on_error) {
                    result.stopped = true;
                    break;
                }
            }
        }
        return result;
    }

}  // namespace opbridge
