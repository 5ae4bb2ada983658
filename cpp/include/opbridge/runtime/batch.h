#ifndef OPBRIDGE_RUNTIME_BATCH_H
#define OPBRIDGE_RUNTIME_BATCH_H

#include <opbridge/runtime/resolvers.h>

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace opbridge {

    struct TargetSet {
        std::vector<Instance> targets;
        size_t total_count{0};
        bool truncated{false};
    };

    /**
     * Every instance matching ``pattern``, cut to the first ``max_results`` in
     * enumeration order. ``total_count`` is the number of matches before the cut.
     */
    [[nodiscard]] OPBRIDGE_EXPORT TargetSet resolve_targets(const ObjectResolver& resolver, std::string_view pattern,
                                                            bool use_regex, size_t max_results);

    struct OPBRIDGE_EXPORT BatchResult {
        size_t total_count{0};
        size_t success_count{0};
        size_t error_count{0};
        value::Sequence results;
        value::Sequence errors;
        bool stopped{false};

        // totalCount, successCount, errorCount, results, errors and, when it happened, stopped
        [[nodiscard]] value::Mapping to_mapping() const;
    };

    using BatchOperation = std::function<value::Mapping(const Instance&)>;
    using InstanceLabeler = std::function<std::string(const Instance&)>;

    /**
     * Runs ``operation`` against each target in order. Each result entry carries
     * ``target`` and ``success: true`` merged with the operation's mapping; a thrown
     * error becomes an ``errors`` entry with ``target``, ``error`` and ``errorType``.
     *
     * With ``stop_on_error`` the run ends right after the first failing target has
     * been recorded. ``total_count`` is always the number of targets handed in.
     */
    [[nodiscard]] OPBRIDGE_EXPORT BatchResult run_batched(const std::vector<Instance>& targets,
                                                          const BatchOperation& operation, bool stop_on_error,
                                                          const InstanceLabeler& labeler = {});

}  // namespace opbridge

#endif  // OPBRIDGE_RUNTIME_BATCH_H
