/**
 * @file composite_scorer.hpp
 * @brief Weighted sum of the four priorities for one (task, node) pair.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "framework/node_info.hpp"
#include "nodeorder/listers.hpp"
#include "nodeorder/node_state_index.hpp"
#include "nodeorder/priorities.hpp"
#include "nodeorder/weights.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace node_order {

/**
 * @brief Raw, unweighted priority scores for one (task, node) pair.
 */
struct SubScores {
    int64_t least_requested{0};
    int64_t balanced_resource{0};
    int64_t node_affinity{0};
    int64_t task_affinity{0};

    bool operator==(const SubScores&) const = default;
};

/**
 * @brief The node-order function registered with the session.
 *
 * Reads the NodeStateIndex only through copies; safe to call from many
 * threads while the EventBridge mutates the index. The cluster-wide
 * affinity pass is computed once per task and index generation and then
 * reused for every candidate node. A task that reuses a uid with different
 * labels, namespace or affinity terms is recomputed rather than served stale.
 */
class CompositeScorer {
public:
    CompositeScorer(PriorityWeights weights,
                    const NodeStateIndex& index,
                    const ITaskLister& task_lister,
                    Logger& logger);

    CompositeScorer(const CompositeScorer&) = delete;
    CompositeScorer& operator=(const CompositeScorer&) = delete;

    /// Weighted sum of sub_scores(); the first failing priority aborts the call.
    [[nodiscard]] Result<double> score(const Task& task, const NodeInfo& node) const;

    [[nodiscard]] Result<SubScores> sub_scores(const Task& task, const NodeInfo& node) const;

    [[nodiscard]] const PriorityWeights& weights() const noexcept { return weights_; }

    [[nodiscard]] static double weighted_sum(const SubScores& scores,
                                             const PriorityWeights& weights) noexcept;

private:
    /// Task fields the affinity pass reads; a same-uid task that differs misses the cache.
    struct AffinityInputs {
        std::string namespace_name;
        Labels labels;
        std::optional<TaskAffinity> task_affinity;
        std::optional<TaskAffinity> task_anti_affinity;

        static AffinityInputs of(const Task& task);
        bool operator==(const AffinityInputs&) const = default;
    };

    struct CachedAffinity {
        uint64_t generation;
        AffinityInputs inputs;
        HostPriorityList scores;
    };

    [[nodiscard]] NodeState resolve_state(const NodeInfo& node) const;
    [[nodiscard]] Result<HostPriorityList> affinity_scores(const Task& task) const;

    PriorityWeights weights_;
    const NodeStateIndex& index_;
    Logger& logger_;
    IndexNodeLister node_lister_;
    InterTaskAffinityPriority task_affinity_;

    mutable std::mutex cache_mutex_;
    mutable std::unordered_map<TaskId, CachedAffinity> affinity_cache_;
};

}  // namespace node_order
