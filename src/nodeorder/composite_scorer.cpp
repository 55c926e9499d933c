/**
 * @file composite_scorer.cpp
 * @brief CompositeScorer implementation.
 * @author Dimitris Kafetzis
 *
 *   score = w_lr  * least_requested
 *         + w_br  * balanced_resource
 *         + w_na  * node_affinity
 *         + w_ta  * task_affinity[node]
 */

#include "nodeorder/composite_scorer.hpp"

#include "core/concepts.hpp"

#include <string>
#include <string_view>

namespace node_order {

namespace {

template <NodeStatePriority F>
Result<int64_t> run_priority(F&& priority, std::string_view name,
                             const Task& task, const NodeState& state, Logger& logger) {
    auto result = priority(task, state);
    if (!result) {
        logger.warn(std::string{name} + " priority failed because of error: "
                    + result.error().message);
    }
    return result;
}

}  // anonymous namespace

CompositeScorer::CompositeScorer(PriorityWeights weights,
                                 const NodeStateIndex& index,
                                 const ITaskLister& task_lister,
                                 Logger& logger)
    : weights_(weights)
    , index_(index)
    , logger_(logger)
    , node_lister_(index)
    , task_affinity_(node_lister_, node_lister_, task_lister) {}

double CompositeScorer::weighted_sum(const SubScores& scores,
                                     const PriorityWeights& weights) noexcept {
    double total = 0.0;
    total += static_cast<double>(scores.least_requested * weights.least_requested);
    total += static_cast<double>(scores.balanced_resource * weights.balanced_resource);
    total += static_cast<double>(scores.node_affinity * weights.node_affinity);
    total += static_cast<double>(scores.task_affinity * weights.task_affinity);
    return total;
}

NodeState CompositeScorer::resolve_state(const NodeInfo& node) const {
    if (auto state = index_.lookup(node.name())) {
        return std::move(*state);
    }
    logger_.warn("node order, generate node info for " + node.name()
                 + " at NodeOrderFn is unexpected");
    return NodeState::from(node);
}

CompositeScorer::AffinityInputs CompositeScorer::AffinityInputs::of(const Task& task) {
    return AffinityInputs{
        .namespace_name = task.namespace_name,
        .labels = task.labels,
        .task_affinity = task.affinity.task_affinity,
        .task_anti_affinity = task.affinity.task_anti_affinity
    };
}

Result<HostPriorityList> CompositeScorer::affinity_scores(const Task& task) const {
    const uint64_t generation = index_.generation();
    auto inputs = AffinityInputs::of(task);
    {
        std::lock_guard lock(cache_mutex_);
        auto it = affinity_cache_.find(task.uid);
        if (it != affinity_cache_.end() && it->second.generation == generation
            && it->second.inputs == inputs) {
            return it->second.scores;
        }
    }

    auto cluster = index_.snapshot();
    auto scores = task_affinity_.calculate(task, cluster.nodes);
    if (!scores) return scores;

    std::lock_guard lock(cache_mutex_);
    affinity_cache_[task.uid] = CachedAffinity{cluster.generation, std::move(inputs), *scores};
    return scores;
}

Result<SubScores> CompositeScorer::sub_scores(const Task& task, const NodeInfo& node) const {
    const NodeState state = resolve_state(node);
    SubScores scores;

    auto least = run_priority(least_requested_priority, "Least Requested", task, state, logger_);
    if (!least) return least.error();
    scores.least_requested = *least;

    auto balanced = run_priority(balanced_resource_priority, "Balanced Resource Allocation",
                                 task, state, logger_);
    if (!balanced) return balanced.error();
    scores.balanced_resource = *balanced;

    auto affinity = run_priority(node_affinity_priority, "Calculate Node Affinity",
                                 task, state, logger_);
    if (!affinity) return affinity.error();
    scores.node_affinity = *affinity;

    auto inter_task = affinity_scores(task);
    if (!inter_task) {
        logger_.warn("Calculate Inter Task Affinity priority failed because of error: "
                     + inter_task.error().message);
        return inter_task.error();
    }
    scores.task_affinity = host_score(*inter_task, node.name());

    return scores;
}

Result<double> CompositeScorer::score(const Task& task, const NodeInfo& node) const {
    auto scores = sub_scores(task, node);
    if (!scores) return scores.error();

    double total = weighted_sum(*scores, weights_);
    if (logger_.enabled(LogLevel::Debug)) {
        logger_.debug("Total score of " + task.qualified_name() + " on node " + node.name()
                      + " is: " + std::to_string(total));
    }
    return total;
}

}  // namespace node_order
