/**
 * @file priorities.hpp
 * @brief The four node priorities combined by the CompositeScorer.
 * @author Dimitris Kafetzis
 *
 * Every priority is a pure function of its inputs: it reads node and
 * cluster state copies and never mutates shared state, so any number of
 * them may run concurrently. Failures are returned, never defaulted.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "nodeorder/listers.hpp"
#include "nodeorder/node_state_index.hpp"

#include <cstdint>
#include <vector>

namespace node_order {

/// Upper bound of every normalized per-node priority.
inline constexpr int64_t kMaxPriority = 10;

/// Weight given to an existing task's required affinity term that the incoming task satisfies.
inline constexpr int32_t kDefaultHardAffinitySymmetricWeight = 1;

struct HostPriority {
    NodeId host;
    int64_t score{0};
};

using HostPriorityList = std::vector<HostPriority>;

// ─────────────────────────────────────────────
// Per-node priorities
// ─────────────────────────────────────────────

/**
 * @brief Favors nodes with more unrequested capacity once the task is placed.
 *
 * Per resource: ((allocatable - requested) * 10) / allocatable, 0 when the
 * node is full or has no such resource; the result averages CPU and memory.
 */
[[nodiscard]] Result<int64_t> least_requested_priority(const Task& task, const NodeState& state);

/**
 * @brief Favors nodes whose CPU and memory utilization stay close together.
 *
 * (1 - |cpu_fraction - memory_fraction|) * 10, or 0 when either fraction
 * reaches 1.
 */
[[nodiscard]] Result<int64_t> balanced_resource_priority(const Task& task, const NodeState& state);

/**
 * @brief Sum of weights of the preferred node affinity terms the node matches.
 *
 * Required terms are not evaluated; the feasibility stage owns them.
 */
[[nodiscard]] Result<int64_t> node_affinity_priority(const Task& task, const NodeState& state);

// ─────────────────────────────────────────────
// Cluster-wide priority
// ─────────────────────────────────────────────

/**
 * @brief Inter-task affinity and anti-affinity, scored for every node at once.
 *
 * Walks every bound task in the cluster once. Terms of the incoming task
 * that match an existing task, and terms of existing tasks that match the
 * incoming task, add (affinity) or subtract (anti-affinity) their weight on
 * every node sharing the existing task's topology domain. Raw counts are
 * then scaled to [0, kMaxPriority].
 */
class InterTaskAffinityPriority {
public:
    InterTaskAffinityPriority(const INodeInfoProvider& node_info,
                              const INodeLister& node_lister,
                              const ITaskLister& task_lister,
                              int32_t hard_affinity_weight = kDefaultHardAffinitySymmetricWeight);

    [[nodiscard]] Result<HostPriorityList> calculate(const Task& task,
                                                     const std::vector<NodeState>& cluster) const;

private:
    const INodeInfoProvider& node_info_;
    const INodeLister& node_lister_;
    const ITaskLister& task_lister_;
    int32_t hard_affinity_weight_;
};

/// Score of `host` in `list`, or 0 when the host is absent.
[[nodiscard]] int64_t host_score(const HostPriorityList& list, const NodeId& host) noexcept;

}  // namespace node_order
