/**
 * @file inter_task_affinity.cpp
 * @brief InterTaskAffinityPriority: one pass over all bound tasks.
 * @author Dimitris Kafetzis
 *
 * Algorithm:
 *   counts(node) = 0 for every node
 *   For each existing task E on node N_E:
 *     incoming preferred affinity terms matching E:       +w on topology(N_E)
 *     incoming preferred anti-affinity terms matching E:  -w on topology(N_E)
 *     E's required affinity terms matching incoming:      +hard on topology(N_E)
 *     E's preferred affinity terms matching incoming:     +w on topology(N_E)
 *     E's preferred anti-affinity terms matching incoming: -w on topology(N_E)
 *   score(node) = 10 * (counts(node) - min) / (max - min), min/max seeded at 0
 *
 * Complexity: O(T × K × N) where T = bound tasks, K = terms, N = nodes.
 */

#include "nodeorder/label_selector.hpp"
#include "nodeorder/priorities.hpp"

#include <algorithm>
#include <string>
#include <unordered_map>

namespace node_order {

namespace {

bool same_topology(const Node& a, const Node& b, const std::string& topology_key) {
    if (topology_key.empty()) {
        return a.name == b.name;
    }
    auto label_a = a.labels.find(topology_key);
    auto label_b = b.labels.find(topology_key);
    return label_a != a.labels.end() && label_b != b.labels.end()
           && label_a->second == label_b->second;
}

/// Does `candidate` fall under `term`, which is owned by `owner`?
Result<bool> term_matches(const TaskAffinityTerm& term, const Task& owner, const Task& candidate) {
    if (!term.selector) return false;

    auto selected = selector_matches(*term.selector, candidate.labels);
    if (!selected) return selected.error();
    if (!*selected) return false;

    if (term.namespaces.empty()) {
        return candidate.namespace_name == owner.namespace_name;
    }
    return std::find(term.namespaces.begin(), term.namespaces.end(), candidate.namespace_name)
           != term.namespaces.end();
}

class AffinityCounts {
public:
    explicit AffinityCounts(const std::vector<Node>& nodes) : nodes_(nodes) {}

    Result<void> process_term(const TaskAffinityTerm& term,
                              const Task& owner,
                              const Task& candidate,
                              const Node& fixed_node,
                              double weight) {
        auto matched = term_matches(term, owner, candidate);
        if (!matched) {
            return matched.error().with_context("affinity term of " + owner.qualified_name());
        }
        if (!*matched) return Result<void>{};

        for (const auto& node : nodes_) {
            if (same_topology(node, fixed_node, term.topology_key)) {
                counts_[node.name] += weight;
            }
        }
        return Result<void>{};
    }

    Result<void> process_terms(const std::vector<WeightedTaskAffinityTerm>& terms,
                               const Task& owner,
                               const Task& candidate,
                               const Node& fixed_node,
                               int multiplier) {
        for (const auto& weighted : terms) {
            auto processed = process_term(weighted.term, owner, candidate, fixed_node,
                                          static_cast<double>(weighted.weight * multiplier));
            if (!processed) return processed;
        }
        return Result<void>{};
    }

    [[nodiscard]] HostPriorityList normalize() const {
        double max_count = 0.0;
        double min_count = 0.0;
        for (const auto& node : nodes_) {
            double count = count_of(node.name);
            max_count = std::max(max_count, count);
            min_count = std::min(min_count, count);
        }

        HostPriorityList result;
        result.reserve(nodes_.size());
        for (const auto& node : nodes_) {
            double score = 0.0;
            if (max_count - min_count > 0) {
                score = static_cast<double>(kMaxPriority)
                        * ((count_of(node.name) - min_count) / (max_count - min_count));
            }
            result.push_back({node.name, static_cast<int64_t>(score)});
        }
        return result;
    }

private:
    [[nodiscard]] double count_of(const NodeId& name) const {
        auto it = counts_.find(name);
        return it == counts_.end() ? 0.0 : it->second;
    }

    const std::vector<Node>& nodes_;
    std::unordered_map<NodeId, double> counts_;
};

}  // anonymous namespace

InterTaskAffinityPriority::InterTaskAffinityPriority(const INodeInfoProvider& node_info,
                                                     const INodeLister& node_lister,
                                                     const ITaskLister& task_lister,
                                                     int32_t hard_affinity_weight)
    : node_info_(node_info)
    , node_lister_(node_lister)
    , task_lister_(task_lister)
    , hard_affinity_weight_(hard_affinity_weight) {}

Result<HostPriorityList> InterTaskAffinityPriority::calculate(
        const Task& task, const std::vector<NodeState>& cluster) const {
    const auto& affinity = task.affinity.task_affinity;
    const auto& anti_affinity = task.affinity.task_anti_affinity;

    const auto nodes = node_lister_.list();
    AffinityCounts counts(nodes);

    for (const auto& state : cluster) {
        for (const auto& [uid, existing] : state.tasks) {
            const auto& existing_affinity = existing.affinity.task_affinity;
            const auto& existing_anti_affinity = existing.affinity.task_anti_affinity;
            if (!affinity && !anti_affinity && !existing_affinity && !existing_anti_affinity) {
                continue;
            }

            auto placed_on = task_lister_.placement(uid).value_or(state.name());
            auto existing_node = node_info_.node_info(placed_on);
            if (!existing_node) continue;  // placed outside the indexed nodes

            if (affinity) {
                auto r = counts.process_terms(affinity->preferred, task, existing, *existing_node, 1);
                if (!r) return r.error();
            }
            if (anti_affinity) {
                auto r = counts.process_terms(anti_affinity->preferred, task, existing, *existing_node, -1);
                if (!r) return r.error();
            }
            if (existing_affinity) {
                if (hard_affinity_weight_ > 0) {
                    for (const auto& term : existing_affinity->required) {
                        auto r = counts.process_term(term, existing, task, *existing_node,
                                                     static_cast<double>(hard_affinity_weight_));
                        if (!r) return r.error();
                    }
                }
                auto r = counts.process_terms(existing_affinity->preferred, existing, task, *existing_node, 1);
                if (!r) return r.error();
            }
            if (existing_anti_affinity) {
                auto r = counts.process_terms(existing_anti_affinity->preferred, existing, task, *existing_node, -1);
                if (!r) return r.error();
            }
        }
    }

    return counts.normalize();
}

int64_t host_score(const HostPriorityList& list, const NodeId& host) noexcept {
    for (const auto& entry : list) {
        if (entry.host == host) return entry.score;
    }
    return 0;
}

}  // namespace node_order
