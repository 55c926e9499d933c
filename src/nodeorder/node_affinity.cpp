/**
 * @file node_affinity.cpp
 * @brief NodeAffinity priority.
 * @author Dimitris Kafetzis
 */

#include "nodeorder/label_selector.hpp"
#include "nodeorder/priorities.hpp"

namespace node_order {

Result<int64_t> node_affinity_priority(const Task& task, const NodeState& state) {
    if (!state.node) {
        return Error{"node not found"};
    }

    int64_t count = 0;
    const auto& node_affinity = task.affinity.node_affinity;
    if (!node_affinity) return count;

    for (const auto& term : node_affinity->preferred) {
        if (term.weight == 0) continue;

        auto matched = node_selector_term_matches(term.preference, state.node->labels);
        if (!matched) {
            return matched.error().with_context("preferred node affinity term of "
                                                + task.qualified_name());
        }
        if (*matched) count += term.weight;
    }
    return count;
}

}  // namespace node_order
