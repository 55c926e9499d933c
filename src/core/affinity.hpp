/**
 * @file affinity.hpp
 * @brief Label selectors and affinity/anti-affinity rule types.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace node_order {

using Labels = std::map<std::string, std::string>;

// ─────────────────────────────────────────────
// Selector Requirements
// ─────────────────────────────────────────────

enum class SelectorOperator : uint8_t {
    In,
    NotIn,
    Exists,
    DoesNotExist,
    Gt,            ///< Node selectors only
    Lt             ///< Node selectors only
};

[[nodiscard]] constexpr std::string_view to_string(SelectorOperator op) noexcept {
    switch (op) {
        case SelectorOperator::In:           return "In";
        case SelectorOperator::NotIn:        return "NotIn";
        case SelectorOperator::Exists:       return "Exists";
        case SelectorOperator::DoesNotExist: return "DoesNotExist";
        case SelectorOperator::Gt:           return "Gt";
        case SelectorOperator::Lt:           return "Lt";
    }
    return "unknown";
}

struct SelectorRequirement {
    std::string key;
    SelectorOperator op = SelectorOperator::In;
    std::vector<std::string> values;

    bool operator==(const SelectorRequirement&) const = default;
};

/**
 * @brief Selects tasks by label. An empty selector selects everything.
 */
struct LabelSelector {
    Labels match_labels;
    std::vector<SelectorRequirement> match_expressions;

    bool operator==(const LabelSelector&) const = default;
};

// ─────────────────────────────────────────────
// Node Affinity
// ─────────────────────────────────────────────

/// ANDed requirements; a term without requirements matches no node.
struct NodeSelectorTerm {
    std::vector<SelectorRequirement> match_expressions;
};

struct PreferredSchedulingTerm {
    int32_t weight{0};
    NodeSelectorTerm preference;
};

struct NodeAffinity {
    std::vector<NodeSelectorTerm> required;          ///< ORed; enforced upstream
    std::vector<PreferredSchedulingTerm> preferred;
};

// ─────────────────────────────────────────────
// Inter-Task Affinity
// ─────────────────────────────────────────────

/**
 * @brief Co-location rule relative to tasks matched by `selector`.
 *
 * An absent selector matches no task. An empty namespace list means the
 * namespace of the task that owns the term. An empty topology key means
 * "the same node".
 */
struct TaskAffinityTerm {
    std::optional<LabelSelector> selector;
    std::vector<std::string> namespaces;
    std::string topology_key;

    bool operator==(const TaskAffinityTerm&) const = default;
};

struct WeightedTaskAffinityTerm {
    int32_t weight{0};
    TaskAffinityTerm term;

    bool operator==(const WeightedTaskAffinityTerm&) const = default;
};

struct TaskAffinity {
    std::vector<TaskAffinityTerm> required;
    std::vector<WeightedTaskAffinityTerm> preferred;

    bool operator==(const TaskAffinity&) const = default;
};

struct Affinity {
    std::optional<NodeAffinity> node_affinity;
    std::optional<TaskAffinity> task_affinity;
    std::optional<TaskAffinity> task_anti_affinity;
};

}  // namespace node_order
