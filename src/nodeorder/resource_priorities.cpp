/**
 * @file resource_priorities.cpp
 * @brief LeastRequested and BalancedResource priorities.
 * @author Dimitris Kafetzis
 *
 * Both priorities work on the node's non-zero requested resources plus the
 * incoming task's non-zero request, so tasks without explicit requests
 * still count against the node.
 */

#include "nodeorder/priorities.hpp"

#include <cmath>

namespace node_order {

namespace {

int64_t least_requested_score(int64_t requested, int64_t capacity) noexcept {
    if (capacity == 0) return 0;
    if (requested > capacity) return 0;
    return ((capacity - requested) * kMaxPriority) / capacity;
}

double fraction_of_capacity(int64_t requested, int64_t capacity) noexcept {
    if (capacity == 0) return 1.0;
    return static_cast<double>(requested) / static_cast<double>(capacity);
}

Resources requested_after_placement(const Task& task, const NodeState& state) noexcept {
    return state.non_zero_requested + task.request.non_zero();
}

}  // anonymous namespace

Result<int64_t> least_requested_priority(const Task& task, const NodeState& state) {
    if (!state.node) {
        return Error{"node not found"};
    }

    const auto requested = requested_after_placement(task, state);
    const auto& allocatable = state.node->allocatable;

    return (least_requested_score(requested.milli_cpu, allocatable.milli_cpu)
            + least_requested_score(requested.memory_bytes, allocatable.memory_bytes)) / 2;
}

Result<int64_t> balanced_resource_priority(const Task& task, const NodeState& state) {
    if (!state.node) {
        return Error{"node not found"};
    }

    const auto requested = requested_after_placement(task, state);
    const auto& allocatable = state.node->allocatable;

    double cpu_fraction = fraction_of_capacity(requested.milli_cpu, allocatable.milli_cpu);
    double memory_fraction = fraction_of_capacity(requested.memory_bytes, allocatable.memory_bytes);

    // Over-committed in either dimension: the node is not a balanced choice.
    if (cpu_fraction >= 1.0 || memory_fraction >= 1.0) {
        return int64_t{0};
    }

    double diff = std::abs(cpu_fraction - memory_fraction);
    return static_cast<int64_t>((1.0 - diff) * static_cast<double>(kMaxPriority));
}

}  // namespace node_order
