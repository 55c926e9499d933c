/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for NodeOrder interfaces.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <concepts>
#include <cstdint>

namespace node_order {

// Forward declarations
struct NodeState;

/**
 * @concept NodeStatePriority
 * @brief A pure function scoring one task against one node's state.
 */
template <typename F>
concept NodeStatePriority = requires(F fn, const Task& task, const NodeState& state) {
    { fn(task, state) } -> std::same_as<Result<int64_t>>;
};

}  // namespace node_order
