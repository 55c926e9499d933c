/**
 * @file weights.hpp
 * @brief Per-priority weights resolved from the plugin arguments.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "framework/arguments.hpp"

#include <string>
#include <string_view>

namespace node_order {

inline constexpr std::string_view kNodeAffinityWeightKey = "nodeaffinity.weight";
inline constexpr std::string_view kTaskAffinityWeightKey = "podaffinity.weight";
inline constexpr std::string_view kLeastRequestedWeightKey = "leastrequested.weight";
inline constexpr std::string_view kBalancedResourceWeightKey = "balancedresource.weight";

/**
 * @brief Multipliers applied to each raw priority score.
 *
 * Resolved once per session and never modified afterwards. A weight of 0
 * switches the corresponding priority off.
 */
struct PriorityWeights {
    int least_requested = 1;
    int balanced_resource = 1;
    int node_affinity = 1;
    int task_affinity = 1;

    bool operator==(const PriorityWeights&) const = default;

    [[nodiscard]] std::string to_string() const;
};

/**
 * @brief Build the weights from the plugin arguments.
 *
 * Expected configuration, e.g.:
 *
 *     [[tiers.plugins]]
 *     name = "nodeorder"
 *     [tiers.plugins.arguments]
 *     "nodeaffinity.weight" = 2
 *     "podaffinity.weight" = 2
 *     "leastrequested.weight" = 2
 *     "balancedresource.weight" = 2
 *
 * Missing keys keep the default of 1. Unparseable values keep the default
 * and are reported as a warning. Never fails.
 */
PriorityWeights calculate_weights(const Arguments& arguments, Logger& logger);

}  // namespace node_order
