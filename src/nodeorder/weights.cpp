/**
 * @file weights.cpp
 * @brief Weight resolution.
 * @author Dimitris Kafetzis
 */

#include "nodeorder/weights.hpp"

namespace node_order {

std::string PriorityWeights::to_string() const {
    return "leastrequested=" + std::to_string(least_requested)
         + " balancedresource=" + std::to_string(balanced_resource)
         + " nodeaffinity=" + std::to_string(node_affinity)
         + " podaffinity=" + std::to_string(task_affinity);
}

PriorityWeights calculate_weights(const Arguments& arguments, Logger& logger) {
    PriorityWeights weights;

    arguments.get_int(weights.node_affinity, kNodeAffinityWeightKey, logger);
    arguments.get_int(weights.task_affinity, kTaskAffinityWeightKey, logger);
    arguments.get_int(weights.least_requested, kLeastRequestedWeightKey, logger);
    arguments.get_int(weights.balanced_resource, kBalancedResourceWeightKey, logger);

    return weights;
}

}  // namespace node_order
