/**
 * @file cluster_generator.hpp
 * @brief Synthetic clusters and task sets for testing and benchmarking.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"

#include <random>
#include <string>
#include <vector>

namespace node_order {

inline constexpr std::string_view kZoneLabel = "topology.kubernetes.io/zone";
inline constexpr std::string_view kDiskTypeLabel = "disktype";

/**
 * @brief Factory for synthetic nodes and tasks with realistic labels.
 */
class ClusterGenerator {
public:
    /// `count` identical nodes "node-0".."node-{n-1}", spread round-robin
    /// over `zones` zones, alternating ssd/hdd disks.
    static std::vector<Node> uniform_nodes(size_t count, Resources allocatable, size_t zones = 1);

    /// `replicas` unbound tasks labelled app=<app>, team=<team>. With
    /// `spread`, every replica prefers (weight 100) not to share a host
    /// with another replica of the same app.
    static std::vector<Task> replicated_tasks(const std::string& app,
                                              const std::string& team,
                                              size_t replicas,
                                              Resources request,
                                              bool spread = false);

    /// Tasks with requests drawn uniformly from [min_request, max_request].
    static std::vector<Task> random_tasks(size_t count,
                                          Resources min_request,
                                          Resources max_request,
                                          std::mt19937& rng);

    /// Preferred node-affinity term on `key In values`.
    static PreferredSchedulingTerm prefer_node_label(int32_t weight,
                                                     std::string key,
                                                     std::vector<std::string> values);
};

}  // namespace node_order
