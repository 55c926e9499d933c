/**
 * @file cluster_generator.cpp
 * @brief Synthetic cluster generator.
 * @author Dimitris Kafetzis
 */

#include "workload/cluster_generator.hpp"

namespace node_order {

// ─────────────────────────────────────────────
// Nodes
// ─────────────────────────────────────────────

std::vector<Node> ClusterGenerator::uniform_nodes(size_t count, Resources allocatable, size_t zones) {
    if (zones == 0) zones = 1;

    std::vector<Node> nodes;
    nodes.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        auto name = "node-" + std::to_string(i);
        nodes.push_back(Node{
            .name = name,
            .labels = {
                {std::string{kHostnameLabel}, name},
                {std::string{kZoneLabel}, "zone-" + std::to_string(i % zones)},
                {std::string{kDiskTypeLabel}, i % 2 == 0 ? "ssd" : "hdd"}
            },
            .allocatable = allocatable
        });
    }
    return nodes;
}

// ─────────────────────────────────────────────
// Tasks
// ─────────────────────────────────────────────

std::vector<Task> ClusterGenerator::replicated_tasks(const std::string& app,
                                                     const std::string& team,
                                                     size_t replicas,
                                                     Resources request,
                                                     bool spread) {
    std::vector<Task> tasks;
    tasks.reserve(replicas);
    for (size_t i = 0; i < replicas; ++i) {
        Task task{
            .uid = app + "-" + std::to_string(i),
            .name = app + "-" + std::to_string(i),
            .namespace_name = "default",
            .labels = {{"app", app}, {"team", team}},
            .request = request,
            .affinity = {},
            .assigned_node = {}
        };
        if (spread) {
            task.affinity.task_anti_affinity = TaskAffinity{
                .required = {},
                .preferred = {WeightedTaskAffinityTerm{
                    .weight = 100,
                    .term = TaskAffinityTerm{
                        .selector = LabelSelector{.match_labels = {{"app", app}},
                                                  .match_expressions = {}},
                        .namespaces = {},
                        .topology_key = std::string{kHostnameLabel}
                    }
                }}
            };
        }
        tasks.push_back(std::move(task));
    }
    return tasks;
}

std::vector<Task> ClusterGenerator::random_tasks(size_t count,
                                                 Resources min_request,
                                                 Resources max_request,
                                                 std::mt19937& rng) {
    std::uniform_int_distribution<int64_t> cpu(min_request.milli_cpu, max_request.milli_cpu);
    std::uniform_int_distribution<int64_t> memory(min_request.memory_bytes, max_request.memory_bytes);

    std::vector<Task> tasks;
    tasks.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        auto id = "rand-" + std::to_string(i);
        tasks.push_back(Task{
            .uid = id,
            .name = id,
            .namespace_name = "default",
            .labels = {{"app", "rand"}},
            .request = Resources{.milli_cpu = cpu(rng), .memory_bytes = memory(rng)},
            .affinity = {},
            .assigned_node = {}
        });
    }
    return tasks;
}

PreferredSchedulingTerm ClusterGenerator::prefer_node_label(int32_t weight,
                                                            std::string key,
                                                            std::vector<std::string> values) {
    return PreferredSchedulingTerm{
        .weight = weight,
        .preference = NodeSelectorTerm{.match_expressions = {
            SelectorRequirement{.key = std::move(key),
                                .op = SelectorOperator::In,
                                .values = std::move(values)}
        }}
    };
}

}  // namespace node_order
