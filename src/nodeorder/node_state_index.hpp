/**
 * @file node_state_index.hpp
 * @brief Per-session node → {node, bound tasks, aggregate usage} index.
 * @author Dimitris Kafetzis
 *
 * Built once from the session's node snapshot at open and kept in sync by
 * the EventBridge. Readers always receive copies, so a scoring call never
 * holds a lock while it computes and can be abandoned at any point.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "framework/node_info.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace node_order {

/**
 * @brief State of one node as seen by the priorities.
 *
 * Invariant: `requested` is the sum of the requests of `tasks`, and
 * `non_zero_requested` the sum of their non-zero requests.
 */
struct NodeState {
    std::shared_ptr<const Node> node;      ///< Null when the node is unknown
    std::map<TaskId, Task> tasks;
    Resources requested;
    Resources non_zero_requested;

    /// State of a node from the session's view of it.
    [[nodiscard]] static NodeState from(const NodeInfo& info);

    [[nodiscard]] NodeId name() const { return node ? node->name : NodeId{}; }

    /// Adds or replaces `task`.
    void add_task(const Task& task);
    bool remove_task(const TaskId& uid);
};

/**
 * @brief Consistent copy of every entry, in node-list order.
 */
struct ClusterSnapshot {
    uint64_t generation{0};
    std::vector<NodeState> nodes;
};

class NodeStateIndex {
public:
    NodeStateIndex(const std::vector<NodeInfo>& nodes, Logger& logger);

    NodeStateIndex(const NodeStateIndex&) = delete;
    NodeStateIndex& operator=(const NodeStateIndex&) = delete;

    // ── Reads (shared lock, copies out) ──────
    [[nodiscard]] std::optional<NodeState> lookup(const NodeId& name) const;
    [[nodiscard]] ClusterSnapshot snapshot() const;
    [[nodiscard]] bool contains(const NodeId& name) const;

    // ── Writes (exclusive lock) ──────────────
    /// False, with a warning, when `name` is not indexed.
    bool bind(const Task& task, const NodeId& name);
    /// False, with a warning, when `name` is not indexed or the task is not on it.
    bool unbind(const Task& task, const NodeId& name);

    // ── Node list (fixed at construction) ────
    [[nodiscard]] const std::vector<NodeId>& node_names() const noexcept { return order_; }
    [[nodiscard]] std::vector<Node> node_list() const;
    [[nodiscard]] std::shared_ptr<const Node> find_node(const NodeId& name) const;
    [[nodiscard]] size_t size() const noexcept { return order_.size(); }

    /// Incremented by every successful bind/unbind.
    [[nodiscard]] uint64_t generation() const noexcept { return generation_.load(); }

private:
    Logger& logger_;
    std::vector<NodeId> order_;
    std::unordered_map<NodeId, std::shared_ptr<const Node>> node_by_name_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<NodeId, NodeState> entries_;
    std::atomic<uint64_t> generation_{0};
};

}  // namespace node_order
