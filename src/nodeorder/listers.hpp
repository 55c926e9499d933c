/**
 * @file listers.hpp
 * @brief Read-only collaborator interfaces consumed by the priorities.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"
#include "nodeorder/node_state_index.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace node_order {

// ─────────────────────────────────────────────
// Interfaces
// ─────────────────────────────────────────────

/**
 * @brief Resolves where tasks currently sit.
 */
class ITaskLister {
public:
    virtual ~ITaskLister() = default;

    /// Node the task is placed on; nullopt when unknown or unbound.
    [[nodiscard]] virtual std::optional<NodeId> placement(const TaskId& uid) const = 0;
};

/**
 * @brief Enumerates every node of the session.
 */
class INodeLister {
public:
    virtual ~INodeLister() = default;

    [[nodiscard]] virtual std::vector<Node> list() const = 0;
};

/**
 * @brief Node lookup by name (labels and capacity).
 */
class INodeInfoProvider {
public:
    virtual ~INodeInfoProvider() = default;

    [[nodiscard]] virtual std::shared_ptr<const Node> node_info(const NodeId& name) const = 0;
};

// ─────────────────────────────────────────────
// Implementations
// ─────────────────────────────────────────────

/**
 * @brief Task placement table updated by the EventBridge.
 */
class TaskLister : public ITaskLister {
public:
    explicit TaskLister(const std::vector<Task>& tasks);

    /// Record `task` as placed on `node` (empty = unbound) and return the stored copy.
    Task update_task(const Task& task, const NodeId& node);

    [[nodiscard]] std::optional<NodeId> placement(const TaskId& uid) const override;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<TaskId, Task> tasks_;
};

/**
 * @brief Node lister and node lookup over the session's NodeStateIndex.
 */
class IndexNodeLister : public INodeLister, public INodeInfoProvider {
public:
    explicit IndexNodeLister(const NodeStateIndex& index) : index_(index) {}

    [[nodiscard]] std::vector<Node> list() const override { return index_.node_list(); }
    [[nodiscard]] std::shared_ptr<const Node> node_info(const NodeId& name) const override {
        return index_.find_node(name);
    }

private:
    const NodeStateIndex& index_;
};

}  // namespace node_order
