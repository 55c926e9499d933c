/**
 * @file listers.cpp
 * @brief TaskLister implementation.
 * @author Dimitris Kafetzis
 */

#include "nodeorder/listers.hpp"

namespace node_order {

TaskLister::TaskLister(const std::vector<Task>& tasks) {
    for (const auto& task : tasks) {
        tasks_.emplace(task.uid, task);
    }
}

Task TaskLister::update_task(const Task& task, const NodeId& node) {
    std::unique_lock lock(mutex_);
    auto& stored = tasks_[task.uid];
    stored = task;
    stored.assigned_node = node;
    return stored;
}

std::optional<NodeId> TaskLister::placement(const TaskId& uid) const {
    std::shared_lock lock(mutex_);
    auto it = tasks_.find(uid);
    if (it == tasks_.end() || it->second.assigned_node.empty()) return std::nullopt;
    return it->second.assigned_node;
}

}  // namespace node_order
