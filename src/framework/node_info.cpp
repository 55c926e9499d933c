/**
 * @file node_info.cpp
 * @brief NodeInfo implementation.
 * @author Dimitris Kafetzis
 */

#include "framework/node_info.hpp"

namespace node_order {

NodeInfo::NodeInfo(Node node) : node_(std::move(node)) {}

Resources NodeInfo::idle() const noexcept {
    Resources idle = node_.allocatable;
    idle -= used_;
    return idle;
}

Result<void> NodeInfo::add_task(const Task& task) {
    auto [it, inserted] = tasks_.emplace(task.uid, task);
    if (!inserted) {
        return Error{"task <" + task.qualified_name() + "> already on node <" + node_.name + ">"};
    }
    it->second.assigned_node = node_.name;
    used_ += task.request;
    return Result<void>{};
}

Result<void> NodeInfo::remove_task(const TaskId& uid) {
    auto it = tasks_.find(uid);
    if (it == tasks_.end()) {
        return Error{"task <" + uid + "> not found on node <" + node_.name + ">"};
    }
    used_ -= it->second.request;
    tasks_.erase(it);
    return Result<void>{};
}

}  // namespace node_order
