/**
 * @file node_info.hpp
 * @brief Session-side node record: the node plus the tasks bound to it.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <map>

namespace node_order {

class NodeInfo {
public:
    explicit NodeInfo(Node node);

    [[nodiscard]] const Node& node() const noexcept { return node_; }
    [[nodiscard]] const NodeId& name() const noexcept { return node_.name; }
    [[nodiscard]] const std::map<TaskId, Task>& tasks() const noexcept { return tasks_; }

    /// Sum of the requests of every bound task.
    [[nodiscard]] const Resources& used() const noexcept { return used_; }
    [[nodiscard]] Resources idle() const noexcept;

    Result<void> add_task(const Task& task);
    Result<void> remove_task(const TaskId& uid);

private:
    Node node_;
    std::map<TaskId, Task> tasks_;
    Resources used_;
};

}  // namespace node_order
