/**
 * @file node_state_index.cpp
 * @brief NodeStateIndex implementation.
 * @author Dimitris Kafetzis
 */

#include "nodeorder/node_state_index.hpp"

#include <mutex>

namespace node_order {

// ── NodeState ────────────────────────────────

NodeState NodeState::from(const NodeInfo& info) {
    NodeState state;
    state.node = std::make_shared<const Node>(info.node());
    for (const auto& [uid, task] : info.tasks()) {
        state.add_task(task);
    }
    return state;
}

void NodeState::add_task(const Task& task) {
    remove_task(task.uid);
    auto it = tasks.emplace(task.uid, task).first;
    if (node) it->second.assigned_node = node->name;
    requested += task.request;
    non_zero_requested += task.request.non_zero();
}

bool NodeState::remove_task(const TaskId& uid) {
    auto it = tasks.find(uid);
    if (it == tasks.end()) return false;
    requested -= it->second.request;
    non_zero_requested -= it->second.request.non_zero();
    tasks.erase(it);
    return true;
}

// ── NodeStateIndex ───────────────────────────

NodeStateIndex::NodeStateIndex(const std::vector<NodeInfo>& nodes, Logger& logger)
    : logger_(logger) {
    order_.reserve(nodes.size());
    for (const auto& info : nodes) {
        if (entries_.count(info.name()) > 0) {
            logger_.warn("node order, duplicate node [" + info.name() + "] ignored");
            continue;
        }
        auto state = NodeState::from(info);
        node_by_name_.emplace(info.name(), state.node);
        order_.push_back(info.name());
        entries_.emplace(info.name(), std::move(state));
    }
}

std::optional<NodeState> NodeStateIndex::lookup(const NodeId& name) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(name);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

ClusterSnapshot NodeStateIndex::snapshot() const {
    std::shared_lock lock(mutex_);
    ClusterSnapshot snap;
    snap.generation = generation_.load();
    snap.nodes.reserve(order_.size());
    for (const auto& name : order_) {
        snap.nodes.push_back(entries_.at(name));
    }
    return snap;
}

bool NodeStateIndex::contains(const NodeId& name) const {
    return node_by_name_.count(name) > 0;
}

bool NodeStateIndex::bind(const Task& task, const NodeId& name) {
    {
        std::unique_lock lock(mutex_);
        auto it = entries_.find(name);
        if (it != entries_.end()) {
            it->second.add_task(task);
            ++generation_;
            return true;
        }
    }
    logger_.warn("node order, bind " + task.qualified_name()
                 + " to NOT EXIST node [" + name + "]");
    return false;
}

bool NodeStateIndex::unbind(const Task& task, const NodeId& name) {
    {
        std::unique_lock lock(mutex_);
        auto it = entries_.find(name);
        if (it != entries_.end()) {
            if (it->second.remove_task(task.uid)) {
                ++generation_;
                return true;
            }
            lock.unlock();
            logger_.warn("node order, unbind " + task.qualified_name()
                         + " not bound to node [" + name + "]");
            return false;
        }
    }
    logger_.warn("node order, unbind " + task.qualified_name()
                 + " from NOT EXIST node [" + name + "]");
    return false;
}

std::vector<Node> NodeStateIndex::node_list() const {
    std::vector<Node> nodes;
    nodes.reserve(order_.size());
    for (const auto& name : order_) {
        nodes.push_back(*node_by_name_.at(name));
    }
    return nodes;
}

std::shared_ptr<const Node> NodeStateIndex::find_node(const NodeId& name) const {
    auto it = node_by_name_.find(name);
    if (it == node_by_name_.end()) return nullptr;
    return it->second;
}

}  // namespace node_order
