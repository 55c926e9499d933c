/**
 * @file event_bridge.cpp
 * @brief EventBridge implementation.
 * @author Dimitris Kafetzis
 */

#include "nodeorder/event_bridge.hpp"

namespace node_order {

EventBridge::EventBridge(NodeStateIndex& index, TaskLister& task_lister, Logger& logger)
    : index_(index), task_lister_(task_lister), logger_(logger) {}

void EventBridge::on_allocate(const Event& event) {
    const auto& node_name = event.node;
    if (!index_.contains(node_name)) {
        logger_.warn("node order, update task " + event.task.qualified_name()
                     + " allocate to NOT EXIST node [" + node_name + "]");
        ++dropped_;
        return;
    }

    Task task = task_lister_.update_task(event.task, node_name);

    if (index_.bind(task, node_name)) {
        ++applied_;
        logger_.debug("node order, update task " + task.qualified_name()
                      + " allocate to node [" + node_name + "]");
    } else {
        ++dropped_;
    }
}

void EventBridge::on_deallocate(const Event& event) {
    const auto node_name = event.node.empty() ? event.task.assigned_node : event.node;
    if (!index_.contains(node_name)) {
        logger_.warn("node order, update task " + event.task.qualified_name()
                     + " deallocate from NOT EXIST node [" + node_name + "]");
        ++dropped_;
        return;
    }

    Task task = task_lister_.update_task(event.task, "");

    if (index_.unbind(task, node_name)) {
        ++applied_;
        logger_.debug("node order, update task " + task.qualified_name()
                      + " deallocate from node [" + node_name + "]");
    } else {
        ++dropped_;
    }
}

void EventBridge::handle(const Event& event) {
    switch (event.type) {
        case EventType::Allocate:   on_allocate(event);   break;
        case EventType::Deallocate: on_deallocate(event); break;
    }
}

}  // namespace node_order
