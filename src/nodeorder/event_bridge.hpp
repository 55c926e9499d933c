/**
 * @file event_bridge.hpp
 * @brief Applies session allocate/deallocate events to the NodeStateIndex.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "framework/event.hpp"
#include "nodeorder/listers.hpp"
#include "nodeorder/node_state_index.hpp"

#include <atomic>
#include <cstddef>

namespace node_order {

/**
 * @brief Stateful subscriber keeping task placement and node usage in sync.
 *
 * Events naming a node the index does not know are logged and dropped
 * without touching the task lister or the index; the session owns which
 * nodes exist, so this is never escalated to an error.
 */
class EventBridge {
public:
    EventBridge(NodeStateIndex& index, TaskLister& task_lister, Logger& logger);

    void on_allocate(const Event& event);
    void on_deallocate(const Event& event);

    /// Dispatch on `event.type`.
    void handle(const Event& event);

    /// Events that reached the index.
    [[nodiscard]] size_t applied_count() const noexcept { return applied_; }
    /// Events dropped because the node was unknown.
    [[nodiscard]] size_t dropped_count() const noexcept { return dropped_; }

private:
    NodeStateIndex& index_;
    TaskLister& task_lister_;
    Logger& logger_;
    std::atomic<size_t> applied_{0};
    std::atomic<size_t> dropped_{0};
};

}  // namespace node_order
