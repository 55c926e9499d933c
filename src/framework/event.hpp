/**
 * @file event.hpp
 * @brief Session lifecycle events and their handler pair.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <functional>
#include <string_view>

namespace node_order {

enum class EventType : uint8_t {
    Allocate,      ///< Task tentatively placed on `node`
    Deallocate     ///< Task removed from `node`
};

[[nodiscard]] constexpr std::string_view to_string(EventType type) noexcept {
    switch (type) {
        case EventType::Allocate:   return "allocate";
        case EventType::Deallocate: return "deallocate";
    }
    return "unknown";
}

/**
 * @brief One placement change emitted by the session.
 *
 * For Deallocate, `task.assigned_node` still names the node being left.
 */
struct Event {
    EventType type;
    Task task;
    NodeId node;
};

struct EventHandler {
    std::function<void(const Event&)> allocate_func;
    std::function<void(const Event&)> deallocate_func;
};

}  // namespace node_order
