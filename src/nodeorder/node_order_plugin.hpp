/**
 * @file node_order_plugin.hpp
 * @brief The "nodeorder" session plugin.
 * @author Dimitris Kafetzis
 *
 * On session open it resolves the weights, builds the NodeStateIndex from
 * the session's nodes, subscribes an EventBridge to placement events and
 * registers a CompositeScorer as the session's node-order function. All of
 * it is discarded on session close.
 */

#pragma once

#include "framework/arguments.hpp"
#include "framework/plugin.hpp"
#include "nodeorder/composite_scorer.hpp"
#include "nodeorder/event_bridge.hpp"
#include "nodeorder/listers.hpp"
#include "nodeorder/node_state_index.hpp"
#include "nodeorder/weights.hpp"

#include <memory>
#include <string_view>

namespace node_order {

inline constexpr std::string_view kNodeOrderPluginName = "nodeorder";

class NodeOrderPlugin : public IPlugin {
public:
    explicit NodeOrderPlugin(Arguments arguments);
    ~NodeOrderPlugin() override;

    static std::unique_ptr<IPlugin> create(const Arguments& arguments);

    [[nodiscard]] std::string_view name() const noexcept override { return kNodeOrderPluginName; }
    void on_session_open(Session& session) override;
    void on_session_close(Session& session) override;

    // ── Session-scoped state (null outside a session) ──
    [[nodiscard]] const NodeStateIndex* index() const noexcept;
    [[nodiscard]] const CompositeScorer* scorer() const noexcept;
    [[nodiscard]] const EventBridge* bridge() const noexcept;

private:
    struct SessionState;

    Arguments arguments_;
    std::unique_ptr<SessionState> state_;
};

/// Register NodeOrderPlugin under kNodeOrderPluginName.
bool register_node_order_plugin(PluginRegistry& registry);

}  // namespace node_order
