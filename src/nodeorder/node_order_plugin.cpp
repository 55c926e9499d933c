/**
 * @file node_order_plugin.cpp
 * @brief NodeOrderPlugin implementation.
 * @author Dimitris Kafetzis
 */

#include "nodeorder/node_order_plugin.hpp"

#include "framework/session.hpp"

#include <string>

namespace node_order {

/**
 * @brief Everything the plugin owns for the lifetime of one session.
 *
 * Member order matters: the scorer and the bridge reference the index and
 * the task lister, so those are built first and destroyed last.
 */
struct NodeOrderPlugin::SessionState {
    SessionState(const Arguments& arguments, Session& session)
        : weights(calculate_weights(arguments, session.logger()))
        , task_lister(session.tasks())
        , index(session.nodes(), session.logger())
        , scorer(weights, index, task_lister, session.logger())
        , bridge(index, task_lister, session.logger()) {}

    PriorityWeights weights;
    TaskLister task_lister;
    NodeStateIndex index;
    CompositeScorer scorer;
    EventBridge bridge;
};

NodeOrderPlugin::NodeOrderPlugin(Arguments arguments)
    : arguments_(std::move(arguments)) {}

NodeOrderPlugin::~NodeOrderPlugin() = default;

std::unique_ptr<IPlugin> NodeOrderPlugin::create(const Arguments& arguments) {
    return std::make_unique<NodeOrderPlugin>(arguments);
}

void NodeOrderPlugin::on_session_open(Session& session) {
    state_ = std::make_unique<SessionState>(arguments_, session);
    session.logger().info("node order weights: " + state_->weights.to_string());

    EventBridge& bridge = state_->bridge;
    session.add_event_handler(EventHandler{
        .allocate_func = [&bridge](const Event& event) { bridge.on_allocate(event); },
        .deallocate_func = [&bridge](const Event& event) { bridge.on_deallocate(event); }
    });

    const CompositeScorer& scorer = state_->scorer;
    session.add_node_order_fn(std::string{name()},
        [&scorer](const Task& task, const NodeInfo& node) { return scorer.score(task, node); });
}

void NodeOrderPlugin::on_session_close(Session& /*session*/) {
    state_.reset();
}

const NodeStateIndex* NodeOrderPlugin::index() const noexcept {
    return state_ ? &state_->index : nullptr;
}

const CompositeScorer* NodeOrderPlugin::scorer() const noexcept {
    return state_ ? &state_->scorer : nullptr;
}

const EventBridge* NodeOrderPlugin::bridge() const noexcept {
    return state_ ? &state_->bridge : nullptr;
}

bool register_node_order_plugin(PluginRegistry& registry) {
    return registry.register_builder(std::string{kNodeOrderPluginName}, &NodeOrderPlugin::create);
}

}  // namespace node_order
