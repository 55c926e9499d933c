/**
 * @file session.cpp
 * @brief Session implementation.
 * @author Dimitris Kafetzis
 */

#include "framework/session.hpp"

#include <algorithm>
#include <future>

namespace node_order {

Session::Session(Logger& logger, size_t worker_threads)
    : logger_(logger), pool_(worker_threads) {}

Session::~Session() {
    close();
}

// ─────────────────────────────────────────────
// Cluster snapshot
// ─────────────────────────────────────────────

Result<void> Session::add_node(Node node) {
    if (open_) {
        return Error{"cannot add node <" + node.name + "> to an open session"};
    }
    if (node.name.empty()) {
        return Error{"node name must not be empty"};
    }

    std::unique_lock lock(state_mutex_);
    if (nodes_.count(node.name) > 0) {
        return Error{"duplicate node <" + node.name + ">"};
    }
    node_names_.push_back(node.name);
    auto name = node.name;
    nodes_.emplace(std::move(name), NodeInfo{std::move(node)});
    return Result<void>{};
}

Result<void> Session::add_task(Task task) {
    if (task.uid.empty()) {
        return Error{"task uid must not be empty"};
    }
    if (task.is_bound() && open_) {
        return Error{"task <" + task.qualified_name()
                     + "> must be placed through allocate once the session is open"};
    }

    std::unique_lock lock(state_mutex_);
    if (tasks_.count(task.uid) > 0) {
        return Error{"duplicate task <" + task.uid + ">"};
    }

    if (task.is_bound()) {
        auto node_it = nodes_.find(task.assigned_node);
        if (node_it == nodes_.end()) {
            return Error{"task <" + task.qualified_name() + "> bound to unknown node <"
                         + task.assigned_node + ">"};
        }
        auto added = node_it->second.add_task(task);
        if (!added) return added.error();
    }

    auto uid = task.uid;
    tasks_.emplace(std::move(uid), std::move(task));
    return Result<void>{};
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

void Session::open(std::vector<std::unique_ptr<IPlugin>> plugins) {
    if (open_) {
        logger_.warn("session already open, ignoring second open");
        return;
    }

    plugins_ = std::move(plugins);
    open_ = true;

    for (auto& plugin : plugins_) {
        plugin->on_session_open(*this);
        logger_.debug("plugin <" + std::string{plugin->name()} + "> opened");
    }

    logger_.info("session opened: nodes=" + std::to_string(node_names_.size())
                 + " tasks=" + std::to_string(tasks_.size())
                 + " plugins=" + std::to_string(plugins_.size()));
}

void Session::close() {
    if (!open_) return;

    for (auto& plugin : plugins_) {
        plugin->on_session_close(*this);
    }
    node_order_fns_.clear();
    event_handlers_.clear();
    plugins_.clear();
    open_ = false;

    logger_.info("session closed");
}

void Session::add_event_handler(EventHandler handler) {
    event_handlers_.push_back(std::move(handler));
}

void Session::add_node_order_fn(std::string plugin_name, NodeOrderFn fn) {
    node_order_fns_.push_back({std::move(plugin_name), std::move(fn)});
}

// ─────────────────────────────────────────────
// Placement
// ─────────────────────────────────────────────

Result<void> Session::allocate(const TaskId& uid, const NodeId& node_name) {
    std::lock_guard events(event_mutex_);

    Event event{.type = EventType::Allocate, .task = {}, .node = node_name};
    {
        std::unique_lock lock(state_mutex_);
        auto task_it = tasks_.find(uid);
        if (task_it == tasks_.end()) {
            return Error{"unknown task <" + uid + ">"};
        }
        auto& task = task_it->second;
        if (task.is_bound()) {
            return Error{"task <" + task.qualified_name() + "> already allocated to <"
                         + task.assigned_node + ">"};
        }

        auto node_it = nodes_.find(node_name);
        if (node_it == nodes_.end()) {
            return Error{"unknown node <" + node_name + ">"};
        }

        task.assigned_node = node_name;
        auto added = node_it->second.add_task(task);
        if (!added) {
            task.assigned_node.clear();
            return added.error();
        }
        event.task = task;
    }

    dispatch(event);
    return Result<void>{};
}

Result<void> Session::deallocate(const TaskId& uid) {
    std::lock_guard events(event_mutex_);

    Event event{.type = EventType::Deallocate, .task = {}, .node = {}};
    {
        std::unique_lock lock(state_mutex_);
        auto task_it = tasks_.find(uid);
        if (task_it == tasks_.end()) {
            return Error{"unknown task <" + uid + ">"};
        }
        auto& task = task_it->second;
        if (!task.is_bound()) {
            return Error{"task <" + task.qualified_name() + "> is not allocated"};
        }

        auto node_it = nodes_.find(task.assigned_node);
        if (node_it != nodes_.end()) {
            auto removed = node_it->second.remove_task(uid);
            if (!removed) return removed.error();
        }

        event.task = task;
        event.node = task.assigned_node;
        task.assigned_node.clear();
    }

    dispatch(event);
    return Result<void>{};
}

void Session::dispatch(const Event& event) {
    logger_.debug("dispatch " + std::string{to_string(event.type)} + " event for "
                  + event.task.qualified_name() + " to "
                  + std::to_string(event_handlers_.size()) + " handler(s)");
    for (const auto& handler : event_handlers_) {
        const auto& fn = event.type == EventType::Allocate
            ? handler.allocate_func
            : handler.deallocate_func;
        if (fn) fn(event);
    }
}

// ─────────────────────────────────────────────
// Scoring
// ─────────────────────────────────────────────

Result<double> Session::node_order(const TaskId& uid, const NodeId& node_name) const {
    std::optional<Task> task;
    std::optional<NodeInfo> info;
    {
        std::shared_lock lock(state_mutex_);
        if (auto it = tasks_.find(uid); it != tasks_.end()) task = it->second;
        if (auto it = nodes_.find(node_name); it != nodes_.end()) info = it->second;
    }
    if (!task) return Error{"unknown task <" + uid + ">"};
    if (!info) return Error{"unknown node <" + node_name + ">"};

    double total = 0.0;
    for (const auto& registered : node_order_fns_) {
        auto score = registered.fn(*task, *info);
        if (!score) {
            return score.error().with_context(registered.plugin_name);
        }
        total += *score;
    }
    return total;
}

std::vector<NodeScore> Session::prioritize_nodes(const TaskId& uid,
                                                 const std::vector<NodeId>& candidates,
                                                 std::stop_token stop) {
    std::vector<std::future<Result<double>>> futures;
    futures.reserve(candidates.size());

    for (const auto& candidate : candidates) {
        futures.push_back(pool_.submit_cancellable(
            [this, uid, candidate, stop](std::stop_token worker_stop) -> Result<double> {
                if (stop.stop_requested() || worker_stop.stop_requested()) {
                    return Error{"scoring pass aborted"};
                }
                return node_order(uid, candidate);
            }));
    }

    std::vector<NodeScore> scores;
    scores.reserve(candidates.size());
    for (size_t i = 0; i < candidates.size(); ++i) {
        scores.push_back(NodeScore{candidates[i], futures[i].get()});
    }

    std::stable_sort(scores.begin(), scores.end(),
        [](const NodeScore& a, const NodeScore& b) {
            if (a.score.has_value() != b.score.has_value()) {
                return a.score.has_value();
            }
            if (a.score.has_value() && *a.score != *b.score) {
                return *a.score > *b.score;
            }
            return a.node < b.node;
        });
    return scores;
}

std::vector<NodeScore> Session::prioritize_nodes(const TaskId& uid, std::stop_token stop) {
    return prioritize_nodes(uid, node_names(), std::move(stop));
}

Result<NodeId> Session::best_node(const TaskId& uid) {
    auto scores = prioritize_nodes(uid);
    for (const auto& entry : scores) {
        if (entry.score.has_value()) return entry.node;
        logger_.warn("node <" + entry.node + "> unscored for task <" + uid + ">: "
                     + entry.score.error().message);
    }
    return Error{"no node could be scored for task <" + uid + ">"};
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

std::vector<NodeId> Session::node_names() const {
    std::shared_lock lock(state_mutex_);
    return node_names_;
}

std::vector<NodeInfo> Session::nodes() const {
    std::shared_lock lock(state_mutex_);
    std::vector<NodeInfo> result;
    result.reserve(node_names_.size());
    for (const auto& name : node_names_) {
        result.push_back(nodes_.at(name));
    }
    return result;
}

std::optional<NodeInfo> Session::node(const NodeId& name) const {
    std::shared_lock lock(state_mutex_);
    auto it = nodes_.find(name);
    if (it == nodes_.end()) return std::nullopt;
    return it->second;
}

std::vector<Task> Session::tasks() const {
    std::shared_lock lock(state_mutex_);
    std::vector<Task> result;
    result.reserve(tasks_.size());
    for (const auto& [uid, task] : tasks_) {
        result.push_back(task);
    }
    std::sort(result.begin(), result.end(),
              [](const Task& a, const Task& b) { return a.uid < b.uid; });
    return result;
}

std::optional<Task> Session::task(const TaskId& uid) const {
    std::shared_lock lock(state_mutex_);
    auto it = tasks_.find(uid);
    if (it == tasks_.end()) return std::nullopt;
    return it->second;
}

}  // namespace node_order
