/**
 * @file session.hpp
 * @brief One scheduling round: cluster snapshot, plugins, events and scoring.
 * @author Dimitris Kafetzis
 *
 * The session owns the authoritative placement state. Plugins attach to it
 * in on_session_open by registering node-order functions (scoring) and
 * event handlers (placement changes). Scoring may run on several worker
 * threads while allocate/deallocate for other tasks interleave; events are
 * dispatched one at a time, in the order they happened.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/thread_pool.hpp"
#include "framework/event.hpp"
#include "framework/node_info.hpp"
#include "framework/plugin.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <vector>

namespace node_order {

using NodeOrderFn = std::function<Result<double>(const Task&, const NodeInfo&)>;

/**
 * @brief Outcome of scoring one candidate node; errors stay per node.
 */
struct NodeScore {
    NodeId node;
    Result<double> score;
};

class Session {
public:
    explicit Session(Logger& logger, size_t worker_threads = 0);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // ── Cluster snapshot ─────────────────────
    /// Only before open().
    Result<void> add_node(Node node);
    /// A task with `assigned_node` set is bound immediately; only before open().
    /// Unbound tasks may be added at any time.
    Result<void> add_task(Task task);

    // ── Lifecycle ────────────────────────────
    void open(std::vector<std::unique_ptr<IPlugin>> plugins);
    void close();
    [[nodiscard]] bool is_open() const noexcept { return open_; }

    // ── Plugin registration (from on_session_open) ──
    void add_event_handler(EventHandler handler);
    void add_node_order_fn(std::string plugin_name, NodeOrderFn fn);

    // ── Placement ────────────────────────────
    Result<void> allocate(const TaskId& task, const NodeId& node);
    Result<void> deallocate(const TaskId& task);

    // ── Scoring ──────────────────────────────
    /// Sum of every registered node-order function; the first error wins.
    [[nodiscard]] Result<double> node_order(const TaskId& task, const NodeId& node) const;

    /**
     * @brief Score every candidate concurrently on the worker pool.
     *
     * Sorted by score descending, ties by node name, failures last. Once
     * `stop` is requested, calls that have not started report an error.
     */
    [[nodiscard]] std::vector<NodeScore> prioritize_nodes(const TaskId& task,
                                                          const std::vector<NodeId>& candidates,
                                                          std::stop_token stop = {});
    [[nodiscard]] std::vector<NodeScore> prioritize_nodes(const TaskId& task,
                                                          std::stop_token stop = {});
    [[nodiscard]] Result<NodeId> best_node(const TaskId& task);

    // ── Queries ──────────────────────────────
    [[nodiscard]] std::vector<NodeId> node_names() const;
    [[nodiscard]] std::vector<NodeInfo> nodes() const;
    [[nodiscard]] std::optional<NodeInfo> node(const NodeId& name) const;
    [[nodiscard]] std::vector<Task> tasks() const;
    [[nodiscard]] std::optional<Task> task(const TaskId& uid) const;

    [[nodiscard]] Logger& logger() noexcept { return logger_; }

private:
    struct RegisteredOrderFn {
        std::string plugin_name;
        NodeOrderFn fn;
    };

    void dispatch(const Event& event);

    Logger& logger_;
    bool open_ = false;

    std::vector<std::unique_ptr<IPlugin>> plugins_;
    std::vector<EventHandler> event_handlers_;
    std::vector<RegisteredOrderFn> node_order_fns_;

    std::mutex event_mutex_;                  ///< Serializes allocate/deallocate
    mutable std::shared_mutex state_mutex_;   ///< Guards the maps below
    std::vector<NodeId> node_names_;          ///< Insertion order
    std::unordered_map<NodeId, NodeInfo> nodes_;
    std::unordered_map<TaskId, Task> tasks_;

    ThreadPool pool_;
};

}  // namespace node_order
