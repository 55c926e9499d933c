/**
 * @file main.cpp
 * @brief nodeorder_demo entry point.
 * @author Dimitris Kafetzis
 *
 * Wires the modules into one scheduling session:
 *   Config → Logger → PluginRegistry → Session → prioritize / allocate → close
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "framework/plugin.hpp"
#include "framework/session.hpp"
#include "nodeorder/node_order_plugin.hpp"
#include "telemetry/json_sink.hpp"
#include "workload/cluster_generator.hpp"

#include <charconv>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

using namespace node_order;

namespace {

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║          NodeOrder demo v1.0.0            ║
  ║   Weighted node ranking for task          ║
  ║   placement                               ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

void print_usage() {
    std::cout << "Usage: nodeorder_demo [OPTIONS]\n"
              << "  --config <path>      Configuration file (default: built-in)\n"
              << "  --nodes <n>          Number of synthetic nodes (default: 4)\n"
              << "  --log-level <level>  debug | info | warn | error\n"
              << "  --help, -h           Show this help message\n";
}

struct CLIArgs {
    std::optional<std::filesystem::path> config_path;
    size_t nodes = 4;
    std::string log_level;
    bool help = false;
};

Result<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--nodes" && i + 1 < argc) {
            std::string_view text = argv[++i];
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), args.nodes);
            if (ec != std::errc{} || ptr != text.data() + text.size() || args.nodes == 0) {
                return Error{"--nodes expects a positive integer, got <" + std::string{text} + ">"};
            }
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            args.help = true;
        } else {
            return Error{"unknown option <" + arg + ">"};
        }
    }
    return args;
}

/// Two busy nodes, a team "x" already running, and a mix of pending tasks.
Result<void> populate(Session& session, size_t node_count) {
    auto nodes = ClusterGenerator::uniform_nodes(
        node_count, Resources{.milli_cpu = 4000, .memory_bytes = 8LL * 1024 * 1024 * 1024}, 2);
    for (auto& node : nodes) {
        auto added = session.add_node(std::move(node));
        if (!added) return added;
    }

    // Running workload on the first node(s).
    auto running = ClusterGenerator::replicated_tasks(
        "db", "x", node_count > 1 ? 2 : 1,
        Resources{.milli_cpu = 2000, .memory_bytes = 4LL * 1024 * 1024 * 1024});
    for (size_t i = 0; i < running.size(); ++i) {
        running[i].assigned_node = "node-" + std::to_string(i);
        auto added = session.add_task(std::move(running[i]));
        if (!added) return added;
    }

    // Pending: spread replicas that avoid team x, plus one that wants ssd.
    auto web = ClusterGenerator::replicated_tasks(
        "web", "y", 3, Resources{.milli_cpu = 500, .memory_bytes = 512LL * 1024 * 1024}, true);
    for (auto& task : web) {
        task.affinity.task_anti_affinity->preferred.push_back(WeightedTaskAffinityTerm{
            .weight = 50,
            .term = TaskAffinityTerm{
                .selector = LabelSelector{.match_labels = {{"team", "x"}}, .match_expressions = {}},
                .namespaces = {},
                .topology_key = std::string{kHostnameLabel}
            }
        });
        auto added = session.add_task(std::move(task));
        if (!added) return added;
    }

    auto cache = ClusterGenerator::replicated_tasks(
        "cache", "y", 1, Resources{.milli_cpu = 250, .memory_bytes = 1LL * 1024 * 1024 * 1024});
    cache.front().affinity.node_affinity = NodeAffinity{
        .required = {},
        .preferred = {ClusterGenerator::prefer_node_label(5, std::string{kDiskTypeLabel}, {"ssd"})}
    };
    return session.add_task(std::move(cache.front()));
}

void print_ranking(const Task& task, const std::vector<NodeScore>& scores) {
    std::cout << "  " << task.qualified_name() << '\n';
    for (const auto& entry : scores) {
        std::cout << "    " << std::left << std::setw(10) << entry.node;
        if (entry.score) {
            std::cout << std::fixed << std::setprecision(1) << *entry.score << '\n';
        } else {
            std::cout << "error: " << entry.score.error().message << '\n';
        }
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (!args) {
        std::cerr << args.error().message << std::endl;
        print_usage();
        return 2;
    }
    if (args->help) {
        print_usage();
        return 0;
    }

    print_banner();

    // Load configuration
    Config config = default_config();
    if (args->config_path) {
        auto config_result = load_config(*args->config_path);
        if (!config_result) {
            std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
            return 1;
        }
        config = std::move(*config_result);
    }
    if (!args->log_level.empty()) config.telemetry.log_level = args->log_level;

    // ── Initialize Logger ────────────────────
    auto level = parse_log_level(config.telemetry.log_level);
    if (!level) {
        std::cerr << "Unknown log level: " << config.telemetry.log_level << std::endl;
        return 1;
    }
    std::unique_ptr<ILogSink> log_sink;
    if (config.telemetry.log_to_file) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "nodeorder");
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }
    Logger logger(std::move(log_sink), *level);

    // ── Plugins ──────────────────────────────
    PluginRegistry registry;
    register_node_order_plugin(registry);
    auto plugins = build_plugins(config, registry);
    if (!plugins) {
        logger.error("plugin setup failed: " + plugins.error().message);
        return 1;
    }

    // ── Session ──────────────────────────────
    Session session(logger, config.session.worker_threads);
    auto populated = populate(session, args->nodes);
    if (!populated) {
        logger.error("cluster setup failed: " + populated.error().message);
        return 1;
    }
    session.open(std::move(*plugins));

    std::cout << "Placements:\n";
    int exit_code = 0;
    for (const auto& task : session.tasks()) {
        if (task.is_bound()) continue;

        auto scores = session.prioritize_nodes(task.uid);
        print_ranking(task, scores);

        if (scores.empty() || !scores.front().score) {
            logger.error("no schedulable node for " + task.qualified_name());
            exit_code = 1;
            continue;
        }
        auto allocated = session.allocate(task.uid, scores.front().node);
        if (!allocated) {
            logger.error("allocate failed: " + allocated.error().message);
            exit_code = 1;
            continue;
        }
        std::cout << "    -> " << scores.front().node << "\n\n";
    }

    // Release the first placed task and show the refreshed ranking.
    std::optional<Task> released;
    for (const auto& task : session.tasks()) {
        if (task.is_bound() && task.labels.count("app") > 0 && task.labels.at("app") == "web") {
            released = task;
            break;
        }
    }
    if (released) {
        auto deallocated = session.deallocate(released->uid);
        if (!deallocated) {
            logger.error("deallocate failed: " + deallocated.error().message);
            exit_code = 1;
        } else {
            std::cout << "Released " << released->qualified_name() << " from "
                      << released->assigned_node << ":\n";
            print_ranking(*released, session.prioritize_nodes(released->uid));
        }
    }

    session.close();
    logger.flush();
    return exit_code;
}
