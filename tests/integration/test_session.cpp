/**
 * @file test_session.cpp
 * @brief Integration tests: a full session with the nodeorder plugin.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"
#include "framework/plugin.hpp"
#include "framework/session.hpp"
#include "nodeorder/node_order_plugin.hpp"
#include "workload/cluster_generator.hpp"

#include "support/test_support.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <random>
#include <set>
#include <thread>

using namespace node_order;
using namespace node_order::testing;

// ═══════════════════════════════════════════════
// Fixture
// ═══════════════════════════════════════════════

class SessionIntegration : public ::testing::Test {
protected:
    void open_with(Arguments arguments = {}) {
        auto plugin = std::make_unique<NodeOrderPlugin>(std::move(arguments));
        plugin_ = plugin.get();
        std::vector<std::unique_ptr<IPlugin>> plugins;
        plugins.push_back(std::move(plugin));
        session_.open(std::move(plugins));
    }

    /// "a" has 2 CPUs free, "b" has 1 CPU free.
    void add_two_node_cluster() {
        ASSERT_TRUE(session_.add_node(make_node("a", 4000, 4 * kGiB)).has_value());
        ASSERT_TRUE(session_.add_node(make_node("b", 4000, 4 * kGiB)).has_value());
        ASSERT_TRUE(session_.add_task(make_task("busy-a", 2000, 2 * kGiB, {{"team", "x"}}, "a")).has_value());
        ASSERT_TRUE(session_.add_task(make_task("busy-b", 3000, 3 * kGiB, {{"team", "y"}}, "b")).has_value());
        ASSERT_TRUE(session_.add_task(make_task("web-0", 500, kGiB / 2, {{"app", "web"}})).has_value());
    }

    /// Plugin index and session NodeInfo must agree on every node.
    void expect_index_matches_session() {
        ASSERT_NE(plugin_->index(), nullptr);
        for (const auto& info : session_.nodes()) {
            auto state = plugin_->index()->lookup(info.name());
            ASSERT_TRUE(state.has_value()) << info.name();
            EXPECT_EQ(state->requested, info.used()) << info.name();
            EXPECT_EQ(state->tasks.size(), info.tasks().size()) << info.name();
        }
    }

    CapturedLogger log_;
    Session session_{log_.logger, 4};
    NodeOrderPlugin* plugin_ = nullptr;
};

// ═══════════════════════════════════════════════
// Lifecycle & guards
// ═══════════════════════════════════════════════

TEST_F(SessionIntegration, OpenFromDefaultConfig) {
    add_two_node_cluster();

    PluginRegistry registry;
    register_node_order_plugin(registry);
    auto plugins = build_plugins(default_config(), registry);
    ASSERT_TRUE(plugins.has_value());
    session_.open(std::move(*plugins));

    EXPECT_TRUE(session_.is_open());
    EXPECT_DOUBLE_EQ(*session_.node_order("web-0", "a"), 13.0);
    EXPECT_TRUE(log_.sink.contains("session opened"));
}

TEST_F(SessionIntegration, GuardsRejectInvalidOperations) {
    add_two_node_cluster();
    EXPECT_FALSE(session_.add_node(make_node("a", 1, 1)).has_value());
    EXPECT_FALSE(session_.add_task(make_task("busy-a", 1, 1)).has_value());
    EXPECT_FALSE(session_.add_task(make_task("stray", 1, 1, {}, "nowhere")).has_value());
    open_with();

    EXPECT_FALSE(session_.add_node(make_node("c", 1, 1)).has_value());
    EXPECT_FALSE(session_.add_task(make_task("late-bound", 1, 1, {}, "a")).has_value());
    EXPECT_TRUE(session_.add_task(make_task("late", 1, 1)).has_value());

    EXPECT_FALSE(session_.allocate("ghost", "a").has_value());
    EXPECT_FALSE(session_.allocate("web-0", "ghost").has_value());
    EXPECT_FALSE(session_.allocate("busy-a", "b").has_value());
    EXPECT_FALSE(session_.deallocate("web-0").has_value());
    EXPECT_FALSE(session_.node_order("ghost", "a").has_value());
    EXPECT_FALSE(session_.node_order("web-0", "ghost").has_value());
}

TEST_F(SessionIntegration, NoPluginsScoresZero) {
    add_two_node_cluster();
    session_.open({});
    EXPECT_DOUBLE_EQ(*session_.node_order("web-0", "a"), 0.0);
}

TEST_F(SessionIntegration, CloseDropsPluginState) {
    add_two_node_cluster();
    open_with();
    session_.close();
    EXPECT_FALSE(session_.is_open());
    EXPECT_DOUBLE_EQ(*session_.node_order("web-0", "a"), 0.0);
}

// ═══════════════════════════════════════════════
// Scoring through the session
// ═══════════════════════════════════════════════

TEST_F(SessionIntegration, PrioritizePrefersFreeCapacity) {
    add_two_node_cluster();
    open_with();

    auto scores = session_.prioritize_nodes("web-0");
    ASSERT_EQ(scores.size(), 2u);
    EXPECT_EQ(scores[0].node, "a");
    EXPECT_DOUBLE_EQ(*scores[0].score, 13.0);
    EXPECT_EQ(scores[1].node, "b");
    EXPECT_DOUBLE_EQ(*scores[1].score, 11.0);
    EXPECT_EQ(*session_.best_node("web-0"), "a");
}

TEST_F(SessionIntegration, WeightsComeFromPluginArguments) {
    add_two_node_cluster();
    open_with(Arguments{{"leastrequested.weight", "0"}, {"balancedresource.weight", "2"}});

    EXPECT_DOUBLE_EQ(*session_.node_order("web-0", "a"), 20.0);
    EXPECT_DOUBLE_EQ(*session_.node_order("web-0", "b"), 20.0);
}

TEST_F(SessionIntegration, AllocationChangesLaterScores) {
    add_two_node_cluster();
    open_with();
    ASSERT_TRUE(session_.add_task(make_task("heavy", 1500, 1536LL * 1024 * 1024)).has_value());

    ASSERT_TRUE(session_.allocate("heavy", "a").has_value());
    EXPECT_EQ(session_.task("heavy")->assigned_node, "a");
    EXPECT_EQ(session_.node("a")->tasks().count("heavy"), 1u);
    // a now has 0.5 CPU free: LR (0 + 0) / 2, BR fractions 1.0 → 0
    EXPECT_DOUBLE_EQ(*session_.node_order("web-0", "a"), 0.0);
    expect_index_matches_session();

    ASSERT_TRUE(session_.deallocate("heavy").has_value());
    EXPECT_FALSE(session_.task("heavy")->is_bound());
    EXPECT_FALSE(session_.task("missing").has_value());
    EXPECT_DOUBLE_EQ(*session_.node_order("web-0", "a"), 13.0);
    expect_index_matches_session();
}

TEST_F(SessionIntegration, AntiAffinityAvoidsTeamX) {
    add_two_node_cluster();
    auto task = make_task("loner", 500, kGiB / 2);
    task.affinity.task_anti_affinity = TaskAffinity{
        .required = {}, .preferred = {weighted_term(10, {{"team", "x"}})}};
    ASSERT_TRUE(session_.add_task(task).has_value());
    open_with();

    // a: 13 + 0, b: 11 + 10
    EXPECT_EQ(*session_.best_node("loner"), "b");
}

TEST_F(SessionIntegration, SpreadReplicasLandOnDistinctNodes) {
    for (auto& node : ClusterGenerator::uniform_nodes(3, {.milli_cpu = 4000, .memory_bytes = 4 * kGiB})) {
        ASSERT_TRUE(session_.add_node(std::move(node)).has_value());
    }
    for (auto& task : ClusterGenerator::replicated_tasks("web", "y", 3, {.milli_cpu = 500, .memory_bytes = kGiB / 2}, true)) {
        ASSERT_TRUE(session_.add_task(std::move(task)).has_value());
    }
    open_with();

    std::set<NodeId> used;
    for (const auto& uid : {"web-0", "web-1", "web-2"}) {
        auto best = session_.best_node(uid);
        ASSERT_TRUE(best.has_value()) << best.error().message;
        ASSERT_TRUE(session_.allocate(uid, *best).has_value());
        used.insert(*best);
    }
    EXPECT_EQ(used.size(), 3u);
    expect_index_matches_session();
}

TEST_F(SessionIntegration, ScoringErrorNamesThePlugin) {
    add_two_node_cluster();
    auto task = make_task("bad", 100, kGiB);
    task.affinity.node_affinity = NodeAffinity{
        .required = {},
        .preferred = {PreferredSchedulingTerm{
            .weight = 2,
            .preference = NodeSelectorTerm{.match_expressions = {
                SelectorRequirement{.key = "disktype", .op = SelectorOperator::In, .values = {}}}}}}
    };
    ASSERT_TRUE(session_.add_task(task).has_value());
    open_with();

    auto score = session_.node_order("bad", "a");
    ASSERT_FALSE(score.has_value());
    EXPECT_EQ(score.error().message.rfind("nodeorder: ", 0), 0u);

    auto scores = session_.prioritize_nodes("bad");
    for (const auto& entry : scores) EXPECT_FALSE(entry.score.has_value());
    EXPECT_FALSE(session_.best_node("bad").has_value());
}

TEST_F(SessionIntegration, StoppedPassReportsAbort) {
    add_two_node_cluster();
    open_with();

    std::stop_source stop;
    stop.request_stop();
    auto scores = session_.prioritize_nodes("web-0", stop.get_token());
    ASSERT_EQ(scores.size(), 2u);
    for (const auto& entry : scores) {
        ASSERT_FALSE(entry.score.has_value());
        EXPECT_EQ(entry.score.error().message, "scoring pass aborted");
    }
}

// ═══════════════════════════════════════════════
// Concurrency
// ═══════════════════════════════════════════════

TEST_F(SessionIntegration, ConcurrentScoringAndPlacement) {
    for (auto& node : ClusterGenerator::uniform_nodes(4, {.milli_cpu = 8000, .memory_bytes = 16 * kGiB}, 2)) {
        ASSERT_TRUE(session_.add_node(std::move(node)).has_value());
    }
    std::mt19937 rng(3);
    auto tasks = ClusterGenerator::random_tasks(
        40, {.milli_cpu = 50, .memory_bytes = 64LL * 1024 * 1024},
        {.milli_cpu = 400, .memory_bytes = 512LL * 1024 * 1024}, rng);
    for (auto& task : ClusterGenerator::replicated_tasks("web", "y", 4, {.milli_cpu = 100}, true)) {
        tasks.push_back(std::move(task));
    }
    for (const auto& task : tasks) ASSERT_TRUE(session_.add_task(task).has_value());
    open_with();

    std::atomic<int> scoring_errors{0};
    std::atomic<int> placement_errors{0};
    std::vector<std::jthread> threads;

    for (int s = 0; s < 3; ++s) {
        threads.emplace_back([&, s] {
            for (int i = 0; i < 20; ++i) {
                const auto& task = tasks[static_cast<size_t>((s * 7 + i) % static_cast<int>(tasks.size()))];
                for (const auto& entry : session_.prioritize_nodes(task.uid)) {
                    if (!entry.score) ++scoring_errors;
                }
            }
        });
    }
    for (int w = 0; w < 2; ++w) {
        threads.emplace_back([&, w] {
            std::mt19937 local(static_cast<unsigned>(100 + w));
            std::uniform_int_distribution<int> pick(0, 3);
            for (int round = 0; round < 10; ++round) {
                for (size_t i = static_cast<size_t>(w); i < tasks.size(); i += 2) {
                    auto node = "node-" + std::to_string(pick(local));
                    if (!session_.allocate(tasks[i].uid, node)) ++placement_errors;
                }
                for (size_t i = static_cast<size_t>(w); i < tasks.size(); i += 2) {
                    if (!session_.deallocate(tasks[i].uid)) ++placement_errors;
                }
            }
        });
    }
    threads.clear();

    EXPECT_EQ(scoring_errors.load(), 0);
    EXPECT_EQ(placement_errors.load(), 0);
    EXPECT_EQ(plugin_->bridge()->dropped_count(), 0u);
    EXPECT_EQ(plugin_->bridge()->applied_count(), 2u * 10u * tasks.size());
    expect_index_matches_session();
    for (const auto& info : session_.nodes()) {
        EXPECT_TRUE(info.used().is_empty());
    }
}
