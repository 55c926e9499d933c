/**
 * @file test_plugin_registry.cpp
 * @brief Unit tests for PluginRegistry and the nodeorder plugin lifecycle.
 * @author Dimitris Kafetzis
 */

#include "framework/plugin.hpp"
#include "framework/session.hpp"
#include "nodeorder/node_order_plugin.hpp"

#include "support/test_support.hpp"

#include <gtest/gtest.h>

using namespace node_order;
using namespace node_order::testing;

namespace {

class CountingPlugin : public IPlugin {
public:
    explicit CountingPlugin(int& opens) : opens_(opens) {}
    std::string_view name() const noexcept override { return "counting"; }
    void on_session_open(Session&) override { ++opens_; }
    void on_session_close(Session&) override {}

private:
    int& opens_;
};

}  // namespace

TEST(PluginRegistryTest, RegisterAndBuild) {
    PluginRegistry registry;
    EXPECT_TRUE(register_node_order_plugin(registry));
    EXPECT_FALSE(register_node_order_plugin(registry));
    EXPECT_TRUE(registry.has("nodeorder"));
    EXPECT_EQ(registry.names(), (std::vector<std::string>{"nodeorder"}));

    auto plugin = registry.build("nodeorder", Arguments{});
    ASSERT_TRUE(plugin.has_value());
    EXPECT_EQ((*plugin)->name(), "nodeorder");
}

TEST(PluginRegistryTest, UnknownPluginIsError) {
    PluginRegistry registry;
    auto plugin = registry.build("gang", Arguments{});
    ASSERT_FALSE(plugin.has_value());
    EXPECT_NE(plugin.error().message.find("gang"), std::string::npos);
}

TEST(PluginRegistryTest, NullBuilderResultIsError) {
    PluginRegistry registry;
    registry.register_builder("broken", [](const Arguments&) { return std::unique_ptr<IPlugin>{}; });
    EXPECT_FALSE(registry.build("broken", Arguments{}).has_value());
}

TEST(PluginRegistryTest, BuildPluginsFollowsConfigOrder) {
    PluginRegistry registry;
    int opens = 0;
    register_node_order_plugin(registry);
    registry.register_builder("counting",
        [&opens](const Arguments&) { return std::make_unique<CountingPlugin>(opens); });

    Config config;
    config.tiers = {
        Tier{.plugins = {PluginOption{.name = "counting", .arguments = {}}}},
        Tier{.plugins = {PluginOption{.name = "nodeorder", .arguments = {}}}}
    };

    auto plugins = build_plugins(config, registry);
    ASSERT_TRUE(plugins.has_value());
    ASSERT_EQ(plugins->size(), 2u);
    EXPECT_EQ((*plugins)[0]->name(), "counting");
    EXPECT_EQ((*plugins)[1]->name(), "nodeorder");

    config.tiers.push_back(Tier{.plugins = {PluginOption{.name = "missing", .arguments = {}}}});
    EXPECT_FALSE(build_plugins(config, registry).has_value());
}

TEST(NodeOrderPluginTest, StateLivesForTheSession) {
    CapturedLogger log;
    Session session(log.logger, 1);
    ASSERT_TRUE(session.add_node(make_node("n1", 4000, 4 * kGiB)).has_value());

    auto plugin = std::make_unique<NodeOrderPlugin>(Arguments{{"leastrequested.weight", "4"}});
    NodeOrderPlugin* observed = plugin.get();
    EXPECT_EQ(observed->index(), nullptr);

    std::vector<std::unique_ptr<IPlugin>> plugins;
    plugins.push_back(std::move(plugin));
    session.open(std::move(plugins));

    ASSERT_NE(observed->index(), nullptr);
    EXPECT_EQ(observed->index()->size(), 1u);
    ASSERT_NE(observed->scorer(), nullptr);
    EXPECT_EQ(observed->scorer()->weights().least_requested, 4);
    EXPECT_TRUE(log.sink.contains("leastrequested=4"));

    // Plugins are owned by the session and released on close.
    session.close();
    EXPECT_FALSE(session.is_open());
}
