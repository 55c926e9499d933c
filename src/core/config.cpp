/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <limits>
#include <sstream>

namespace node_order {

namespace {

/// Plugin arguments are untyped: every scalar is stored in its text form.
std::optional<std::string> scalar_to_string(const toml::node& value) {
    if (auto s = value.as_string()) return s->get();
    if (auto i = value.as_integer()) return std::to_string(i->get());
    if (auto b = value.as_boolean()) return std::string{b->get() ? "true" : "false"};
    if (auto f = value.as_floating_point()) {
        std::ostringstream oss;
        oss << f->get();
        return oss.str();
    }
    return std::nullopt;
}

Result<PluginOption> parse_plugin(const toml::table& tbl) {
    PluginOption option;
    option.name = tbl["name"].value_or(std::string{});
    if (option.name.empty()) {
        return Error{"plugin entry without a name"};
    }

    if (auto arguments = tbl["arguments"].as_table()) {
        for (auto&& [key, value] : *arguments) {
            auto text = scalar_to_string(value);
            if (!text) {
                return Error{"argument <" + std::string{key.str()} + "> of plugin <"
                             + option.name + "> is not a scalar"};
            }
            option.arguments.set(std::string{key.str()}, std::move(*text));
        }
    }
    return option;
}

}  // namespace

const PluginOption* Config::find_plugin(const std::string& name) const {
    for (const auto& tier : tiers) {
        for (const auto& plugin : tier.plugins) {
            if (plugin.name == name) return &plugin;
        }
    }
    return nullptr;
}

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{"Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [session]
        if (auto session = tbl["session"]; session.is_table()) {
            // Negative counts fall back to hardware_concurrency (0).
            auto threads = session["worker_threads"].value_or(int64_t{0});
            config.session.worker_threads = static_cast<uint32_t>(
                std::clamp<int64_t>(threads, 0, std::numeric_limits<uint32_t>::max()));
        }

        // [[tiers]] / [[tiers.plugins]]
        if (auto tiers = tbl["tiers"].as_array()) {
            for (auto&& tier_node : *tiers) {
                auto tier_tbl = tier_node.as_table();
                if (!tier_tbl) {
                    return Error{"every [[tiers]] entry must be a table"};
                }

                Tier tier;
                if (auto plugins = (*tier_tbl)["plugins"].as_array()) {
                    for (auto&& plugin_node : *plugins) {
                        auto plugin_tbl = plugin_node.as_table();
                        if (!plugin_tbl) {
                            return Error{"every [[tiers.plugins]] entry must be a table"};
                        }
                        auto plugin = parse_plugin(*plugin_tbl);
                        if (!plugin) return plugin.error();
                        tier.plugins.push_back(std::move(*plugin));
                    }
                }
                config.tiers.push_back(std::move(tier));
            }
        } else {
            config.tiers = default_config().tiers;
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
            config.telemetry.log_to_file = telemetry["log_to_file"].value_or(false);
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    Config config;
    config.tiers.push_back(Tier{.plugins = {PluginOption{.name = "nodeorder", .arguments = {}}}});
    return config;
}

}  // namespace node_order
