/**
 * @file plugin.cpp
 * @brief PluginRegistry implementation.
 * @author Dimitris Kafetzis
 */

#include "framework/plugin.hpp"

#include <algorithm>

namespace node_order {

bool PluginRegistry::register_builder(std::string name, PluginBuilder builder) {
    std::lock_guard lock(mutex_);
    return builders_.emplace(std::move(name), std::move(builder)).second;
}

Result<std::unique_ptr<IPlugin>> PluginRegistry::build(std::string_view name,
                                                       const Arguments& arguments) const {
    PluginBuilder builder;
    {
        std::lock_guard lock(mutex_);
        auto it = builders_.find(std::string{name});
        if (it == builders_.end()) {
            return Error{"no plugin registered under <" + std::string{name} + ">"};
        }
        builder = it->second;
    }

    auto plugin = builder(arguments);
    if (!plugin) {
        return Error{"builder for <" + std::string{name} + "> returned no plugin"};
    }
    return Result<std::unique_ptr<IPlugin>>{std::move(plugin)};
}

bool PluginRegistry::has(std::string_view name) const {
    std::lock_guard lock(mutex_);
    return builders_.count(std::string{name}) > 0;
}

std::vector<std::string> PluginRegistry::names() const {
    std::vector<std::string> result;
    {
        std::lock_guard lock(mutex_);
        result.reserve(builders_.size());
        for (const auto& [name, builder] : builders_) {
            result.push_back(name);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

Result<std::vector<std::unique_ptr<IPlugin>>> build_plugins(const Config& config,
                                                            const PluginRegistry& registry) {
    std::vector<std::unique_ptr<IPlugin>> plugins;
    for (const auto& tier : config.tiers) {
        for (const auto& option : tier.plugins) {
            auto plugin = registry.build(option.name, option.arguments);
            if (!plugin) return plugin.error();
            plugins.push_back(std::move(*plugin));
        }
    }
    return Result<std::vector<std::unique_ptr<IPlugin>>>{std::move(plugins)};
}

}  // namespace node_order
