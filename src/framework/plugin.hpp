/**
 * @file plugin.hpp
 * @brief Session plugin interface and the builder registry.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "framework/arguments.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace node_order {

class Session;

/**
 * @brief A scheduler plugin hooked into the session lifecycle.
 *
 * Plugins register their scoring functions and event handlers with the
 * session from on_session_open and drop all session-scoped state in
 * on_session_close.
 */
class IPlugin {
public:
    virtual ~IPlugin() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    virtual void on_session_open(Session& session) = 0;
    virtual void on_session_close(Session& session) = 0;
};

using PluginBuilder = std::function<std::unique_ptr<IPlugin>(const Arguments&)>;

/**
 * @brief Name → builder table used to instantiate configured plugins.
 */
class PluginRegistry {
public:
    /// Returns false if a builder is already registered under `name`.
    bool register_builder(std::string name, PluginBuilder builder);

    [[nodiscard]] Result<std::unique_ptr<IPlugin>> build(std::string_view name,
                                                         const Arguments& arguments) const;
    [[nodiscard]] bool has(std::string_view name) const;
    [[nodiscard]] std::vector<std::string> names() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, PluginBuilder> builders_;
};

/**
 * @brief Instantiate every plugin of every tier, in configuration order.
 *
 * Fails on the first plugin name with no registered builder.
 */
[[nodiscard]] Result<std::vector<std::unique_ptr<IPlugin>>> build_plugins(
    const Config& config, const PluginRegistry& registry);

}  // namespace node_order
