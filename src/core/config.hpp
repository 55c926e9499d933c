/**
 * @file config.hpp
 * @brief Scheduler configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"
#include "framework/arguments.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace node_order {

struct SessionConfig {
    uint32_t worker_threads = 0;        ///< 0 = hardware_concurrency
};

/**
 * @brief One plugin entry of a tier. Argument values are kept as text.
 */
struct PluginOption {
    std::string name;
    Arguments arguments;
};

struct Tier {
    std::vector<PluginOption> plugins;
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    std::string log_level = "info";
    bool log_to_file = false;
};

/**
 * @brief Top-level scheduler configuration.
 */
struct Config {
    SessionConfig session;
    std::vector<Tier> tiers;
    TelemetryConfig telemetry;

    /// First plugin entry named `name`, or nullptr.
    [[nodiscard]] const PluginOption* find_plugin(const std::string& name) const;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration: one tier with "nodeorder".
 */
Config default_config();

}  // namespace node_order
