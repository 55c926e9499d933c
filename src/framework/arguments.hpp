/**
 * @file arguments.hpp
 * @brief String-keyed plugin argument bag.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"

#include <initializer_list>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace node_order {

/**
 * @brief Raw plugin arguments as handed over by the scheduler configuration.
 *
 * Values are kept as strings; typed accessors parse on demand and leave the
 * caller's default untouched when a key is absent or unparseable.
 */
class Arguments {
public:
    Arguments() = default;
    Arguments(std::initializer_list<std::pair<const std::string, std::string>> init)
        : values_(init) {}

    void set(std::string key, std::string value);
    [[nodiscard]] bool contains(std::string_view key) const;
    [[nodiscard]] const std::string* find(std::string_view key) const;
    [[nodiscard]] size_t size() const noexcept { return values_.size(); }
    [[nodiscard]] bool empty() const noexcept { return values_.empty(); }

    /**
     * @brief Overwrite `target` with the integer stored under `key`.
     *
     * Absent or empty values leave `target` unchanged silently. Values that
     * do not parse as a whole base-10 integer leave it unchanged and log a
     * warning naming the key and the rejected value.
     *
     * @return true when `target` was overwritten.
     */
    bool get_int(int& target, std::string_view key, Logger& logger) const;

    [[nodiscard]] auto begin() const { return values_.begin(); }
    [[nodiscard]] auto end() const { return values_.end(); }

private:
    std::unordered_map<std::string, std::string> values_;
};

}  // namespace node_order
