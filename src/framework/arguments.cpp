/**
 * @file arguments.cpp
 * @brief Arguments parsing helpers.
 * @author Dimitris Kafetzis
 */

#include "framework/arguments.hpp"

#include <charconv>
#include <system_error>

namespace node_order {

void Arguments::set(std::string key, std::string value) {
    values_[std::move(key)] = std::move(value);
}

bool Arguments::contains(std::string_view key) const {
    return find(key) != nullptr;
}

const std::string* Arguments::find(std::string_view key) const {
    auto it = values_.find(std::string{key});
    if (it == values_.end()) return nullptr;
    return &it->second;
}

bool Arguments::get_int(int& target, std::string_view key, Logger& logger) const {
    const std::string* raw = find(key);
    if (raw == nullptr || raw->empty()) return false;

    const char* first = raw->data();
    const char* last = raw->data() + raw->size();
    if (raw->size() > 1 && (*raw)[0] == '+' && (*raw)[1] != '-') ++first;

    int parsed = 0;
    auto [ptr, ec] = std::from_chars(first, last, parsed);
    if (ec != std::errc{} || ptr != last) {
        logger.warn("Could not parse argument: " + *raw + " for key "
                    + std::string{key} + ", keeping default");
        return false;
    }

    target = parsed;
    return true;
}

}  // namespace node_order
