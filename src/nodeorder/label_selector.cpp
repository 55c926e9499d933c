/**
 * @file label_selector.cpp
 * @brief Selector evaluation.
 * @author Dimitris Kafetzis
 */

#include "nodeorder/label_selector.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>

namespace node_order {

namespace {

std::optional<int64_t> parse_int64(std::string_view text) {
    if (text.empty()) return std::nullopt;
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

Error requirement_error(const SelectorRequirement& requirement, const std::string& reason) {
    return Error{"invalid requirement on key <" + requirement.key + "> with operator "
                 + std::string{to_string(requirement.op)} + ": " + reason};
}

}  // namespace

Result<void> validate_requirement(const SelectorRequirement& requirement, SelectorKind kind) {
    if (requirement.key.empty()) {
        return requirement_error(requirement, "empty key");
    }

    switch (requirement.op) {
        case SelectorOperator::In:
        case SelectorOperator::NotIn:
            if (requirement.values.empty()) {
                return requirement_error(requirement, "values set can't be empty");
            }
            break;
        case SelectorOperator::Exists:
        case SelectorOperator::DoesNotExist:
            if (!requirement.values.empty()) {
                return requirement_error(requirement, "values set must be empty");
            }
            break;
        case SelectorOperator::Gt:
        case SelectorOperator::Lt:
            if (kind != SelectorKind::NodeLabels) {
                return requirement_error(requirement, "not a valid task selector operator");
            }
            if (requirement.values.size() != 1) {
                return requirement_error(requirement, "exactly one value required");
            }
            if (!parse_int64(requirement.values.front())) {
                return requirement_error(requirement,
                    "value <" + requirement.values.front() + "> is not an integer");
            }
            break;
    }
    return Result<void>{};
}

Result<bool> requirement_matches(const SelectorRequirement& requirement,
                                 const Labels& labels,
                                 SelectorKind kind) {
    auto valid = validate_requirement(requirement, kind);
    if (!valid) return valid.error();

    auto it = labels.find(requirement.key);
    const bool present = it != labels.end();
    auto contains = [&requirement](const std::string& value) {
        return std::find(requirement.values.begin(), requirement.values.end(), value)
               != requirement.values.end();
    };

    switch (requirement.op) {
        case SelectorOperator::In:
            return present && contains(it->second);
        case SelectorOperator::NotIn:
            return !present || !contains(it->second);
        case SelectorOperator::Exists:
            return present;
        case SelectorOperator::DoesNotExist:
            return !present;
        case SelectorOperator::Gt:
        case SelectorOperator::Lt: {
            if (!present) return false;
            auto label_value = parse_int64(it->second);
            if (!label_value) return false;
            auto bound = *parse_int64(requirement.values.front());
            return requirement.op == SelectorOperator::Gt ? *label_value > bound
                                                          : *label_value < bound;
        }
    }
    return false;
}

Result<bool> selector_matches(const LabelSelector& selector, const Labels& labels) {
    bool matched = true;

    for (const auto& [key, value] : selector.match_labels) {
        auto it = labels.find(key);
        if (it == labels.end() || it->second != value) {
            matched = false;
        }
    }

    // Every expression is validated even once the outcome is known.
    for (const auto& requirement : selector.match_expressions) {
        auto result = requirement_matches(requirement, labels, SelectorKind::TaskLabels);
        if (!result) return result.error();
        matched = matched && *result;
    }
    return matched;
}

Result<bool> node_selector_term_matches(const NodeSelectorTerm& term, const Labels& labels) {
    bool matched = !term.match_expressions.empty();

    for (const auto& requirement : term.match_expressions) {
        auto result = requirement_matches(requirement, labels, SelectorKind::NodeLabels);
        if (!result) return result.error();
        matched = matched && *result;
    }
    return matched;
}

}  // namespace node_order
