/**
 * @file label_selector.hpp
 * @brief Validation and matching of label and node selectors.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/affinity.hpp"
#include "core/result.hpp"


namespace node_order {

/// Task label selectors accept In/NotIn/Exists/DoesNotExist; node selectors also Gt/Lt.
enum class SelectorKind : uint8_t {
    TaskLabels,
    NodeLabels
};

/**
 * @brief Check operator/value shape of a requirement.
 *
 *   In, NotIn           non-empty values
 *   Exists, DoesNotExist no values
 *   Gt, Lt              exactly one integer value (node selectors only)
 */
[[nodiscard]] Result<void> validate_requirement(const SelectorRequirement& requirement,
                                                SelectorKind kind);

/// Validate, then evaluate one requirement against `labels`.
[[nodiscard]] Result<bool> requirement_matches(const SelectorRequirement& requirement,
                                               const Labels& labels,
                                               SelectorKind kind);

/// ANDs match_labels and match_expressions; an empty selector matches everything.
[[nodiscard]] Result<bool> selector_matches(const LabelSelector& selector, const Labels& labels);

/// ANDs the term's expressions; a term without expressions matches nothing.
[[nodiscard]] Result<bool> node_selector_term_matches(const NodeSelectorTerm& term,
                                                      const Labels& labels);

}  // namespace node_order
