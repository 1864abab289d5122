#pragma once

#include "element_info.hpp"
#include <unordered_map>
#include <vector>

namespace cemkit::registry {

// ============================================================================
// Snapshot
// ============================================================================

// Every converted element of one epoch. Taken under the registry lock and
// read without it.
struct Snapshot {
    std::unordered_map<String, ElementInfoPtr> elements;
};

// ============================================================================
// Aggregates
// ============================================================================

// Tag prefixes (the part before the first '-') shared by more than one
// element, sorted. Tags without '-' have no prefix.
[[nodiscard]] std::vector<String> compute_common_prefixes(const Snapshot& snapshot);

// Union of CSS custom property names across all elements, sorted and
// without duplicates.
[[nodiscard]] std::vector<String> compute_all_css_properties(const Snapshot& snapshot);

} // namespace cemkit::registry
