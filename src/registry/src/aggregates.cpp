#include "cemkit/registry/aggregates.hpp"
#include <algorithm>
#include <set>

namespace cemkit::registry {

std::vector<String> compute_common_prefixes(const Snapshot& snapshot) {
    std::unordered_map<String, usize> counts;
    for (const auto& [tag, info] : snapshot.elements) {
        auto dash = tag.find('-');
        if (!dash) {
            continue;
        }
        ++counts[tag.substring(0, *dash)];
    }

    std::vector<String> prefixes;
    for (const auto& [prefix, count] : counts) {
        if (count > 1) {
            prefixes.push_back(prefix);
        }
    }
    std::sort(prefixes.begin(), prefixes.end());
    return prefixes;
}

std::vector<String> compute_all_css_properties(const Snapshot& snapshot) {
    std::set<String> names;
    for (const auto& [tag, info] : snapshot.elements) {
        if (!info) {
            continue;
        }
        for (const auto* prop : info->css_properties()) {
            names.insert(prop->name);
        }
    }
    return {names.begin(), names.end()};
}

} // namespace cemkit::registry
