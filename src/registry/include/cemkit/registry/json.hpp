#pragma once

#include "element_info.hpp"
#include "relationships.hpp"
#include <json/json.h>

namespace cemkit::registry {

// ============================================================================
// JSON shape of query results
// ============================================================================
//
// Collections are always emitted, empty ones as [] rather than null.
// Kind-specific item fields are only emitted for the kinds that have them.

[[nodiscard]] Json::Value to_json(const Item& item);
[[nodiscard]] Json::Value to_json(const ExampleInfo& example);
[[nodiscard]] Json::Value to_json(const ElementInfo& info);
[[nodiscard]] Json::Value to_json(const Relationship& relationship);
[[nodiscard]] Json::Value to_json(const std::vector<Relationship>& relationships);
[[nodiscard]] Json::Value to_json(const std::vector<String>& strings);

// Compact single-line serialization
[[nodiscard]] String to_json_string(const Json::Value& value);

} // namespace cemkit::registry
