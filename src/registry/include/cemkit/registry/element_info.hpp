#pragma once

#include "item.hpp"
#include <memory>

namespace cemkit::registry {

// ============================================================================
// Usage example
// ============================================================================

struct ExampleInfo {
    String title;
    String description;
    String code;
    String language;
};

// ============================================================================
// Element info
// ============================================================================

// A custom element enriched for consumers: sanitized text, typed items,
// guidelines and generated examples. Built by convert_element() and
// shared read-only between the registry cache and its callers.
struct ElementInfo {
    String tag_name;
    String name;
    String summary;
    String description;
    String module;
    String package;
    bool deprecated{false};
    std::vector<Item> items;
    std::vector<String> guidelines;
    std::vector<ExampleInfo> examples;

    [[nodiscard]] std::vector<const AttributeItem*> attributes() const { return items_of<AttributeItem>(); }
    [[nodiscard]] std::vector<const SlotItem*> slots() const { return items_of<SlotItem>(); }
    [[nodiscard]] std::vector<const EventItem*> events() const { return items_of<EventItem>(); }
    [[nodiscard]] std::vector<const CssPropertyItem*> css_properties() const { return items_of<CssPropertyItem>(); }
    [[nodiscard]] std::vector<const CssPartItem*> css_parts() const { return items_of<CssPartItem>(); }
    [[nodiscard]] std::vector<const CssStateItem*> css_states() const { return items_of<CssStateItem>(); }

    [[nodiscard]] std::vector<const Item*> items_by_kind(ItemKind kind) const;

private:
    template<typename T>
    [[nodiscard]] std::vector<const T*> items_of() const {
        std::vector<const T*> result;
        for (const auto& item : items) {
            if (const auto* typed = std::get_if<T>(&item)) {
                result.push_back(typed);
            }
        }
        return result;
    }
};

using ElementInfoPtr = std::shared_ptr<const ElementInfo>;

} // namespace cemkit::registry
