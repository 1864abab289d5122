#pragma once

#include "cemkit/core/types.hpp"
#include "cemkit/core/string.hpp"
#include <variant>
#include <vector>

namespace cemkit::registry {

// ============================================================================
// Item kinds
// ============================================================================

enum class ItemKind : u8 {
    Attribute,
    Slot,
    Event,
    CssProperty,
    CssPart,
    CssState
};

[[nodiscard]] constexpr std::string_view item_kind_name(ItemKind kind) {
    switch (kind) {
        case ItemKind::Attribute:   return "attribute";
        case ItemKind::Slot:        return "slot";
        case ItemKind::Event:       return "event";
        case ItemKind::CssProperty: return "css-property";
        case ItemKind::CssPart:     return "css-part";
        case ItemKind::CssState:    return "css-state";
    }
    return "unknown";
}

// ============================================================================
// Capabilities
// ============================================================================
//
// Each item kind is composed from the capabilities it has rather than
// derived from a common hierarchy. Code that cares about a capability
// can test for it with std::is_base_of_v.

struct ItemBase {
    String name;
    String description;
    std::vector<String> guidelines;
    std::vector<String> examples;
};

struct Typed {
    String type;
};

struct Defaultable {
    String default_value;
};

struct Enumerable {
    std::vector<String> values;
};

// ============================================================================
// Item types
// ============================================================================

struct AttributeItem : ItemBase, Typed, Defaultable, Enumerable {
    static constexpr ItemKind kind = ItemKind::Attribute;
    bool required{false};
};

struct SlotItem : ItemBase {
    static constexpr ItemKind kind = ItemKind::Slot;
};

struct EventItem : ItemBase, Typed {
    static constexpr ItemKind kind = ItemKind::Event;
};

struct CssPropertyItem : ItemBase {
    static constexpr ItemKind kind = ItemKind::CssProperty;
    String syntax;
    bool inherits{false};
    String initial;
};

struct CssPartItem : ItemBase {
    static constexpr ItemKind kind = ItemKind::CssPart;
};

struct CssStateItem : ItemBase {
    static constexpr ItemKind kind = ItemKind::CssState;
};

using Item = std::variant<AttributeItem, SlotItem, EventItem, CssPropertyItem, CssPartItem, CssStateItem>;

[[nodiscard]] inline ItemKind kind_of(const Item& item) {
    return std::visit([](const auto& i) { return std::decay_t<decltype(i)>::kind; }, item);
}

[[nodiscard]] inline const ItemBase& base_of(const Item& item) {
    return std::visit([](const auto& i) -> const ItemBase& { return i; }, item);
}

} // namespace cemkit::registry
