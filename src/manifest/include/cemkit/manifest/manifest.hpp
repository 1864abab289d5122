#pragma once

#include "cemkit/core/types.hpp"
#include "cemkit/core/string.hpp"
#include <optional>
#include <vector>

namespace cemkit::manifest {

// ============================================================================
// Custom Elements Manifest data model
// ============================================================================
//
// Mirrors the subset of the custom-elements.json schema that the registry
// reads. Values are plain data; a Package is immutable once parsed.

struct Type {
    String text;
};

// Reference to a class or mixin, optionally qualified by package/module
struct Reference {
    String name;
    String package;
    String module;
};

// Either absent, a bare flag (`true`), or a reason string
struct Deprecation {
    String reason;
};

struct Attribute {
    String name;
    String summary;
    String description;
    std::optional<Type> type;
    String default_value;
    String field_name;
    bool required{false};
    std::optional<Deprecation> deprecated;
};

struct Slot {
    String name;  // Empty for the default slot
    String summary;
    String description;
    std::optional<Deprecation> deprecated;
};

struct Event {
    String name;
    String summary;
    String description;
    std::optional<Type> type;
    std::optional<Deprecation> deprecated;
};

struct CssCustomProperty {
    String name;
    String summary;
    String description;
    String syntax;
    bool inherits{false};
    String initial;
    String default_value;
    std::optional<Deprecation> deprecated;
};

struct CssPart {
    String name;
    String summary;
    String description;
    std::optional<Deprecation> deprecated;
};

struct CssCustomState {
    String name;
    String summary;
    String description;
    std::optional<Deprecation> deprecated;
};

struct Demo {
    String url;
    String description;
};

struct CustomElementDeclaration {
    String kind;      // "class" or "mixin"
    String name;      // Class name
    String tag_name;
    String summary;
    String description;
    std::optional<Reference> superclass;
    std::vector<Reference> mixins;

    std::vector<Attribute> attributes;
    std::vector<Event> events;
    std::vector<Slot> slots;
    std::vector<CssPart> css_parts;
    std::vector<CssCustomProperty> css_properties;
    std::vector<CssCustomState> css_states;
    std::vector<Demo> demos;

    std::optional<Deprecation> deprecated;
};

struct Module {
    String kind;  // "javascript-module"
    String path;
    std::vector<CustomElementDeclaration> declarations;
};

struct Package {
    String schema_version;
    String readme;
    std::vector<Module> modules;

    [[nodiscard]] usize element_count() const;
};

} // namespace cemkit::manifest
