#pragma once

#include "cemkit/manifest/manifest.hpp"
#include "cemkit/workspace/element_store.hpp"
#include <optional>
#include <unordered_map>
#include <vector>

namespace cemkit::registry {

// ============================================================================
// Relationships between elements
// ============================================================================

enum class RelationshipType : u8 {
    Superclass,  // element extends target
    Subclass,    // target extends element
    Mixin,       // element and target apply the same mixin
    Module,      // defined in the same module
    Package      // shipped in the same package
};

[[nodiscard]] constexpr std::string_view relationship_type_name(RelationshipType type) {
    switch (type) {
        case RelationshipType::Superclass: return "superclass";
        case RelationshipType::Subclass:   return "subclass";
        case RelationshipType::Mixin:      return "mixin";
        case RelationshipType::Module:     return "module";
        case RelationshipType::Package:    return "package";
    }
    return "unknown";
}

// Superclass and mixin edges whose target is not a registered element keep
// an empty target_tag_name; `via` still names the class or mixin.
struct Relationship {
    String target_tag_name;
    RelationshipType type;
    String via;  // Class, mixin, module or package name the edge was derived from

    // Human readable form, e.g. "extends BaseButton"
    [[nodiscard]] String label() const;

    [[nodiscard]] bool operator==(const Relationship& other) const = default;
};

// What the detector needs to know about one element
struct ElementData {
    String tag_name;
    String class_name;
    std::optional<manifest::Reference> superclass;
    std::vector<manifest::Reference> mixins;
    String module_path;
    String package_name;
};

// ============================================================================
// Relationship detector
// ============================================================================

// Index of class, mixin, module and package membership over one epoch's
// elements. Built once per reload; queries are pure lookups.
class RelationshipDetector {
public:
    RelationshipDetector() = default;

    // Builds a detector from every custom element declaration in the
    // store's packages, in package and module order.
    [[nodiscard]] static RelationshipDetector build(const workspace::ElementStore& store);

    // Adds an element. A tag name that is already present keeps its first
    // data; the call returns false.
    bool add_element(ElementData data);

    // Relationships of `tag_name`, closest first: inheritance and mixins
    // (a mixin nobody else applies yields one edge without a target), then
    // module co-location, then package siblings. A target appears under
    // module or package only if it is not already related more closely.
    // Unknown tags yield an empty vector.
    [[nodiscard]] std::vector<Relationship> detect(const String& tag_name) const;

    [[nodiscard]] usize size() const { return m_elements.size(); }
    [[nodiscard]] bool contains(const String& tag_name) const { return m_index.contains(tag_name); }

private:
    std::vector<ElementData> m_elements;
    std::unordered_map<String, usize> m_index;
    std::unordered_map<String, String> m_class_to_tag;
    std::unordered_map<String, std::vector<String>> m_module_to_tags;
    std::unordered_map<String, std::vector<String>> m_package_to_tags;
    std::unordered_map<String, std::vector<String>> m_mixin_to_tags;
};

} // namespace cemkit::registry
