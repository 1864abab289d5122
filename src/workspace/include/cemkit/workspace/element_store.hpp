#pragma once

#include "cemkit/manifest/manifest.hpp"
#include <memory>
#include <unordered_map>
#include <vector>

namespace cemkit::workspace {

// ============================================================================
// Element definition
// ============================================================================

// One custom element together with where it came from.
struct ElementDefinition {
    String tag_name;
    String class_name;
    String module_path;
    String package_name;
    manifest::CustomElementDeclaration declaration;
};

using ElementDefinitionPtr = std::shared_ptr<const ElementDefinition>;

// ============================================================================
// Element Store
// ============================================================================

// Raw elements of one load, keyed by tag name.
//
// Filled by a WorkspaceLoader and never modified afterwards; the registry
// replaces the whole store on reload. When several declarations claim the
// same tag name, the first one added wins and later ones are dropped.
class ElementStore {
public:
    ElementStore() = default;

    // Adds every custom element of every module, in document order.
    // Returns the number of elements that were new.
    usize add_package(manifest::Package package, const String& package_name);

    [[nodiscard]] ElementDefinitionPtr find(const String& tag_name) const;
    [[nodiscard]] bool contains(const String& tag_name) const;

    // Tag names in insertion order
    [[nodiscard]] const std::vector<String>& tags() const { return m_tags; }
    [[nodiscard]] usize size() const { return m_tags.size(); }
    [[nodiscard]] bool empty() const { return m_tags.empty(); }

    [[nodiscard]] const std::vector<manifest::Package>& packages() const { return m_packages; }
    [[nodiscard]] const std::vector<String>& package_names() const { return m_package_names; }

    // Unique non-empty schema versions, first-seen order
    [[nodiscard]] std::vector<String> schema_versions() const;

private:
    std::vector<manifest::Package> m_packages;
    std::vector<String> m_package_names;
    std::unordered_map<String, ElementDefinitionPtr> m_definitions;
    std::vector<String> m_tags;
};

} // namespace cemkit::workspace
