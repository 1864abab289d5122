#pragma once

#include "element_store.hpp"

namespace cemkit::workspace {

// ============================================================================
// Workspace configuration
// ============================================================================

struct WorkspaceConfig {
    /**
     * @brief Workspace root directory
     */
    String root;

    /**
     * @brief Path of the workspace's own manifest, relative to root.
     * Empty means: the `customElements` field of root/package.json, else
     * custom-elements.json.
     */
    String manifest_path;

    /**
     * @brief Additional manifests to load, relative to root.
     * A missing or malformed one fails the load.
     */
    std::vector<String> extra_manifests;

    /**
     * @brief Load manifests of dependencies under node_modules
     */
    bool scan_node_modules = true;
};

// ============================================================================
// Workspace loader
// ============================================================================

// Populates an Element Store from some source of manifests.
class WorkspaceLoader {
public:
    virtual ~WorkspaceLoader() = default;

    [[nodiscard]] virtual const String& root() const = 0;

    // Fills `store`, which is empty on entry. On error the store content is
    // unspecified and must be discarded.
    [[nodiscard]] virtual Result<void, String> load(ElementStore& store) = 0;
};

} // namespace cemkit::workspace
