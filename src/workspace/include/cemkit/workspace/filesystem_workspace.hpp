#pragma once

#include "workspace.hpp"
#include <filesystem>

namespace cemkit::workspace {

// ============================================================================
// File system workspace
// ============================================================================

// Loads manifests from a project checkout:
//   1. the workspace's own manifest
//   2. dependency manifests under node_modules (including @scope/ packages)
//   3. WorkspaceConfig::extra_manifests
//
// A workspace without any manifest loads successfully with zero elements.
// Broken dependency manifests are logged and skipped.
class FileSystemWorkspace : public WorkspaceLoader {
public:
    explicit FileSystemWorkspace(WorkspaceConfig config);

    [[nodiscard]] const String& root() const override { return m_config.root; }
    [[nodiscard]] Result<void, String> load(ElementStore& store) override;

    [[nodiscard]] const WorkspaceConfig& config() const { return m_config; }

private:
    struct PackageJson {
        String name;
        String custom_elements;
    };

    [[nodiscard]] static Result<std::optional<PackageJson>, String> read_package_json(
        const std::filesystem::path& dir);

    [[nodiscard]] Result<void, String> load_workspace_manifest(ElementStore& store);
    void load_dependency_manifests(ElementStore& store);
    [[nodiscard]] Result<void, String> load_extra_manifests(ElementStore& store);

    // Loads the package rooted at `dir` if its package.json names a manifest
    void load_dependency(ElementStore& store, const std::filesystem::path& dir);

    WorkspaceConfig m_config;
};

} // namespace cemkit::workspace
