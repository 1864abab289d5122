/**
 * File system workspace loader
 */

#include "cemkit/workspace/filesystem_workspace.hpp"
#include "cemkit/manifest/parser.hpp"
#include "cemkit/core/logger.hpp"
#include <json/json.h>
#include <algorithm>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace cemkit::workspace {

namespace {

constexpr const char* DEFAULT_MANIFEST_NAME = "custom-elements.json";
constexpr const char* PACKAGE_JSON_NAME = "package.json";
constexpr const char* NODE_MODULES_NAME = "node_modules";

Logger& logger() {
    return logging::get("workspace");
}

String path_string(const fs::path& path) {
    return String(path.string());
}

bool is_regular_file(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

// Sorted so that first-writer resolution does not depend on directory order
std::vector<fs::path> sorted_subdirectories(const fs::path& dir) {
    std::vector<fs::path> result;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return result;
    }
    for (const auto& entry : it) {
        std::error_code entry_ec;
        if (entry.is_directory(entry_ec)) {
            result.push_back(entry.path());
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace

FileSystemWorkspace::FileSystemWorkspace(WorkspaceConfig config)
    : m_config(std::move(config)) {}

Result<void, String> FileSystemWorkspace::load(ElementStore& store) {
    fs::path root(m_config.root.std_string());
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return make_error("workspace root \""_s + m_config.root + "\" is not a directory");
    }

    auto own = load_workspace_manifest(store);
    if (own.is_err()) {
        return own;
    }

    if (m_config.scan_node_modules) {
        load_dependency_manifests(store);
    }

    auto extra = load_extra_manifests(store);
    if (extra.is_err()) {
        return extra;
    }

    logger().debug_fmt("workspace {}: {} elements from {} manifests",
                       m_config.root, store.size(), store.packages().size());
    return {};
}

Result<std::optional<FileSystemWorkspace::PackageJson>, String>
FileSystemWorkspace::read_package_json(const fs::path& dir) {
    auto path = dir / PACKAGE_JSON_NAME;
    if (!is_regular_file(path)) {
        return std::optional<PackageJson>();
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return make_error("cannot open \""_s + path_string(path) + "\"");
    }

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    try {
        if (!Json::parseFromStream(builder, file, &root, &errors)) {
            return make_error("invalid JSON in \""_s + path_string(path) + "\": " + String(errors).trim());
        }
    } catch (const Json::Exception& e) {
        return make_error("invalid JSON in \""_s + path_string(path) + "\": " + e.what());
    }
    if (!root.isObject()) {
        return make_error("\""_s + path_string(path) + "\" is not a JSON object");
    }

    PackageJson package;
    if (root["name"].isString()) {
        package.name = String(root["name"].asString());
    }
    if (root["customElements"].isString()) {
        package.custom_elements = String(root["customElements"].asString());
    }
    return std::optional<PackageJson>(std::move(package));
}

Result<void, String> FileSystemWorkspace::load_workspace_manifest(ElementStore& store) {
    fs::path root(m_config.root.std_string());

    auto package_json = read_package_json(root);
    if (package_json.is_err()) {
        return make_error(package_json.error());
    }

    String package_name = path_string(root.filename());
    String manifest_path = m_config.manifest_path;
    bool explicit_path = !manifest_path.empty();

    if (const auto& pkg = package_json.value()) {
        if (!pkg->name.empty()) {
            package_name = pkg->name;
        }
        if (!explicit_path && !pkg->custom_elements.empty()) {
            manifest_path = pkg->custom_elements;
            explicit_path = true;
        }
    }

    if (manifest_path.empty()) {
        manifest_path = DEFAULT_MANIFEST_NAME;
    }

    auto full_path = root / manifest_path.std_string();
    if (!is_regular_file(full_path)) {
        if (explicit_path) {
            return make_error("manifest \""_s + path_string(full_path) + "\" not found");
        }
        logger().debug_fmt("no workspace manifest at {}", full_path.string());
        return {};
    }

    auto package = manifest::parse_package_file(path_string(full_path));
    if (package.is_err()) {
        return make_error(package.error());
    }

    auto added = store.add_package(std::move(package).value(), package_name);
    logger().debug_fmt("loaded workspace manifest {} ({} elements)", full_path.string(), added);
    return {};
}

void FileSystemWorkspace::load_dependency_manifests(ElementStore& store) {
    auto node_modules = fs::path(m_config.root.std_string()) / NODE_MODULES_NAME;
    std::error_code ec;
    if (!fs::is_directory(node_modules, ec)) {
        return;
    }

    for (const auto& dir : sorted_subdirectories(node_modules)) {
        auto name = dir.filename().string();
        if (name.starts_with(".")) {
            continue;
        }
        if (name.starts_with("@")) {
            for (const auto& scoped : sorted_subdirectories(dir)) {
                load_dependency(store, scoped);
            }
            continue;
        }
        load_dependency(store, dir);
    }
}

void FileSystemWorkspace::load_dependency(ElementStore& store, const fs::path& dir) {
    auto package_json = read_package_json(dir);
    if (package_json.is_err()) {
        logger().warn_fmt("skipping dependency {}: {}", dir.string(), package_json.error());
        return;
    }

    const auto& pkg = package_json.value();
    if (!pkg || pkg->custom_elements.empty()) {
        return;
    }

    auto manifest_path = dir / pkg->custom_elements.std_string();
    auto package = manifest::parse_package_file(path_string(manifest_path));
    if (package.is_err()) {
        logger().warn_fmt("skipping dependency manifest: {}", package.error());
        return;
    }

    String package_name = pkg->name.empty() ? path_string(dir.filename()) : pkg->name;
    auto added = store.add_package(std::move(package).value(), package_name);
    logger().debug_fmt("loaded dependency manifest {} ({} elements)", manifest_path.string(), added);
}

Result<void, String> FileSystemWorkspace::load_extra_manifests(ElementStore& store) {
    fs::path root(m_config.root.std_string());

    for (const auto& extra : m_config.extra_manifests) {
        auto path = root / extra.std_string();
        auto package = manifest::parse_package_file(path_string(path));
        if (package.is_err()) {
            return make_error(package.error());
        }
        store.add_package(std::move(package).value(), path_string(path.parent_path().filename()));
    }
    return {};
}

} // namespace cemkit::workspace
