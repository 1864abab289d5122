#include "cemkit/workspace/element_store.hpp"
#include "cemkit/core/logger.hpp"
#include <unordered_set>

namespace cemkit::workspace {

usize ElementStore::add_package(manifest::Package package, const String& package_name) {
    usize added = 0;

    for (const auto& module : package.modules) {
        for (const auto& decl : module.declarations) {
            if (decl.tag_name.empty()) {
                continue;
            }
            if (m_definitions.contains(decl.tag_name)) {
                logging::get("workspace").debug_fmt(
                    "duplicate definition of <{}> in {} ignored", decl.tag_name, module.path);
                continue;
            }

            auto definition = std::make_shared<ElementDefinition>();
            definition->tag_name = decl.tag_name;
            definition->class_name = decl.name;
            definition->module_path = module.path;
            definition->package_name = package_name;
            definition->declaration = decl;

            m_definitions.emplace(decl.tag_name, std::move(definition));
            m_tags.push_back(decl.tag_name);
            ++added;
        }
    }

    m_packages.push_back(std::move(package));
    m_package_names.push_back(package_name);
    return added;
}

ElementDefinitionPtr ElementStore::find(const String& tag_name) const {
    auto it = m_definitions.find(tag_name);
    if (it == m_definitions.end()) {
        return nullptr;
    }
    return it->second;
}

bool ElementStore::contains(const String& tag_name) const {
    return m_definitions.contains(tag_name);
}

std::vector<String> ElementStore::schema_versions() const {
    std::vector<String> versions;
    std::unordered_set<String> seen;

    for (const auto& package : m_packages) {
        if (package.schema_version.empty()) {
            continue;
        }
        if (seen.insert(package.schema_version).second) {
            versions.push_back(package.schema_version);
        }
    }
    return versions;
}

} // namespace cemkit::workspace
