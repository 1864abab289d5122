#include "cemkit/registry/relationships.hpp"
#include <algorithm>

namespace cemkit::registry {

namespace {

bool contains_relationship(const std::vector<Relationship>& rels, const String& target, RelationshipType type) {
    return std::any_of(rels.begin(), rels.end(), [&](const Relationship& r) {
        return r.target_tag_name == target && r.type == type;
    });
}

bool contains_target(const std::vector<Relationship>& rels, const String& target) {
    return std::any_of(rels.begin(), rels.end(), [&](const Relationship& r) {
        return r.target_tag_name == target;
    });
}

} // namespace

String Relationship::label() const {
    switch (type) {
        case RelationshipType::Superclass: return "extends "_s + via;
        case RelationshipType::Subclass:   return "extended by "_s + target_tag_name;
        case RelationshipType::Mixin:
            return target_tag_name.empty() ? "applies "_s + via : "shares "_s + via;
        case RelationshipType::Module:     return "same module"_s;
        case RelationshipType::Package:    return "same package"_s;
    }
    return String(relationship_type_name(type));
}

RelationshipDetector RelationshipDetector::build(const workspace::ElementStore& store) {
    RelationshipDetector detector;

    const auto& packages = store.packages();
    const auto& package_names = store.package_names();

    for (usize i = 0; i < packages.size(); ++i) {
        for (const auto& module : packages[i].modules) {
            for (const auto& decl : module.declarations) {
                if (decl.tag_name.empty()) {
                    continue;
                }
                detector.add_element(ElementData{
                    .tag_name = decl.tag_name,
                    .class_name = decl.name,
                    .superclass = decl.superclass,
                    .mixins = decl.mixins,
                    .module_path = module.path,
                    .package_name = package_names[i],
                });
            }
        }
    }

    return detector;
}

bool RelationshipDetector::add_element(ElementData data) {
    if (m_index.contains(data.tag_name)) {
        return false;
    }

    const auto& tag = data.tag_name;

    if (!data.class_name.empty()) {
        m_class_to_tag.try_emplace(data.class_name, tag);
    }
    if (!data.module_path.empty()) {
        m_module_to_tags[data.module_path].push_back(tag);
    }
    if (!data.package_name.empty()) {
        m_package_to_tags[data.package_name].push_back(tag);
    }
    for (const auto& mixin : data.mixins) {
        m_mixin_to_tags[mixin.name].push_back(tag);
    }

    m_index.emplace(tag, m_elements.size());
    m_elements.push_back(std::move(data));
    return true;
}

std::vector<Relationship> RelationshipDetector::detect(const String& tag_name) const {
    std::vector<Relationship> rels;

    auto found = m_index.find(tag_name);
    if (found == m_index.end()) {
        return rels;
    }
    const auto& data = m_elements[found->second];

    // Superclass
    if (data.superclass && !data.superclass->name.empty()) {
        auto it = m_class_to_tag.find(data.superclass->name);
        if (it == m_class_to_tag.end()) {
            rels.push_back({String(), RelationshipType::Superclass, data.superclass->name});
        } else if (it->second != tag_name) {
            rels.push_back({it->second, RelationshipType::Superclass, data.superclass->name});
        }
    }

    // Subclasses
    if (!data.class_name.empty()) {
        for (const auto& other : m_elements) {
            if (other.tag_name == tag_name) {
                continue;
            }
            if (other.superclass && other.superclass->name == data.class_name) {
                rels.push_back({other.tag_name, RelationshipType::Subclass, data.class_name});
            }
        }
    }

    // Shared mixins
    for (const auto& mixin : data.mixins) {
        bool shared = false;
        auto it = m_mixin_to_tags.find(mixin.name);
        if (it != m_mixin_to_tags.end()) {
            for (const auto& other_tag : it->second) {
                if (other_tag == tag_name) {
                    continue;
                }
                shared = true;
                if (!contains_relationship(rels, other_tag, RelationshipType::Mixin)) {
                    rels.push_back({other_tag, RelationshipType::Mixin, mixin.name});
                }
            }
        }
        if (!shared) {
            rels.push_back({String(), RelationshipType::Mixin, mixin.name});
        }
    }

    // Module co-location
    if (!data.module_path.empty()) {
        auto it = m_module_to_tags.find(data.module_path);
        if (it != m_module_to_tags.end()) {
            for (const auto& other_tag : it->second) {
                if (other_tag == tag_name) {
                    continue;
                }
                if (contains_relationship(rels, other_tag, RelationshipType::Superclass) ||
                    contains_relationship(rels, other_tag, RelationshipType::Subclass) ||
                    contains_relationship(rels, other_tag, RelationshipType::Mixin)) {
                    continue;
                }
                rels.push_back({other_tag, RelationshipType::Module, data.module_path});
            }
        }
    }

    // Package siblings
    if (!data.package_name.empty()) {
        auto it = m_package_to_tags.find(data.package_name);
        if (it != m_package_to_tags.end()) {
            for (const auto& other_tag : it->second) {
                if (other_tag == tag_name || contains_target(rels, other_tag)) {
                    continue;
                }
                rels.push_back({other_tag, RelationshipType::Package, data.package_name});
            }
        }
    }

    return rels;
}

} // namespace cemkit::registry
