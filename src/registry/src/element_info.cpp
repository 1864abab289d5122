#include "cemkit/registry/element_info.hpp"

namespace cemkit::registry {

std::vector<const Item*> ElementInfo::items_by_kind(ItemKind kind) const {
    std::vector<const Item*> result;
    for (const auto& item : items) {
        if (kind_of(item) == kind) {
            result.push_back(&item);
        }
    }
    return result;
}

} // namespace cemkit::registry
