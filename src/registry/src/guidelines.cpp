#include "cemkit/registry/guidelines.hpp"
#include <array>

namespace cemkit::registry {

namespace {

constexpr std::array<std::string_view, 4> GUIDELINE_KEYWORDS = {"should", "must", "use", "avoid"};

bool reads_like_guideline(const String& sentence) {
    auto lowered = sentence.to_lowercase();
    for (auto keyword : GUIDELINE_KEYWORDS) {
        if (lowered.contains(String(keyword))) {
            return true;
        }
    }
    return false;
}

} // namespace

std::vector<String> extract_guidelines(const String& text) {
    std::vector<String> guidelines;
    if (text.empty()) {
        return guidelines;
    }

    for (const auto& part : text.split('.')) {
        auto sentence = part.trim();
        if (!sentence.empty() && reads_like_guideline(sentence)) {
            guidelines.push_back(sentence + ".");
        }
    }
    return guidelines;
}

std::vector<String> element_guidelines(const manifest::CustomElementDeclaration& decl) {
    std::vector<String> guidelines;

    for (const auto& attr : decl.attributes) {
        if (!attr.description.empty()) {
            guidelines.push_back(attr.name + ": " + attr.description.trim());
        }
    }

    for (auto& sentence : extract_guidelines(decl.description)) {
        guidelines.push_back(std::move(sentence));
    }
    return guidelines;
}

} // namespace cemkit::registry
