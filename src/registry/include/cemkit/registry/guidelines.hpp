#pragma once

#include "cemkit/manifest/manifest.hpp"
#include <vector>

namespace cemkit::registry {

// Sentences of `text` that read like usage advice: those mentioning
// "should", "must", "use" or "avoid". Each is trimmed and ends with '.'.
[[nodiscard]] std::vector<String> extract_guidelines(const String& text);

// Element-level guidelines: "<attribute>: <description>" for every
// described attribute, then the advice sentences of the element's own
// description.
[[nodiscard]] std::vector<String> element_guidelines(const manifest::CustomElementDeclaration& decl);

} // namespace cemkit::registry
