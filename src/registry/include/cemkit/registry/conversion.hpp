#pragma once

#include "element_info.hpp"
#include "sanitize.hpp"
#include "cemkit/workspace/element_store.hpp"

namespace cemkit::registry {

struct ConversionOptions {
    /**
     * @brief Descriptions longer than this many bytes are truncated
     */
    usize max_description_length = DEFAULT_MAX_DESCRIPTION_LENGTH;

    /**
     * @brief Attach generated HTML usage examples to each element
     */
    bool generate_examples = true;
};

// ============================================================================
// Conversion pipeline
// ============================================================================
//
// convert_element() is a pure function of its arguments: it touches no
// registry state, so the registry runs it outside its lock.

[[nodiscard]] ElementInfo convert_element(const workspace::ElementDefinition& definition,
                                          const ConversionOptions& options = {});

// Members of a union type such as `'primary' | 'secondary'`, unquoted.
// Types without '|' have no enumerated values.
[[nodiscard]] std::vector<String> extract_enum_values(const String& type_text);

// "Basic Usage", plus "With Attributes" and "With Content Slots" when the
// element has attributes or slots.
[[nodiscard]] std::vector<ExampleInfo> generate_examples(const ElementInfo& info);

} // namespace cemkit::registry
