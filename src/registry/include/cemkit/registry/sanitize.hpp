#pragma once

#include "cemkit/core/string.hpp"

namespace cemkit::registry {

inline constexpr usize DEFAULT_MAX_DESCRIPTION_LENGTH = 2000;

// Replacement text for descriptions that carry template syntax
inline constexpr std::string_view TEMPLATE_SYNTAX_PLACEHOLDER =
    "[Description removed: contains template syntax]";

// Makes an analyzer-provided description safe to hand to renderers:
// truncated to max_length bytes on a code point boundary (with "..."),
// replaced entirely if it contains template syntax, HTML-escaped, and
// whitespace-collapsed.
[[nodiscard]] String sanitize_description(const String& description,
                                          usize max_length = DEFAULT_MAX_DESCRIPTION_LENGTH);

// True for "{{ ... }}" including forms split by whitespace or HTML comments
[[nodiscard]] bool contains_template_syntax(const String& text);

[[nodiscard]] String escape_html(const String& text);

} // namespace cemkit::registry
