#pragma once

#include "manifest.hpp"

namespace cemkit::manifest {

// ============================================================================
// Manifest parser
// ============================================================================

// Parses a custom-elements.json document.
//
// The root must be an object and `modules`, when present, an array. Only
// declarations that describe custom elements (a `tagName`, or
// `customElement: true`) are kept; functions, variables and plain classes
// are skipped. Unknown fields are ignored.
[[nodiscard]] Result<Package, String> parse_package(std::string_view json_text);

// Reads and parses a manifest file. Errors name the path.
[[nodiscard]] Result<Package, String> parse_package_file(const String& path);

} // namespace cemkit::manifest
