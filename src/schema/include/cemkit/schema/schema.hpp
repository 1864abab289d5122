#pragma once

#include "cemkit/core/types.hpp"
#include "cemkit/core/string.hpp"
#include <vector>

namespace cemkit::schema {

// Schema served when no loaded manifest names a version
inline constexpr std::string_view DEFAULT_SCHEMA_VERSION = "2.1.1-speculative";

// ============================================================================
// Schema provider
// ============================================================================

// Source of the JSON schema documents for custom-elements.json.
class SchemaProvider {
public:
    virtual ~SchemaProvider() = default;

    // Raw schema document for `version`
    [[nodiscard]] virtual Result<String, String> get_schema(const String& version) const = 0;
};

// Reads `<directory>/<version>.json`.
class DirectorySchemaProvider : public SchemaProvider {
public:
    explicit DirectorySchemaProvider(String directory);

    [[nodiscard]] Result<String, String> get_schema(const String& version) const override;

    [[nodiscard]] const String& directory() const { return m_directory; }

private:
    String m_directory;
};

// Picks the schema version to serve for a set of loaded manifests.
// Speculative versions win over stable ones; within a group the
// lexicographically highest wins. Empty input yields the default.
[[nodiscard]] String select_best_schema_version(const std::vector<String>& versions);

} // namespace cemkit::schema
