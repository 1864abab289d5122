#pragma once

#include "aggregates.hpp"
#include "conversion.hpp"
#include "element_info.hpp"
#include "relationships.hpp"
#include "cemkit/schema/schema.hpp"
#include "cemkit/workspace/workspace.hpp"
#include <json/json.h>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace cemkit::registry {

// ============================================================================
// Registry options
// ============================================================================

struct RegistryOptions {
    using ConvertFunction = std::function<ElementInfo(const workspace::ElementDefinition&, const ConversionOptions&)>;

    /**
     * @brief Descriptions longer than this many bytes are truncated
     */
    usize max_description_length = DEFAULT_MAX_DESCRIPTION_LENGTH;

    /**
     * @brief Attach generated HTML usage examples to each element
     */
    bool generate_examples = true;

    /**
     * @brief Replaces convert_element when set. Exceptions it throws reach
     * get_element() callers; during aggregate computation they yield empty
     * aggregates for the epoch.
     */
    ConvertFunction convert;

    [[nodiscard]] ConversionOptions conversion() const {
        return {max_description_length, generate_examples};
    }
};

// ============================================================================
// Registry errors
// ============================================================================

enum class RegistryErrorKind : u8 {
    NotFound,
    LoadFailure,
    SchemaFailure
};

[[nodiscard]] constexpr std::string_view registry_error_kind_name(RegistryErrorKind kind) {
    switch (kind) {
        case RegistryErrorKind::NotFound:      return "not-found";
        case RegistryErrorKind::LoadFailure:   return "load-failure";
        case RegistryErrorKind::SchemaFailure: return "schema-failure";
    }
    return "unknown";
}

struct RegistryError {
    RegistryErrorKind kind;
    String message;
};

// ============================================================================
// Registry
// ============================================================================

// Concurrent, read-mostly view over the elements of one workspace.
//
// One reader/writer lock guards the element store, the per-element memo
// cache, both aggregate caches and their validity flag. Conversion and
// aggregate computation run outside the lock; their results are committed
// only if no reload happened in the meantime (checked via the epoch).
//
// reload() loads into a fresh store without holding the lock and swaps it
// in, together with the cleared caches and the rebuilt relationship
// detector, in a single exclusive section. A failed reload leaves the
// previous epoch in place.
class Registry {
public:
    explicit Registry(std::unique_ptr<workspace::WorkspaceLoader> loader,
                      std::shared_ptr<const schema::SchemaProvider> schema_provider = nullptr,
                      RegistryOptions options = {});

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    [[nodiscard]] Result<void, RegistryError> reload();

    [[nodiscard]] Result<ElementInfoPtr, RegistryError> get_element(const String& tag_name);

    // Every element of one epoch, keyed by tag name
    [[nodiscard]] std::unordered_map<String, ElementInfoPtr> get_all_elements();

    // Cached per epoch; empty rather than failing
    [[nodiscard]] std::vector<String> common_tag_prefixes();
    [[nodiscard]] std::vector<String> all_css_custom_properties();

    // Empty for unknown tags
    [[nodiscard]] std::vector<Relationship> relationships_for(const String& tag_name) const;

    [[nodiscard]] Result<Json::Value, RegistryError> get_manifest_schema() const;
    [[nodiscard]] std::vector<String> get_manifest_schema_versions() const;

    // Incremented by every successful reload; 0 until the first one
    [[nodiscard]] u64 epoch() const;
    [[nodiscard]] usize element_count() const;

    [[nodiscard]] const RegistryOptions& options() const { return m_options; }

private:
    struct Aggregates {
        std::vector<String> common_prefixes;
        std::vector<String> css_properties;
    };

    // Converts outside the lock; the result is cached only if `epoch` is
    // still current.
    [[nodiscard]] ElementInfoPtr convert(const workspace::ElementDefinition& definition) const;

    [[nodiscard]] ElementInfoPtr convert_and_memoize(const workspace::ElementDefinition& definition, u64 epoch);

    // Converts every element of the current store, reusing and filling the
    // memo cache. Caller holds m_mutex exclusively.
    [[nodiscard]] Snapshot take_snapshot_locked();

    // Cached aggregate, recomputed over a snapshot when a reload has
    // invalidated it. Never fails.
    [[nodiscard]] std::vector<String> read_aggregate(std::vector<String> Aggregates::*field);

    std::unique_ptr<workspace::WorkspaceLoader> m_loader;
    std::shared_ptr<const schema::SchemaProvider> m_schema_provider;
    RegistryOptions m_options;

    // Serializes reload() calls. The loader runs under this mutex only.
    std::mutex m_reload_mutex;

    mutable std::shared_mutex m_mutex;
    std::shared_ptr<const workspace::ElementStore> m_store;
    std::unordered_map<String, ElementInfoPtr> m_memo;
    RelationshipDetector m_relationships;
    Aggregates m_aggregates;
    bool m_aggregates_valid{false};
    u64 m_epoch{0};
};

} // namespace cemkit::registry
