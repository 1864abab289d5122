#include "cemkit/registry/registry.hpp"
#include "cemkit/core/logger.hpp"
#include <exception>
#include <format>

namespace cemkit::registry {

namespace {

// Commit attempts before an aggregate computed during concurrent reloads is
// returned without being cached
constexpr int MAX_AGGREGATE_ATTEMPTS = 3;

Logger& logger() {
    return logging::get("registry");
}

RegistryError error_of(RegistryErrorKind kind, String message) {
    return RegistryError{kind, std::move(message)};
}

} // namespace

Registry::Registry(std::unique_ptr<workspace::WorkspaceLoader> loader,
                   std::shared_ptr<const schema::SchemaProvider> schema_provider,
                   RegistryOptions options)
    : m_loader(std::move(loader))
    , m_schema_provider(std::move(schema_provider))
    , m_options(options)
    , m_store(std::make_shared<const workspace::ElementStore>()) {}

// ============================================================================
// Reload
// ============================================================================

Result<void, RegistryError> Registry::reload() {
    std::lock_guard reload_guard(m_reload_mutex);

    if (!m_loader) {
        return make_error(error_of(RegistryErrorKind::LoadFailure, "no workspace loader configured"_s));
    }

    auto store = std::make_shared<workspace::ElementStore>();
    auto loaded = m_loader->load(*store);
    if (loaded.is_err()) {
        auto message = String(std::format("failed to load manifests from workspace \"{}\": {}",
                                          m_loader->root(), loaded.error()));
        logger().error(message.view());
        return make_error(error_of(RegistryErrorKind::LoadFailure, std::move(message)));
    }

    auto relationships = RelationshipDetector::build(*store);
    auto element_count = store->size();
    auto package_count = store->packages().size();

    u64 epoch = 0;
    {
        std::unique_lock lock(m_mutex);
        m_store = std::move(store);
        m_memo.clear();
        m_aggregates = Aggregates{};
        m_aggregates_valid = false;
        m_relationships = std::move(relationships);
        epoch = ++m_epoch;
    }

    logger().info_fmt("reloaded {}: {} elements from {} manifests (epoch {})",
                      m_loader->root(), element_count, package_count, epoch);
    return {};
}

// ============================================================================
// Element queries
// ============================================================================

ElementInfoPtr Registry::convert(const workspace::ElementDefinition& definition) const {
    auto conversion = m_options.conversion();
    if (m_options.convert) {
        return std::make_shared<const ElementInfo>(m_options.convert(definition, conversion));
    }
    return std::make_shared<const ElementInfo>(convert_element(definition, conversion));
}

ElementInfoPtr Registry::convert_and_memoize(const workspace::ElementDefinition& definition, u64 epoch) {
    logger().trace_fmt("converting {} (epoch {})", definition.tag_name, epoch);
    ElementInfoPtr info = convert(definition);

    std::unique_lock lock(m_mutex);
    if (m_epoch != epoch) {
        // A reload replaced the store; the result belongs to the old epoch
        return info;
    }
    auto [it, inserted] = m_memo.try_emplace(definition.tag_name, std::move(info));
    return it->second;
}

Result<ElementInfoPtr, RegistryError> Registry::get_element(const String& tag_name) {
    workspace::ElementDefinitionPtr definition;
    u64 epoch = 0;
    {
        std::shared_lock lock(m_mutex);
        if (auto it = m_memo.find(tag_name); it != m_memo.end()) {
            return it->second;
        }
        definition = m_store->find(tag_name);
        epoch = m_epoch;
    }

    if (!definition) {
        return make_error(error_of(RegistryErrorKind::NotFound,
                                   "element "_s + tag_name + " not found in registry"));
    }
    return convert_and_memoize(*definition, epoch);
}

std::unordered_map<String, ElementInfoPtr> Registry::get_all_elements() {
    std::shared_ptr<const workspace::ElementStore> store;
    std::unordered_map<String, ElementInfoPtr> cached;
    u64 epoch = 0;
    {
        std::shared_lock lock(m_mutex);
        store = m_store;
        cached = m_memo;
        epoch = m_epoch;
    }

    // Everything comes from the store captured above, even if a reload
    // happens while converting.
    std::unordered_map<String, ElementInfoPtr> elements;
    elements.reserve(store->size());
    for (const auto& tag : store->tags()) {
        if (auto it = cached.find(tag); it != cached.end()) {
            elements.emplace(tag, it->second);
            continue;
        }
        if (auto definition = store->find(tag)) {
            elements.emplace(tag, convert_and_memoize(*definition, epoch));
        }
    }
    return elements;
}

std::vector<Relationship> Registry::relationships_for(const String& tag_name) const {
    std::shared_lock lock(m_mutex);
    return m_relationships.detect(tag_name);
}

u64 Registry::epoch() const {
    std::shared_lock lock(m_mutex);
    return m_epoch;
}

usize Registry::element_count() const {
    std::shared_lock lock(m_mutex);
    return m_store->size();
}

// ============================================================================
// Aggregates
// ============================================================================

Snapshot Registry::take_snapshot_locked() {
    Snapshot snapshot;
    snapshot.elements.reserve(m_store->size());
    for (const auto& tag : m_store->tags()) {
        auto it = m_memo.find(tag);
        if (it == m_memo.end()) {
            auto definition = m_store->find(tag);
            if (!definition) {
                continue;
            }
            it = m_memo.emplace(tag, convert(*definition)).first;
        }
        snapshot.elements.emplace(tag, it->second);
    }
    return snapshot;
}

std::vector<String> Registry::read_aggregate(std::vector<String> Aggregates::*field) {
    {
        std::shared_lock lock(m_mutex);
        if (m_aggregates_valid) {
            return m_aggregates.*field;
        }
    }

    Aggregates computed;
    for (int attempt = 0; attempt < MAX_AGGREGATE_ATTEMPTS; ++attempt) {
        Snapshot snapshot;
        bool have_snapshot = false;
        u64 epoch = 0;
        {
            std::unique_lock lock(m_mutex);
            if (m_aggregates_valid) {
                return m_aggregates.*field;
            }
            epoch = m_epoch;
            try {
                snapshot = take_snapshot_locked();
                have_snapshot = true;
            } catch (const std::exception& e) {
                logger().warn_fmt("snapshot for epoch {} failed, aggregates will be empty: {}", epoch, e.what());
            }
        }

        computed = Aggregates{};
        if (have_snapshot) {
            computed.common_prefixes = compute_common_prefixes(snapshot);
            computed.css_properties = compute_all_css_properties(snapshot);
        }

        std::unique_lock lock(m_mutex);
        if (m_aggregates_valid) {
            return m_aggregates.*field;
        }
        if (m_epoch == epoch) {
            m_aggregates = std::move(computed);
            m_aggregates_valid = true;
            logger().debug_fmt("aggregates for epoch {}: {} prefixes, {} css properties",
                               epoch, m_aggregates.common_prefixes.size(), m_aggregates.css_properties.size());
            return m_aggregates.*field;
        }
        logger().debug_fmt("epoch changed from {} to {} while computing aggregates", epoch, m_epoch);
    }

    // Reloads kept racing the computation; hand out the last result uncached
    return computed.*field;
}

std::vector<String> Registry::common_tag_prefixes() {
    return read_aggregate(&Aggregates::common_prefixes);
}

std::vector<String> Registry::all_css_custom_properties() {
    return read_aggregate(&Aggregates::css_properties);
}

// ============================================================================
// Manifest schema
// ============================================================================

std::vector<String> Registry::get_manifest_schema_versions() const {
    std::shared_lock lock(m_mutex);
    return m_store->schema_versions();
}

Result<Json::Value, RegistryError> Registry::get_manifest_schema() const {
    auto version = schema::select_best_schema_version(get_manifest_schema_versions());

    if (!m_schema_provider) {
        return make_error(error_of(RegistryErrorKind::SchemaFailure, "no schema provider configured"_s));
    }

    auto raw = m_schema_provider->get_schema(version);
    if (raw.is_err()) {
        return make_error(error_of(RegistryErrorKind::SchemaFailure,
                                   "failed to get schema "_s + version + ": " + raw.error()));
    }

    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    const auto& text = raw.value();

    Json::Value schema;
    std::string errors;
    try {
        if (!reader->parse(text.data(), text.data() + text.size(), &schema, &errors)) {
            return make_error(error_of(RegistryErrorKind::SchemaFailure,
                                       "failed to parse schema "_s + version + ": " + String(errors).trim()));
        }
    } catch (const Json::Exception& e) {
        return make_error(error_of(RegistryErrorKind::SchemaFailure,
                                   "failed to parse schema "_s + version + ": " + e.what()));
    }

    if (!schema.isObject()) {
        return make_error(error_of(RegistryErrorKind::SchemaFailure,
                                   "schema "_s + version + " is not a JSON object"));
    }

    logger().debug_fmt("serving manifest schema {}", version);
    return schema;
}

} // namespace cemkit::registry
