#include "cemkit/schema/schema.hpp"
#include "cemkit/core/logger.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace cemkit::schema {

namespace {

// Versions are used as file names; anything that could leave the directory
// is refused.
bool is_safe_version(const String& version) {
    if (version.empty() || version.contains(".."_s)) {
        return false;
    }
    return !version.contains('/') && !version.contains('\\');
}

} // namespace

DirectorySchemaProvider::DirectorySchemaProvider(String directory)
    : m_directory(std::move(directory)) {}

Result<String, String> DirectorySchemaProvider::get_schema(const String& version) const {
    if (!is_safe_version(version)) {
        return make_error("invalid schema version \""_s + version + "\"");
    }

    auto path = std::filesystem::path(m_directory.std_string()) / (version.std_string() + ".json");
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return make_error("schema version "_s + version + " not available");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    logging::get("schema").debug_fmt("read schema {}", path.string());
    return String(buffer.str());
}

String select_best_schema_version(const std::vector<String>& versions) {
    String best;
    bool has_speculative = false;

    for (const auto& version : versions) {
        if (version.empty()) {
            continue;
        }

        if (version.contains("speculative"_s)) {
            if (!has_speculative || version > best) {
                best = version;
                has_speculative = true;
            }
        } else if (!has_speculative) {
            if (best.empty() || version > best) {
                best = version;
            }
        }
    }

    if (best.empty()) {
        return String(DEFAULT_SCHEMA_VERSION);
    }
    return best;
}

} // namespace cemkit::schema
