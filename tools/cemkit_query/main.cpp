/**
 * Custom elements query tool
 * Usage: cemkit-query <workspace> [--verbose] [--log-level <level>] [--schema-dir <dir>] [command [tag]]
 *
 * Commands: elements (default), element <tag>, prefixes, css-properties,
 *           relationships <tag>, schema-versions, schema
 */

#include "cemkit/registry/json.hpp"
#include "cemkit/registry/registry.hpp"
#include "cemkit/workspace/filesystem_workspace.hpp"
#include "cemkit/core/logger.hpp"
#include <iostream>
#include <vector>

using namespace cemkit;

namespace {

void print_usage() {
    std::cerr << "Usage: cemkit-query <workspace> [--verbose] [--log-level <level>] [--schema-dir <dir>] [command [tag]]\n"
              << "Options:\n"
              << "  --verbose            same as --log-level debug\n"
              << "  --log-level <level>  trace, debug, info, warn, error or off (default warn)\n"
              << "  --schema-dir <dir>   directory of <version>.json schema files\n"
              << "Commands:\n"
              << "  elements             all elements (default)\n"
              << "  element <tag>        one element\n"
              << "  prefixes             tag prefixes shared by several elements\n"
              << "  css-properties       CSS custom properties of all elements\n"
              << "  relationships <tag>  elements related to <tag>\n"
              << "  schema-versions      schema versions named by the loaded manifests\n"
              << "  schema               the manifest JSON schema\n";
}

void print(const Json::Value& value) {
    std::cout << registry::to_json_string(value).c_str() << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    logging::init();

    std::vector<String> positional;
    String schema_dir;
    LogLevel log_level = LogLevel::Warn;

    for (int i = 1; i < argc; ++i) {
        String arg(argv[i]);
        if (arg == "--verbose"_s) {
            log_level = LogLevel::Debug;
        } else if (arg == "--log-level"_s && i + 1 < argc) {
            auto parsed = parse_log_level(argv[++i]);
            if (!parsed) {
                std::cerr << "Error: unknown log level: " << argv[i] << "\n";
                print_usage();
                return 1;
            }
            log_level = *parsed;
        } else if (arg == "--schema-dir"_s && i + 1 < argc) {
            schema_dir = String(argv[++i]);
        } else if (arg == "--help"_s || arg == "-h"_s) {
            print_usage();
            return 0;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        print_usage();
        return 1;
    }

    logging::set_all_levels(log_level);

    workspace::WorkspaceConfig config;
    config.root = positional[0];
    String command = positional.size() > 1 ? positional[1] : "elements"_s;
    String tag = positional.size() > 2 ? positional[2] : String();

    std::shared_ptr<const schema::SchemaProvider> schemas;
    if (!schema_dir.empty()) {
        schemas = std::make_shared<schema::DirectorySchemaProvider>(schema_dir);
    }

    registry::Registry registry(std::make_unique<workspace::FileSystemWorkspace>(config), schemas);

    auto loaded = registry.reload();
    if (loaded.is_err()) {
        std::cerr << "Error: " << loaded.error().message.c_str() << "\n";
        logging::shutdown();
        return 1;
    }

    int status = 0;
    if (command == "elements"_s) {
        Json::Value elements(Json::objectValue);
        for (const auto& [name, info] : registry.get_all_elements()) {
            elements[name.std_string()] = registry::to_json(*info);
        }
        print(elements);
    } else if (command == "element"_s) {
        auto info = registry.get_element(tag);
        if (info.is_ok()) {
            print(registry::to_json(*info.value()));
        } else {
            std::cerr << "Error: " << info.error().message.c_str() << "\n";
            status = 1;
        }
    } else if (command == "prefixes"_s) {
        print(registry::to_json(registry.common_tag_prefixes()));
    } else if (command == "css-properties"_s) {
        print(registry::to_json(registry.all_css_custom_properties()));
    } else if (command == "relationships"_s) {
        print(registry::to_json(registry.relationships_for(tag)));
    } else if (command == "schema-versions"_s) {
        print(registry::to_json(registry.get_manifest_schema_versions()));
    } else if (command == "schema"_s) {
        auto schema = registry.get_manifest_schema();
        if (schema.is_ok()) {
            print(schema.value());
        } else {
            std::cerr << "Error: " << schema.error().message.c_str() << "\n";
            status = 1;
        }
    } else {
        std::cerr << "Error: unknown command: " << command.c_str() << "\n";
        print_usage();
        status = 1;
    }

    logging::shutdown();
    return status;
}
