/**
 * Custom Elements Manifest parser (jsoncpp)
 */

#include "cemkit/manifest/parser.hpp"
#include "cemkit/core/logger.hpp"
#include <json/json.h>
#include <fstream>
#include <memory>
#include <sstream>

namespace cemkit::manifest {

namespace {

Logger& logger() {
    return logging::get("manifest");
}

String string_field(const Json::Value& object, const char* key) {
    const auto& value = object[key];
    if (value.isString()) {
        return String(value.asString());
    }
    return String();
}

bool bool_field(const Json::Value& object, const char* key) {
    const auto& value = object[key];
    return value.isBool() && value.asBool();
}

std::optional<Type> type_field(const Json::Value& object) {
    const auto& value = object["type"];
    if (!value.isObject()) {
        return std::nullopt;
    }
    return Type{string_field(value, "text")};
}

std::optional<Deprecation> deprecated_field(const Json::Value& object) {
    const auto& value = object["deprecated"];
    if (value.isString()) {
        return Deprecation{String(value.asString())};
    }
    if (value.isBool() && value.asBool()) {
        return Deprecation{};
    }
    return std::nullopt;
}

std::optional<Reference> parse_reference(const Json::Value& value) {
    if (!value.isObject()) {
        return std::nullopt;
    }
    Reference ref;
    ref.name = string_field(value, "name");
    ref.package = string_field(value, "package");
    ref.module = string_field(value, "module");
    if (ref.name.empty()) {
        return std::nullopt;
    }
    return ref;
}

// Calls parse_one for every object element of object[key]
template<typename T, typename F>
std::vector<T> parse_array(const Json::Value& object, const char* key, F&& parse_one) {
    std::vector<T> result;
    const auto& array = object[key];
    if (!array.isArray()) {
        return result;
    }
    result.reserve(array.size());
    for (const auto& item : array) {
        if (item.isObject()) {
            result.push_back(parse_one(item));
        }
    }
    return result;
}

Attribute parse_attribute(const Json::Value& value) {
    Attribute attr;
    attr.name = string_field(value, "name");
    attr.summary = string_field(value, "summary");
    attr.description = string_field(value, "description");
    attr.type = type_field(value);
    attr.default_value = string_field(value, "default");
    attr.field_name = string_field(value, "fieldName");
    attr.required = bool_field(value, "required");
    attr.deprecated = deprecated_field(value);
    return attr;
}

Event parse_event(const Json::Value& value) {
    Event event;
    event.name = string_field(value, "name");
    event.summary = string_field(value, "summary");
    event.description = string_field(value, "description");
    event.type = type_field(value);
    event.deprecated = deprecated_field(value);
    return event;
}

Slot parse_slot(const Json::Value& value) {
    Slot slot;
    slot.name = string_field(value, "name");
    slot.summary = string_field(value, "summary");
    slot.description = string_field(value, "description");
    slot.deprecated = deprecated_field(value);
    return slot;
}

CssPart parse_css_part(const Json::Value& value) {
    CssPart part;
    part.name = string_field(value, "name");
    part.summary = string_field(value, "summary");
    part.description = string_field(value, "description");
    part.deprecated = deprecated_field(value);
    return part;
}

CssCustomProperty parse_css_property(const Json::Value& value) {
    CssCustomProperty prop;
    prop.name = string_field(value, "name");
    prop.summary = string_field(value, "summary");
    prop.description = string_field(value, "description");
    prop.syntax = string_field(value, "syntax");
    prop.inherits = bool_field(value, "inherits");
    prop.initial = string_field(value, "initialValue");
    prop.default_value = string_field(value, "default");
    prop.deprecated = deprecated_field(value);
    return prop;
}

CssCustomState parse_css_state(const Json::Value& value) {
    CssCustomState state;
    state.name = string_field(value, "name");
    state.summary = string_field(value, "summary");
    state.description = string_field(value, "description");
    state.deprecated = deprecated_field(value);
    return state;
}

Demo parse_demo(const Json::Value& value) {
    return Demo{string_field(value, "url"), string_field(value, "description")};
}

bool is_custom_element(const Json::Value& value) {
    const auto& tag = value["tagName"];
    if (tag.isString() && !tag.asString().empty()) {
        return true;
    }
    return bool_field(value, "customElement");
}

CustomElementDeclaration parse_declaration(const Json::Value& value) {
    CustomElementDeclaration decl;
    decl.kind = string_field(value, "kind");
    decl.name = string_field(value, "name");
    decl.tag_name = string_field(value, "tagName");
    decl.summary = string_field(value, "summary");
    decl.description = string_field(value, "description");
    decl.superclass = parse_reference(value["superclass"]);

    const auto& mixins = value["mixins"];
    if (mixins.isArray()) {
        for (const auto& mixin : mixins) {
            if (auto ref = parse_reference(mixin)) {
                decl.mixins.push_back(std::move(*ref));
            }
        }
    }

    decl.attributes = parse_array<Attribute>(value, "attributes", parse_attribute);
    decl.events = parse_array<Event>(value, "events", parse_event);
    decl.slots = parse_array<Slot>(value, "slots", parse_slot);
    decl.css_parts = parse_array<CssPart>(value, "cssParts", parse_css_part);
    decl.css_properties = parse_array<CssCustomProperty>(value, "cssProperties", parse_css_property);
    decl.css_states = parse_array<CssCustomState>(value, "cssStates", parse_css_state);
    decl.demos = parse_array<Demo>(value, "demos", parse_demo);
    decl.deprecated = deprecated_field(value);
    return decl;
}

Result<Module, String> parse_module(const Json::Value& value) {
    Module module;
    module.kind = string_field(value, "kind");
    module.path = string_field(value, "path");

    const auto& declarations = value["declarations"];
    if (declarations.isNull()) {
        return module;
    }
    if (!declarations.isArray()) {
        return make_error("module \""_s + module.path + "\": declarations is not an array");
    }

    for (const auto& decl : declarations) {
        if (decl.isObject() && is_custom_element(decl)) {
            module.declarations.push_back(parse_declaration(decl));
        }
    }
    return module;
}

} // namespace

usize Package::element_count() const {
    usize count = 0;
    for (const auto& module : modules) {
        count += module.declarations.size();
    }
    return count;
}

Result<Package, String> parse_package(std::string_view json_text) {
    Json::CharReaderBuilder builder;
    Json::CharReaderBuilder::strictMode(&builder.settings_);
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    try {
        if (!reader->parse(json_text.data(), json_text.data() + json_text.size(), &root, &errors)) {
            return make_error("invalid JSON: "_s + String(errors).trim());
        }
    } catch (const Json::Exception& e) {
        // Nesting deeper than the reader's stack limit throws
        return make_error("invalid JSON: "_s + e.what());
    }

    if (!root.isObject()) {
        return make_error("manifest root is not an object"_s);
    }

    Package package;
    package.schema_version = string_field(root, "schemaVersion");
    package.readme = string_field(root, "readme");

    const auto& modules = root["modules"];
    if (modules.isNull()) {
        return package;
    }
    if (!modules.isArray()) {
        return make_error("manifest modules is not an array"_s);
    }

    for (const auto& value : modules) {
        if (!value.isObject()) {
            continue;
        }
        auto module = parse_module(value);
        if (module.is_err()) {
            return make_error(module.error());
        }
        package.modules.push_back(std::move(module).value());
    }

    logger().debug_fmt("parsed manifest: schema {} with {} modules, {} elements",
                    package.schema_version, package.modules.size(), package.element_count());
    return package;
}

Result<Package, String> parse_package_file(const String& path) {
    std::ifstream file(path.std_string(), std::ios::binary);
    if (!file) {
        return make_error("cannot open manifest \""_s + path + "\"");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    auto text = buffer.str();

    auto package = parse_package(text);
    if (package.is_err()) {
        return make_error("failed to parse manifest \""_s + path + "\": " + package.error());
    }
    return package;
}

} // namespace cemkit::manifest
