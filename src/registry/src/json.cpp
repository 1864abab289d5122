#include "cemkit/registry/json.hpp"
#include <type_traits>

namespace cemkit::registry {

namespace {

Json::Value string_value(const String& s) {
    return Json::Value(s.std_string());
}

} // namespace

Json::Value to_json(const std::vector<String>& strings) {
    Json::Value array(Json::arrayValue);
    for (const auto& s : strings) {
        array.append(string_value(s));
    }
    return array;
}

Json::Value to_json(const Item& item) {
    const auto& base = base_of(item);

    Json::Value value(Json::objectValue);
    value["kind"] = std::string(item_kind_name(kind_of(item)));
    value["name"] = string_value(base.name);
    value["description"] = string_value(base.description);
    value["guidelines"] = to_json(base.guidelines);
    value["examples"] = to_json(base.examples);

    std::visit([&value](const auto& i) {
        using T = std::decay_t<decltype(i)>;
        if constexpr (std::is_base_of_v<Typed, T>) {
            value["type"] = string_value(i.type);
        }
        if constexpr (std::is_base_of_v<Defaultable, T>) {
            value["default"] = string_value(i.default_value);
        }
        if constexpr (std::is_base_of_v<Enumerable, T>) {
            value["values"] = to_json(i.values);
        }
        if constexpr (std::is_same_v<T, AttributeItem>) {
            value["required"] = i.required;
        }
        if constexpr (std::is_same_v<T, CssPropertyItem>) {
            value["syntax"] = string_value(i.syntax);
            value["inherits"] = i.inherits;
            value["initial"] = string_value(i.initial);
        }
    }, item);

    return value;
}

Json::Value to_json(const ExampleInfo& example) {
    Json::Value value(Json::objectValue);
    value["title"] = string_value(example.title);
    value["description"] = string_value(example.description);
    value["code"] = string_value(example.code);
    value["language"] = string_value(example.language);
    return value;
}

Json::Value to_json(const ElementInfo& info) {
    Json::Value value(Json::objectValue);
    value["tagName"] = string_value(info.tag_name);
    value["name"] = string_value(info.name);
    value["summary"] = string_value(info.summary);
    value["description"] = string_value(info.description);
    value["module"] = string_value(info.module);
    value["package"] = string_value(info.package);
    value["deprecated"] = info.deprecated;

    Json::Value items(Json::arrayValue);
    for (const auto& item : info.items) {
        items.append(to_json(item));
    }
    value["items"] = std::move(items);
    value["guidelines"] = to_json(info.guidelines);

    Json::Value examples(Json::arrayValue);
    for (const auto& example : info.examples) {
        examples.append(to_json(example));
    }
    value["examples"] = std::move(examples);
    return value;
}

Json::Value to_json(const Relationship& relationship) {
    Json::Value value(Json::objectValue);
    value["target"] = string_value(relationship.target_tag_name);
    value["type"] = std::string(relationship_type_name(relationship.type));
    value["via"] = string_value(relationship.via);
    value["label"] = string_value(relationship.label());
    return value;
}

Json::Value to_json(const std::vector<Relationship>& relationships) {
    Json::Value array(Json::arrayValue);
    for (const auto& relationship : relationships) {
        array.append(to_json(relationship));
    }
    return array;
}

String to_json_string(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return String(Json::writeString(builder, value));
}

} // namespace cemkit::registry
