#include "cemkit/registry/conversion.hpp"
#include "cemkit/registry/guidelines.hpp"
#include <algorithm>

namespace cemkit::registry {

namespace {

constexpr usize MAX_EXAMPLE_ATTRIBUTES = 3;
constexpr usize MAX_EXAMPLE_SLOTS = 2;

String unquote(const String& text) {
    return text.trim().trim_matches("\"'`");
}

String example_attribute(const AttributeItem& attr) {
    if (!attr.default_value.empty()) {
        return attr.name + "=\"" + unquote(attr.default_value) + "\"";
    }

    auto type = attr.type.trim();
    if (type == "boolean") {
        return attr.name;
    }
    if (type == "string") {
        return attr.name + "=\"example\"";
    }
    if (type == "number") {
        return attr.name + "=\"0\"";
    }
    if (!attr.values.empty()) {
        return attr.name + "=\"" + attr.values.front() + "\"";
    }
    return attr.name + "=\"value\"";
}

String slot_content(const String& slot_name) {
    if (slot_name.empty()) {
        return "Default content"_s;
    }
    return "<span slot=\""_s + slot_name + "\">" + slot_name + " content</span>";
}

struct Converter {
    const ConversionOptions& options;
    const String& tag_name;

    [[nodiscard]] String sanitize(const String& text) const {
        return sanitize_description(text, options.max_description_length);
    }

    // Items fall back to the summary when there is no description
    void fill_base(ItemBase& base, const String& name, const String& summary, const String& description) const {
        base.name = name;
        base.description = sanitize(description.empty() ? summary : description);
        base.guidelines = extract_guidelines(base.description);
    }

    void add_example(ItemBase& base, String code) const {
        if (options.generate_examples) {
            base.examples.push_back(std::move(code));
        }
    }

    [[nodiscard]] AttributeItem attribute(const manifest::Attribute& attr) const {
        AttributeItem item;
        fill_base(item, attr.name, attr.summary, attr.description);
        if (attr.type) {
            item.type = attr.type->text;
            item.values = extract_enum_values(attr.type->text);
        }
        item.default_value = attr.default_value;
        item.required = attr.required;
        add_example(item, "<"_s + tag_name + " " + example_attribute(item) + "></" + tag_name + ">");
        return item;
    }

    [[nodiscard]] SlotItem slot(const manifest::Slot& slot) const {
        SlotItem item;
        fill_base(item, slot.name, slot.summary, slot.description);
        add_example(item, "<"_s + tag_name + ">" + slot_content(slot.name) + "</" + tag_name + ">");
        return item;
    }

    [[nodiscard]] EventItem event(const manifest::Event& event) const {
        EventItem item;
        fill_base(item, event.name, event.summary, event.description);
        if (event.type) {
            item.type = event.type->text;
        }
        add_example(item, "document.querySelector(\""_s + tag_name + "\").addEventListener(\"" +
                              event.name + "\", (event) => {});");
        return item;
    }

    [[nodiscard]] CssPropertyItem css_property(const manifest::CssCustomProperty& prop) const {
        CssPropertyItem item;
        fill_base(item, prop.name, prop.summary, prop.description);
        item.syntax = prop.syntax;
        item.inherits = prop.inherits;
        item.initial = prop.initial.empty() ? prop.default_value : prop.initial;
        add_example(item, tag_name + " { " + prop.name + ": " +
                              (item.initial.empty() ? "initial"_s : item.initial) + "; }");
        return item;
    }

    [[nodiscard]] CssPartItem css_part(const manifest::CssPart& part) const {
        CssPartItem item;
        fill_base(item, part.name, part.summary, part.description);
        add_example(item, tag_name + "::part(" + part.name + ") { }");
        return item;
    }

    [[nodiscard]] CssStateItem css_state(const manifest::CssCustomState& state) const {
        CssStateItem item;
        fill_base(item, state.name, state.summary, state.description);
        add_example(item, tag_name + ":state(" + state.name + ") { }");
        return item;
    }
};

} // namespace

std::vector<String> extract_enum_values(const String& type_text) {
    std::vector<String> values;
    if (!type_text.contains('|')) {
        return values;
    }

    for (const auto& part : type_text.split('|')) {
        auto value = unquote(part);
        if (!value.empty()) {
            values.push_back(std::move(value));
        }
    }
    return values;
}

std::vector<ExampleInfo> generate_examples(const ElementInfo& info) {
    std::vector<ExampleInfo> examples;
    if (info.tag_name.empty()) {
        return examples;
    }

    const auto& tag = info.tag_name;
    auto open = "<"_s + tag;
    auto close = "</"_s + tag + ">";

    examples.push_back({
        "Basic Usage"_s,
        "Standard implementation of "_s + tag,
        open + ">" + close,
        "html"_s,
    });

    auto attributes = info.attributes();
    if (!attributes.empty()) {
        std::vector<String> parts;
        auto count = std::min(attributes.size(), MAX_EXAMPLE_ATTRIBUTES);
        for (usize i = 0; i < count; ++i) {
            parts.push_back(example_attribute(*attributes[i]));
        }
        examples.push_back({
            "With Attributes"_s,
            "Using "_s + tag + " with common attributes",
            open + " " + join(parts, " ") + ">" + close,
            "html"_s,
        });
    }

    auto slots = info.slots();
    if (!slots.empty()) {
        std::vector<String> content;
        auto count = std::min(slots.size(), MAX_EXAMPLE_SLOTS);
        for (usize i = 0; i < count; ++i) {
            content.push_back(slot_content(slots[i]->name));
        }
        examples.push_back({
            "With Content Slots"_s,
            "Using "_s + tag + " with slotted content",
            open + ">\n  " + join(content, "\n  ") + "\n" + close,
            "html"_s,
        });
    }

    return examples;
}

ElementInfo convert_element(const workspace::ElementDefinition& definition, const ConversionOptions& options) {
    const Converter converter{options, definition.tag_name};
    const auto& decl = definition.declaration;

    ElementInfo info;
    info.tag_name = definition.tag_name;
    info.name = definition.class_name.empty() ? definition.tag_name : definition.class_name;
    info.summary = converter.sanitize(decl.summary);
    info.description = converter.sanitize(decl.description);
    info.module = definition.module_path;
    info.package = definition.package_name;
    info.deprecated = decl.deprecated.has_value();

    info.items.reserve(decl.attributes.size() + decl.slots.size() + decl.events.size() +
                       decl.css_properties.size() + decl.css_parts.size() + decl.css_states.size());

    for (const auto& attr : decl.attributes) {
        info.items.emplace_back(converter.attribute(attr));
    }
    for (const auto& slot : decl.slots) {
        info.items.emplace_back(converter.slot(slot));
    }
    for (const auto& event : decl.events) {
        info.items.emplace_back(converter.event(event));
    }
    for (const auto& prop : decl.css_properties) {
        info.items.emplace_back(converter.css_property(prop));
    }
    for (const auto& part : decl.css_parts) {
        info.items.emplace_back(converter.css_part(part));
    }
    for (const auto& state : decl.css_states) {
        info.items.emplace_back(converter.css_state(state));
    }

    for (const auto& guideline : element_guidelines(decl)) {
        info.guidelines.push_back(converter.sanitize(guideline));
    }

    if (options.generate_examples) {
        info.examples = generate_examples(info);
    }

    return info;
}

} // namespace cemkit::registry
