#include <gtest/gtest.h>
#include "cemkit/registry/conversion.hpp"
#include "support/fake_workspace.hpp"

using namespace cemkit;
using namespace cemkit::registry;

namespace {

workspace::ElementDefinition button_definition() {
    auto decl = test_support::element("x-button", "XButton");
    decl.summary = "A <button>.";
    decl.description = "Triggers actions. Use variant for emphasis.";

    manifest::Attribute variant;
    variant.name = "variant";
    variant.description = "Visual style. Should match the surrounding UI.";
    variant.type = manifest::Type{"'primary' | 'secondary' | \"danger\""};
    variant.default_value = "'primary'";
    variant.required = true;
    decl.attributes.push_back(variant);

    manifest::Attribute disabled;
    disabled.name = "disabled";
    disabled.summary = "Disables the button.";
    disabled.type = manifest::Type{"boolean"};
    decl.attributes.push_back(disabled);

    manifest::Attribute label;
    label.name = "label";
    label.type = manifest::Type{"string"};
    decl.attributes.push_back(label);

    manifest::Attribute size;
    size.name = "size";
    size.type = manifest::Type{"number"};
    decl.attributes.push_back(size);

    manifest::Slot default_slot;
    default_slot.description = "Label content.";
    decl.slots.push_back(default_slot);

    manifest::Slot icon;
    icon.name = "icon";
    decl.slots.push_back(icon);

    manifest::Slot suffix;
    suffix.name = "suffix";
    decl.slots.push_back(suffix);

    manifest::Event click;
    click.name = "x-click";
    click.type = manifest::Type{"CustomEvent<{ id: string }>"};
    decl.events.push_back(click);

    manifest::CssCustomProperty color;
    color.name = "--x-button-color";
    color.syntax = "<color>";
    color.inherits = true;
    color.default_value = "blue";
    decl.css_properties.push_back(color);

    manifest::CssPart base;
    base.name = "base";
    decl.css_parts.push_back(base);

    manifest::CssCustomState pressed;
    pressed.name = "pressed";
    decl.css_states.push_back(pressed);

    workspace::ElementDefinition definition;
    definition.tag_name = decl.tag_name;
    definition.class_name = decl.name;
    definition.module_path = "src/button.js";
    definition.package_name = "x-kit";
    definition.declaration = decl;
    return definition;
}

} // namespace

// ============================================================================
// Enum values
// ============================================================================

TEST(ConversionTest, ExtractEnumValues) {
    auto values = extract_enum_values("'primary' | 'secondary' | \"danger\"");

    ASSERT_EQ(values.size(), 3u);
    EXPECT_EQ(values[0], "primary");
    EXPECT_EQ(values[1], "secondary");
    EXPECT_EQ(values[2], "danger");
}

TEST(ConversionTest, NonUnionTypesHaveNoEnumValues) {
    EXPECT_TRUE(extract_enum_values("string").empty());
    EXPECT_TRUE(extract_enum_values("").empty());
    EXPECT_EQ(extract_enum_values("'a' | | ''").size(), 1u);
}

// ============================================================================
// Element conversion
// ============================================================================

TEST(ConversionTest, ElementFields) {
    auto info = convert_element(button_definition());

    EXPECT_EQ(info.tag_name, "x-button");
    EXPECT_EQ(info.name, "XButton");
    EXPECT_EQ(info.summary, "A &lt;button&gt;.");
    EXPECT_EQ(info.module, "src/button.js");
    EXPECT_EQ(info.package, "x-kit");
    EXPECT_FALSE(info.deprecated);
}

TEST(ConversionTest, NameFallsBackToTag) {
    workspace::ElementDefinition definition;
    definition.tag_name = "x-anon";
    definition.declaration = test_support::element("x-anon");

    auto info = convert_element(definition);
    EXPECT_EQ(info.name, "x-anon");
    EXPECT_TRUE(info.items.empty());
}

TEST(ConversionTest, ItemsInKindOrder) {
    auto info = convert_element(button_definition());

    ASSERT_EQ(info.items.size(), 11u);
    EXPECT_EQ(kind_of(info.items[0]), ItemKind::Attribute);
    EXPECT_EQ(kind_of(info.items[4]), ItemKind::Slot);
    EXPECT_EQ(kind_of(info.items[7]), ItemKind::Event);
    EXPECT_EQ(kind_of(info.items[8]), ItemKind::CssProperty);
    EXPECT_EQ(kind_of(info.items[9]), ItemKind::CssPart);
    EXPECT_EQ(kind_of(info.items[10]), ItemKind::CssState);

    EXPECT_EQ(info.attributes().size(), 4u);
    EXPECT_EQ(info.slots().size(), 3u);
    EXPECT_EQ(info.items_by_kind(ItemKind::Event).size(), 1u);
}

TEST(ConversionTest, AttributeItem) {
    auto info = convert_element(button_definition());
    const auto* variant = info.attributes()[0];

    EXPECT_EQ(variant->name, "variant");
    EXPECT_EQ(variant->type, "'primary' | 'secondary' | \"danger\"");
    EXPECT_EQ(variant->default_value, "'primary'");
    EXPECT_TRUE(variant->required);
    ASSERT_EQ(variant->values.size(), 3u);
    EXPECT_EQ(variant->values[0], "primary");
    ASSERT_EQ(variant->guidelines.size(), 1u);
    EXPECT_EQ(variant->guidelines[0], "Should match the surrounding UI.");

    const auto* disabled = info.attributes()[1];
    EXPECT_FALSE(disabled->required);
    EXPECT_TRUE(disabled->values.empty());
    // Summary stands in for a missing description
    EXPECT_EQ(disabled->description, "Disables the button.");
}

TEST(ConversionTest, EventAndCssItems) {
    auto info = convert_element(button_definition());

    ASSERT_EQ(info.events().size(), 1u);
    EXPECT_EQ(info.events()[0]->type, "CustomEvent<{ id: string }>");

    ASSERT_EQ(info.css_properties().size(), 1u);
    const auto* color = info.css_properties()[0];
    EXPECT_EQ(color->syntax, "<color>");
    EXPECT_TRUE(color->inherits);
    EXPECT_EQ(color->initial, "blue");

    EXPECT_EQ(info.css_parts()[0]->name, "base");
    EXPECT_EQ(info.css_states()[0]->name, "pressed");
}

TEST(ConversionTest, ElementGuidelinesAreSanitized) {
    auto definition = button_definition();
    definition.declaration.attributes[0].description = "Uses <em>style</em>.";

    auto info = convert_element(definition);
    ASSERT_FALSE(info.guidelines.empty());
    EXPECT_EQ(info.guidelines[0], "variant: Uses &lt;em&gt;style&lt;/em&gt;.");
    EXPECT_EQ(info.guidelines.back(), "Use variant for emphasis.");
}

TEST(ConversionTest, DeprecatedElement) {
    auto definition = button_definition();
    definition.declaration.deprecated = manifest::Deprecation{"use x-action"};

    EXPECT_TRUE(convert_element(definition).deprecated);
}

TEST(ConversionTest, DescriptionLimitFromOptions) {
    auto definition = button_definition();
    definition.declaration.description = String(100, 'd');

    ConversionOptions options;
    options.max_description_length = 20;
    auto info = convert_element(definition, options);

    EXPECT_EQ(info.description, String(20, 'd') + "...");
}

// ============================================================================
// Examples
// ============================================================================

TEST(ConversionTest, GeneratesExamples) {
    auto info = convert_element(button_definition());

    ASSERT_EQ(info.examples.size(), 3u);

    EXPECT_EQ(info.examples[0].title, "Basic Usage");
    EXPECT_EQ(info.examples[0].code, "<x-button></x-button>");
    EXPECT_EQ(info.examples[0].language, "html");

    // First three attributes only
    EXPECT_EQ(info.examples[1].title, "With Attributes");
    EXPECT_EQ(info.examples[1].code, "<x-button variant=\"primary\" disabled label=\"example\"></x-button>");

    // First two slots only
    EXPECT_EQ(info.examples[2].title, "With Content Slots");
    EXPECT_EQ(info.examples[2].code,
              "<x-button>\n  Default content\n  <span slot=\"icon\">icon content</span>\n</x-button>");
}

TEST(ConversionTest, ExamplesForBareElement) {
    ElementInfo info;
    info.tag_name = "x-plain";

    auto examples = generate_examples(info);
    ASSERT_EQ(examples.size(), 1u);
    EXPECT_EQ(examples[0].code, "<x-plain></x-plain>");
}

TEST(ConversionTest, NumberAndUnknownPlaceholders) {
    ElementInfo info;
    info.tag_name = "x-meter";

    AttributeItem value;
    value.name = "value";
    value.type = "number";
    info.items.emplace_back(value);

    AttributeItem mode;
    mode.name = "mode";
    mode.type = "Mode";
    info.items.emplace_back(mode);

    auto examples = generate_examples(info);
    ASSERT_EQ(examples.size(), 2u);
    EXPECT_EQ(examples[1].code, "<x-meter value=\"0\" mode=\"value\"></x-meter>");
}

TEST(ConversionTest, ExamplesCanBeDisabled) {
    ConversionOptions options;
    options.generate_examples = false;

    auto info = convert_element(button_definition(), options);
    EXPECT_TRUE(info.examples.empty());
    for (const auto& item : info.items) {
        EXPECT_TRUE(base_of(item).examples.empty());
    }
}

TEST(ConversionTest, ItemExamples) {
    auto info = convert_element(button_definition());

    auto attributes = info.attributes();
    ASSERT_EQ(attributes.size(), 4u);
    EXPECT_EQ(attributes[0]->examples, (std::vector<String>{"<x-button variant=\"primary\"></x-button>"}));
    EXPECT_EQ(attributes[1]->examples, (std::vector<String>{"<x-button disabled></x-button>"}));

    auto slots = info.slots();
    ASSERT_EQ(slots.size(), 3u);
    EXPECT_EQ(slots[0]->examples, (std::vector<String>{"<x-button>Default content</x-button>"}));
    EXPECT_EQ(slots[1]->examples,
              (std::vector<String>{"<x-button><span slot=\"icon\">icon content</span></x-button>"}));

    auto events = info.events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0]->examples,
              (std::vector<String>{"document.querySelector(\"x-button\").addEventListener(\"x-click\", (event) => {});"}));

    auto properties = info.css_properties();
    ASSERT_EQ(properties.size(), 1u);
    EXPECT_EQ(properties[0]->examples, (std::vector<String>{"x-button { --x-button-color: blue; }"}));

    EXPECT_EQ(info.css_parts()[0]->examples, (std::vector<String>{"x-button::part(base) { }"}));
    EXPECT_EQ(info.css_states()[0]->examples, (std::vector<String>{"x-button:state(pressed) { }"}));
}

TEST(ConversionTest, CssPropertyExampleWithoutInitialValue) {
    auto definition = button_definition();
    definition.declaration.css_properties[0].default_value = "";

    auto info = convert_element(definition);
    EXPECT_EQ(info.css_properties()[0]->examples, (std::vector<String>{"x-button { --x-button-color: initial; }"}));
}
