#include <gtest/gtest.h>
#include "cemkit/manifest/parser.hpp"
#include <filesystem>
#include <fstream>

using namespace cemkit;
using namespace cemkit::manifest;

namespace {

constexpr const char* BUTTON_MANIFEST = R"({
  "schemaVersion": "2.1.0",
  "readme": "README.md",
  "modules": [
    {
      "kind": "javascript-module",
      "path": "src/button.js",
      "declarations": [
        {
          "kind": "class",
          "name": "MyButton",
          "tagName": "my-button",
          "customElement": true,
          "summary": "A button.",
          "description": "Buttons trigger actions. Use the variant attribute for emphasis.",
          "superclass": { "name": "BaseButton", "module": "src/base.js" },
          "mixins": [ { "name": "FocusMixin", "package": "@my/mixins" }, { "package": "no-name" } ],
          "attributes": [
            {
              "name": "variant",
              "description": "Visual style.",
              "type": { "text": "'primary' | 'secondary'" },
              "default": "'primary'",
              "fieldName": "variant",
              "required": true
            },
            { "name": "disabled", "type": { "text": "boolean" }, "deprecated": "use inert" }
          ],
          "events": [ { "name": "my-click", "type": { "text": "CustomEvent" } } ],
          "slots": [ { "name": "", "description": "Label" }, { "name": "icon" } ],
          "cssParts": [ { "name": "base" } ],
          "cssProperties": [
            { "name": "--my-button-color", "syntax": "<color>", "inherits": true, "initialValue": "blue" }
          ],
          "cssStates": [ { "name": "pressed" } ],
          "demos": [ { "url": "https://example.com/demo" } ],
          "deprecated": true
        },
        { "kind": "function", "name": "helper" },
        { "kind": "class", "name": "PlainClass" }
      ]
    }
  ]
})";

} // namespace

// ============================================================================
// parse_package Tests
// ============================================================================

TEST(ManifestParserTest, ParsesPackageMetadata) {
    auto result = parse_package(BUTTON_MANIFEST);
    ASSERT_TRUE(result.is_ok()) << result.error().c_str();

    const auto& package = result.value();
    EXPECT_EQ(package.schema_version, "2.1.0");
    EXPECT_EQ(package.readme, "README.md");
    ASSERT_EQ(package.modules.size(), 1u);
    EXPECT_EQ(package.modules[0].path, "src/button.js");
    EXPECT_EQ(package.element_count(), 1u);
}

TEST(ManifestParserTest, KeepsOnlyCustomElements) {
    auto result = parse_package(BUTTON_MANIFEST);
    ASSERT_TRUE(result.is_ok());

    const auto& declarations = result.value().modules[0].declarations;
    ASSERT_EQ(declarations.size(), 1u);
    EXPECT_EQ(declarations[0].tag_name, "my-button");
    EXPECT_EQ(declarations[0].name, "MyButton");
}

TEST(ManifestParserTest, ParsesDeclaration) {
    auto result = parse_package(BUTTON_MANIFEST);
    ASSERT_TRUE(result.is_ok());
    const auto& decl = result.value().modules[0].declarations[0];

    ASSERT_TRUE(decl.superclass.has_value());
    EXPECT_EQ(decl.superclass->name, "BaseButton");
    EXPECT_EQ(decl.superclass->module, "src/base.js");

    // Mixin references without a name are dropped
    ASSERT_EQ(decl.mixins.size(), 1u);
    EXPECT_EQ(decl.mixins[0].name, "FocusMixin");
    EXPECT_EQ(decl.mixins[0].package, "@my/mixins");

    EXPECT_TRUE(decl.deprecated.has_value());
    ASSERT_EQ(decl.demos.size(), 1u);
    EXPECT_EQ(decl.demos[0].url, "https://example.com/demo");
}

TEST(ManifestParserTest, ParsesAttributes) {
    auto result = parse_package(BUTTON_MANIFEST);
    ASSERT_TRUE(result.is_ok());
    const auto& attrs = result.value().modules[0].declarations[0].attributes;

    ASSERT_EQ(attrs.size(), 2u);
    EXPECT_EQ(attrs[0].name, "variant");
    ASSERT_TRUE(attrs[0].type.has_value());
    EXPECT_EQ(attrs[0].type->text, "'primary' | 'secondary'");
    EXPECT_EQ(attrs[0].default_value, "'primary'");
    EXPECT_EQ(attrs[0].field_name, "variant");
    EXPECT_TRUE(attrs[0].required);
    EXPECT_FALSE(attrs[0].deprecated.has_value());

    EXPECT_FALSE(attrs[1].required);
    ASSERT_TRUE(attrs[1].deprecated.has_value());
    EXPECT_EQ(attrs[1].deprecated->reason, "use inert");
}

TEST(ManifestParserTest, ParsesStylingSurface) {
    auto result = parse_package(BUTTON_MANIFEST);
    ASSERT_TRUE(result.is_ok());
    const auto& decl = result.value().modules[0].declarations[0];

    ASSERT_EQ(decl.css_properties.size(), 1u);
    EXPECT_EQ(decl.css_properties[0].name, "--my-button-color");
    EXPECT_EQ(decl.css_properties[0].syntax, "<color>");
    EXPECT_TRUE(decl.css_properties[0].inherits);
    EXPECT_EQ(decl.css_properties[0].initial, "blue");

    ASSERT_EQ(decl.css_parts.size(), 1u);
    EXPECT_EQ(decl.css_parts[0].name, "base");
    ASSERT_EQ(decl.css_states.size(), 1u);
    EXPECT_EQ(decl.css_states[0].name, "pressed");

    ASSERT_EQ(decl.slots.size(), 2u);
    EXPECT_TRUE(decl.slots[0].name.empty());
    EXPECT_EQ(decl.slots[1].name, "icon");

    ASSERT_EQ(decl.events.size(), 1u);
    ASSERT_TRUE(decl.events[0].type.has_value());
    EXPECT_EQ(decl.events[0].type->text, "CustomEvent");
}

TEST(ManifestParserTest, CustomElementFlagWithoutTagName) {
    auto result = parse_package(R"({"modules":[{"path":"a.js","declarations":[
        {"kind":"class","name":"Later","customElement":true}]}]})");
    ASSERT_TRUE(result.is_ok());

    const auto& declarations = result.value().modules[0].declarations;
    ASSERT_EQ(declarations.size(), 1u);
    EXPECT_TRUE(declarations[0].tag_name.empty());
}

TEST(ManifestParserTest, MissingModulesIsEmptyPackage) {
    auto result = parse_package(R"({"schemaVersion":"1.0.0"})");
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().modules.empty());
}

TEST(ManifestParserTest, RejectsInvalidDocuments) {
    EXPECT_TRUE(parse_package("{ not json").is_err());
    EXPECT_TRUE(parse_package("[1, 2]").is_err());
    EXPECT_TRUE(parse_package(R"({"modules": {}})").is_err());
    EXPECT_TRUE(parse_package(R"({"modules":[{"declarations": 3}]})").is_err());
}

TEST(ManifestParserTest, DeepNestingIsAnError) {
    std::string nested = R"({"schemaVersion":"2.1.0","modules":[],"x":)";
    nested += std::string(2000, '[');
    nested += std::string(2000, ']');
    nested += "}";

    auto result = parse_package(nested);
    ASSERT_TRUE(result.is_err());
    EXPECT_TRUE(result.error().starts_with("invalid JSON"_s));
}

// ============================================================================
// parse_package_file Tests
// ============================================================================

TEST(ManifestParserTest, FileErrorsNameThePath) {
    auto missing = std::filesystem::temp_directory_path() / "cemkit-no-such-manifest.json";
    auto result = parse_package_file(String(missing.string()));

    ASSERT_TRUE(result.is_err());
    EXPECT_TRUE(result.error().contains(String(missing.string())));
}

TEST(ManifestParserTest, ParsesFile) {
    auto path = std::filesystem::temp_directory_path() / "cemkit-parser-test.json";
    {
        std::ofstream out(path);
        out << BUTTON_MANIFEST;
    }

    auto result = parse_package_file(String(path.string()));
    std::filesystem::remove(path);

    ASSERT_TRUE(result.is_ok()) << result.error().c_str();
    EXPECT_EQ(result.value().element_count(), 1u);
}
