#include <gtest/gtest.h>
#include "cemkit/registry/relationships.hpp"
#include "support/fake_workspace.hpp"

using namespace cemkit;
using namespace cemkit::registry;
using namespace cemkit::test_support;

namespace {

ElementData data(const String& tag, const String& class_name, const String& module = "src/a.js"_s,
                 const String& package = "pkg"_s) {
    ElementData d;
    d.tag_name = tag;
    d.class_name = class_name;
    d.module_path = module;
    d.package_name = package;
    return d;
}

ElementData extending(ElementData d, const String& superclass) {
    d.superclass = manifest::Reference{superclass, String(), String()};
    return d;
}

ElementData mixing(ElementData d, std::initializer_list<const char*> mixins) {
    for (const auto* mixin : mixins) {
        d.mixins.push_back(manifest::Reference{String(mixin), String(), String()});
    }
    return d;
}

} // namespace

TEST(RelationshipDetectorTest, UnknownTagYieldsEmpty) {
    RelationshipDetector detector;
    EXPECT_TRUE(detector.detect("unknown-tag").empty());

    detector.add_element(data("x-a", "A"));
    EXPECT_TRUE(detector.detect("unknown-tag").empty());
}

TEST(RelationshipDetectorTest, LoneElementHasNoEdges) {
    RelationshipDetector detector;
    detector.add_element(data("x-a", "A"));

    EXPECT_TRUE(detector.detect("x-a").empty());
}

TEST(RelationshipDetectorTest, SuperclassAndSubclass) {
    RelationshipDetector detector;
    detector.add_element(data("x-base", "Base", "base.js", "p1"));
    detector.add_element(extending(data("x-button", "Button", "button.js", "p2"), "Base"));

    auto button = detector.detect("x-button");
    ASSERT_EQ(button.size(), 1u);
    EXPECT_EQ(button[0].target_tag_name, "x-base");
    EXPECT_EQ(button[0].type, RelationshipType::Superclass);
    EXPECT_EQ(button[0].label(), "extends Base");

    auto base = detector.detect("x-base");
    ASSERT_EQ(base.size(), 1u);
    EXPECT_EQ(base[0].target_tag_name, "x-button");
    EXPECT_EQ(base[0].type, RelationshipType::Subclass);
    EXPECT_EQ(base[0].label(), "extended by x-button");
}

TEST(RelationshipDetectorTest, UnresolvedSuperclassKeepsName) {
    RelationshipDetector detector;
    detector.add_element(extending(data("x-a", "A"), "LitElement"));

    auto rels = detector.detect("x-a");
    ASSERT_EQ(rels.size(), 1u);
    EXPECT_TRUE(rels[0].target_tag_name.empty());
    EXPECT_EQ(rels[0].via, "LitElement");
    EXPECT_EQ(rels[0].type, RelationshipType::Superclass);
}

TEST(RelationshipDetectorTest, SharedMixins) {
    RelationshipDetector detector;
    detector.add_element(mixing(data("x-a", "A", "a.js", "p1"), {"FocusMixin", "SoloMixin"}));
    detector.add_element(mixing(data("x-b", "B", "b.js", "p2"), {"FocusMixin"}));

    auto rels = detector.detect("x-a");
    ASSERT_EQ(rels.size(), 2u);
    EXPECT_EQ(rels[0], (Relationship{"x-b", RelationshipType::Mixin, "FocusMixin"}));
    EXPECT_EQ(rels[0].label(), "shares FocusMixin");
    EXPECT_TRUE(rels[1].target_tag_name.empty());
    EXPECT_EQ(rels[1].label(), "applies SoloMixin");
}

TEST(RelationshipDetectorTest, ModuleAndPackageOnlyForUnrelatedTargets) {
    RelationshipDetector detector;
    detector.add_element(data("x-base", "Base", "shared.js", "kit"));
    detector.add_element(extending(data("x-child", "Child", "shared.js", "kit"), "Base"));
    detector.add_element(data("x-peer", "Peer", "shared.js", "kit"));
    detector.add_element(data("x-far", "Far", "far.js", "kit"));
    detector.add_element(data("y-other", "Other", "other.js", "elsewhere"));

    auto rels = detector.detect("x-child");
    ASSERT_EQ(rels.size(), 3u);
    EXPECT_EQ(rels[0], (Relationship{"x-base", RelationshipType::Superclass, "Base"}));
    EXPECT_EQ(rels[1], (Relationship{"x-peer", RelationshipType::Module, "shared.js"}));
    EXPECT_EQ(rels[2], (Relationship{"x-far", RelationshipType::Package, "kit"}));
    EXPECT_EQ(rels[1].label(), "same module");
    EXPECT_EQ(rels[2].label(), "same package");
}

TEST(RelationshipDetectorTest, FirstWriterWins) {
    RelationshipDetector detector;
    EXPECT_TRUE(detector.add_element(data("x-a", "First", "a.js", "p1")));
    EXPECT_FALSE(detector.add_element(extending(data("x-a", "Second", "b.js", "p2"), "Base")));

    EXPECT_EQ(detector.size(), 1u);
    EXPECT_TRUE(detector.detect("x-a").empty());
}

TEST(RelationshipDetectorTest, BuildFromStore) {
    auto child = element("x-child", "Child");
    child.superclass = manifest::Reference{"Base"_s, String(), String()};

    workspace::ElementStore store;
    store.add_package(package({element("x-base", "Base"), child}, "src/a.js"), "kit");
    store.add_package(package({element("x-base", "Duplicate")}, "src/b.js"), "other");

    auto detector = RelationshipDetector::build(store);
    EXPECT_EQ(detector.size(), 2u);
    EXPECT_TRUE(detector.contains("x-child"));

    auto rels = detector.detect("x-base");
    ASSERT_EQ(rels.size(), 1u);
    EXPECT_EQ(rels[0].type, RelationshipType::Subclass);
    EXPECT_EQ(rels[0].target_tag_name, "x-child");
}
