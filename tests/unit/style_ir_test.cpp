#include <stylec/ir/style_ir.h>

#include <gtest/gtest.h>

#include <string>

using namespace stylec::ir;

// ---------------------------------------------------------------------------
// Selector specs
// ---------------------------------------------------------------------------
TEST(StyleIRTest, SelectorTextForEachSpec) {
    EXPECT_EQ(selector_text(self()), "&");
    EXPECT_EQ(selector_text(pseudo("hover")), "&:hover");
    EXPECT_EQ(selector_text(pseudo_element("before")), "&::before");
    EXPECT_EQ(selector_text(descendant(".icon")), "& .icon");
    EXPECT_EQ(selector_text(child("a")), "& > a");
    EXPECT_EQ(selector_text(next_sibling("li")), "& + li");
    EXPECT_EQ(selector_text(subsequent_sibling("p")), "& ~ p");
    EXPECT_EQ(selector_text(compound(".active")), "&.active");
    EXPECT_EQ(selector_text(media("(max-width: 768px)")), "@media (max-width: 768px)");
}

TEST(StyleIRTest, SelectorTextDoesNotValidate) {
    EXPECT_EQ(selector_text(pseudo(" hover")), "&: hover");
    EXPECT_EQ(selector_text(descendant("")), "& ");
}

TEST(StyleIRTest, SpecPredicates) {
    EXPECT_TRUE(is_self(self()));
    EXPECT_FALSE(is_self(pseudo("hover")));
    EXPECT_TRUE(is_media(media("(min-width: 1px)")));
    EXPECT_FALSE(is_media(child("a")));
}

TEST(StyleIRTest, SpecEquality) {
    EXPECT_EQ(pseudo("hover"), pseudo("hover"));
    EXPECT_NE(pseudo("hover"), pseudo_element("hover"));
    EXPECT_NE(child("a"), descendant("a"));
    EXPECT_EQ(media("(a: b)"), media("(a: b)"));
}

TEST(StyleIRTest, CombinatorKindNames) {
    EXPECT_STREQ(combinator_kind_name(CombinatorKind::Child), "child");
    EXPECT_STREQ(combinator_kind_name(CombinatorKind::Compound), "compound");
}

// ---------------------------------------------------------------------------
// Rule tree building
// ---------------------------------------------------------------------------
TEST(StyleIRTest, DefaultRootIsSelf) {
    ComponentStyleSheet sheet("button");
    EXPECT_EQ(sheet.name, "button");
    EXPECT_TRUE(is_self(sheet.root.selector));
    EXPECT_TRUE(sheet.root.empty());
    EXPECT_EQ(sheet.root.node_count(), 1u);
}

TEST(StyleIRTest, AddDeclarationChains) {
    RuleNode node;
    node.add_declaration("display", "flex").add_declaration("color", "red");
    ASSERT_EQ(node.declarations.size(), 2u);
    EXPECT_EQ(node.declarations[1].property, "color");
    EXPECT_FALSE(node.empty());
}

TEST(StyleIRTest, ChildReferencesStayValidWhileSiblingsAreAdded) {
    ComponentStyleSheet sheet("card");
    RuleNode& hover = sheet.root.add_child(pseudo("hover"));
    for (int i = 0; i < 32; ++i) {
        sheet.root.add_child(descendant(".item" + std::to_string(i)));
    }
    hover.add_declaration("color", "red");

    const RuleNode* found = sheet.root.find_child(pseudo("hover"));
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found, &hover);
    ASSERT_EQ(found->declarations.size(), 1u);
    EXPECT_EQ(sheet.root.node_count(), 34u);
}

TEST(StyleIRTest, ChildForReusesExistingChild) {
    RuleNode root;
    RuleNode& first = root.child_for(media("(max-width: 10px)"));
    RuleNode& second = root.child_for(media("(max-width: 10px)"));
    EXPECT_EQ(&first, &second);
    EXPECT_EQ(root.children.size(), 1u);

    root.child_for(media("(max-width: 20px)"));
    EXPECT_EQ(root.children.size(), 2u);
}

TEST(StyleIRTest, FindChildMissingReturnsNull) {
    RuleNode root;
    root.add_child(pseudo("hover"));
    EXPECT_EQ(root.find_child(pseudo("focus")), nullptr);
}

TEST(StyleIRTest, NodeCountIsRecursive) {
    RuleNode root;
    auto& media_node = root.add_child(media("(max-width: 1px)"));
    media_node.add_child(pseudo("hover")).add_child(child("span"));
    EXPECT_EQ(root.node_count(), 4u);
}

// ---------------------------------------------------------------------------
// Keyframes and modules
// ---------------------------------------------------------------------------
TEST(StyleIRTest, KeyframesBuilder) {
    ComponentStyleSheet sheet("animation_fade");
    auto& block = sheet.add_keyframes("fade");
    block.add_step("from").add_declaration("opacity", "0");
    block.add_step("to").add_declaration("opacity", "1");

    ASSERT_EQ(sheet.keyframes.size(), 1u);
    ASSERT_EQ(sheet.keyframes.front().steps.size(), 2u);
    EXPECT_EQ(sheet.keyframes.front().steps.back().selector, "to");
}

TEST(StyleIRTest, ModuleOwnsSheets) {
    StyleModule module("button");
    auto& primary = module.add_sheet("button_primary");
    module.add_sheet("button_secondary");
    primary.root.add_declaration("color", "blue");

    auto* found = module.find_sheet("button_primary");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found, &primary);
    EXPECT_EQ(module.find_sheet("missing"), nullptr);
}

// ---------------------------------------------------------------------------
// Equality
// ---------------------------------------------------------------------------
TEST(StyleIRTest, SheetEqualityIsStructural) {
    ComponentStyleSheet a("x");
    a.root.add_declaration("color", "red");
    a.root.add_child(pseudo("hover")).add_declaration("color", "blue");

    ComponentStyleSheet b("x");
    b.root.add_declaration("color", "red");
    b.root.add_child(pseudo("hover")).add_declaration("color", "blue");

    EXPECT_EQ(a, b);

    b.root.children.front().declarations[0].value = "green";
    EXPECT_FALSE(a == b);
}

TEST(StyleIRTest, ChildOrderMatters) {
    RuleNode a;
    a.add_child(pseudo("hover"));
    a.add_child(pseudo("focus"));

    RuleNode b;
    b.add_child(pseudo("focus"));
    b.add_child(pseudo("hover"));

    EXPECT_FALSE(a == b);
}
