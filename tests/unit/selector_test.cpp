#include <stylec/css/parser/selector.h>

#include <gtest/gtest.h>

using namespace stylec::css;

// ---------------------------------------------------------------------------
// Simple and compound selectors
// ---------------------------------------------------------------------------
TEST(SelectorTest, ClassSelector) {
    auto list = parse_selector_list(".button");
    ASSERT_FALSE(list.malformed);
    ASSERT_EQ(list.selectors.size(), 1u);
    ASSERT_EQ(list.selectors[0].parts.size(), 1u);
    const auto& simple = list.selectors[0].parts[0].compound.simple_selectors;
    ASSERT_EQ(simple.size(), 1u);
    EXPECT_EQ(simple[0].type, SimpleSelectorType::Class);
    EXPECT_EQ(simple[0].value, "button");
}

TEST(SelectorTest, CompoundSelectorKeepsOrder) {
    auto list = parse_selector_list("a.link#main[href]");
    ASSERT_FALSE(list.malformed);
    const auto& simple = list.selectors[0].parts[0].compound.simple_selectors;
    ASSERT_EQ(simple.size(), 4u);
    EXPECT_EQ(simple[0].type, SimpleSelectorType::Type);
    EXPECT_EQ(simple[1].type, SimpleSelectorType::Class);
    EXPECT_EQ(simple[2].type, SimpleSelectorType::Id);
    EXPECT_EQ(simple[2].value, "main");
    EXPECT_EQ(simple[3].type, SimpleSelectorType::Attribute);
    EXPECT_EQ(simple[3].value, "href");
}

TEST(SelectorTest, AttributeSelectorKeepsContents) {
    auto list = parse_selector_list("input[type=\"text\"]");
    ASSERT_FALSE(list.malformed);
    const auto& simple = list.selectors[0].parts[0].compound.simple_selectors;
    ASSERT_EQ(simple.size(), 2u);
    EXPECT_EQ(simple[1].attribute, "type=\"text\"");
    EXPECT_EQ(simple[1].value, "type");
    EXPECT_EQ(to_string(simple[1]), "[type=\"text\"]");
}

TEST(SelectorTest, PseudoClassesAndElements) {
    auto list = parse_selector_list("a:hover::before");
    ASSERT_FALSE(list.malformed);
    const auto& simple = list.selectors[0].parts[0].compound.simple_selectors;
    ASSERT_EQ(simple.size(), 3u);
    EXPECT_EQ(simple[1].type, SimpleSelectorType::PseudoClass);
    EXPECT_EQ(simple[1].value, "hover");
    EXPECT_EQ(simple[2].type, SimpleSelectorType::PseudoElement);
    EXPECT_EQ(simple[2].value, "before");
}

TEST(SelectorTest, LegacySingleColonPseudoElement) {
    auto list = parse_selector_list("p:after");
    ASSERT_FALSE(list.malformed);
    const auto& simple = list.selectors[0].parts[0].compound.simple_selectors;
    ASSERT_EQ(simple.size(), 2u);
    EXPECT_EQ(simple[1].type, SimpleSelectorType::PseudoElement);
    EXPECT_EQ(to_string(simple[1]), "::after");
}

TEST(SelectorTest, FunctionalPseudoClassArgument) {
    auto list = parse_selector_list("li:nth-child(2n + 1)");
    ASSERT_FALSE(list.malformed);
    const auto& simple = list.selectors[0].parts[0].compound.simple_selectors;
    ASSERT_EQ(simple.size(), 2u);
    EXPECT_TRUE(simple[1].is_function);
    EXPECT_EQ(simple[1].value, "nth-child");
    EXPECT_EQ(simple[1].argument, "2n + 1");
}

TEST(SelectorTest, NestingSelector) {
    auto list = parse_selector_list("&:focus");
    ASSERT_FALSE(list.malformed);
    const auto& simple = list.selectors[0].parts[0].compound.simple_selectors;
    ASSERT_EQ(simple.size(), 2u);
    EXPECT_EQ(simple[0].type, SimpleSelectorType::Nesting);
    EXPECT_EQ(to_string(list.selectors[0]), "&:focus");
}

// ---------------------------------------------------------------------------
// Combinators and lists
// ---------------------------------------------------------------------------
TEST(SelectorTest, Combinators) {
    auto list = parse_selector_list("ul > li + li ~ span a");
    ASSERT_FALSE(list.malformed);
    const auto& parts = list.selectors[0].parts;
    ASSERT_EQ(parts.size(), 5u);
    EXPECT_FALSE(parts[0].combinator.has_value());
    EXPECT_TRUE(parts[1].combinator == Combinator::Child);
    EXPECT_TRUE(parts[2].combinator == Combinator::NextSibling);
    EXPECT_TRUE(parts[3].combinator == Combinator::SubsequentSibling);
    EXPECT_TRUE(parts[4].combinator == Combinator::Descendant);
}

TEST(SelectorTest, CombinatorWithoutSpaces) {
    auto list = parse_selector_list("ul>li");
    ASSERT_FALSE(list.malformed);
    EXPECT_EQ(to_string(list.selectors[0]), "ul > li");
}

TEST(SelectorTest, SelectorList) {
    auto list = parse_selector_list(".a, .b:hover ,#c");
    ASSERT_FALSE(list.malformed);
    ASSERT_EQ(list.selectors.size(), 3u);
    EXPECT_EQ(to_string(list.selectors[1]), ".b:hover");
    EXPECT_EQ(to_string(list.selectors[2]), "#c");
}

TEST(SelectorTest, EmptyInputIsEmptyList) {
    auto list = parse_selector_list("   ");
    EXPECT_TRUE(list.selectors.empty());
    EXPECT_FALSE(list.malformed);
}

// ---------------------------------------------------------------------------
// Malformed input
// ---------------------------------------------------------------------------
TEST(SelectorTest, SpaceAfterColonIsMalformed) {
    EXPECT_TRUE(parse_selector_list("&: hover").malformed);
    EXPECT_TRUE(parse_selector_list("a:").malformed);
}

TEST(SelectorTest, DanglingCombinatorIsMalformed) {
    EXPECT_TRUE(parse_selector_list("a >").malformed);
    EXPECT_TRUE(parse_selector_list("a >, b").malformed);
}

TEST(SelectorTest, TrailingCommaIsMalformed) {
    EXPECT_TRUE(parse_selector_list("a,").malformed);
}

TEST(SelectorTest, DotWithoutNameIsMalformed) {
    EXPECT_TRUE(parse_selector_list(".").malformed);
    EXPECT_TRUE(parse_selector_list("a. b").malformed);
}

TEST(SelectorTest, TrailingGarbageIsMalformed) {
    EXPECT_TRUE(parse_selector_list("a {").malformed);
    EXPECT_TRUE(parse_selector_list("a )").malformed);
}

TEST(SelectorTest, CombinatorText) {
    EXPECT_STREQ(combinator_text(Combinator::Descendant), " ");
    EXPECT_STREQ(combinator_text(Combinator::Child), " > ");
    EXPECT_STREQ(combinator_text(Combinator::NextSibling), " + ");
    EXPECT_STREQ(combinator_text(Combinator::SubsequentSibling), " ~ ");
}
