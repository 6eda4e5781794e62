#include <stylec/codegen/naming.h>

#include <gtest/gtest.h>

using namespace stylec::codegen;

TEST(NamingTest, Keywords) {
    EXPECT_TRUE(is_rust_keyword("type"));
    EXPECT_TRUE(is_rust_keyword("Self"));
    EXPECT_TRUE(is_rust_keyword("async"));
    EXPECT_TRUE(is_rust_keyword("yield"));
    EXPECT_FALSE(is_rust_keyword("button"));
    EXPECT_FALSE(is_rust_keyword("Type"));
}

TEST(NamingTest, Identifiers) {
    EXPECT_TRUE(is_rust_identifier("button"));
    EXPECT_TRUE(is_rust_identifier("_private"));
    EXPECT_TRUE(is_rust_identifier("button_2"));
    EXPECT_FALSE(is_rust_identifier(""));
    EXPECT_FALSE(is_rust_identifier("_"));
    EXPECT_FALSE(is_rust_identifier("2col"));
    EXPECT_FALSE(is_rust_identifier("btn-primary"));
    EXPECT_FALSE(is_rust_identifier("match"));
}

TEST(NamingTest, SanitizeReplacesPunctuation) {
    EXPECT_EQ(sanitize_identifier("btn-primary"), "btn_primary");
    EXPECT_EQ(sanitize_identifier("nav--item__link"), "nav_item_link");
    EXPECT_EQ(sanitize_identifier("-lead-"), "lead");
}

TEST(NamingTest, SanitizeFixesLeadingDigitsAndKeywords) {
    EXPECT_EQ(sanitize_identifier("2col"), "style_2col");
    EXPECT_EQ(sanitize_identifier("type"), "type_style");
    EXPECT_EQ(sanitize_identifier("self"), "self_style");
}

TEST(NamingTest, SanitizeEmptyFallsBack) {
    EXPECT_EQ(sanitize_identifier(""), "style");
    EXPECT_EQ(sanitize_identifier("---"), "style");
}

TEST(NamingTest, SanitizedNamesAreIdentifiers) {
    for (const char* raw : {"btn-primary", "2col", "type", "", "a.b:c", "loop"}) {
        EXPECT_TRUE(is_rust_identifier(sanitize_identifier(raw))) << raw;
    }
}

TEST(NamingTest, DocTitle) {
    EXPECT_EQ(doc_title("button_secondary"), "Button Secondary");
    EXPECT_EQ(doc_title("card"), "Card");
    EXPECT_EQ(doc_title("utils"), "Utils");
}
