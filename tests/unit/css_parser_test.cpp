#include <stylec/css/parser/stylesheet.h>
#include <stylec/css/parser/tokenizer.h>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace stylec::css;

namespace {

std::vector<CSSToken> significant_tokens(const std::string& css) {
    std::vector<CSSToken> out;
    for (auto& token : CSSTokenizer::tokenize_all(css)) {
        if (token.type != CSSToken::Whitespace && token.type != CSSToken::EndOfFile) {
            out.push_back(token);
        }
    }
    return out;
}

} // namespace

// ---------------------------------------------------------------------------
// Tokenizer
// ---------------------------------------------------------------------------
TEST(CSSTokenizerTest, EmptyInputYieldsEndOfFile) {
    auto tokens = CSSTokenizer::tokenize_all("");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].type, CSSToken::EndOfFile);
}

TEST(CSSTokenizerTest, IdentsColonsAndSemicolons) {
    auto tokens = significant_tokens("color: red;");
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[0].type, CSSToken::Ident);
    EXPECT_EQ(tokens[0].value, "color");
    EXPECT_EQ(tokens[1].type, CSSToken::Colon);
    EXPECT_EQ(tokens[2].type, CSSToken::Ident);
    EXPECT_EQ(tokens[2].value, "red");
    EXPECT_EQ(tokens[3].type, CSSToken::Semicolon);
}

TEST(CSSTokenizerTest, NumbersKeepSourceSpelling) {
    auto tokens = significant_tokens("1.50 16px 50% -2em");
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[0].type, CSSToken::Number);
    EXPECT_EQ(tokens[0].value, "1.50");
    EXPECT_EQ(tokens[1].type, CSSToken::Dimension);
    EXPECT_EQ(tokens[1].value, "16px");
    EXPECT_EQ(tokens[1].unit, "px");
    EXPECT_EQ(tokens[2].type, CSSToken::Percentage);
    EXPECT_EQ(tokens[2].value, "50%");
    EXPECT_EQ(tokens[3].type, CSSToken::Dimension);
    EXPECT_EQ(tokens[3].value, "-2em");
}

TEST(CSSTokenizerTest, HashFunctionAndAtKeyword) {
    auto tokens = significant_tokens("#fff rgba( @media");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].type, CSSToken::Hash);
    EXPECT_EQ(tokens[0].value, "fff");
    EXPECT_EQ(to_css_text(tokens[0]), "#fff");
    EXPECT_EQ(tokens[1].type, CSSToken::Function);
    EXPECT_EQ(to_css_text(tokens[1]), "rgba(");
    EXPECT_EQ(tokens[2].type, CSSToken::AtKeyword);
    EXPECT_EQ(tokens[2].value, "media");
}

TEST(CSSTokenizerTest, StringsRememberTheirQuote) {
    auto tokens = significant_tokens("'a' \"b\"");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].type, CSSToken::String);
    EXPECT_EQ(tokens[0].value, "a");
    EXPECT_EQ(to_css_text(tokens[0]), "'a'");
    EXPECT_EQ(to_css_text(tokens[1]), "\"b\"");
}

TEST(CSSTokenizerTest, CommentsAreSkipped) {
    auto tokens = significant_tokens("/* note */ a /* another */ {");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].value, "a");
    EXPECT_EQ(tokens[1].type, CSSToken::LeftBrace);
}

TEST(CSSTokenizerTest, TracksLines) {
    auto tokens = significant_tokens("a\n{\n}");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].line, 1u);
    EXPECT_EQ(tokens[1].line, 2u);
    EXPECT_EQ(tokens[2].line, 3u);
}

// ---------------------------------------------------------------------------
// Style rules
// ---------------------------------------------------------------------------
TEST(CSSParserTest, SimpleRule) {
    auto sheet = parse_stylesheet(".button { display: flex; color: red; }");
    ASSERT_EQ(sheet.rules.size(), 1u);
    const auto& rule = sheet.rules[0];
    EXPECT_EQ(rule.selector_text, ".button");
    EXPECT_FALSE(rule.selectors.malformed);
    ASSERT_EQ(rule.declarations.size(), 2u);
    EXPECT_EQ(rule.declarations[0].property, "display");
    EXPECT_EQ(rule.declarations[0].value, "flex");
    EXPECT_EQ(rule.declarations[1].property, "color");
    EXPECT_EQ(rule.declarations[1].value, "red");
    EXPECT_TRUE(rule.media.empty());
    EXPECT_TRUE(sheet.warnings.empty());
}

TEST(CSSParserTest, ValueWhitespaceIsCollapsed) {
    auto sheet = parse_stylesheet(".a { border:   1px\n   solid   #ccc ; }");
    ASSERT_EQ(sheet.rules.size(), 1u);
    ASSERT_EQ(sheet.rules[0].declarations.size(), 1u);
    EXPECT_EQ(sheet.rules[0].declarations[0].value, "1px solid #ccc");
}

TEST(CSSParserTest, FunctionValuesKeepTheirArguments) {
    auto sheet = parse_stylesheet(".a { background: rgba(0, 0, 0, 0.5); }");
    ASSERT_EQ(sheet.rules.size(), 1u);
    ASSERT_EQ(sheet.rules[0].declarations.size(), 1u);
    EXPECT_EQ(sheet.rules[0].declarations[0].value, "rgba(0, 0, 0, 0.5)");
}

TEST(CSSParserTest, ImportantIsDetected) {
    auto sheet = parse_stylesheet(".a { color: red !important; margin: 0 ! important; }");
    ASSERT_EQ(sheet.rules.size(), 1u);
    const auto& decls = sheet.rules[0].declarations;
    ASSERT_EQ(decls.size(), 2u);
    EXPECT_TRUE(decls[0].important);
    EXPECT_EQ(decls[0].value, "red");
    EXPECT_TRUE(decls[1].important);
    EXPECT_EQ(decls[1].value, "0");
}

TEST(CSSParserTest, LastDeclarationWithoutSemicolon) {
    auto sheet = parse_stylesheet(".a { color: red }");
    ASSERT_EQ(sheet.rules.size(), 1u);
    ASSERT_EQ(sheet.rules[0].declarations.size(), 1u);
    EXPECT_EQ(sheet.rules[0].declarations[0].value, "red");
}

TEST(CSSParserTest, SelectorListsStayTogether) {
    auto sheet = parse_stylesheet("h1, h2 { margin: 0; }");
    ASSERT_EQ(sheet.rules.size(), 1u);
    EXPECT_EQ(sheet.rules[0].selector_text, "h1, h2");
    EXPECT_EQ(sheet.rules[0].selectors.selectors.size(), 2u);
}

TEST(CSSParserTest, MissingColonWarnsAndSkipsDeclaration) {
    auto sheet = parse_stylesheet(".a { color red; margin: 0; }");
    ASSERT_EQ(sheet.rules.size(), 1u);
    ASSERT_EQ(sheet.rules[0].declarations.size(), 1u);
    EXPECT_EQ(sheet.rules[0].declarations[0].property, "margin");
    ASSERT_FALSE(sheet.warnings.empty());
    EXPECT_NE(sheet.warnings[0].message.find("missing ':'"), std::string::npos);
}

TEST(CSSParserTest, EmptyValueWarns) {
    auto sheet = parse_stylesheet(".a { color: ; }");
    ASSERT_EQ(sheet.rules.size(), 1u);
    EXPECT_TRUE(sheet.rules[0].declarations.empty());
    ASSERT_EQ(sheet.warnings.size(), 1u);
    EXPECT_NE(sheet.warnings[0].message.find("no value"), std::string::npos);
}

TEST(CSSParserTest, StrayClosingBraceWarns) {
    auto sheet = parse_stylesheet("} .a { color: red; }");
    ASSERT_EQ(sheet.rules.size(), 1u);
    ASSERT_EQ(sheet.warnings.size(), 1u);
    EXPECT_NE(sheet.warnings[0].message.find("unexpected '}'"), std::string::npos);
}

TEST(CSSParserTest, UnterminatedRuleWarns) {
    auto sheet = parse_stylesheet(".a { color: red;");
    ASSERT_EQ(sheet.rules.size(), 1u);
    ASSERT_EQ(sheet.warnings.size(), 1u);
    EXPECT_NE(sheet.warnings[0].message.find("unterminated"), std::string::npos);
}

TEST(CSSParserTest, MalformedSelectorWarns) {
    auto sheet = parse_stylesheet("&: hover { color: red; }");
    ASSERT_EQ(sheet.rules.size(), 1u);
    EXPECT_TRUE(sheet.rules[0].selectors.malformed);
    ASSERT_FALSE(sheet.warnings.empty());
    EXPECT_NE(sheet.warnings[0].message.find("malformed selector"), std::string::npos);
}

// ---------------------------------------------------------------------------
// Nesting
// ---------------------------------------------------------------------------
TEST(CSSParserTest, NestedRulesAreFlattenedAfterParent) {
    auto sheet = parse_stylesheet(
        ".card { padding: 4px; &:hover { color: red; } .title { font-weight: bold; } }");
    ASSERT_EQ(sheet.rules.size(), 3u);
    EXPECT_EQ(sheet.rules[0].selector_text, ".card");
    EXPECT_EQ(sheet.rules[1].selector_text, ".card:hover");
    EXPECT_EQ(sheet.rules[2].selector_text, ".card .title");
    ASSERT_EQ(sheet.rules[1].declarations.size(), 1u);
    EXPECT_EQ(sheet.rules[1].declarations[0].value, "red");
}

TEST(CSSParserTest, NestedChildCombinator) {
    auto sheet = parse_stylesheet(".list { > li { margin: 0; } }");
    ASSERT_EQ(sheet.rules.size(), 2u);
    EXPECT_EQ(sheet.rules[1].selector_text, ".list > li");
}

TEST(CSSParserTest, ResolveNestedSelectorCrossProduct) {
    EXPECT_EQ(resolve_nested_selector("a, b", "&:hover"), "a:hover, b:hover");
    EXPECT_EQ(resolve_nested_selector("a", ".x, .y"), "a .x, a .y");
    EXPECT_EQ(resolve_nested_selector("", ".x"), ".x");
    EXPECT_EQ(resolve_nested_selector(".a", "& + &"), ".a + .a");
}

TEST(CSSParserTest, SplitTopLevelCommasRespectsParentheses) {
    auto items = split_top_level_commas(":is(a, b), c ,  d");
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0], ":is(a, b)");
    EXPECT_EQ(items[1], "c");
    EXPECT_EQ(items[2], "d");
}

// ---------------------------------------------------------------------------
// At-rules
// ---------------------------------------------------------------------------
TEST(CSSParserTest, MediaRulesCarryTheirCondition) {
    auto sheet = parse_stylesheet(
        "@media (max-width: 768px) { .a { display: none; } .b { color: red; } }");
    ASSERT_EQ(sheet.rules.size(), 2u);
    EXPECT_EQ(sheet.rules[0].media, "(max-width: 768px)");
    EXPECT_EQ(sheet.rules[1].media, "(max-width: 768px)");
    EXPECT_EQ(sheet.rules[0].selector_text, ".a");
}

TEST(CSSParserTest, MediaNestedInRuleIsHoisted) {
    auto sheet = parse_stylesheet(
        ".a { color: red; @media (min-width: 10px) { color: blue; } }");
    ASSERT_EQ(sheet.rules.size(), 2u);
    EXPECT_EQ(sheet.rules[0].selector_text, ".a");
    EXPECT_TRUE(sheet.rules[0].media.empty());
    EXPECT_EQ(sheet.rules[1].selector_text, ".a");
    EXPECT_EQ(sheet.rules[1].media, "(min-width: 10px)");
    ASSERT_EQ(sheet.rules[1].declarations.size(), 1u);
    EXPECT_EQ(sheet.rules[1].declarations[0].value, "blue");
}

TEST(CSSParserTest, NestedMediaConditionsAreJoined) {
    auto sheet = parse_stylesheet(
        "@media (min-width: 1px) { @media (max-width: 2px) { .a { color: red; } } }");
    ASSERT_EQ(sheet.rules.size(), 1u);
    EXPECT_EQ(sheet.rules[0].media, "(min-width: 1px) and (max-width: 2px)");
}

TEST(CSSParserTest, KeyframesAreCollected) {
    auto sheet = parse_stylesheet(
        "@keyframes fadeIn { from { opacity: 0; } 50% { opacity: 0.5; } to { opacity: 1; } }");
    EXPECT_TRUE(sheet.rules.empty());
    ASSERT_EQ(sheet.keyframes.size(), 1u);
    const auto& kf = sheet.keyframes[0];
    EXPECT_EQ(kf.name, "fadeIn");
    ASSERT_EQ(kf.steps.size(), 3u);
    EXPECT_EQ(kf.steps[0].selector, "from");
    EXPECT_EQ(kf.steps[1].selector, "50%");
    EXPECT_EQ(kf.steps[2].selector, "to");
    ASSERT_EQ(kf.steps[1].declarations.size(), 1u);
    EXPECT_EQ(kf.steps[1].declarations[0].value, "0.5");
}

TEST(CSSParserTest, ImportIsRecordedWithWarning) {
    auto sheet = parse_stylesheet("@import \"base.css\";\n.a { color: red; }");
    ASSERT_EQ(sheet.imports.size(), 1u);
    EXPECT_EQ(sheet.imports[0], "\"base.css\"");
    ASSERT_EQ(sheet.rules.size(), 1u);
    ASSERT_EQ(sheet.warnings.size(), 1u);
    EXPECT_EQ(sheet.warnings[0].line, 1u);
}

TEST(CSSParserTest, UnsupportedAtRulesAreSkipped) {
    auto sheet = parse_stylesheet(
        "@font-face { font-family: x; }\n@charset \"utf-8\";\n.a { color: red; }");
    ASSERT_EQ(sheet.rules.size(), 1u);
    EXPECT_EQ(sheet.rules[0].selector_text, ".a");
    ASSERT_EQ(sheet.warnings.size(), 2u);
    EXPECT_NE(sheet.warnings[0].message.find("@font-face"), std::string::npos);
    EXPECT_EQ(sheet.warnings[1].line, 2u);
}

// ---------------------------------------------------------------------------
// Declaration blocks
// ---------------------------------------------------------------------------
TEST(CSSParserTest, ParseDeclarationBlock) {
    auto decls = parse_declaration_block("color: red; --gap: 4px; margin: 0 auto");
    ASSERT_EQ(decls.size(), 3u);
    EXPECT_EQ(decls[1].property, "--gap");
    EXPECT_EQ(decls[1].value, "4px");
    EXPECT_EQ(decls[2].value, "0 auto");
}
