#pragma once
#include <stylec/css/parser/selector.h>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace stylec::css {

struct Declaration {
    std::string property;
    std::string value;       // source text, whitespace collapsed, without !important
    bool important = false;
    size_t line = 0;
};

// A flattened style rule. Nested rules are resolved against their parent
// ("&" replaced, or prefixed as a descendant) and nested @media blocks are
// hoisted, leaving the condition in `media`.
struct StyleRule {
    std::string selector_text;
    SelectorList selectors;
    std::vector<Declaration> declarations;
    std::string media;       // empty outside @media
    size_t line = 0;
};

struct KeyframeStep {
    std::string selector;    // "from", "to", "50%", or a list "0%, 100%"
    std::vector<Declaration> declarations;
};

struct KeyframesRule {
    std::string name;
    std::vector<KeyframeStep> steps;
    size_t line = 0;
};

struct ParseWarning {
    std::string message;
    size_t line = 0;
    size_t column = 0;
};

struct StyleSheet {
    std::vector<StyleRule> rules;
    std::vector<KeyframesRule> keyframes;
    std::vector<std::string> imports;
    std::vector<ParseWarning> warnings;
};

StyleSheet parse_stylesheet(std::string_view css);
std::vector<Declaration> parse_declaration_block(std::string_view css);

// "a, b" + "&:hover" -> "a:hover, b:hover"; "a" + ".x" -> "a .x"
std::string resolve_nested_selector(const std::string& parent_selector,
                                    const std::string& nested_selector);

// Splits on commas outside parentheses and brackets, trimming each item.
std::vector<std::string> split_top_level_commas(std::string_view text);

} // namespace stylec::css
