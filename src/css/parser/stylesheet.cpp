#include <stylec/css/parser/stylesheet.h>
#include <stylec/css/parser/tokenizer.h>
#include <algorithm>
#include <cctype>

namespace stylec::css {

namespace {

std::string trim(std::string_view s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        ++start;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return std::string(s.substr(start, end - start));
}

std::string ascii_lower(std::string value) {
    for (auto& ch : value) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return value;
}

std::string join_media(const std::string& outer, const std::string& inner) {
    if (outer.empty()) return inner;
    if (inner.empty()) return outer;
    return outer + " and " + inner;
}

} // namespace

// ---------------------------------------------------------------------------
// Internal stylesheet parser
// ---------------------------------------------------------------------------

class StyleSheetParser {
public:
    explicit StyleSheetParser(std::vector<CSSToken> tokens)
        : tokens_(std::move(tokens)), pos_(0) {}

    StyleSheet parse();
    std::vector<Declaration> parse_declarations();

private:
    std::vector<CSSToken> tokens_;
    size_t pos_;
    StyleSheet sheet_;

    const CSSToken& current() const;
    bool at_end() const;
    void advance();
    void skip_whitespace();
    void skip_block();
    void skip_at_rule();
    void warn(const std::string& message);
    void warn_at(const CSSToken& token, const std::string& message);

    // Rule lists: top level, or the body of an @media block.
    void parse_rule_list(const std::string& media, bool inside_block);
    void parse_at_rule(const std::string& parent_selector, const std::string& media,
                       std::vector<StyleRule>& nested_out);
    void parse_style_rule(const std::string& parent_selector, const std::string& media,
                          std::vector<StyleRule>& out);
    void parse_block_contents(StyleRule& rule, std::vector<StyleRule>& nested_out);
    void parse_keyframes_rule();

    bool is_nested_rule_start() const;
    std::string consume_prelude();
    bool expect_block_open(const std::string& what);
    void expect_block_close(const std::string& what, const CSSToken& opened_at);

    Declaration parse_declaration();
};

const CSSToken& StyleSheetParser::current() const {
    if (pos_ < tokens_.size()) {
        return tokens_[pos_];
    }
    static const CSSToken eof{};
    return eof;
}

bool StyleSheetParser::at_end() const {
    return pos_ >= tokens_.size() || tokens_[pos_].type == CSSToken::EndOfFile;
}

void StyleSheetParser::advance() {
    if (pos_ < tokens_.size()) {
        ++pos_;
    }
}

void StyleSheetParser::skip_whitespace() {
    while (!at_end() && (current().type == CSSToken::Whitespace ||
                         current().type == CSSToken::CDO ||
                         current().type == CSSToken::CDC)) {
        advance();
    }
}

void StyleSheetParser::skip_block() {
    // Assumes we're at '{'
    if (current().type == CSSToken::LeftBrace) {
        advance();
    }
    int depth = 1;
    while (!at_end() && depth > 0) {
        if (current().type == CSSToken::LeftBrace) depth++;
        else if (current().type == CSSToken::RightBrace) depth--;
        advance();
    }
}

void StyleSheetParser::skip_at_rule() {
    while (!at_end()) {
        if (current().type == CSSToken::Semicolon) { advance(); break; }
        if (current().type == CSSToken::LeftBrace) { skip_block(); break; }
        if (current().type == CSSToken::RightBrace) break;
        advance();
    }
}

void StyleSheetParser::warn(const std::string& message) {
    warn_at(current(), message);
}

void StyleSheetParser::warn_at(const CSSToken& token, const std::string& message) {
    sheet_.warnings.push_back({message, token.line, token.column});
}

StyleSheet StyleSheetParser::parse() {
    parse_rule_list("", false);
    return std::move(sheet_);
}

void StyleSheetParser::parse_rule_list(const std::string& media, bool inside_block) {
    while (!at_end()) {
        skip_whitespace();
        if (at_end()) break;

        if (current().type == CSSToken::RightBrace) {
            if (inside_block) return;
            warn("unexpected '}' skipped");
            advance();
            continue;
        }
        if (current().type == CSSToken::Semicolon) {
            advance();  // stray semicolon
            continue;
        }

        if (current().type == CSSToken::AtKeyword) {
            std::vector<StyleRule> hoisted;
            parse_at_rule("", media, hoisted);
            for (auto& rule : hoisted) {
                sheet_.rules.push_back(std::move(rule));
            }
        } else {
            std::vector<StyleRule> rules;
            parse_style_rule("", media, rules);
            for (auto& rule : rules) {
                sheet_.rules.push_back(std::move(rule));
            }
        }
    }
}

void StyleSheetParser::parse_at_rule(const std::string& parent_selector,
                                     const std::string& media,
                                     std::vector<StyleRule>& nested_out) {
    const CSSToken at_token = current();
    const std::string keyword = ascii_lower(at_token.value);
    advance();

    if (keyword == "media") {
        skip_whitespace();
        std::string condition = consume_prelude();
        if (condition.empty()) {
            warn_at(at_token, "@media without a condition");
        }
        const std::string combined = join_media(media, condition);
        if (!expect_block_open("@media")) {
            return;
        }
        if (parent_selector.empty()) {
            parse_rule_list(combined, true);
        } else {
            // @media nested in a style rule: its declarations belong to the
            // parent selector, hoisted out under the combined condition.
            StyleRule hoisted;
            hoisted.selector_text = parent_selector;
            hoisted.selectors = parse_selector_list(parent_selector);
            hoisted.media = combined;
            hoisted.line = at_token.line;
            std::vector<StyleRule> deeper;
            parse_block_contents(hoisted, deeper);
            nested_out.push_back(std::move(hoisted));
            for (auto& rule : deeper) {
                nested_out.push_back(std::move(rule));
            }
        }
        expect_block_close("@media", at_token);
        return;
    }

    if (keyword == "keyframes" || keyword == "-webkit-keyframes") {
        parse_keyframes_rule();
        return;
    }

    if (keyword == "import" && parent_selector.empty()) {
        skip_whitespace();
        std::string target = consume_prelude();
        if (!at_end() && current().type == CSSToken::Semicolon) {
            advance();
        }
        sheet_.imports.push_back(target);
        warn_at(at_token, "@import is not followed; rules from '" + target + "' are not compiled");
        return;
    }

    warn_at(at_token, "unsupported at-rule @" + at_token.value + " skipped");
    skip_at_rule();
}

void StyleSheetParser::parse_keyframes_rule() {
    KeyframesRule kr;
    kr.line = current().line;
    skip_whitespace();

    if (!at_end() && (current().type == CSSToken::Ident ||
                      current().type == CSSToken::String)) {
        kr.name = current().value;
        advance();
    }
    skip_whitespace();

    const CSSToken opened = current();
    if (!expect_block_open("@keyframes")) {
        return;
    }

    while (!at_end() && current().type != CSSToken::RightBrace) {
        skip_whitespace();
        if (at_end() || current().type == CSSToken::RightBrace) break;

        KeyframeStep step;
        step.selector = consume_prelude();
        const CSSToken step_open = current();
        if (!expect_block_open("keyframe step")) {
            break;
        }
        while (!at_end() && current().type != CSSToken::RightBrace) {
            skip_whitespace();
            if (at_end() || current().type == CSSToken::RightBrace) break;
            if (current().type == CSSToken::Semicolon) {
                advance();
                continue;
            }
            auto decl = parse_declaration();
            if (!decl.property.empty()) {
                step.declarations.push_back(std::move(decl));
            }
        }
        expect_block_close("keyframe step", step_open);
        kr.steps.push_back(std::move(step));
    }

    expect_block_close("@keyframes", opened);
    sheet_.keyframes.push_back(std::move(kr));
}

// Nested rules start with selector-like tokens (&, ., #, [, :, >, +, ~, *),
// or with an ident whose statement reaches '{' before ';' or '}'.
bool StyleSheetParser::is_nested_rule_start() const {
    const auto& tok = current();
    if (tok.type == CSSToken::Delim &&
        (tok.value == "&" || tok.value == "." || tok.value == ">" ||
         tok.value == "+" || tok.value == "~" || tok.value == "*")) {
        return true;
    }
    if (tok.type == CSSToken::Hash || tok.type == CSSToken::Colon ||
        tok.type == CSSToken::LeftBracket) {
        return true;
    }
    if (tok.type != CSSToken::Ident) {
        return false;
    }
    int depth = 0;
    for (size_t i = pos_; i < tokens_.size(); ++i) {
        const auto type = tokens_[i].type;
        if (type == CSSToken::LeftParen || type == CSSToken::Function ||
            type == CSSToken::LeftBracket) {
            ++depth;
        } else if ((type == CSSToken::RightParen || type == CSSToken::RightBracket) &&
                   depth > 0) {
            --depth;
        } else if (depth == 0 && type == CSSToken::LeftBrace) {
            return true;
        } else if (depth == 0 && (type == CSSToken::Semicolon ||
                                  type == CSSToken::RightBrace ||
                                  type == CSSToken::EndOfFile)) {
            return false;
        }
    }
    return false;
}

// Selector or at-rule prelude up to (not including) '{', ';' or '}'.
std::string StyleSheetParser::consume_prelude() {
    std::string text;
    while (!at_end() && current().type != CSSToken::LeftBrace &&
           current().type != CSSToken::Semicolon &&
           current().type != CSSToken::RightBrace) {
        if (current().type == CSSToken::Whitespace) {
            if (!text.empty() && text.back() != ' ') text += " ";
        } else {
            text += to_css_text(current());
        }
        advance();
    }
    return trim(text);
}

bool StyleSheetParser::expect_block_open(const std::string& what) {
    if (!at_end() && current().type == CSSToken::LeftBrace) {
        advance();
        return true;
    }
    warn("expected '{' after " + what + ", found " + token_type_name(current().type));
    if (!at_end() && current().type == CSSToken::Semicolon) {
        advance();
    }
    return false;
}

void StyleSheetParser::expect_block_close(const std::string& what, const CSSToken& opened_at) {
    if (!at_end() && current().type == CSSToken::RightBrace) {
        advance();
        return;
    }
    warn_at(opened_at, "unterminated " + what + " block");
}

void StyleSheetParser::parse_style_rule(const std::string& parent_selector,
                                        const std::string& media,
                                        std::vector<StyleRule>& out) {
    StyleRule rule;
    rule.line = current().line;
    const CSSToken start = current();

    std::string sel_text = consume_prelude();
    if (!parent_selector.empty()) {
        sel_text = resolve_nested_selector(parent_selector, sel_text);
    }

    if (!expect_block_open("selector '" + sel_text + "'")) {
        return;
    }
    if (sel_text.empty()) {
        warn_at(start, "style rule without a selector");
    }

    rule.selector_text = sel_text;
    rule.selectors = parse_selector_list(sel_text);
    rule.media = media;
    if (rule.selectors.malformed) {
        warn_at(start, "malformed selector '" + sel_text + "'");
    }

    std::vector<StyleRule> nested;
    parse_block_contents(rule, nested);
    expect_block_close("rule '" + sel_text + "'", start);

    // Parent first, nested rules after it
    out.push_back(std::move(rule));
    for (auto& nr : nested) {
        out.push_back(std::move(nr));
    }
}

// Declarations go to `rule`; nested rules are flattened into nested_out.
// Does not consume the closing '}'.
void StyleSheetParser::parse_block_contents(StyleRule& rule,
                                            std::vector<StyleRule>& nested_out) {
    while (!at_end() && current().type != CSSToken::RightBrace) {
        skip_whitespace();
        if (at_end() || current().type == CSSToken::RightBrace) break;
        if (current().type == CSSToken::Semicolon) {
            advance();
            continue;
        }

        if (current().type == CSSToken::AtKeyword) {
            parse_at_rule(rule.selector_text, rule.media, nested_out);
        } else if (is_nested_rule_start()) {
            parse_style_rule(rule.selector_text, rule.media, nested_out);
        } else {
            auto decl = parse_declaration();
            if (!decl.property.empty()) {
                rule.declarations.push_back(std::move(decl));
            }
        }
    }
}

Declaration StyleSheetParser::parse_declaration() {
    Declaration decl;
    skip_whitespace();
    const CSSToken start = current();

    auto skip_statement = [this]() {
        while (!at_end() && current().type != CSSToken::Semicolon &&
               current().type != CSSToken::RightBrace) {
            advance();
        }
        if (!at_end() && current().type == CSSToken::Semicolon) {
            advance();
        }
    };

    if (at_end() || current().type != CSSToken::Ident) {
        warn("expected a property name, found " + std::string(token_type_name(current().type)));
        skip_statement();
        return decl;
    }
    std::string property = current().value;
    advance();
    skip_whitespace();

    if (at_end() || current().type != CSSToken::Colon) {
        warn_at(start, "declaration '" + property + "' is missing ':'");
        skip_statement();
        return decl;
    }
    advance();
    skip_whitespace();

    std::vector<CSSToken> value_tokens;
    int depth = 0;
    while (!at_end()) {
        const auto type = current().type;
        if (depth == 0 && (type == CSSToken::Semicolon || type == CSSToken::RightBrace)) {
            break;
        }
        if (type == CSSToken::Function || type == CSSToken::LeftParen ||
            type == CSSToken::LeftBracket) {
            ++depth;
        } else if ((type == CSSToken::RightParen || type == CSSToken::RightBracket) &&
                   depth > 0) {
            --depth;
        }
        value_tokens.push_back(current());
        advance();
    }
    if (!at_end() && current().type == CSSToken::Semicolon) {
        advance();
    }

    while (!value_tokens.empty() && value_tokens.back().type == CSSToken::Whitespace) {
        value_tokens.pop_back();
    }

    // Trailing "! important"
    if (value_tokens.size() >= 2 && value_tokens.back().type == CSSToken::Ident &&
        ascii_lower(value_tokens.back().value) == "important") {
        size_t bang = value_tokens.size() - 2;
        while (bang > 0 && value_tokens[bang].type == CSSToken::Whitespace) --bang;
        if (value_tokens[bang].type == CSSToken::Delim && value_tokens[bang].value == "!") {
            decl.important = true;
            value_tokens.erase(value_tokens.begin() + static_cast<std::ptrdiff_t>(bang),
                               value_tokens.end());
        }
    }

    std::string value;
    for (const auto& tok : value_tokens) {
        if (tok.type == CSSToken::Whitespace) {
            if (!value.empty() && value.back() != ' ') value += " ";
        } else {
            value += to_css_text(tok);
        }
    }
    value = trim(value);

    if (value.empty()) {
        warn_at(start, "declaration '" + property + "' has no value");
        return decl;
    }

    decl.property = property;
    decl.value = value;
    decl.line = start.line;
    return decl;
}

std::vector<Declaration> StyleSheetParser::parse_declarations() {
    std::vector<Declaration> decls;

    while (!at_end()) {
        skip_whitespace();
        if (at_end()) break;
        if (current().type == CSSToken::Semicolon || current().type == CSSToken::RightBrace) {
            advance();
            continue;
        }
        auto decl = parse_declaration();
        if (!decl.property.empty()) {
            decls.push_back(std::move(decl));
        }
    }

    return decls;
}

// ---------------------------------------------------------------------------
// Nesting helpers
// ---------------------------------------------------------------------------

std::vector<std::string> split_top_level_commas(std::string_view text) {
    std::vector<std::string> items;
    std::string current;
    int depth = 0;
    char quote = 0;
    for (char ch : text) {
        if (quote != 0) {
            if (ch == quote) quote = 0;
        } else if (ch == '"' || ch == '\'') {
            quote = ch;
        } else if (ch == '(' || ch == '[') {
            ++depth;
        } else if ((ch == ')' || ch == ']') && depth > 0) {
            --depth;
        } else if (ch == ',' && depth == 0) {
            items.push_back(trim(current));
            current.clear();
            continue;
        }
        current.push_back(ch);
    }
    items.push_back(trim(current));
    items.erase(std::remove_if(items.begin(), items.end(),
                               [](const std::string& s) { return s.empty(); }),
                items.end());
    return items;
}

std::string resolve_nested_selector(const std::string& parent_selector,
                                    const std::string& nested_selector) {
    const auto parents = split_top_level_commas(parent_selector);
    const auto nested = split_top_level_commas(nested_selector);
    if (parents.empty()) return nested_selector;
    if (nested.empty()) return "";

    std::string resolved;
    for (const auto& n : nested) {
        for (const auto& p : parents) {
            std::string one;
            if (n.find('&') != std::string::npos) {
                one = n;
                size_t amp_pos = 0;
                while ((amp_pos = one.find('&', amp_pos)) != std::string::npos) {
                    one.replace(amp_pos, 1, p);
                    amp_pos += p.size();
                }
            } else {
                one = p + " " + n;
            }
            if (!resolved.empty()) resolved += ", ";
            resolved += one;
        }
    }
    return resolved;
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

StyleSheet parse_stylesheet(std::string_view css) {
    auto tokens = CSSTokenizer::tokenize_all(css);
    StyleSheetParser parser(std::move(tokens));
    return parser.parse();
}

std::vector<Declaration> parse_declaration_block(std::string_view css) {
    auto tokens = CSSTokenizer::tokenize_all(css);
    StyleSheetParser parser(std::move(tokens));
    return parser.parse_declarations();
}

} // namespace stylec::css
