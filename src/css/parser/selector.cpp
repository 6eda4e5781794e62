#include <stylec/css/parser/selector.h>
#include <stylec/css/parser/tokenizer.h>
#include <algorithm>
#include <cctype>

namespace stylec::css {

namespace {

std::string ascii_lower(std::string value) {
    std::transform(
        value.begin(),
        value.end(),
        value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool is_legacy_pseudo_element(const std::string& name) {
    const std::string lower = ascii_lower(name);
    return lower == "before" || lower == "after" ||
           lower == "first-line" || lower == "first-letter";
}

} // namespace

// ---------------------------------------------------------------------------
// Selector Parser
// ---------------------------------------------------------------------------

class SelectorParser {
public:
    explicit SelectorParser(std::vector<CSSToken> tokens)
        : tokens_(std::move(tokens)), pos_(0) {}

    SelectorList parse();

private:
    std::vector<CSSToken> tokens_;
    size_t pos_;

    const CSSToken& current() const;
    bool at_end() const;
    void advance();
    void skip_whitespace();

    ComplexSelector parse_complex_selector(bool& malformed);
    CompoundSelector parse_compound_selector(bool& malformed);
    SimpleSelector parse_attribute_selector();
    std::string consume_function_argument();
    std::optional<Combinator> try_parse_combinator();
};

const CSSToken& SelectorParser::current() const {
    if (pos_ < tokens_.size()) {
        return tokens_[pos_];
    }
    static const CSSToken eof{};
    return eof;
}

bool SelectorParser::at_end() const {
    return pos_ >= tokens_.size() || tokens_[pos_].type == CSSToken::EndOfFile;
}

void SelectorParser::advance() {
    if (pos_ < tokens_.size()) {
        ++pos_;
    }
}

void SelectorParser::skip_whitespace() {
    while (!at_end() && current().type == CSSToken::Whitespace) {
        advance();
    }
}

SelectorList SelectorParser::parse() {
    SelectorList list;
    skip_whitespace();

    if (at_end()) {
        return list;
    }

    list.selectors.push_back(parse_complex_selector(list.malformed));

    while (!at_end()) {
        skip_whitespace();
        if (at_end()) break;
        if (current().type != CSSToken::Comma) {
            // trailing garbage, e.g. "a {" or "a )"
            list.malformed = true;
            break;
        }
        advance();
        skip_whitespace();
        if (at_end()) {
            list.malformed = true;
            break;
        }
        list.selectors.push_back(parse_complex_selector(list.malformed));
    }

    return list;
}

ComplexSelector SelectorParser::parse_complex_selector(bool& malformed) {
    ComplexSelector result;

    skip_whitespace();
    ComplexSelector::Part first_part;
    first_part.compound = parse_compound_selector(malformed);
    if (first_part.compound.empty()) malformed = true;
    result.parts.push_back(std::move(first_part));

    while (!at_end()) {
        auto maybe_comb = try_parse_combinator();
        if (!maybe_comb.has_value()) {
            break;
        }

        skip_whitespace();
        if (at_end() || current().type == CSSToken::Comma) {
            malformed = true;  // dangling combinator
            break;
        }

        ComplexSelector::Part part;
        part.compound = parse_compound_selector(malformed);
        part.combinator = maybe_comb;
        if (part.compound.empty()) malformed = true;
        result.parts.push_back(std::move(part));
    }

    return result;
}

std::optional<Combinator> SelectorParser::try_parse_combinator() {
    size_t saved = pos_;

    bool had_whitespace = false;
    if (!at_end() && current().type == CSSToken::Whitespace) {
        had_whitespace = true;
        skip_whitespace();
    }

    if (at_end() || current().type == CSSToken::Comma ||
        current().type == CSSToken::LeftBrace) {
        pos_ = saved;
        return std::nullopt;
    }

    if (current().type == CSSToken::Delim) {
        if (current().value == ">") {
            advance();
            skip_whitespace();
            return Combinator::Child;
        }
        if (current().value == "+") {
            advance();
            skip_whitespace();
            return Combinator::NextSibling;
        }
        if (current().value == "~") {
            advance();
            skip_whitespace();
            return Combinator::SubsequentSibling;
        }
    }

    if (had_whitespace) {
        auto& tok = current();
        if (tok.type == CSSToken::Ident || tok.type == CSSToken::Hash ||
            tok.type == CSSToken::LeftBracket || tok.type == CSSToken::Colon ||
            (tok.type == CSSToken::Delim &&
             (tok.value == "." || tok.value == "*" || tok.value == "&"))) {
            return Combinator::Descendant;
        }
    }

    pos_ = saved;
    return std::nullopt;
}

std::string SelectorParser::consume_function_argument() {
    // Function token already consumed; read to the matching ')'
    std::string args;
    int depth = 1;
    while (!at_end() && depth > 0) {
        const auto& tok = current();
        if (tok.type == CSSToken::LeftParen) {
            depth++;
            args += "(";
        } else if (tok.type == CSSToken::RightParen) {
            depth--;
            if (depth > 0) args += ")";
        } else if (tok.type == CSSToken::Function) {
            depth++;
            args += to_css_text(tok);
        } else {
            args += to_css_text(tok);
        }
        advance();
    }
    while (!args.empty() && args.back() == ' ') args.pop_back();
    while (!args.empty() && args.front() == ' ') args.erase(args.begin());
    return args;
}

CompoundSelector SelectorParser::parse_compound_selector(bool& malformed) {
    CompoundSelector compound;

    while (!at_end()) {
        auto& tok = current();

        if (tok.type == CSSToken::Ident) {
            SimpleSelector ss;
            ss.type = SimpleSelectorType::Type;
            ss.value = tok.value;
            compound.simple_selectors.push_back(std::move(ss));
            advance();
            continue;
        }

        if (tok.type == CSSToken::Delim && (tok.value == "*" || tok.value == "&")) {
            SimpleSelector ss;
            ss.type = tok.value == "*" ? SimpleSelectorType::Universal
                                       : SimpleSelectorType::Nesting;
            ss.value = tok.value;
            compound.simple_selectors.push_back(std::move(ss));
            advance();
            continue;
        }

        if (tok.type == CSSToken::Delim && tok.value == ".") {
            advance();
            if (!at_end() && current().type == CSSToken::Ident) {
                SimpleSelector ss;
                ss.type = SimpleSelectorType::Class;
                ss.value = current().value;
                compound.simple_selectors.push_back(std::move(ss));
                advance();
                continue;
            }
            malformed = true;  // '.' without a class name
            break;
        }

        if (tok.type == CSSToken::Hash) {
            SimpleSelector ss;
            ss.type = SimpleSelectorType::Id;
            ss.value = tok.value;
            compound.simple_selectors.push_back(std::move(ss));
            advance();
            continue;
        }

        if (tok.type == CSSToken::LeftBracket) {
            compound.simple_selectors.push_back(parse_attribute_selector());
            continue;
        }

        if (tok.type == CSSToken::Colon) {
            advance();
            bool element = false;
            if (!at_end() && current().type == CSSToken::Colon) {
                element = true;
                advance();
            }
            if (at_end() || (current().type != CSSToken::Ident &&
                             current().type != CSSToken::Function)) {
                malformed = true;  // "&: hover", "a:"
                break;
            }
            SimpleSelector ss;
            ss.value = current().value;
            if (current().type == CSSToken::Function) {
                advance();
                ss.is_function = true;
                ss.argument = consume_function_argument();
            } else {
                advance();
            }
            // :before and :after are legacy spellings of pseudo-elements
            element = element || (!ss.is_function && is_legacy_pseudo_element(ss.value));
            ss.type = element ? SimpleSelectorType::PseudoElement
                              : SimpleSelectorType::PseudoClass;
            compound.simple_selectors.push_back(std::move(ss));
            continue;
        }

        break;
    }

    return compound;
}

SimpleSelector SelectorParser::parse_attribute_selector() {
    SimpleSelector ss;
    ss.type = SimpleSelectorType::Attribute;

    advance();  // '['
    std::string contents;
    while (!at_end() && current().type != CSSToken::RightBracket) {
        if (current().type != CSSToken::Whitespace) {
            contents += to_css_text(current());
        }
        advance();
    }
    if (!at_end()) {
        advance();  // ']'
    }

    ss.attribute = contents;
    auto op = contents.find_first_of("~|^$*=");
    ss.value = contents.substr(0, op);
    return ss;
}

// ---------------------------------------------------------------------------
// Serialization
// ---------------------------------------------------------------------------

const char* combinator_text(Combinator combinator) {
    switch (combinator) {
        case Combinator::Descendant:        return " ";
        case Combinator::Child:             return " > ";
        case Combinator::NextSibling:       return " + ";
        case Combinator::SubsequentSibling: return " ~ ";
    }
    return " ";
}

std::string to_string(const SimpleSelector& selector) {
    switch (selector.type) {
        case SimpleSelectorType::Type:
        case SimpleSelectorType::Universal:
        case SimpleSelectorType::Nesting:
            return selector.value;
        case SimpleSelectorType::Class:
            return "." + selector.value;
        case SimpleSelectorType::Id:
            return "#" + selector.value;
        case SimpleSelectorType::Attribute:
            return "[" + selector.attribute + "]";
        case SimpleSelectorType::PseudoClass:
        case SimpleSelectorType::PseudoElement: {
            std::string out = selector.type == SimpleSelectorType::PseudoElement ? "::" : ":";
            out += selector.value;
            if (selector.is_function) {
                out += "(" + selector.argument + ")";
            }
            return out;
        }
    }
    return selector.value;
}

std::string to_string(const CompoundSelector& compound) {
    std::string out;
    for (const auto& simple : compound.simple_selectors) {
        out += to_string(simple);
    }
    return out;
}

std::string to_string(const ComplexSelector& selector) {
    std::string out;
    for (const auto& part : selector.parts) {
        if (part.combinator.has_value()) {
            out += combinator_text(*part.combinator);
        }
        out += to_string(part.compound);
    }
    return out;
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

SelectorList parse_selector_list(std::string_view input) {
    auto tokens = CSSTokenizer::tokenize_all(input);
    SelectorParser parser(std::move(tokens));
    return parser.parse();
}

} // namespace stylec::css
