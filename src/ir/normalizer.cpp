#include <stylec/ir/normalizer.h>
#include <stylec/core/strings.h>
#include <stylec/css/parser/selector.h>
#include <stylec/css/parser/stylesheet.h>
#include <cctype>
#include <cstdlib>
#include <set>

namespace stylec::ir {

using core::CompileError;
using core::ErrorKind;

namespace {

bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '-' ||
           static_cast<unsigned char>(c) >= 0x80;
}

bool is_ident_char(char c) {
    return is_ident_start(c) || std::isdigit(static_cast<unsigned char>(c));
}

bool is_identifier(const std::string& name) {
    if (name.empty() || !is_ident_start(name[0])) return false;
    if (name[0] == '-' && (name.size() == 1 || std::isdigit(static_cast<unsigned char>(name[1])))) {
        return false;
    }
    for (char c : name) {
        if (!is_ident_char(c)) return false;
    }
    return true;
}

// Finds any of chars outside quoted strings and escapes. A dangling '\\'
// or an opening comment also counts, since either hides what follows.
bool contains_unquoted(const std::string& text, const std::string& chars) {
    char quote = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '\\') {
            if (i + 1 >= text.size()) return true;
            ++i;
            continue;
        }
        if (quote != 0) {
            if (c == quote) quote = 0;
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '/' && i + 1 < text.size() && text[i + 1] == '*') {
            return true;
        } else if (chars.find(c) != std::string::npos) {
            return true;
        }
    }
    return quote != 0;
}

bool is_keyframe_selector(const std::string& step) {
    if (step == "from" || step == "to") return true;
    if (step.size() < 2 || step.back() != '%') return false;
    const std::string number = step.substr(0, step.size() - 1);
    bool seen_dot = false;
    for (char c : number) {
        if (c == '.') {
            if (seen_dot) return false;
            seen_dot = true;
        } else if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    if (number.front() == '.' || number.back() == '.') return false;
    const double pct = std::strtod(number.c_str(), nullptr);
    return pct >= 0.0 && pct <= 100.0;
}

// ---------------------------------------------------------------------------
// Sheet walker
// ---------------------------------------------------------------------------

class Normalizer {
public:
    explicit Normalizer(const ComponentStyleSheet& sheet) : sheet_(sheet) {}

    NormalizeResult run();

private:
    const ComponentStyleSheet& sheet_;
    std::vector<CompileError> errors_;

    void fail(ErrorKind kind, const std::string& path, const std::string& message) {
        errors_.push_back({kind, sheet_.name, path, message});
    }

    RuleNode normalize_node(const RuleNode& node, const std::string& path, size_t depth);
    SelectorSpec normalize_selector(const SelectorSpec& spec, const std::string& path,
                                    size_t depth);
    SelectorSpec normalize_pseudo(const PseudoState& pseudo, const std::string& path);
    SelectorSpec normalize_combinator(const Combinator& combinator, const std::string& path);
    SelectorSpec normalize_media(const MediaQuery& media, const std::string& path, size_t depth);
    std::vector<Declaration> normalize_declarations(const std::vector<Declaration>& decls,
                                                    const std::string& path);
    KeyframesBlock normalize_keyframes(const KeyframesBlock& block, const std::string& path);
};

NormalizeResult Normalizer::run() {
    NormalizeResult result;
    result.sheet.name = sheet_.name;
    result.sheet.root = normalize_node(sheet_.root, sheet_.name, 0);

    std::set<std::string> keyframe_names;
    for (const auto& block : sheet_.keyframes) {
        const std::string path = sheet_.name + "/@keyframes " + block.name;
        if (!keyframe_names.insert(block.name).second) {
            fail(ErrorKind::MalformedKeyframes, path,
                 "keyframes '" + block.name + "' defined twice");
        }
        result.sheet.keyframes.push_back(normalize_keyframes(block, path));
    }

    result.errors = std::move(errors_);
    result.ok = result.errors.empty();
    return result;
}

RuleNode Normalizer::normalize_node(const RuleNode& node, const std::string& path, size_t depth) {
    RuleNode out(normalize_selector(node.selector, path, depth));
    out.declarations = normalize_declarations(node.declarations, path);
    for (const auto& c : node.children) {
        out.children.push_back(normalize_node(c, node_path(path, c.selector), depth + 1));
    }
    return out;
}

SelectorSpec Normalizer::normalize_selector(const SelectorSpec& spec, const std::string& path,
                                            size_t depth) {
    if (depth == 0) {
        if (!is_self(spec)) {
            fail(ErrorKind::MalformedSelector, path,
                 "root block must use the implicit parent selector, found '" +
                 selector_text(spec) + "'");
        }
        return spec;
    }
    if (std::holds_alternative<Self>(spec)) {
        fail(ErrorKind::MissingSelector, path, "nested block has no selector");
        return spec;
    }
    if (const auto* p = std::get_if<PseudoState>(&spec)) {
        return normalize_pseudo(*p, path);
    }
    if (const auto* c = std::get_if<Combinator>(&spec)) {
        return normalize_combinator(*c, path);
    }
    return normalize_media(std::get<MediaQuery>(spec), path, depth);
}

SelectorSpec Normalizer::normalize_pseudo(const PseudoState& pseudo, const std::string& path) {
    const std::string& name = pseudo.name;
    if (core::trim(name).empty()) {
        fail(ErrorKind::MissingSelector, path, "pseudo-state name is empty");
        return pseudo;
    }
    if (core::is_space(name.front()) || name.front() == ':') {
        fail(ErrorKind::MalformedPseudoSelector, path,
             "unexpected '" + std::string(1, name.front()) + "' after the pseudo-selector colon");
        return pseudo;
    }

    size_t open = std::string::npos;
    int depth = 0;
    for (size_t i = 0; i < name.size(); ++i) {
        const char c = name[i];
        if (c == ';' || c == '{' || c == '}') {
            fail(ErrorKind::MalformedPseudoSelector, path,
                 "'" + std::string(1, c) + "' inside pseudo-selector '" + name + "'");
            return pseudo;
        }
        if (c == '(') {
            if (depth == 0 && open == std::string::npos) open = i;
            ++depth;
        } else if (c == ')') {
            if (--depth < 0) break;
            if (depth == 0 && i + 1 != name.size()) {
                fail(ErrorKind::MalformedPseudoSelector, path,
                     "text after the argument of pseudo-selector '" + name + "'");
                return pseudo;
            }
        } else if (depth == 0 && core::is_space(c)) {
            fail(ErrorKind::MalformedPseudoSelector, path,
                 "whitespace inside pseudo-selector '" + name + "'");
            return pseudo;
        }
    }
    if (depth != 0) {
        fail(ErrorKind::MalformedPseudoSelector, path,
             "unbalanced parentheses in pseudo-selector '" + name + "'");
        return pseudo;
    }

    const std::string head = core::to_lower(name.substr(0, open));
    if (!is_identifier(head)) {
        fail(ErrorKind::MalformedPseudoSelector, path,
             "'" + head + "' is not a pseudo-class name");
        return pseudo;
    }

    PseudoState out{head, pseudo.element};
    if (open != std::string::npos) {
        const std::string argument =
            core::collapse_whitespace(name.substr(open + 1, name.size() - open - 2));
        if (argument.empty()) {
            fail(ErrorKind::MalformedPseudoSelector, path,
                 "empty argument in pseudo-selector '" + name + "'");
            return pseudo;
        }
        out.name += "(" + argument + ")";
    }
    return out;
}

SelectorSpec Normalizer::normalize_combinator(const Combinator& combinator,
                                              const std::string& path) {
    const std::string target = core::collapse_whitespace(combinator.target);
    if (target.empty()) {
        fail(ErrorKind::MissingSelector, path,
             std::string(combinator_kind_name(combinator.kind)) + " combinator target is empty");
        return combinator;
    }
    if (contains_unquoted(target, ";{}&@")) {
        fail(ErrorKind::MalformedSelector, path,
             "combinator target '" + target +
                 "' contains ';', '{', '}', '&', '@', a comment or an open string");
        return combinator;
    }
    const char lead = target.front();
    if (lead == '>' || lead == '+' || lead == '~' || lead == ',') {
        fail(ErrorKind::MalformedSelector, path,
             "combinator target '" + target + "' starts with '" + std::string(1, lead) + "'");
        return combinator;
    }

    const auto list = css::parse_selector_list(target);
    if (list.malformed || list.selectors.size() != 1) {
        fail(ErrorKind::MalformedSelector, path,
             "combinator target '" + target + "' is not a single selector");
        return combinator;
    }
    if (combinator.kind == CombinatorKind::Compound) {
        if ((lead != '.' && lead != '#' && lead != '[' && lead != ':') ||
            list.selectors.front().parts.size() != 1) {
            fail(ErrorKind::MalformedSelector, path,
                 "compound target '" + target +
                 "' must be classes, ids, attributes or pseudo-classes only");
            return combinator;
        }
    }
    return Combinator{combinator.kind, target};
}

SelectorSpec Normalizer::normalize_media(const MediaQuery& media, const std::string& path,
                                         size_t depth) {
    if (depth != 1) {
        fail(ErrorKind::NestedMediaQuery, path,
             "@media blocks are only allowed directly under the root block");
        return media;
    }
    auto condition = canonical_media_condition(media.condition);
    if (!condition) {
        fail(ErrorKind::MalformedMediaQuery, path,
             "media condition '" + media.condition + "' is not fully formed");
        return media;
    }
    return MediaQuery{*condition};
}

std::vector<Declaration> Normalizer::normalize_declarations(const std::vector<Declaration>& decls,
                                                            const std::string& path) {
    std::vector<Declaration> out;
    out.reserve(decls.size());
    for (const auto& decl : decls) {
        std::string property = core::trim(decl.property);
        const bool custom = core::starts_with(property, "--");
        if (!custom) {
            property = core::to_lower(property);
        }

        bool property_ok = !property.empty();
        for (char c : property) {
            if (custom ? (core::is_space(c) || c == ':' || c == ';' || c == '{' || c == '}')
                       : !(std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_')) {
                property_ok = false;
                break;
            }
        }
        if (!property_ok) {
            fail(ErrorKind::InvalidDeclaration, path,
                 "invalid property name '" + decl.property + "'");
            out.push_back(decl);
            continue;
        }

        auto value = canonical_value(decl.value);
        if (!value) {
            fail(ErrorKind::InvalidDeclaration, path,
                 "value of '" + property + "' is empty or would break its block: '" +
                 decl.value + "'");
            out.push_back(decl);
            continue;
        }
        out.push_back({property, *value});
    }
    return out;
}

KeyframesBlock Normalizer::normalize_keyframes(const KeyframesBlock& block,
                                               const std::string& path) {
    KeyframesBlock out;
    out.name = core::trim(block.name);
    if (!is_identifier(out.name)) {
        fail(ErrorKind::MalformedKeyframes, path,
             "'" + block.name + "' is not a valid keyframes name");
    }
    if (block.steps.empty()) {
        fail(ErrorKind::MalformedKeyframes, path, "keyframes block has no steps");
    }

    for (const auto& step : block.steps) {
        const std::string step_path = path + "/" + step.selector;
        std::string selector;
        const auto parts = css::split_top_level_commas(core::to_lower(step.selector));
        bool valid = !parts.empty();
        for (const auto& part : parts) {
            if (!is_keyframe_selector(part)) {
                valid = false;
                break;
            }
            if (!selector.empty()) selector += ", ";
            selector += part;
        }
        if (!valid) {
            fail(ErrorKind::MalformedKeyframes, step_path,
                 "keyframe selector '" + step.selector + "' must be from, to or a percentage");
            selector = step.selector;
        }

        KeyframeStep normalized;
        normalized.selector = selector;
        normalized.declarations = normalize_declarations(step.declarations, step_path);
        out.steps.push_back(std::move(normalized));
    }
    return out;
}

} // namespace

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

NormalizeResult normalize(const ComponentStyleSheet& sheet) {
    return Normalizer(sheet).run();
}

bool is_normalized(const ComponentStyleSheet& sheet) {
    auto result = normalize(sheet);
    return result.ok && result.sheet == sheet;
}

std::optional<std::string> canonical_media_condition(const std::string& condition) {
    const std::string text = core::trim(condition);
    if (text.empty() || text.find_first_of("{};") != std::string::npos) {
        return std::nullopt;
    }

    std::string out;
    int depth = 0;
    bool pending_space = false;
    bool force_space = false;
    for (char c : text) {
        if (core::is_space(c)) {
            pending_space = true;
            continue;
        }
        bool want_space = (pending_space || force_space) && !out.empty() &&
                          out.back() != '(' && c != ')' && c != ':' && c != ',';
        if (c == '(' && !out.empty() &&
            std::isalnum(static_cast<unsigned char>(out.back()))) {
            want_space = true;
        }
        if (want_space) out.push_back(' ');
        pending_space = false;
        force_space = false;
        out.push_back(c);

        if (c == '(') {
            ++depth;
        } else if (c == ')') {
            if (--depth < 0) return std::nullopt;
            force_space = true;
        } else if (c == ':' && depth > 0) {
            force_space = true;
        } else if (c == ',') {
            force_space = true;
        }
    }
    if (depth != 0) return std::nullopt;
    if (out.find("()") != std::string::npos || out.find("(:") != std::string::npos ||
        out.find(":)") != std::string::npos) {
        return std::nullopt;
    }
    for (const auto& part : css::split_top_level_commas(out)) {
        if (part.empty() || part.front() != '(') return std::nullopt;
    }
    if (out.back() == ',') return std::nullopt;
    return out;
}

std::optional<std::string> canonical_value(const std::string& value) {
    std::string text = core::collapse_whitespace(value);
    if (text.empty()) return std::nullopt;

    char quote = 0;
    int depth = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '\\') {
            // An escape covers the next character, quoted or not
            if (i + 1 >= text.size()) return std::nullopt;
            ++i;
            continue;
        }
        if (quote != 0) {
            if (c == quote) quote = 0;
            continue;
        }
        switch (c) {
            case '/':
                // Comments are never emitted; an open one would eat the rest of the block
                if (i + 1 < text.size() && text[i + 1] == '*') return std::nullopt;
                break;
            case '"':
            case '\'':
                quote = c;
                break;
            case '(':
                ++depth;
                break;
            case ')':
                if (--depth < 0) return std::nullopt;
                break;
            case '{':
            case '}':
                return std::nullopt;
            case ';':
                if (depth == 0) return std::nullopt;
                break;
            default:
                break;
        }
    }
    if (quote != 0 || depth != 0) return std::nullopt;
    return text;
}

std::string node_path(const std::string& parent_path, const SelectorSpec& spec) {
    return parent_path + "/" + selector_text(spec);
}

} // namespace stylec::ir
