#include <stylec/codegen/naming.h>
#include <algorithm>
#include <array>
#include <cctype>

namespace stylec::codegen {

namespace {

constexpr std::array<std::string_view, 51> kRustKeywords = {
    "as", "break", "const", "continue", "crate", "else", "enum", "extern",
    "false", "fn", "for", "if", "impl", "in", "let", "loop", "match", "mod",
    "move", "mut", "pub", "ref", "return", "self", "Self", "static", "struct",
    "super", "trait", "true", "type", "unsafe", "use", "where", "while",
    "async", "await", "dyn", "abstract", "become", "box", "do", "final",
    "macro", "override", "priv", "typeof", "unsized", "virtual", "yield", "try",
};

bool is_alnum(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

} // namespace

bool is_rust_keyword(std::string_view name) {
    return std::find(kRustKeywords.begin(), kRustKeywords.end(), name) != kRustKeywords.end();
}

bool is_rust_identifier(std::string_view name) {
    if (name.empty() || name == "_") return false;
    if (!(std::isalpha(static_cast<unsigned char>(name[0])) || name[0] == '_')) return false;
    for (char c : name) {
        if (!(is_alnum(c) || c == '_')) return false;
    }
    return !is_rust_keyword(name);
}

std::string sanitize_identifier(std::string_view name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        const char mapped = is_alnum(c) ? c : '_';
        if (mapped == '_' && !out.empty() && out.back() == '_') continue;
        out.push_back(mapped);
    }

    // Trim underscores
    const auto first = out.find_first_not_of('_');
    if (first == std::string::npos) {
        return "style";
    }
    out = out.substr(first, out.find_last_not_of('_') - first + 1);

    if (std::isdigit(static_cast<unsigned char>(out[0]))) {
        out = "style_" + out;
    }
    if (is_rust_keyword(out)) {
        out += "_style";
    }
    return out;
}

std::string doc_title(std::string_view name) {
    std::string out;
    bool word_start = true;
    for (char c : name) {
        if (c == '_') {
            out.push_back(' ');
            word_start = true;
            continue;
        }
        if (word_start) {
            out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        } else {
            out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
        word_start = !std::isalpha(static_cast<unsigned char>(c));
    }
    return out;
}

} // namespace stylec::codegen
