#include <stylec/core/strings.h>

#include <cctype>

namespace stylec::core {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

std::string trim(std::string_view text) {
    size_t start = 0;
    while (start < text.size() && is_space(text[start])) {
        ++start;
    }
    size_t end = text.size();
    while (end > start && is_space(text[end - 1])) {
        --end;
    }
    return std::string(text.substr(start, end - start));
}

std::string to_lower(std::string_view text) {
    std::string out(text);
    for (auto& ch : out) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return out;
}

bool starts_with(std::string_view text, std::string_view prefix) {
    return text.size() >= prefix.size() && text.substr(0, prefix.size()) == prefix;
}

bool ends_with(std::string_view text, std::string_view suffix) {
    return text.size() >= suffix.size() &&
           text.substr(text.size() - suffix.size()) == suffix;
}

std::string collapse_whitespace(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    char quote = 0;
    bool pending_space = false;
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (quote != 0) {
            out.push_back(c);
            if (c == '\\' && i + 1 < text.size()) {
                out.push_back(text[++i]);
            } else if (c == quote) {
                quote = 0;
            }
            continue;
        }
        if (is_space(c)) {
            pending_space = true;
            continue;
        }
        if (pending_space && !out.empty()) {
            out.push_back(' ');
        }
        pending_space = false;
        if (c == '"' || c == '\'') {
            quote = c;
        }
        out.push_back(c);
    }
    return out;
}

std::string indent_lines(std::string_view text, std::size_t indent) {
    const std::string pad(indent, ' ');
    std::string out;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        const auto line = text.substr(start, end - start);
        if (!line.empty()) {
            out += pad;
            out += line;
        }
        if (end < text.size()) out.push_back('\n');
        start = end + 1;
    }
    return out;
}

} // namespace stylec::core
