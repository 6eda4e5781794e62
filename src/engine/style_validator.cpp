#include <stylec/engine/style_validator.h>
#include <stylec/core/strings.h>
#include <stylec/css/parser/selector.h>
#include <stylec/css/parser/stylesheet.h>
#include <cctype>
#include <sstream>

namespace stylec::engine {

namespace {

enum class BlockKind {
    Rule,
    Media,
    Keyframes,
    KeyframeStep,
};

class StyleTextChecker {
public:
    explicit StyleTextChecker(std::string_view text) : text_(text) {}

    ValidationResult run();

private:
    std::string_view text_;
    std::vector<BlockKind> stack_;
    std::string buffer_;
    size_t line_ = 1;
    size_t buffer_line_ = 1;
    size_t top_level_blocks_ = 0;
    bool just_opened_ = false;
    ValidationResult result_;

    void issue(size_t line, const std::string& message) {
        result_.ok = false;
        result_.issues.push_back({line, message});
    }

    void open_block(const std::string& prelude, size_t line);
    void close_block(size_t line);
    void declaration(const std::string& statement, size_t line);
    void check_selector(const std::string& selector, size_t line);
};

bool is_step_selector(const std::string& text) {
    for (const auto& part : css::split_top_level_commas(core::to_lower(text))) {
        if (part == "from" || part == "to") continue;
        if (part.size() < 2 || part.back() != '%') return false;
        for (size_t i = 0; i + 1 < part.size(); ++i) {
            if (!std::isdigit(static_cast<unsigned char>(part[i])) && part[i] != '.') return false;
        }
    }
    return !core::trim(text).empty();
}

ValidationResult StyleTextChecker::run() {
    char quote = 0;
    int parens = 0;
    for (size_t i = 0; i < text_.size(); ++i) {
        const char c = text_[i];
        if (c == '\n') ++line_;

        if (c == '\\') {
            if (i + 1 >= text_.size()) {
                issue(line_, "dangling '\\' at end of text");
                break;
            }
            if (quote == 0 && core::trim(buffer_).empty()) buffer_line_ = line_;
            buffer_.push_back(c);
            buffer_.push_back(text_[++i]);
            if (text_[i] == '\n') ++line_;
            continue;
        }

        if (quote != 0) {
            buffer_.push_back(c);
            if (c == quote) quote = 0;
            continue;
        }

        if (c == '/' && i + 1 < text_.size() && text_[i + 1] == '*') {
            const size_t end = text_.find("*/", i + 2);
            if (end == std::string_view::npos) {
                issue(line_, "unterminated comment");
                break;
            }
            for (size_t j = i; j < end; ++j) {
                if (text_[j] == '\n') ++line_;
            }
            i = end + 1;
            continue;
        }

        if (core::trim(buffer_).empty() && !core::is_space(c)) {
            buffer_line_ = line_;
        }

        if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '(') {
            ++parens;
        } else if (c == ')') {
            --parens;
        } else if (parens <= 0) {
            if (c == '{') {
                open_block(core::trim(buffer_), buffer_line_);
                buffer_.clear();
                parens = 0;
                just_opened_ = true;
                continue;
            }
            if (c == '}') {
                if (!core::trim(buffer_).empty()) {
                    declaration(core::trim(buffer_), buffer_line_);
                }
                buffer_.clear();
                close_block(line_);
                just_opened_ = false;
                continue;
            }
            if (c == ';') {
                const std::string statement = core::trim(buffer_);
                if (statement.empty()) {
                    issue(line_, just_opened_ ? "';' directly after '{'" : "stray ';'");
                } else {
                    declaration(statement, buffer_line_);
                }
                buffer_.clear();
                just_opened_ = false;
                continue;
            }
        }
        if (!core::is_space(c)) just_opened_ = false;
        buffer_.push_back(c);
    }

    if (quote != 0) {
        issue(line_, "unterminated string");
    }
    if (!core::trim(buffer_).empty()) {
        issue(buffer_line_, "trailing text '" + core::trim(buffer_) + "' outside any block");
    }
    if (!stack_.empty()) {
        issue(line_, std::to_string(stack_.size()) + " block(s) left unclosed");
    }
    return std::move(result_);
}

void StyleTextChecker::open_block(const std::string& prelude, size_t line) {
    const bool top_level = stack_.empty();
    if (top_level) ++top_level_blocks_;

    if (!stack_.empty() && stack_.back() == BlockKind::Keyframes) {
        if (!is_step_selector(prelude)) {
            issue(line, "keyframe selector '" + prelude + "' is not from, to or a percentage");
        }
        stack_.push_back(BlockKind::KeyframeStep);
        return;
    }
    if (!stack_.empty() && stack_.back() == BlockKind::KeyframeStep) {
        issue(line, "block inside a keyframe step");
        stack_.push_back(BlockKind::Rule);
        return;
    }

    if (core::starts_with(prelude, "@media")) {
        if (!top_level) {
            issue(line, "@media block nested inside another block");
        }
        if (!core::starts_with(prelude, "@media (")) {
            issue(line, "@media must be followed by a parenthesized condition, found '" +
                            prelude + "'");
        }
        stack_.push_back(BlockKind::Media);
        return;
    }
    if (core::starts_with(prelude, "@keyframes")) {
        const std::string name = core::trim(prelude.substr(10));
        if (!top_level) {
            issue(line, "@keyframes nested inside another block");
        }
        if (name.empty() || name.find(' ') != std::string::npos) {
            issue(line, "@keyframes needs a single name, found '" + name + "'");
        }
        stack_.push_back(BlockKind::Keyframes);
        return;
    }
    if (!prelude.empty() && prelude.front() == '@') {
        issue(line, "unsupported at-rule '" + prelude + "'");
        stack_.push_back(BlockKind::Rule);
        return;
    }

    if (prelude.empty()) {
        if (!(top_level && top_level_blocks_ == 1)) {
            issue(line, "block without a selector");
        }
    } else {
        check_selector(prelude, line);
    }
    stack_.push_back(BlockKind::Rule);
}

void StyleTextChecker::close_block(size_t line) {
    if (stack_.empty()) {
        issue(line, "unbalanced '}'");
        return;
    }
    stack_.pop_back();
}

void StyleTextChecker::check_selector(const std::string& selector, size_t line) {
    for (size_t i = 0; i + 1 < selector.size(); ++i) {
        if (selector[i] == ':' && core::is_space(selector[i + 1])) {
            issue(line, "whitespace after ':' in selector '" + selector + "'");
            return;
        }
    }
    const auto list = css::parse_selector_list(selector);
    if (list.malformed || list.selectors.empty()) {
        issue(line, "malformed selector '" + selector + "'");
    }
}

void StyleTextChecker::declaration(const std::string& statement, size_t line) {
    if (stack_.empty()) {
        issue(line, "declaration '" + statement + "' outside any block");
        return;
    }
    const BlockKind kind = stack_.back();
    if (kind == BlockKind::Media || kind == BlockKind::Keyframes) {
        issue(line, "declaration '" + statement + "' directly inside an at-rule block");
        return;
    }

    const auto colon = statement.find(':');
    if (colon == std::string::npos) {
        issue(line, "declaration '" + statement + "' is missing ':'");
        return;
    }
    const std::string property = core::trim(statement.substr(0, colon));
    const std::string value = core::trim(statement.substr(colon + 1));
    if (property.empty()) {
        issue(line, "declaration '" + statement + "' has no property");
        return;
    }
    for (char c : property) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_')) {
            issue(line, "invalid property name '" + property + "'");
            return;
        }
    }
    if (value.empty()) {
        issue(line, "declaration '" + property + "' has no value");
    }
}

} // namespace

ValidationResult validate_style_text(std::string_view text) {
    return StyleTextChecker(text).run();
}

std::string format_issues(const ValidationResult& result) {
    std::ostringstream out;
    for (size_t i = 0; i < result.issues.size(); ++i) {
        if (i > 0) out << "; ";
        out << "line " << result.issues[i].line << ": " << result.issues[i].message;
    }
    return out.str();
}

} // namespace stylec::engine
