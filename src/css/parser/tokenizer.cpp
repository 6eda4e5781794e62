#include <stylec/css/parser/tokenizer.h>
#include <cctype>

namespace stylec::css {

// ---------------------------------------------------------------------------
// CSSToken
// ---------------------------------------------------------------------------

bool CSSToken::operator==(const CSSToken& other) const {
    return type == other.type && value == other.value && unit == other.unit;
}

const char* token_type_name(CSSToken::Type type) {
    switch (type) {
        case CSSToken::Ident:        return "ident";
        case CSSToken::Function:     return "function";
        case CSSToken::AtKeyword:    return "at-keyword";
        case CSSToken::Hash:         return "hash";
        case CSSToken::String:       return "string";
        case CSSToken::Number:       return "number";
        case CSSToken::Percentage:   return "percentage";
        case CSSToken::Dimension:    return "dimension";
        case CSSToken::Whitespace:   return "whitespace";
        case CSSToken::Colon:        return "colon";
        case CSSToken::Semicolon:    return "semicolon";
        case CSSToken::Comma:        return "comma";
        case CSSToken::LeftBrace:    return "{";
        case CSSToken::RightBrace:   return "}";
        case CSSToken::LeftParen:    return "(";
        case CSSToken::RightParen:   return ")";
        case CSSToken::LeftBracket:  return "[";
        case CSSToken::RightBracket: return "]";
        case CSSToken::Delim:        return "delim";
        case CSSToken::CDC:          return "-->";
        case CSSToken::CDO:          return "<!--";
        case CSSToken::EndOfFile:    return "end of input";
    }
    return "unknown";
}

std::string to_css_text(const CSSToken& token) {
    switch (token.type) {
        case CSSToken::Hash:
            return "#" + token.value;
        case CSSToken::Function:
            return token.value + "(";
        case CSSToken::AtKeyword:
            return "@" + token.value;
        case CSSToken::String: {
            std::string out(1, token.quote);
            for (char c : token.value) {
                if (c == token.quote || c == '\\') out += '\\';
                out += c;
            }
            out += token.quote;
            return out;
        }
        case CSSToken::Whitespace:
            return " ";
        case CSSToken::EndOfFile:
            return "";
        default:
            return token.value;
    }
}

// ---------------------------------------------------------------------------
// CSSTokenizer
// ---------------------------------------------------------------------------

CSSTokenizer::CSSTokenizer(std::string_view input) : input_(input), pos_(0) {}

char CSSTokenizer::consume() {
    if (pos_ < input_.size()) {
        char c = input_[pos_++];
        if (c == '\n') {
            ++line_;
            column_ = 1;
        } else {
            ++column_;
        }
        return c;
    }
    return '\0';
}

char CSSTokenizer::peek() const {
    if (pos_ < input_.size()) {
        return input_[pos_];
    }
    return '\0';
}

char CSSTokenizer::peek(size_t offset) const {
    size_t idx = pos_ + offset;
    if (idx < input_.size()) {
        return input_[idx];
    }
    return '\0';
}

bool CSSTokenizer::at_end() const {
    return pos_ >= input_.size();
}

// Only ever steps back over a non-newline character.
void CSSTokenizer::reconsume() {
    if (pos_ > 0) {
        --pos_;
        if (column_ > 1) --column_;
    }
}

CSSToken CSSTokenizer::make(CSSToken::Type type, std::string value) const {
    CSSToken token;
    token.type = type;
    token.value = std::move(value);
    token.line = token_line_;
    token.column = token_column_;
    return token;
}

void CSSTokenizer::consume_whitespace() {
    while (!at_end() && (peek() == ' ' || peek() == '\t' || peek() == '\n' ||
                         peek() == '\r' || peek() == '\f')) {
        consume();
    }
}

void CSSTokenizer::consume_comment() {
    // '/' and '*' already consumed
    while (!at_end()) {
        char c = consume();
        if (c == '*' && peek() == '/') {
            consume();
            return;
        }
    }
}

bool CSSTokenizer::is_name_start_char(char c) const {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' ||
           (static_cast<unsigned char>(c) >= 0x80);
}

bool CSSTokenizer::is_name_char(char c) const {
    return is_name_start_char(c) || std::isdigit(static_cast<unsigned char>(c)) ||
           c == '-';
}

bool CSSTokenizer::starts_identifier() const {
    char c = peek();
    if (is_name_start_char(c)) return true;
    if (c == '-') {
        char next = peek(1);
        return is_name_start_char(next) || next == '-' || next == '\\';
    }
    if (c == '\\') {
        char next = peek(1);
        return next != '\n' && next != '\0';
    }
    return false;
}

bool CSSTokenizer::starts_number() const {
    char c = peek();
    if (std::isdigit(static_cast<unsigned char>(c))) return true;
    if (c == '.') {
        return std::isdigit(static_cast<unsigned char>(peek(1)));
    }
    if (c == '+' || c == '-') {
        char next = peek(1);
        if (std::isdigit(static_cast<unsigned char>(next))) return true;
        if (next == '.' && std::isdigit(static_cast<unsigned char>(peek(2))))
            return true;
    }
    return false;
}

// Escapes are kept verbatim ("sm\:flex") so selectors re-emit unchanged.
std::string CSSTokenizer::consume_name() {
    std::string result;
    while (!at_end()) {
        char c = peek();
        if (is_name_char(c)) {
            result += consume();
        } else if (c == '\\' && peek(1) != '\n' && peek(1) != '\0') {
            result += consume();
            result += consume();
        } else {
            break;
        }
    }
    return result;
}

std::string CSSTokenizer::consume_number_repr() {
    std::string repr;

    if (peek() == '+' || peek() == '-') {
        repr += consume();
    }
    while (!at_end() && std::isdigit(static_cast<unsigned char>(peek()))) {
        repr += consume();
    }
    if (peek() == '.' && std::isdigit(static_cast<unsigned char>(peek(1)))) {
        repr += consume();
        while (!at_end() && std::isdigit(static_cast<unsigned char>(peek()))) {
            repr += consume();
        }
    }
    if (peek() == 'e' || peek() == 'E') {
        char after_e = peek(1);
        bool signed_exp = (after_e == '+' || after_e == '-') &&
                          std::isdigit(static_cast<unsigned char>(peek(2)));
        if (std::isdigit(static_cast<unsigned char>(after_e)) || signed_exp) {
            repr += consume();
            if (peek() == '+' || peek() == '-') {
                repr += consume();
            }
            while (!at_end() &&
                   std::isdigit(static_cast<unsigned char>(peek()))) {
                repr += consume();
            }
        }
    }
    return repr;
}

CSSToken CSSTokenizer::consume_string(char ending) {
    std::string result;

    while (!at_end()) {
        char c = consume();
        if (c == ending) {
            break;
        }
        if (c == '\\') {
            if (at_end()) break;
            if (peek() == '\n') {
                consume();  // line continuation
            } else {
                result += consume();
            }
        } else if (c == '\n') {
            // unescaped newline ends a bad string
            break;
        } else {
            result += c;
        }
    }

    CSSToken token = make(CSSToken::String, result);
    token.quote = ending;
    return token;
}

CSSToken CSSTokenizer::consume_numeric() {
    std::string repr = consume_number_repr();

    if (starts_identifier()) {
        std::string unit = consume_name();
        CSSToken token = make(CSSToken::Dimension, repr + unit);
        token.unit = unit;
        return token;
    }
    if (peek() == '%') {
        consume();
        return make(CSSToken::Percentage, repr + "%");
    }
    return make(CSSToken::Number, repr);
}

CSSToken CSSTokenizer::consume_ident_like() {
    std::string name = consume_name();
    if (peek() == '(') {
        consume();
        return make(CSSToken::Function, name);
    }
    return make(CSSToken::Ident, name);
}

CSSToken CSSTokenizer::consume_hash() {
    // '#' already consumed
    if (!at_end() && (is_name_char(peek()) || peek() == '\\')) {
        return make(CSSToken::Hash, consume_name());
    }
    return make(CSSToken::Delim, "#");
}

CSSToken CSSTokenizer::next_token() {
    while (!at_end() && peek() == '/' && peek(1) == '*') {
        consume();
        consume();
        consume_comment();
    }

    token_line_ = line_;
    token_column_ = column_;

    if (at_end()) {
        return make(CSSToken::EndOfFile, "");
    }

    char c = consume();

    switch (c) {
        case ' ': case '\t': case '\n': case '\r': case '\f':
            consume_whitespace();
            return make(CSSToken::Whitespace, " ");
        case '"': case '\'':
            return consume_string(c);
        case '#':
            return consume_hash();
        case '(': return make(CSSToken::LeftParen, "(");
        case ')': return make(CSSToken::RightParen, ")");
        case ',': return make(CSSToken::Comma, ",");
        case ':': return make(CSSToken::Colon, ":");
        case ';': return make(CSSToken::Semicolon, ";");
        case '[': return make(CSSToken::LeftBracket, "[");
        case ']': return make(CSSToken::RightBracket, "]");
        case '{': return make(CSSToken::LeftBrace, "{");
        case '}': return make(CSSToken::RightBrace, "}");
        default:
            break;
    }

    if (c == '+' || c == '.') {
        reconsume();
        if (starts_number()) {
            return consume_numeric();
        }
        consume();
        return make(CSSToken::Delim, std::string(1, c));
    }

    if (c == '-') {
        if (peek() == '-' && peek(1) == '>') {
            consume();
            consume();
            return make(CSSToken::CDC, "-->");
        }
        reconsume();
        if (starts_number()) {
            return consume_numeric();
        }
        if (starts_identifier()) {
            return consume_ident_like();
        }
        consume();
        return make(CSSToken::Delim, "-");
    }

    if (c == '<' && peek() == '!' && peek(1) == '-' && peek(2) == '-') {
        consume();
        consume();
        consume();
        return make(CSSToken::CDO, "<!--");
    }

    if (c == '@') {
        if (starts_identifier()) {
            return make(CSSToken::AtKeyword, consume_name());
        }
        return make(CSSToken::Delim, "@");
    }

    if (c == '\\') {
        if (!at_end() && peek() != '\n') {
            reconsume();
            return consume_ident_like();
        }
        return make(CSSToken::Delim, "\\");
    }

    if (std::isdigit(static_cast<unsigned char>(c))) {
        reconsume();
        return consume_numeric();
    }

    if (is_name_start_char(c)) {
        reconsume();
        return consume_ident_like();
    }

    return make(CSSToken::Delim, std::string(1, c));
}

std::vector<CSSToken> CSSTokenizer::tokenize_all(std::string_view input) {
    CSSTokenizer tokenizer(input);
    std::vector<CSSToken> tokens;

    while (true) {
        CSSToken token = tokenizer.next_token();
        tokens.push_back(token);
        if (token.type == CSSToken::EndOfFile) {
            break;
        }
    }

    return tokens;
}

} // namespace stylec::css
