#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace stylec::css {

struct CSSToken {
    enum Type {
        Ident, Function, AtKeyword, Hash, String, Number, Percentage,
        Dimension, Whitespace, Colon, Semicolon, Comma,
        LeftBrace, RightBrace, LeftParen, RightParen, LeftBracket, RightBracket,
        Delim, CDC, CDO, EndOfFile
    };
    Type type = EndOfFile;
    std::string value;   // numbers keep their source spelling, e.g. "1.50", "16px"
    std::string unit;    // Dimension only
    char quote = '"';    // String only
    size_t line = 1;
    size_t column = 1;

    bool operator==(const CSSToken& other) const;
};

const char* token_type_name(CSSToken::Type type);

// Source text for a token, suitable for re-emitting values and selectors.
// Hash tokens regain their '#', functions their '(', strings their quotes.
std::string to_css_text(const CSSToken& token);

class CSSTokenizer {
public:
    explicit CSSTokenizer(std::string_view input);
    CSSToken next_token();

    static std::vector<CSSToken> tokenize_all(std::string_view input);

private:
    std::string_view input_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;

    char consume();
    char peek() const;
    char peek(size_t offset) const;
    bool at_end() const;
    void reconsume();

    CSSToken make(CSSToken::Type type, std::string value) const;

    void consume_whitespace();
    void consume_comment();
    CSSToken consume_string(char ending);
    CSSToken consume_numeric();
    CSSToken consume_ident_like();
    CSSToken consume_hash();
    std::string consume_number_repr();
    std::string consume_name();
    bool starts_identifier() const;
    bool starts_number() const;
    bool is_name_start_char(char c) const;
    bool is_name_char(char c) const;

    size_t token_line_ = 1;
    size_t token_column_ = 1;
};

} // namespace stylec::css
