#pragma once

#include <string>
#include <string_view>

namespace stylec::core {

bool is_space(char c);
std::string trim(std::string_view text);
std::string to_lower(std::string_view text);
bool starts_with(std::string_view text, std::string_view prefix);
bool ends_with(std::string_view text, std::string_view suffix);

// Collapses whitespace runs to one space and trims, leaving quoted strings
// untouched.
std::string collapse_whitespace(std::string_view text);

// Reindents a multi-line block: every non-empty line gets `indent` spaces
// prepended.
std::string indent_lines(std::string_view text, std::size_t indent);

} // namespace stylec::core
