#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace stylec::engine {

struct ValidationIssue {
    size_t line = 0;
    std::string message;
};

struct ValidationResult {
    bool ok = true;
    std::vector<ValidationIssue> issues;
};

// Structural check of style text as handed to Style::new:
//   - balanced braces, nothing after the last block
//   - only the first top-level block may have an empty selector
//   - selectors parse, with no space after a pseudo-class colon
//   - no ';' directly after '{'
//   - declarations are "property: value" and live inside a rule block
//   - @media only at top level and followed by '('
//   - @keyframes steps are from/to/percentages
ValidationResult validate_style_text(std::string_view text);

std::string format_issues(const ValidationResult& result);

} // namespace stylec::engine
