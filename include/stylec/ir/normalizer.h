#pragma once
#include <stylec/core/error.h>
#include <stylec/ir/style_ir.h>
#include <optional>
#include <string>
#include <vector>

namespace stylec::ir {

struct NormalizeResult {
    bool ok = false;
    ComponentStyleSheet sheet;               // canonical copy; meaningful only when ok
    std::vector<core::CompileError> errors;  // every problem found, in tree order
};

// Validates one sheet and rewrites it into canonical form:
//   - pseudo-states as &:name with no inner whitespace
//   - combinator targets trimmed, whitespace collapsed, never empty
//   - media conditions "(feature: value)" and top-level only
//   - lowercase properties (custom properties keep their case), collapsed values
//   - keyframe steps from/to/N%
// normalize(normalize(s).sheet).sheet == normalize(s).sheet
NormalizeResult normalize(const ComponentStyleSheet& sheet);

// True iff the sheet validates and is already canonical.
bool is_normalized(const ComponentStyleSheet& sheet);

// Canonical media condition, or nullopt if it is not fully formed.
std::optional<std::string> canonical_media_condition(const std::string& condition);

// Canonical declaration value, or nullopt when the value would break out of
// its block (top-level ; { }, unbalanced quotes or parentheses) or is empty.
std::optional<std::string> canonical_value(const std::string& value);

// Path of a node inside a sheet: "button/&:hover/& .icon"
std::string node_path(const std::string& parent_path, const SelectorSpec& spec);

} // namespace stylec::ir
