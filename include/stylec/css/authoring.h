#pragma once
#include <stylec/core/config.h>
#include <stylec/css/parser/stylesheet.h>
#include <stylec/ir/style_ir.h>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stylec::css {

// "btn-primary" -> {"btn", "primary"}, "card-header" -> {"card", "header"},
// "card" -> {"card", ""}. Known suffixes (colors, sizes, styles) are
// preferred; any other "<letters>-<letters>" pair splits generically.
struct VariantName {
    std::string base;
    std::string variant;
    bool known = false;   // variant is one of the known suffixes
};

VariantName split_variant(std::string_view name);
bool is_known_variant_suffix(std::string_view suffix);

// btn* -> button, card* -> card, nav* -> navbar, ... else the first word.
std::string component_name(std::string_view name);

// Maps a declaration value for a property; empty function keeps values as-is.
using ValueMapper = std::function<std::string(const std::string& property,
                                              const std::string& value)>;

struct AuthoringOptions {
    bool extract_variants = true;
    bool group_by_component = false;
    std::string default_module = core::config::kDefaultModule;
    std::string animations_module = core::config::kAnimationsModule;
    ValueMapper map_value;
};

struct AuthoringResult {
    std::vector<ir::StyleModule> modules;   // in order of first appearance
    std::vector<std::string> warnings;
    size_t rules_used = 0;
    size_t keyframes_used = 0;
};

// Where one complex selector of a rule lands: the sheet it belongs to and
// the chain of nested specs under that sheet's root.
struct SelectorPlacement {
    std::string sheet;
    std::string component;
    std::vector<ir::SelectorSpec> chain;
    std::vector<std::string> dropped;   // simple selectors the IR cannot express
};

std::optional<SelectorPlacement> place_selector(const ComplexSelector& selector,
                                                bool extract_variants);

// Groups parsed rules into modules and sheets and builds their IR. Nodes with
// identical selectors are merged, so repeated rules append to one node.
AuthoringResult build_modules(const StyleSheet& sheet, const AuthoringOptions& options);

} // namespace stylec::css
