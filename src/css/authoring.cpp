#include <stylec/css/authoring.h>
#include <stylec/codegen/naming.h>
#include <stylec/core/config.h>
#include <stylec/core/strings.h>
#include <array>
#include <cctype>
#include <map>

namespace stylec::css {

namespace {

constexpr std::array<std::string_view, 18> kVariantSuffixes = {
    // intent
    "primary", "secondary", "success", "danger", "warning", "info", "light", "dark",
    // size
    "small", "sm", "large", "lg", "xl", "xs",
    // treatment
    "outline", "solid", "ghost", "link",
};

struct ComponentPrefix {
    std::string_view prefix;
    std::string_view component;
};

constexpr std::array<ComponentPrefix, 8> kComponentPrefixes = {{
    {"btn", "button"},
    {"card", "card"},
    {"nav", "navbar"},
    {"modal", "modal"},
    {"form", "form"},
    {"input", "input"},
    {"table", "table"},
    {"alert", "alert"},
}};

bool is_separator(char c) {
    return c == '-' || c == '_';
}

std::string pseudo_name(const SimpleSelector& simple) {
    std::string name = simple.value;
    if (simple.is_function) {
        name += "(" + simple.argument + ")";
    }
    return name;
}

ir::CombinatorKind to_combinator_kind(Combinator combinator) {
    switch (combinator) {
        case Combinator::Descendant:        return ir::CombinatorKind::Descendant;
        case Combinator::Child:             return ir::CombinatorKind::Child;
        case Combinator::NextSibling:       return ir::CombinatorKind::NextSibling;
        case Combinator::SubsequentSibling: return ir::CombinatorKind::SubsequentSibling;
    }
    return ir::CombinatorKind::Descendant;
}

bool is_pseudo(const SimpleSelector& simple) {
    return simple.type == SimpleSelectorType::PseudoClass ||
           simple.type == SimpleSelectorType::PseudoElement;
}

// Name a simple selector contributes to a sheet name: the class or id
// without its sigil, the attribute name, or the pseudo-class name.
std::string anchor_text(const SimpleSelector& simple) {
    return simple.type == SimpleSelectorType::Universal ? "universal" : simple.value;
}

// Picks the simple selector a sheet is named after. With variant extraction
// a class carrying a known variant suffix wins over its base class, so
// ".btn.btn-primary" lands in btn_primary.
size_t pick_anchor(const CompoundSelector& compound, bool extract_variants) {
    const auto& simples = compound.simple_selectors;
    const size_t none = simples.size();

    if (extract_variants) {
        for (size_t i = 0; i < simples.size(); ++i) {
            if (simples[i].type == SimpleSelectorType::Class &&
                split_variant(simples[i].value).known) {
                return i;
            }
        }
    }
    constexpr std::array<SimpleSelectorType, 5> order = {
        SimpleSelectorType::Class, SimpleSelectorType::Id, SimpleSelectorType::Type,
        SimpleSelectorType::Attribute, SimpleSelectorType::Universal,
    };
    for (auto type : order) {
        for (size_t i = 0; i < simples.size(); ++i) {
            if (simples[i].type == type) return i;
        }
    }
    for (size_t i = 0; i < simples.size(); ++i) {
        if (is_pseudo(simples[i])) return i;
    }
    return none;
}

} // namespace

// ---------------------------------------------------------------------------
// Names
// ---------------------------------------------------------------------------

bool is_known_variant_suffix(std::string_view suffix) {
    const std::string lower = core::to_lower(suffix);
    for (auto known : kVariantSuffixes) {
        if (lower == known) return true;
    }
    return false;
}

VariantName split_variant(std::string_view name) {
    VariantName result;
    const std::string lower = core::to_lower(core::trim(name));

    size_t letters = 0;
    while (letters < lower.size() && std::isalpha(static_cast<unsigned char>(lower[letters]))) {
        ++letters;
    }
    if (letters == 0 || letters + 1 >= lower.size() || !is_separator(lower[letters])) {
        result.base = lower;
        return result;
    }

    const std::string rest = lower.substr(letters + 1);
    size_t segment_end = 0;
    while (segment_end < rest.size() && !is_separator(rest[segment_end])) {
        ++segment_end;
    }
    const std::string first_segment = rest.substr(0, segment_end);
    if (first_segment.empty() || !std::isalpha(static_cast<unsigned char>(first_segment[0]))) {
        result.base = lower;
        return result;
    }

    result.base = lower.substr(0, letters);
    result.variant = rest;
    result.known = is_known_variant_suffix(first_segment);
    return result;
}

std::string component_name(std::string_view name) {
    std::string lower = core::to_lower(core::trim(name));
    while (!lower.empty() && (lower.front() == '.' || lower.front() == '#')) {
        lower.erase(lower.begin());
    }
    for (const auto& entry : kComponentPrefixes) {
        if (core::starts_with(lower, entry.prefix)) {
            return std::string(entry.component);
        }
    }
    size_t end = 0;
    while (end < lower.size() && !is_separator(lower[end]) && !core::is_space(lower[end])) {
        ++end;
    }
    const std::string word = lower.substr(0, end);
    return word.empty() ? "component" : word;
}

// ---------------------------------------------------------------------------
// Placement
// ---------------------------------------------------------------------------

std::optional<SelectorPlacement> place_selector(const ComplexSelector& selector,
                                                bool extract_variants) {
    if (selector.parts.empty() || selector.parts.front().compound.empty()) {
        return std::nullopt;
    }
    const auto& base = selector.parts.front().compound.simple_selectors;
    const size_t anchor = pick_anchor(selector.parts.front().compound, extract_variants);
    if (anchor >= base.size()) {
        return std::nullopt;
    }

    SelectorPlacement placement;
    std::string raw_name;
    std::string extras;
    std::vector<ir::SelectorSpec> pseudo_chain;

    if (extract_variants) {
        raw_name = anchor_text(base[anchor]);
    }
    for (size_t i = 0; i < base.size(); ++i) {
        const auto& simple = base[i];
        if (simple.type == SimpleSelectorType::Nesting) {
            continue;
        }
        if (is_pseudo(simple)) {
            if (i == anchor) {
                if (!extract_variants) raw_name += "-" + simple.value;
                continue;
            }
            pseudo_chain.push_back(simple.type == SimpleSelectorType::PseudoElement
                                       ? ir::pseudo_element(pseudo_name(simple))
                                       : ir::pseudo(pseudo_name(simple)));
            continue;
        }
        if (!extract_variants) {
            raw_name += "-" + anchor_text(simple);
            continue;
        }
        if (i == anchor) {
            continue;
        }
        if (simple.type == SimpleSelectorType::Type ||
            simple.type == SimpleSelectorType::Universal) {
            placement.dropped.push_back(to_string(simple));
            continue;
        }
        extras += to_string(simple);
    }

    placement.sheet = codegen::sanitize_identifier(core::to_lower(raw_name));
    placement.component = codegen::sanitize_identifier(component_name(raw_name.empty()
        ? placement.sheet : raw_name.substr(raw_name.front() == '-' ? 1 : 0)));

    if (!extras.empty()) {
        placement.chain.push_back(ir::compound(extras));
    }
    for (auto& spec : pseudo_chain) {
        placement.chain.push_back(std::move(spec));
    }
    for (size_t p = 1; p < selector.parts.size(); ++p) {
        const auto& part = selector.parts[p];
        const auto kind = to_combinator_kind(part.combinator.value_or(Combinator::Descendant));
        placement.chain.push_back(ir::Combinator{kind, to_string(part.compound)});
    }
    return placement;
}

// ---------------------------------------------------------------------------
// Module building
// ---------------------------------------------------------------------------

namespace {

class ModuleSet {
public:
    ir::StyleModule& module(const std::string& name) {
        auto it = index_.find(name);
        if (it != index_.end()) {
            return modules_[it->second];
        }
        index_.emplace(name, modules_.size());
        return modules_.emplace_back(name);
    }

    ir::ComponentStyleSheet& sheet(const std::string& module_name, const std::string& sheet_name) {
        auto& m = module(module_name);
        if (auto* existing = m.find_sheet(sheet_name)) {
            return *existing;
        }
        return m.add_sheet(sheet_name);
    }

    std::vector<ir::StyleModule> take() { return std::move(modules_); }

private:
    std::vector<ir::StyleModule> modules_;
    std::map<std::string, size_t> index_;
};

std::string mapped_value(const AuthoringOptions& options, const Declaration& decl) {
    std::string value = options.map_value ? options.map_value(decl.property, decl.value)
                                          : decl.value;
    if (decl.important) {
        value += " !important";
    }
    return value;
}

} // namespace

AuthoringResult build_modules(const StyleSheet& sheet, const AuthoringOptions& options) {
    AuthoringResult result;
    ModuleSet modules;

    for (const auto& w : sheet.warnings) {
        result.warnings.push_back("line " + std::to_string(w.line) + ": " + w.message);
    }

    for (const auto& rule : sheet.rules) {
        const std::string where = "line " + std::to_string(rule.line) + ": ";
        if (rule.selectors.malformed || rule.selectors.selectors.empty()) {
            result.warnings.push_back(where + "skipped rule with malformed selector '" +
                                      rule.selector_text + "'");
            continue;
        }
        if (rule.declarations.empty()) {
            result.warnings.push_back(where + "skipped empty rule '" + rule.selector_text + "'");
            continue;
        }

        bool used = false;
        for (const auto& complex : rule.selectors.selectors) {
            auto placement = place_selector(complex, options.extract_variants);
            if (!placement) {
                result.warnings.push_back(where + "cannot place selector '" +
                                          to_string(complex) + "'");
                continue;
            }
            for (const auto& dropped : placement->dropped) {
                result.warnings.push_back(where + "type selector '" + dropped + "' in '" +
                                          to_string(complex) + "' dropped");
            }

            const std::string module_name = options.group_by_component
                ? placement->component : options.default_module;
            auto& target = modules.sheet(module_name, placement->sheet);

            ir::RuleNode* node = &target.root;
            if (!rule.media.empty()) {
                node = &node->child_for(ir::media(rule.media));
            }
            for (const auto& spec : placement->chain) {
                node = &node->child_for(spec);
            }
            for (const auto& decl : rule.declarations) {
                node->add_declaration(decl.property, mapped_value(options, decl));
            }
            used = true;
        }
        if (used) ++result.rules_used;
    }

    for (const auto& kr : sheet.keyframes) {
        if (kr.name.empty()) {
            result.warnings.push_back("line " + std::to_string(kr.line) +
                                      ": skipped @keyframes without a name");
            continue;
        }
        const std::string module_name = options.group_by_component
            ? options.animations_module : options.default_module;
        auto& target = modules.sheet(module_name,
            core::config::kAnimationPrefix + codegen::sanitize_identifier(core::to_lower(kr.name)));

        auto& block = target.add_keyframes(kr.name);
        for (const auto& step : kr.steps) {
            auto& out_step = block.add_step(step.selector);
            for (const auto& decl : step.declarations) {
                if (decl.important) {
                    result.warnings.push_back("line " + std::to_string(decl.line) +
                                              ": !important ignored inside @keyframes " + kr.name);
                }
                std::string value = options.map_value
                    ? options.map_value(decl.property, decl.value) : decl.value;
                out_step.add_declaration(decl.property, value);
            }
        }
        ++result.keyframes_used;
    }

    result.modules = modules.take();
    return result;
}

} // namespace stylec::css
