#pragma once
#include <cstddef>
#include <list>
#include <string>
#include <variant>
#include <vector>

namespace stylec::ir {

struct Declaration {
    std::string property;
    std::string value;

    bool operator==(const Declaration& other) const = default;
};

// --- Selector specs -------------------------------------------------------

// The implicit parent "&". Only the root node carries it.
struct Self {
    bool operator==(const Self&) const = default;
};

// &:name, or &::name for pseudo-elements
struct PseudoState {
    std::string name;
    bool element = false;

    bool operator==(const PseudoState&) const = default;
};

enum class CombinatorKind {
    Descendant,        // & target
    Child,             // & > target
    NextSibling,       // & + target
    SubsequentSibling, // & ~ target
    Compound           // &target
};

struct Combinator {
    CombinatorKind kind = CombinatorKind::Descendant;
    std::string target;

    bool operator==(const Combinator&) const = default;
};

// @media condition
struct MediaQuery {
    std::string condition;

    bool operator==(const MediaQuery&) const = default;
};

using SelectorSpec = std::variant<Self, PseudoState, Combinator, MediaQuery>;

SelectorSpec self();
SelectorSpec pseudo(std::string name);
SelectorSpec pseudo_element(std::string name);
SelectorSpec descendant(std::string target);
SelectorSpec child(std::string target);
SelectorSpec next_sibling(std::string target);
SelectorSpec subsequent_sibling(std::string target);
SelectorSpec compound(std::string target);
SelectorSpec media(std::string condition);

const char* combinator_kind_name(CombinatorKind kind);

// Selector text as it appears in emitted style text: "&:hover", "& > a",
// "@media (max-width: 768px)". No validation happens here.
std::string selector_text(const SelectorSpec& spec);

bool is_self(const SelectorSpec& spec);
bool is_media(const SelectorSpec& spec);

// --- Rule tree ------------------------------------------------------------

// Children live in a std::list so references returned by add_child stay
// valid while siblings are added.
class RuleNode {
public:
    RuleNode() = default;
    explicit RuleNode(SelectorSpec selector) : selector(std::move(selector)) {}

    SelectorSpec selector = Self{};
    std::vector<Declaration> declarations;
    std::list<RuleNode> children;

    RuleNode& add_declaration(std::string property, std::string value);
    RuleNode& add_child(SelectorSpec spec);

    // First direct child with exactly this selector, or nullptr
    RuleNode* find_child(const SelectorSpec& spec);
    const RuleNode* find_child(const SelectorSpec& spec) const;

    // find_child, falling back to add_child
    RuleNode& child_for(const SelectorSpec& spec);

    bool empty() const { return declarations.empty() && children.empty(); }
    size_t node_count() const;

    bool operator==(const RuleNode& other) const;
};

struct KeyframeStep {
    std::string selector;   // from, to, 40%, "0%, 100%"
    std::vector<Declaration> declarations;

    KeyframeStep& add_declaration(std::string property, std::string value);

    bool operator==(const KeyframeStep&) const = default;
};

struct KeyframesBlock {
    std::string name;
    std::list<KeyframeStep> steps;

    KeyframeStep& add_step(std::string selector);

    bool operator==(const KeyframesBlock&) const = default;
};

// One generated style function.
struct ComponentStyleSheet {
    ComponentStyleSheet() = default;
    explicit ComponentStyleSheet(std::string name) : name(std::move(name)) {}

    std::string name;
    RuleNode root;
    std::list<KeyframesBlock> keyframes;

    KeyframesBlock& add_keyframes(std::string keyframes_name);

    bool operator==(const ComponentStyleSheet& other) const;
};

// One generated Rust module; owns its sheets.
struct StyleModule {
    StyleModule() = default;
    explicit StyleModule(std::string name) : name(std::move(name)) {}

    std::string name;
    std::list<ComponentStyleSheet> sheets;

    ComponentStyleSheet& add_sheet(std::string sheet_name);
    ComponentStyleSheet* find_sheet(const std::string& sheet_name);
};

} // namespace stylec::ir
