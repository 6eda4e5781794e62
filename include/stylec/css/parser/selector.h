#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stylec::css {

enum class SimpleSelectorType {
    Type,         // div, p, span
    Class,        // .foo
    Id,           // #bar
    Universal,    // *
    Attribute,    // [attr=val]
    PseudoClass,  // :hover, :not(.x)
    PseudoElement, // ::before, ::after
    Nesting       // &
};

struct SimpleSelector {
    SimpleSelectorType type = SimpleSelectorType::Type;
    std::string value;

    // Attribute selectors keep their bracket contents verbatim: "type=\"text\""
    std::string attribute;

    // Functional pseudo-class argument, e.g. ".x" for :not(.x)
    std::string argument;
    bool is_function = false;
};

enum class Combinator {
    Descendant,        // space
    Child,             // >
    NextSibling,       // +
    SubsequentSibling  // ~
};

struct CompoundSelector {
    std::vector<SimpleSelector> simple_selectors;
    bool empty() const { return simple_selectors.empty(); }
};

struct ComplexSelector {
    struct Part {
        CompoundSelector compound;
        std::optional<Combinator> combinator;  // combinator BEFORE this compound
    };
    std::vector<Part> parts;
};

struct SelectorList {
    std::vector<ComplexSelector> selectors;
    // Set when tokens were left over or a compound came out empty.
    bool malformed = false;
};

SelectorList parse_selector_list(std::string_view input);

const char* combinator_text(Combinator combinator);  // " ", " > ", " + ", " ~ "

std::string to_string(const SimpleSelector& selector);
std::string to_string(const CompoundSelector& compound);
std::string to_string(const ComplexSelector& selector);

} // namespace stylec::css
