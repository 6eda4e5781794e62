#include <stylec/ir/style_ir.h>

namespace stylec::ir {

SelectorSpec self() { return Self{}; }
SelectorSpec pseudo(std::string name) { return PseudoState{std::move(name), false}; }
SelectorSpec pseudo_element(std::string name) { return PseudoState{std::move(name), true}; }

SelectorSpec descendant(std::string target) {
    return Combinator{CombinatorKind::Descendant, std::move(target)};
}

SelectorSpec child(std::string target) {
    return Combinator{CombinatorKind::Child, std::move(target)};
}

SelectorSpec next_sibling(std::string target) {
    return Combinator{CombinatorKind::NextSibling, std::move(target)};
}

SelectorSpec subsequent_sibling(std::string target) {
    return Combinator{CombinatorKind::SubsequentSibling, std::move(target)};
}

SelectorSpec compound(std::string target) {
    return Combinator{CombinatorKind::Compound, std::move(target)};
}

SelectorSpec media(std::string condition) { return MediaQuery{std::move(condition)}; }

const char* combinator_kind_name(CombinatorKind kind) {
    switch (kind) {
        case CombinatorKind::Descendant:        return "descendant";
        case CombinatorKind::Child:             return "child";
        case CombinatorKind::NextSibling:       return "next-sibling";
        case CombinatorKind::SubsequentSibling: return "subsequent-sibling";
        case CombinatorKind::Compound:          return "compound";
    }
    return "unknown";
}

namespace {

struct SelectorTextVisitor {
    std::string operator()(const Self&) const { return "&"; }

    std::string operator()(const PseudoState& p) const {
        return (p.element ? "&::" : "&:") + p.name;
    }

    std::string operator()(const Combinator& c) const {
        switch (c.kind) {
            case CombinatorKind::Descendant:        return "& " + c.target;
            case CombinatorKind::Child:             return "& > " + c.target;
            case CombinatorKind::NextSibling:       return "& + " + c.target;
            case CombinatorKind::SubsequentSibling: return "& ~ " + c.target;
            case CombinatorKind::Compound:          return "&" + c.target;
        }
        return "&";
    }

    std::string operator()(const MediaQuery& m) const {
        return "@media " + m.condition;
    }
};

} // namespace

std::string selector_text(const SelectorSpec& spec) {
    return std::visit(SelectorTextVisitor{}, spec);
}

bool is_self(const SelectorSpec& spec) {
    return std::holds_alternative<Self>(spec);
}

bool is_media(const SelectorSpec& spec) {
    return std::holds_alternative<MediaQuery>(spec);
}

// --- RuleNode -------------------------------------------------------------

RuleNode& RuleNode::add_declaration(std::string property, std::string value) {
    declarations.push_back({std::move(property), std::move(value)});
    return *this;
}

RuleNode& RuleNode::add_child(SelectorSpec spec) {
    return children.emplace_back(std::move(spec));
}

RuleNode* RuleNode::find_child(const SelectorSpec& spec) {
    for (auto& c : children) {
        if (c.selector == spec) return &c;
    }
    return nullptr;
}

const RuleNode* RuleNode::find_child(const SelectorSpec& spec) const {
    for (const auto& c : children) {
        if (c.selector == spec) return &c;
    }
    return nullptr;
}

RuleNode& RuleNode::child_for(const SelectorSpec& spec) {
    if (auto* existing = find_child(spec)) {
        return *existing;
    }
    return add_child(spec);
}

size_t RuleNode::node_count() const {
    size_t count = 1;
    for (const auto& c : children) {
        count += c.node_count();
    }
    return count;
}

bool RuleNode::operator==(const RuleNode& other) const {
    return selector == other.selector &&
           declarations == other.declarations &&
           children == other.children;
}

// --- Keyframes and sheets -------------------------------------------------

KeyframeStep& KeyframeStep::add_declaration(std::string property, std::string value) {
    declarations.push_back({std::move(property), std::move(value)});
    return *this;
}

KeyframeStep& KeyframesBlock::add_step(std::string selector) {
    auto& step = steps.emplace_back();
    step.selector = std::move(selector);
    return step;
}

KeyframesBlock& ComponentStyleSheet::add_keyframes(std::string keyframes_name) {
    auto& block = keyframes.emplace_back();
    block.name = std::move(keyframes_name);
    return block;
}

bool ComponentStyleSheet::operator==(const ComponentStyleSheet& other) const {
    return name == other.name && root == other.root && keyframes == other.keyframes;
}

ComponentStyleSheet& StyleModule::add_sheet(std::string sheet_name) {
    return sheets.emplace_back(std::move(sheet_name));
}

ComponentStyleSheet* StyleModule::find_sheet(const std::string& sheet_name) {
    for (auto& s : sheets) {
        if (s.name == sheet_name) return &s;
    }
    return nullptr;
}

} // namespace stylec::ir
