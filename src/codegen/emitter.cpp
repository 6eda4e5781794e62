#include <stylec/codegen/emitter.h>
#include <stylec/core/config.h>
#include <stylec/core/strings.h>
#include <stylec/ir/normalizer.h>
#include <sstream>

namespace stylec::codegen {

namespace {

class TextWriter {
public:
    void open(size_t depth, const std::string& selector) {
        pad(depth);
        if (selector.empty()) {
            out_ << "{\n";  // bare root block
        } else {
            out_ << selector << " {\n";
        }
    }

    void close(size_t depth) {
        pad(depth);
        out_ << "}\n";
    }

    void declarations(size_t depth, const std::vector<ir::Declaration>& decls) {
        for (const auto& d : decls) {
            pad(depth);
            out_ << d.property << ": " << d.value << ";\n";
        }
    }

    std::string str() const { return out_.str(); }

private:
    std::ostringstream out_;

    void pad(size_t depth) {
        out_ << std::string(depth * core::config::kIndentWidth, ' ');
    }
};

void write_node(TextWriter& w, const ir::RuleNode& node, size_t depth) {
    w.open(depth, ir::selector_text(node.selector));
    if (ir::is_media(node.selector)) {
        // Declarations directly under @media apply to the parent itself.
        if (!node.declarations.empty()) {
            w.open(depth + 1, core::config::kParentReference);
            w.declarations(depth + 2, node.declarations);
            w.close(depth + 1);
        }
    } else {
        w.declarations(depth + 1, node.declarations);
    }
    for (const auto& c : node.children) {
        write_node(w, c, depth + 1);
    }
    w.close(depth);
}

void write_keyframes(TextWriter& w, const ir::KeyframesBlock& block) {
    w.open(0, "@keyframes " + block.name);
    for (const auto& step : block.steps) {
        w.open(1, step.selector);
        w.declarations(2, step.declarations);
        w.close(1);
    }
    w.close(0);
}

} // namespace

EmitResult emit(const ir::ComponentStyleSheet& sheet) {
    EmitResult result;

    auto normalized = ir::normalize(sheet);
    if (!normalized.ok || !(normalized.sheet == sheet)) {
        std::string why = normalized.ok
            ? "sheet is not in canonical form; normalize it before emission"
            : "sheet does not validate (" + core::format_error(normalized.errors.front()) + ")";
        result.errors.push_back({core::ErrorKind::InvalidIR, sheet.name, sheet.name, why});
        return result;
    }

    TextWriter w;
    const auto& root = sheet.root;
    if (!root.declarations.empty()) {
        w.open(0, "");
        w.declarations(1, root.declarations);
        w.close(0);
    }
    for (const auto& c : root.children) {
        write_node(w, c, 0);
    }
    for (const auto& block : sheet.keyframes) {
        write_keyframes(w, block);
    }

    result.text = w.str();
    result.ok = true;
    return result;
}

std::string whitespace_normalized(const std::string& text) {
    std::string out;
    bool pending = false;
    for (char c : text) {
        if (core::is_space(c)) {
            pending = true;
            continue;
        }
        if (pending && !out.empty()) out.push_back(' ');
        pending = false;
        out.push_back(c);
    }
    return out;
}

} // namespace stylec::codegen
