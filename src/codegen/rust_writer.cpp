#include <stylec/codegen/rust_writer.h>
#include <stylec/codegen/naming.h>
#include <stylec/core/config.h>
#include <stylec/core/strings.h>
#include <algorithm>
#include <sstream>

namespace stylec::codegen {

namespace config = core::config;

size_t raw_string_hashes(const std::string& text) {
    size_t longest = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '"') continue;
        size_t run = 0;
        while (i + 1 + run < text.size() && text[i + 1 + run] == '#') {
            ++run;
        }
        longest = std::max(longest, run);
    }
    return longest + 1;
}

std::string write_function(const RustFunction& fn) {
    const std::string hashes(raw_string_hashes(fn.style_text), '#');
    std::string body = core::indent_lines(fn.style_text, config::kRustBodyIndent);
    // The first line follows the opening quote directly
    body.erase(0, body.find_first_not_of(' '));
    if (!body.empty() && body.back() != '\n') {
        body.push_back('\n');
    }

    std::ostringstream out;
    out << "pub fn " << fn.name << "() -> " << config::kStyleType << " {\n"
        << "    " << config::kStyleType << "::new(\n"
        << "        r" << hashes << "\"" << body
        << "    \"" << hashes << ",\n"
        << "    )\n"
        << "    .expect(\"Failed to create " << fn.name << " styles\")\n"
        << "}\n";
    return out.str();
}

namespace {

void write_functions(std::ostringstream& out, const std::vector<RustFunction>& functions) {
    for (size_t i = 0; i < functions.size(); ++i) {
        if (i > 0) out << "\n";
        out << write_function(functions[i]);
    }
}

} // namespace

std::string write_module(const std::string& module_name,
                         const std::vector<RustFunction>& functions) {
    std::ostringstream out;
    out << "//! " << doc_title(module_name) << " component styles\n\n"
        << config::kStyleImport << "\n\n";
    write_functions(out, functions);
    return out.str();
}

std::string write_mod_file(std::vector<std::string> module_names) {
    std::sort(module_names.begin(), module_names.end());
    std::ostringstream out;
    out << config::kModFileHeader << "\n\n";
    for (const auto& name : module_names) {
        out << "pub mod " << name << ";\n";
    }
    out << "\n// Re-export all component styles\n";
    for (const auto& name : module_names) {
        out << "pub use " << name << "::*;\n";
    }
    return out.str();
}

std::string write_single_file(const std::vector<RustFunction>& functions) {
    std::ostringstream out;
    out << config::kSingleFileHeader << "\n\n" << config::kStyleImport << "\n\n";
    write_functions(out, functions);
    return out.str();
}

} // namespace stylec::codegen
