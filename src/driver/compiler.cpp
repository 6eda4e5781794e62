#include <stylec/driver/compiler.h>
#include <stylec/css/authoring.h>
#include <stylec/css/parser/stylesheet.h>
#include <stylec/core/strings.h>
#include <stylec/ir/normalizer.h>
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <set>
#include <sstream>
#include <system_error>
#include <utility>

namespace stylec::driver {

namespace config = core::config;
namespace fs = std::filesystem;

namespace {

struct UtilityStyle {
    const char* name;
    std::vector<std::pair<const char*, const char*>> declarations;
};

const std::vector<UtilityStyle>& utility_styles() {
    static const std::vector<UtilityStyle> utilities = {
        {"flex_center", {{"display", "flex"}, {"align-items", "center"},
                         {"justify-content", "center"}}},
        {"flex_column", {{"display", "flex"}, {"flex-direction", "column"}}},
        {"flex_row", {{"display", "flex"}, {"flex-direction", "row"}}},
        {"absolute_center", {{"position", "absolute"}, {"top", "50%"}, {"left", "50%"},
                             {"transform", "translate(-50%, -50%)"}}},
        {"full_width", {{"width", "100%"}}},
        {"full_height", {{"height", "100%"}}},
        {"hidden", {{"display", "none"}}},
        {"visible", {{"display", "block"}}},
    };
    return utilities;
}

ir::StyleModule& module_named(std::vector<ir::StyleModule>& modules, const std::string& name) {
    for (auto& m : modules) {
        if (m.name == name) return m;
    }
    return modules.emplace_back(name);
}

bool has_pseudo(const css::SelectorList& list) {
    for (const auto& complex : list.selectors) {
        for (const auto& part : complex.parts) {
            for (const auto& simple : part.compound.simple_selectors) {
                if (simple.type == css::SimpleSelectorType::PseudoClass ||
                    simple.type == css::SimpleSelectorType::PseudoElement) {
                    return true;
                }
            }
        }
    }
    return false;
}

} // namespace

// ---------------------------------------------------------------------------
// Results and reports
// ---------------------------------------------------------------------------

const codegen::RustFunction* CompileResult::find_function(const std::string& name) const {
    for (const auto& fn : functions) {
        if (fn.name == name) return &fn;
    }
    return nullptr;
}

double AnalysisReport::mapping_coverage() const {
    if (total_values == 0) return 0.0;
    return static_cast<double>(mappable_values) * 100.0 / static_cast<double>(total_values);
}

std::string format_report(const AnalysisReport& report) {
    std::ostringstream out;
    out << "total_rules: " << report.total_rules << "\n"
        << "total_keyframes: " << report.total_keyframes << "\n"
        << "media_queries: " << report.media_rules << "\n"
        << "pseudo_selectors: " << report.pseudo_rules << "\n"
        << "unique_selectors: " << report.unique_selectors << "\n"
        << "total_properties: " << report.total_properties << "\n"
        << "unique_properties: " << report.unique_properties << "\n"
        << "mappable_values: " << report.mappable_values << "\n"
        << "mapping_coverage: " << std::fixed << std::setprecision(1)
        << report.mapping_coverage() << "%\n"
        << "components:\n";
    for (const auto& [name, count] : report.components) {
        out << "  " << name << ": " << count << "\n";
    }
    return out.str();
}

const std::vector<OptionInfo>& option_descriptions() {
    static const std::vector<OptionInfo> options = {
        {"group_by_component", "Group CSS rules by component and create separate files", false},
        {"extract_variants", "Extract style variants (e.g., btn-primary, btn-secondary)", true},
        {"include_utilities", "Include common utility functions", false},
        {"apply_mappings", "Apply value mappings to CSS variables", true},
        {"verify_output", "Check every emitted style block before writing", false},
    };
    return options;
}

// ---------------------------------------------------------------------------
// File IO
// ---------------------------------------------------------------------------

bool read_text_file(const fs::path& path, std::string& out_text, std::string& err) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        err = "Unable to open file: " + path.string();
        return false;
    }

    std::ostringstream stream;
    stream << file.rdbuf();
    if (!file.good() && !file.eof()) {
        err = "Failed to read file: " + path.string();
        return false;
    }

    out_text = stream.str();
    return true;
}

bool write_text_file(const fs::path& path, const std::string& text, std::string& err) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            err = "Unable to create directory " + path.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    std::ofstream file(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        err = "Unable to open file for writing: " + path.string();
        return false;
    }
    file << text;
    file.flush();
    if (!file.good()) {
        err = "Failed to write file: " + path.string();
        return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// Compiler
// ---------------------------------------------------------------------------

Compiler::Compiler(CompileOptions options) : options_(std::move(options)) {
    if (!options_.mappings_path.empty()) {
        std::string err;
        if (!mappings_.load_file(options_.mappings_path, err)) {
            diagnostics_.warning("mappings", "load", err + "; using built-in mappings");
        } else {
            diagnostics_.info("mappings", "load",
                              "loaded overrides from " + options_.mappings_path);
        }
    }
}

CompileResult Compiler::fail_io(const std::string& path, const std::string& message) {
    CompileResult result;
    result.errors.push_back({core::ErrorKind::IoError, "", path, message});
    diagnostics_.report("write", result.errors.back());
    return result;
}

CompileResult Compiler::convert_string(std::string_view css_text) {
    CompileResult result;

    const auto sheet = css::parse_stylesheet(css_text);
    diagnostics_.info("authoring", "parse",
                      std::to_string(sheet.rules.size()) + " rule(s), " +
                      std::to_string(sheet.keyframes.size()) + " keyframes block(s)");

    css::AuthoringOptions authoring;
    authoring.extract_variants = options_.extract_variants;
    authoring.group_by_component = options_.group_by_component;
    if (options_.apply_mappings) {
        authoring.map_value = [this](const std::string& property, const std::string& value) {
            return mappings_.map_value(property, value);
        };
    }

    auto built = css::build_modules(sheet, authoring);
    for (const auto& warning : built.warnings) {
        diagnostics_.warning("authoring", "build", warning);
    }
    result.warnings = built.warnings;
    result.keyframes = built.keyframes_used;

    if (options_.include_utilities) {
        auto& utils = module_named(built.modules, options_.group_by_component
                                                      ? config::kUtilitiesModule
                                                      : config::kDefaultModule);
        for (const auto& utility : utility_styles()) {
            auto& sheet_ir = utils.add_sheet(utility.name);
            for (const auto& [property, value] : utility.declarations) {
                sheet_ir.root.add_declaration(
                    property, options_.apply_mappings ? mappings_.map_value(property, value)
                                                      : std::string(value));
            }
        }
    }

    codegen::Aggregator aggregator;
    for (auto& m : built.modules) {
        aggregator.register_module(std::move(m));
    }
    diagnostics_.info("ir", "build", std::to_string(aggregator.sheet_count()) + " sheet(s)");

    codegen::AggregateOptions aggregate;
    aggregate.jobs = options_.jobs;
    aggregate.verify_output = options_.verify_output;
    auto unit = aggregator.run(aggregate, &diagnostics_);

    result.ok = unit.ok;
    result.functions = std::move(unit.functions);
    result.modules = std::move(unit.modules);
    result.mod_source = std::move(unit.mod_source);
    result.single_file_source = std::move(unit.single_file_source);
    result.errors = std::move(unit.errors);
    return result;
}

CompileResult Compiler::convert_file(const fs::path& input, const fs::path& output) {
    diagnostics_.set_source(input.string());

    std::string text;
    std::string err;
    if (!read_text_file(input, text, err)) {
        return fail_io(input.string(), err);
    }

    auto result = convert_string(text);
    if (!result.ok) {
        diagnostics_.error("write", "skip", "not writing " + output.string() + ": " +
                           std::to_string(result.errors.size()) + " compile error(s)");
        return result;
    }

    std::vector<std::pair<fs::path, const std::string*>> outputs;
    if (options_.group_by_component) {
        for (const auto& module : result.modules) {
            outputs.emplace_back(output / (module.name + ".rs"), &module.source);
        }
        // mod.rs goes last so it never names a module file that is missing
        outputs.emplace_back(output / config::kModFileName, &result.mod_source);
    } else {
        outputs.emplace_back(output, &result.single_file_source);
    }

    auto io_error = [&](const fs::path& path, const std::string& message) {
        result.errors.push_back({core::ErrorKind::IoError, "", path.string(), message});
        diagnostics_.report("write", result.errors.back());
        result.ok = false;
    };

    // Stage every file first; nothing lands at its final path unless all of them wrote
    std::vector<fs::path> staged;
    for (const auto& [path, source] : outputs) {
        fs::path temp = path;
        temp += ".tmp";
        std::string write_err;
        if (!write_text_file(temp, *source, write_err)) {
            io_error(path, write_err);
            break;
        }
        staged.push_back(std::move(temp));
    }

    if (result.ok) {
        for (size_t i = 0; i < outputs.size(); ++i) {
            std::error_code ec;
            fs::rename(staged[i], outputs[i].first, ec);
            if (ec) {
                io_error(outputs[i].first, "Failed to write: " + ec.message());
                for (const auto& done : result.written) {
                    fs::remove(done, ec);
                }
                result.written.clear();
                break;
            }
            result.written.push_back(outputs[i].first);
            diagnostics_.info("write", "file", "wrote " + outputs[i].first.string());
        }
    }

    for (const auto& temp : staged) {
        std::error_code ec;
        fs::remove(temp, ec);
    }
    return result;
}

std::map<std::string, CompileResult> Compiler::convert_directory(const fs::path& input_dir,
                                                                 const fs::path& output_dir) {
    std::map<std::string, CompileResult> results;

    std::error_code ec;
    if (!fs::is_directory(input_dir, ec)) {
        results.emplace(input_dir.string(),
                        fail_io(input_dir.string(), "Input directory not found: " +
                                                        input_dir.string()));
        return results;
    }

    std::vector<fs::path> inputs;
    for (const auto& entry : fs::directory_iterator(input_dir, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".css") {
            inputs.push_back(entry.path());
        }
    }
    if (ec) {
        results.emplace(input_dir.string(), fail_io(input_dir.string(), ec.message()));
        return results;
    }
    std::sort(inputs.begin(), inputs.end());
    if (inputs.empty()) {
        diagnostics_.warning("driver", "directory", "no CSS files found in " + input_dir.string());
    }

    for (const auto& input : inputs) {
        const fs::path output = options_.group_by_component
            ? output_dir / input.stem()
            : output_dir / (input.stem().string() + ".rs");
        diagnostics_.info("driver", "directory", "converting " + input.filename().string());
        results.emplace(input.filename().string(), convert_file(input, output));
    }
    diagnostics_.set_source("");
    return results;
}

AnalysisReport Compiler::analyze(std::string_view css_text) const {
    AnalysisReport report;
    const auto sheet = css::parse_stylesheet(css_text);

    std::set<std::string> selectors;
    std::set<std::string> properties;
    report.total_rules = sheet.rules.size();
    report.total_keyframes = sheet.keyframes.size();

    for (const auto& rule : sheet.rules) {
        if (!rule.media.empty()) ++report.media_rules;
        if (has_pseudo(rule.selectors)) ++report.pseudo_rules;
        selectors.insert(rule.selector_text);

        for (const auto& decl : rule.declarations) {
            ++report.total_properties;
            ++report.total_values;
            properties.insert(core::to_lower(decl.property));
            if (mappings_.is_mappable(decl.property, decl.value)) {
                ++report.mappable_values;
            }
        }

        std::string component = "component";
        if (!rule.selectors.selectors.empty()) {
            if (auto placement = css::place_selector(rule.selectors.selectors.front(),
                                                     options_.extract_variants)) {
                component = placement->component;
            }
        }
        ++report.components[component];
    }

    report.unique_selectors = selectors.size();
    report.unique_properties = properties.size();
    return report;
}

std::vector<std::string> Compiler::validate(std::string_view css_text) const {
    std::vector<std::string> warnings;
    const auto sheet = css::parse_stylesheet(css_text);

    for (const auto& w : sheet.warnings) {
        warnings.push_back("Parse warning at line " + std::to_string(w.line) + ": " + w.message);
    }

    std::set<std::string> checked_media;
    for (const auto& rule : sheet.rules) {
        const std::string& selector = rule.selector_text;
        if (rule.selectors.malformed) {
            warnings.push_back("Malformed selector: " + selector);
        }
        if (rule.declarations.empty()) {
            warnings.push_back("Empty rule found: " + selector);
        }
        if (selector.find(' ') != std::string::npos && !core::starts_with(selector, ".")) {
            warnings.push_back("Complex selector may not convert well: " + selector);
        }
        if (!rule.media.empty() && checked_media.insert(rule.media).second &&
            !ir::canonical_media_condition(rule.media)) {
            warnings.push_back("Media query will be rejected (conditions must be parenthesized "
                               "features): " + rule.media);
        }
        for (const auto& decl : rule.declarations) {
            if (decl.value.find("calc(") != std::string::npos) {
                warnings.push_back("CSS calc() function found in " + selector + "." +
                                   decl.property);
            }
            const auto var = decl.value.find("var(");
            if (var != std::string::npos && decl.value.compare(var, 6, "var(--") != 0) {
                warnings.push_back("Non-standard CSS variable in " + selector + "." +
                                   decl.property);
            }
        }
    }
    return warnings;
}

} // namespace stylec::driver
