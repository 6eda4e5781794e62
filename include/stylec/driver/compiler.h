#pragma once
#include <stylec/codegen/aggregator.h>
#include <stylec/codegen/rust_writer.h>
#include <stylec/codegen/value_mappings.h>
#include <stylec/core/config.h>
#include <stylec/core/diagnostics.h>
#include <stylec/core/error.h>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace stylec::driver {

struct CompileOptions {
    bool group_by_component = false;  // one Rust file per component plus mod.rs
    bool extract_variants = true;
    bool include_utilities = false;
    bool apply_mappings = true;
    bool verify_output = false;
    size_t jobs = core::config::kDefaultJobs;
    std::string mappings_path;        // JSON overrides, empty for built-ins only
};

struct CompileResult {
    bool ok = false;
    std::vector<codegen::RustFunction> functions;
    std::vector<codegen::ModuleOutput> modules;
    std::string mod_source;
    std::string single_file_source;
    std::vector<core::CompileError> errors;
    std::vector<std::string> warnings;
    std::vector<std::filesystem::path> written;   // files created on disk
    size_t keyframes = 0;

    const codegen::RustFunction* find_function(const std::string& name) const;
};

struct AnalysisReport {
    size_t total_rules = 0;
    size_t total_keyframes = 0;
    size_t media_rules = 0;
    size_t pseudo_rules = 0;
    size_t unique_selectors = 0;
    size_t total_properties = 0;
    size_t unique_properties = 0;
    size_t total_values = 0;
    size_t mappable_values = 0;
    std::map<std::string, size_t> components;   // component -> rule count

    double mapping_coverage() const;            // percent, 0 when there are no values
};

std::string format_report(const AnalysisReport& report);

struct OptionInfo {
    std::string name;
    std::string description;
    bool default_value = false;
};

const std::vector<OptionInfo>& option_descriptions();

bool read_text_file(const std::filesystem::path& path, std::string& out_text, std::string& err);
bool write_text_file(const std::filesystem::path& path, const std::string& text, std::string& err);

class Compiler {
public:
    explicit Compiler(CompileOptions options = {});

    const CompileOptions& options() const { return options_; }
    const codegen::ValueMappings& mappings() const { return mappings_; }
    core::DiagnosticEmitter& diagnostics() { return diagnostics_; }

    // Compiles CSS text in memory; nothing is written.
    CompileResult convert_string(std::string_view css);

    // Component mode writes <output>/<module>.rs and <output>/mod.rs;
    // otherwise <output> is the single .rs file.
    CompileResult convert_file(const std::filesystem::path& input,
                               const std::filesystem::path& output);

    // Converts every *.css in input_dir into output_dir/<stem>.rs (or a
    // <stem>/ directory in component mode). A failing file does not stop
    // the others. Keyed by input file name.
    std::map<std::string, CompileResult> convert_directory(const std::filesystem::path& input_dir,
                                                           const std::filesystem::path& output_dir);

    AnalysisReport analyze(std::string_view css) const;
    std::vector<std::string> validate(std::string_view css) const;

private:
    CompileOptions options_;
    codegen::ValueMappings mappings_;
    core::DiagnosticEmitter diagnostics_;

    CompileResult fail_io(const std::string& path, const std::string& message);
};

} // namespace stylec::driver
