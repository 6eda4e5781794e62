#include <stylec/core/config.h>
#include <stylec/core/diagnostics.h>
#include <stylec/driver/compiler.h>

#include <charconv>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

namespace config = stylec::core::config;
namespace fs = std::filesystem;

using stylec::core::DiagnosticEvent;
using stylec::core::Severity;
using stylec::driver::CompileOptions;
using stylec::driver::CompileResult;
using stylec::driver::Compiler;

void print_usage(std::ostream& stream) {
    stream << "usage: " << config::kProgramName << " <command> [options]\n"
           << "\n"
           << "commands:\n"
           << "  convert <input> [-o out] [-c mappings.json] [--component] [--no-variants]\n"
           << "          [--utilities] [--no-mappings] [--verify] [--jobs=N] [--verbose]\n"
           << "  analyze <file.css>\n"
           << "  validate <file.css>\n"
           << "  preview <css> [--no-variants]\n"
           << "  options\n"
           << "\n"
           << "  -h, --help       show this help\n"
           << "  -V, --version    show the version\n";
}

bool is_help_flag(std::string_view text) {
    return text == "-h" || text == "--help";
}

bool is_version_flag(std::string_view text) {
    return text == "-V" || text == "--version";
}

bool starts_with(std::string_view value, std::string_view prefix) {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

bool parse_jobs_flag(std::string_view text, std::size_t& jobs) {
    constexpr std::string_view kJobsPrefix = "--jobs=";
    if (!starts_with(text, kJobsPrefix)) {
        return false;
    }
    const std::string_view digits = text.substr(kJobsPrefix.size());
    if (digits.empty()) {
        return false;
    }
    std::size_t parsed = 0;
    const char* begin = digits.data();
    const char* end = begin + digits.size();
    const std::from_chars_result result = std::from_chars(begin, end, parsed);
    if (result.ec != std::errc() || result.ptr != end) {
        return false;
    }
    jobs = parsed;
    return true;
}

void attach_stderr(Compiler& compiler, bool verbose) {
    auto& diagnostics = compiler.diagnostics();
    const Severity shown = verbose ? Severity::Info : Severity::Warning;
    // Events recorded while the compiler was constructed (mapping overrides)
    for (const auto& event : diagnostics.events()) {
        if (event.severity >= shown) {
            std::cerr << stylec::core::format_diagnostic(event) << "\n";
        }
    }
    diagnostics.add_observer([shown](const DiagnosticEvent& event) {
        if (event.severity >= shown) {
            std::cerr << stylec::core::format_diagnostic(event) << "\n";
        }
    });
}

void print_errors(const CompileResult& result) {
    for (const auto& error : result.errors) {
        std::cerr << "error: " << stylec::core::format_error(error) << "\n";
    }
}

void print_summary(const std::string& label, const CompileResult& result) {
    if (!result.ok) {
        std::cerr << label << ": failed with " << result.errors.size() << " error(s)\n";
        print_errors(result);
        return;
    }
    std::cout << label << ": " << result.functions.size() << " function(s)";
    if (result.keyframes > 0) {
        std::cout << ", " << result.keyframes << " keyframes block(s)";
    }
    std::cout << "\n";
    for (const auto& path : result.written) {
        std::cout << "  wrote " << path.string() << "\n";
    }
}

int run_convert(const std::vector<std::string_view>& args) {
    CompileOptions options;
    std::string input;
    std::string output;
    bool verbose = false;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string_view arg = args[i];
        if (arg == "-o" || arg == "--output" || arg == "-c" || arg == "--config") {
            if (i + 1 >= args.size()) {
                std::cerr << "Missing value for " << arg << "\n";
                print_usage(std::cerr);
                return 1;
            }
            if (arg == "-o" || arg == "--output") {
                output = std::string(args[++i]);
            } else {
                options.mappings_path = std::string(args[++i]);
            }
        } else if (arg == "--component") {
            options.group_by_component = true;
        } else if (arg == "--no-variants") {
            options.extract_variants = false;
        } else if (arg == "--utilities") {
            options.include_utilities = true;
        } else if (arg == "--no-mappings") {
            options.apply_mappings = false;
        } else if (arg == "--verify") {
            options.verify_output = true;
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (starts_with(arg, "--jobs")) {
            if (!parse_jobs_flag(arg, options.jobs)) {
                std::cerr << "Invalid --jobs: '" << arg
                          << "' (expected --jobs=N with N >= 0)\n";
                return 1;
            }
        } else if (starts_with(arg, "-")) {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(std::cerr);
            return 1;
        } else if (input.empty()) {
            input = std::string(arg);
        } else {
            std::cerr << "Unexpected argument: " << arg << "\n";
            print_usage(std::cerr);
            return 1;
        }
    }

    if (input.empty()) {
        std::cerr << "convert: missing <input>\n";
        print_usage(std::cerr);
        return 1;
    }

    std::error_code ec;
    const fs::path input_path(input);
    const bool is_directory = fs::is_directory(input_path, ec);
    if (!is_directory && !fs::exists(input_path, ec)) {
        std::cerr << "Input not found: " << input << "\n";
        return 1;
    }

    fs::path output_path(output);
    if (output.empty()) {
        if (is_directory) {
            output_path = input_path / config::kDefaultOutputDirName;
        } else if (options.group_by_component) {
            output_path = input_path.parent_path() / config::kDefaultOutputDirName;
        } else {
            output_path = input_path;
            output_path.replace_extension(".rs");
        }
    }

    Compiler compiler(options);
    attach_stderr(compiler, verbose);

    if (is_directory) {
        const auto results = compiler.convert_directory(input_path, output_path);
        bool ok = true;
        for (const auto& [name, result] : results) {
            print_summary(name, result);
            ok = ok && result.ok;
        }
        return ok ? 0 : 1;
    }

    const auto result = compiler.convert_file(input_path, output_path);
    print_summary(input_path.filename().string(), result);
    return result.ok ? 0 : 1;
}

bool read_css_argument(const std::vector<std::string_view>& args, const char* command,
                       std::string& css) {
    if (args.size() != 1) {
        std::cerr << command << ": expected exactly one <file.css>\n";
        print_usage(std::cerr);
        return false;
    }
    std::string err;
    if (!stylec::driver::read_text_file(fs::path(std::string(args[0])), css, err)) {
        std::cerr << err << "\n";
        return false;
    }
    return true;
}

int run_analyze(const std::vector<std::string_view>& args) {
    std::string css;
    if (!read_css_argument(args, "analyze", css)) {
        return 1;
    }
    Compiler compiler;
    std::cout << stylec::driver::format_report(compiler.analyze(css));
    return 0;
}

int run_validate(const std::vector<std::string_view>& args) {
    std::string css;
    if (!read_css_argument(args, "validate", css)) {
        return 1;
    }
    Compiler compiler;
    const auto warnings = compiler.validate(css);
    if (warnings.empty()) {
        std::cout << "CSS file is valid for conversion\n";
        return 0;
    }
    std::cout << "Found " << warnings.size() << " potential issue(s):\n";
    for (const auto& warning : warnings) {
        std::cout << "  - " << warning << "\n";
    }
    return 0;
}

int run_preview(const std::vector<std::string_view>& args) {
    CompileOptions options;
    std::string css;
    for (const auto arg : args) {
        if (arg == "--no-variants") {
            options.extract_variants = false;
        } else if (arg == "--component") {
            options.group_by_component = true;
        } else if (css.empty()) {
            css = std::string(arg);
        } else {
            std::cerr << "Unexpected argument: " << arg << "\n";
            return 1;
        }
    }
    if (css.empty()) {
        std::cerr << "preview: missing <css>\n";
        print_usage(std::cerr);
        return 1;
    }

    Compiler compiler(options);
    attach_stderr(compiler, false);
    const auto result = compiler.convert_string(css);
    if (!result.ok) {
        print_errors(result);
        return 1;
    }
    if (result.functions.empty()) {
        std::cout << "No functions generated from CSS\n";
        return 0;
    }
    std::cout << "Generated " << result.functions.size() << " function(s):\n\n";
    std::cout << result.single_file_source;
    return 0;
}

int run_options() {
    for (const auto& option : stylec::driver::option_descriptions()) {
        std::cout << std::left << std::setw(20) << option.name
                  << std::setw(7) << (option.default_value ? "true" : "false")
                  << option.description << "\n";
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    if (argc == 2 && is_help_flag(argv[1])) {
        print_usage(std::cout);
        return 0;
    }
    if (argc == 2 && is_version_flag(argv[1])) {
        std::cout << config::kVersionString << "\n";
        return 0;
    }
    if (argc < 2) {
        print_usage(std::cerr);
        return 1;
    }

    const std::string_view command(argv[1]);
    std::vector<std::string_view> args;
    args.reserve(static_cast<std::size_t>(argc));
    for (int index = 2; index < argc; ++index) {
        args.emplace_back(argv[index] != nullptr ? argv[index] : "");
    }

    if (command == "convert") return run_convert(args);
    if (command == "analyze") return run_analyze(args);
    if (command == "validate") return run_validate(args);
    if (command == "preview") return run_preview(args);
    if (command == "options") return run_options();

    std::cerr << "Unknown command: " << command << "\n";
    print_usage(std::cerr);
    return 1;
}
