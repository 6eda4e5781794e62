#pragma once
#include <stylec/codegen/rust_writer.h>
#include <stylec/core/config.h>
#include <stylec/core/diagnostics.h>
#include <stylec/core/error.h>
#include <stylec/ir/style_ir.h>
#include <list>
#include <string>
#include <thread>
#include <vector>

namespace stylec::codegen {

struct AggregateOptions {
    size_t jobs = core::config::kDefaultJobs;  // 0: compile on the calling thread
    bool verify_output = false;                // run the style text validator on each sheet
};

struct ModuleOutput {
    std::string name;
    std::vector<RustFunction> functions;
    std::string source;
};

struct AggregateResult {
    bool ok = false;
    std::vector<ModuleOutput> modules;     // modules with at least one function
    std::vector<RustFunction> functions;   // every emitted function, in registration order
    std::string mod_source;                // mod.rs
    std::string single_file_source;        // output.rs
    std::vector<core::CompileError> errors;

    const RustFunction* find_function(const std::string& name) const;
};

// Module-scoped registration of every sheet that makes up one output unit.
// Names are checked when run() is called, before any sheet is compiled.
class Aggregator {
public:
    ir::StyleModule& add_module(std::string name);
    void register_module(ir::StyleModule module);

    const std::list<ir::StyleModule>& modules() const { return modules_; }
    size_t sheet_count() const;

    AggregateResult run(const AggregateOptions& options = {},
                        core::DiagnosticEmitter* diagnostics = nullptr) const;

private:
    std::list<ir::StyleModule> modules_;
};

// Normalize, emit and optionally verify one sheet.
struct SheetOutput {
    bool ok = false;
    RustFunction function;
    std::vector<core::CompileError> errors;
};

SheetOutput compile_sheet(const ir::ComponentStyleSheet& sheet, bool verify_output);

// Threads to start for a run: never more than the sheets to compile or the
// hardware threads available. 0 means compile on the calling thread.
size_t worker_count(size_t jobs, size_t sheets,
                    size_t hardware = std::thread::hardware_concurrency());

} // namespace stylec::codegen
