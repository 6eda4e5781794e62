#include <stylec/codegen/aggregator.h>
#include <stylec/codegen/emitter.h>
#include <stylec/codegen/naming.h>
#include <stylec/engine/style_validator.h>
#include <stylec/ir/normalizer.h>
#include <stylec/platform/thread_pool.h>
#include <algorithm>
#include <map>
#include <set>

namespace stylec::codegen {

using core::CompileError;
using core::ErrorKind;

const RustFunction* AggregateResult::find_function(const std::string& name) const {
    for (const auto& fn : functions) {
        if (fn.name == name) return &fn;
    }
    return nullptr;
}

ir::StyleModule& Aggregator::add_module(std::string name) {
    return modules_.emplace_back(std::move(name));
}

void Aggregator::register_module(ir::StyleModule module) {
    modules_.push_back(std::move(module));
}

size_t Aggregator::sheet_count() const {
    size_t count = 0;
    for (const auto& m : modules_) {
        count += m.sheets.size();
    }
    return count;
}

SheetOutput compile_sheet(const ir::ComponentStyleSheet& sheet, bool verify_output) {
    SheetOutput out;
    out.function.name = sheet.name;

    auto normalized = ir::normalize(sheet);
    if (!normalized.ok) {
        out.errors = std::move(normalized.errors);
        return out;
    }

    auto emitted = emit(normalized.sheet);
    if (!emitted.ok) {
        out.errors = std::move(emitted.errors);
        return out;
    }

    if (verify_output) {
        auto check = engine::validate_style_text(emitted.text);
        if (!check.ok) {
            out.errors.push_back({ErrorKind::InvalidIR, sheet.name, sheet.name,
                                  "emitted style text rejected: " + engine::format_issues(check)});
            return out;
        }
    }

    out.function.style_text = std::move(emitted.text);
    out.ok = true;
    return out;
}

namespace {

struct Job {
    const ir::ComponentStyleSheet* sheet = nullptr;
    size_t module_index = 0;
};

void log_error(core::DiagnosticEmitter* diagnostics, const std::string& stage,
               const CompileError& error) {
    if (diagnostics != nullptr) {
        diagnostics->report(stage, error);
    }
}

} // namespace

AggregateResult Aggregator::run(const AggregateOptions& options,
                                core::DiagnosticEmitter* diagnostics) const {
    AggregateResult result;

    // --- Registration checks --------------------------------------------
    std::vector<const ir::StyleModule*> modules;
    std::set<std::string> module_names;
    std::set<std::string> colliding_modules;
    for (const auto& m : modules_) {
        if (!module_names.insert(m.name).second) colliding_modules.insert(m.name);
    }
    for (const auto& m : modules_) {
        if (!is_rust_identifier(m.name)) {
            result.errors.push_back({ErrorKind::InvalidIdentifier, "", m.name,
                                     "module name '" + m.name + "' is not a Rust identifier"});
            log_error(diagnostics, "aggregate", result.errors.back());
            continue;
        }
        if (colliding_modules.count(m.name) > 0) {
            continue;
        }
        modules.push_back(&m);
    }
    for (const auto& name : colliding_modules) {
        result.errors.push_back({ErrorKind::NameCollision, "", name,
                                 "module '" + name + "' is registered more than once"});
        log_error(diagnostics, "aggregate", result.errors.back());
    }

    std::map<std::string, std::vector<std::string>> owners;  // sheet name -> modules
    for (const auto* m : modules) {
        for (const auto& sheet : m->sheets) {
            owners[sheet.name].push_back(m->name);
        }
    }

    std::vector<Job> jobs;
    std::set<std::string> reported;
    for (size_t mi = 0; mi < modules.size(); ++mi) {
        for (const auto& sheet : modules[mi]->sheets) {
            if (!is_rust_identifier(sheet.name)) {
                result.errors.push_back({ErrorKind::InvalidIdentifier, sheet.name,
                                         modules[mi]->name + "/" + sheet.name,
                                         "'" + sheet.name + "' is not a valid function name"});
                log_error(diagnostics, "aggregate", result.errors.back());
                continue;
            }
            const auto& owning = owners[sheet.name];
            if (owning.size() > 1) {
                if (reported.insert(sheet.name).second) {
                    std::string where;
                    for (const auto& name : owning) {
                        if (!where.empty()) where += ", ";
                        where += name;
                    }
                    result.errors.push_back({ErrorKind::NameCollision, sheet.name, sheet.name,
                                             "sheet '" + sheet.name + "' is defined " +
                                             std::to_string(owning.size()) + " times (in " +
                                             where + ")"});
                    log_error(diagnostics, "aggregate", result.errors.back());
                }
                continue;
            }
            jobs.push_back({&sheet, mi});
        }
    }

    // --- Per-sheet compilation ------------------------------------------
    const bool verify = options.verify_output;
    auto compile = [verify](const Job& job) { return compile_sheet(*job.sheet, verify); };

    std::vector<SheetOutput> outputs;
    const size_t workers = worker_count(options.jobs, jobs.size());
    if (workers > 1) {
        platform::ThreadPool pool(workers);
        outputs = pool.map(jobs, compile);
        pool.shutdown();
    } else {
        outputs.reserve(jobs.size());
        for (const auto& job : jobs) {
            outputs.push_back(compile(job));
        }
    }

    // --- Collection, in registration order -----------------------------
    std::vector<std::vector<RustFunction>> per_module(modules.size());
    for (size_t i = 0; i < outputs.size(); ++i) {
        auto& out = outputs[i];
        if (!out.ok) {
            for (auto& error : out.errors) {
                log_error(diagnostics, "normalize", error);
                result.errors.push_back(std::move(error));
            }
            continue;
        }
        if (diagnostics != nullptr) {
            diagnostics->info("emit", out.function.name, "emitted style text");
        }
        per_module[jobs[i].module_index].push_back(out.function);
        result.functions.push_back(std::move(out.function));
    }

    std::vector<std::string> names;
    for (size_t mi = 0; mi < modules.size(); ++mi) {
        if (per_module[mi].empty()) continue;
        ModuleOutput module;
        module.name = modules[mi]->name;
        module.source = write_module(module.name, per_module[mi]);
        module.functions = std::move(per_module[mi]);
        names.push_back(module.name);
        result.modules.push_back(std::move(module));
    }
    result.mod_source = write_mod_file(names);
    result.single_file_source = write_single_file(result.functions);

    result.ok = result.errors.empty();
    if (diagnostics != nullptr) {
        diagnostics->info("aggregate", "collect",
                          std::to_string(result.functions.size()) + " function(s), " +
                          std::to_string(result.errors.size()) + " error(s)");
    }
    return result;
}

size_t worker_count(size_t jobs, size_t sheets, size_t hardware) {
    size_t workers = std::min(jobs, sheets);
    if (hardware > 0) workers = std::min(workers, hardware);
    return workers;
}

} // namespace stylec::codegen
