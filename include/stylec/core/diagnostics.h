#pragma once

#include <stylec/core/error.h>

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace stylec::core {

enum class Severity {
    Info,
    Warning,
    Error,
};

const char* severity_name(Severity severity);

struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string module;   // compiler stage owner: "authoring", "normalize", ...
    std::string stage;    // finer step or the sheet being processed
    std::string message;
    std::string source;   // input file the event belongs to, if any
};

// "[warning] authoring/parse (card.css): unknown at-rule @font-face skipped"
std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Not thread-safe: events are emitted from the thread that drives the
// compile, never from pool workers.
class DiagnosticEmitter {
public:
    void emit(Severity severity, const std::string& module,
              const std::string& stage, const std::string& message);
    void info(const std::string& module, const std::string& stage,
              const std::string& message);
    void warning(const std::string& module, const std::string& stage,
                 const std::string& message);
    void error(const std::string& module, const std::string& stage,
               const std::string& message);

    // Logs a compile error at Error severity under `module`.
    void report(const std::string& module, const CompileError& error);

    void set_source(std::string source);
    const std::string& source() const;

    void set_min_severity(Severity min);
    Severity min_severity() const;

    void add_observer(DiagnosticObserver observer);

    const std::vector<DiagnosticEvent>& events() const;
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_by_module(const std::string& module) const;
    std::size_t count(Severity severity) const;
    bool has_errors() const;

    void clear();
    std::size_t size() const;

private:
    std::vector<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    std::string source_;
    Severity min_severity_ = Severity::Info;
};

} // namespace stylec::core
