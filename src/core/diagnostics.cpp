#include <stylec/core/diagnostics.h>

#include <algorithm>
#include <sstream>

namespace stylec::core {

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Info:    return "info";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "unknown";
}

std::string format_diagnostic(const DiagnosticEvent& event) {
    std::ostringstream oss;
    oss << "[" << severity_name(event.severity) << "]";
    if (!event.module.empty()) {
        oss << " " << event.module;
    }
    if (!event.stage.empty()) {
        oss << "/" << event.stage;
    }
    if (!event.source.empty()) {
        oss << " (" << event.source << ")";
    }
    oss << ": " << event.message;
    return oss.str();
}

void DiagnosticEmitter::emit(Severity severity, const std::string& module,
                             const std::string& stage, const std::string& message) {
    if (severity < min_severity_) {
        return;
    }

    DiagnosticEvent event;
    event.timestamp = std::chrono::steady_clock::now();
    event.severity = severity;
    event.module = module;
    event.stage = stage;
    event.message = message;
    event.source = source_;

    events_.push_back(event);

    for (const auto& observer : observers_) {
        observer(event);
    }
}

void DiagnosticEmitter::info(const std::string& module, const std::string& stage,
                             const std::string& message) {
    emit(Severity::Info, module, stage, message);
}

void DiagnosticEmitter::warning(const std::string& module, const std::string& stage,
                                const std::string& message) {
    emit(Severity::Warning, module, stage, message);
}

void DiagnosticEmitter::error(const std::string& module, const std::string& stage,
                              const std::string& message) {
    emit(Severity::Error, module, stage, message);
}

void DiagnosticEmitter::report(const std::string& module, const CompileError& error) {
    emit(Severity::Error, module, error.sheet, format_error(error));
}

void DiagnosticEmitter::set_source(std::string source) {
    source_ = std::move(source);
}

const std::string& DiagnosticEmitter::source() const {
    return source_;
}

void DiagnosticEmitter::set_min_severity(Severity min) {
    min_severity_ = min;
}

Severity DiagnosticEmitter::min_severity() const {
    return min_severity_;
}

void DiagnosticEmitter::add_observer(DiagnosticObserver observer) {
    observers_.push_back(std::move(observer));
}

const std::vector<DiagnosticEvent>& DiagnosticEmitter::events() const {
    return events_;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_severity(Severity severity) const {
    std::vector<DiagnosticEvent> result;
    for (const auto& e : events_) {
        if (e.severity == severity) {
            result.push_back(e);
        }
    }
    return result;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_module(const std::string& module) const {
    std::vector<DiagnosticEvent> result;
    for (const auto& e : events_) {
        if (e.module == module) {
            result.push_back(e);
        }
    }
    return result;
}

std::size_t DiagnosticEmitter::count(Severity severity) const {
    return static_cast<std::size_t>(
        std::count_if(events_.begin(), events_.end(),
                      [severity](const DiagnosticEvent& e) { return e.severity == severity; }));
}

bool DiagnosticEmitter::has_errors() const {
    return count(Severity::Error) > 0;
}

void DiagnosticEmitter::clear() {
    events_.clear();
}

std::size_t DiagnosticEmitter::size() const {
    return events_.size();
}

} // namespace stylec::core
