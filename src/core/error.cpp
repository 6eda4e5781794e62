#include <stylec/core/error.h>

#include <algorithm>
#include <sstream>

namespace stylec::core {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MissingSelector:         return "MissingSelector";
        case ErrorKind::MalformedPseudoSelector: return "MalformedPseudoSelector";
        case ErrorKind::MalformedSelector:       return "MalformedSelector";
        case ErrorKind::MalformedMediaQuery:     return "MalformedMediaQuery";
        case ErrorKind::NestedMediaQuery:        return "NestedMediaQuery";
        case ErrorKind::InvalidDeclaration:      return "InvalidDeclaration";
        case ErrorKind::MalformedKeyframes:      return "MalformedKeyframes";
        case ErrorKind::InvalidIR:               return "InvalidIR";
        case ErrorKind::NameCollision:           return "NameCollision";
        case ErrorKind::InvalidIdentifier:       return "InvalidIdentifier";
        case ErrorKind::IoError:                 return "IoError";
    }
    return "Unknown";
}

std::string format_error(const CompileError& error) {
    std::ostringstream oss;
    oss << error_kind_name(error.kind);
    if (!error.sheet.empty()) {
        oss << " in " << error.sheet;
    }
    if (!error.path.empty()) {
        oss << " at " << error.path;
    }
    oss << ": " << error.message;
    return oss.str();
}

bool has_error_kind(const std::vector<CompileError>& errors, ErrorKind kind) {
    return std::any_of(errors.begin(), errors.end(),
                       [kind](const CompileError& e) { return e.kind == kind; });
}

} // namespace stylec::core
