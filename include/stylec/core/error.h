#pragma once

#include <string>
#include <vector>

namespace stylec::core {

enum class ErrorKind {
    MissingSelector,
    MalformedPseudoSelector,
    MalformedSelector,
    MalformedMediaQuery,
    NestedMediaQuery,
    InvalidDeclaration,
    MalformedKeyframes,
    InvalidIR,
    NameCollision,
    InvalidIdentifier,
    IoError,
};

const char* error_kind_name(ErrorKind kind);

struct CompileError {
    ErrorKind kind = ErrorKind::InvalidIR;
    std::string sheet;    // sheet (function) the error is attributed to
    std::string path;     // node path inside the sheet, e.g. "button/&:hover"
    std::string message;
};

// "MissingSelector in button at button/& .icon: combinator target is empty"
std::string format_error(const CompileError& error);

bool has_error_kind(const std::vector<CompileError>& errors, ErrorKind kind);

} // namespace stylec::core
