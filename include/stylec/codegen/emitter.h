#pragma once
#include <stylec/core/error.h>
#include <stylec/ir/style_ir.h>
#include <string>
#include <vector>

namespace stylec::codegen {

struct EmitResult {
    bool ok = false;
    std::string text;
    std::vector<core::CompileError> errors;
};

// Serializes a normalized sheet into style text:
//
//   {
//       display: flex;
//   }
//   &:hover {
//       color: red;
//   }
//   @media (max-width: 768px) {
//       & {
//           width: 100%;
//       }
//   }
//
// A sheet that is not normalized fails with InvalidIR and no text.
EmitResult emit(const ir::ComponentStyleSheet& sheet);

// Collapses all whitespace runs to single spaces, for comparing emitted text
// against a one-line expectation.
std::string whitespace_normalized(const std::string& text);

} // namespace stylec::codegen
