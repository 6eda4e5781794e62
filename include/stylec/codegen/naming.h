#pragma once
#include <string>
#include <string_view>

namespace stylec::codegen {

// Strict and reserved Rust keywords (2018 edition onwards).
bool is_rust_keyword(std::string_view name);

// [A-Za-z_][A-Za-z0-9_]*, not "_" alone, not a keyword
bool is_rust_identifier(std::string_view name);

// "btn-primary" -> "btn_primary", "2col" -> "style_2col", "type" -> "type_style",
// "" -> "style"
std::string sanitize_identifier(std::string_view name);

// "button_secondary" -> "Button Secondary"
std::string doc_title(std::string_view name);

} // namespace stylec::codegen
