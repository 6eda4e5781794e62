#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace stylec::codegen {

struct RustFunction {
    std::string name;        // Rust identifier
    std::string style_text;  // emitted style text
};

// Number of '#' needed so that no `"#...` run inside text closes the raw string.
size_t raw_string_hashes(const std::string& text);

// pub fn name() -> Style { Style::new(r#"..."#,).expect("...") }
std::string write_function(const RustFunction& fn);

// "//! <Title> component styles", the stylist import, then every function.
std::string write_module(const std::string& module_name, const std::vector<RustFunction>& functions);

// mod.rs: sorted `pub mod x;` lines followed by sorted `pub use x::*;` lines.
std::string write_mod_file(std::vector<std::string> module_names);

// All functions in one file under "//! Generated CSS styles".
std::string write_single_file(const std::vector<RustFunction>& functions);

} // namespace stylec::codegen
