#pragma once

#include <cstddef>

namespace stylec::core::config {

inline constexpr const char kProgramName[] = "stylec";
inline constexpr const char kVersionString[] = "stylec 1.0.0";

// Generated Rust surface
inline constexpr const char kStyleImport[] = "use stylist::Style;";
inline constexpr const char kStyleType[] = "Style";
inline constexpr const char kModFileName[] = "mod.rs";
inline constexpr const char kSingleFileHeader[] = "//! Generated CSS styles";
inline constexpr const char kModFileHeader[] = "//! Style modules";
inline constexpr const char kDefaultOutputDirName[] = "rust_styles";
inline constexpr const char kDefaultOutputFileName[] = "output.rs";
inline constexpr const char kDefaultModule[] = "styles";      // flat (non-component) output
inline constexpr const char kAnimationsModule[] = "animations";
inline constexpr const char kUtilitiesModule[] = "utils";
inline constexpr const char kAnimationPrefix[] = "animation_";

// Style text layout
inline constexpr std::size_t kIndentWidth = 4;
inline constexpr std::size_t kRustBodyIndent = 8;   // style text inside Style::new(r#"..."#)
inline constexpr const char kParentReference[] = "&";

// Parallel compilation; 0 keeps everything on the calling thread.
inline constexpr std::size_t kDefaultJobs = 0;

} // namespace stylec::core::config
