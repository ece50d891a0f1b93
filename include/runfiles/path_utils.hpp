#pragma once

#include <string>

namespace runfiles {

enum class PathError {
    None,
    Empty,
    ContainsUplevel,
    AbsoluteNotAllowed,
};

// Check that a logical runfiles path is usable as a lookup key (string-based).
// - Rejects the empty path
// - Rejects any occurrence of ".."
// - Rejects absolute paths ("/..." everywhere; "\..." and "C:..." on Windows)
PathError validate_logical_path(const std::string& path);

// True when `path` is absolute on the host platform.
bool is_absolute_path(const std::string& path);

// Concatenate `base` and `rel` with a single '/' separator. No normalization.
std::string join_path(const std::string& base, const std::string& rel);

} // namespace runfiles
