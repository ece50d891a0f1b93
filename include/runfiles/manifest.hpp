#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>

namespace runfiles {

// Logical runfiles path -> physical path. An empty value marks the logical path
// as explicitly absent.
using ManifestTable = std::unordered_map<std::string, std::string>;

struct ManifestParseResult {
    bool ok = false;
    std::string error;
    size_t error_line = 0;     // 1-based, set when ok is false
    ManifestTable entries;
    size_t duplicates = 0;     // lines that replaced an earlier entry
};

// Parse runfiles manifest text. Each non-blank line is "<logical> <physical>",
// split at the first space; a trailing '\r' is dropped. A line without a space
// or with an empty logical path fails the whole parse. Later duplicates
// replace earlier ones.
// `source` only appears in error messages.
ManifestParseResult parse_runfiles_manifest(const std::string& content,
                                            const std::string& source = "<manifest>");

} // namespace runfiles
