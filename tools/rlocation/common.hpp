/**
 * rlocation CLI - Common utilities and types
 */

#pragma once

#include <runfiles/runfiles.hpp>
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace runfiles::cli {

/**
 * Global options available to the command.
 */
struct GlobalOptions {
    std::string manifest;          // --manifest
    std::string dir;               // --dir
    std::vector<std::string> paths;
    bool env = false;              // --env
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Environment snapshot the resolver is created from.
 * Priority: --manifest / --dir flags > process environment
 */
inline EnvMap resolve_environment(const GlobalOptions& opts) {
    if (!opts.manifest.empty()) {
        return EnvMap{{ENV_MANIFEST_ONLY, "1"}, {ENV_MANIFEST_FILE, opts.manifest}};
    }
    if (!opts.dir.empty()) {
        return EnvMap{{ENV_RUNFILES_DIR, opts.dir}};
    }
    return get_all_env();
}

/**
 * Output utilities. JSON goes to `out`, text errors to `err`.
 */
inline void print_error(const std::string& msg, const GlobalOptions& opts,
                        std::ostream& out = std::cout, std::ostream& err = std::cerr) {
    if (opts.json) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        out << j.dump(2) << std::endl;
    } else if (!opts.quiet) {
        err << "Error: " << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j, std::ostream& out = std::cout) {
    out << j.dump(2) << std::endl;
}

} // namespace runfiles::cli
