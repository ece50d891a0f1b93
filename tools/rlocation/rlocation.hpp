/**
 * rlocation CLI - rlocation command
 *
 * Resolve runfiles-root-relative paths and print their locations.
 */

#pragma once

#include "common.hpp"
#include <CLI/CLI.hpp>

#include <map>

namespace runfiles::cli {

inline void setup_rlocation(CLI::App& app, GlobalOptions& opts) {
    auto* manifest_opt = app.add_option("--manifest", opts.manifest,
                                        "Resolve through this runfiles manifest");
    auto* dir_opt = app.add_option("--dir", opts.dir, "Resolve under this runfiles directory");
    manifest_opt->excludes(dir_opt);

    app.add_option("paths", opts.paths, "Runfiles-root-relative paths to resolve");
    app.add_flag("--env", opts.env, "Print environment variables for child processes");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");
}

// Exit status: 0 when every path resolves, 1 otherwise.
inline int cmd_rlocation(const GlobalOptions& opts,
                         std::ostream& out = std::cout, std::ostream& err = std::cerr) {
    auto created = Runfiles::create(resolve_environment(opts));
    if (created.isErr()) {
        print_error(created.error().message(), opts, out, err);
        return 1;
    }
    const auto& rf = *created.value();

    // Sorted for stable output
    auto env_vars = rf.env_vars();
    std::map<std::string, std::string> sorted_env(env_vars.begin(), env_vars.end());

    bool all_found = true;
    nlohmann::json results = nlohmann::json::array();

    for (const auto& path : opts.paths) {
        auto resolved = rf.rlocation(path);
        nlohmann::json entry;
        entry["path"] = path;

        if (resolved.isErr()) {
            all_found = false;
            entry["error"] = resolved.error().message();
            entry["code"] = error_code_to_string(resolved.error().code());
            if (!opts.json) print_error(resolved.error().message(), opts, out, err);
        } else if (!resolved.value()) {
            all_found = false;
            entry["location"] = nullptr;
            if (!opts.json) print_error("unknown runfile: " + path, opts, out, err);
        } else {
            entry["location"] = *resolved.value();
            if (!opts.json) out << *resolved.value() << std::endl;
        }
        results.push_back(std::move(entry));
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = all_found;
        j["mode"] = mode_to_string(rf.mode());
        j["results"] = results;
        if (opts.env) {
            j["env"] = sorted_env;
        }
        output_json(j, out);
    } else if (opts.env) {
        for (const auto& [key, value] : sorted_env) {
            out << key << "=" << value << std::endl;
        }
    }

    return all_found ? 0 : 1;
}

} // namespace runfiles::cli
