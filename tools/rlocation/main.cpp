/**
 * rlocation CLI - Entry Point
 *
 * Prints the runtime location of runfiles.
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include "rlocation.hpp"

#ifndef RUNFILES_VERSION
#define RUNFILES_VERSION "0.0.0"
#endif

int main(int argc, char** argv) {
    using namespace runfiles::cli;

    CLI::App app{"rlocation - print the runtime location of runfiles"};
    app.set_version_flag("-V,--version", RUNFILES_VERSION);

    GlobalOptions opts;
    setup_rlocation(app, opts);

    CLI11_PARSE(app, argc, argv);

    // stdout carries resolved paths
    spdlog::set_default_logger(spdlog::stderr_color_mt("rlocation"));
    spdlog::set_level(opts.verbose ? spdlog::level::debug : spdlog::level::warn);

    if (opts.paths.empty() && !opts.env) {
        std::cout << app.help() << std::endl;
        return 1;
    }

    return cmd_rlocation(opts);
}
