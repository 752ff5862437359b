/**
 * uberpack CLI - Entry Point
 *
 * Assembles a single executable archive from resolved libraries and
 * compiled project output.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace uberpack::cli::commands {
    void setup_build(CLI::App* app, GlobalOptions& opts);
    void setup_list(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace uberpack::cli;

    CLI::App app{"uberpack - uber archive assembler"};
    app.set_version_flag("-V,--version", UBERPACK_VERSION);
    app.require_subcommand(0, 1);
    app.fallthrough();

    GlobalOptions opts;

    // Global options
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    // Commands
    auto* build_cmd = app.add_subcommand("build", "Build an uber archive");
    commands::setup_build(build_cmd, opts);

    auto* list_cmd = app.add_subcommand("list", "List the entries of an archive");
    commands::setup_list(list_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
