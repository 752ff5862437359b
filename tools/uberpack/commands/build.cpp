/**
 * uberpack CLI - build command
 *
 * Assemble an uber archive from a basis file and the compiled output.
 */

#include "../common.hpp"
#include <uberpack/config.hpp>
#include <uberpack/platform.hpp>
#include <uberpack/uber.hpp>
#include <CLI/CLI.hpp>
#include <cstdlib>

namespace uberpack::cli::commands {

namespace {

struct BuildOptions {
    std::string basis;
    std::string params;
    std::string target_dir;
    std::string class_dir;
    std::string uber_file;
    std::string main;
    std::vector<std::string> manifest;
    std::string project_root;
    bool strict = false;
};

// "Name=Value" from -M
bool parse_manifest_flag(const std::string& flag, std::pair<std::string, std::string>& out) {
    auto eq = flag.find('=');
    if (eq == std::string::npos || eq == 0) {
        return false;
    }
    out = {flag.substr(0, eq), flag.substr(eq + 1)};
    return true;
}

// Parameters given on the command line, laid over the params file
bool flag_params(const BuildOptions& build_opts, BuildParams& params, std::string& error) {
    if (!build_opts.target_dir.empty()) params.target_dir = build_opts.target_dir;
    if (!build_opts.class_dir.empty()) params.class_dir = build_opts.class_dir;
    if (!build_opts.uber_file.empty()) params.uber_file = build_opts.uber_file;
    if (!build_opts.main.empty()) params.main = build_opts.main;
    if (!build_opts.project_root.empty()) params.project_root = build_opts.project_root;

    for (const auto& flag : build_opts.manifest) {
        std::pair<std::string, std::string> attr;
        if (!parse_manifest_flag(flag, attr)) {
            error = "manifest attribute must be Name=Value: " + flag;
            return false;
        }
        params.manifest.push_back(std::move(attr));
    }
    return true;
}

nlohmann::json to_json(const UberResult& result) {
    nlohmann::json j;
    j["ok"] = true;
    j["uber_file"] = result.uber_file;
    j["sources"] = result.sources;
    j["pruned"] = result.pruned;
    j["entries_written"] = result.entries_written;
    j["conflicts_dropped"] = result.conflicts_dropped;
    j["files_merged"] = result.files_merged;
    j["entries_excluded"] = result.entries_excluded;

    nlohmann::json manifest = nlohmann::json::array();
    for (const auto& [name, value] : result.manifest.items()) {
        manifest.push_back({{"name", name}, {"value", value}});
    }
    j["manifest"] = manifest;
    return j;
}

int cmd_build(const GlobalOptions& opts, const BuildOptions& build_opts) {
    init_warning_printer(opts.json, opts.quiet);

    // Basis
    auto basis_content = read_file(build_opts.basis);
    if (!basis_content) {
        print_error("Failed to read basis: " + build_opts.basis, opts.json);
        return 1;
    }
    auto basis = parse_basis(*basis_content, build_opts.basis);
    if (!basis.ok) {
        print_error("Invalid basis: " + basis.error, opts.json);
        return 1;
    }
    for (const auto& w : basis.warnings) {
        print_warning(w);
    }

    // Params: file first, then flags
    BuildParams params;
    if (!build_opts.params.empty()) {
        auto params_content = read_file(build_opts.params);
        if (!params_content) {
            print_error("Failed to read params: " + build_opts.params, opts.json);
            return 1;
        }
        auto parsed = parse_params(*params_content, build_opts.params);
        if (!parsed.ok) {
            print_error("Invalid params: " + parsed.error, opts.json);
            return 1;
        }
        for (const auto& w : parsed.warnings) {
            print_warning(w);
        }
        params = parsed.params;
    }

    BuildParams flags;
    std::string error;
    if (!flag_params(build_opts, flags, error)) {
        print_error(error, opts.json);
        return 1;
    }
    overlay_params(params, flags);

    WarningCollector collector(params.warning_policy);
    if (build_opts.strict) {
        collector.apply_override(warning_to_string(Warning::merge_conflict), WarningAction::Error);
    }

    auto uber_params = merge_params(get_builtin_defaults(), params, std::move(basis.libs));
    uber_params.warnings = &collector;

    if (opts.verbose && !opts.json) {
        std::cerr << "Building " << uber_params.uber_file << std::endl;
    }

    auto result = uber(std::move(uber_params));
    print_collected_warnings(collector, opts);

    if (!result.ok) {
        print_error(result.error, opts.json);
        return 1;
    }

    if (opts.json) {
        output_json(to_json(result));
        return 0;
    }

    if (opts.verbose) {
        for (const auto& source : result.sources) {
            std::cout << "  source: " << source << std::endl;
        }
        for (const auto& coordinate : result.pruned) {
            std::cout << "  pruned: " << coordinate << std::endl;
        }
    }
    if (!opts.quiet) {
        std::cout << "Created " << result.uber_file << " (" << result.entries_written
                  << " entries";
        if (result.conflicts_dropped > 0) {
            std::cout << ", " << result.conflicts_dropped << " conflicting entries dropped";
        }
        std::cout << ")" << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_build(CLI::App* app, GlobalOptions& opts) {
    static BuildOptions build_opts;

    app->add_option("--basis", build_opts.basis, "Resolved library map (JSON)")
        ->required()
        ->check(CLI::ExistingFile);
    app->add_option("--params", build_opts.params, "Build parameters (JSON)")
        ->check(CLI::ExistingFile);
    app->add_option("--target-dir", build_opts.target_dir,
                    "Build output directory holding the default class dir and archive");
    app->add_option("--class-dir", build_opts.class_dir, "Compiled output directory");
    app->add_option("--uber-file", build_opts.uber_file, "Output archive path");
    app->add_option("--main", build_opts.main, "Entry-point namespace");
    app->add_option("-M,--manifest", build_opts.manifest, "Manifest attribute Name=Value");
    app->add_option("--project-root", build_opts.project_root,
                    "Base directory for relative paths");
    app->add_flag("--strict", build_opts.strict, "Treat dropped conflicting entries as errors");

    app->callback([&opts]() {
        std::exit(cmd_build(opts, build_opts));
    });
}

} // namespace uberpack::cli::commands
