/**
 * uberpack CLI - list command
 *
 * List the entries of an archive.
 */

#include "../common.hpp"
#include <uberpack/zip.hpp>
#include <CLI/CLI.hpp>
#include <cstdlib>
#include <iomanip>

namespace uberpack::cli::commands {

namespace {

struct ListOptions {
    std::string archive;
};

const char* method_name(uint16_t method) {
    switch (method) {
        case ZIP_METHOD_STORED: return "stored";
        case ZIP_METHOD_DEFLATED: return "deflated";
        default: return "other";
    }
}

int cmd_list(const GlobalOptions& opts, const ListOptions& list_opts) {
    init_warning_printer(opts.json, opts.quiet);

    ZipReader reader(list_opts.archive);
    auto opened = reader.open();
    if (!opened.ok) {
        print_error(opened.error, opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json entries = nlohmann::json::array();
        for (const auto& entry : reader.entries()) {
            nlohmann::json e;
            e["name"] = entry.name;
            e["size"] = entry.uncompressed_size;
            e["compressed_size"] = entry.compressed_size;
            e["method"] = method_name(entry.method);
            e["directory"] = entry.is_directory();
            e["last_modified"] = entry.last_modified();
            entries.push_back(e);
        }
        nlohmann::json j;
        j["ok"] = true;
        j["archive"] = list_opts.archive;
        j["entries"] = entries;
        output_json(j);
        return 0;
    }

    for (const auto& entry : reader.entries()) {
        std::cout << std::setw(10) << entry.uncompressed_size << "  " << entry.name << std::endl;
    }
    if (opts.verbose) {
        std::cout << reader.entries().size() << " entries" << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_list(CLI::App* app, GlobalOptions& opts) {
    static ListOptions list_opts;

    app->add_option("archive", list_opts.archive, "Archive to list")
        ->required()
        ->check(CLI::ExistingFile);

    app->callback([&opts]() {
        std::exit(cmd_list(opts, list_opts));
    });
}

} // namespace uberpack::cli::commands
