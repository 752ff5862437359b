/**
 * uberpack CLI - Common utilities and types
 */

#pragma once

#include <uberpack/types.hpp>
#include <uberpack/warnings.hpp>
#include <nlohmann/json.hpp>
#include <iostream>
#include <string>
#include <vector>

namespace uberpack::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Warning output for the current command.
 * In JSON mode, warnings are collected and output at the end.
 * In text mode, warnings are printed immediately to stderr.
 */
struct WarningPrinter {
    std::vector<std::string> warnings;
    bool json_mode = false;
    bool quiet = false;

    void add(const std::string& msg) {
        if (json_mode) {
            warnings.push_back(msg);
        } else if (!quiet) {
            std::cerr << "Warning: " << msg << std::endl;
        }
    }

    void clear() { warnings.clear(); }
    bool empty() const { return warnings.empty(); }

    nlohmann::json to_json() const {
        return nlohmann::json(warnings);
    }
};

inline WarningPrinter& get_warning_printer() {
    static WarningPrinter printer;
    return printer;
}

inline void init_warning_printer(bool json_mode, bool quiet) {
    auto& printer = get_warning_printer();
    printer.clear();
    printer.json_mode = json_mode;
    printer.quiet = quiet;
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        auto& printer = get_warning_printer();
        if (!printer.empty()) {
            j["warnings"] = printer.to_json();
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_warning(const std::string& msg) {
    get_warning_printer().add(msg);
}

inline void print_verbose_warning(const std::string& msg, bool verbose) {
    if (verbose) {
        print_warning(msg);
    }
}

inline void output_json(const nlohmann::json& j) {
    // Include any collected warnings in the output
    auto& printer = get_warning_printer();
    if (!printer.empty() && !j.contains("warnings")) {
        nlohmann::json output = j;
        output["warnings"] = printer.to_json();
        std::cout << output.dump(2) << std::endl;
    } else {
        std::cout << j.dump(2) << std::endl;
    }
}

/**
 * Forward collected library warnings to the printer. Per-entry merge
 * decisions are only shown with --verbose (or in JSON mode).
 */
inline void print_collected_warnings(const WarningCollector& collector, const GlobalOptions& opts) {
    for (const auto& warning : collector.get_warnings()) {
        bool per_entry = warning.key == warning_to_string(Warning::merge_conflict) ||
                         warning.key == warning_to_string(Warning::data_readers_merged);
        if (per_entry && warning.action != "error") {
            print_verbose_warning(format_warning(warning), opts.verbose || opts.json);
        } else {
            print_warning(format_warning(warning));
        }
    }
}

} // namespace uberpack::cli
