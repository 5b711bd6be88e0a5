#pragma once

#include <string>
#include <vector>
#include <ostream>
#include <iostream>
#include <cstdlib>
#include <cstddef>

#include <CLI/CLI.hpp>

#include "deepsize/config.hpp"
#include "deepsize/log/logger.hpp"

namespace deepsize::cli::report {

// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value == "trace" || value == "debug" || value == "info" ||
            value == "warn"  || value == "error" || value == "fatal") {
            return {};
        }
        return "Log level must be one of: trace, debug, info, warn, error, fatal";
    },
    "Log level validator"
);

struct Params {
    std::vector<std::string> files;
    std::string log_level   = "warn";
    std::size_t max_depth   = config::default_max_depth;
    std::size_t json_depth  = 1024;
    bool intern_strings     = false;
    bool exact              = false;

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n  Files          : ";
        for (const auto& f : files) {
            os << f << " ";
        }
        os << "\n  Log Level      : " << log_level
           << "\n  Max Depth      : " << max_depth
           << "\n  JSON Depth     : " << json_depth
           << "\n  Intern Strings : " << (intern_strings ? "yes" : "no")
           << "\n  Exact Bytes    : " << (exact ? "yes" : "no") << "\n";
    }
};

[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    Params params{};

    app.set_config("--config", "", "Read options from an INI/TOML file");
    app.add_option("files", params.files, "JSON document(s) to measure")->required()->check(CLI::ExistingFile);
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->check(log_level_validator)->default_val(params.log_level);
    app.add_option("--max-depth", params.max_depth, "Traversal depth guard")->check(CLI::Range(std::size_t{1}, std::size_t{1} << 20))->default_val(params.max_depth);
    app.add_option("--json-depth", params.json_depth, "Maximum document nesting")->check(CLI::Range(std::size_t{1}, std::size_t{1} << 16))->default_val(params.json_depth);
    app.add_flag("-i,--intern-strings", params.intern_strings, "Share equal keys and strings between members");
    app.add_flag("-x,--exact", params.exact, "Print exact byte counts next to scaled ones");

    app.footer(
        "Measures what holding each document in memory costs:\n"
        "static bytes of the root plus every heap byte it owns.\n"
        "Interned strings are counted once per document."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr));
    }

    log::set_level(params.log_level);
    return params;
}

} // namespace deepsize::cli::report
