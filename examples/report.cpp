// -----------------------------------------------------------------------------
// deepsize-report
//
// Loads JSON documents into an owned in-memory tree and reports the memory
// that tree costs to hold.
//
// Example:
//     deepsize-report --intern-strings --exact data/*.json
// -----------------------------------------------------------------------------
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>

#include "deepsize.hpp"
#include "deepsize/format.hpp"
#include "deepsize/json/parser.hpp"
#include "common/cli/report.hpp"


int main(int argc, char** argv) {
    using namespace deepsize;

    auto params = cli::report::configure(argc, argv, "deepsize-report: memory footprint of parsed JSON documents");
    if (log::Logger::instance().enabled(log::Level::Debug)) {
        params.dump("Parameters", std::cout);
    }

    const Config cfg{ .max_depth = params.max_depth, .warn_on_truncation = true };
    const json::ParseOptions opts{ .intern_strings = params.intern_strings, .max_depth = params.json_depth };

    int failures = 0;
    for (const auto& path : params.files) {
        json::value doc;
        std::uint64_t digest = 0;
        auto err = json::load_file(path, opts, doc, digest);
        if (err != json::Error::None) {
            DS_ERROR("[report] " << path << ": " << json::to_string(err));
            ++failures;
            continue;
        }

        Context ctx{cfg};
        const footprint fp{
            .static_bytes = stack_size<json::value>(),
            .dynamic_bytes = deep_size_of_children(doc, ctx)
        };
        const auto st = json::collect_stats(doc);

        std::cout << path << "\n"
                  << "  xxh64     : " << std::hex << std::setw(16) << std::setfill('0') << digest
                  << std::dec << std::setfill(' ') << "\n"
                  << "  root      : " << json::to_string(doc.type()) << "\n"
                  << "  values    : " << st.values << " (" << st.strings << " strings, depth " << st.max_depth << ")\n"
                  << "  footprint : " << format_footprint(fp, params.exact) << "\n";
        if (params.intern_strings) {
            std::cout << "  shared    : " << ctx.visited() << " distinct strings\n";
        }
        if (ctx.truncated() > 0) {
            std::cout << "  truncated : " << ctx.truncated() << " descents (raise --max-depth)\n";
        }
    }

    return failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
