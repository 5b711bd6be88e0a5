#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "deepsize/json/error.hpp"
#include "deepsize/json/value.hpp"

/*
================================================================================
JSON → owned document
================================================================================

Parses JSON text with simdjson and copies the DOM into an owned
deepsize::json::value tree, so the result outlives the parser.

  • Returns Error::None on success; `out` is untouched on failure
  • Never throws on malformed input
  • Logs the underlying simdjson message at debug level
================================================================================
*/

namespace deepsize::json {

struct ParseOptions {
    bool intern_strings   = false;   // share equal keys and strings
    std::size_t max_depth = 1024;    // nesting limit of the document
};

[[nodiscard]] Error parse(std::string_view json, const ParseOptions& opts, value& out);

// Loads and parses a file. digest receives the XXH64 of the raw file bytes.
[[nodiscard]] Error load_file(const std::string& path, const ParseOptions& opts,
                              value& out, std::uint64_t& digest);

} // namespace deepsize::json
