#pragma once

#include <cstddef>

namespace deepsize::config {

/*
===============================================================================
Traversal Limits
===============================================================================

The depth guard bounds how many owning indirections (boxes, shared pointers,
container element descents) a single traversal may nest.

Design principles:
  - Generous enough that realistic deep structures (long linked lists,
    deep trees) are sized exactly
  - Small enough that the recursion stays well within a default 8 MiB
    thread stack
  - Only a true cycle through non-shared links or pathological depth
    ever hits it
===============================================================================
*/

inline constexpr std::size_t default_max_depth = 1 << 14; // 16384

// Initial bucket reservation of the visited-identity set
inline constexpr std::size_t visited_reserve   = 1 << 5;  // 32

} // namespace deepsize::config


namespace deepsize {

// -----------------------------------------------------------------------------
// Runtime traversal configuration
// -----------------------------------------------------------------------------
struct Config {
    std::size_t max_depth   = config::default_max_depth;
    bool warn_on_truncation = true;
};

} // namespace deepsize
