#pragma once

#include <cstdint>
#include <string_view>

namespace deepsize::json {

/*
===============================================================================
 json::Error
===============================================================================

Failures while turning a file into an owned document. Sizing itself never
fails; only loading does.
===============================================================================
*/

enum class Error : std::uint8_t {
    None = 0,
    FileNotFound,     // Path does not exist or is not a regular file
    ReadFailed,       // File exists but could not be read into memory
    InvalidJson,      // Structural failure reported by the parser
    DepthExceeded,    // Nesting deeper than the configured limit
    AllocationFailed  // Parser buffers for the document could not be reserved
};

[[nodiscard]]
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:          return "None";
    case Error::FileNotFound:  return "FileNotFound";
    case Error::ReadFailed:    return "ReadFailed";
    case Error::InvalidJson:   return "InvalidJson";
    case Error::DepthExceeded: return "DepthExceeded";
    case Error::AllocationFailed: return "AllocationFailed";
    default:                   return "Unknown";
    }
}

} // namespace deepsize::json
