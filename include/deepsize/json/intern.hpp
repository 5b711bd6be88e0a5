#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

#include "deepsize/json/value.hpp"

namespace deepsize::json {

// ============================================================================
// Custom string_view hasher and comparator (content-based)
// ============================================================================
struct SvHasher {
    std::size_t operator()(std::string_view sv) const noexcept {
        std::size_t h = 146527;
        for (unsigned char c : sv)
            h = (h * 16777619) ^ c;  // FNV-1a-ish variant
        return h;
    }
};

struct SvEqual {
    bool operator()(std::string_view a, std::string_view b) const noexcept {
        return a == b;
    }
};

// ============================================================================
// Text interning pool
// ============================================================================
//
// Hands out one shared allocation per distinct content. The pool belongs to
// a single parse; documents keep their text alive through the shared
// pointers after the pool is gone.
//
class InternPool {
public:
    InternPool() {
        map_.reserve(256);
    }

    [[nodiscard]] inline shared_text intern(std::string_view sv) {
        auto it = map_.find(sv);
        if (it != map_.end())
            return it->second;

        auto owned = std::make_shared<const std::string>(sv);
        std::string_view key = *owned;   // stable: points into the shared string
        map_.emplace(key, owned);
        return owned;
    }

    // Number of distinct strings
    [[nodiscard]] inline std::size_t count() const noexcept {
        return map_.size();
    }

private:
    std::unordered_map<std::string_view, shared_text, SvHasher, SvEqual> map_;
};

} // namespace deepsize::json
