#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "deepsize/size_of.hpp"
#include "deepsize/impls/primitives.hpp"
#include "deepsize/impls/containers.hpp"
#include "deepsize/impls/pointers.hpp"
#include "deepsize/impls/utility.hpp"

/*
===============================================================================
deepsize::json: owned JSON document model
===============================================================================

A fully owned, recursive representation of a JSON document, used by the
report tool to measure what holding a parsed document costs.

Text (keys and string values) is either owned inline in a std::string or
shared through an interned std::shared_ptr<const std::string>. Interned
text is counted once per traversal however many times it appears, which is
exactly what an interning cache saves.
===============================================================================
*/

namespace deepsize::json {

using shared_text = std::shared_ptr<const std::string>;
using text = std::variant<std::string, shared_text>;

[[nodiscard]] inline std::string_view view(const text& t) noexcept {
    if (const auto* s = std::get_if<std::string>(&t)) {
        return *s;
    }
    const auto& shared = std::get<shared_text>(t);
    return shared ? std::string_view{*shared} : std::string_view{};
}

struct member;
struct value;

using array = std::vector<value>;
using object = std::vector<member>;

enum class kind : std::uint8_t {
    null,
    boolean,
    int64,
    uint64,
    real,
    string,
    array,
    object
};

struct value {
    using storage = std::variant<
        std::monostate,
        bool,
        std::int64_t,
        std::uint64_t,
        double,
        text,
        array,
        object
    >;

    storage data;

    [[nodiscard]] inline kind type() const noexcept {
        return static_cast<kind>(data.index());
    }

    // Sum type: the active alternative only
    std::size_t deep_size_of_children(Context& ctx) const;
};

struct member {
    text key;
    value val;

    std::size_t deep_size_of_children(Context& ctx) const {
        return sum_children(ctx, key, val);
    }
};

// Defined once member is complete, so Sizable<object> can be checked
inline std::size_t value::deep_size_of_children(Context& ctx) const {
    return deepsize::deep_size_of_children(data, ctx);
}

constexpr std::string_view to_string(kind k) noexcept {
    switch (k) {
        case kind::null:    return "null";
        case kind::boolean: return "boolean";
        case kind::int64:   return "int64";
        case kind::uint64:  return "uint64";
        case kind::real:    return "real";
        case kind::string:  return "string";
        case kind::array:   return "array";
        case kind::object:  return "object";
    }
    return "unknown";
}

// Aggregate statistics over a document, for the report
struct stats {
    std::size_t values{0};
    std::size_t strings{0};
    std::size_t max_depth{0};
};

stats collect_stats(const value& root);

} // namespace deepsize::json
