#include <algorithm>

#include "deepsize/json/value.hpp"


namespace deepsize::json {

namespace {

void walk(const value& v, std::size_t depth, stats& out) {
    ++out.values;
    out.max_depth = std::max(out.max_depth, depth);

    switch (v.type()) {
    case kind::string:
        ++out.strings;
        break;
    case kind::array:
        for (const auto& item : std::get<array>(v.data)) {
            walk(item, depth + 1, out);
        }
        break;
    case kind::object:
        for (const auto& m : std::get<object>(v.data)) {
            ++out.strings; // key
            walk(m.val, depth + 1, out);
        }
        break;
    default:
        break;
    }
}

} // namespace

stats collect_stats(const value& root) {
    stats s{};
    walk(root, 0, s);
    return s;
}

} // namespace deepsize::json
