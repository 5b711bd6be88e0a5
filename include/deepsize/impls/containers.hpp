#pragma once

#include <array>
#include <cstddef>
#include <deque>
#include <forward_list>
#include <list>
#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "deepsize/size_of.hpp"
#include "deepsize/impls/capacity.hpp"


namespace deepsize {

namespace detail {

// Sum of the children of every live element. Callers hold the descent guard.
template <typename Elem, typename Range>
[[nodiscard]] inline std::size_t elements_children(const Range& range, Context& ctx) {
    if constexpr (leaf<Elem>) {
        return 0;
    } else {
        std::size_t total = 0;
        for (const auto& e : range) {
            total += deep_size_of_children(e, ctx);
        }
        return total;
    }
}

// Same for associative containers: key and mapped value of every entry
template <typename Key, typename Mapped, typename Range>
[[nodiscard]] inline std::size_t entries_children(const Range& range, Context& ctx) {
    if constexpr (leaf<Key> && leaf<Mapped>) {
        return 0;
    } else {
        std::size_t total = 0;
        for (const auto& [key, mapped] : range) {
            total += deep_size_of_children(key, ctx);
            total += deep_size_of_children(mapped, ctx);
        }
        return total;
    }
}

} // namespace detail


// -----------------------------------------------------------------------------
// Contiguous containers: the whole reserved capacity is counted
// -----------------------------------------------------------------------------
template <Sizable T, typename A>
struct size_traits<std::vector<T, A>> {
    static std::size_t children(const std::vector<T, A>& v, Context& ctx) {
        if (v.capacity() == 0) return 0;
        Context::descent guard{ctx};
        if (!guard) return 0;
        return capacity::reserved_bytes(v) + detail::elements_children<T>(v, ctx);
    }
};

template <typename A>
struct size_traits<std::vector<bool, A>> {
    static std::size_t children(const std::vector<bool, A>& v, Context&) noexcept {
        return capacity::reserved_bytes(v);
    }
};

// Characters are not independently sizable: the buffer is the whole cost
template <typename C, typename Tr, typename A>
struct size_traits<std::basic_string<C, Tr, A>> {
    static std::size_t children(const std::basic_string<C, Tr, A>& s, Context&) noexcept {
        return capacity::reserved_bytes(s);
    }
};

template <Sizable T, std::size_t N>
struct size_traits<std::array<T, N>> {
    static std::size_t children(const std::array<T, N>& a, Context& ctx) {
        return detail::elements_children<T>(a, ctx);
    }
};

template <Sizable T, typename A>
struct size_traits<std::deque<T, A>> {
    static std::size_t children(const std::deque<T, A>& d, Context& ctx) {
        Context::descent guard{ctx};
        if (!guard) return 0;
        return capacity::deque_bytes<T>(d.size()) + detail::elements_children<T>(d, ctx);
    }
};


// -----------------------------------------------------------------------------
// Node-based sequences: one allocation per element
// -----------------------------------------------------------------------------
template <Sizable T, typename A>
struct size_traits<std::list<T, A>> {
    static std::size_t children(const std::list<T, A>& l, Context& ctx) {
        if (l.empty()) return 0;
        Context::descent guard{ctx};
        if (!guard) return 0;
        return l.size() * capacity::list_node_bytes<T> + detail::elements_children<T>(l, ctx);
    }
};

template <Sizable T, typename A>
struct size_traits<std::forward_list<T, A>> {
    static std::size_t children(const std::forward_list<T, A>& l, Context& ctx) {
        if (l.empty()) return 0;
        Context::descent guard{ctx};
        if (!guard) return 0;
        std::size_t nodes = 0;
        std::size_t owned = 0;
        for (const auto& e : l) {
            ++nodes;
            owned += deep_size_of_children(e, ctx);
        }
        return nodes * capacity::forward_list_node_bytes<T> + owned;
    }
};


// -----------------------------------------------------------------------------
// Ordered associative containers (red-black tree nodes)
// -----------------------------------------------------------------------------
template <Sizable K, Sizable V, typename C, typename A>
struct size_traits<std::map<K, V, C, A>> {
    using container = std::map<K, V, C, A>;

    static std::size_t children(const container& m, Context& ctx) {
        if (m.empty()) return 0;
        Context::descent guard{ctx};
        if (!guard) return 0;
        return m.size() * capacity::tree_node_bytes<typename container::value_type>
             + detail::entries_children<K, V>(m, ctx);
    }
};

template <Sizable K, Sizable V, typename C, typename A>
struct size_traits<std::multimap<K, V, C, A>> {
    using container = std::multimap<K, V, C, A>;

    static std::size_t children(const container& m, Context& ctx) {
        if (m.empty()) return 0;
        Context::descent guard{ctx};
        if (!guard) return 0;
        return m.size() * capacity::tree_node_bytes<typename container::value_type>
             + detail::entries_children<K, V>(m, ctx);
    }
};

template <Sizable K, typename C, typename A>
struct size_traits<std::set<K, C, A>> {
    static std::size_t children(const std::set<K, C, A>& s, Context& ctx) {
        if (s.empty()) return 0;
        Context::descent guard{ctx};
        if (!guard) return 0;
        return s.size() * capacity::tree_node_bytes<K> + detail::elements_children<K>(s, ctx);
    }
};

template <Sizable K, typename C, typename A>
struct size_traits<std::multiset<K, C, A>> {
    static std::size_t children(const std::multiset<K, C, A>& s, Context& ctx) {
        if (s.empty()) return 0;
        Context::descent guard{ctx};
        if (!guard) return 0;
        return s.size() * capacity::tree_node_bytes<K> + detail::elements_children<K>(s, ctx);
    }
};


// -----------------------------------------------------------------------------
// Unordered associative containers (bucket array + singly linked nodes)
// -----------------------------------------------------------------------------
template <Sizable K, Sizable V, typename H, typename E, typename A>
struct size_traits<std::unordered_map<K, V, H, E, A>> {
    using container = std::unordered_map<K, V, H, E, A>;

    static std::size_t children(const container& m, Context& ctx) {
        Context::descent guard{ctx};
        if (!guard) return 0;
        return capacity::bucket_bytes(m.bucket_count())
             + m.size() * capacity::hash_node_bytes<K, typename container::value_type>
             + detail::entries_children<K, V>(m, ctx);
    }
};

template <Sizable K, Sizable V, typename H, typename E, typename A>
struct size_traits<std::unordered_multimap<K, V, H, E, A>> {
    using container = std::unordered_multimap<K, V, H, E, A>;

    static std::size_t children(const container& m, Context& ctx) {
        Context::descent guard{ctx};
        if (!guard) return 0;
        return capacity::bucket_bytes(m.bucket_count())
             + m.size() * capacity::hash_node_bytes<K, typename container::value_type>
             + detail::entries_children<K, V>(m, ctx);
    }
};

template <Sizable K, typename H, typename E, typename A>
struct size_traits<std::unordered_set<K, H, E, A>> {
    static std::size_t children(const std::unordered_set<K, H, E, A>& s, Context& ctx) {
        Context::descent guard{ctx};
        if (!guard) return 0;
        return capacity::bucket_bytes(s.bucket_count())
             + s.size() * capacity::hash_node_bytes<K, K>
             + detail::elements_children<K>(s, ctx);
    }
};

template <Sizable K, typename H, typename E, typename A>
struct size_traits<std::unordered_multiset<K, H, E, A>> {
    static std::size_t children(const std::unordered_multiset<K, H, E, A>& s, Context& ctx) {
        Context::descent guard{ctx};
        if (!guard) return 0;
        return capacity::bucket_bytes(s.bucket_count())
             + s.size() * capacity::hash_node_bytes<K, K>
             + detail::elements_children<K>(s, ctx);
    }
};

} // namespace deepsize
