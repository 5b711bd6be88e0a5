// -----------------------------------------------------------------------------
// Reserved-storage queries for standard containers
//
// These answer "how many bytes does this container's backing store occupy",
// independent of what the elements themselves own. Contiguous containers are
// exact (capacity() is what was allocated). Node-based containers are
// modelled after the libstdc++ node layouts:
//
//   std::list          { prev, next, value }
//   std::forward_list  { next, value }
//   std::map / set     { color, parent, left, right, value }
//   std::unordered_*   { next, value [, cached hash] } + bucket array
//   std::deque         fixed 512-byte blocks + block map (>= 8 slots)
//
// Allocator bookkeeping (malloc headers, size-class rounding) is not counted,
// so node-based results are a close lower bound rather than exact.
// -----------------------------------------------------------------------------
#pragma once

#include <algorithm>
#include <climits>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>


namespace deepsize::capacity {

namespace detail {

template <typename V>
struct list_node {
    void* prev;
    void* next;
    alignas(V) unsigned char value[sizeof(V)];
};

template <typename V>
struct forward_list_node {
    void* next;
    alignas(V) unsigned char value[sizeof(V)];
};

template <typename V>
struct tree_node {
    int color;
    void* parent;
    void* left;
    void* right;
    alignas(V) unsigned char value[sizeof(V)];
};

template <typename V>
struct hash_node {
    void* next;
    alignas(V) unsigned char value[sizeof(V)];
};

template <typename V>
struct hash_node_cached {
    void* next;
    alignas(V) unsigned char value[sizeof(V)];
    std::size_t hash;
};

inline constexpr std::size_t deque_block_bytes = 512;
inline constexpr std::size_t deque_min_map_slots = 8;

} // namespace detail


// libstdc++ caches the hash code in each node unless the key hashes cheaply
template <typename Key>
inline constexpr bool hash_is_cached =
    !(std::is_arithmetic_v<Key> || std::is_enum_v<Key> || std::is_pointer_v<Key>);

template <typename V>
inline constexpr std::size_t list_node_bytes = sizeof(detail::list_node<V>);

template <typename V>
inline constexpr std::size_t forward_list_node_bytes = sizeof(detail::forward_list_node<V>);

template <typename V>
inline constexpr std::size_t tree_node_bytes = sizeof(detail::tree_node<V>);

template <typename Key, typename V>
inline constexpr std::size_t hash_node_bytes =
    hash_is_cached<Key> ? sizeof(detail::hash_node_cached<V>) : sizeof(detail::hash_node<V>);

template <typename V>
inline constexpr std::size_t deque_block_elements =
    sizeof(V) < detail::deque_block_bytes ? detail::deque_block_bytes / sizeof(V) : 1;


// Bytes reserved by a vector's backing array
template <typename T, typename A>
[[nodiscard]] inline std::size_t reserved_bytes(const std::vector<T, A>& v) noexcept {
    return v.capacity() * sizeof(T);
}

// vector<bool> packs bits
template <typename A>
[[nodiscard]] inline std::size_t reserved_bytes(const std::vector<bool, A>& v) noexcept {
    return (v.capacity() + CHAR_BIT - 1) / CHAR_BIT;
}

// True while the characters live in the string object's own small buffer
template <typename C, typename Tr, typename A>
[[nodiscard]] inline bool is_inline(const std::basic_string<C, Tr, A>& s) noexcept {
    // compared as integers: data() may point into an unrelated allocation
    const auto data  = reinterpret_cast<std::uintptr_t>(s.data());
    const auto begin = reinterpret_cast<std::uintptr_t>(std::addressof(s));
    return data >= begin && data < begin + sizeof(s);
}

// Heap bytes of a string: capacity plus the terminator, or nothing while
// the small-string buffer is in use
template <typename C, typename Tr, typename A>
[[nodiscard]] inline std::size_t reserved_bytes(const std::basic_string<C, Tr, A>& s) noexcept {
    if (is_inline(s)) return 0;
    return (s.capacity() + 1) * sizeof(C);
}

// Block storage plus the block map of a deque holding n elements
template <typename T>
[[nodiscard]] inline std::size_t deque_bytes(std::size_t n) noexcept {
    const std::size_t per_block = deque_block_elements<T>;
    const std::size_t blocks = n / per_block + 1;
    const std::size_t map_slots = std::max(detail::deque_min_map_slots, blocks + 2);
    return blocks * per_block * sizeof(T) + map_slots * sizeof(void*);
}

// Bucket array of an unordered container; a single bucket is stored inline
[[nodiscard]] inline std::size_t bucket_bytes(std::size_t bucket_count) noexcept {
    return bucket_count > 1 ? bucket_count * sizeof(void*) : 0;
}

} // namespace deepsize::capacity
