#pragma once

#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <typeinfo>

namespace deepsize {

// ============================================================================
// Allocation identity
// ============================================================================
//
// Identifies one heap allocation reached during a traversal: the address of
// the pointee plus a tag for its static type. Equal-valued but distinct
// allocations never compare equal; the same allocation reached through
// different owners always does.
//
// The type tag keeps a pointer to an object and a pointer to its first
// member (same address, different type) as separate identities.
//
// Polymorphic pointees are identified by the address of their most-derived
// object and a shared tag, so one object reached as Derived* and as Base*
// (at any base offset) is a single identity. Non-polymorphic class
// hierarchies carry no dynamic type: a Base* and a Derived* to the same
// object stay distinct identities.
//
struct identity {
    std::uintptr_t address{0};
    std::size_t tag{0};

    // Tag shared by every polymorphic pointee
    static constexpr std::size_t dynamic_tag = 0;

    template <typename T>
    [[nodiscard]] static inline identity of(const T* p) noexcept {
        if constexpr (std::is_polymorphic_v<T>) {
            return identity{
                reinterpret_cast<std::uintptr_t>(dynamic_cast<const void*>(p)),
                dynamic_tag
            };
        } else {
            return identity{
                reinterpret_cast<std::uintptr_t>(static_cast<const void*>(p)),
                typeid(T).hash_code()
            };
        }
    }

    friend constexpr bool operator==(const identity&, const identity&) noexcept = default;
};

// ============================================================================
// Hasher for the visited set
// ============================================================================
//
// Heap addresses are aligned, so the low bits carry no entropy. The address
// is shifted and folded with the tag through a 64-bit multiplicative mix.
//
struct identity_hash {
    std::size_t operator()(const identity& id) const noexcept {
        std::uint64_t h = static_cast<std::uint64_t>(id.address >> 4);
        h ^= static_cast<std::uint64_t>(id.tag) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        h ^= h >> 33;
        h *= 0xff51afd7ed558ccdULL;
        h ^= h >> 33;
        return static_cast<std::size_t>(h);
    }
};

} // namespace deepsize
