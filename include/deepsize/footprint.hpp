#pragma once

#include <cstdint>
#include <ostream>
#include <type_traits>


namespace deepsize {

// Memory footprint split into the in-place representation (static) and the
// heap bytes it transitively owns (dynamic)
struct footprint {
    std::uint64_t static_bytes{0};
    std::uint64_t dynamic_bytes{0};

    inline constexpr std::uint64_t total_bytes() const noexcept {
        return static_bytes + dynamic_bytes;
    }

    /// Merge another footprint into this one
    inline constexpr void add(const footprint& other) noexcept {
        static_bytes += other.static_bytes;
        dynamic_bytes += other.dynamic_bytes;
    }

    template <typename T>
        requires (!std::is_arithmetic_v<T>)
    inline constexpr void add(const T& component) noexcept {
        if constexpr (requires { component.memory_usage(); }) {
            add(component.memory_usage());
        } else {
            static_assert(sizeof(T) == 0, "Type passed to add() must have memory_usage()");
        }
    }

    inline constexpr void add_static(std::uint64_t bytes) noexcept {
        static_bytes += bytes;
    }

    inline constexpr void add_dynamic(std::uint64_t bytes) noexcept {
        dynamic_bytes += bytes;
    }

    // A component held by pointer: everything it accounts for lives on the heap
    template <typename T>
        requires (!std::is_arithmetic_v<T>)
    inline constexpr void add_dynamic(const T& component) noexcept {
        if constexpr (requires { component.memory_usage(); }) {
            dynamic_bytes += component.memory_usage().total_bytes();
        } else {
            static_assert(sizeof(T) == 0, "Type passed to add_dynamic() must implement memory_usage()");
        }
    }

    friend constexpr bool operator==(const footprint&, const footprint&) noexcept = default;
};

inline std::ostream& operator<<(std::ostream& os, const footprint& fp) {
    return os << "{static=" << fp.static_bytes
              << ", dynamic=" << fp.dynamic_bytes
              << ", total=" << fp.total_bytes() << "}";
}

} // namespace deepsize
