#pragma once

#include <atomic>
#include <bitset>
#include <chrono>
#include <cstddef>
#include <span>
#include <string_view>
#include <type_traits>

#include "deepsize/size_of.hpp"
#include "deepsize/detail/preprocessor.hpp"


// -----------------------------------------------------------------------------
// DEEPSIZE_KNOWN_SIZE(bytes, Type...)
// -----------------------------------------------------------------------------
// Declares a fixed children size for whole types: types without heap
// ownership (bytes = 0) or opaque types whose allocation is known up front.
// Must be used at global namespace scope with fully qualified type names.
//
//   DEEPSIZE_KNOWN_SIZE(0, app::Color, app::Point);   // no allocation
//   DEEPSIZE_KNOWN_SIZE(4096, app::PageHandle);       // one 4 KiB page
//
#define DEEPSIZE_DETAIL_KNOWN_ONE(bytes, Type)                                 \
    template <>                                                                \
    struct deepsize::size_traits<Type> {                                       \
        static constexpr std::size_t children(const Type&,                     \
                                              ::deepsize::Context&) noexcept { \
            return (bytes);                                                    \
        }                                                                      \
    };

#define DEEPSIZE_KNOWN_SIZE(bytes, ...)                                        \
    DEEPSIZE_DETAIL_FOR_EACH_ARG(DEEPSIZE_DETAIL_KNOWN_ONE, bytes, __VA_ARGS__)


namespace deepsize {

// Scalars: arithmetic, bool, character types, enums (std::byte included),
// nullptr_t, member pointers and function pointers own nothing
template <typename T>
    requires detail::leaf<T>
struct size_traits<T> {
    static constexpr std::size_t children(const T&, Context&) noexcept { return 0; }
};

template <typename T>
    requires detail::leaf<T>
struct size_traits<std::atomic<T>> {
    static constexpr std::size_t children(const std::atomic<T>&, Context&) noexcept { return 0; }
};

template <std::size_t N>
struct size_traits<std::bitset<N>> {
    static constexpr std::size_t children(const std::bitset<N>&, Context&) noexcept { return 0; }
};

template <typename Rep, typename Period>
struct size_traits<std::chrono::duration<Rep, Period>> {
    static constexpr std::size_t children(const std::chrono::duration<Rep, Period>&, Context&) noexcept {
        return 0;
    }
};

template <typename Clock, typename Duration>
struct size_traits<std::chrono::time_point<Clock, Duration>> {
    static constexpr std::size_t children(const std::chrono::time_point<Clock, Duration>&, Context&) noexcept {
        return 0;
    }
};

// Views do not own the storage they refer to
template <typename C, typename Tr>
struct size_traits<std::basic_string_view<C, Tr>> {
    static constexpr std::size_t children(const std::basic_string_view<C, Tr>&, Context&) noexcept {
        return 0;
    }
};

template <typename T, std::size_t Extent>
struct size_traits<std::span<T, Extent>> {
    static constexpr std::size_t children(const std::span<T, Extent>&, Context&) noexcept {
        return 0;
    }
};

// Fixed-size C arrays: elements are laid out inline
template <Sizable T, std::size_t N>
struct size_traits<T[N]> {
    static std::size_t children(const T (&arr)[N], Context& ctx) {
        if constexpr (detail::leaf<T>) {
            return 0;
        } else {
            std::size_t total = 0;
            for (const auto& e : arr) {
                total += deep_size_of_children(e, ctx);
            }
            return total;
        }
    }
};

} // namespace deepsize
