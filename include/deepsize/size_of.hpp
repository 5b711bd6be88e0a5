// ============================================================================
// Size Contract
// ----------------------------------------------------------------------------
//
// Every sizable type reports two numbers:
//
//   • stack_size<T>()               bytes of the in-place representation
//                                   (sizeof(T))
//   • deep_size_of_children(v, ctx) heap bytes v transitively owns, NOT
//                                   including sizeof(T) itself
//
// and the total is always derived:
//
//   deep_size_of(v) == stack_size<T>() + deep_size_of_children(v, ctx)
//
// Only the children size is ever customised. A type opts in with exactly one
// of the following, checked in this order:
//
//   1. a const member
//        std::size_t deep_size_of_children(deepsize::Context&) const;
//   2. a free function found by argument-dependent lookup
//        std::size_t deepsize_children(const T&, deepsize::Context&);
//      (this is what DEEPSIZE_DERIVE generates)
//   3. a specialisation of deepsize::size_traits<T> providing
//        static std::size_t children(const T&, deepsize::Context&);
//      (used for std and third-party types, see impls/)
//   4. a memory_usage() const member returning deepsize::footprint, whose
//      dynamic_bytes are taken as the children size
//
// A type with none of these is not Sizable and fails to compile. There is no
// implicit "zero" fallback: an opaque handle must be given an explicit
// size with DEEPSIZE_KNOWN_SIZE or declared().
//
// Implementations must:
//   • delegate to deep_size_of_children() of every owned sub-value
//   • add sizeof() only for storage living outside their own object
//     (a pointee, a backing array), never for sub-objects laid out inline
//   • call ctx.try_mark() before counting anything that may be shared
//
// ============================================================================

#pragma once

#include <concepts>
#include <cstddef>
#include <type_traits>

#include "deepsize/context.hpp"
#include "deepsize/footprint.hpp"

namespace deepsize {

// Customisation point for types that cannot carry a member function.
// The primary template is intentionally left undefined.
template <typename T>
struct size_traits;

namespace detail {

template <typename T>
concept has_member_children = requires(const T& v, Context& ctx) {
    { v.deep_size_of_children(ctx) } -> std::convertible_to<std::size_t>;
};

template <typename T>
concept has_adl_children = requires(const T& v, Context& ctx) {
    { deepsize_children(v, ctx) } -> std::convertible_to<std::size_t>;
};

template <typename T>
concept has_traits_children = requires(const T& v, Context& ctx) {
    { size_traits<T>::children(v, ctx) } -> std::convertible_to<std::size_t>;
};

template <typename T>
concept has_memory_usage = requires(const T& v) {
    { v.memory_usage() } -> std::same_as<footprint>;
};

// Types whose children size is zero by construction; containers of these
// skip the per-element walk entirely
template <typename T>
concept leaf =
    std::is_arithmetic_v<T> ||
    std::is_enum_v<T> ||
    std::is_null_pointer_v<T> ||
    std::is_member_pointer_v<T> ||
    (std::is_pointer_v<T> && std::is_function_v<std::remove_pointer_t<T>>);

template <typename>
inline constexpr bool dependent_false = false;

} // namespace detail


template <typename T>
concept Sizable =
    detail::has_member_children<std::remove_cv_t<T>> ||
    detail::has_adl_children<std::remove_cv_t<T>> ||
    detail::has_traits_children<std::remove_cv_t<T>> ||
    detail::has_memory_usage<std::remove_cv_t<T>>;


// Size of the in-place representation
template <typename T>
[[nodiscard]] inline constexpr std::size_t stack_size() noexcept {
    return sizeof(T);
}

// Heap bytes owned by value, excluding sizeof(value)
template <typename T>
[[nodiscard]] inline std::size_t deep_size_of_children(const T& value, Context& ctx) {
    if constexpr (detail::has_member_children<T>) {
        return static_cast<std::size_t>(value.deep_size_of_children(ctx));
    } else if constexpr (detail::has_adl_children<T>) {
        return static_cast<std::size_t>(deepsize_children(value, ctx));
    } else if constexpr (detail::has_traits_children<T>) {
        return static_cast<std::size_t>(size_traits<T>::children(value, ctx));
    } else if constexpr (detail::has_memory_usage<T>) {
        return static_cast<std::size_t>(value.memory_usage().dynamic_bytes);
    } else {
        static_assert(detail::dependent_false<T>,
            "Type is not Sizable: provide deep_size_of_children(), DEEPSIZE_DERIVE, "
            "a size_traits specialisation or DEEPSIZE_KNOWN_SIZE");
        return 0;
    }
}

// Total footprint, counted inside an existing traversal
template <Sizable T>
[[nodiscard]] inline std::size_t deep_size_of(const T& value, Context& ctx) {
    return stack_size<T>() + deep_size_of_children(value, ctx);
}

// Total footprint of value: in-place size plus every heap byte it owns
template <Sizable T>
[[nodiscard]] inline std::size_t deep_size_of(const T& value) {
    Context ctx;
    return deep_size_of(value, ctx);
}

template <Sizable T>
[[nodiscard]] inline std::size_t deep_size_of(const T& value, const Config& cfg) {
    Context ctx{cfg};
    return deep_size_of(value, ctx);
}

// Sizes several roots as one aggregate: an allocation shared between roots
// is counted once
template <Sizable... Ts>
[[nodiscard]] inline std::size_t deep_size_of_all(const Ts&... values) {
    Context ctx;
    std::size_t total = 0;
    ((total += deep_size_of(values, ctx)), ...);
    return total;
}

template <Sizable T>
[[nodiscard]] inline footprint footprint_of(const T& value) {
    Context ctx;
    return footprint{
        .static_bytes = stack_size<T>(),
        .dynamic_bytes = deep_size_of_children(value, ctx)
    };
}


// -----------------------------------------------------------------------------
// Field composition helpers
// -----------------------------------------------------------------------------

// A stand-in for a field that cannot be introspected: contributes exactly
// the declared number of bytes
struct declared {
    std::size_t bytes{0};

    constexpr explicit declared(std::size_t b) noexcept : bytes(b) {}
};

template <>
struct size_traits<declared> {
    static constexpr std::size_t children(const declared& d, Context&) noexcept {
        return d.bytes;
    }
};

// Sum of the children sizes of every field, left to right
template <typename... Fields>
[[nodiscard]] inline std::size_t sum_children(Context& ctx, const Fields&... fields) {
    std::size_t total = 0;
    ((total += deep_size_of_children(fields, ctx)), ...);
    return total;
}

} // namespace deepsize
