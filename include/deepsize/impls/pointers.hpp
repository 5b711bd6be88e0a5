#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <type_traits>

#include "deepsize/size_of.hpp"


namespace deepsize {

namespace detail {

// Pointee bytes of an allocation that may be reachable from several owners.
// The allocation is counted by whichever owner reaches it first.
template <typename T>
[[nodiscard]] inline std::size_t shared_pointee(const T* p, Context& ctx) {
    if (p == nullptr) return 0;
    Context::descent guard{ctx};
    if (!guard) return 0;
    if (!ctx.try_mark(p)) return 0;
    return stack_size<T>() + deep_size_of_children(*p, ctx);
}

// Raw character pointers are usually C strings, not single characters
template <typename T>
concept character =
    std::is_same_v<std::remove_cv_t<T>, char> ||
    std::is_same_v<std::remove_cv_t<T>, signed char> ||
    std::is_same_v<std::remove_cv_t<T>, unsigned char> ||
    std::is_same_v<std::remove_cv_t<T>, wchar_t> ||
    std::is_same_v<std::remove_cv_t<T>, char8_t> ||
    std::is_same_v<std::remove_cv_t<T>, char16_t> ||
    std::is_same_v<std::remove_cv_t<T>, char32_t>;

} // namespace detail


// -----------------------------------------------------------------------------
// std::unique_ptr<T>: exclusive ownership, never shared, no marking needed
// -----------------------------------------------------------------------------
template <Sizable T, typename D>
struct size_traits<std::unique_ptr<T, D>> {
    static std::size_t children(const std::unique_ptr<T, D>& p, Context& ctx) {
        if (!p) return 0;
        Context::descent guard{ctx};
        if (!guard) return 0;
        return stack_size<T>() + deep_size_of_children(*p, ctx);
    }
};

// -----------------------------------------------------------------------------
// std::shared_ptr<T>: counted once per traversal, whichever owner comes first.
// The control block is not counted. A polymorphic object owned through both a
// base and a derived pointer is one allocation, charged at the static type
// of the owner reached first.
// -----------------------------------------------------------------------------
template <Sizable T>
struct size_traits<std::shared_ptr<T>> {
    static std::size_t children(const std::shared_ptr<T>& p, Context& ctx) {
        return detail::shared_pointee<std::remove_cv_t<T>>(p.get(), ctx);
    }
};

// A weak reference owns nothing
template <typename T>
struct size_traits<std::weak_ptr<T>> {
    static constexpr std::size_t children(const std::weak_ptr<T>&, Context&) noexcept { return 0; }
};

// -----------------------------------------------------------------------------
// Borrowed references: raw object pointers and std::reference_wrapper.
// The referent is counted once per traversal, like a shared allocation.
// Pointers to characters are excluded: give them an explicit size.
// -----------------------------------------------------------------------------
template <typename T>
    requires (!std::is_function_v<T> && !std::is_void_v<T> && !detail::character<T> && Sizable<T>)
struct size_traits<T*> {
    static std::size_t children(T* const& p, Context& ctx) {
        return detail::shared_pointee<std::remove_cv_t<T>>(p, ctx);
    }
};

template <Sizable T>
struct size_traits<std::reference_wrapper<T>> {
    static std::size_t children(const std::reference_wrapper<T>& r, Context& ctx) {
        return detail::shared_pointee<std::remove_cv_t<T>>(&r.get(), ctx);
    }
};

} // namespace deepsize
