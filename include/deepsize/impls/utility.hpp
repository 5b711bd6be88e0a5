#pragma once

#include <cstddef>
#include <optional>
#include <tuple>
#include <utility>
#include <variant>

#include "deepsize/size_of.hpp"


namespace deepsize {

// The contained value is laid out inline; only what it owns counts
template <Sizable T>
struct size_traits<std::optional<T>> {
    static std::size_t children(const std::optional<T>& o, Context& ctx) {
        return o.has_value() ? deep_size_of_children(*o, ctx) : 0;
    }
};

template <>
struct size_traits<std::monostate> {
    static constexpr std::size_t children(const std::monostate&, Context&) noexcept { return 0; }
};

template <>
struct size_traits<std::nullopt_t> {
    static constexpr std::size_t children(const std::nullopt_t&, Context&) noexcept { return 0; }
};

// Sum type: only the active alternative contributes, the index never does
template <Sizable... Ts>
struct size_traits<std::variant<Ts...>> {
    static std::size_t children(const std::variant<Ts...>& v, Context& ctx) {
        if (v.valueless_by_exception()) return 0;
        return std::visit([&ctx](const auto& alt) -> std::size_t {
            return deep_size_of_children(alt, ctx);
        }, v);
    }
};

template <Sizable A, Sizable B>
struct size_traits<std::pair<A, B>> {
    static std::size_t children(const std::pair<A, B>& p, Context& ctx) {
        return sum_children(ctx, p.first, p.second);
    }
};

template <Sizable... Ts>
struct size_traits<std::tuple<Ts...>> {
    static std::size_t children(const std::tuple<Ts...>& t, Context& ctx) {
        return std::apply([&ctx](const auto&... fields) {
            return sum_children(ctx, fields...);
        }, t);
    }
};

} // namespace deepsize
