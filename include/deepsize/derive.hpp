// ============================================================================
// Derived implementations for product types
// ----------------------------------------------------------------------------
//
// DEEPSIZE_DERIVE(Type, field...) generates the children size of a struct as
// the sum of the children sizes of the listed fields:
//
//   struct Order {
//       std::uint32_t id;
//       std::string   symbol;
//       std::unique_ptr<Fill> fill;
//   };
//   DEEPSIZE_DERIVE(Order, id, symbol, fill)
//
// The macro defines an inline free function found by argument-dependent
// lookup, so it must appear in the namespace that declares Type, after the
// definition of Type. It may name its own type recursively through owning
// pointers (e.g. std::unique_ptr<Node> next).
//
// Every field must be listed. A field whose type is not Sizable is a compile
// error; a field that cannot be introspected is listed through
// DEEPSIZE_FIXED with the bytes it stands for (0 included):
//
//   struct Handle {
//       std::string path;
//       std::FILE*  file;
//   };
//   DEEPSIZE_DERIVE(Handle, path, DEEPSIZE_FIXED(file, BUFSIZ))
//
// For aggregates the number of listed entries is checked against the number
// of fields, so a forgotten field does not compile. Aggregates with C array
// members or base classes count those element by element and should write
// the member function instead:
//
//   std::size_t deep_size_of_children(deepsize::Context& ctx) const {
//       return deepsize::sum_children(ctx, name, deepsize::declared(0));
//   }
//
// Sum types are std::variant (only the active alternative counts) or a
// hand-written member that calls sum_children() on the active payload.
//
// Class templates write the member function; the macro only covers
// non-template types.
// ============================================================================

#pragma once

#include <cstddef>
#include <type_traits>
#include <utility>

#include "deepsize/size_of.hpp"
#include "deepsize/detail/preprocessor.hpp"


namespace deepsize::detail {

// Converts to any field type; only used in unevaluated brace initialisation
struct any_field {
    template <typename T>
    operator T() const&&;
};

template <std::size_t>
using any_field_t = any_field;

template <typename T, typename Indices>
struct brace_initializable;

template <typename T, std::size_t... I>
struct brace_initializable<T, std::index_sequence<I...>>
    : std::bool_constant<requires { T{ any_field_t<I>{}... }; }> {};

// Number of initialisers an aggregate accepts, i.e. its field count
template <typename T, std::size_t N = 0>
[[nodiscard]] consteval std::size_t aggregate_arity() {
    if constexpr (brace_initializable<T, std::make_index_sequence<N + 1>>::value) {
        return aggregate_arity<T, N + 1>();
    } else {
        return N;
    }
}

template <typename T>
[[nodiscard]] consteval bool lists_every_field(std::size_t listed) {
    if constexpr (std::is_aggregate_v<T>) {
        return aggregate_arity<T>() == listed;
    } else {
        return true;
    }
}

} // namespace deepsize::detail


// A field contributing a fixed, caller-declared number of bytes
#define DEEPSIZE_FIXED(field, bytes) (field, bytes)

#define DEEPSIZE_DETAIL_FIELD_0(f) , deepsize_value_.f
#define DEEPSIZE_DETAIL_FIELD_1(fixed) , DEEPSIZE_DETAIL_FIXED_ENTRY fixed
#define DEEPSIZE_DETAIL_FIXED_ENTRY(field, bytes)                              \
    ::deepsize::declared(                                                      \
        (static_cast<void>(sizeof(deepsize_value_.field)), (bytes)))

#define DEEPSIZE_DETAIL_FIELD(entry)                                           \
    DEEPSIZE_DETAIL_CAT(DEEPSIZE_DETAIL_FIELD_, DEEPSIZE_DETAIL_IS_PAREN(entry))(entry)

#define DEEPSIZE_DERIVE(Type, ...)                                             \
    [[maybe_unused]] inline std::size_t deepsize_children(                     \
        const Type& deepsize_value_, ::deepsize::Context& deepsize_ctx_) {     \
        static_assert(::deepsize::detail::lists_every_field<Type>(             \
                          DEEPSIZE_DETAIL_COUNT(__VA_ARGS__)),                 \
            "DEEPSIZE_DERIVE(" #Type ", ...) must list every field; use "      \
            "DEEPSIZE_FIXED(field, bytes) for fields that cannot be sized");   \
        return ::deepsize::sum_children(deepsize_ctx_                          \
            DEEPSIZE_DETAIL_FOR_EACH(DEEPSIZE_DETAIL_FIELD, __VA_ARGS__));     \
    }

// A type without fields, or with fields that own nothing by construction
#define DEEPSIZE_DERIVE_EMPTY(Type)                                            \
    [[maybe_unused]] inline constexpr std::size_t deepsize_children(           \
        const Type&, ::deepsize::Context&) noexcept {                          \
        return 0;                                                              \
    }
