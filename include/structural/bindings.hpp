#ifndef STRUCTURAL_BINDINGS_HPP
#define STRUCTURAL_BINDINGS_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <type_traits>

#include <structural/str_utils.hpp>

namespace structural {

// --- Type bindings: declared type text -> C++ type ---

template <FixedString Key, typename T> struct bind {
    static constexpr Name key = Name::of(Key.view());
    using type = T;
};

template <typename... Binds> struct bindings {};

// Type names every declaration can use without binding them.
using prelude = bindings<bind<"String", std::string>,
                         bind<"Int", std::int64_t>,
                         bind<"Int32", std::int32_t>,
                         bind<"Int64", std::int64_t>,
                         bind<"UInt", std::uint64_t>,
                         bind<"Double", double>,
                         bind<"Float", float>,
                         bind<"Bool", bool>,
                         bind<"Character", char>,
                         bind<"Date", std::chrono::year_month_day>>;

template <typename A, typename B> struct concat;
template <typename... As, typename... Bs>
struct concat<bindings<As...>, bindings<Bs...>> {
    using type = bindings<As..., Bs...>;
};

template <typename A, typename B> using concat_t = typename concat<A, B>::type;

template <auto> inline constexpr bool unbound_type_name = false;

// First binding whose key equals N.
template <Name N, typename Bindings> struct resolve;

template <Name N> struct resolve<N, bindings<>> {
    static_assert(unbound_type_name<N>,
                  "declared type name has no binding; add "
                  "structural::bind<\"Name\", T> to the declaration's "
                  "bindings");
};

template <Name N, typename B, typename... Rest>
struct resolve<N, bindings<B, Rest...>>
    : std::conditional_t<B::key == N, std::type_identity<typename B::type>,
                         resolve<N, bindings<Rest...>>> {};

template <Name N, typename Bindings>
using resolve_t = typename resolve<N, Bindings>::type;

} // namespace structural

#endif // STRUCTURAL_BINDINGS_HPP
