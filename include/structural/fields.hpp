#ifndef STRUCTURAL_FIELDS_HPP
#define STRUCTURAL_FIELDS_HPP

#include <cstddef>
#include <tuple>
#include <type_traits>
#include <utility>

#include <structural/canonical.hpp>
#include <structural/declaration.hpp>

namespace structural {

// --- Positional access to the members of an aggregate ---
//
// N must equal the aggregate's member count; a mismatch fails to
// decompose.

template <std::size_t N, typename T> constexpr auto tie_fields(T& v) {
    static_assert(N <= MaxMembers, "aggregate has more members than supported");
    if constexpr (N == 0) {
        return std::tuple<>{};
    } else if constexpr (N == 1) {
        auto& [f0] = v;
        return std::tie(f0);
    } else if constexpr (N == 2) {
        auto& [f0, f1] = v;
        return std::tie(f0, f1);
    } else if constexpr (N == 3) {
        auto& [f0, f1, f2] = v;
        return std::tie(f0, f1, f2);
    } else if constexpr (N == 4) {
        auto& [f0, f1, f2, f3] = v;
        return std::tie(f0, f1, f2, f3);
    } else if constexpr (N == 5) {
        auto& [f0, f1, f2, f3, f4] = v;
        return std::tie(f0, f1, f2, f3, f4);
    } else if constexpr (N == 6) {
        auto& [f0, f1, f2, f3, f4, f5] = v;
        return std::tie(f0, f1, f2, f3, f4, f5);
    } else if constexpr (N == 7) {
        auto& [f0, f1, f2, f3, f4, f5, f6] = v;
        return std::tie(f0, f1, f2, f3, f4, f5, f6);
    } else if constexpr (N == 8) {
        auto& [f0, f1, f2, f3, f4, f5, f6, f7] = v;
        return std::tie(f0, f1, f2, f3, f4, f5, f6, f7);
    } else if constexpr (N == 9) {
        auto& [f0, f1, f2, f3, f4, f5, f6, f7, f8] = v;
        return std::tie(f0, f1, f2, f3, f4, f5, f6, f7, f8);
    } else if constexpr (N == 10) {
        auto& [f0, f1, f2, f3, f4, f5, f6, f7, f8, f9] = v;
        return std::tie(f0, f1, f2, f3, f4, f5, f6, f7, f8, f9);
    } else if constexpr (N == 11) {
        auto& [f0, f1, f2, f3, f4, f5, f6, f7, f8, f9, f10] = v;
        return std::tie(f0, f1, f2, f3, f4, f5, f6, f7, f8, f9, f10);
    } else if constexpr (N == 12) {
        auto& [f0, f1, f2, f3, f4, f5, f6, f7, f8, f9, f10, f11] = v;
        return std::tie(f0, f1, f2, f3, f4, f5, f6, f7, f8, f9, f10, f11);
    } else if constexpr (N == 13) {
        auto& [f0, f1, f2, f3, f4, f5, f6, f7, f8, f9, f10, f11, f12] = v;
        return std::tie(f0, f1, f2, f3, f4, f5, f6, f7, f8, f9, f10, f11, f12);
    } else if constexpr (N == 14) {
        auto& [f0, f1, f2, f3, f4, f5, f6, f7, f8, f9, f10, f11, f12, f13] = v;
        return std::tie(f0, f1, f2, f3, f4, f5, f6, f7, f8, f9, f10, f11, f12,
                        f13);
    } else if constexpr (N == 15) {
        auto& [f0, f1, f2, f3, f4, f5, f6, f7, f8, f9, f10, f11, f12, f13,
               f14] = v;
        return std::tie(f0, f1, f2, f3, f4, f5, f6, f7, f8, f9, f10, f11, f12,
                        f13, f14);
    } else if constexpr (N == 16) {
        auto& [f0, f1, f2, f3, f4, f5, f6, f7, f8, f9, f10, f11, f12, f13, f14,
               f15] = v;
        return std::tie(f0, f1, f2, f3, f4, f5, f6, f7, f8, f9, f10, f11, f12,
                        f13, f14, f15);
    }
}

template <std::size_t N, typename T>
using field_refs_t = decltype(tie_fields<N>(std::declval<T&>()));

// Whether a tuple of member references has exactly the element types of a
// value chain.
template <typename Refs, typename Chain>
struct chain_matches : std::false_type {};

template <> struct chain_matches<std::tuple<>, Empty> : std::true_type {};

template <typename F, typename... Fs, typename H, typename T>
struct chain_matches<std::tuple<F&, Fs...>, List<H, T>>
    : std::bool_constant<std::is_same_v<std::remove_const_t<F>, H> &&
                         chain_matches<std::tuple<Fs...>, T>::value> {};

} // namespace structural

#endif // STRUCTURAL_FIELDS_HPP
