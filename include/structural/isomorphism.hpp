#ifndef STRUCTURAL_ISOMORPHISM_HPP
#define STRUCTURAL_ISOMORPHISM_HPP

#include <cstddef>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

#include <structural/builder.hpp>
#include <structural/canonical.hpp>
#include <structural/fields.hpp>

namespace structural {

// --- Products: aggregate <-> List chain ---

template <typename S, typename T> struct ProductIsomorphism {
    using Value = typename canonical_t<S>::Value;
    static constexpr std::size_t field_count = S::decl.member_count;

    static_assert(std::is_aggregate_v<T>,
                  "a derived struct must be an aggregate");
    static_assert(field_count > 0 || std::is_empty_v<T>,
                  "the declaration has no stored properties but the type has "
                  "data members");
    static_assert(chain_matches<field_refs_t<field_count, T>, Value>::value,
                  "the type's data members must match the declared stored "
                  "properties in order and type");

    static constexpr Value to(const T& v) {
        return [&]<std::size_t... I>(std::index_sequence<I...>) {
            [[maybe_unused]] auto refs = tie_fields<field_count>(v);
            return make_chain<Value>(std::get<I>(refs)...);
        }(std::make_index_sequence<field_count>{});
    }

    static constexpr T from(const Value& c) {
        return [&]<std::size_t... I>(std::index_sequence<I...>) {
            return T{chain_get<I>(c)...};
        }(std::make_index_sequence<field_count>{});
    }
};

// --- Sums: std::variant <-> Choice chain ---

template <typename... A>
constexpr const std::variant<A...>& as_variant(const std::variant<A...>& v) {
    return v;
}

// The std::variant a sum type is, or derives from.
template <typename T>
using variant_t =
    std::remove_cvref_t<decltype(as_variant(std::declval<const T&>()))>;

// A single-parameter case whose alternative is the parameter type itself.
template <typename S, std::size_t M, typename Alt,
          bool Single = (S::decl.members[M].param_count == 1)>
struct holds_directly : std::false_type {};

template <typename S, std::size_t M, typename Alt>
struct holds_directly<S, M, Alt, true>
    : std::is_same<Alt, value_t<typename payload_t<S, M>::head_type>> {};

template <typename S, std::size_t M, typename Alt>
constexpr bool alternative_matches() {
    if constexpr (holds_directly<S, M, Alt>::value)
        return true;
    else if constexpr (S::decl.members[M].param_count == 0)
        return std::is_empty_v<Alt>;
    else if constexpr (!std::is_aggregate_v<Alt>)
        return false;
    else
        return chain_matches<
            field_refs_t<S::decl.members[M].param_count, Alt>,
            value_t<payload_t<S, M>>>::value;
}

template <typename S, typename V> constexpr bool alternatives_match() {
    if constexpr (std::variant_size_v<V> != S::decl.member_count)
        return false;
    else
        return []<std::size_t... M>(std::index_sequence<M...>) {
            return (alternative_matches<S, M, std::variant_alternative_t<M, V>>() &&
                    ...);
        }(std::make_index_sequence<S::decl.member_count>{});
}

template <typename S, typename T,
          bool Empty = (S::decl.member_count == 0)>
struct SumIsomorphism;

// No cases: T has no values, and neither does Nothing.
template <typename S, typename T> struct SumIsomorphism<S, T, true> {
    using Value = Nothing;

    static_assert(!std::is_default_constructible_v<T>,
                  "an enum without cases must bind to an uninhabited type");

    [[noreturn]] static constexpr Value to(const T&) { std::unreachable(); }

    static constexpr T from(const Value& c) { return c.template absurd<T>(); }
};

template <typename S, typename T> struct SumIsomorphism<S, T, false> {
    using Value = typename canonical_t<S>::Value;
    using Variant = variant_t<T>;
    static constexpr std::size_t case_count = S::decl.member_count;

    static_assert(std::variant_size_v<Variant> == case_count,
                  "a derived enum needs one variant alternative per case");
    static_assert(alternatives_match<S, Variant>(),
                  "each variant alternative must be an aggregate of the "
                  "case's parameters, the single parameter's type, or an "
                  "empty type for a case without parameters");

    template <std::size_t M>
    using alternative_t = std::variant_alternative_t<M, Variant>;

    template <std::size_t M>
    static constexpr bool direct = holds_directly<S, M, alternative_t<M>>::value;

    // Labeled parameters travel as Property{label, value}.
    template <std::size_t M, std::size_t P, typename V>
    static constexpr auto wrap(const V& v) {
        if constexpr (S::decl.members[M].params[P].labeled)
            return Property<V>{S::decl.members[M].params[P].label.view(), v};
        else
            return v;
    }

    template <std::size_t M, std::size_t P, typename X>
    static constexpr const auto& unwrap(const X& x) {
        if constexpr (S::decl.members[M].params[P].labeled)
            return x.value;
        else
            return x;
    }

    template <std::size_t M>
    static constexpr payload_t<S, M> payload(const alternative_t<M>& a) {
        if constexpr (direct<M>) {
            return make_chain<payload_t<S, M>>(wrap<M, 0>(a));
        } else {
            return [&]<std::size_t... P>(std::index_sequence<P...>) {
                [[maybe_unused]] auto refs =
                    tie_fields<sizeof...(P)>(a);
                return make_chain<payload_t<S, M>>(
                    wrap<M, P>(std::get<P>(refs))...);
            }(std::make_index_sequence<S::decl.members[M].param_count>{});
        }
    }

    template <std::size_t M>
    static constexpr alternative_t<M> alternative(const payload_t<S, M>& p) {
        if constexpr (direct<M>) {
            return unwrap<M, 0>(chain_get<0>(p));
        } else {
            return [&]<std::size_t... P>(std::index_sequence<P...>) {
                return alternative_t<M>{unwrap<M, P>(chain_get<P>(p))...};
            }(std::make_index_sequence<S::decl.members[M].param_count>{});
        }
    }

    // Case M sits under M `second` layers.
    template <std::size_t M>
    static constexpr choice_suffix_t<M, Value> to_cases(const Variant& v) {
        using Layer = choice_suffix_t<M, Value>;
        if constexpr (M + 1 == case_count) {
            return Layer::first(payload<M>(std::get<M>(v)));
        } else {
            if (v.index() == M)
                return Layer::first(payload<M>(std::get<M>(v)));
            return Layer::second(to_cases<M + 1>(v));
        }
    }

    template <std::size_t M>
    static constexpr T from_cases(const choice_suffix_t<M, Value>& c) {
        if constexpr (M == case_count) {
            return c.template absurd<T>();
        } else {
            if (c.is_first())
                return T(std::in_place_index<M>, alternative<M>(c.left()));
            return from_cases<M + 1>(c.right());
        }
    }

    static constexpr Value to(const T& v) {
        return to_cases<0>(as_variant(v));
    }

    static constexpr T from(const Value& c) { return from_cases<0>(c); }
};

} // namespace structural

#endif // STRUCTURAL_ISOMORPHISM_HPP
