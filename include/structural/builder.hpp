#ifndef STRUCTURAL_BUILDER_HPP
#define STRUCTURAL_BUILDER_HPP

#include <cstddef>
#include <type_traits>

#include <structural/bindings.hpp>
#include <structural/canonical.hpp>
#include <structural/declaration.hpp>

// A derivation source S supplies:
//   static constexpr Declaration decl;   checked, error-free
//   using bindings = structural::bindings<...>;

namespace structural {

// --- Right fold over member positions [0, N) ---
//
// Step::apply<I, Acc> prepends position I to the accumulator; position
// N - 1 is folded first so position 0 ends up outermost.

template <typename Step, std::size_t I, typename Acc> struct fold_right {
    using type = typename fold_right<
        Step, I - 1, typename Step::template apply<I - 1, Acc>>::type;
};

template <typename Step, typename Acc> struct fold_right<Step, 0, Acc> {
    using type = Acc;
};

template <typename Step, std::size_t N, typename Seed>
using fold_right_t = typename fold_right<Step, N, Seed>::type;

// --- Products ---

template <typename S, std::size_t I>
using field_type_t = resolve_t<S::decl.members[I].type, typename S::bindings>;

template <typename S> struct field_step {
    template <std::size_t I, typename Acc>
    using apply = List<Property<field_type_t<S, I>>, Acc>;
};

// List<Property<T0>, List<Property<T1>, ... Empty>>
template <typename S>
using fields_t = fold_right_t<field_step<S>, S::decl.member_count, Empty>;

// --- Sums ---

// Labeled parameters are wrapped in Property, unlabeled ones stay bare.
template <typename S, std::size_t M, std::size_t P>
using param_t = std::conditional_t<
    S::decl.members[M].params[P].labeled,
    Property<resolve_t<S::decl.members[M].params[P].type,
                       typename S::bindings>>,
    resolve_t<S::decl.members[M].params[P].type, typename S::bindings>>;

template <typename S, std::size_t M> struct param_step {
    template <std::size_t P, typename Acc>
    using apply = List<param_t<S, M, P>, Acc>;
};

template <typename S, std::size_t M>
using payload_t =
    fold_right_t<param_step<S, M>, S::decl.members[M].param_count, Empty>;

template <typename S> struct case_step {
    template <std::size_t M, typename Acc>
    using apply = Choice<payload_t<S, M>, Acc>;
};

// Choice<Payload0, Choice<Payload1, ... Nothing>>
template <typename S>
using cases_t = fold_right_t<case_step<S>, S::decl.member_count, Nothing>;

// --- Canonical type of a declaration ---

template <typename S, DeclKind = S::decl.kind> struct canonical;

template <typename S> struct canonical<S, DeclKind::Struct> {
    using type = Struct<fields_t<S>>;
};

template <typename S> struct canonical<S, DeclKind::Enum> {
    using type = Enum<cases_t<S>>;
};

template <typename S> using canonical_t = typename canonical<S>::type;

} // namespace structural

#endif // STRUCTURAL_BUILDER_HPP
