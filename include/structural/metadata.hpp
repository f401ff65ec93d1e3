#ifndef STRUCTURAL_METADATA_HPP
#define STRUCTURAL_METADATA_HPP

#include <cstddef>
#include <utility>

#include <structural/builder.hpp>
#include <structural/canonical.hpp>

namespace structural {

// Names point into the static Declaration of S, so every metadata value
// is a constant expression.

// --- Products ---

template <typename S> constexpr canonical_t<S> product_metadata() {
    using Shape = canonical_t<S>;
    return [&]<std::size_t... I>(std::index_sequence<I...>) {
        return Shape{S::decl.name.view(),
                     make_chain<typename Shape::Metadata>(
                         Label{S::decl.members[I].name.view()}...)};
    }(std::make_index_sequence<S::decl.member_count>{});
}

// --- Sums ---

template <typename S, std::size_t M, std::size_t P>
constexpr auto param_metadata() {
    if constexpr (S::decl.members[M].params[P].labeled)
        return Label{S::decl.members[M].params[P].label.view()};
    else
        return Unlabeled{};
}

template <typename S, std::size_t M>
constexpr metadata_t<payload_t<S, M>> payload_metadata() {
    return [&]<std::size_t... P>(std::index_sequence<P...>) {
        return make_chain<metadata_t<payload_t<S, M>>>(
            param_metadata<S, M, P>()...);
    }(std::make_index_sequence<S::decl.members[M].param_count>{});
}

// Alternative chain from case M on; Empty past the last case.
template <typename S, std::size_t M = 0> constexpr auto case_metadata() {
    if constexpr (M == S::decl.member_count) {
        return Empty{};
    } else {
        using Meta = metadata_t<choice_suffix_t<M, cases_t<S>>>;
        return Meta{S::decl.members[M].name.view(), payload_metadata<S, M>(),
                    case_metadata<S, M + 1>()};
    }
}

template <typename S> constexpr canonical_t<S> sum_metadata() {
    return canonical_t<S>{S::decl.name.view(), case_metadata<S>()};
}

} // namespace structural

#endif // STRUCTURAL_METADATA_HPP
