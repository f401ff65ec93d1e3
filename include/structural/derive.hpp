#ifndef STRUCTURAL_DERIVE_HPP
#define STRUCTURAL_DERIVE_HPP

#include <concepts>
#include <functional>
#include <string_view>
#include <utility>

#include <structural/bindings.hpp>
#include <structural/builder.hpp>
#include <structural/declaration.hpp>
#include <structural/extract.hpp>
#include <structural/isomorphism.hpp>
#include <structural/metadata.hpp>

namespace structural {

// --- Customisation point ---
//
//   template <> struct structural::declaration<Book> {
//       static constexpr std::string_view source = R"(
//           struct Book {
//               var title: String
//               var author: Person
//           }
//       )";
//       using bindings = structural::bindings<structural::bind<"Person", Person>>;
//   };

template <typename T> struct declaration {};

template <typename T>
concept Structural = requires {
    { declaration<T>::source } -> std::convertible_to<std::string_view>;
};

// User bindings first, so they shadow the prelude.
template <typename D> struct declared_bindings {
    using type = prelude;
};

template <typename D>
    requires requires { typename D::bindings; }
struct declared_bindings<D> {
    using type = concat_t<typename D::bindings, prelude>;
};

template <Structural T> struct Source {
    static constexpr Declaration decl =
        checked(extract(declaration<T>::source));
    using bindings = typename declared_bindings<declaration<T>>::type;
};

// --- Derivation: canonical type, metadata, isomorphism ---

template <typename T, DeclKind = Source<T>::decl.kind> struct Derivation;

template <typename T>
struct Derivation<T, DeclKind::Struct> : ProductIsomorphism<Source<T>, T> {
    using Structure = canonical_t<Source<T>>;
    static constexpr bool is_product = true;

    static constexpr Structure structure() {
        return product_metadata<Source<T>>();
    }
};

template <typename T>
struct Derivation<T, DeclKind::Enum> : SumIsomorphism<Source<T>, T> {
    using Structure = canonical_t<Source<T>>;
    static constexpr bool is_product = false;

    static constexpr Structure structure() { return sum_metadata<Source<T>>(); }
};

template <Structural T>
using structure_t = typename Derivation<T>::Structure;

template <Structural T>
using value_type_t = typename Derivation<T>::Value;

template <Structural T>
inline constexpr bool is_product_v = Derivation<T>::is_product;

template <Structural T> constexpr structure_t<T> structure() {
    return Derivation<T>::structure();
}

template <Structural T> constexpr value_type_t<T> to(const T& v) {
    return Derivation<T>::to(v);
}

template <Structural T> constexpr T from(const value_type_t<T>& c) {
    return Derivation<T>::from(c);
}

// Round trip through the canonical value: f edits the chain in place.
template <Structural T, typename F> constexpr void modify(T& v, F&& f) {
    value_type_t<T> c = Derivation<T>::to(v);
    std::invoke(std::forward<F>(f), c);
    v = Derivation<T>::from(c);
}

} // namespace structural

#endif // STRUCTURAL_DERIVE_HPP
