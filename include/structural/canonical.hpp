#ifndef STRUCTURAL_CANONICAL_HPP
#define STRUCTURAL_CANONICAL_HPP

#include <cstddef>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace structural {

// --- Product chain ---

// End of a product chain; also the payload of a case without parameters.
struct Empty {
    constexpr bool operator==(const Empty&) const = default;
};

template <typename Head, typename Tail> struct List {
    using head_type = Head;
    using tail_type = Tail;

    Head head;
    Tail tail;

    // Implicitly constexpr when eligible; an explicit constexpr makes g++-12
    // instantiate std::variant members' operator== eagerly.
    bool operator==(const List&) const = default;
};

// A labeled leaf value.
template <typename Value> struct Property {
    using value_type = Value;

    std::string_view name;
    Value value;

    constexpr bool operator==(const Property&) const = default;
};

// --- Sum chain ---

// No alternatives left. Has no values, so a Nothing reference can only
// come from an impossible branch.
struct Nothing {
    Nothing() = delete;

    template <typename R> [[noreturn]] constexpr R absurd() const {
        std::unreachable();
    }

    constexpr bool operator==(const Nothing&) const = default;
};

// first: this alternative, second: one of the remaining ones.
template <typename Left, typename Right> struct Choice {
    using first_type = Left;
    using second_type = Right;

    std::variant<Left, Right> alternative;

    static constexpr Choice first(Left l) {
        return Choice{std::variant<Left, Right>(std::in_place_index<0>,
                                                std::move(l))};
    }

    static constexpr Choice second(Right r) {
        return Choice{std::variant<Left, Right>(std::in_place_index<1>,
                                                std::move(r))};
    }

    constexpr bool is_first() const { return alternative.index() == 0; }

    constexpr const Left& left() const { return std::get<0>(alternative); }
    constexpr Left& left() { return std::get<0>(alternative); }
    constexpr const Right& right() const { return std::get<1>(alternative); }
    constexpr Right& right() { return std::get<1>(alternative); }

    constexpr bool operator==(const Choice&) const = default;
};

// --- Metadata vocabulary ---

// Name of a labeled field or parameter.
struct Label {
    std::string_view name;
    constexpr bool operator==(const Label&) const = default;
};

// Placeholder for an unlabeled case parameter.
struct Unlabeled {
    constexpr bool operator==(const Unlabeled&) const = default;
};

template <typename Payload, typename Rest> struct Alternative {
    std::string_view name;
    Payload payload;
    Rest rest;

    constexpr bool operator==(const Alternative&) const = default;
};

// --- Shape traits ---

// Value chain of a product: Property<V> contributes its bare V.
template <typename Shape> struct value_of {
    using type = Shape;
};
template <typename V> struct value_of<Property<V>> {
    using type = V;
};
template <typename H, typename T> struct value_of<List<H, T>> {
    using type = List<typename value_of<H>::type, typename value_of<T>::type>;
};

template <typename Shape> using value_t = typename value_of<Shape>::type;

// Metadata with the same nesting as the shape.
template <typename Shape> struct metadata_of {
    using type = Unlabeled;
};
template <> struct metadata_of<Empty> {
    using type = Empty;
};
template <> struct metadata_of<Nothing> {
    using type = Empty;
};
template <typename V> struct metadata_of<Property<V>> {
    using type = Label;
};
template <typename H, typename T> struct metadata_of<List<H, T>> {
    using type =
        List<typename metadata_of<H>::type, typename metadata_of<T>::type>;
};
template <typename L, typename R> struct metadata_of<Choice<L, R>> {
    using type = Alternative<typename metadata_of<L>::type,
                             typename metadata_of<R>::type>;
};

template <typename Shape> using metadata_t = typename metadata_of<Shape>::type;

// --- Wrappers ---

// Canonical type of a product. An instance is the product's metadata; the
// values themselves are Value chains.
template <typename Properties> struct Struct {
    using properties_type = Properties;
    using Value = value_t<Properties>;
    using Metadata = metadata_t<Properties>;

    std::string_view name;
    Metadata properties;

    constexpr bool operator==(const Struct&) const = default;
};

// Canonical type of a sum. The values are the Choice chain itself.
template <typename Cases> struct Enum {
    using cases_type = Cases;
    using Value = Cases;
    using Metadata = metadata_t<Cases>;

    std::string_view name;
    Metadata cases;

    constexpr bool operator==(const Enum&) const = default;
};

// --- Chain access ---

template <typename Chain> struct chain_size;
template <> struct chain_size<Empty> : std::integral_constant<std::size_t, 0> {};
template <typename H, typename T>
struct chain_size<List<H, T>>
    : std::integral_constant<std::size_t, 1 + chain_size<T>::value> {};

template <typename Chain>
inline constexpr std::size_t chain_size_v = chain_size<Chain>::value;

// Element I of a product chain: I tails down, then the head.
template <std::size_t I, typename Chain> constexpr auto& chain_get(Chain& chain) {
    if constexpr (I == 0)
        return chain.head;
    else
        return chain_get<I - 1>(chain.tail);
}

template <typename Chain> constexpr Chain make_chain() {
    static_assert(std::is_same_v<Chain, Empty>,
                  "fewer elements than the chain has positions");
    return Chain{};
}

template <typename Chain, typename First, typename... Rest>
constexpr Chain make_chain(First&& first, Rest&&... rest) {
    return Chain{std::forward<First>(first),
                 make_chain<typename Chain::tail_type>(
                     std::forward<Rest>(rest)...)};
}

// Choice chain starting at alternative M.
template <std::size_t M, typename Chain> struct choice_suffix {
    using type =
        typename choice_suffix<M - 1, typename Chain::second_type>::type;
};
template <typename Chain> struct choice_suffix<0, Chain> {
    using type = Chain;
};

template <std::size_t M, typename Chain>
using choice_suffix_t = typename choice_suffix<M, Chain>::type;

} // namespace structural

#endif // STRUCTURAL_CANONICAL_HPP
