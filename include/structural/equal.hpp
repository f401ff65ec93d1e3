#ifndef STRUCTURAL_EQUAL_HPP
#define STRUCTURAL_EQUAL_HPP

#include <structural/canonical.hpp>
#include <structural/derive.hpp>

namespace structural {

template <Structural T> constexpr bool equal(const T& a, const T& b);

// --- Structural equality, one specialisation per container shape ---

// Leaf: a derived type compares structurally, anything else with ==.
template <typename V> struct Equal {
    static constexpr bool apply(const V& a, const V& b) {
        if constexpr (Structural<V>)
            return structural::equal(a, b);
        else
            return a == b;
    }
};

template <> struct Equal<Empty> {
    static constexpr bool apply(const Empty&, const Empty&) { return true; }
};

template <typename H, typename T> struct Equal<List<H, T>> {
    static constexpr bool apply(const List<H, T>& a, const List<H, T>& b) {
        return Equal<H>::apply(a.head, b.head) &&
               Equal<T>::apply(a.tail, b.tail);
    }
};

// Labels come from the declaration, so only the values can differ.
template <typename V> struct Equal<Property<V>> {
    static constexpr bool apply(const Property<V>& a, const Property<V>& b) {
        return Equal<V>::apply(a.value, b.value);
    }
};

template <typename L, typename R> struct Equal<Choice<L, R>> {
    static constexpr bool apply(const Choice<L, R>& a, const Choice<L, R>& b) {
        if (a.is_first() != b.is_first())
            return false;
        if (a.is_first())
            return Equal<L>::apply(a.left(), b.left());
        return Equal<R>::apply(a.right(), b.right());
    }
};

template <> struct Equal<Nothing> {
    static constexpr bool apply(const Nothing& a, const Nothing&) {
        return a.absurd<bool>();
    }
};

template <Structural T> constexpr bool equal(const T& a, const T& b) {
    return Equal<value_type_t<T>>::apply(structural::to(a), structural::to(b));
}

} // namespace structural

#endif // STRUCTURAL_EQUAL_HPP
