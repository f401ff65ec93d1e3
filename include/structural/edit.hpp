#ifndef STRUCTURAL_EDIT_HPP
#define STRUCTURAL_EDIT_HPP

#include <string_view>
#include <type_traits>

#include <structural/canonical.hpp>
#include <structural/derive.hpp>

namespace structural {

template <Structural T, typename Editor> void edit(T& v, Editor& editor);

template <typename V> inline constexpr bool no_editor_for = false;

namespace detail {

inline constexpr std::string_view title_of(const Label& l) { return l.name; }
inline constexpr std::string_view title_of(const Unlabeled&) { return {}; }

} // namespace detail

// --- Editing: every leaf of the canonical value goes to the editor ---
//
// The editor is called as editor(title, leaf&). Unlabeled case parameters
// get an empty title.

template <typename V> struct Edit {
    template <typename Meta, typename Editor>
    static void apply(V& v, const Meta& m, Editor& editor) {
        if constexpr (std::is_invocable_v<Editor&, std::string_view, V&>)
            editor(detail::title_of(m), v);
        else if constexpr (Structural<V>)
            structural::edit(v, editor);
        else
            static_assert(no_editor_for<V>,
                          "the editor accepts neither this leaf type nor a "
                          "derived type containing it");
    }
};

template <> struct Edit<Empty> {
    template <typename Editor>
    static void apply(Empty&, const Empty&, Editor&) {}
};

template <typename H, typename T> struct Edit<List<H, T>> {
    template <typename Meta, typename Editor>
    static void apply(List<H, T>& v, const Meta& m, Editor& editor) {
        Edit<H>::apply(v.head, m.head, editor);
        Edit<T>::apply(v.tail, m.tail, editor);
    }
};

template <typename V> struct Edit<Property<V>> {
    template <typename Editor>
    static void apply(Property<V>& p, const Label& m, Editor& editor) {
        Edit<V>::apply(p.value, m, editor);
    }
};

// Only the active case is presented.
template <typename L, typename R> struct Edit<Choice<L, R>> {
    template <typename Meta, typename Editor>
    static void apply(Choice<L, R>& c, const Meta& m, Editor& editor) {
        if (c.is_first())
            Edit<L>::apply(c.left(), m.payload, editor);
        else
            Edit<R>::apply(c.right(), m.rest, editor);
    }
};

template <> struct Edit<Nothing> {
    template <typename Editor>
    static void apply(Nothing& n, const Empty&, Editor&) {
        n.absurd<void>();
    }
};

template <Structural T, typename Editor> void edit(T& v, Editor& editor) {
    constexpr structure_t<T> s = structural::structure<T>();
    structural::modify(v, [&](value_type_t<T>& c) {
        if constexpr (is_product_v<T>)
            Edit<value_type_t<T>>::apply(c, s.properties, editor);
        else
            Edit<value_type_t<T>>::apply(c, s.cases, editor);
    });
}

// Accepts temporaries, e.g. a lambda written at the call site.
template <Structural T, typename Editor> void edit(T& v, Editor&& editor) {
    structural::edit(v, editor);
}

} // namespace structural

#endif // STRUCTURAL_EDIT_HPP
