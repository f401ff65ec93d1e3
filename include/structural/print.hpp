#ifndef STRUCTURAL_PRINT_HPP
#define STRUCTURAL_PRINT_HPP

#include <chrono>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>

#include <structural/canonical.hpp>
#include <structural/derive.hpp>

namespace structural {

template <Structural T> void print(std::ostream& os, const T& v);

namespace detail {

inline void print_label(std::ostream& os, const Label& l) {
    os << l.name << ": ";
}

inline void print_label(std::ostream&, const Unlabeled&) {}

inline void print_date(std::ostream& os, const std::chrono::year_month_day& d) {
    char fill = os.fill('0');
    os << static_cast<int>(d.year()) << '-' << std::setw(2)
       << static_cast<unsigned>(d.month()) << '-' << std::setw(2)
       << static_cast<unsigned>(d.day());
    os.fill(fill);
}

template <typename V> void print_leaf(std::ostream& os, const V& v) {
    if constexpr (Structural<V>)
        structural::print(os, v);
    else if constexpr (std::is_convertible_v<const V&, std::string_view>)
        os << std::quoted(std::string_view(v));
    else if constexpr (std::is_same_v<V, bool>)
        os << (v ? "true" : "false");
    else if constexpr (std::is_same_v<V, char>)
        os << '\'' << v << '\'';
    else if constexpr (std::is_same_v<V, std::chrono::year_month_day>)
        print_date(os, v);
    else
        os << v;
}

} // namespace detail

// --- Printing: value and metadata walked in lockstep ---

// Leaf, labeled by its field or parameter metadata.
template <typename V> struct Print {
    template <typename Meta>
    static void apply(std::ostream& os, const V& v, const Meta& m) {
        detail::print_label(os, m);
        detail::print_leaf(os, v);
    }
};

template <> struct Print<Empty> {
    static void apply(std::ostream&, const Empty&, const Empty&) {}
};

template <typename H, typename T> struct Print<List<H, T>> {
    template <typename Meta>
    static void apply(std::ostream& os, const List<H, T>& v, const Meta& m) {
        Print<H>::apply(os, v.head, m.head);
        if constexpr (!std::is_same_v<T, Empty>) {
            os << ", ";
            Print<T>::apply(os, v.tail, m.tail);
        }
    }
};

template <typename V> struct Print<Property<V>> {
    static void apply(std::ostream& os, const Property<V>& p, const Label& m) {
        detail::print_label(os, m);
        Print<V>::apply(os, p.value, Unlabeled{});
    }
};

// .case or .case(payload) for the active alternative.
template <typename L, typename R> struct Print<Choice<L, R>> {
    template <typename Meta>
    static void apply(std::ostream& os, const Choice<L, R>& c, const Meta& m) {
        if (!c.is_first()) {
            Print<R>::apply(os, c.right(), m.rest);
            return;
        }
        os << '.' << m.name;
        if constexpr (!std::is_same_v<L, Empty>) {
            os << '(';
            Print<L>::apply(os, c.left(), m.payload);
            os << ')';
        }
    }
};

template <> struct Print<Nothing> {
    static void apply(std::ostream&, const Nothing& n, const Empty&) {
        n.absurd<void>();
    }
};

// Book { title: "Dune", pages: 412 }, Format.hardcover(pages: 300)
template <Structural T> void print(std::ostream& os, const T& v) {
    constexpr structure_t<T> s = structural::structure<T>();
    using Value = value_type_t<T>;
    os << s.name;
    if constexpr (is_product_v<T>) {
        if constexpr (chain_size_v<Value> == 0) {
            os << " {}";
        } else {
            os << " { ";
            Print<Value>::apply(os, structural::to(v), s.properties);
            os << " }";
        }
    } else {
        Print<Value>::apply(os, structural::to(v), s.cases);
    }
}

template <Structural T> std::string to_string(const T& v) {
    std::ostringstream os;
    structural::print(os, v);
    return os.str();
}

} // namespace structural

#endif // STRUCTURAL_PRINT_HPP
