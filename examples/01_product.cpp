// 01_product.cpp — Deriving a struct
//
// Shows: declaration<T>, structure<T>(), to(), from<T>(), static_assert,
//        the canonical value chain, runtime output.

#include <cstdint>
#include <iostream>
#include <string>
#include <structural/structural.hpp>

struct Book {
    std::string title;
    std::int64_t pages;
};

template <> struct structural::declaration<Book> {
    static constexpr std::string_view source = R"(
        struct Book {
            var title: String
            var pages: Int
            var isLong: Bool { pages > 500 }
        }
    )";
};

struct Point {
    std::int64_t x;
    std::int64_t y;
};

template <> struct structural::declaration<Point> {
    static constexpr std::string_view source = R"(
        struct Point {
            var x: Int
            var y: Int
        }
    )";
};

int main() {
    // --- The canonical type is computed from the declaration ---
    using namespace structural;
    static_assert(std::is_same_v<structure_t<Book>,
                                 Struct<List<Property<std::string>,
                                             List<Property<std::int64_t>,
                                                  Empty>>>>);

    // Names are available at compile time
    constexpr auto s = structure<Book>();
    static_assert(s.name == "Book");
    static_assert(s.properties.head.name == "title");

    // Conversions are constexpr
    constexpr Point p{3, 4};
    constexpr auto c = to(p);
    static_assert(c.head == 3 && c.tail.head == 4);
    static_assert(from<Point>(c).y == 4);

    // --- Use at runtime ---
    Book dune{"Dune", 412};
    auto v = to(dune);
    std::cout << s.properties.head.name << " = " << v.head << "\n";
    std::cout << s.properties.tail.head.name << " = " << v.tail.head << "\n";

    v.tail.head += 100;
    Book longer = from<Book>(v);
    std::cout << to_string(longer) << "\n";
}
