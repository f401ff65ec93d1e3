// 03_form_editor.cpp — A console "form" built from the canonical shape
//
// Shows: edit() with an overloaded editor, nested derived types,
//        bindings<>, Date fields, only the active enum case being edited.

#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <structural/structural.hpp>
#include <variant>

struct Person {
    std::string name;
    std::chrono::year_month_day born;
};

template <> struct structural::declaration<Person> {
    static constexpr std::string_view source = R"(
        struct Person {
            var name: String
            var born: Date
        }
    )";
};

struct Paperback {
    std::int64_t pages;
};
struct Ebook {
    std::string format;
    bool drm;
};

using Edition = std::variant<Paperback, Ebook>;

template <> struct structural::declaration<Edition> {
    static constexpr std::string_view source = R"(
        enum Edition {
            case paperback(pages: Int)
            case ebook(format: String, drm: Bool)
        }
    )";
};

struct Book {
    std::string title;
    Person author;
    Edition edition;
    bool available;
};

template <> struct structural::declaration<Book> {
    static constexpr std::string_view source = R"(
        @Structural
        struct Book {
            var title: String
            var author: Person
            var edition: Edition
            var available: Bool = true
        }
    )";
    using bindings = structural::bindings<structural::bind<"Person", Person>,
                                          structural::bind<"Edition", Edition>>;
};

// Renders one form row per leaf and fills in new values.
struct FormEditor {
    void operator()(std::string_view title, std::string& s) {
        std::cout << "  [text]   " << title << ": " << s << "\n";
        if (title == "title")
            s += " (2nd edition)";
    }
    void operator()(std::string_view title, bool& b) {
        std::cout << "  [toggle] " << title << ": " << (b ? "on" : "off")
                  << "\n";
        b = !b;
    }
    void operator()(std::string_view title, std::int64_t& n) {
        std::cout << "  [number] " << title << ": " << n << "\n";
    }
    void operator()(std::string_view title, std::chrono::year_month_day& d) {
        std::cout << "  [date]   " << title << ": "
                  << static_cast<int>(d.year()) << "\n";
    }
};

int main() {
    using namespace std::chrono;

    Book book{"Dune",
              Person{"Frank Herbert", 1920y / October / 8d},
              Ebook{"epub", false},
              true};

    std::cout << "before: " << structural::to_string(book) << "\n";

    FormEditor editor;
    structural::edit(book, editor);

    std::cout << "after:  " << structural::to_string(book) << "\n";
}
