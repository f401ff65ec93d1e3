#include <gtest/gtest.h>
#include <structural/structural.hpp>

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

using namespace structural;
using namespace std::chrono;

// --- Library domain ---

struct Person {
    std::string name;
    std::int64_t born;
};

template <> struct structural::declaration<Person> {
    static constexpr std::string_view source = R"(
        struct Person {
            var name: String
            var born: Int
        }
    )";
};

struct Hardcover {
    std::int64_t pages;
};
struct Audio {
    std::int64_t minutes;
    std::string narrator;
};
struct Unknown {};

struct Format : std::variant<Hardcover, std::string, Audio, Unknown> {
    using std::variant<Hardcover, std::string, Audio, Unknown>::variant;
};

template <> struct structural::declaration<Format> {
    static constexpr std::string_view source = R"(
        enum Format {
            case hardcover(pages: Int)
            case ebook(String)
            case audio(_ minutes: Int, narrator: String)
            case unknown
        }
    )";
};

struct Book {
    std::string title;
    Person author;
    Format format;
    bool available;
};

template <> struct structural::declaration<Book> {
    static constexpr std::string_view source = R"(
        struct Book {
            var title: String
            var author: Person
            var format: Format
            var available: Bool
            var summary: String { title }
        }
    )";
    using bindings = structural::bindings<bind<"Person", Person>,
                                          bind<"Format", Format>>;
};

struct Loan {
    std::string member;
    year_month_day due;
    char shelf;
};

template <> struct structural::declaration<Loan> {
    static constexpr std::string_view source = R"(
        struct Loan {
            let member: String
            let due: Date
            let shelf: Character
        }
    )";
};

struct Flag {};

template <> struct structural::declaration<Flag> {
    static constexpr std::string_view source = "struct Flag {}";
};

struct Never {
    Never() = delete;
};

template <> struct structural::declaration<Never> {
    static constexpr std::string_view source = "enum Never {}";
};

namespace {

Book dune() {
    return Book{"Dune", Person{"Frank Herbert", 1920},
                Format{std::in_place_index<0>, Hardcover{412}}, true};
}

} // namespace

// --- Equality ---

TEST(Equal, Products) {
    EXPECT_TRUE(structural::equal(Person{"Ann", 1990}, Person{"Ann", 1990}));
    EXPECT_FALSE(structural::equal(Person{"Ann", 1990}, Person{"Ann", 1991}));
    EXPECT_FALSE(structural::equal(Person{"Ann", 1990}, Person{"Bob", 1990}));
}

TEST(Equal, Sums) {
    Format a{std::in_place_index<2>, Audio{60, "Kim"}};
    Format b{std::in_place_index<2>, Audio{60, "Kim"}};
    Format c{std::in_place_index<2>, Audio{61, "Kim"}};
    Format d{std::in_place_index<3>, Unknown{}};
    EXPECT_TRUE(structural::equal(a, b));
    EXPECT_FALSE(structural::equal(a, c));
    EXPECT_FALSE(structural::equal(a, d));
    EXPECT_TRUE(structural::equal(d, Format{std::in_place_index<3>, Unknown{}}));
}

TEST(Equal, NestedDerivedTypes) {
    Book a = dune();
    Book b = dune();
    EXPECT_TRUE(structural::equal(a, b));
    b.author.born = 1921;
    EXPECT_FALSE(structural::equal(a, b));
    b = dune();
    b.format = Format{std::in_place_index<1>, std::string("epub")};
    EXPECT_FALSE(structural::equal(a, b));
}

TEST(Equal, ConstantEvaluation) {
    static_assert(structural::equal(Flag{}, Flag{}));
}

TEST(Equal, EmptySumIsCallable) {
    bool (*eq)(const Never&, const Never&) = &structural::equal<Never>;
    EXPECT_NE(eq, nullptr);
}

// --- Printing ---

TEST(Print, Product) {
    EXPECT_EQ(structural::to_string(Person{"Ann", 1990}),
              R"(Person { name: "Ann", born: 1990 })");
}

TEST(Print, LabeledCase) {
    Format f{std::in_place_index<0>, Hardcover{300}};
    EXPECT_EQ(structural::to_string(f), "Format.hardcover(pages: 300)");
}

TEST(Print, UnlabeledCase) {
    Format f{std::in_place_index<1>, std::string("epub")};
    EXPECT_EQ(structural::to_string(f), R"(Format.ebook("epub"))");
}

TEST(Print, MixedLabels) {
    Format f{std::in_place_index<2>, Audio{90, "Simon"}};
    EXPECT_EQ(structural::to_string(f),
              R"(Format.audio(90, narrator: "Simon"))");
}

TEST(Print, ZeroParameterCase) {
    Format f{std::in_place_index<3>, Unknown{}};
    EXPECT_EQ(structural::to_string(f), "Format.unknown");
}

TEST(Print, NestedDerivedTypes) {
    EXPECT_EQ(structural::to_string(dune()),
              R"(Book { title: "Dune", author: Person { name: "Frank Herbert", )"
              R"(born: 1920 }, format: Format.hardcover(pages: 412), )"
              R"(available: true })");
}

TEST(Print, DatesAndCharacters) {
    Loan l{"Ann", 2024y / March / 5d, 'B'};
    EXPECT_EQ(structural::to_string(l),
              R"(Loan { member: "Ann", due: 2024-03-05, shelf: 'B' })");
}

TEST(Print, DateRestoresFill) {
    std::ostringstream os;
    structural::print(os, Loan{"Ann", 2024y / December / 25d, 'A'});
    os << std::setw(3) << 7;
    EXPECT_EQ(os.str(),
              R"(Loan { member: "Ann", due: 2024-12-25, shelf: 'A' }  7)");
}

TEST(Print, EmptyProduct) {
    EXPECT_EQ(structural::to_string(Flag{}), "Flag {}");
}

TEST(Print, QuotesEscapes) {
    EXPECT_EQ(structural::to_string(Person{"A \"B\"", 1}),
              R"(Person { name: "A \"B\"", born: 1 })");
}

// --- Editing ---

// Records every leaf it is handed and rewrites strings and integers.
struct Recorder {
    std::vector<std::string> titles;

    void operator()(std::string_view title, std::string& s) {
        titles.emplace_back(title);
        s += "!";
    }
    void operator()(std::string_view title, std::int64_t& n) {
        titles.emplace_back(title);
        n *= 2;
    }
    void operator()(std::string_view title, bool& b) {
        titles.emplace_back(title);
        b = !b;
    }
};

TEST(Edit, ProductLeaves) {
    Person p{"Ann", 1000};
    Recorder r;
    structural::edit(p, r);
    EXPECT_EQ(p.name, "Ann!");
    EXPECT_EQ(p.born, 2000);
    EXPECT_EQ(r.titles, (std::vector<std::string>{"name", "born"}));
}

TEST(Edit, OnlyActiveCase) {
    Format f{std::in_place_index<2>, Audio{30, "Kim"}};
    Recorder r;
    structural::edit(f, r);
    ASSERT_EQ(f.index(), 2u);
    EXPECT_EQ(std::get<2>(f).minutes, 60);
    EXPECT_EQ(std::get<2>(f).narrator, "Kim!");
    EXPECT_EQ(r.titles, (std::vector<std::string>{"", "narrator"}));
}

TEST(Edit, ZeroParameterCasePresentsNothing) {
    Format f{std::in_place_index<3>, Unknown{}};
    Recorder r;
    structural::edit(f, r);
    EXPECT_EQ(f.index(), 3u);
    EXPECT_TRUE(r.titles.empty());
}

TEST(Edit, RecursesIntoNestedDerivedTypes) {
    Book b = dune();
    Recorder r;
    structural::edit(b, r);
    EXPECT_EQ(b.title, "Dune!");
    EXPECT_EQ(b.author.name, "Frank Herbert!");
    EXPECT_EQ(b.author.born, 3840);
    EXPECT_EQ(std::get<0>(b.format).pages, 824);
    EXPECT_FALSE(b.available);
    EXPECT_EQ(r.titles, (std::vector<std::string>{"title", "name", "born",
                                                  "pages", "available"}));
}

// Takes a whole Person instead of its fields.
struct PersonEditor : Recorder {
    using Recorder::operator();

    void operator()(std::string_view title, Person& p) {
        titles.emplace_back(title);
        p = Person{"Anonymous", 0};
    }
};

TEST(Edit, EditorTakesNestedDerivedType) {
    Book b = dune();
    PersonEditor e;
    structural::edit(b, e);
    EXPECT_EQ(b.author.name, "Anonymous");
    EXPECT_EQ(b.author.born, 0);
    EXPECT_EQ(e.titles, (std::vector<std::string>{"title", "author", "pages",
                                                  "available"}));
}

TEST(Edit, TemporaryEditor) {
    Person p{"Ann", 1};
    structural::edit(p, [](std::string_view, auto& leaf) -> void {
        leaf = std::remove_reference_t<decltype(leaf)>{};
    });
    EXPECT_EQ(p.name, "");
    EXPECT_EQ(p.born, 0);
}

TEST(Edit, DateLeaf) {
    Loan l{"Ann", 2024y / March / 5d, 'B'};
    structural::edit(l, [](std::string_view title, auto& leaf) -> void {
        if constexpr (std::is_same_v<std::remove_cvref_t<decltype(leaf)>,
                                     year_month_day>) {
            EXPECT_EQ(title, "due");
            leaf = year_month_day{sys_days{leaf} + days{1}};
        }
    });
    EXPECT_EQ(l.due, 2024y / March / 6d);
}
