// 02_sum.cpp — Deriving an enum
//
// Shows: variant-backed sums, labeled and unlabeled parameters,
//        the Choice chain, equal(), print().

#include <cstdint>
#include <iostream>
#include <string>
#include <structural/structural.hpp>
#include <variant>

struct Hardcover {
    std::int64_t pages;
};
struct Audio {
    std::int64_t minutes;
    std::string narrator;
};
struct Unknown {};

// One alternative per case; ebook holds its single String directly.
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

int main() {
    using namespace structural;

    // --- Case position is the depth of the first Choice::first ---
    Format ebook{std::in_place_index<1>, std::string("epub")};
    auto c = to(ebook);
    std::cout << "is_first: " << c.is_first()
              << ", right().is_first: " << c.right().is_first() << "\n";

    // --- Case names and payload labels ---
    constexpr auto s = structure<Format>();
    std::cout << s.name << " cases:";
    std::cout << " " << s.cases.name;
    std::cout << " " << s.cases.rest.name;
    std::cout << " " << s.cases.rest.rest.name;
    std::cout << " " << s.cases.rest.rest.rest.name << "\n";

    // --- Generic algorithms ---
    Format formats[] = {
        Format{std::in_place_index<0>, Hardcover{300}},
        ebook,
        Format{std::in_place_index<2>, Audio{90, "Simon Vance"}},
        Format{std::in_place_index<3>, Unknown{}},
    };
    for (const auto& f : formats) {
        structural::print(std::cout, f);
        std::cout << (structural::equal(f, ebook) ? "  <- ebook" : "") << "\n";
    }
}
