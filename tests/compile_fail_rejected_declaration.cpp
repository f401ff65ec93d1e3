// Compile-fail test: a property declaration with two bindings must be rejected.
// This file should FAIL to compile — checked() throws UnsupportedMemberShape.
#include <structural/derive.hpp>

#include <cstdint>

struct Range {
    std::int64_t low;
    std::int64_t high;
};

template <> struct structural::declaration<Range> {
    static constexpr std::string_view source = R"(
        struct Range {
            var low: Int, high: Int
        }
    )";
};

constexpr auto s = structural::structure<Range>();

int main() { (void)s; }
