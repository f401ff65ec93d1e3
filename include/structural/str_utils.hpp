#ifndef STRUCTURAL_STR_UTILS_HPP
#define STRUCTURAL_STR_UTILS_HPP

#include <cstddef>
#include <string_view>

namespace structural {

inline constexpr std::size_t NameCap = 32;

// --- Name: fixed-capacity text (structural type — works as NTTP) ---

struct Name {
    char data[NameCap]{};
    std::size_t len{0};

    consteval void append(std::string_view s) {
        for (char c : s) {
            if (len + 1 >= NameCap)
                throw "Name capacity exceeded";
            data[len++] = c;
        }
    }

    consteval void append_char(char c) {
        if (len + 1 >= NameCap)
            throw "Name capacity exceeded";
        data[len++] = c;
    }

    static consteval Name of(std::string_view s) {
        Name n{};
        n.append(s);
        return n;
    }

    constexpr std::string_view view() const { return {data, len}; }
    constexpr bool empty() const { return len == 0; }

    constexpr bool operator==(const Name&) const = default;
    constexpr bool operator==(std::string_view s) const { return view() == s; }
};

// --- NTTP string wrapper for binding keys ---

template <std::size_t N> struct FixedString {
    char data[N]{};
    consteval FixedString(const char (&s)[N]) {
        for (std::size_t i = 0; i < N; ++i)
            data[i] = s[i];
    }
    constexpr std::string_view view() const { return {data, N - 1}; }
};

} // namespace structural

#endif // STRUCTURAL_STR_UTILS_HPP
