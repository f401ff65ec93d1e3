#ifndef STRUCTURAL_LEXER_HPP
#define STRUCTURAL_LEXER_HPP

#include <cstddef>
#include <string_view>

namespace structural {

// --- Tokens of a declaration source ---

enum class TokenKind { Identifier, Number, String, Punct, Arrow, End };

struct Token {
    TokenKind kind{TokenKind::End};
    std::string_view text{};
    int line{0};
};

inline constexpr std::size_t MaxTokens = 512;

// tokens[count] is always the End token.
struct TokenStream {
    Token tokens[MaxTokens]{};
    std::size_t count{0};
};

namespace detail {

// Bytes of multi-byte UTF-8 sequences count as letters, so `café` is one
// identifier.
consteval bool is_ident_start(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' ||
           static_cast<unsigned char>(c) >= 0x80;
}

consteval bool is_digit(char c) { return c >= '0' && c <= '9'; }

consteval bool is_ident_char(char c) {
    return is_ident_start(c) || is_digit(c);
}

} // namespace detail

consteval TokenStream tokenize(std::string_view src) {
    TokenStream ts{};
    std::size_t i = 0;
    int line = 1;

    auto push = [&](TokenKind kind, std::size_t begin, std::size_t end) {
        if (ts.count + 1 >= MaxTokens)
            throw "declaration exceeds token capacity";
        ts.tokens[ts.count++] = Token{kind, src.substr(begin, end - begin), line};
    };

    while (i < src.size()) {
        char c = src[i];
        if (c == '\n') {
            ++line;
            ++i;
            continue;
        }
        if (c == ' ' || c == '\t' || c == '\r') {
            ++i;
            continue;
        }

        // Line comment
        if (c == '/' && i + 1 < src.size() && src[i + 1] == '/') {
            while (i < src.size() && src[i] != '\n')
                ++i;
            continue;
        }

        // Block comment (nests, as in Swift)
        if (c == '/' && i + 1 < src.size() && src[i + 1] == '*') {
            int depth = 1;
            i += 2;
            while (depth > 0) {
                if (i + 1 >= src.size())
                    throw "unterminated block comment";
                if (src[i] == '/' && src[i + 1] == '*') {
                    ++depth;
                    i += 2;
                } else if (src[i] == '*' && src[i + 1] == '/') {
                    --depth;
                    i += 2;
                } else {
                    if (src[i] == '\n')
                        ++line;
                    ++i;
                }
            }
            continue;
        }

        std::size_t begin = i;

        if (detail::is_ident_start(c)) {
            while (i < src.size() && detail::is_ident_char(src[i]))
                ++i;
            push(TokenKind::Identifier, begin, i);
            continue;
        }

        // `keyword` used as an identifier; the backticks are dropped
        if (c == '`') {
            ++i;
            begin = i;
            while (i < src.size() && src[i] != '`' && src[i] != '\n')
                ++i;
            if (i >= src.size() || src[i] != '`')
                throw "unterminated backtick identifier";
            push(TokenKind::Identifier, begin, i);
            ++i;
            continue;
        }

        if (detail::is_digit(c)) {
            while (i < src.size() &&
                   (detail::is_ident_char(src[i]) || src[i] == '.'))
                ++i;
            push(TokenKind::Number, begin, i);
            continue;
        }

        if (c == '"') {
            ++i;
            while (i < src.size() && src[i] != '"') {
                if (src[i] == '\n')
                    throw "unterminated string literal";
                if (src[i] == '\\')
                    ++i;
                ++i;
            }
            if (i >= src.size())
                throw "unterminated string literal";
            ++i;
            push(TokenKind::String, begin, i);
            continue;
        }

        if (c == '-' && i + 1 < src.size() && src[i + 1] == '>') {
            i += 2;
            push(TokenKind::Arrow, begin, i);
            continue;
        }

        ++i;
        push(TokenKind::Punct, begin, i);
    }

    ts.tokens[ts.count] = Token{TokenKind::End, {}, line};
    return ts;
}

} // namespace structural

#endif // STRUCTURAL_LEXER_HPP
