#include <gtest/gtest.h>
#include <structural/lexer.hpp>

using namespace structural;

// --- Token kinds ---

TEST(Lexer, IdentifiersAndPunctuation) {
    constexpr auto ts = tokenize("struct Book { var title: String }");
    static_assert(ts.count == 8);
    static_assert(ts.tokens[0].kind == TokenKind::Identifier);
    static_assert(ts.tokens[0].text == "struct");
    static_assert(ts.tokens[1].text == "Book");
    static_assert(ts.tokens[2].kind == TokenKind::Punct);
    static_assert(ts.tokens[2].text == "{");
    static_assert(ts.tokens[5].text == ":");
    static_assert(ts.tokens[7].text == "}");
}

TEST(Lexer, NonAsciiIdentifier) {
    constexpr auto ts = tokenize("var café: String");
    static_assert(ts.count == 4);
    static_assert(ts.tokens[1].kind == TokenKind::Identifier);
    static_assert(ts.tokens[1].text == "café");
    static_assert(ts.tokens[2].text == ":");
}

TEST(Lexer, EndTokenFollowsLastToken) {
    constexpr auto ts = tokenize("a b");
    static_assert(ts.count == 2);
    static_assert(ts.tokens[2].kind == TokenKind::End);
}

TEST(Lexer, EmptySource) {
    constexpr auto ts = tokenize("");
    static_assert(ts.count == 0);
    static_assert(ts.tokens[0].kind == TokenKind::End);
}

TEST(Lexer, Numbers) {
    constexpr auto ts = tokenize("42 1.5 0x1F");
    static_assert(ts.count == 3);
    static_assert(ts.tokens[0].kind == TokenKind::Number);
    static_assert(ts.tokens[1].text == "1.5");
    static_assert(ts.tokens[2].text == "0x1F");
}

TEST(Lexer, Arrow) {
    constexpr auto ts = tokenize("(Int) -> Bool");
    static_assert(ts.count == 5);
    static_assert(ts.tokens[3].kind == TokenKind::Arrow);
    static_assert(ts.tokens[3].text == "->");
    static_assert(ts.tokens[4].text == "Bool");
}

TEST(Lexer, MinusIsPunct) {
    constexpr auto ts = tokenize("-1");
    static_assert(ts.tokens[0].kind == TokenKind::Punct);
    static_assert(ts.tokens[1].kind == TokenKind::Number);
}

// --- Strings ---

TEST(Lexer, StringLiteral) {
    constexpr auto ts = tokenize(R"(x = "a \" b" y)");
    static_assert(ts.count == 4);
    static_assert(ts.tokens[2].kind == TokenKind::String);
    static_assert(ts.tokens[2].text == R"("a \" b")");
    static_assert(ts.tokens[3].text == "y");
}

TEST(Lexer, CommentMarkersInsideString) {
    constexpr auto ts = tokenize(R"(a = "// not a comment" b)");
    static_assert(ts.count == 4);
    static_assert(ts.tokens[3].text == "b");
}

// --- Backtick identifiers ---

TEST(Lexer, BacktickIdentifier) {
    constexpr auto ts = tokenize("var `default`: Int");
    static_assert(ts.count == 4);
    static_assert(ts.tokens[1].kind == TokenKind::Identifier);
    static_assert(ts.tokens[1].text == "default");
}

// --- Comments ---

TEST(Lexer, LineComment) {
    constexpr auto ts = tokenize("a // b c\nd");
    static_assert(ts.count == 2);
    static_assert(ts.tokens[1].text == "d");
}

TEST(Lexer, NestedBlockComment) {
    constexpr auto ts = tokenize("a /* b /* c */ d */ e");
    static_assert(ts.count == 2);
    static_assert(ts.tokens[0].text == "a");
    static_assert(ts.tokens[1].text == "e");
}

// --- Line tracking ---

TEST(Lexer, LineNumbers) {
    constexpr auto ts = tokenize("a\nb\n\nc");
    static_assert(ts.tokens[0].line == 1);
    static_assert(ts.tokens[1].line == 2);
    static_assert(ts.tokens[2].line == 4);
}

TEST(Lexer, BlockCommentCountsLines) {
    constexpr auto ts = tokenize("a /* x\ny\n*/ b");
    static_assert(ts.tokens[1].line == 3);
}

TEST(Lexer, ResultUsableAtRuntime) {
    constexpr auto ts = tokenize("enum Format { case unknown }");
    EXPECT_EQ(ts.count, 6u);
    EXPECT_EQ(ts.tokens[4].text, "unknown");
}
