#ifndef STRUCTURAL_EXTRACT_HPP
#define STRUCTURAL_EXTRACT_HPP

#include <cstddef>
#include <string_view>

#include <structural/declaration.hpp>
#include <structural/lexer.hpp>
#include <structural/str_utils.hpp>

namespace structural {

namespace detail {

consteval bool is_member_modifier(std::string_view w) {
    return w == "public" || w == "private" || w == "fileprivate" ||
           w == "internal" || w == "open" || w == "package" ||
           w == "final" || w == "indirect" || w == "lazy" || w == "weak" ||
           w == "unowned" || w == "nonisolated" || w == "mutating" ||
           w == "nonmutating" || w == "override" || w == "required" ||
           w == "convenience" || w == "dynamic";
}

// One pattern binding of a `var` / `let` declaration.
struct Binding {
    bool identifier{false};
    Name name{};
    bool typed{false};
    Name type{};
    bool computed{false};
};

// --- Parser: declaration source -> Declaration ---
//
// Every parse_* step returns false once an error has been recorded; the
// first recorded error wins and no members are added after it.

struct Parser {
    TokenStream ts{};
    std::size_t pos{0};
    int last_line{1};
    Declaration decl{};

    consteval const Token& peek(std::size_t ahead = 0) const {
        std::size_t i = pos + ahead;
        return ts.tokens[i < ts.count ? i : ts.count];
    }

    consteval const Token& next() {
        const Token& t = peek();
        if (pos < ts.count)
            ++pos;
        last_line = t.line;
        return t;
    }

    consteval bool at_end() const { return peek().kind == TokenKind::End; }

    consteval bool punct(char c, std::size_t ahead = 0) const {
        const Token& t = peek(ahead);
        return t.kind == TokenKind::Punct && t.text[0] == c;
    }

    consteval bool word(std::string_view w, std::size_t ahead = 0) const {
        const Token& t = peek(ahead);
        return t.kind == TokenKind::Identifier && t.text == w;
    }

    consteval bool identifier(std::size_t ahead = 0) const {
        return peek(ahead).kind == TokenKind::Identifier;
    }

    // Next token starts a new source line
    consteval bool line_break() const { return peek().line > last_line; }

    consteval bool accept(char c) {
        if (!punct(c))
            return false;
        next();
        return true;
    }

    consteval bool opener() const {
        return punct('(') || punct('[') || punct('{');
    }

    consteval bool closer() const {
        return punct(')') || punct(']') || punct('}');
    }

    consteval bool fail(DeriveError e, int line) {
        if (decl.error == DeriveError::None) {
            decl.error = e;
            decl.error_line = line;
        }
        return false;
    }

    // Consumes a bracketed group starting at the current opener.
    consteval bool skip_balanced() {
        int depth = 0;
        do {
            if (at_end())
                return false;
            if (opener())
                ++depth;
            else if (closer())
                --depth;
            next();
        } while (depth > 0);
        return true;
    }

    // Attributes and modifiers; `static` / `class` make the member a
    // type member.
    consteval bool skip_modifiers(bool& type_member) {
        type_member = false;
        while (true) {
            if (punct('@')) {
                next();
                if (!identifier())
                    return false;
                next();
                if (punct('(') && !line_break() && !skip_balanced())
                    return false;
                continue;
            }
            if (word("static") ||
                (word("class") && (word("var", 1) || word("let", 1) ||
                                   word("func", 1) || word("subscript", 1)))) {
                type_member = true;
                next();
                continue;
            }
            if (identifier() && is_member_modifier(peek().text)) {
                next();
                // private(set), unowned(unsafe)
                if (punct('(') && !line_break() && !skip_balanced())
                    return false;
                continue;
            }
            return true;
        }
    }

    // Type text up to the next delimiter at nesting depth zero. Tokens are
    // joined without whitespace, except between two words.
    consteval bool collect_type(Name& out) {
        int depth = 0;
        bool consumed = false;
        bool prev_word = false;
        while (true) {
            if (at_end())
                return false;
            if (depth == 0) {
                if (punct('=') || punct('{') || punct(',') || punct(';') ||
                    punct('}') || punct(')'))
                    break;
                if (consumed && line_break())
                    break;
            }
            if (punct('(') || punct('[') || punct('<'))
                ++depth;
            else if (punct(')') || punct(']') || punct('>'))
                --depth;
            if (depth < 0)
                return false;
            bool is_word = identifier();
            if (is_word && prev_word)
                out.append_char(' ');
            out.append(peek().text);
            prev_word = is_word;
            next();
            consumed = true;
        }
        return consumed;
    }

    // `{ willSet ...` or `{ didSet ...`
    consteval bool observer_block() const {
        return punct('{') && (word("willSet", 1) || word("didSet", 1));
    }

    // Initializer, default value or raw value: up to ',' ';' ')' '}' at
    // depth zero, the end of the line, or an observer block. Any other
    // '{' is a closure inside the expression.
    consteval bool skip_expression() {
        bool consumed = false;
        while (true) {
            if (at_end())
                return false;
            if (punct(',') || punct(';') || punct(')') || punct('}'))
                return consumed;
            if (consumed && (line_break() || observer_block()))
                return true;
            if (opener()) {
                if (!skip_balanced())
                    return false;
            } else {
                next();
            }
            consumed = true;
        }
    }

    // Methods, initializers, subscripts, typealiases, nested types.
    consteval bool skip_member() {
        bool consumed = false;
        while (true) {
            if (at_end())
                return false;
            if (punct('}') || punct(';'))
                return consumed;
            if (consumed && line_break() && !punct('{'))
                return true;
            if (punct('{'))
                return skip_balanced();
            if (punct('(') || punct('[')) {
                if (!skip_balanced())
                    return false;
            } else {
                next();
            }
            consumed = true;
        }
    }

    consteval bool parse_binding(Binding& b) {
        if (word("_")) {
            next();
        } else if (identifier()) {
            b.identifier = true;
            b.name = Name::of(next().text);
        } else if (punct('(')) {
            if (!skip_balanced())
                return false;
        } else {
            return false;
        }

        if (accept(':')) {
            b.typed = true;
            if (!collect_type(b.type))
                return false;
        }

        bool initialized = false;
        if (accept('=')) {
            initialized = true;
            if (!skip_expression())
                return false;
        }

        if (punct('{') && (!initialized || !line_break())) {
            b.computed = true;
            return skip_balanced();
        }
        return true;
    }

    consteval bool parse_variable(bool type_member) {
        int line = next().line; // var / let
        Binding first{};
        std::size_t count = 0;
        do {
            Binding b{};
            if (!parse_binding(b))
                return fail(DeriveError::MalformedDeclaration, line);
            if (count++ == 0)
                first = b;
        } while (accept(','));

        // Not an instance stored property of a product
        if (type_member || decl.kind == DeclKind::Enum)
            return true;

        if (count != 1)
            return fail(DeriveError::UnsupportedMemberShape, line);
        if (first.computed)
            return true;
        if (!first.identifier)
            return fail(DeriveError::UnsupportedPattern, line);
        if (!first.typed)
            return fail(DeriveError::MissingTypeAnnotation, line);

        Member m{};
        m.name = first.name;
        m.type = first.type;
        decl.add_member(m);
        return true;
    }

    consteval bool parse_params(Member& m) {
        if (accept(')'))
            return true;
        while (true) {
            Param p{};
            if (identifier() && punct(':', 1)) {
                // label: Type
                p.labeled = peek().text != "_";
                if (p.labeled)
                    p.label = Name::of(peek().text);
                next();
                next();
            } else if (identifier() && identifier(1) && punct(':', 2)) {
                // label name: Type
                p.labeled = peek().text != "_";
                if (p.labeled)
                    p.label = Name::of(peek().text);
                next();
                next();
                next();
            }
            if (!collect_type(p.type))
                return false;
            if (accept('=') && !skip_expression())
                return false;
            m.add_param(p);
            if (accept(')'))
                return true;
            if (!accept(','))
                return false;
        }
    }

    consteval bool parse_case() {
        int line = next().line; // case
        Member first{};
        std::size_t count = 0;
        do {
            Member m{};
            if (!identifier())
                return fail(DeriveError::MalformedDeclaration, line);
            m.name = Name::of(next().text);
            if (accept('(') && !parse_params(m))
                return fail(DeriveError::MalformedDeclaration, line);
            if (accept('=') && !skip_expression())
                return fail(DeriveError::MalformedDeclaration, line);
            if (count++ == 0)
                first = m;
        } while (accept(','));

        if (decl.kind != DeclKind::Enum)
            return fail(DeriveError::MalformedDeclaration, line);
        if (count != 1)
            return fail(DeriveError::UnsupportedMemberShape, line);

        decl.add_member(first);
        return true;
    }

    consteval bool parse_members() {
        while (true) {
            while (accept(';')) {
            }
            if (accept('}'))
                return true;
            if (at_end())
                return fail(DeriveError::MalformedDeclaration, peek().line);

            int line = peek().line;
            bool type_member = false;
            if (!skip_modifiers(type_member))
                return fail(DeriveError::MalformedDeclaration, line);

            if (word("var") || word("let")) {
                if (!parse_variable(type_member))
                    return false;
            } else if (word("case")) {
                if (!parse_case())
                    return false;
            } else if (!skip_member()) {
                return fail(DeriveError::MalformedDeclaration, line);
            }
        }
    }

    consteval bool parse_declaration() {
        bool type_member = false;
        if (!skip_modifiers(type_member))
            return fail(DeriveError::MalformedDeclaration, peek().line);

        if (!identifier())
            return fail(DeriveError::MalformedDeclaration, peek().line);
        const Token& keyword = next();
        if (keyword.text == "struct")
            decl.kind = DeclKind::Struct;
        else if (keyword.text == "enum")
            decl.kind = DeclKind::Enum;
        else
            return fail(DeriveError::UnsupportedDeclarationKind, keyword.line);

        if (!identifier())
            return fail(DeriveError::MalformedDeclaration, peek().line);
        decl.name = Name::of(next().text);

        // Generic parameters, inheritance clause, where clause
        while (!punct('{')) {
            if (at_end())
                return fail(DeriveError::MalformedDeclaration, peek().line);
            next();
        }
        next();

        if (!parse_members())
            return false;
        while (accept(';')) {
        }
        if (!at_end())
            return fail(DeriveError::MalformedDeclaration, peek().line);
        return true;
    }
};

} // namespace detail

// --- Member extraction ---

// Parses one struct or enum declaration. Errors are reported in the
// result (error, error_line) rather than thrown, so they can be inspected
// in constant expressions.
consteval Declaration extract(std::string_view source) {
    detail::Parser p{};
    p.ts = tokenize(source);
    p.parse_declaration();
    return p.decl;
}

// Stops compilation when the declaration could not be derived.
consteval Declaration checked(const Declaration& d) {
    switch (d.error) {
    case DeriveError::None:
        return d;
    case DeriveError::UnsupportedMemberShape:
        throw "UnsupportedMemberShape: declare one property binding or one "
              "enum case per declaration";
    case DeriveError::UnsupportedPattern:
        throw "UnsupportedPattern: only identifier patterns are supported";
    case DeriveError::MissingTypeAnnotation:
        throw "MissingTypeAnnotation: stored properties need an explicit type";
    case DeriveError::UnsupportedDeclarationKind:
        throw "UnsupportedDeclarationKind: only structs and enums derive";
    case DeriveError::MalformedDeclaration:
        throw "MalformedDeclaration: the declaration source does not parse";
    }
    throw "unknown derivation error";
}

} // namespace structural

#endif // STRUCTURAL_EXTRACT_HPP
