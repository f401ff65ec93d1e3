#ifndef STRUCTURAL_DECLARATION_HPP
#define STRUCTURAL_DECLARATION_HPP

#include <cstddef>
#include <string_view>

#include <structural/str_utils.hpp>

namespace structural {

enum class DeclKind { Struct, Enum };

enum class DeriveError {
    None,
    UnsupportedMemberShape,
    UnsupportedPattern,
    MissingTypeAnnotation,
    UnsupportedDeclarationKind,
    MalformedDeclaration,
};

constexpr std::string_view error_name(DeriveError e) {
    switch (e) {
    case DeriveError::None:
        return "None";
    case DeriveError::UnsupportedMemberShape:
        return "UnsupportedMemberShape";
    case DeriveError::UnsupportedPattern:
        return "UnsupportedPattern";
    case DeriveError::MissingTypeAnnotation:
        return "MissingTypeAnnotation";
    case DeriveError::UnsupportedDeclarationKind:
        return "UnsupportedDeclarationKind";
    case DeriveError::MalformedDeclaration:
        return "MalformedDeclaration";
    }
    return "Unknown";
}

inline constexpr std::size_t MaxMembers = 16;
inline constexpr std::size_t MaxParams = 8;

// --- Extracted members (structural types — usable in constant expressions) ---

// One parameter of an enum case payload.
struct Param {
    Name label{};
    bool labeled{false};
    Name type{};
};

// A stored property (name + type) or an enum case (name + params).
struct Member {
    Name name{};
    Name type{};
    Param params[MaxParams]{};
    std::size_t param_count{0};

    consteval void add_param(const Param& p) {
        if (param_count >= MaxParams)
            throw "enum case parameter capacity exceeded";
        params[param_count++] = p;
    }
};

struct Declaration {
    DeclKind kind{DeclKind::Struct};
    Name name{};
    Member members[MaxMembers]{};
    std::size_t member_count{0};
    DeriveError error{DeriveError::None};
    int error_line{0};

    constexpr bool ok() const { return error == DeriveError::None; }

    consteval void add_member(const Member& m) {
        if (member_count >= MaxMembers)
            throw "declaration member capacity exceeded";
        members[member_count++] = m;
    }
};

} // namespace structural

#endif // STRUCTURAL_DECLARATION_HPP
