#pragma once

#include <cstdint>
#include <string>

namespace kiln::syntax {

enum class TokenKind : uint16_t {
    kEof = 0,
    kError,

    kIdent,
    kIntLit,
    kStringLit,

    kKwProject,
    kKwOption,
    kKwLet,
    kKwExecutable,
    kKwLibrary,
    kKwCommand,
    kKwAlias,
    kKwDefault,
    kKwInstall,
    kKwGlobalFlags,
    kKwValidate,
    kKwTrue,
    kKwFalse,
    kKwString,
    kKwBool,
    kKwEnum,
    kKwList,

    kLParen,
    kRParen,
    kLBrace,
    kRBrace,
    kLBracket,
    kRBracket,
    kComma,
    kColon,
    kSemicolon,

    kAssign,
    kPlus,
};

struct SourceLoc {
    uint32_t line = 1;
    uint32_t column = 1;
};

struct Token {
    TokenKind kind = TokenKind::kError;
    std::string lexeme;
    SourceLoc loc{};
};

inline bool is_keyword(TokenKind k) {
    return k >= TokenKind::kKwProject && k <= TokenKind::kKwList;
}

// Human wording for a token in parse errors: `end of file`, `identifier 'x'`,
// `keyword 'let'`, `'{'`.
inline std::string describe(const Token& t) {
    switch (t.kind) {
        case TokenKind::kEof: return "end of file";
        case TokenKind::kError: return "invalid token";
        case TokenKind::kIdent: return "identifier '" + t.lexeme + "'";
        case TokenKind::kIntLit: return "number " + t.lexeme;
        case TokenKind::kStringLit: return "string \"" + t.lexeme + "\"";
        default: break;
    }
    if (is_keyword(t.kind)) return "keyword '" + t.lexeme + "'";
    return "'" + t.lexeme + "'";
}

} // namespace kiln::syntax
