#ifndef SCREENBIND_EXPR_TOKEN_H
#define SCREENBIND_EXPR_TOKEN_H

#include "screenbind/common/types.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace screenbind {

enum class TokenKind : uint8_t {
    NUMBER,
    STRING,
    IDENTIFIER,
    BOOLEAN,
    NULL_LITERAL,

    LPAREN,       // (
    RPAREN,       // )
    LBRACKET,     // [
    RBRACKET,     // ]
    COMMA,        // ,
    DOT,          // .
    QUESTION,     // ?
    COLON,        // :

    PLUS,         // +
    MINUS,        // -
    STAR,         // *
    SLASH,        // /
    PERCENT,      // %

    GT,           // >
    GE,           // >=
    LT,           // <
    LE,           // <=
    EQ,           // ==
    NE,           // !=
    STRICT_EQ,    // ===
    STRICT_NE,    // !==

    AND_AND,      // &&
    OR_OR,        // ||
    BANG,         // !

    END_OF_INPUT
};

struct Token {
    TokenKind kind = TokenKind::END_OF_INPUT;
    Value value;            // number, string contents, identifier name, bool, null, or operator text
    std::size_t position = 0; // byte offset of the first character

    Token() = default;
    Token(TokenKind k, Value v, std::size_t pos) : kind(k), value(std::move(v)), position(pos) {}
};

// Source spelling of a kind: "===", "(", "identifier", "end of input".
const char* token_kind_name(TokenKind kind);

} // namespace screenbind

#endif // SCREENBIND_EXPR_TOKEN_H
