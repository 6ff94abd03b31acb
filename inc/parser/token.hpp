/**
 * Token Definitions
 *
 * Token types for the Lua 5.1 subset: names, numbers, strings,
 * the fixed keyword set, operators and delimiters.
 */

#pragma once

#include <cstddef>
#include <string>

namespace luna {
namespace parser {

/**
 * Token types
 */
enum class TokenType {
    // Literals
    NUMBER,
    STRING,
    NAME,

    // Keywords
    KW_AND,
    KW_BREAK,
    KW_DO,
    KW_ELSE,
    KW_ELSEIF,
    KW_END,
    KW_FALSE,
    KW_FOR,
    KW_FUNCTION,
    KW_IF,
    KW_IN,
    KW_LOCAL,
    KW_NIL,
    KW_NOT,
    KW_OR,
    KW_REPEAT,
    KW_RETURN,
    KW_THEN,
    KW_TRUE,
    KW_UNTIL,
    KW_WHILE,

    // Arithmetic
    PLUS,           // +
    MINUS,          // -
    STAR,           // *
    SLASH,          // /
    PERCENT,        // %
    CARET,          // ^
    HASH,           // #
    CONCAT,         // ..

    // Comparison
    EQ,             // ==
    NE,             // ~=
    LT,             // <
    LE,             // <=
    GT,             // >
    GE,             // >=

    // Assignment
    ASSIGN,         // =

    // Delimiters
    LPAREN,         // (
    RPAREN,         // )
    LBRACE,         // {
    RBRACE,         // }
    LBRACKET,       // [
    RBRACKET,       // ]
    SEMICOLON,      // ;
    COLON,          // :
    COMMA,          // ,
    DOT,            // .
    ELLIPSIS,       // ...

    // Special
    END_OF_FILE,
    ERROR           // Unrecognized input; lexeme holds the offending text
};

/**
 * Token structure
 */
struct Token {
    TokenType type;
    std::string lexeme;      // Name, processed string contents, or raw text
    std::size_t offset;      // Byte offset into the source

    double numberValue;

    Token()
        : type(TokenType::END_OF_FILE)
        , offset(0)
        , numberValue(0.0)
    {}

    Token(TokenType t, const std::string& lex, std::size_t off)
        : type(t)
        , lexeme(lex)
        , offset(off)
        , numberValue(0.0)
    {}

    bool isKeyword() const {
        return type >= TokenType::KW_AND && type <= TokenType::KW_WHILE;
    }
};

/**
 * Convert token type to string (for error messages)
 */
const char* tokenTypeToString(TokenType type);

} // namespace parser
} // namespace luna
