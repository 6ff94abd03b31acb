/**
 * Scanner - pull tokenizer
 *
 * Converts source text into tokens on demand. The current token is
 * always available; advance() moves to the next one. Handles:
 * - Line comments (--) and block comments (--[[ ... ]])
 * - Quoted strings with escapes and [[long strings]] without
 * - Longest-match operators (<= before <, ... before .. before .)
 * - A leading #! line, which is skipped
 *
 * Unrecognized input produces an ERROR token instead of stopping.
 */

#pragma once

#include "parser/token.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace luna {
namespace parser {

class Scanner {
public:
    explicit Scanner(const std::string& source);

    /**
     * Current token
     */
    const Token& token() const { return current_; }

    /**
     * Move to the next token
     */
    void advance();

    /**
     * Token after the current one, without consuming anything
     */
    const Token& lookahead();

    /**
     * Drain all remaining tokens, ending with END_OF_FILE
     */
    std::vector<Token> tokenize();

    bool isAtEnd() const { return current_.type == TokenType::END_OF_FILE; }

private:
    std::string source_;
    std::size_t pos_;

    Token current_;
    std::optional<Token> lookahead_;

    std::unordered_map<std::string, TokenType> keywords_;

    // Character access
    char peek() const;
    char peekNext() const;
    bool atSourceEnd() const { return pos_ >= source_.length(); }

    // Whitespace and comments; false if a block comment is unterminated
    bool skipTrivia(std::size_t& errorOffset);

    // Token scanning
    Token scanToken();
    Token scanString(char quote);
    Token scanLongString();
    Token scanNumber();
    Token scanName();
    Token scanOperator();

    void initKeywords();
};

} // namespace parser
} // namespace luna
