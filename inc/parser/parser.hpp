/**
 * Recursive Descent Parser
 *
 * Consumes one Scanner and builds the AST. Expression precedence,
 * lowest to highest:
 *
 *   or
 *   and
 *   < > <= >= ~= ==      (left-associative, chains: a < b < c)
 *   ..                   (right-associative)
 *   + -
 *   * / %
 *   not # - (unary)
 *   ^                    (right-associative)
 *
 * Statements must be separated by ';'. Any mismatch raises a
 * SyntaxError carrying the current token's source offset; there is
 * no recovery.
 */

#ifndef LUNA_PARSER_HPP
#define LUNA_PARSER_HPP

#include "parser/ast.hpp"
#include "parser/scanner.hpp"
#include "parser/token.hpp"
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace luna {
namespace parser {

class SyntaxError : public std::runtime_error {
public:
    SyntaxError(const std::string& msg, std::size_t off, const std::string& tok = "")
        : std::runtime_error(formatError(msg, off)), offset(off), token(tok) {}

    std::size_t offset;
    std::string token;      // Text of the offending token

private:
    static std::string formatError(const std::string& msg, std::size_t off) {
        return "syntax error: " + msg + " at " + std::to_string(off);
    }
};

class Parser {
public:
    explicit Parser(Scanner& scanner) : scanner_(scanner) {}

    /**
     * block = {stat ";"} - stops at a block terminator
     */
    Block parseBlock();

    /**
     * A block that must consume the whole input
     */
    Block parseChunk();

    StatPtr parseStatement();
    ExpPtr parseExpression();

private:
    // Token stream management
    const Token& peek() const { return scanner_.token(); }
    bool check(TokenType type) const { return peek().type == type; }
    bool match(TokenType type);
    void expect(TokenType type);
    std::string expectName();
    bool isBlockEnd() const;
    [[noreturn]] void error(const std::string& message) const;

    // Statement parsing
    StatPtr parseDo();
    StatPtr parseWhile();
    StatPtr parseRepeat();
    StatPtr parseIf();
    StatPtr parseFor();
    StatPtr parseFunction();
    StatPtr parseLocal();
    StatPtr parseReturn();
    StatPtr parseExpressionStatement();

    FunctionBodyPtr parseFunctionBody(std::vector<std::string> params);
    std::vector<std::string> parseParameters();
    std::vector<std::string> parseNameList();
    ExpList parseExpressionList();

    // Expression parsing (precedence climbing)
    ExpPtr parseOr();
    ExpPtr parseAnd();
    ExpPtr parseComparison();
    ExpPtr parseConcat();
    ExpPtr parseAdditive();
    ExpPtr parseMultiplicative();
    ExpPtr parseUnary();
    ExpPtr parsePow();
    ExpPtr parsePrimary();
    ExpPtr parsePostfix(ExpPtr prefix);
    ExpPtr parseTableConstructor();

    bool isCallArgsStart() const;
    ExpList parseCallArgs();

    Scanner& scanner_;
};

/**
 * Scan and parse a whole source
 *
 * @return The syntax error message, or nothing if the source is valid
 */
std::optional<std::string> checkSyntax(const std::string& source);

} // namespace parser
} // namespace luna

#endif // LUNA_PARSER_HPP
