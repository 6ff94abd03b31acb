/**
 * Recursive Descent Parser Implementation
 */

#include "parser/parser.hpp"

namespace luna {
namespace parser {

// ============================================================================
// Token Stream Management
// ============================================================================

bool Parser::match(TokenType type) {
    if (check(type)) {
        scanner_.advance();
        return true;
    }
    return false;
}

void Parser::expect(TokenType type) {
    if (!check(type)) {
        error(std::string("expected '") + tokenTypeToString(type) + "'");
    }
    scanner_.advance();
}

std::string Parser::expectName() {
    if (!check(TokenType::NAME)) {
        error("Name expected");
    }
    std::string name = peek().lexeme;
    scanner_.advance();
    return name;
}

bool Parser::isBlockEnd() const {
    TokenType t = peek().type;
    return t == TokenType::END_OF_FILE || t == TokenType::KW_ELSE ||
           t == TokenType::KW_ELSEIF || t == TokenType::KW_END ||
           t == TokenType::KW_UNTIL;
}

void Parser::error(const std::string& message) const {
    const Token& tok = peek();
    if (tok.type == TokenType::ERROR) {
        throw SyntaxError("invalid token '" + tok.lexeme + "'", tok.offset, tok.lexeme);
    }
    throw SyntaxError(message, tok.offset, tok.lexeme);
}

// ============================================================================
// Entry Points
// ============================================================================

Block Parser::parseBlock() {
    Block block;

    // Empty statements are skipped; a ';' may also close the block
    while (match(TokenType::SEMICOLON)) {}
    if (isBlockEnd()) return block;

    block.stats.push_back(parseStatement());
    while (match(TokenType::SEMICOLON)) {
        while (match(TokenType::SEMICOLON)) {}
        if (isBlockEnd()) break;
        block.stats.push_back(parseStatement());
    }
    return block;
}

Block Parser::parseChunk() {
    Block block = parseBlock();
    if (!scanner_.isAtEnd()) {
        error("expected end of input");
    }
    return block;
}

// ============================================================================
// Statement Parsing
// ============================================================================

StatPtr Parser::parseStatement() {
    switch (peek().type) {
        case TokenType::KW_DO: return parseDo();
        case TokenType::KW_WHILE: return parseWhile();
        case TokenType::KW_REPEAT: return parseRepeat();
        case TokenType::KW_IF: return parseIf();
        case TokenType::KW_FOR: return parseFor();
        case TokenType::KW_FUNCTION: return parseFunction();
        case TokenType::KW_LOCAL: return parseLocal();
        case TokenType::KW_RETURN: return parseReturn();
        case TokenType::KW_BREAK: {
            std::size_t offset = peek().offset;
            scanner_.advance();
            return makeStat(Break{}, offset);
        }
        default:
            return parseExpressionStatement();
    }
}

StatPtr Parser::parseDo() {
    std::size_t offset = peek().offset;
    expect(TokenType::KW_DO);
    Block block = parseBlock();
    expect(TokenType::KW_END);
    return makeStat(std::move(block), offset);
}

StatPtr Parser::parseWhile() {
    std::size_t offset = peek().offset;
    expect(TokenType::KW_WHILE);
    ExpPtr cond = parseExpression();
    expect(TokenType::KW_DO);
    Block block = parseBlock();
    expect(TokenType::KW_END);
    return makeStat(While{std::move(cond), std::move(block)}, offset);
}

StatPtr Parser::parseRepeat() {
    std::size_t offset = peek().offset;
    expect(TokenType::KW_REPEAT);
    Block block = parseBlock();
    expect(TokenType::KW_UNTIL);
    ExpPtr cond = parseExpression();
    return makeStat(Repeat{std::move(block), std::move(cond)}, offset);
}

StatPtr Parser::parseIf() {
    // Entered on 'if' or, for a nested branch, on 'elseif'
    std::size_t offset = peek().offset;
    scanner_.advance();

    ExpPtr cond = parseExpression();
    expect(TokenType::KW_THEN);
    Block thenBlock = parseBlock();
    Block elseBlock;

    if (check(TokenType::KW_ELSEIF)) {
        // The nested If consumes the shared 'end'
        elseBlock.stats.push_back(parseIf());
        return makeStat(If{std::move(cond), std::move(thenBlock), std::move(elseBlock)}, offset);
    }
    if (match(TokenType::KW_ELSE)) {
        elseBlock = parseBlock();
    }
    expect(TokenType::KW_END);
    return makeStat(If{std::move(cond), std::move(thenBlock), std::move(elseBlock)}, offset);
}

StatPtr Parser::parseFor() {
    std::size_t offset = peek().offset;
    expect(TokenType::KW_FOR);
    std::vector<std::string> names = parseNameList();

    if (check(TokenType::ASSIGN)) {
        if (names.size() != 1) {
            error("only one name before '=' allowed");
        }
        scanner_.advance();
        ExpPtr start = parseExpression();
        expect(TokenType::COMMA);
        ExpPtr stop = parseExpression();
        ExpPtr step;
        if (match(TokenType::COMMA)) {
            step = parseExpression();
        } else {
            step = makeExp(Lit{runtime::Value::number(1)}, peek().offset);
        }
        expect(TokenType::KW_DO);
        Block block = parseBlock();
        expect(TokenType::KW_END);
        return makeStat(NumericFor{names[0], std::move(start), std::move(stop),
                                   std::move(step), std::move(block)}, offset);
    }

    expect(TokenType::KW_IN);
    ExpList exps = parseExpressionList();
    expect(TokenType::KW_DO);
    Block block = parseBlock();
    expect(TokenType::KW_END);
    return makeStat(GenericFor{std::move(names), std::move(exps), std::move(block)}, offset);
}

StatPtr Parser::parseFunction() {
    std::size_t offset = peek().offset;
    expect(TokenType::KW_FUNCTION);

    // funcname = Name {"." Name} [":" Name]
    std::vector<std::string> names;
    names.push_back(expectName());
    while (match(TokenType::DOT)) {
        names.push_back(expectName());
    }

    if (match(TokenType::COLON)) {
        std::string method = expectName();
        std::vector<std::string> params = parseParameters();
        params.insert(params.begin(), "self");
        FunctionBodyPtr body = parseFunctionBody(std::move(params));
        return makeStat(MethDef{std::move(names), std::move(method), std::move(body)}, offset);
    }

    FunctionBodyPtr body = parseFunctionBody(parseParameters());
    return makeStat(FuncDef{std::move(names), std::move(body)}, offset);
}

StatPtr Parser::parseLocal() {
    std::size_t offset = peek().offset;
    expect(TokenType::KW_LOCAL);

    if (match(TokenType::KW_FUNCTION)) {
        std::string name = expectName();
        FunctionBodyPtr body = parseFunctionBody(parseParameters());
        return makeStat(LocalFuncDef{std::move(name), std::move(body)}, offset);
    }

    std::vector<std::string> names = parseNameList();
    ExpList exps;
    if (match(TokenType::ASSIGN)) {
        exps = parseExpressionList();
    }
    return makeStat(Local{std::move(names), std::move(exps)}, offset);
}

StatPtr Parser::parseReturn() {
    std::size_t offset = peek().offset;
    expect(TokenType::KW_RETURN);

    ExpList exps;
    if (!isBlockEnd() && !check(TokenType::SEMICOLON)) {
        exps = parseExpressionList();
    }
    return makeStat(Return{std::move(exps)}, offset);
}

StatPtr Parser::parseExpressionStatement() {
    std::size_t offset = peek().offset;
    ExpPtr first = parseExpression();

    if (first->isAssignable()) {
        // Start of a varlist: every target must be a Var or an Index
        ExpList targets;
        targets.push_back(std::move(first));
        while (match(TokenType::COMMA)) {
            ExpPtr target = parseExpression();
            if (!target->isAssignable()) {
                throw SyntaxError("cannot assign to this expression", target->offset);
            }
            targets.push_back(std::move(target));
        }
        expect(TokenType::ASSIGN);
        ExpList exps = parseExpressionList();
        return makeStat(Assign{std::move(targets), std::move(exps)}, offset);
    }

    if (first->isCall()) {
        return makeStat(CallStat{std::move(first)}, offset);
    }

    throw SyntaxError("do, while, repeat, if, for, function, local, call or assignment expected",
                      offset);
}

// ============================================================================
// Function Bodies & Lists
// ============================================================================

FunctionBodyPtr Parser::parseFunctionBody(std::vector<std::string> params) {
    auto body = std::make_shared<FunctionBody>();
    body->params = std::move(params);
    body->block = parseBlock();
    expect(TokenType::KW_END);
    return body;
}

std::vector<std::string> Parser::parseParameters() {
    // parlist = "(" [Name {"," Name} ["," "..."] | "..."] ")"
    std::vector<std::string> params;
    expect(TokenType::LPAREN);

    if (!check(TokenType::RPAREN)) {
        do {
            if (match(TokenType::ELLIPSIS)) {
                params.push_back(kVarargs);
                break;
            }
            params.push_back(expectName());
        } while (match(TokenType::COMMA));
    }

    expect(TokenType::RPAREN);
    return params;
}

std::vector<std::string> Parser::parseNameList() {
    std::vector<std::string> names;
    names.push_back(expectName());
    while (match(TokenType::COMMA)) {
        names.push_back(expectName());
    }
    return names;
}

ExpList Parser::parseExpressionList() {
    ExpList exps;
    exps.push_back(parseExpression());
    while (match(TokenType::COMMA)) {
        exps.push_back(parseExpression());
    }
    return exps;
}

// ============================================================================
// Expression Parsing - Precedence Climbing
// ============================================================================

ExpPtr Parser::parseExpression() {
    return parseOr();
}

ExpPtr Parser::parseOr() {
    ExpPtr left = parseAnd();
    while (check(TokenType::KW_OR)) {
        std::size_t offset = left->offset;
        scanner_.advance();
        left = makeExp(Binary{BinaryOp::Or, std::move(left), parseAnd()}, offset);
    }
    return left;
}

ExpPtr Parser::parseAnd() {
    ExpPtr left = parseComparison();
    while (check(TokenType::KW_AND)) {
        std::size_t offset = left->offset;
        scanner_.advance();
        left = makeExp(Binary{BinaryOp::And, std::move(left), parseComparison()}, offset);
    }
    return left;
}

ExpPtr Parser::parseComparison() {
    ExpPtr left = parseConcat();

    // Left-chaining: a < b < c is (a < b) < c
    while (true) {
        BinaryOp op;
        switch (peek().type) {
            case TokenType::LT: op = BinaryOp::Lt; break;
            case TokenType::GT: op = BinaryOp::Gt; break;
            case TokenType::LE: op = BinaryOp::Le; break;
            case TokenType::GE: op = BinaryOp::Ge; break;
            case TokenType::NE: op = BinaryOp::Ne; break;
            case TokenType::EQ: op = BinaryOp::Eq; break;
            default: return left;
        }
        std::size_t offset = left->offset;
        scanner_.advance();
        left = makeExp(Binary{op, std::move(left), parseConcat()}, offset);
    }
}

ExpPtr Parser::parseConcat() {
    ExpPtr left = parseAdditive();
    if (check(TokenType::CONCAT)) {
        std::size_t offset = left->offset;
        scanner_.advance();
        return makeExp(Binary{BinaryOp::Concat, std::move(left), parseConcat()}, offset);
    }
    return left;
}

ExpPtr Parser::parseAdditive() {
    ExpPtr left = parseMultiplicative();
    while (check(TokenType::PLUS) || check(TokenType::MINUS)) {
        BinaryOp op = check(TokenType::PLUS) ? BinaryOp::Add : BinaryOp::Sub;
        std::size_t offset = left->offset;
        scanner_.advance();
        left = makeExp(Binary{op, std::move(left), parseMultiplicative()}, offset);
    }
    return left;
}

ExpPtr Parser::parseMultiplicative() {
    ExpPtr left = parseUnary();
    while (true) {
        BinaryOp op;
        switch (peek().type) {
            case TokenType::STAR: op = BinaryOp::Mul; break;
            case TokenType::SLASH: op = BinaryOp::Div; break;
            case TokenType::PERCENT: op = BinaryOp::Mod; break;
            default: return left;
        }
        std::size_t offset = left->offset;
        scanner_.advance();
        left = makeExp(Binary{op, std::move(left), parseUnary()}, offset);
    }
}

ExpPtr Parser::parseUnary() {
    std::size_t offset = peek().offset;
    if (match(TokenType::KW_NOT)) {
        return makeExp(Unary{UnaryOp::Not, parseUnary()}, offset);
    }
    if (match(TokenType::HASH)) {
        return makeExp(Unary{UnaryOp::Len, parseUnary()}, offset);
    }
    if (match(TokenType::MINUS)) {
        return makeExp(Unary{UnaryOp::Neg, parseUnary()}, offset);
    }
    return parsePow();
}

ExpPtr Parser::parsePow() {
    ExpPtr base = parsePrimary();
    if (check(TokenType::CARET)) {
        std::size_t offset = base->offset;
        scanner_.advance();
        // Right operand may carry its own unary prefix: 2 ^ -3
        return makeExp(Binary{BinaryOp::Pow, std::move(base), parseUnary()}, offset);
    }
    return base;
}

// ============================================================================
// Primary & Postfix Expressions
// ============================================================================

ExpPtr Parser::parsePrimary() {
    const Token& tok = peek();
    std::size_t offset = tok.offset;

    switch (tok.type) {
        case TokenType::KW_NIL:
            scanner_.advance();
            return makeExp(Lit{runtime::Value::nil()}, offset);
        case TokenType::KW_TRUE:
            scanner_.advance();
            return makeExp(Lit{runtime::Value::boolean(true)}, offset);
        case TokenType::KW_FALSE:
            scanner_.advance();
            return makeExp(Lit{runtime::Value::boolean(false)}, offset);
        case TokenType::NUMBER: {
            double number = tok.numberValue;
            scanner_.advance();
            return makeExp(Lit{runtime::Value::number(number)}, offset);
        }
        case TokenType::STRING: {
            std::string text = tok.lexeme;
            scanner_.advance();
            return makeExp(Lit{runtime::Value::string(std::move(text))}, offset);
        }
        case TokenType::ELLIPSIS:
            scanner_.advance();
            return makeExp(Var{kVarargs}, offset);
        case TokenType::KW_FUNCTION: {
            scanner_.advance();
            FunctionBodyPtr body = parseFunctionBody(parseParameters());
            return makeExp(Func{std::move(body)}, offset);
        }
        case TokenType::LBRACE:
            return parseTableConstructor();
        case TokenType::NAME: {
            std::string name = tok.lexeme;
            scanner_.advance();
            return parsePostfix(makeExp(Var{std::move(name)}, offset));
        }
        case TokenType::LPAREN: {
            scanner_.advance();
            ExpPtr inner = parseExpression();
            expect(TokenType::RPAREN);
            // Parentheses only matter where they truncate results or
            // stop a variable from being an assignment target
            if (inner->isCall() || inner->isAssignable()) {
                inner = makeExp(Paren{std::move(inner)}, offset);
            }
            return parsePostfix(std::move(inner));
        }
        default:
            error("unexpected token");
    }
}

ExpPtr Parser::parsePostfix(ExpPtr prefix) {
    while (true) {
        std::size_t offset = prefix->offset;

        if (match(TokenType::LBRACKET)) {
            ExpPtr key = parseExpression();
            expect(TokenType::RBRACKET);
            prefix = makeExp(Index{std::move(prefix), std::move(key)}, offset);
        } else if (check(TokenType::DOT)) {
            scanner_.advance();
            std::size_t keyOffset = peek().offset;
            ExpPtr key = makeExp(Lit{runtime::Value::string(expectName())}, keyOffset);
            prefix = makeExp(Index{std::move(prefix), std::move(key)}, offset);
        } else if (match(TokenType::COLON)) {
            std::string method = expectName();
            if (!isCallArgsStart()) {
                error("expected arguments after method name");
            }
            ExpList args = parseCallArgs();
            prefix = makeExp(MethCall{std::move(prefix), std::move(method), std::move(args)}, offset);
        } else if (isCallArgsStart()) {
            ExpList args = parseCallArgs();
            prefix = makeExp(FuncCall{std::move(prefix), std::move(args)}, offset);
        } else {
            return prefix;
        }
    }
}

bool Parser::isCallArgsStart() const {
    return check(TokenType::LPAREN) || check(TokenType::LBRACE) || check(TokenType::STRING);
}

ExpList Parser::parseCallArgs() {
    // args = "(" [explist] ")" | tableconstructor | String
    ExpList args;

    if (check(TokenType::STRING)) {
        std::size_t offset = peek().offset;
        std::string text = peek().lexeme;
        scanner_.advance();
        args.push_back(makeExp(Lit{runtime::Value::string(std::move(text))}, offset));
        return args;
    }
    if (check(TokenType::LBRACE)) {
        args.push_back(parseTableConstructor());
        return args;
    }

    expect(TokenType::LPAREN);
    if (!check(TokenType::RPAREN)) {
        args = parseExpressionList();
    }
    expect(TokenType::RPAREN);
    return args;
}

ExpPtr Parser::parseTableConstructor() {
    // fieldlist = field {fieldsep field} [fieldsep], fieldsep = "," | ";"
    std::size_t offset = peek().offset;
    expect(TokenType::LBRACE);

    std::vector<Field> fields;
    while (!check(TokenType::RBRACE)) {
        Field field;
        if (match(TokenType::LBRACKET)) {
            field.key = parseExpression();
            expect(TokenType::RBRACKET);
            expect(TokenType::ASSIGN);
            field.value = parseExpression();
        } else if (check(TokenType::NAME) && scanner_.lookahead().type == TokenType::ASSIGN) {
            std::size_t keyOffset = peek().offset;
            field.key = makeExp(Lit{runtime::Value::string(expectName())}, keyOffset);
            scanner_.advance();
            field.value = parseExpression();
        } else {
            field.value = parseExpression();
        }
        fields.push_back(std::move(field));

        if (!match(TokenType::COMMA) && !match(TokenType::SEMICOLON)) {
            break;
        }
    }

    expect(TokenType::RBRACE);
    return makeExp(TableConst{std::move(fields)}, offset);
}

// ============================================================================
// Convenience
// ============================================================================

std::optional<std::string> checkSyntax(const std::string& source) {
    try {
        Scanner scanner(source);
        Parser parser(scanner);
        parser.parseChunk();
    } catch (const SyntaxError& e) {
        return std::string(e.what());
    }
    return std::nullopt;
}

} // namespace parser
} // namespace luna
