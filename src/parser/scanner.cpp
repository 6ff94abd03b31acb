/**
 * Scanner Implementation
 */

#include "parser/scanner.hpp"
#include <cctype>
#include <cstdlib>

namespace luna {
namespace parser {

// =============================================================================
// Token Type Strings
// =============================================================================

const char* tokenTypeToString(TokenType type) {
    switch (type) {
        case TokenType::NUMBER: return "<number>";
        case TokenType::STRING: return "<string>";
        case TokenType::NAME: return "<name>";

        case TokenType::KW_AND: return "and";
        case TokenType::KW_BREAK: return "break";
        case TokenType::KW_DO: return "do";
        case TokenType::KW_ELSE: return "else";
        case TokenType::KW_ELSEIF: return "elseif";
        case TokenType::KW_END: return "end";
        case TokenType::KW_FALSE: return "false";
        case TokenType::KW_FOR: return "for";
        case TokenType::KW_FUNCTION: return "function";
        case TokenType::KW_IF: return "if";
        case TokenType::KW_IN: return "in";
        case TokenType::KW_LOCAL: return "local";
        case TokenType::KW_NIL: return "nil";
        case TokenType::KW_NOT: return "not";
        case TokenType::KW_OR: return "or";
        case TokenType::KW_REPEAT: return "repeat";
        case TokenType::KW_RETURN: return "return";
        case TokenType::KW_THEN: return "then";
        case TokenType::KW_TRUE: return "true";
        case TokenType::KW_UNTIL: return "until";
        case TokenType::KW_WHILE: return "while";

        case TokenType::PLUS: return "+";
        case TokenType::MINUS: return "-";
        case TokenType::STAR: return "*";
        case TokenType::SLASH: return "/";
        case TokenType::PERCENT: return "%";
        case TokenType::CARET: return "^";
        case TokenType::HASH: return "#";
        case TokenType::CONCAT: return "..";

        case TokenType::EQ: return "==";
        case TokenType::NE: return "~=";
        case TokenType::LT: return "<";
        case TokenType::LE: return "<=";
        case TokenType::GT: return ">";
        case TokenType::GE: return ">=";
        case TokenType::ASSIGN: return "=";

        case TokenType::LPAREN: return "(";
        case TokenType::RPAREN: return ")";
        case TokenType::LBRACE: return "{";
        case TokenType::RBRACE: return "}";
        case TokenType::LBRACKET: return "[";
        case TokenType::RBRACKET: return "]";
        case TokenType::SEMICOLON: return ";";
        case TokenType::COLON: return ":";
        case TokenType::COMMA: return ",";
        case TokenType::DOT: return ".";
        case TokenType::ELLIPSIS: return "...";

        case TokenType::END_OF_FILE: return "<eof>";
        case TokenType::ERROR: return "<error>";
    }
    return "<unknown>";
}

namespace {

bool isDigit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }
bool isHexDigit(char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; }
bool isNameStart(char c) { return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_'; }
bool isNameChar(char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_'; }
bool isSpace(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

void appendUtf8(std::string& out, unsigned long codePoint) {
    if (codePoint < 0x80) {
        out += static_cast<char>(codePoint);
    } else if (codePoint < 0x800) {
        out += static_cast<char>(0xC0 | (codePoint >> 6));
        out += static_cast<char>(0x80 | (codePoint & 0x3F));
    } else {
        out += static_cast<char>(0xE0 | (codePoint >> 12));
        out += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codePoint & 0x3F));
    }
}

} // namespace

// =============================================================================
// Scanner Implementation
// =============================================================================

Scanner::Scanner(const std::string& source)
    : source_(source)
    , pos_(0)
{
    initKeywords();

    // #! line
    if (!source_.empty() && source_[0] == '#') {
        std::size_t newline = source_.find('\n');
        pos_ = newline == std::string::npos ? source_.length() : newline + 1;
    }

    current_ = scanToken();
}

void Scanner::initKeywords() {
    keywords_["and"] = TokenType::KW_AND;
    keywords_["break"] = TokenType::KW_BREAK;
    keywords_["do"] = TokenType::KW_DO;
    keywords_["else"] = TokenType::KW_ELSE;
    keywords_["elseif"] = TokenType::KW_ELSEIF;
    keywords_["end"] = TokenType::KW_END;
    keywords_["false"] = TokenType::KW_FALSE;
    keywords_["for"] = TokenType::KW_FOR;
    keywords_["function"] = TokenType::KW_FUNCTION;
    keywords_["if"] = TokenType::KW_IF;
    keywords_["in"] = TokenType::KW_IN;
    keywords_["local"] = TokenType::KW_LOCAL;
    keywords_["nil"] = TokenType::KW_NIL;
    keywords_["not"] = TokenType::KW_NOT;
    keywords_["or"] = TokenType::KW_OR;
    keywords_["repeat"] = TokenType::KW_REPEAT;
    keywords_["return"] = TokenType::KW_RETURN;
    keywords_["then"] = TokenType::KW_THEN;
    keywords_["true"] = TokenType::KW_TRUE;
    keywords_["until"] = TokenType::KW_UNTIL;
    keywords_["while"] = TokenType::KW_WHILE;
}

void Scanner::advance() {
    if (lookahead_) {
        current_ = std::move(*lookahead_);
        lookahead_.reset();
    } else {
        current_ = scanToken();
    }
}

const Token& Scanner::lookahead() {
    if (!lookahead_) {
        lookahead_ = scanToken();
    }
    return *lookahead_;
}

std::vector<Token> Scanner::tokenize() {
    std::vector<Token> tokens;

    while (true) {
        tokens.push_back(current_);
        if (current_.type == TokenType::END_OF_FILE) {
            break;
        }
        advance();
    }

    return tokens;
}

char Scanner::peek() const {
    if (atSourceEnd()) return '\0';
    return source_[pos_];
}

char Scanner::peekNext() const {
    if (pos_ + 1 >= source_.length()) return '\0';
    return source_[pos_ + 1];
}

bool Scanner::skipTrivia(std::size_t& errorOffset) {
    while (!atSourceEnd()) {
        char c = peek();

        if (isSpace(c)) {
            pos_++;
            continue;
        }

        if (c == '-' && peekNext() == '-') {
            std::size_t start = pos_;
            pos_ += 2;

            // Block comment --[[ ... ]]
            if (peek() == '[' && peekNext() == '[') {
                std::size_t close = source_.find("]]", pos_ + 2);
                if (close == std::string::npos) {
                    errorOffset = start;
                    return false;
                }
                pos_ = close + 2;
                continue;
            }

            // Line comment
            while (!atSourceEnd() && peek() != '\n') {
                pos_++;
            }
            continue;
        }

        break;
    }
    return true;
}

Token Scanner::scanToken() {
    std::size_t errorOffset = 0;
    if (!skipTrivia(errorOffset)) {
        pos_ = source_.length();
        return Token(TokenType::ERROR, "--[[", errorOffset);
    }

    if (atSourceEnd()) {
        return Token(TokenType::END_OF_FILE, "", source_.length());
    }

    char c = peek();

    // String literals
    if (c == '"' || c == '\'') {
        return scanString(c);
    }
    if (c == '[' && peekNext() == '[') {
        return scanLongString();
    }

    // Numbers
    if (isDigit(c)) {
        return scanNumber();
    }

    // Names and keywords
    if (isNameStart(c)) {
        return scanName();
    }

    // Operators and delimiters
    return scanOperator();
}

Token Scanner::scanString(char quote) {
    std::size_t start = pos_;
    pos_++;  // Opening quote

    std::string value;

    while (!atSourceEnd() && peek() != quote) {
        char c = source_[pos_++];

        if (c != '\\') {
            value += c;
            continue;
        }

        if (atSourceEnd()) break;

        char escaped = source_[pos_++];
        switch (escaped) {
            case 'b': value += '\b'; break;
            case 'f': value += '\f'; break;
            case 'n': value += '\n'; break;
            case 'r': value += '\r'; break;
            case 't': value += '\t'; break;
            case 'u': {
                // \uXXXX - exactly four hex digits, otherwise a literal 'u'
                if (pos_ + 4 <= source_.length() &&
                    isHexDigit(source_[pos_]) && isHexDigit(source_[pos_ + 1]) &&
                    isHexDigit(source_[pos_ + 2]) && isHexDigit(source_[pos_ + 3])) {
                    unsigned long codePoint = std::strtoul(source_.substr(pos_, 4).c_str(), nullptr, 16);
                    appendUtf8(value, codePoint);
                    pos_ += 4;
                } else {
                    value += 'u';
                }
                break;
            }
            default: value += escaped; break;
        }
    }

    if (atSourceEnd()) {
        // Unterminated
        pos_ = source_.length();
        return Token(TokenType::ERROR, std::string(1, quote), start);
    }

    pos_++;  // Closing quote
    return Token(TokenType::STRING, value, start);
}

Token Scanner::scanLongString() {
    std::size_t start = pos_;
    std::size_t close = source_.find("]]", pos_ + 2);

    if (close == std::string::npos) {
        pos_ = source_.length();
        return Token(TokenType::ERROR, "[[", start);
    }

    std::string value = source_.substr(pos_ + 2, close - pos_ - 2);
    pos_ = close + 2;
    return Token(TokenType::STRING, value, start);
}

Token Scanner::scanNumber() {
    std::size_t start = pos_;

    while (!atSourceEnd() && isDigit(peek())) {
        pos_++;
    }

    // Fraction only if a digit follows the dot, so 1..2 stays a concat
    if (peek() == '.' && isDigit(peekNext())) {
        pos_++;
        while (!atSourceEnd() && isDigit(peek())) {
            pos_++;
        }
    }

    std::string text = source_.substr(start, pos_ - start);
    Token token(TokenType::NUMBER, text, start);
    token.numberValue = std::strtod(text.c_str(), nullptr);
    return token;
}

Token Scanner::scanName() {
    std::size_t start = pos_;

    while (!atSourceEnd() && isNameChar(peek())) {
        pos_++;
    }

    std::string text = source_.substr(start, pos_ - start);
    auto it = keywords_.find(text);
    TokenType type = it != keywords_.end() ? it->second : TokenType::NAME;
    return Token(type, text, start);
}

Token Scanner::scanOperator() {
    std::size_t start = pos_;
    char c = source_[pos_++];

    auto match = [this](char expected) {
        if (atSourceEnd() || source_[pos_] != expected) return false;
        pos_++;
        return true;
    };

    switch (c) {
        case '+': return Token(TokenType::PLUS, "+", start);
        case '-': return Token(TokenType::MINUS, "-", start);
        case '*': return Token(TokenType::STAR, "*", start);
        case '/': return Token(TokenType::SLASH, "/", start);
        case '%': return Token(TokenType::PERCENT, "%", start);
        case '^': return Token(TokenType::CARET, "^", start);
        case '#': return Token(TokenType::HASH, "#", start);

        case '=':
            if (match('=')) return Token(TokenType::EQ, "==", start);
            return Token(TokenType::ASSIGN, "=", start);

        case '~':
            if (match('=')) return Token(TokenType::NE, "~=", start);
            break;

        case '<':
            if (match('=')) return Token(TokenType::LE, "<=", start);
            return Token(TokenType::LT, "<", start);

        case '>':
            if (match('=')) return Token(TokenType::GE, ">=", start);
            return Token(TokenType::GT, ">", start);

        case '.':
            if (match('.')) {
                if (match('.')) return Token(TokenType::ELLIPSIS, "...", start);
                return Token(TokenType::CONCAT, "..", start);
            }
            return Token(TokenType::DOT, ".", start);

        case '(': return Token(TokenType::LPAREN, "(", start);
        case ')': return Token(TokenType::RPAREN, ")", start);
        case '{': return Token(TokenType::LBRACE, "{", start);
        case '}': return Token(TokenType::RBRACE, "}", start);
        case '[': return Token(TokenType::LBRACKET, "[", start);
        case ']': return Token(TokenType::RBRACKET, "]", start);
        case ';': return Token(TokenType::SEMICOLON, ";", start);
        case ':': return Token(TokenType::COLON, ":", start);
        case ',': return Token(TokenType::COMMA, ",", start);

        default:
            break;
    }

    return Token(TokenType::ERROR, std::string(1, c), start);
}

} // namespace parser
} // namespace luna
