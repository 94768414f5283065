// ---------------------------------------------------------------------------
// expr_lexer.cpp
//
// 한 글자씩 전진하는 스캐너. 문자열 리터럴 내부와 주석을 구분하여
// 연산자 문자를 오인하지 않는다.
// ---------------------------------------------------------------------------

#include "script/expr/expr_lexer.hpp"

#include <array>
#include <cctype>
#include <utility>

#include <fmt/format.h>

namespace {

constexpr std::array<std::pair<std::string_view, TokenKind>, 13> kKeywords{{
    {"let",      TokenKind::kLet},
    {"fn",       TokenKind::kFn},
    {"if",       TokenKind::kIf},
    {"else",     TokenKind::kElse},
    {"while",    TokenKind::kWhile},
    {"for",      TokenKind::kFor},
    {"in",       TokenKind::kIn},
    {"return",   TokenKind::kReturn},
    {"break",    TokenKind::kBreak},
    {"continue", TokenKind::kContinue},
    {"true",     TokenKind::kTrue},
    {"false",    TokenKind::kFalse},
    {"null",     TokenKind::kNull},
}};

bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

class Scanner {
public:
    explicit Scanner(std::string_view src) : src_(src) {}

    std::expected<std::vector<Token>, LexError> run() {
        std::vector<Token> tokens;
        while (true) {
            if (auto err = skip_trivia(); !err.message.empty()) {
                return std::unexpected(err);
            }
            if (at_end()) {
                tokens.push_back(Token{TokenKind::kEnd, "", line_, column_});
                return tokens;
            }

            const std::size_t line = line_;
            const std::size_t col  = column_;
            auto token = next_token();
            if (!token) {
                return std::unexpected(LexError{token.error(), line, col});
            }
            token->line   = line;
            token->column = col;
            tokens.push_back(std::move(*token));
        }
    }

private:
    [[nodiscard]] bool at_end() const { return pos_ >= src_.size(); }
    [[nodiscard]] char peek(std::size_t ahead = 0) const {
        return pos_ + ahead < src_.size() ? src_[pos_ + ahead] : '\0';
    }

    char advance() {
        const char c = src_[pos_++];
        if (c == '\n') {
            ++line_;
            column_ = 1;
        } else {
            ++column_;
        }
        return c;
    }

    // 공백과 주석 건너뛰기. 닫히지 않은 블록 주석은 오류.
    LexError skip_trivia() {
        while (!at_end()) {
            const char c = peek();
            if (std::isspace(static_cast<unsigned char>(c)) != 0) {
                advance();
            } else if (c == '/' && peek(1) == '/') {
                while (!at_end() && peek() != '\n') {
                    advance();
                }
            } else if (c == '/' && peek(1) == '*') {
                const std::size_t line = line_;
                const std::size_t col  = column_;
                advance();
                advance();
                while (!at_end() && !(peek() == '*' && peek(1) == '/')) {
                    advance();
                }
                if (at_end()) {
                    return LexError{"unterminated block comment", line, col};
                }
                advance();
                advance();
            } else {
                break;
            }
        }
        return LexError{"", 0, 0};
    }

    std::expected<Token, std::string> next_token() {
        const char c = peek();

        if (is_ident_start(c)) {
            const std::size_t start = pos_;
            while (!at_end() && is_ident_char(peek())) {
                advance();
            }
            const std::string_view word = src_.substr(start, pos_ - start);
            for (const auto& [kw, kind] : kKeywords) {
                if (kw == word) {
                    return Token{kind, std::string(word)};
                }
            }
            return Token{TokenKind::kIdent, std::string(word)};
        }

        if (is_digit(c)) {
            return number();
        }
        if (c == '"') {
            return string_literal();
        }

        advance();
        switch (c) {
            case '(': return Token{TokenKind::kLParen, "("};
            case ')': return Token{TokenKind::kRParen, ")"};
            case '{': return Token{TokenKind::kLBrace, "{"};
            case '}': return Token{TokenKind::kRBrace, "}"};
            case '[': return Token{TokenKind::kLBracket, "["};
            case ']': return Token{TokenKind::kRBracket, "]"};
            case ',': return Token{TokenKind::kComma, ","};
            case ':': return Token{TokenKind::kColon, ":"};
            case ';': return Token{TokenKind::kSemicolon, ";"};
            case '.': return Token{TokenKind::kDot, "."};
            case '+': return Token{TokenKind::kPlus, "+"};
            case '-': return Token{TokenKind::kMinus, "-"};
            case '*': return Token{TokenKind::kStar, "*"};
            case '/': return Token{TokenKind::kSlash, "/"};
            case '%': return Token{TokenKind::kPercent, "%"};
            case '#':
                if (peek() == '{') {
                    advance();
                    return Token{TokenKind::kMapOpen, "#{"};
                }
                return std::unexpected("expected '{' after '#'");
            case '=':
                if (peek() == '=') { advance(); return Token{TokenKind::kEq, "=="}; }
                return Token{TokenKind::kAssign, "="};
            case '!':
                if (peek() == '=') { advance(); return Token{TokenKind::kNe, "!="}; }
                return Token{TokenKind::kBang, "!"};
            case '<':
                if (peek() == '=') { advance(); return Token{TokenKind::kLe, "<="}; }
                return Token{TokenKind::kLt, "<"};
            case '>':
                if (peek() == '=') { advance(); return Token{TokenKind::kGe, ">="}; }
                return Token{TokenKind::kGt, ">"};
            case '&':
                if (peek() == '&') { advance(); return Token{TokenKind::kAndAnd, "&&"}; }
                return std::unexpected("unexpected '&' (did you mean '&&'?)");
            case '|':
                if (peek() == '|') { advance(); return Token{TokenKind::kOrOr, "||"}; }
                return std::unexpected("unexpected '|' (did you mean '||'?)");
            default:
                return std::unexpected(fmt::format("unexpected character '{}'", c));
        }
    }

    std::expected<Token, std::string> number() {
        const std::size_t start = pos_;
        bool is_float = false;
        while (!at_end() && is_digit(peek())) {
            advance();
        }
        // "1.5" 는 float, "arr.len()" 의 '.' 와 구분하기 위해 뒤가 숫자일 때만
        if (peek() == '.' && is_digit(peek(1))) {
            is_float = true;
            advance();
            while (!at_end() && is_digit(peek())) {
                advance();
            }
        }
        if (is_ident_start(peek())) {
            return std::unexpected("invalid numeric literal");
        }
        return Token{is_float ? TokenKind::kFloat : TokenKind::kInt,
                     std::string(src_.substr(start, pos_ - start))};
    }

    std::expected<Token, std::string> string_literal() {
        advance();  // opening quote
        std::string value;
        while (!at_end() && peek() != '"') {
            char c = advance();
            if (c == '\\') {
                if (at_end()) {
                    break;
                }
                const char esc = advance();
                switch (esc) {
                    case '"':  c = '"';  break;
                    case '\\': c = '\\'; break;
                    case 'n':  c = '\n'; break;
                    case 't':  c = '\t'; break;
                    case 'r':  c = '\r'; break;
                    default:
                        return std::unexpected(fmt::format("unknown escape '\\{}'", esc));
                }
            } else if (c == '\n') {
                return std::unexpected("newline in string literal");
            }
            value.push_back(c);
        }
        if (at_end()) {
            return std::unexpected("unterminated string literal");
        }
        advance();  // closing quote
        return Token{TokenKind::kString, std::move(value)};
    }

    std::string_view src_;
    std::size_t      pos_{0};
    std::size_t      line_{1};
    std::size_t      column_{1};
};

}  // namespace

std::expected<std::vector<Token>, LexError> tokenize(std::string_view source) {
    return Scanner(source).run();
}

std::string_view token_kind_name(TokenKind kind) noexcept {
    switch (kind) {
        case TokenKind::kEnd:       return "end of input";
        case TokenKind::kIdent:     return "identifier";
        case TokenKind::kInt:       return "integer";
        case TokenKind::kFloat:     return "float";
        case TokenKind::kString:    return "string";
        case TokenKind::kLParen:    return "'('";
        case TokenKind::kRParen:    return "')'";
        case TokenKind::kLBrace:    return "'{'";
        case TokenKind::kRBrace:    return "'}'";
        case TokenKind::kLBracket:  return "'['";
        case TokenKind::kRBracket:  return "']'";
        case TokenKind::kMapOpen:   return "'#{'";
        case TokenKind::kComma:     return "','";
        case TokenKind::kColon:     return "':'";
        case TokenKind::kSemicolon: return "';'";
        case TokenKind::kDot:       return "'.'";
        case TokenKind::kAssign:    return "'='";
        default:                    return "token";
    }
}
