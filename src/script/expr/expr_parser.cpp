// ---------------------------------------------------------------------------
// expr_parser.cpp
//
// [문장 구분]
// ';' 는 선택적 구분자다. 블록의 마지막 문장 값이 블록의 값이 된다.
//   if has_role("doctor") { allow() } else { deny("not a doctor") }
//
// [함수 정의]
// fn 은 최상위에서만 허용되며 실행 전에 모두 등록된다 (호이스팅).
// ---------------------------------------------------------------------------

#include "script/expr/expr_parser.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

namespace {

// 파서 내부 실패. parse_program() 경계에서 ParseFailure 로 변환된다.
class ParseAbort : public std::runtime_error {
public:
    ParseAbort(const std::string& what, bool depth_exceeded)
        : std::runtime_error(what), depth_exceeded_(depth_exceeded) {}

    [[nodiscard]] bool depth_exceeded() const noexcept { return depth_exceeded_; }

private:
    bool depth_exceeded_;
};

class Parser {
public:
    Parser(std::vector<Token> tokens, std::uint32_t max_depth)
        : tokens_(std::move(tokens)), max_depth_(max_depth) {}

    void parse_into(Program& program) {
        while (!check(TokenKind::kEnd)) {
            if (check(TokenKind::kFn)) {
                auto fn = parse_function();
                const std::string name = fn.name;
                if (!program.functions.emplace(name, std::move(fn)).second) {
                    fail(fmt::format("function '{}' is defined twice", name));
                }
                continue;
            }
            program.statements.push_back(parse_statement());
        }
    }

private:
    // -----------------------------------------------------------------------
    // 중첩 깊이 추적 (RAII)
    // -----------------------------------------------------------------------
    class DepthGuard {
    public:
        explicit DepthGuard(Parser& p) : p_(p) {
            if (++p_.depth_ > p_.max_depth_) {
                throw ParseAbort(fmt::format("expression nesting exceeds {} at line {}",
                                             p_.max_depth_, p_.peek().line),
                                 true);
            }
        }
        ~DepthGuard() { --p_.depth_; }

        DepthGuard(const DepthGuard&)            = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;

    private:
        Parser& p_;
    };

    // -----------------------------------------------------------------------
    // 토큰 커서
    // -----------------------------------------------------------------------
    [[nodiscard]] const Token& peek(std::size_t ahead = 0) const {
        const std::size_t idx = std::min(pos_ + ahead, tokens_.size() - 1);
        return tokens_[idx];
    }
    [[nodiscard]] bool check(TokenKind kind) const { return peek().kind == kind; }

    bool match(TokenKind kind) {
        if (check(kind)) {
            ++pos_;
            return true;
        }
        return false;
    }

    const Token& expect(TokenKind kind, std::string_view context) {
        if (!check(kind)) {
            fail(fmt::format("expected {} {}, found '{}'", token_kind_name(kind), context,
                             peek().kind == TokenKind::kEnd ? "end of input" : peek().text));
        }
        return tokens_[pos_++];
    }

    [[noreturn]] void fail(const std::string& message) const {
        throw ParseAbort(fmt::format("line {}, col {}: {}", peek().line, peek().column, message), false);
    }

    // -----------------------------------------------------------------------
    // 문장
    // -----------------------------------------------------------------------
    FunctionDef parse_function() {
        expect(TokenKind::kFn, "");
        FunctionDef fn;
        fn.name = expect(TokenKind::kIdent, "after 'fn'").text;
        expect(TokenKind::kLParen, "after function name");
        if (!check(TokenKind::kRParen)) {
            do {
                fn.params.push_back(expect(TokenKind::kIdent, "in parameter list").text);
            } while (match(TokenKind::kComma));
        }
        expect(TokenKind::kRParen, "after parameters");
        fn.body = parse_block();
        return fn;
    }

    std::vector<StmtPtr> parse_block() {
        DepthGuard guard(*this);
        expect(TokenKind::kLBrace, "to open block");
        std::vector<StmtPtr> body;
        while (!check(TokenKind::kRBrace)) {
            if (check(TokenKind::kEnd)) {
                fail("unterminated block");
            }
            if (check(TokenKind::kFn)) {
                fail("'fn' is only allowed at the top level");
            }
            body.push_back(parse_statement());
        }
        expect(TokenKind::kRBrace, "to close block");
        return body;
    }

    StmtPtr make_stmt(StmtKind kind) const {
        auto stmt  = std::make_unique<Stmt>();
        stmt->kind = kind;
        stmt->line = peek().line;
        return stmt;
    }

    StmtPtr parse_statement() {
        StmtPtr stmt;

        if (match(TokenKind::kLet)) {
            stmt       = make_stmt(StmtKind::kLet);
            stmt->name = expect(TokenKind::kIdent, "after 'let'").text;
            expect(TokenKind::kAssign, "after variable name");
            stmt->expr = parse_expression();
        } else if (check(TokenKind::kIdent) && peek(1).kind == TokenKind::kAssign) {
            stmt       = make_stmt(StmtKind::kAssign);
            stmt->name = tokens_[pos_].text;
            pos_ += 2;
            stmt->expr = parse_expression();
        } else if (check(TokenKind::kIf)) {
            stmt = parse_if();
        } else if (match(TokenKind::kWhile)) {
            stmt       = make_stmt(StmtKind::kWhile);
            stmt->expr = parse_expression();
            stmt->body = parse_block();
        } else if (match(TokenKind::kFor)) {
            stmt       = make_stmt(StmtKind::kFor);
            stmt->name = expect(TokenKind::kIdent, "after 'for'").text;
            expect(TokenKind::kIn, "in for loop");
            stmt->expr = parse_expression();
            stmt->body = parse_block();
        } else if (match(TokenKind::kReturn)) {
            stmt = make_stmt(StmtKind::kReturn);
            if (!check(TokenKind::kSemicolon) && !check(TokenKind::kRBrace) && !check(TokenKind::kEnd)) {
                stmt->expr = parse_expression();
            }
        } else if (match(TokenKind::kBreak)) {
            stmt = make_stmt(StmtKind::kBreak);
        } else if (match(TokenKind::kContinue)) {
            stmt = make_stmt(StmtKind::kContinue);
        } else if (check(TokenKind::kLBrace)) {
            stmt       = make_stmt(StmtKind::kBlock);
            stmt->body = parse_block();
        } else {
            stmt       = make_stmt(StmtKind::kExpr);
            stmt->expr = parse_expression();
        }

        while (match(TokenKind::kSemicolon)) {
        }
        return stmt;
    }

    StmtPtr parse_if() {
        expect(TokenKind::kIf, "");
        auto stmt  = make_stmt(StmtKind::kIf);
        stmt->expr = parse_expression();
        stmt->body = parse_block();
        if (match(TokenKind::kElse)) {
            if (check(TokenKind::kIf)) {
                DepthGuard guard(*this);
                stmt->else_body.push_back(parse_if());
            } else {
                stmt->else_body = parse_block();
            }
        }
        return stmt;
    }

    // -----------------------------------------------------------------------
    // 식
    // -----------------------------------------------------------------------
    ExprPtr make_expr(ExprKind kind, std::size_t line) const {
        auto expr  = std::make_unique<Expr>();
        expr->kind = kind;
        expr->line = line;
        return expr;
    }

    ExprPtr binary(ExprKind kind, TokenKind op, ExprPtr lhs, ExprPtr rhs, std::size_t line) const {
        auto expr = make_expr(kind, line);
        expr->op  = op;
        expr->children.push_back(std::move(lhs));
        expr->children.push_back(std::move(rhs));
        return expr;
    }

    ExprPtr parse_expression() {
        DepthGuard guard(*this);
        return parse_or();
    }

    ExprPtr parse_or() {
        auto lhs = parse_and();
        while (check(TokenKind::kOrOr)) {
            const auto line = peek().line;
            ++pos_;
            lhs = binary(ExprKind::kOr, TokenKind::kOrOr, std::move(lhs), parse_and(), line);
        }
        return lhs;
    }

    ExprPtr parse_and() {
        auto lhs = parse_equality();
        while (check(TokenKind::kAndAnd)) {
            const auto line = peek().line;
            ++pos_;
            lhs = binary(ExprKind::kAnd, TokenKind::kAndAnd, std::move(lhs), parse_equality(), line);
        }
        return lhs;
    }

    ExprPtr parse_equality() {
        auto lhs = parse_comparison();
        while (check(TokenKind::kEq) || check(TokenKind::kNe)) {
            const Token op = tokens_[pos_++];
            lhs = binary(ExprKind::kBinary, op.kind, std::move(lhs), parse_comparison(), op.line);
        }
        return lhs;
    }

    ExprPtr parse_comparison() {
        auto lhs = parse_additive();
        while (check(TokenKind::kLt) || check(TokenKind::kLe) || check(TokenKind::kGt) ||
               check(TokenKind::kGe)) {
            const Token op = tokens_[pos_++];
            lhs = binary(ExprKind::kBinary, op.kind, std::move(lhs), parse_additive(), op.line);
        }
        return lhs;
    }

    ExprPtr parse_additive() {
        auto lhs = parse_multiplicative();
        while (check(TokenKind::kPlus) || check(TokenKind::kMinus)) {
            const Token op = tokens_[pos_++];
            lhs = binary(ExprKind::kBinary, op.kind, std::move(lhs), parse_multiplicative(), op.line);
        }
        return lhs;
    }

    ExprPtr parse_multiplicative() {
        auto lhs = parse_unary();
        while (check(TokenKind::kStar) || check(TokenKind::kSlash) || check(TokenKind::kPercent)) {
            const Token op = tokens_[pos_++];
            lhs = binary(ExprKind::kBinary, op.kind, std::move(lhs), parse_unary(), op.line);
        }
        return lhs;
    }

    ExprPtr parse_unary() {
        if (check(TokenKind::kBang) || check(TokenKind::kMinus)) {
            DepthGuard guard(*this);
            const Token op = tokens_[pos_++];
            auto expr = make_expr(ExprKind::kUnary, op.line);
            expr->op  = op.kind;
            expr->children.push_back(parse_unary());
            return expr;
        }
        return parse_postfix();
    }

    std::vector<ExprPtr> parse_arguments() {
        std::vector<ExprPtr> args;
        if (!check(TokenKind::kRParen)) {
            do {
                args.push_back(parse_expression());
            } while (match(TokenKind::kComma));
        }
        expect(TokenKind::kRParen, "after arguments");
        return args;
    }

    ExprPtr parse_postfix() {
        auto expr = parse_primary();
        while (true) {
            const auto line = peek().line;
            if (match(TokenKind::kDot)) {
                const std::string name = expect(TokenKind::kIdent, "after '.'").text;
                if (match(TokenKind::kLParen)) {
                    auto call  = make_expr(ExprKind::kMethodCall, line);
                    call->name = name;
                    call->children.push_back(std::move(expr));
                    for (auto& arg : parse_arguments()) {
                        call->children.push_back(std::move(arg));
                    }
                    expr = std::move(call);
                } else {
                    auto member  = make_expr(ExprKind::kMember, line);
                    member->name = name;
                    member->children.push_back(std::move(expr));
                    expr = std::move(member);
                }
            } else if (match(TokenKind::kLBracket)) {
                auto index = make_expr(ExprKind::kIndex, line);
                index->children.push_back(std::move(expr));
                index->children.push_back(parse_expression());
                expect(TokenKind::kRBracket, "after index");
                expr = std::move(index);
            } else {
                return expr;
            }
        }
    }

    ExprPtr parse_primary() {
        const Token tok = peek();

        switch (tok.kind) {
            case TokenKind::kInt: {
                ++pos_;
                std::int64_t value{0};
                const auto [ptr, ec] =
                    std::from_chars(tok.text.data(), tok.text.data() + tok.text.size(), value);
                if (ec != std::errc{}) {
                    fail(fmt::format("integer literal '{}' out of range", tok.text));
                }
                auto expr     = make_expr(ExprKind::kLiteral, tok.line);
                expr->literal = ExprValue(value);
                return expr;
            }
            case TokenKind::kFloat: {
                ++pos_;
                auto expr     = make_expr(ExprKind::kLiteral, tok.line);
                expr->literal = ExprValue(std::strtod(tok.text.c_str(), nullptr));
                return expr;
            }
            case TokenKind::kString: {
                ++pos_;
                auto expr     = make_expr(ExprKind::kLiteral, tok.line);
                expr->literal = ExprValue(tok.text);
                return expr;
            }
            case TokenKind::kTrue:
            case TokenKind::kFalse: {
                ++pos_;
                auto expr     = make_expr(ExprKind::kLiteral, tok.line);
                expr->literal = ExprValue(tok.kind == TokenKind::kTrue);
                return expr;
            }
            case TokenKind::kNull: {
                ++pos_;
                return make_expr(ExprKind::kLiteral, tok.line);
            }
            case TokenKind::kIdent: {
                ++pos_;
                if (match(TokenKind::kLParen)) {
                    auto call      = make_expr(ExprKind::kCall, tok.line);
                    call->name     = tok.text;
                    call->children = parse_arguments();
                    return call;
                }
                auto var  = make_expr(ExprKind::kVariable, tok.line);
                var->name = tok.text;
                return var;
            }
            case TokenKind::kLParen: {
                ++pos_;
                auto inner = parse_expression();
                expect(TokenKind::kRParen, "to close '('");
                return inner;
            }
            case TokenKind::kLBracket: {
                ++pos_;
                DepthGuard guard(*this);
                auto arr = make_expr(ExprKind::kArray, tok.line);
                if (!check(TokenKind::kRBracket)) {
                    do {
                        if (check(TokenKind::kRBracket)) {
                            break;  // trailing comma
                        }
                        arr->children.push_back(parse_expression());
                    } while (match(TokenKind::kComma));
                }
                expect(TokenKind::kRBracket, "to close array literal");
                return arr;
            }
            case TokenKind::kMapOpen: {
                ++pos_;
                DepthGuard guard(*this);
                auto map = make_expr(ExprKind::kMap, tok.line);
                if (!check(TokenKind::kRBrace)) {
                    do {
                        if (check(TokenKind::kRBrace)) {
                            break;  // trailing comma
                        }
                        if (!check(TokenKind::kIdent) && !check(TokenKind::kString)) {
                            fail("map key must be an identifier or string");
                        }
                        map->keys.push_back(tokens_[pos_++].text);
                        expect(TokenKind::kColon, "after map key");
                        map->children.push_back(parse_expression());
                    } while (match(TokenKind::kComma));
                }
                expect(TokenKind::kRBrace, "to close map literal");
                return map;
            }
            default:
                fail(fmt::format("unexpected {}", tok.kind == TokenKind::kEnd
                                                      ? std::string("end of input")
                                                      : fmt::format("'{}'", tok.text)));
        }
    }

    std::vector<Token> tokens_;
    std::size_t        pos_{0};
    std::uint32_t      max_depth_;
    std::uint32_t      depth_{0};
};

}  // namespace

std::expected<std::shared_ptr<const Program>, ParseFailure>
parse_program(std::string_view source, std::uint32_t max_depth) {
    auto tokens = tokenize(source);
    if (!tokens) {
        return std::unexpected(ParseFailure{
            fmt::format("line {}, col {}: {}", tokens.error().line, tokens.error().column,
                        tokens.error().message),
            false});
    }

    auto program    = std::make_shared<Program>();
    program->source = std::string(source);
    try {
        Parser(std::move(*tokens), max_depth).parse_into(*program);
    } catch (const ParseAbort& e) {
        return std::unexpected(ParseFailure{e.what(), e.depth_exceeded()});
    }
    return std::shared_ptr<const Program>(std::move(program));
}
