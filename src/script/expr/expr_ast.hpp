#pragma once

// ---------------------------------------------------------------------------
// expr_ast.hpp
//
// 경량 정책 언어 구문 트리. 파싱 후 불변이며 여러 스레드가 동시에
// 같은 Program 을 실행할 수 있다 (실행 상태는 인터프리터 쪽에만 존재).
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "script/expr/expr_lexer.hpp"
#include "script/expr/expr_value.hpp"

struct Expr;
struct Stmt;
using ExprPtr = std::unique_ptr<Expr>;
using StmtPtr = std::unique_ptr<Stmt>;

enum class ExprKind : std::uint8_t {
    kLiteral,     // literal
    kVariable,    // name
    kArray,       // children
    kMap,         // keys[i] : children[i]
    kUnary,       // op children[0]
    kBinary,      // children[0] op children[1]
    kAnd,         // 단락 평가
    kOr,          // 단락 평가
    kMember,      // children[0].name
    kIndex,       // children[0][children[1]]
    kCall,        // name(children...)
    kMethodCall,  // children[0].name(children[1..])
};

struct Expr {
    ExprKind                 kind{ExprKind::kLiteral};
    ExprValue                literal{};
    std::string              name{};
    TokenKind                op{TokenKind::kEnd};
    std::vector<ExprPtr>     children{};
    std::vector<std::string> keys{};
    std::size_t              line{0};
};

enum class StmtKind : std::uint8_t {
    kLet,       // let name = expr
    kAssign,    // name = expr
    kExpr,      // expr
    kIf,        // if expr { body } else { else_body }
    kWhile,     // while expr { body }
    kFor,       // for name in expr { body }
    kReturn,    // return expr?
    kBreak,
    kContinue,
    kBlock,     // { body }
};

struct Stmt {
    StmtKind             kind{StmtKind::kExpr};
    std::string          name{};
    ExprPtr              expr{};
    std::vector<StmtPtr> body{};
    std::vector<StmtPtr> else_body{};
    std::size_t          line{0};
};

struct FunctionDef {
    std::string              name{};
    std::vector<std::string> params{};
    std::vector<StmtPtr>     body{};
};

struct Program {
    std::string                        source{};
    std::vector<StmtPtr>               statements{};
    std::map<std::string, FunctionDef> functions{};
};
