#pragma once

// ---------------------------------------------------------------------------
// expr_interpreter.hpp
//
// 경량 정책 언어 트리 워킹 인터프리터.
//
// [자원 상한]
// - 문장/식 평가 1회마다 연산 카운터 +1, max_operations 초과 시 중단
// - 64 연산마다 ExecutionDeadline 검사 (협조적 타임아웃)
// - 사용자 함수 호출 깊이 max_call_levels
// - 새로 만들어지는 string/array/map 크기 상한
//
// [스코프]
// 전역(ctx, user, client, scopes, request, resource, environment)은 읽기 전용.
// 함수 본문은 전역과 자신의 매개변수만 볼 수 있다.
//
// 실행 상태는 인스턴스에만 존재하며 한 번 run() 후 폐기한다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include <json/json.h>

#include "common/types.hpp"
#include "script/execution_deadline.hpp"
#include "script/expr/expr_ast.hpp"
#include "script/expr/expr_value.hpp"
#include "script/script_types.hpp"

// 스크립트 실행 중단. LightweightEngine 경계에서 ScriptFailure 로 변환된다.
class ScriptAbort : public std::runtime_error {
public:
    ScriptAbort(ScriptFault fault, const std::string& what)
        : std::runtime_error(what), fault_(fault) {}

    [[nodiscard]] ScriptFault fault() const noexcept { return fault_; }

private:
    ScriptFault fault_;
};

class ExprInterpreter {
public:
    ExprInterpreter(const Program& program, const LightweightLimits& limits,
                    ExecutionDeadline deadline);

    ExprInterpreter(const ExprInterpreter&)            = delete;
    ExprInterpreter& operator=(const ExprInterpreter&) = delete;

    // 프로그램 실행. 최상위 return 값 또는 마지막 문장의 값을 돌려준다.
    // 실패 시 ScriptAbort.
    ExprValue run(const Json::Value& context);

    [[nodiscard]] std::uint64_t operations() const noexcept { return operations_; }

private:
    enum class Flow : std::uint8_t { kNormal, kReturn, kBreak, kContinue };

    using Scope = std::map<std::string, ExprValue, std::less<>>;
    using Frame = std::vector<Scope>;

    // 문장
    Flow exec_block(const std::vector<StmtPtr>& body);
    Flow exec_stmt(const Stmt& stmt);
    Flow exec_for(const Stmt& stmt);

    // 식
    ExprValue eval(const Expr& expr);
    ExprValue eval_binary(const Expr& expr);
    ExprValue eval_unary(const Expr& expr);
    ExprValue eval_member(const ExprValue& target, const std::string& name, std::size_t line);
    ExprValue eval_index(const ExprValue& target, const ExprValue& key, std::size_t line);
    ExprValue eval_call(const std::string& name, std::vector<ExprValue> args, std::size_t line);
    ExprValue call_function(const FunctionDef& fn, std::vector<ExprValue> args, std::size_t line);
    bool      call_builtin(const std::string& name, const std::vector<ExprValue>& args,
                           std::size_t line, ExprValue& out);
    bool      eval_condition(const Expr& expr, std::string_view what);

    // 변수
    [[nodiscard]] const ExprValue* lookup(std::string_view name) const;
    void declare(const std::string& name, ExprValue value);
    void assign(const std::string& name, ExprValue value, std::size_t line);

    // 상한
    void tick();
    const ExprValue& checked(const ExprValue& value, std::size_t line) const;
    [[noreturn]] static void error(std::size_t line, const std::string& message);

    const Program&           program_;
    const LightweightLimits& limits_;
    ExecutionDeadline        deadline_;

    Scope              globals_{};
    std::vector<Frame> frames_{};
    ExprValue          last_value_{};
    ExprValue          return_value_{};
    std::uint64_t      operations_{0};
    std::uint32_t      call_depth_{0};
    std::uint32_t      loop_depth_{0};
};
