#pragma once

// ---------------------------------------------------------------------------
// quickjs_engine.hpp
//
// QuickJS 기반 ECMAScript 정책 엔진 (ScriptEngine 구현).
//
// [풀 구조]
// pool_size 개의 슬롯. 슬롯마다 JSRuntime 하나를 소유하며
// memory_limit / max_stack_size 는 런타임 생성 시 고정된다.
// 한 슬롯은 한 번에 한 실행만 수행한다 (checkout → 실행 → 반납).
//
// [실행 1회]
//   1. 슬롯 checkout (최대 checkout_timeout 대기, 초과 시 kPoolExhausted)
//   2. 새 JSContext 생성 (이전 실행의 전역 상태가 보이지 않음)
//   3. PolicyContext JSON → 동결된 ctx 객체 + user/client/... 지역 상수
//   4. 사용자 스크립트를 헬퍼 함수와 함께 클로저로 감싸 평가
//   5. interrupt handler 가 deadline 을 주기적으로 확인
//   6. 반환값 → JSON → decision_from_script_result()
// ---------------------------------------------------------------------------

#include <cstddef>
#include <expected>
#include <memory>
#include <string_view>

#include "script/script_engine.hpp"
#include "script/script_types.hpp"

class QuickJsEngine final : public ScriptEngine {
public:
    // 설정 값이 0 이거나 런타임 생성 실패 시 ConfigurationError
    explicit QuickJsEngine(QuickJsPoolConfig config = {});
    ~QuickJsEngine() override;

    QuickJsEngine(const QuickJsEngine&)            = delete;
    QuickJsEngine& operator=(const QuickJsEngine&) = delete;

    [[nodiscard]] std::expected<AccessDecision, ScriptFailure>
    execute(const ScriptInvocation& invocation) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "quickjs"; }

    [[nodiscard]] std::size_t pool_size() const noexcept;
    [[nodiscard]] std::size_t available_slots() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};
