#pragma once

// ---------------------------------------------------------------------------
// script_engine.hpp
//
// 정책 스크립트 엔진 추상 경계. 구현체: LightweightEngine, QuickJsEngine.
//
// [계약]
// - execute() 는 예외를 던지지 않는다. 모든 엔진 내부 실패는
//   ScriptFailure 로 분류하여 반환한다.
// - invocation.deadline 을 넘기면 반드시 kTimeout 으로 중단한다.
// - 한 실행의 전역/변수 상태는 다음 실행에서 보이지 않아야 한다.
// ---------------------------------------------------------------------------

#include <expected>
#include <string_view>

#include <json/json.h>

#include "policy/access_decision.hpp"
#include "script/script_types.hpp"

class ScriptEngine {
public:
    virtual ~ScriptEngine() = default;

    [[nodiscard]] virtual std::expected<AccessDecision, ScriptFailure>
    execute(const ScriptInvocation& invocation) = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

// ---------------------------------------------------------------------------
// decision_from_script_result
//   스크립트 반환값(JSON 으로 정규화된 값) → AccessDecision.
//     true                               → Allow
//     false                              → Deny{script-denied}
//     {decision: "allow"|"deny"|"abstain", reason?} → 해당 판정
//     그 외                              → Abstain
// ---------------------------------------------------------------------------
[[nodiscard]] AccessDecision decision_from_script_result(const Json::Value& result);
