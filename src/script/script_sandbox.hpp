#pragma once

// ---------------------------------------------------------------------------
// script_sandbox.hpp
//
// Script Sandbox Pool 경계. 스크립트 정책 1건을 알맞은 엔진으로 실행하고
// 결과를 항상 AccessDecision 으로 돌려준다.
//
// [fail-close]
// 엔진 실패(오류/타임아웃/자원 초과/풀 고갈)와 엔진 부재는
// Deny{script-*} 로 변환된다. 이 경계 밖으로 예외가 나가지 않는다.
//
// [deadline]
// 실행 마감 = min(호출자 deadline, 지금 + config.timeout)
// ---------------------------------------------------------------------------

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <json/json.h>

#include "policy/access_decision.hpp"
#include "policy/access_policy.hpp"
#include "script/script_engine.hpp"
#include "script/script_types.hpp"

class ScriptSandbox {
public:
    // 엔진은 nullptr 일 수 있다 (해당 언어 정책은 script-error 로 거부).
    ScriptSandbox(std::shared_ptr<ScriptEngine> lightweight,
                  std::shared_ptr<ScriptEngine> javascript,
                  std::chrono::milliseconds     timeout);

    // config.lightweight / config.quickjs 로 엔진을 직접 생성한다.
    // QuickJS 없이 빌드된 경우 javascript 엔진은 비어 있다.
    [[nodiscard]] static std::unique_ptr<ScriptSandbox> create(const ScriptSandboxConfig& config);

    ScriptSandbox(const ScriptSandbox&)            = delete;
    ScriptSandbox& operator=(const ScriptSandbox&) = delete;

    [[nodiscard]] AccessDecision evaluate(
        const ScriptEngineSpec& spec, const std::string& policy_id, const Json::Value& context,
        std::optional<std::chrono::steady_clock::time_point> caller_deadline = std::nullopt) const noexcept;

    [[nodiscard]] bool has_engine(ScriptLanguage language) const noexcept;

    [[nodiscard]] std::chrono::milliseconds timeout() const noexcept { return timeout_; }

private:
    [[nodiscard]] ScriptEngine* engine_for(ScriptLanguage language) const noexcept;

    std::shared_ptr<ScriptEngine> lightweight_;
    std::shared_ptr<ScriptEngine> javascript_;
    std::chrono::milliseconds     timeout_;
};

[[nodiscard]] const char* to_string(ScriptLanguage language) noexcept;
