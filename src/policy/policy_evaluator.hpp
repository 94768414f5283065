#pragma once

// ---------------------------------------------------------------------------
// policy_evaluator.hpp
//
// Evaluation Orchestrator. PolicyContext 1건에 대해 최종 AccessDecision 을 낸다.
//
// [판정 규칙]
// 1. (선택) SMART scope 사전 검사. 불충분하면 Deny{insufficient-scope}
// 2. PolicyStore 에서 후보 조회 실패 → Deny{policy-store-unavailable}
// 3. (priority, id) 오름차순으로 순차 평가. 병렬화 금지.
//    - matcher 불일치 → Abstain 으로 기록하고 다음 정책
//    - 첫 Deny 가 즉시 최종 결과 (policy_id 기록)
// 4. Deny 가 없고 Allow 가 하나라도 있으면 Allow
// 5. 그 외 → Deny{no-matching-policy}
//
// [fail-close]
// evaluate() 는 예외를 던지지 않는다. 내부 예외는 Deny{policy-error},
// 마감 초과는 Deny{evaluation-timeout} 로 변환된다. 기본 허용은 없다.
//
// [스레드 안전성]
// 모든 멤버는 읽기 전용. 서로 다른 요청의 evaluate() 는 병렬 실행 가능.
// ---------------------------------------------------------------------------

#include <chrono>
#include <optional>
#include <vector>

#include <json/json.h>

#include "logger/audit_sink.hpp"
#include "logger/log_types.hpp"
#include "policy/access_decision.hpp"
#include "policy/pattern_matcher.hpp"
#include "policy/policy_context.hpp"
#include "policy/policy_store.hpp"
#include "script/script_sandbox.hpp"

struct EvaluatorConfig {
    bool                      evaluate_scopes_first{false};
    std::chrono::milliseconds deadline{1000};  // 0 = 호출자 deadline 만 사용
};

struct EvaluationResult {
    AccessDecision                decision{Deny::no_matching_policy()};
    std::vector<PolicyTrace>      evaluated_policies{};
    std::chrono::microseconds     evaluation_time{0};
    bool                          scopes_checked{false};
    std::optional<AccessDecision> scope_decision{};
};

class PolicyEvaluator {
public:
    using Deadline = std::chrono::steady_clock::time_point;

    // audit 는 nullptr 가능. 참조 대상들은 evaluator 보다 오래 살아야 한다.
    PolicyEvaluator(const PolicyStore&    store,
                    const PatternMatcher& matcher,
                    const ScriptSandbox&  sandbox,
                    AuditSink*            audit  = nullptr,
                    EvaluatorConfig       config = {});

    PolicyEvaluator(const PolicyEvaluator&)            = delete;
    PolicyEvaluator& operator=(const PolicyEvaluator&) = delete;

    [[nodiscard]] AccessDecision evaluate(const PolicyContext&    ctx,
                                          std::optional<Deadline> deadline = std::nullopt) const noexcept;

    [[nodiscard]] EvaluationResult evaluate_with_audit(
        const PolicyContext& ctx, std::optional<Deadline> deadline = std::nullopt) const noexcept;

    [[nodiscard]] const EvaluatorConfig& config() const noexcept { return config_; }

private:
    void run(const PolicyContext& ctx, std::optional<Deadline> deadline, EvaluationResult& result) const;

    [[nodiscard]] AccessDecision dispatch(const AccessPolicy&      policy,
                                          const PolicyContext&     ctx,
                                          std::optional<Json::Value>& script_ctx,
                                          std::optional<Deadline>  deadline) const;

    void emit(const PolicyContext& ctx, const EvaluationResult& result) const noexcept;

    const PolicyStore&    store_;
    const PatternMatcher& matcher_;
    const ScriptSandbox&  sandbox_;
    AuditSink*            audit_;
    EvaluatorConfig       config_;
};

// SMART scope 사전 검사. capabilities 는 항상 Allow.
[[nodiscard]] AccessDecision check_smart_scopes(const PolicyContext& ctx);

// {decision, code?, message?, details?, policyId?}
[[nodiscard]] Json::Value decision_to_json(const AccessDecision& decision);

// decision_to_json + evaluatedPolicies, evaluationTimeUs, scopesChecked
[[nodiscard]] Json::Value to_json(const EvaluationResult& result);
