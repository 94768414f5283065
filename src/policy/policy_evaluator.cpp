#include "policy/policy_evaluator.hpp"

#include <algorithm>
#include <exception>
#include <string>
#include <type_traits>
#include <variant>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "smart/smart_scopes.hpp"

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

bool passed(const std::optional<PolicyEvaluator::Deadline>& deadline) {
    return deadline && std::chrono::steady_clock::now() >= *deadline;
}

}  // namespace

AccessDecision check_smart_scopes(const PolicyContext& ctx) {
    const auto op = ctx.request.operation;
    if (op == FhirOperation::kCapabilities) {
        return Allow{};
    }

    auto scopes = SmartScopes::parse(ctx.scopes.raw);
    if (!scopes) {
        return Deny::insufficient_scope(fmt::format("invalid scope string: {}", scopes.error()));
    }
    if (!scopes->permits_any(ctx.request.resource_type, op)) {
        return Deny::insufficient_scope(fmt::format("no granted scope permits {} on {}",
                                                    to_string(op), ctx.request.resource_type));
    }
    return Allow{};
}

PolicyEvaluator::PolicyEvaluator(const PolicyStore&    store,
                                 const PatternMatcher& matcher,
                                 const ScriptSandbox&  sandbox,
                                 AuditSink*            audit,
                                 EvaluatorConfig       config)
    : store_(store), matcher_(matcher), sandbox_(sandbox), audit_(audit), config_(config) {}

AccessDecision PolicyEvaluator::evaluate(const PolicyContext& ctx,
                                         std::optional<Deadline> deadline) const noexcept {
    return evaluate_with_audit(ctx, deadline).decision;
}

EvaluationResult PolicyEvaluator::evaluate_with_audit(const PolicyContext&    ctx,
                                                      std::optional<Deadline> deadline) const noexcept {
    const auto start = std::chrono::steady_clock::now();

    if (config_.deadline > std::chrono::milliseconds::zero()) {
        const Deadline budget_end = start + config_.deadline;
        deadline = deadline ? std::min(*deadline, budget_end) : budget_end;
    }

    EvaluationResult result;
    try {
        run(ctx, deadline, result);
    } catch (const std::exception& e) {
        spdlog::error("evaluator: request '{}' failed: {}", ctx.environment.request_id, e.what());
        result.decision = Deny::policy_error(e.what());
    }

    result.evaluation_time = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
    emit(ctx, result);
    return result;
}

// ---------------------------------------------------------------------------
// run
//   평가 본체. result.decision 을 채운다.
// ---------------------------------------------------------------------------
void PolicyEvaluator::run(const PolicyContext& ctx, std::optional<Deadline> deadline,
                          EvaluationResult& result) const {
    if (config_.evaluate_scopes_first) {
        result.scopes_checked = true;
        AccessDecision scope_decision = check_smart_scopes(ctx);
        result.scope_decision = scope_decision;
        if (is_deny(scope_decision)) {
            result.decision = std::move(scope_decision);
            return;
        }
    }

    auto candidates = store_.find_applicable(ctx.request.resource_type, ctx.request.operation);
    if (!candidates) {
        spdlog::error("evaluator: policy store unavailable: {}", candidates.error().message);
        result.decision = Deny::policy_store_unavailable(candidates.error().message);
        return;
    }

    std::vector<AccessPolicy>& policies = *candidates;
    std::stable_sort(policies.begin(), policies.end(), policy_order_less);
    result.evaluated_policies.reserve(policies.size());

    std::optional<Json::Value> script_ctx;  // 첫 스크립트 정책에서 한 번만 직렬화
    bool any_allow = false;

    for (const auto& policy : policies) {
        // 저장소 구현이 active 를 거르지 않아도 비활성 정책은 평가하지 않는다
        if (!policy.active) {
            continue;
        }
        if (passed(deadline)) {
            spdlog::warn("evaluator: deadline exceeded before policy '{}'", policy.id);
            result.decision = Deny::evaluation_timeout();
            return;
        }

        const bool matched = matcher_.matches(policy.matcher, ctx);
        AccessDecision decision = matched ? dispatch(policy, ctx, script_ctx, deadline)
                                          : AccessDecision{Abstain{}};

        result.evaluated_policies.push_back(
            PolicyTrace{policy.id, policy.name, matched, std::string(outcome_name(decision))});

        if (auto* deny = std::get_if<Deny>(&decision)) {
            deny->policy_id = policy.id;
            result.decision = std::move(*deny);
            return;
        }
        if (is_allow(decision)) {
            any_allow = true;
        }
    }

    result.decision = any_allow ? AccessDecision{Allow{}} : AccessDecision{Deny::no_matching_policy()};
}

AccessDecision PolicyEvaluator::dispatch(const AccessPolicy&         policy,
                                         const PolicyContext&        ctx,
                                         std::optional<Json::Value>& script_ctx,
                                         std::optional<Deadline>     deadline) const {
    return std::visit(
        Overloaded{
            [](const AllowEngine&) -> AccessDecision { return Allow{}; },
            [&](const DenyEngine&) -> AccessDecision {
                return Deny::policy_denied(
                    policy.deny_message.value_or(fmt::format("Access denied by policy '{}'", policy.name)));
            },
            [&](const ScriptEngineSpec& spec) -> AccessDecision {
                if (!script_ctx) {
                    script_ctx = to_json(ctx);
                }
                return sandbox_.evaluate(spec, policy.id, *script_ctx, deadline);
            },
        },
        policy.engine);
}

void PolicyEvaluator::emit(const PolicyContext& ctx, const EvaluationResult& result) const noexcept {
    const auto* deny = std::get_if<Deny>(&result.decision);

    if (deny != nullptr) {
        spdlog::info("evaluator: deny request='{}' client='{}' op={} type='{}' code={} policy='{}'",
                     ctx.environment.request_id, ctx.client.id, to_string(ctx.request.operation),
                     ctx.request.resource_type, deny->code, deny->policy_id.value_or(""));
    } else {
        spdlog::debug("evaluator: allow request='{}' client='{}' op={} type='{}' ({} policies, {}us)",
                      ctx.environment.request_id, ctx.client.id, to_string(ctx.request.operation),
                      ctx.request.resource_type, result.evaluated_policies.size(),
                      result.evaluation_time.count());
    }

    if (audit_ == nullptr) {
        return;
    }

    try {
        DecisionLog entry;
        entry.request_id    = ctx.environment.request_id;
        entry.client_id     = ctx.client.id;
        entry.user_id       = ctx.user ? ctx.user->id : "";
        entry.operation     = std::string(to_string(ctx.request.operation));
        entry.resource_type = ctx.request.resource_type;
        entry.resource_id   = ctx.request.resource_id.value_or("");
        entry.source_ip     = ctx.environment.source_ip.value_or("");
        entry.outcome       = std::string(outcome_name(result.decision));
        if (deny != nullptr) {
            entry.deny_code          = deny->code;
            entry.message            = deny->message;
            entry.terminating_policy = deny->policy_id.value_or("");
        }
        entry.scanned   = result.evaluated_policies;
        entry.timestamp = std::chrono::system_clock::now();
        entry.duration  = result.evaluation_time;
        audit_->on_decision(entry);
    } catch (const std::exception& e) {
        spdlog::error("evaluator: failed to build audit record: {}", e.what());
    }
}

Json::Value decision_to_json(const AccessDecision& decision) {
    Json::Value out(Json::objectValue);
    out["decision"] = std::string(outcome_name(decision));
    if (const auto* deny = std::get_if<Deny>(&decision)) {
        out["code"]    = deny->code;
        out["message"] = deny->message;
        if (deny->details) {
            out["details"] = *deny->details;
        }
        if (deny->policy_id) {
            out["policyId"] = *deny->policy_id;
        }
    }
    return out;
}

Json::Value to_json(const EvaluationResult& result) {
    Json::Value out = decision_to_json(result.decision);

    Json::Value policies(Json::arrayValue);
    for (const auto& trace : result.evaluated_policies) {
        Json::Value item(Json::objectValue);
        item["id"]      = trace.policy_id;
        item["name"]    = trace.name;
        item["matched"] = trace.matched;
        item["outcome"] = trace.outcome;
        policies.append(std::move(item));
    }
    out["evaluatedPolicies"] = std::move(policies);
    out["evaluationTimeUs"]  = static_cast<Json::Int64>(result.evaluation_time.count());
    out["scopesChecked"]     = result.scopes_checked;
    if (result.scope_decision) {
        out["scopeDecision"] = decision_to_json(*result.scope_decision);
    }
    return out;
}
