// ---------------------------------------------------------------------------
// test_policy_evaluator.cpp
//
// PolicyEvaluator 단위 테스트.
//
// [테스트 범위]
// - 판정 규칙: 첫 Deny 우선, Allow 집계, 정책 없음 → no-matching-policy
// - (priority, id) 순서. 낮은 priority 의 Allow 가 있어도 이후 Deny 가 최종
// - matcher 불일치 정책은 엔진 미호출 (스크립트 실행 횟수 0)
// - 비활성 정책은 저장소 구현과 무관하게 건너뜀
// - fail-close: 저장소 실패, 예외, 마감 초과, 스크립트 실패, 엔진 부재
// - scope 사전 검사 (insufficient-scope, capabilities 허용)
// - 감사 레코드와 JSON 직렬화
//
// [알려진 한계]
// - 스크립트 엔진은 테스트 더블이다. 실제 엔진은 test_script_sandbox 에서 검증.
// ---------------------------------------------------------------------------

#include "policy/policy_evaluator.hpp"

#include "policy/in_memory_policy_store.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std::chrono_literals;

namespace {

// ---------------------------------------------------------------------------
// CountingEngine
//   source 문자열로 결과를 고른다: "allow" | "deny" | "abstain" | "timeout"
// ---------------------------------------------------------------------------
class CountingEngine : public ScriptEngine {
public:
    std::expected<AccessDecision, ScriptFailure> execute(const ScriptInvocation& invocation) override {
        ++calls;
        last_context = invocation.context;
        if (invocation.source == "allow")   return Allow{};
        if (invocation.source == "deny")    return Deny::script_denied("script says no");
        if (invocation.source == "timeout") {
            return std::unexpected(ScriptFailure{ScriptFault::kTimeout, "deadline exceeded"});
        }
        return Abstain{};
    }

    std::string_view name() const noexcept override { return "counting"; }

    std::atomic<int> calls{0};
    Json::Value      last_context{};
};

class FailingStore : public PolicyStore {
public:
    std::expected<std::vector<AccessPolicy>, StorageError>
    find_applicable(std::string_view, FhirOperation) const override {
        return std::unexpected(StorageError{StorageErrorCode::kUnavailable, "connection refused"});
    }
};

class ThrowingStore : public PolicyStore {
public:
    std::expected<std::vector<AccessPolicy>, StorageError>
    find_applicable(std::string_view, FhirOperation) const override {
        throw std::runtime_error("index corrupted");
    }
};

// 필터 없이 목록을 그대로 돌려주는 저장소
class UnfilteredStore : public PolicyStore {
public:
    explicit UnfilteredStore(std::vector<AccessPolicy> policies) : policies_(std::move(policies)) {}

    std::expected<std::vector<AccessPolicy>, StorageError>
    find_applicable(std::string_view, FhirOperation) const override {
        return policies_;
    }

private:
    std::vector<AccessPolicy> policies_;
};

class RecordingSink : public AuditSink {
public:
    void on_decision(const DecisionLog& entry) noexcept override { decisions.push_back(entry); }
    void on_token_event(const TokenEventLog& entry) noexcept override { tokens.push_back(entry); }

    std::vector<DecisionLog>   decisions;
    std::vector<TokenEventLog> tokens;
};

AccessPolicy make_policy(const std::string& id, int priority, PolicyEngineSpec engine) {
    AccessPolicy p;
    p.id       = id;
    p.name     = id;
    p.priority = priority;
    p.engine   = std::move(engine);
    return p;
}

PolicyMatcher read_observation_matcher() {
    PolicyMatcher m;
    m.resource_types = std::vector<std::string>{"Observation"};
    m.operations     = std::vector<FhirOperation>{FhirOperation::kRead};
    return m;
}

ScriptEngineSpec script(const std::string& source) {
    return ScriptEngineSpec{ScriptLanguage::kLightweight, source};
}

PolicyContext read_observation(const std::string& scopes = "patient/Observation.rs") {
    PolicyContext ctx;
    ctx.client.id                = "app-1";
    ctx.scopes                   = ScopeSummary::from_scope_string(scopes);
    ctx.request.operation        = FhirOperation::kRead;
    ctx.request.resource_type    = "Observation";
    ctx.request.resource_id      = "obs-1";
    ctx.request.path             = "/Observation/obs-1";
    ctx.environment.request_id   = "req-1";
    ctx.environment.source_ip    = "10.0.0.5";
    ctx.environment.request_time = std::chrono::system_clock::now();

    UserIdentity user;
    user.id    = "user-1";
    user.roles = {"clinician"};
    ctx.user   = user;
    return ctx;
}

// ---------------------------------------------------------------------------
// Fixture: 정책 목록을 받아 evaluator 구성
// ---------------------------------------------------------------------------
class PolicyEvaluatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        engine_  = std::make_shared<CountingEngine>();
        sandbox_ = std::make_unique<ScriptSandbox>(engine_, nullptr, 100ms);
    }

    void use(std::vector<AccessPolicy> policies) { store_.reload(std::move(policies)); }

    PolicyEvaluator make(EvaluatorConfig config = {}) {
        return PolicyEvaluator(store_, matcher_, *sandbox_, &sink_, config);
    }

    InMemoryPolicyStore            store_;
    PatternMatcher                 matcher_;
    std::shared_ptr<CountingEngine> engine_;
    std::unique_ptr<ScriptSandbox> sandbox_;
    RecordingSink                  sink_;
};

const Deny& as_deny(const AccessDecision& d) {
    return std::get<Deny>(d);
}

}  // namespace

// ===========================================================================
// 판정 규칙
// ===========================================================================

TEST_F(PolicyEvaluatorTest, UnconditionalDenyOverridesEarlierAllow) {
    auto p1    = make_policy("P1", 10, AllowEngine{});
    p1.matcher = read_observation_matcher();
    use({p1, make_policy("P2", 20, DenyEngine{})});

    auto evaluator = make();
    auto d         = evaluator.evaluate(read_observation());
    ASSERT_TRUE(is_deny(d));
    EXPECT_EQ(as_deny(d).code, "policy-denied");
    EXPECT_EQ(as_deny(d).policy_id, "P2");
}

TEST_F(PolicyEvaluatorTest, SingleMatchingAllow_Allows) {
    auto p1    = make_policy("P1", 10, AllowEngine{});
    p1.matcher = read_observation_matcher();
    use({p1});

    auto evaluator = make();
    EXPECT_TRUE(is_allow(evaluator.evaluate(read_observation())));
}

TEST_F(PolicyEvaluatorTest, NoPolicies_NoMatchingPolicy) {
    auto evaluator = make();
    auto d         = evaluator.evaluate(read_observation());
    ASSERT_TRUE(is_deny(d));
    EXPECT_EQ(as_deny(d).code, "no-matching-policy");
    EXPECT_FALSE(as_deny(d).policy_id.has_value());
}

TEST_F(PolicyEvaluatorTest, OnlyAbstentions_NoMatchingPolicy) {
    auto unmatched    = make_policy("other-type", 10, AllowEngine{});
    unmatched.matcher = PolicyMatcher{};
    unmatched.matcher->roles = std::vector<std::string>{"admin"};
    use({unmatched, make_policy("abstains", 20, script("abstain"))});

    auto evaluator = make();
    auto result    = evaluator.evaluate_with_audit(read_observation());
    ASSERT_TRUE(is_deny(result.decision));
    EXPECT_EQ(as_deny(result.decision).code, "no-matching-policy");
    ASSERT_EQ(result.evaluated_policies.size(), 2u);
    EXPECT_FALSE(result.evaluated_policies[0].matched);
    EXPECT_TRUE(result.evaluated_policies[1].matched);
    EXPECT_EQ(result.evaluated_policies[1].outcome, "abstain");
}

TEST_F(PolicyEvaluatorTest, FirstDenyStopsScan) {
    use({make_policy("a-deny", 10, DenyEngine{}), make_policy("b-script", 20, script("allow"))});

    auto evaluator = make();
    auto result    = evaluator.evaluate_with_audit(read_observation());
    EXPECT_EQ(as_deny(result.decision).policy_id, "a-deny");
    EXPECT_EQ(result.evaluated_policies.size(), 1u);
    EXPECT_EQ(engine_->calls.load(), 0);
}

TEST_F(PolicyEvaluatorTest, EqualPriority_OrderedById) {
    use({make_policy("zeta", 50, DenyEngine{}), make_policy("alpha", 50, DenyEngine{})});

    auto evaluator = make();
    EXPECT_EQ(as_deny(evaluator.evaluate(read_observation())).policy_id, "alpha");
}

TEST_F(PolicyEvaluatorTest, DenyMessage_FromPolicy) {
    auto p         = make_policy("blocked", 10, DenyEngine{});
    p.deny_message = "Research clients may not read observations";
    use({p});

    auto evaluator = make();
    EXPECT_EQ(as_deny(evaluator.evaluate(read_observation())).message,
              "Research clients may not read observations");
}

TEST_F(PolicyEvaluatorTest, InactivePolicySkipped) {
    auto p   = make_policy("off", 10, DenyEngine{});
    p.active = false;
    use({p, make_policy("on", 20, AllowEngine{})});

    auto evaluator = make();
    EXPECT_TRUE(is_allow(evaluator.evaluate(read_observation())));
}

TEST_F(PolicyEvaluatorTest, InactivePolicySkipped_EvenIfStoreReturnsIt) {
    auto off_deny   = make_policy("off-deny", 10, DenyEngine{});
    off_deny.active = false;
    auto off_script   = make_policy("off-script", 15, script("deny"));
    off_script.active = false;

    UnfilteredStore store({off_deny, off_script, make_policy("on", 20, AllowEngine{})});
    PolicyEvaluator evaluator(store, matcher_, *sandbox_, &sink_, EvaluatorConfig{});

    auto result = evaluator.evaluate_with_audit(read_observation());
    EXPECT_TRUE(is_allow(result.decision));
    EXPECT_EQ(engine_->calls.load(), 0);
    ASSERT_EQ(result.evaluated_policies.size(), 1u);
    EXPECT_EQ(result.evaluated_policies[0].policy_id, "on");
}

// ===========================================================================
// 스크립트 정책
// ===========================================================================

TEST_F(PolicyEvaluatorTest, UnmatchedScriptPolicy_NeverExecuted) {
    // 저장소가 미리 거르지 않는 조건(roles, source_ips)으로만 불일치시킨다
    auto admins    = make_policy("admins-only", 10, script("deny"));
    admins.matcher = read_observation_matcher();
    admins.matcher->roles = std::vector<std::string>{"admin"};

    auto internal    = make_policy("internal-network", 15, script("deny"));
    internal.matcher = read_observation_matcher();
    internal.matcher->source_ips = std::vector<std::string>{"192.168.0.0/16"};

    use({admins, internal, make_policy("fallback", 20, AllowEngine{})});

    auto evaluator = make();
    auto result    = evaluator.evaluate_with_audit(read_observation());
    EXPECT_TRUE(is_allow(result.decision));
    EXPECT_EQ(engine_->calls.load(), 0);

    ASSERT_EQ(result.evaluated_policies.size(), 3u);
    EXPECT_EQ(result.evaluated_policies[0].policy_id, "admins-only");
    EXPECT_FALSE(result.evaluated_policies[0].matched);
    EXPECT_EQ(result.evaluated_policies[1].policy_id, "internal-network");
    EXPECT_FALSE(result.evaluated_policies[1].matched);
    EXPECT_TRUE(result.evaluated_policies[2].matched);
}

TEST_F(PolicyEvaluatorTest, ScriptReceivesSerializedContext) {
    use({make_policy("s1", 10, script("allow")), make_policy("s2", 20, script("allow"))});

    auto evaluator = make();
    EXPECT_TRUE(is_allow(evaluator.evaluate(read_observation())));
    EXPECT_EQ(engine_->calls.load(), 2);
    EXPECT_EQ(engine_->last_context["request"]["resourceType"].asString(), "Observation");
    EXPECT_EQ(engine_->last_context["user"]["id"].asString(), "user-1");
}

TEST_F(PolicyEvaluatorTest, ScriptDeny_CarriesPolicyId) {
    use({make_policy("scripted", 10, script("deny"))});

    auto evaluator = make();
    auto d         = evaluator.evaluate(read_observation());
    EXPECT_EQ(as_deny(d).code, "script-denied");
    EXPECT_EQ(as_deny(d).policy_id, "scripted");
}

TEST_F(PolicyEvaluatorTest, ScriptFailure_FailsClosed) {
    use({make_policy("allow-first", 5, AllowEngine{}), make_policy("slow", 10, script("timeout"))});

    auto evaluator = make();
    auto d         = evaluator.evaluate(read_observation());
    ASSERT_TRUE(is_deny(d));
    EXPECT_EQ(as_deny(d).code, "script-timeout");
    EXPECT_EQ(as_deny(d).policy_id, "slow");
}

TEST_F(PolicyEvaluatorTest, MissingEngine_ScriptError) {
    auto p   = make_policy("js", 10, ScriptEngineSpec{ScriptLanguage::kJavaScript, "true"});
    use({p});

    auto evaluator = make();
    auto d         = evaluator.evaluate(read_observation());
    EXPECT_EQ(as_deny(d).code, "script-error");
    EXPECT_EQ(as_deny(d).policy_id, "js");
}

// ===========================================================================
// fail-close
// ===========================================================================

TEST(PolicyEvaluatorFailClose, StoreUnavailable) {
    FailingStore   store;
    PatternMatcher matcher;
    ScriptSandbox  sandbox(nullptr, nullptr, 100ms);
    PolicyEvaluator evaluator(store, matcher, sandbox);

    auto d = evaluator.evaluate(read_observation());
    ASSERT_TRUE(is_deny(d));
    EXPECT_EQ(as_deny(d).code, "policy-store-unavailable");
    EXPECT_EQ(as_deny(d).details, "connection refused");
}

TEST(PolicyEvaluatorFailClose, InternalException_PolicyError) {
    ThrowingStore  store;
    PatternMatcher matcher;
    ScriptSandbox  sandbox(nullptr, nullptr, 100ms);
    PolicyEvaluator evaluator(store, matcher, sandbox);

    AccessDecision d = Allow{};
    EXPECT_NO_THROW(d = evaluator.evaluate(read_observation()));
    ASSERT_TRUE(is_deny(d));
    EXPECT_EQ(as_deny(d).code, "policy-error");
    EXPECT_EQ(as_deny(d).details, "index corrupted");
}

TEST_F(PolicyEvaluatorTest, DeadlinePassed_EvaluationTimeout) {
    use({make_policy("p", 10, AllowEngine{})});

    auto evaluator = make();
    auto d = evaluator.evaluate(read_observation(), std::chrono::steady_clock::now() - 1ms);
    ASSERT_TRUE(is_deny(d));
    EXPECT_EQ(as_deny(d).code, "evaluation-timeout");
}

TEST_F(PolicyEvaluatorTest, ZeroConfiguredDeadline_UsesCallerOnly) {
    use({make_policy("p", 10, AllowEngine{})});

    auto evaluator = make(EvaluatorConfig{false, 0ms});
    EXPECT_TRUE(is_allow(evaluator.evaluate(read_observation())));
}

// ===========================================================================
// scope 사전 검사
// ===========================================================================

TEST_F(PolicyEvaluatorTest, ScopesFirst_InsufficientScope) {
    use({make_policy("p", 10, AllowEngine{})});

    auto evaluator = make(EvaluatorConfig{true, 1000ms});
    auto result    = evaluator.evaluate_with_audit(read_observation("patient/Patient.rs"));
    ASSERT_TRUE(is_deny(result.decision));
    EXPECT_EQ(as_deny(result.decision).code, "insufficient-scope");
    EXPECT_TRUE(result.scopes_checked);
    EXPECT_TRUE(result.evaluated_policies.empty());
}

TEST_F(PolicyEvaluatorTest, ScopesFirst_GrantedScopeContinues) {
    use({make_policy("p", 10, AllowEngine{})});

    auto evaluator = make(EvaluatorConfig{true, 1000ms});
    auto result    = evaluator.evaluate_with_audit(read_observation("patient/Observation.rs"));
    EXPECT_TRUE(is_allow(result.decision));
    ASSERT_TRUE(result.scope_decision.has_value());
    EXPECT_TRUE(is_allow(*result.scope_decision));
}

TEST(CheckSmartScopes, CapabilitiesAlwaysAllowed) {
    auto ctx                   = read_observation("");
    ctx.request.operation      = FhirOperation::kCapabilities;
    ctx.request.resource_type  = "metadata";
    EXPECT_TRUE(is_allow(check_smart_scopes(ctx)));
}

TEST(CheckSmartScopes, WriteNotPermittedByReadScope) {
    auto ctx              = read_observation("patient/Observation.rs");
    ctx.request.operation = FhirOperation::kUpdate;
    auto d                = check_smart_scopes(ctx);
    ASSERT_TRUE(is_deny(d));
    EXPECT_EQ(as_deny(d).code, "insufficient-scope");
}

// ===========================================================================
// 감사 / JSON
// ===========================================================================

TEST_F(PolicyEvaluatorTest, AuditRecord_OnePerEvaluation) {
    auto p1    = make_policy("P1", 10, AllowEngine{});
    p1.matcher = read_observation_matcher();
    use({p1, make_policy("P2", 20, DenyEngine{})});

    auto evaluator = make();
    (void)evaluator.evaluate(read_observation());

    ASSERT_EQ(sink_.decisions.size(), 1u);
    const auto& entry = sink_.decisions.front();
    EXPECT_EQ(entry.request_id, "req-1");
    EXPECT_EQ(entry.client_id, "app-1");
    EXPECT_EQ(entry.user_id, "user-1");
    EXPECT_EQ(entry.operation, "read");
    EXPECT_EQ(entry.resource_type, "Observation");
    EXPECT_EQ(entry.resource_id, "obs-1");
    EXPECT_EQ(entry.source_ip, "10.0.0.5");
    EXPECT_EQ(entry.outcome, "deny");
    EXPECT_EQ(entry.deny_code, "policy-denied");
    EXPECT_EQ(entry.terminating_policy, "P2");
    ASSERT_EQ(entry.scanned.size(), 2u);
    EXPECT_EQ(entry.scanned[0].policy_id, "P1");
    EXPECT_EQ(entry.scanned[0].outcome, "allow");
    EXPECT_EQ(entry.scanned[1].outcome, "deny");
    EXPECT_TRUE(sink_.tokens.empty());
}

TEST_F(PolicyEvaluatorTest, ResultJson) {
    use({make_policy("P2", 20, DenyEngine{})});

    auto evaluator = make();
    auto json      = to_json(evaluator.evaluate_with_audit(read_observation()));
    EXPECT_EQ(json["decision"].asString(), "deny");
    EXPECT_EQ(json["code"].asString(), "policy-denied");
    EXPECT_EQ(json["policyId"].asString(), "P2");
    ASSERT_EQ(json["evaluatedPolicies"].size(), 1u);
    EXPECT_EQ(json["evaluatedPolicies"][0u]["id"].asString(), "P2");
    EXPECT_TRUE(json["evaluatedPolicies"][0u]["matched"].asBool());
    EXPECT_FALSE(json["scopesChecked"].asBool());
    EXPECT_TRUE(json.isMember("evaluationTimeUs"));
    EXPECT_FALSE(json.isMember("scopeDecision"));
}

TEST(DecisionJson, AllowHasNoDenyFields) {
    auto json = decision_to_json(Allow{});
    EXPECT_EQ(json["decision"].asString(), "allow");
    EXPECT_FALSE(json.isMember("code"));
    EXPECT_FALSE(json.isMember("policyId"));

    auto deny = decision_to_json(Deny::script_fault(ScriptFault::kPoolExhausted, "busy"));
    EXPECT_EQ(deny["code"].asString(), "script-pool-exhausted");
    EXPECT_EQ(deny["details"].asString(), "busy");
}
