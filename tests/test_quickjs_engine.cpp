// ---------------------------------------------------------------------------
// test_quickjs_engine.cpp
//
// QuickJsEngine 단위 테스트. QuickJS 와 함께 빌드된 경우에만 컴파일된다.
//
// [테스트 범위]
// - 반환값 → AccessDecision (true/false/allow()/deny()/abstain()/undefined)
// - 헬퍼: hasRole, hasAnyRole, isPractitionerUser, inPatientCompartment
// - ctx 동결 (strict mode 대입 → script-error)
// - 실행 간 전역 상태 격리
// - 무한 루프 → kTimeout, 메모리 상한 → kResourceExceeded
// - 풀 고갈 → kPoolExhausted, 실행 후 슬롯 반납
//
// [알려진 한계]
// - 메모리 상한 테스트는 QuickJS 의 "out of memory" 메시지에 의존한다.
// ---------------------------------------------------------------------------

#include "script/quickjs_engine.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>

using namespace std::chrono_literals;

namespace {

Json::Value sample_context() {
    Json::Value ctx(Json::objectValue);
    ctx["user"]["id"]           = "user-1";
    ctx["user"]["fhirUserType"] = "Practitioner";
    ctx["user"]["roles"].append("clinician");
    ctx["client"]["id"]                   = "app-1";
    ctx["scopes"]["raw"]                  = "patient/Observation.rs";
    ctx["request"]["resourceType"]        = "Observation";
    ctx["request"]["compartmentType"]     = Json::Value(Json::nullValue);
    ctx["resource"]["subject"]            = "Patient/pat-1";
    ctx["environment"]["patientContext"]  = "pat-1";
    return ctx;
}

QuickJsPoolConfig small_pool(std::size_t size = 2) {
    QuickJsPoolConfig config;
    config.pool_size        = size;
    config.checkout_timeout = 20ms;
    return config;
}

std::expected<AccessDecision, ScriptFailure> run(QuickJsEngine& engine, const std::string& source,
                                                 std::chrono::milliseconds budget = 1000ms) {
    static const std::string policy_id = "js-policy";
    const Json::Value        context   = sample_context();
    const ScriptInvocation   invocation{policy_id, source, context, ExecutionDeadline::after(budget)};
    return engine.execute(invocation);
}

bool allows(QuickJsEngine& engine, const std::string& source) {
    auto r = run(engine, source);
    return r.has_value() && is_allow(*r);
}

}  // namespace

// ===========================================================================
// 결과 변환 / 헬퍼
// ===========================================================================

TEST(QuickJsEngine, ResultMapping) {
    QuickJsEngine engine(small_pool());

    EXPECT_TRUE(allows(engine, "return true;"));
    EXPECT_TRUE(allows(engine, "return allow();"));

    auto denied = run(engine, "return deny('outside care team');");
    ASSERT_TRUE(denied.has_value());
    ASSERT_TRUE(is_deny(*denied));
    EXPECT_EQ(std::get<Deny>(*denied).code, "script-denied");
    EXPECT_EQ(std::get<Deny>(*denied).message, "outside care team");

    auto falsy = run(engine, "return false;");
    ASSERT_TRUE(falsy.has_value());
    EXPECT_TRUE(is_deny(*falsy));

    auto abstained = run(engine, "return abstain();");
    ASSERT_TRUE(abstained.has_value());
    EXPECT_TRUE(is_abstain(*abstained));

    auto nothing = run(engine, "const x = 1;");
    ASSERT_TRUE(nothing.has_value());
    EXPECT_TRUE(is_abstain(*nothing));
}

TEST(QuickJsEngine, Helpers) {
    QuickJsEngine engine(small_pool());
    EXPECT_TRUE(allows(engine, "return hasRole('clinician');"));
    EXPECT_FALSE(allows(engine, "return hasRole('admin');"));
    EXPECT_TRUE(allows(engine, "return hasAnyRole(['admin', 'clinician']);"));
    EXPECT_TRUE(allows(engine, "return isPractitionerUser() && !isPatientUser();"));
    EXPECT_TRUE(allows(engine, "return getPatientContext() === 'pat-1';"));
    EXPECT_TRUE(allows(engine, "return inPatientCompartment();"));
    EXPECT_TRUE(allows(engine, "return ctx.client.id === client.id;"));
}

TEST(QuickJsEngine, ContextIsFrozen) {
    QuickJsEngine engine(small_pool());
    auto r = run(engine, "user.roles.push('admin'); return true;");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().fault, ScriptFault::kError);
}

TEST(QuickJsEngine, Errors) {
    QuickJsEngine engine(small_pool());

    auto syntax = run(engine, "return (;");
    ASSERT_FALSE(syntax.has_value());
    EXPECT_EQ(syntax.error().fault, ScriptFault::kError);

    auto thrown = run(engine, "throw new Error('boom');");
    ASSERT_FALSE(thrown.has_value());
    EXPECT_EQ(thrown.error().fault, ScriptFault::kError);
    EXPECT_NE(thrown.error().details.find("boom"), std::string::npos);
}

TEST(QuickJsEngine, NoStateLeaksBetweenRuns) {
    QuickJsEngine engine(small_pool(1));
    EXPECT_TRUE(allows(engine, "globalThis.leaked = 1; return true;"));
    EXPECT_TRUE(allows(engine, "return typeof globalThis.leaked === 'undefined';"));
    EXPECT_TRUE(allows(engine, "return typeof globalThis.__authgate_ctx === 'undefined';"));
}

// ===========================================================================
// 자원 / 타임아웃 / 풀
// ===========================================================================

TEST(QuickJsEngine, InfiniteLoop_TimesOut) {
    QuickJsEngine engine(small_pool());

    const auto start = std::chrono::steady_clock::now();
    auto r           = run(engine, "while (true) {}", 50ms);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().fault, ScriptFault::kTimeout);
    EXPECT_LT(elapsed, 50ms + 500ms);
    EXPECT_EQ(engine.available_slots(), engine.pool_size());
}

TEST(QuickJsEngine, MemoryLimit_ResourceExceeded) {
    auto config         = small_pool();
    config.memory_limit = 4 * 1024 * 1024;
    QuickJsEngine engine(config);

    auto r = run(engine, "const a = []; while (true) { a.push('x'.repeat(1024)); }", 5000ms);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().fault, ScriptFault::kResourceExceeded);

    // 같은 슬롯이 다음 실행에 정상 사용된다
    EXPECT_TRUE(allows(engine, "return true;"));
}

TEST(QuickJsEngine, PoolExhausted) {
    QuickJsEngine engine(small_pool(1));
    ASSERT_EQ(engine.pool_size(), 1u);

    std::thread busy([&] { (void)run(engine, "while (true) {}", 300ms); });
    std::this_thread::sleep_for(50ms);

    auto r = run(engine, "return true;");
    busy.join();

    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().fault, ScriptFault::kPoolExhausted);
    EXPECT_EQ(engine.available_slots(), 1u);
    EXPECT_TRUE(allows(engine, "return true;"));
}

TEST(QuickJsEngine, InvalidConfig_Rejected) {
    QuickJsPoolConfig config;
    config.memory_limit = 0;
    EXPECT_THROW({ QuickJsEngine engine(config); }, ConfigurationError);
}
