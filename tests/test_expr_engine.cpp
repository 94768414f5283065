// ---------------------------------------------------------------------------
// test_expr_engine.cpp
//
// 경량 정책 언어 (lexer / parser / interpreter / LightweightEngine) 단위 테스트.
//
// [테스트 범위]
// - 토큰화: 키워드, 맵 리터럴, 주석, 잘못된 문자
// - 파싱: 우선순위, 문법 오류, 중첩 깊이 상한, fn 위치 제한
// - 실행 결과 → AccessDecision 변환 (true/false/allow()/deny()/abstain()/기타)
// - 컨텍스트 접근, null 멤버 접근, 내장 함수
// - 제어 흐름: let/대입/if/while/for/break/사용자 함수
// - 자원 상한: 연산 수, 호출 깊이, 문자열/배열 크기
// - 타임아웃: 무한 루프, 이미 지난 deadline
// - 실행 간 상태 격리, 컴파일 캐시
// ---------------------------------------------------------------------------

#include "script/lightweight_engine.hpp"

#include "script/expr/expr_lexer.hpp"
#include "script/expr/expr_parser.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

using namespace std::chrono_literals;

namespace {

Json::Value sample_context() {
    Json::Value ctx(Json::objectValue);

    Json::Value user(Json::objectValue);
    user["id"]           = "user-1";
    user["fhirUserType"] = "Practitioner";
    user["roles"].append("clinician");
    user["roles"].append("auditor");
    ctx["user"] = user;

    ctx["client"]["id"]                 = "app-1";
    ctx["scopes"]["raw"]                = "patient/Observation.rs";
    ctx["request"]["operation"]         = "read";
    ctx["request"]["resourceType"]      = "Observation";
    ctx["request"]["resourceId"]        = "obs-1";
    ctx["request"]["compartmentType"]   = Json::Value(Json::nullValue);
    ctx["resource"]                     = Json::Value(Json::nullValue);
    ctx["environment"]["patientContext"] = "pat-1";
    ctx["environment"]["requestId"]     = "req-1";
    return ctx;
}

std::expected<AccessDecision, ScriptFailure> run(LightweightEngine&         engine,
                                                 const std::string&         source,
                                                 const Json::Value&         context = sample_context(),
                                                 std::chrono::milliseconds  budget  = 1000ms) {
    static const std::string policy_id = "test-policy";
    const ScriptInvocation   invocation{policy_id, source, context, ExecutionDeadline::after(budget)};
    return engine.execute(invocation);
}

bool allows(LightweightEngine& engine, const std::string& source,
            const Json::Value& context = sample_context()) {
    auto r = run(engine, source, context);
    return r.has_value() && is_allow(*r);
}

ScriptFault fault_of(LightweightEngine& engine, const std::string& source,
                     const Json::Value& context = sample_context()) {
    auto r = run(engine, source, context);
    EXPECT_FALSE(r.has_value()) << source;
    return r.has_value() ? ScriptFault::kError : r.error().fault;
}

}  // namespace

// ===========================================================================
// Lexer / Parser
// ===========================================================================

TEST(ExprLexer, TokenizesMapLiteralAndSkipsComments) {
    auto tokens = tokenize("let m = #{a: 1.5} // trailing\n/* block */ m.a >= 1");
    ASSERT_TRUE(tokens.has_value()) << tokens.error().message;

    std::vector<TokenKind> kinds;
    for (const auto& t : *tokens) {
        kinds.push_back(t.kind);
    }
    const std::vector<TokenKind> expected = {
        TokenKind::kLet,   TokenKind::kIdent, TokenKind::kAssign, TokenKind::kMapOpen,
        TokenKind::kIdent, TokenKind::kColon, TokenKind::kFloat,  TokenKind::kRBrace,
        TokenKind::kIdent, TokenKind::kDot,   TokenKind::kIdent,  TokenKind::kGe,
        TokenKind::kInt,   TokenKind::kEnd,
    };
    EXPECT_EQ(kinds, expected);
    EXPECT_EQ((*tokens)[8].line, 2u);
}

TEST(ExprLexer, StringEscapes) {
    auto tokens = tokenize(R"("a\"b\\c\n")");
    ASSERT_TRUE(tokens.has_value());
    EXPECT_EQ((*tokens)[0].text, "a\"b\\c\n");
}

TEST(ExprLexer, Errors) {
    EXPECT_FALSE(tokenize("\"unterminated").has_value());
    EXPECT_FALSE(tokenize("a & b").has_value());
    EXPECT_FALSE(tokenize("a @ b").has_value());
    EXPECT_FALSE(tokenize("/* never closed").has_value());
}

TEST(ExprParser, SyntaxError) {
    auto r = parse_program("let = 1", 64);
    ASSERT_FALSE(r.has_value());
    EXPECT_FALSE(r.error().depth_exceeded);
}

TEST(ExprParser, NestingDepthLimit) {
    const std::string deep = std::string(100, '(') + "1" + std::string(100, ')');
    auto r = parse_program(deep, 64);
    ASSERT_FALSE(r.has_value());
    EXPECT_TRUE(r.error().depth_exceeded);

    EXPECT_TRUE(parse_program(std::string(10, '(') + "1" + std::string(10, ')'), 64).has_value());
}

TEST(ExprParser, FunctionPlacement) {
    EXPECT_FALSE(parse_program("fn f() { 1 } fn f() { 2 }", 64).has_value());
    EXPECT_FALSE(parse_program("if true { fn g() { 1 } }", 64).has_value());

    auto ok = parse_program("fn f(a, b) { a + b } f(1, 2)", 64);
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ((*ok)->functions.size(), 1u);
    EXPECT_EQ((*ok)->functions.at("f").params.size(), 2u);
}

// ===========================================================================
// 결과 변환
// ===========================================================================

TEST(LightweightEngine, ResultMapping) {
    LightweightEngine engine;

    EXPECT_TRUE(allows(engine, "true"));
    EXPECT_TRUE(allows(engine, "allow()"));

    auto denied = run(engine, "false");
    ASSERT_TRUE(denied.has_value());
    ASSERT_TRUE(is_deny(*denied));
    EXPECT_EQ(std::get<Deny>(*denied).code, "script-denied");

    auto reasoned = run(engine, "deny(\"not your patient\")");
    ASSERT_TRUE(reasoned.has_value());
    EXPECT_EQ(std::get<Deny>(*reasoned).message, "not your patient");

    auto abstained = run(engine, "abstain()");
    ASSERT_TRUE(abstained.has_value());
    EXPECT_TRUE(is_abstain(*abstained));

    auto other = run(engine, "42");
    ASSERT_TRUE(other.has_value());
    EXPECT_TRUE(is_abstain(*other));

    auto empty = run(engine, "let x = 1");
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(is_abstain(*empty));
}

TEST(LightweightEngine, ReturnStopsExecution) {
    LightweightEngine engine;
    EXPECT_TRUE(allows(engine, "if has_role(\"clinician\") { return true }\nfalse"));
    EXPECT_FALSE(allows(engine, "return false\ntrue"));
}

TEST(DecisionFromScriptResult, MapForms) {
    Json::Value deny(Json::objectValue);
    deny["decision"] = "deny";
    EXPECT_EQ(std::get<Deny>(decision_from_script_result(deny)).message, "Denied by policy script");

    Json::Value unknown(Json::objectValue);
    unknown["decision"] = "maybe";
    EXPECT_TRUE(is_abstain(decision_from_script_result(unknown)));

    EXPECT_TRUE(is_abstain(decision_from_script_result(Json::Value("allow"))));
}

// ===========================================================================
// 컨텍스트 / 내장 함수
// ===========================================================================

TEST(LightweightEngine, ContextAccess) {
    LightweightEngine engine;
    EXPECT_TRUE(allows(engine, "user.roles[0] == \"clinician\""));
    EXPECT_TRUE(allows(engine, "ctx.request.resourceType == \"Observation\""));
    EXPECT_TRUE(allows(engine, "request[\"resourceId\"] == \"obs-1\""));
    EXPECT_TRUE(allows(engine, "len(user.roles) == 2"));
}

TEST(LightweightEngine, NullMemberAccessIsNull) {
    LightweightEngine engine;
    EXPECT_TRUE(allows(engine, "resource.subject == null"));
    EXPECT_TRUE(allows(engine, "resource.subject.reference == null"));
    EXPECT_TRUE(allows(engine, "user.missing == null"));
    EXPECT_EQ(fault_of(engine, "user.id.length"), ScriptFault::kError);
}

TEST(LightweightEngine, RoleHelpers) {
    LightweightEngine engine;
    EXPECT_TRUE(allows(engine, "has_role(\"clinician\")"));
    EXPECT_TRUE(allows(engine, "user.has_role(\"auditor\")"));
    EXPECT_FALSE(allows(engine, "has_role(\"admin\")"));
    EXPECT_TRUE(allows(engine, "has_any_role([\"admin\", \"auditor\"])"));
    EXPECT_TRUE(allows(engine, "has_any_role(\"admin\", \"clinician\")"));
    EXPECT_FALSE(allows(engine, "has_any_role()"));
    EXPECT_TRUE(allows(engine, "is_practitioner_user() && !is_patient_user()"));

    Json::Value anonymous = sample_context();
    anonymous["user"]     = Json::Value(Json::nullValue);
    EXPECT_FALSE(allows(engine, "has_role(\"clinician\")", anonymous));
    EXPECT_FALSE(allows(engine, "is_practitioner_user()", anonymous));
}

TEST(LightweightEngine, PatientContextHelpers) {
    LightweightEngine engine;
    EXPECT_TRUE(allows(engine, "get_patient_context() == \"pat-1\""));
    EXPECT_TRUE(allows(engine, "get_encounter_context() == null"));
    EXPECT_FALSE(allows(engine, "in_patient_compartment()"));

    Json::Value with_subject = sample_context();
    with_subject["resource"]["subject"] = "Patient/pat-1";
    EXPECT_TRUE(allows(engine, "in_patient_compartment()", with_subject));

    Json::Value compartment = sample_context();
    compartment["request"]["compartmentType"] = "Patient";
    compartment["request"]["compartmentId"]   = "pat-1";
    EXPECT_TRUE(allows(engine, "in_patient_compartment()", compartment));

    Json::Value other = sample_context();
    other["resource"]["subject"] = "Patient/pat-2";
    EXPECT_FALSE(allows(engine, "in_patient_compartment()", other));
}

TEST(LightweightEngine, StringAndCollectionHelpers) {
    LightweightEngine engine;
    EXPECT_TRUE(allows(engine, "contains(scopes.raw, \"Observation\")"));
    EXPECT_TRUE(allows(engine, "contains([1, 2, 3], 2.0)"));
    EXPECT_TRUE(allows(engine, "contains(#{a: 1}, \"a\")"));
    EXPECT_TRUE(allows(engine, "starts_with(client.id, \"app-\") && ends_with(client.id, \"-1\")"));
    EXPECT_TRUE(allows(engine, "client.id.starts_with(\"app\")"));
    EXPECT_TRUE(allows(engine, "\"n=\" + 1 == \"n=1\""));
    EXPECT_TRUE(allows(engine, "[1] + [2] == [1, 2]"));
    EXPECT_EQ(fault_of(engine, "starts_with(1, \"a\")"), ScriptFault::kError);
    EXPECT_EQ(fault_of(engine, "nope()"), ScriptFault::kError);
}

// ===========================================================================
// 제어 흐름
// ===========================================================================

TEST(LightweightEngine, LoopsAndVariables) {
    LightweightEngine engine;
    EXPECT_TRUE(allows(engine, R"(
        let total = 0
        for n in [1, 2, 3, 4] {
            if n == 3 { continue }
            total = total + n
        }
        total == 7
    )"));

    EXPECT_TRUE(allows(engine, R"(
        let i = 0
        while true {
            i = i + 1
            if i >= 5 { break }
        }
        i == 5
    )"));

    EXPECT_TRUE(allows(engine, R"(
        let keys = []
        for k in #{b: 1, a: 2} { keys = keys + [k] }
        keys == ["a", "b"]
    )"));
}

TEST(LightweightEngine, UserFunctions) {
    LightweightEngine engine;
    EXPECT_TRUE(allows(engine, R"(
        fn fact(n) { if n <= 1 { return 1 } n * fact(n - 1) }
        fact(5) == 120
    )"));

    // 사용자 함수가 같은 이름의 내장 함수를 가린다
    EXPECT_TRUE(allows(engine, "fn len(x) { 99 }\nlen(\"a\") == 99"));

    // 함수 본문은 호출자의 지역 변수를 보지 못한다
    EXPECT_EQ(fault_of(engine, "fn peek() { secret }\nlet secret = 1\npeek()"), ScriptFault::kError);
    EXPECT_EQ(fault_of(engine, "fn f(a) { a }\nf()"), ScriptFault::kError);
}

TEST(LightweightEngine, RuntimeErrors) {
    LightweightEngine engine;
    EXPECT_EQ(fault_of(engine, "user = 1"), ScriptFault::kError);
    EXPECT_EQ(fault_of(engine, "undeclared = 1"), ScriptFault::kError);
    EXPECT_EQ(fault_of(engine, "missing_var"), ScriptFault::kError);
    EXPECT_EQ(fault_of(engine, "1 / 0"), ScriptFault::kError);
    EXPECT_EQ(fault_of(engine, "\"a\" < 1"), ScriptFault::kError);
    EXPECT_EQ(fault_of(engine, "if 1 { true }"), ScriptFault::kError);
    EXPECT_EQ(fault_of(engine, "9223372036854775807 + 1"), ScriptFault::kError);
    EXPECT_EQ(fault_of(engine, "[1][5]"), ScriptFault::kError);
    EXPECT_EQ(fault_of(engine, "break"), ScriptFault::kError);
    EXPECT_EQ(fault_of(engine, "let = oops"), ScriptFault::kError);
}

// ===========================================================================
// 자원 상한 / 타임아웃
// ===========================================================================

TEST(LightweightEngine, OperationLimit) {
    LightweightEngine engine;
    EXPECT_EQ(fault_of(engine, "while true { }"), ScriptFault::kResourceExceeded);
}

TEST(LightweightEngine, CallDepthLimit) {
    LightweightEngine engine;
    EXPECT_EQ(fault_of(engine, "fn f(n) { f(n + 1) }\nf(0)"), ScriptFault::kResourceExceeded);
}

TEST(LightweightEngine, SizeLimits) {
    LightweightEngine engine;
    EXPECT_EQ(fault_of(engine, "let s = \"x\"\nwhile true { s = s + s }"), ScriptFault::kResourceExceeded);

    LightweightLimits limits;
    limits.max_array_size = 3;
    LightweightEngine small(limits);
    EXPECT_EQ(fault_of(small, "[1, 2, 3, 4]"), ScriptFault::kResourceExceeded);
    EXPECT_EQ(fault_of(small, "[1, 2] + [3, 4]"), ScriptFault::kResourceExceeded);
    EXPECT_TRUE(allows(small, "len([1, 2, 3]) == 3"));
}

TEST(LightweightEngine, ExpressionDepthLimit_IsResourceFault) {
    LightweightEngine engine;
    const std::string deep = std::string(100, '(') + "true" + std::string(100, ')');
    EXPECT_EQ(fault_of(engine, deep), ScriptFault::kResourceExceeded);
}

TEST(LightweightEngine, InfiniteLoop_TimesOut) {
    LightweightLimits limits;
    limits.max_operations = std::numeric_limits<std::uint64_t>::max();
    LightweightEngine engine(limits);

    const auto start = std::chrono::steady_clock::now();
    auto r = run(engine, "while true { }", sample_context(), 20ms);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().fault, ScriptFault::kTimeout);
    EXPECT_LT(elapsed, 1s);
}

TEST(LightweightEngine, ExpiredDeadline_TimesOutBeforeRunning) {
    LightweightEngine engine;
    const std::string id     = "p";
    const std::string source = "true";
    const Json::Value ctx    = sample_context();
    const ScriptInvocation invocation{id, source, ctx,
                                      ExecutionDeadline(ExecutionDeadline::Clock::now() - 1ms)};
    auto r = engine.execute(invocation);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().fault, ScriptFault::kTimeout);
}

// ===========================================================================
// 격리 / 캐시
// ===========================================================================

TEST(LightweightEngine, NoStateLeaksBetweenRuns) {
    LightweightEngine engine;
    EXPECT_TRUE(allows(engine, "let leaked = 1\ntrue"));
    EXPECT_EQ(fault_of(engine, "leaked == 1"), ScriptFault::kError);
}

TEST(LightweightEngine, CompileCache) {
    LightweightEngine engine;
    ASSERT_TRUE(engine.compile("has_role(\"a\")").has_value());
    ASSERT_TRUE(engine.compile("has_role(\"a\")").has_value());
    EXPECT_EQ(engine.cached_programs(), 1u);

    auto bad = engine.compile("has_role(");
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().fault, ScriptFault::kError);
    EXPECT_EQ(engine.cached_programs(), 1u);
}

TEST(LightweightEngine, ZeroLimits_Rejected) {
    LightweightLimits limits;
    limits.max_operations = 0;
    EXPECT_THROW({ LightweightEngine engine(limits); }, ConfigurationError);
}
