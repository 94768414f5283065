// ---------------------------------------------------------------------------
// test_pattern_matcher.cpp
//
// PatternMatcher 단위 테스트.
//
// [테스트 범위]
// - matcher 없음 / 빈 matcher → 항상 일치
// - client 패턴 5종 (exact / prefix / suffix / regex / wildcard)
// - roles any-of, user_types, 사용자 없음 → 불일치
// - resource_types "*", operations, operation_ids prefix ("fhir.*")
// - 경로 glob ("*" 한 세그먼트, "**" 임의, "?" 한 문자)
// - CIDR: IPv4 / IPv6 / 경계값 / 잘못된 형식 / source IP 미상 → 불일치
// - required_scopes 전부 포함
// - compartment: launch context / user resource / fixed / request param,
//   소속 판정 (자기 자신, compartment 검색, subject/author 참조)
// - 잘못된 regex → 불일치 + 캐시
//
// [알려진 한계]
// - regex 는 std::regex(ECMAScript) 의미론을 따른다. 부분 일치(search)이므로
//   전체 일치가 필요하면 패턴에 ^...$ 를 명시해야 한다.
// ---------------------------------------------------------------------------

#include "policy/pattern_matcher.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

namespace {

PolicyContext make_ctx() {
    PolicyContext ctx;
    UserIdentity user;
    user.id    = "user-1";
    user.roles = {"clinician", "auditor"};
    user.set_fhir_user("Practitioner/prac-1");
    ctx.user = std::move(user);

    ctx.client.id   = "app.portal.web";
    ctx.client.name = "Portal";

    ctx.scopes = ScopeSummary::from_scope_string("launch/patient openid patient/Observation.rs");

    ctx.request.operation     = FhirOperation::kRead;
    ctx.request.resource_type = "Observation";
    ctx.request.resource_id   = "obs-1";
    ctx.request.path          = "/Observation/obs-1";
    ctx.request.method        = "GET";

    ctx.environment.source_ip       = "10.1.2.3";
    ctx.environment.patient_context = "pat-1";
    return ctx;
}

MatchPattern pattern(MatchPattern::Kind kind, std::string value) {
    return MatchPattern{kind, std::move(value)};
}

}  // namespace

// ===========================================================================
// 기본 동작
// ===========================================================================

TEST(PatternMatcher, NoMatcher_AlwaysMatches) {
    PatternMatcher pm;
    EXPECT_TRUE(pm.matches(std::optional<PolicyMatcher>{}, make_ctx()));
    EXPECT_TRUE(pm.matches(PolicyMatcher{}, make_ctx()));
}

TEST(PatternMatcher, FieldsAreAndCombined) {
    PatternMatcher pm;
    PolicyMatcher m;
    m.resource_types = std::vector<std::string>{"Observation"};
    m.operations     = std::vector<FhirOperation>{FhirOperation::kRead};
    EXPECT_TRUE(pm.matches(m, make_ctx()));

    m.roles = std::vector<std::string>{"admin"};
    EXPECT_FALSE(pm.matches(m, make_ctx()));
}

// ===========================================================================
// client 패턴
// ===========================================================================

TEST(PatternMatcher, ClientPatterns) {
    PatternMatcher pm;
    const std::string id = "app.portal.web";

    EXPECT_TRUE(pm.match_pattern(pattern(MatchPattern::Kind::kExact, id), id));
    EXPECT_FALSE(pm.match_pattern(pattern(MatchPattern::Kind::kExact, "app.portal"), id));

    EXPECT_TRUE(pm.match_pattern(pattern(MatchPattern::Kind::kPrefix, "app."), id));
    EXPECT_FALSE(pm.match_pattern(pattern(MatchPattern::Kind::kPrefix, "svc."), id));

    EXPECT_TRUE(pm.match_pattern(pattern(MatchPattern::Kind::kSuffix, ".web"), id));
    EXPECT_FALSE(pm.match_pattern(pattern(MatchPattern::Kind::kSuffix, ".mobile"), id));

    EXPECT_TRUE(pm.match_pattern(pattern(MatchPattern::Kind::kRegex, "^app\\.[a-z]+\\.web$"), id));
    EXPECT_FALSE(pm.match_pattern(pattern(MatchPattern::Kind::kRegex, "^svc\\."), id));

    EXPECT_TRUE(pm.match_pattern(pattern(MatchPattern::Kind::kWildcard, "app.*.web"), id));
    EXPECT_TRUE(pm.match_pattern(pattern(MatchPattern::Kind::kWildcard, "*"), id));
    EXPECT_FALSE(pm.match_pattern(pattern(MatchPattern::Kind::kWildcard, "app.*.mobile"), id));
}

TEST(PatternMatcher, Wildcard_DotIsLiteral) {
    PatternMatcher pm;
    EXPECT_FALSE(pm.match_pattern(pattern(MatchPattern::Kind::kWildcard, "app.*"), "appXportal"));
    EXPECT_EQ(PatternMatcher::wildcard_to_regex("a.b*"), "^a\\.b.*$");
}

TEST(PatternMatcher, ClientList_AnyOf) {
    PatternMatcher pm;
    PolicyMatcher m;
    m.clients = std::vector<MatchPattern>{pattern(MatchPattern::Kind::kExact, "other"),
                                          pattern(MatchPattern::Kind::kSuffix, ".web")};
    EXPECT_TRUE(pm.matches(m, make_ctx()));

    m.clients = std::vector<MatchPattern>{pattern(MatchPattern::Kind::kExact, "other")};
    EXPECT_FALSE(pm.matches(m, make_ctx()));
}

TEST(PatternMatcher, InvalidRegex_NoMatchAndCached) {
    PatternMatcher pm;
    const auto bad = pattern(MatchPattern::Kind::kRegex, "([unclosed");
    EXPECT_FALSE(pm.match_pattern(bad, "anything"));
    EXPECT_EQ(pm.compiled("([unclosed"), nullptr);
    EXPECT_EQ(pm.cache_size(), 1u);

    EXPECT_FALSE(pm.match_pattern(bad, "anything"));
    EXPECT_EQ(pm.cache_size(), 1u);
}

// ===========================================================================
// 사용자
// ===========================================================================

TEST(PatternMatcher, Roles_AnyOf) {
    PatternMatcher pm;
    PolicyMatcher m;
    m.roles = std::vector<std::string>{"admin", "auditor"};
    EXPECT_TRUE(pm.matches(m, make_ctx()));

    m.roles = std::vector<std::string>{"admin"};
    EXPECT_FALSE(pm.matches(m, make_ctx()));
}

TEST(PatternMatcher, UserConditions_WithoutUser_NoMatch) {
    PatternMatcher pm;
    auto ctx = make_ctx();
    ctx.user.reset();

    PolicyMatcher roles;
    roles.roles = std::vector<std::string>{"clinician"};
    EXPECT_FALSE(pm.matches(roles, ctx));

    PolicyMatcher types;
    types.user_types = std::vector<std::string>{"Practitioner"};
    EXPECT_FALSE(pm.matches(types, ctx));
}

TEST(PatternMatcher, UserTypes) {
    PatternMatcher pm;
    PolicyMatcher m;
    m.user_types = std::vector<std::string>{"Practitioner", "PractitionerRole"};
    EXPECT_TRUE(pm.matches(m, make_ctx()));

    m.user_types = std::vector<std::string>{"Patient"};
    EXPECT_FALSE(pm.matches(m, make_ctx()));

    // fhirUser 가 없으면 타입을 알 수 없다
    auto ctx = make_ctx();
    ctx.user->fhir_user_type.reset();
    m.user_types = std::vector<std::string>{"Practitioner"};
    EXPECT_FALSE(pm.matches(m, ctx));
}

// ===========================================================================
// 요청
// ===========================================================================

TEST(PatternMatcher, ResourceTypes_WildcardAndList) {
    PatternMatcher pm;
    PolicyMatcher m;
    m.resource_types = std::vector<std::string>{"*"};
    EXPECT_TRUE(pm.matches(m, make_ctx()));

    m.resource_types = std::vector<std::string>{"Patient", "Observation"};
    EXPECT_TRUE(pm.matches(m, make_ctx()));

    m.resource_types = std::vector<std::string>{"Patient"};
    EXPECT_FALSE(pm.matches(m, make_ctx()));
}

TEST(PatternMatcher, Operations) {
    PatternMatcher pm;
    PolicyMatcher m;
    m.operations = std::vector<FhirOperation>{FhirOperation::kUpdate, FhirOperation::kDelete};
    EXPECT_FALSE(pm.matches(m, make_ctx()));

    auto ctx = make_ctx();
    ctx.request.operation = FhirOperation::kDelete;
    EXPECT_TRUE(pm.matches(m, ctx));
}

TEST(PatternMatcher, OperationIds_ExactPrefixAndMissing) {
    PatternMatcher pm;
    auto ctx = make_ctx();
    ctx.request.operation    = FhirOperation::kOperation;
    ctx.request.operation_id = "fhir.export";

    PolicyMatcher m;
    m.operation_ids = std::vector<std::string>{"fhir.*"};
    EXPECT_TRUE(pm.matches(m, ctx));

    m.operation_ids = std::vector<std::string>{"fhir.export"};
    EXPECT_TRUE(pm.matches(m, ctx));

    m.operation_ids = std::vector<std::string>{"everything"};
    EXPECT_FALSE(pm.matches(m, ctx));

    // "fhir.*" 는 "fhirx" 를 포함하지 않는다
    ctx.request.operation_id = "fhirx";
    m.operation_ids = std::vector<std::string>{"fhir.*"};
    EXPECT_FALSE(pm.matches(m, ctx));

    ctx.request.operation_id.reset();
    m.operation_ids = std::vector<std::string>{"*"};
    EXPECT_FALSE(pm.matches(m, ctx));
}

TEST(PatternMatcher, PathGlobs) {
    PatternMatcher pm;
    EXPECT_TRUE(pm.match_path("/Patient/*", "/Patient/123"));
    EXPECT_FALSE(pm.match_path("/Patient/*", "/Patient/123/_history"));
    EXPECT_TRUE(pm.match_path("/Patient/**", "/Patient/123/_history/2"));
    EXPECT_TRUE(pm.match_path("/Patient/12?", "/Patient/123"));
    EXPECT_FALSE(pm.match_path("/Patient/12?", "/Patient/1234"));
    EXPECT_TRUE(pm.match_path("/Patient/*/$everything", "/Patient/123/$everything"));
    EXPECT_FALSE(pm.match_path("/Patient", "/Patient/123"));

    PolicyMatcher m;
    m.paths = std::vector<std::string>{"/Patient/**", "/Observation/*"};
    EXPECT_TRUE(pm.matches(m, make_ctx()));
}

// ===========================================================================
// CIDR
// ===========================================================================

TEST(PatternMatcher, CidrIpv4) {
    EXPECT_TRUE(PatternMatcher::ip_in_cidr("10.1.2.3", "10.0.0.0/8"));
    EXPECT_FALSE(PatternMatcher::ip_in_cidr("11.1.2.3", "10.0.0.0/8"));
    EXPECT_TRUE(PatternMatcher::ip_in_cidr("192.168.1.100", "192.168.1.100/32"));
    EXPECT_FALSE(PatternMatcher::ip_in_cidr("192.168.1.101", "192.168.1.100/32"));
    EXPECT_TRUE(PatternMatcher::ip_in_cidr("8.8.8.8", "0.0.0.0/0"));
    EXPECT_TRUE(PatternMatcher::ip_in_cidr("172.16.200.1", "172.16.128.0/17"));
    EXPECT_FALSE(PatternMatcher::ip_in_cidr("172.16.100.1", "172.16.128.0/17"));
    EXPECT_TRUE(PatternMatcher::ip_in_cidr("10.1.2.3", "10.1.2.3"));
}

TEST(PatternMatcher, CidrIpv6) {
    EXPECT_TRUE(PatternMatcher::ip_in_cidr("2001:db8::1", "2001:db8::/32"));
    EXPECT_FALSE(PatternMatcher::ip_in_cidr("2001:db9::1", "2001:db8::/32"));
    EXPECT_TRUE(PatternMatcher::ip_in_cidr("::1", "::1/128"));
    // 주소 패밀리가 다르면 불일치
    EXPECT_FALSE(PatternMatcher::ip_in_cidr("10.0.0.1", "::/0"));
    EXPECT_FALSE(PatternMatcher::ip_in_cidr("::ffff:10.0.0.1", "10.0.0.0/8"));
}

TEST(PatternMatcher, CidrInvalid_NoMatch) {
    EXPECT_FALSE(PatternMatcher::is_valid_cidr("10.0.0.0/33"));
    EXPECT_FALSE(PatternMatcher::is_valid_cidr("10.0.0.0/-1"));
    EXPECT_FALSE(PatternMatcher::is_valid_cidr("10.0.0.0/abc"));
    EXPECT_FALSE(PatternMatcher::is_valid_cidr("10.0.0.0/"));
    EXPECT_FALSE(PatternMatcher::is_valid_cidr("not-an-ip/8"));
    EXPECT_FALSE(PatternMatcher::is_valid_cidr("2001:db8::/129"));
    EXPECT_TRUE(PatternMatcher::is_valid_cidr("2001:db8::/128"));

    EXPECT_FALSE(PatternMatcher::ip_in_cidr("10.0.0.1", "10.0.0.0/33"));
    EXPECT_FALSE(PatternMatcher::ip_in_cidr("garbage", "10.0.0.0/8"));
}

TEST(PatternMatcher, SourceIps_UnknownIp_NoMatch) {
    PatternMatcher pm;
    PolicyMatcher m;
    m.source_ips = std::vector<std::string>{"192.168.0.0/16", "10.0.0.0/8"};
    EXPECT_TRUE(pm.matches(m, make_ctx()));

    auto ctx = make_ctx();
    ctx.environment.source_ip.reset();
    EXPECT_FALSE(pm.matches(m, ctx));
}

// ===========================================================================
// scope
// ===========================================================================

TEST(PatternMatcher, RequiredScopes_AllPresent) {
    PatternMatcher pm;
    PolicyMatcher m;
    m.required_scopes = std::vector<std::string>{"openid", "patient/Observation.rs"};
    EXPECT_TRUE(pm.matches(m, make_ctx()));

    m.required_scopes = std::vector<std::string>{"openid", "fhirUser"};
    EXPECT_FALSE(pm.matches(m, make_ctx()));

    // 부분 문자열은 포함으로 보지 않는다
    m.required_scopes = std::vector<std::string>{"patient/Observation.r"};
    EXPECT_FALSE(pm.matches(m, make_ctx()));
}

// ===========================================================================
// compartment
// ===========================================================================

TEST(PatternMatcher, Compartment_LaunchContext_SubjectReference) {
    PatternMatcher pm;
    auto ctx = make_ctx();
    Json::Value obs(Json::objectValue);
    obs["resourceType"]           = "Observation";
    obs["id"]                     = "obs-1";
    obs["subject"]["reference"]   = "Patient/pat-1";
    ctx.resource = ResourceContext::from_resource(obs);

    const CompartmentMatcher cm{"Patient", CompartmentSource::kLaunchContext, ""};
    EXPECT_TRUE(pm.match_compartment(cm, ctx));

    ctx.environment.patient_context = "pat-2";
    EXPECT_FALSE(pm.match_compartment(cm, ctx));

    ctx.environment.patient_context.reset();
    EXPECT_FALSE(pm.match_compartment(cm, ctx));
}

TEST(PatternMatcher, Compartment_AbsoluteReference) {
    PatternMatcher pm;
    auto ctx = make_ctx();
    Json::Value obs(Json::objectValue);
    obs["resourceType"]         = "Observation";
    obs["subject"]["reference"] = "https://fhir.example.org/Patient/pat-1";
    ctx.resource = ResourceContext::from_resource(obs);

    EXPECT_TRUE(pm.match_compartment({"Patient", CompartmentSource::kLaunchContext, ""}, ctx));
}

TEST(PatternMatcher, Compartment_SelfAndCompartmentSearch) {
    PatternMatcher pm;
    const CompartmentMatcher cm{"Patient", CompartmentSource::kLaunchContext, ""};

    auto self = make_ctx();
    self.request.resource_type = "Patient";
    self.request.resource_id   = "pat-1";
    EXPECT_TRUE(pm.match_compartment(cm, self));

    auto search = make_ctx();
    search.request.resource_type    = "Observation";
    search.request.resource_id.reset();
    search.request.compartment_type = "Patient";
    search.request.compartment_id   = "pat-1";
    EXPECT_TRUE(pm.match_compartment(cm, search));

    search.request.compartment_id = "pat-9";
    EXPECT_FALSE(pm.match_compartment(cm, search));
}

TEST(PatternMatcher, Compartment_UserResource_Author) {
    PatternMatcher pm;
    auto ctx = make_ctx();
    Json::Value note(Json::objectValue);
    note["resourceType"]          = "DocumentReference";
    note["author"][0u]["reference"] = "Practitioner/prac-1";
    ctx.resource = ResourceContext::from_resource(note);

    const CompartmentMatcher cm{"Practitioner", CompartmentSource::kUserResource, ""};
    EXPECT_TRUE(pm.match_compartment(cm, ctx));

    // 사용자 타입이 compartment 타입과 다르면 ID 를 해석하지 않는다
    const CompartmentMatcher as_patient{"Patient", CompartmentSource::kUserResource, ""};
    EXPECT_FALSE(pm.match_compartment(as_patient, ctx));
}

TEST(PatternMatcher, Compartment_FixedAndRequestParam) {
    PatternMatcher pm;
    auto ctx = make_ctx();
    ctx.request.resource_type = "Patient";
    ctx.request.resource_id   = "pat-7";

    EXPECT_TRUE(pm.match_compartment({"Patient", CompartmentSource::kFixed, "pat-7"}, ctx));
    EXPECT_FALSE(pm.match_compartment({"Patient", CompartmentSource::kFixed, "pat-8"}, ctx));

    const CompartmentMatcher by_param{"Patient", CompartmentSource::kRequestParam, "patient"};
    EXPECT_FALSE(pm.match_compartment(by_param, ctx));
    ctx.request.query_params["patient"] = "pat-7";
    EXPECT_TRUE(pm.match_compartment(by_param, ctx));
}

TEST(PatternMatcher, Compartments_AllMustHold) {
    PatternMatcher pm;
    auto ctx = make_ctx();
    ctx.request.resource_type = "Patient";
    ctx.request.resource_id   = "pat-1";

    PolicyMatcher m;
    m.compartments = std::vector<CompartmentMatcher>{
        {"Patient", CompartmentSource::kLaunchContext, ""},
        {"Patient", CompartmentSource::kFixed, "pat-1"},
    };
    EXPECT_TRUE(pm.matches(m, ctx));

    m.compartments->push_back({"Patient", CompartmentSource::kFixed, "pat-2"});
    EXPECT_FALSE(pm.matches(m, ctx));
}
