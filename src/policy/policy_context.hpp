#pragma once

// ---------------------------------------------------------------------------
// policy_context.hpp
//
// 요청 1건의 판정 입력. 전송 계층이 HTTP 요청과 검증된 토큰 클레임으로
// 한 번 구성하고, 평가 중에는 변경하지 않는다 (const& 로만 전달).
//
// [스크립트 노출]
// to_json() 결과가 스크립트 엔진에 읽기 전용 `ctx` 로 전달된다.
// 키는 camelCase (user.fhirUserType, environment.patientContext ...).
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <json/json.h>

#include "common/fhir_operation.hpp"

// ---------------------------------------------------------------------------
// UserIdentity
//   fhir_user: "Practitioner/123" 형식의 참조.
//   fhir_user_type / fhir_user_id 는 fhir_user 를 분해한 값이다.
// ---------------------------------------------------------------------------
struct UserIdentity {
    std::string                id{};
    std::optional<std::string> fhir_user{};
    std::optional<std::string> fhir_user_type{};
    std::optional<std::string> fhir_user_id{};
    std::vector<std::string>   roles{};
    Json::Value                attributes{Json::objectValue};

    // fhir_user 를 설정하면서 type/id 도 채운다. 참조 형식이 아니면 type/id 는 비워둔다.
    void set_fhir_user(std::string_view reference);

    [[nodiscard]] bool has_role(std::string_view role) const noexcept;
};

enum class ClientType : std::uint8_t {
    kPublic                  = 0,
    kConfidentialSymmetric   = 1,
    kConfidentialAsymmetric  = 2,
};

[[nodiscard]] std::string_view to_string(ClientType type) noexcept;
[[nodiscard]] std::optional<ClientType> parse_client_type(std::string_view name) noexcept;

struct ClientIdentity {
    std::string id{};
    std::string name{};
    bool        trusted{false};
    ClientType  client_type{ClientType::kPublic};
};

// ---------------------------------------------------------------------------
// ScopeSummary
//   raw scope 문자열의 요약. 매처(required_scopes)와 스크립트가 사용한다.
//   from_scope_string 은 SMART 문법을 엄격 검증하지 않는다.
//   엄격 검증이 필요한 경로(scope 사전 검사)는 SmartScopes::parse 를 쓴다.
// ---------------------------------------------------------------------------
struct ScopeSummary {
    std::string              raw{};
    std::vector<std::string> patient_scopes{};
    std::vector<std::string> user_scopes{};
    std::vector<std::string> system_scopes{};
    bool                     has_wildcard{false};
    bool                     launch{false};
    bool                     openid{false};
    bool                     fhir_user{false};
    bool                     offline_access{false};

    [[nodiscard]] static ScopeSummary from_scope_string(std::string_view raw);

    // 공백 구분 토큰 중 정확히 일치하는 것이 있는지
    [[nodiscard]] bool contains(std::string_view scope) const noexcept;
};

struct RequestContext {
    FhirOperation                      operation{FhirOperation::kRead};
    std::optional<std::string>         operation_id{};     // "$everything" 의 "everything"
    std::string                        resource_type{};
    std::optional<std::string>         resource_id{};
    std::optional<std::string>         compartment_type{};
    std::optional<std::string>         compartment_id{};
    std::optional<Json::Value>         body{};
    std::map<std::string, std::string> query_params{};
    std::string                        path{};
    std::string                        method{"GET"};
};

// ---------------------------------------------------------------------------
// ResourceContext
//   기존 리소스 스냅샷 (read/update/delete 대상).
//   subject / author 는 "Type/id" 참조 문자열이다.
// ---------------------------------------------------------------------------
struct ResourceContext {
    Json::Value                resource{Json::objectValue};
    std::string                id{};
    std::string                resource_type{};
    std::optional<std::string> version_id{};
    std::optional<std::string> last_updated{};
    std::optional<std::string> subject{};
    std::optional<std::string> author{};

    [[nodiscard]] static ResourceContext from_resource(const Json::Value& resource);
};

struct EnvironmentContext {
    std::chrono::system_clock::time_point request_time{};
    std::optional<std::string>            source_ip{};
    std::string                           request_id{};
    std::optional<std::string>            patient_context{};
    std::optional<std::string>            encounter_context{};
};

struct PolicyContext {
    std::optional<UserIdentity>    user{};
    ClientIdentity                 client{};
    ScopeSummary                   scopes{};
    RequestContext                 request{};
    std::optional<ResourceContext> resource{};
    EnvironmentContext             environment{};
};

// ---------------------------------------------------------------------------
// ParsedFhirPath
//   "/Patient/123/_history/2", "/Patient/123/$everything",
//   "/Patient/123/Observation" 등을 분해한 결과.
//   앞의 "fhir" 세그먼트와 쿼리 문자열은 무시한다.
// ---------------------------------------------------------------------------
struct ParsedFhirPath {
    std::string                resource_type{};
    std::optional<std::string> resource_id{};
    std::optional<std::string> version_id{};
    std::optional<std::string> operation_id{};
    std::optional<std::string> compartment_type{};
    std::optional<std::string> compartment_id{};
    bool                       history{false};
    bool                       search{false};   // POST .../_search
};

[[nodiscard]] ParsedFhirPath parse_fhir_path(std::string_view path);

// ---------------------------------------------------------------------------
// detect_operation
//   REST method + path → FhirOperation.
//   POST / 는 body 의 Bundle.type ("batch" | "transaction") 으로 구분한다.
//   body 가 없거나 type 이 다르면 std::nullopt.
// ---------------------------------------------------------------------------
[[nodiscard]] std::optional<FhirOperation>
detect_operation(std::string_view method, std::string_view path,
                 const Json::Value* body = nullptr);

// "Patient/123" → {"Patient", "123"}. 절대 URL 이면 마지막 두 세그먼트를 쓴다.
[[nodiscard]] std::optional<std::pair<std::string, std::string>>
split_reference(std::string_view reference);

// 스크립트 엔진에 노출되는 읽기 전용 값
[[nodiscard]] Json::Value to_json(const PolicyContext& ctx);

// 전송 계층 입력(JSON) → PolicyContext. CLI 의 evaluate 서브커맨드가 사용한다.
// 입력 키는 to_json() 출력과 같다. operation 이 없으면 method/path 로 추론한다.
[[nodiscard]] std::expected<PolicyContext, std::string>
policy_context_from_json(const Json::Value& value);
