#pragma once

// ---------------------------------------------------------------------------
// access_policy.hpp
//
// 접근 정책 구조체 정의 (헤더만, 구현 없음).
// yaml-cpp 를 통해 정책 YAML 에서 로드된다 (PolicyLoader).
//
// [설계 원칙]
// - 로드 이후 불변. 평가 1회 동안 읽기 전용 스냅샷으로만 사용된다.
// - 모든 matcher 필드는 std::optional: 미설정 = 조건 없음.
//   설정된 필드끼리는 AND 결합이다.
// - 엔진 종류는 닫힌 std::variant. 새 엔진 추가 시 std::visit 호출부가
//   컴파일 오류로 누락을 알려준다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "common/fhir_operation.hpp"

// ---------------------------------------------------------------------------
// MatchPattern
//   client ID 패턴. kWildcard 는 '*' 만 특수문자로 쓰는 glob.
// ---------------------------------------------------------------------------
struct MatchPattern {
    enum class Kind : std::uint8_t {
        kExact    = 0,
        kPrefix   = 1,
        kSuffix   = 2,
        kRegex    = 3,
        kWildcard = 4,
    };

    Kind        kind{Kind::kExact};
    std::string value{};
};

// ---------------------------------------------------------------------------
// CompartmentMatcher
//   compartment_type: "Patient", "Encounter", "Practitioner" ...
//   source 에 따라 value 의 의미가 다르다.
//     kLaunchContext : value 미사용
//     kUserResource  : value 미사용
//     kFixed         : 고정 compartment ID
//     kRequestParam  : 쿼리 파라미터 이름
// ---------------------------------------------------------------------------
enum class CompartmentSource : std::uint8_t {
    kLaunchContext = 0,
    kUserResource  = 1,
    kFixed         = 2,
    kRequestParam  = 3,
};

struct CompartmentMatcher {
    std::string       compartment_type{};
    CompartmentSource source{CompartmentSource::kLaunchContext};
    std::string       value{};
};

struct PolicyMatcher {
    std::optional<std::vector<MatchPattern>>       clients{};
    std::optional<std::vector<std::string>>        roles{};           // any-of
    std::optional<std::vector<std::string>>        user_types{};      // fhir_user_type
    std::optional<std::vector<std::string>>        resource_types{};  // "*" 허용
    std::optional<std::vector<FhirOperation>>      operations{};
    std::optional<std::vector<std::string>>        operation_ids{};   // "fhir.*" = prefix
    std::optional<std::vector<std::string>>        paths{};           // glob
    std::optional<std::vector<std::string>>        source_ips{};      // CIDR
    std::optional<std::vector<std::string>>        required_scopes{}; // 전부 포함
    std::optional<std::vector<CompartmentMatcher>> compartments{};    // 전부 만족
};

// ---------------------------------------------------------------------------
// 엔진 종류
// ---------------------------------------------------------------------------
struct AllowEngine {};
struct DenyEngine {};

enum class ScriptLanguage : std::uint8_t {
    kLightweight = 0,  // 내장 표현식 인터프리터
    kJavaScript  = 1,  // QuickJS 풀
};

struct ScriptEngineSpec {
    ScriptLanguage language{ScriptLanguage::kLightweight};
    std::string    source{};
};

using PolicyEngineSpec = std::variant<AllowEngine, DenyEngine, ScriptEngineSpec>;

// ---------------------------------------------------------------------------
// AccessPolicy
//   priority: 낮을수록 먼저 평가 (0..1000). 동률은 id 사전순.
// ---------------------------------------------------------------------------
struct AccessPolicy {
    std::string                  id{};
    std::string                  name{};
    std::optional<std::string>   description{};
    std::int32_t                 priority{100};
    bool                         active{true};
    std::optional<PolicyMatcher> matcher{};
    PolicyEngineSpec             engine{DenyEngine{}};
    std::optional<std::string>   deny_message{};
};

// 평가 순서: (priority, id) 오름차순
[[nodiscard]] inline bool policy_order_less(const AccessPolicy& a, const AccessPolicy& b) noexcept {
    if (a.priority != b.priority) {
        return a.priority < b.priority;
    }
    return a.id < b.id;
}
