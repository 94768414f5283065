#pragma once

// ---------------------------------------------------------------------------
// smart_scopes.hpp
//
// SMART on FHIR scope 문자열 파서와 권한 검사.
//
// [문법]
//   <context>/<ResourceType|*>.<permissions>[?<param>=<value>[&...]]
//   context     : patient | user | system
//   permissions : "cruds" 의 부분집합, 반드시 c<r<u<d<s 엄격 오름차순
//                 (v1 호환: read = rs, write = cud, * = cruds)
//   특수 scope  : launch, launch/patient, launch/encounter, openid,
//                 fhirUser, offline_access, online_access
//
// [fail-close]
// 순서 위반("rc"), 중복("rr"), 알 수 없는 문자, 알 수 없는 scope 는 모두
// 파싱 오류다. 부분적으로 파싱된 scope 집합을 반환하지 않는다.
// ---------------------------------------------------------------------------

#include "common/fhir_operation.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

enum class ScopeContext : std::uint8_t {
    kPatient = 0,
    kUser    = 1,
    kSystem  = 2,
};

[[nodiscard]] std::string_view to_string(ScopeContext context) noexcept;

// ---------------------------------------------------------------------------
// ScopePermissions
//   c(create) r(read) u(update) d(delete) s(search) 비트 집합.
// ---------------------------------------------------------------------------
struct ScopePermissions {
    bool create{false};
    bool read{false};
    bool update{false};
    bool remove{false};
    bool search{false};

    // "rs", "cruds", "read", "write", "*" 등을 파싱한다.
    [[nodiscard]] static std::expected<ScopePermissions, std::string>
    parse(std::string_view text);

    // 오퍼레이션 수행에 필요한 권한을 보유하는지 검사한다.
    [[nodiscard]] bool allows(FhirOperation op) const noexcept;

    // v2 표기("cruds" 부분 문자열)로 직렬화
    [[nodiscard]] std::string to_string() const;

    bool operator==(const ScopePermissions&) const = default;
};

// ---------------------------------------------------------------------------
// SmartScope
//   단일 scope 토큰의 파싱 결과.
// ---------------------------------------------------------------------------
struct SmartScope {
    enum class Kind : std::uint8_t {
        kResource       = 0,
        kLaunch         = 1,
        kLaunchPatient  = 2,
        kLaunchEncounter = 3,
        kOpenId         = 4,
        kFhirUser       = 5,
        kOfflineAccess  = 6,
        kOnlineAccess   = 7,
    };

    Kind             kind{Kind::kResource};
    ScopeContext     context{ScopeContext::kPatient};    // kResource 전용
    std::string      resource_type{};                     // "*" 허용
    ScopePermissions permissions{};
    std::vector<std::pair<std::string, std::string>> filters{};  // ?k=v
    std::string      raw{};

    [[nodiscard]] static std::expected<SmartScope, std::string> parse(std::string_view token);

    // resource_type 이 일치(또는 "*")하고 권한이 있으면 true
    [[nodiscard]] bool permits(std::string_view resource_type, FhirOperation op) const noexcept;
};

// ---------------------------------------------------------------------------
// SmartScopes
//   공백 구분 scope 문자열 전체.
// ---------------------------------------------------------------------------
class SmartScopes {
public:
    SmartScopes() = default;

    [[nodiscard]] static std::expected<SmartScopes, std::string> parse(std::string_view scope_string);

    // 지정 context 의 scope 중 하나라도 허용하면 true
    [[nodiscard]] bool permits(ScopeContext context,
                               std::string_view resource_type,
                               FhirOperation op) const noexcept;

    // context 무관, 하나라도 허용하면 true. capabilities 는 항상 허용.
    [[nodiscard]] bool permits_any(std::string_view resource_type, FhirOperation op) const noexcept;

    [[nodiscard]] bool has(SmartScope::Kind kind) const noexcept;

    [[nodiscard]] const std::vector<SmartScope>& scopes() const noexcept { return scopes_; }

    // 원본 토큰을 공백으로 이어 붙인 문자열
    [[nodiscard]] std::string to_string() const;

private:
    std::vector<SmartScope> scopes_;
};
