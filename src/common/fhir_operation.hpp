#pragma once

// ---------------------------------------------------------------------------
// fhir_operation.hpp
//
// FHIR REST 상호작용 분류. 정책 매처, SMART scope 검사, 스크립트 컨텍스트가
// 공통으로 사용하는 와이어 문자열("read", "search-type" ...)을 정의한다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

enum class FhirOperation : std::uint8_t {
    kRead            = 0,
    kVRead           = 1,
    kUpdate          = 2,
    kPatch           = 3,
    kDelete          = 4,
    kHistoryInstance = 5,
    kHistoryType     = 6,
    kHistorySystem   = 7,
    kCreate          = 8,
    kSearchType      = 9,
    kSearchSystem    = 10,
    kCapabilities    = 11,
    kBatch           = 12,
    kTransaction     = 13,
    kOperation       = 14,  // $operation 호출
};

// FhirOperation → 와이어 문자열
[[nodiscard]] std::string_view to_string(FhirOperation op) noexcept;

// 와이어 문자열 → FhirOperation (별칭 미포함, 대소문자 구분)
[[nodiscard]] std::optional<FhirOperation> parse_fhir_operation(std::string_view name) noexcept;

// expand_operation_alias
//   정책 YAML 에서 허용하는 이름을 실제 오퍼레이션 목록으로 펼친다.
//   "history" → history-instance/type/system
//   "search"  → search-type/system
//   "*"       → 전체
//   알 수 없는 이름이면 std::nullopt.
[[nodiscard]] std::optional<std::vector<FhirOperation>>
expand_operation_alias(std::string_view name);

// 전체 오퍼레이션 목록 (선언 순서)
[[nodiscard]] const std::vector<FhirOperation>& all_fhir_operations();
