#pragma once

// ---------------------------------------------------------------------------
// policy_loader.hpp
//
// YAML 정책 파일을 AccessPolicy 목록으로 로드한다.
//
// [설계 원칙]
// - load() 실패 시 std::unexpected(error_message) 반환. 호출자는
//   실패 시 반드시 기존 정책을 유지하거나 서비스를 차단해야 한다.
// - All-or-nothing: 정책 하나라도 검증에 실패하면 전체 로드 실패.
//
// [검증 항목]
// - priority 범위 0..1000
// - id 중복, 빈 id
// - script 엔진의 빈 스크립트, 알 수 없는 language
// - 알 수 없는 operation / user type / compartment source
// - 잘못된 CIDR / regex
//
// [보안 고려사항]
// - YAML 파일 경로는 config 에서만 지정하고 사용자 입력을 직접 사용 금지.
// - 파싱 실패 원인은 로깅하되, 스크립트 본문을 로그에 출력하지 말 것.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "policy/access_policy.hpp"

// YAML 예시:
//   policies:
//     - id: observation-read
//       name: Observation read
//       priority: 10
//       matcher:
//         resource_types: [Observation]
//         operations: [read, search]
//         clients: ["app-*", {regex: "^svc-[0-9]+$"}]
//         compartments:
//           - {type: Patient, source: launch_context}
//       engine:
//         type: script            # allow | deny | script
//         language: lightweight   # lightweight | javascript
//         script: "has_role(\"doctor\")"
//       deny_message: "..."
class PolicyLoader {
public:
    static constexpr std::int32_t kMinPriority = 0;
    static constexpr std::int32_t kMaxPriority = 1000;

    PolicyLoader()  = default;
    ~PolicyLoader() = default;

    // 파일 없음, 파싱 오류, 스키마 불일치, 검증 실패 모두 실패로 처리한다.
    [[nodiscard]] static std::expected<std::vector<AccessPolicy>, std::string>
    load(const std::filesystem::path& policy_path);

    // YAML 문자열에서 로드 (테스트, 임베디드 정책용)
    [[nodiscard]] static std::expected<std::vector<AccessPolicy>, std::string>
    parse(std::string_view yaml_text);
};
