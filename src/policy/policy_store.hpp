#pragma once

// ---------------------------------------------------------------------------
// policy_store.hpp
//
// Policy Store 경계. 평가 코어는 후보 정책을 조회만 한다.
//
// [계약]
// - 반환 목록은 (priority, id) 오름차순이어야 한다.
//   PolicyEvaluator 는 stable_sort 로 같은 순서를 한 번 더 보장한다.
// - 조회 실패는 StorageError 로 반환한다. 평가기는 이를 Deny 로 변환한다.
// - 반환된 정책은 해당 평가 동안 불변 스냅샷이다.
// ---------------------------------------------------------------------------

#include <expected>
#include <string_view>
#include <vector>

#include "common/fhir_operation.hpp"
#include "common/types.hpp"
#include "policy/access_policy.hpp"

class PolicyStore {
public:
    virtual ~PolicyStore() = default;

    // 활성 정책 중 resource_type / operation 에 적용될 수 있는 후보.
    // matcher 가 없거나 해당 필드가 없는 정책은 항상 후보다.
    [[nodiscard]] virtual std::expected<std::vector<AccessPolicy>, StorageError>
    find_applicable(std::string_view resource_type, FhirOperation operation) const = 0;
};
