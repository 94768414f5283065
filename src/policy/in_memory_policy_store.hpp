#pragma once

// ---------------------------------------------------------------------------
// in_memory_policy_store.hpp
//
// PolicyLoader 결과를 메모리에 보관하는 PolicyStore 구현.
//
// [Hot Reload]
// reload() 는 std::atomic<std::shared_ptr<const PolicySet>> 교체로 수행된다.
// 진행 중인 find_applicable() 은 load() 로 얻은 이전 스냅샷으로 완료된다.
// ---------------------------------------------------------------------------

#include <atomic>
#include <cstddef>
#include <memory>
#include <vector>

#include "policy/policy_store.hpp"

class InMemoryPolicyStore final : public PolicyStore {
public:
    using PolicySet = std::vector<AccessPolicy>;

    InMemoryPolicyStore();
    explicit InMemoryPolicyStore(std::vector<AccessPolicy> policies);
    ~InMemoryPolicyStore() override = default;

    InMemoryPolicyStore(const InMemoryPolicyStore&)            = delete;
    InMemoryPolicyStore& operator=(const InMemoryPolicyStore&) = delete;

    [[nodiscard]] std::expected<std::vector<AccessPolicy>, StorageError>
    find_applicable(std::string_view resource_type, FhirOperation operation) const override;

    // 정렬 후 원자적 교체. 비활성 정책도 보관은 하되 조회에서 제외한다.
    void reload(std::vector<AccessPolicy> policies);

    [[nodiscard]] std::size_t size() const;

private:
    std::atomic<std::shared_ptr<const PolicySet>> policies_;
};
