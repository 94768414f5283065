// ---------------------------------------------------------------------------
// in_memory_policy_store.cpp
// ---------------------------------------------------------------------------

#include "policy/in_memory_policy_store.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace {

// matcher 의 resource_types / operations 만으로 후보 여부를 거른다.
// 나머지 필드는 PatternMatcher 가 평가 시점에 판단한다.
bool is_candidate(const AccessPolicy& policy, std::string_view resource_type,
                  FhirOperation operation) {
    if (!policy.active) {
        return false;
    }
    if (!policy.matcher) {
        return true;
    }
    const auto& m = *policy.matcher;
    if (m.resource_types &&
        std::none_of(m.resource_types->begin(), m.resource_types->end(),
                     [&](const std::string& t) { return t == "*" || t == resource_type; })) {
        return false;
    }
    if (m.operations &&
        std::find(m.operations->begin(), m.operations->end(), operation) == m.operations->end()) {
        return false;
    }
    return true;
}

}  // namespace

InMemoryPolicyStore::InMemoryPolicyStore()
    : policies_(std::make_shared<const PolicySet>()) {}

InMemoryPolicyStore::InMemoryPolicyStore(std::vector<AccessPolicy> policies)
    : InMemoryPolicyStore() {
    reload(std::move(policies));
}

std::expected<std::vector<AccessPolicy>, StorageError>
InMemoryPolicyStore::find_applicable(std::string_view resource_type, FhirOperation operation) const {
    const auto snapshot = policies_.load();

    std::vector<AccessPolicy> result;
    for (const auto& policy : *snapshot) {
        if (is_candidate(policy, resource_type, operation)) {
            result.push_back(policy);
        }
    }
    return result;
}

void InMemoryPolicyStore::reload(std::vector<AccessPolicy> policies) {
    std::sort(policies.begin(), policies.end(), policy_order_less);
    const auto count = policies.size();
    policies_.store(std::make_shared<const PolicySet>(std::move(policies)));
    spdlog::info("policy_store: reloaded {} policies", count);
}

std::size_t InMemoryPolicyStore::size() const {
    return policies_.load()->size();
}
