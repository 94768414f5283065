#pragma once

// ---------------------------------------------------------------------------
// pattern_matcher.hpp
//
// 정책 적용 여부를 판단하는 구조적 필터.
// 설정된 matcher 필드는 모두 AND 결합되며, matcher 가 없으면 항상 일치한다.
//
// [fail-close 원칙]
// 판단할 수 없는 입력은 "불일치" 로 처리한다:
// - 잘못된 regex / CIDR
// - source IP 미상
// - 사용자 없음 (roles, user_types)
// - compartment ID 해석 불가
//
// [스레드 안전성]
// matches() 는 concurrent 호출 안전. 정규식 캐시는 std::shared_mutex 로
// 보호되며 읽기 경로는 shared lock 만 잡는다.
// ---------------------------------------------------------------------------

#include <memory>
#include <optional>
#include <regex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "policy/access_policy.hpp"
#include "policy/policy_context.hpp"

class PatternMatcher {
public:
    PatternMatcher() = default;
    ~PatternMatcher() = default;

    PatternMatcher(const PatternMatcher&)            = delete;
    PatternMatcher& operator=(const PatternMatcher&) = delete;

    [[nodiscard]] bool matches(const std::optional<PolicyMatcher>& matcher,
                               const PolicyContext&                ctx) const;
    [[nodiscard]] bool matches(const PolicyMatcher& matcher, const PolicyContext& ctx) const;

    // 개별 술어 (테스트 및 로더 검증용으로 공개)
    [[nodiscard]] bool match_pattern(const MatchPattern& pattern, std::string_view value) const;
    [[nodiscard]] bool match_path(std::string_view glob, std::string_view path) const;
    [[nodiscard]] bool match_compartment(const CompartmentMatcher& matcher,
                                         const PolicyContext&      ctx) const;

    // 컴파일 결과를 캐시한다. 잘못된 패턴이면 nullptr (캐시에도 기록).
    [[nodiscard]] std::shared_ptr<const std::regex> compiled(const std::string& pattern) const;

    [[nodiscard]] std::size_t cache_size() const;

    // "10.0.0.0/8", "2001:db8::/32". 파싱 실패 시 false.
    [[nodiscard]] static bool ip_in_cidr(const std::string& ip, const std::string& cidr);
    [[nodiscard]] static bool is_valid_cidr(const std::string& cidr);

    // '*' 만 특수문자인 glob → ECMAScript regex (anchored)
    [[nodiscard]] static std::string wildcard_to_regex(std::string_view glob);
    // 경로 glob: "**" 임의 문자열, "*" 한 세그먼트, "?" 한 문자
    [[nodiscard]] static std::string path_glob_to_regex(std::string_view glob);

private:
    [[nodiscard]] bool regex_match(const std::string& pattern, std::string_view value) const;

    mutable std::shared_mutex                                                  cache_mutex_;
    mutable std::unordered_map<std::string, std::shared_ptr<const std::regex>> cache_;
};
