#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 감사(audit) 로그 이벤트 타입 정의.
//
// [순환 의존성 방지 설계]
// - AccessDecision, TokenKind 를 직접 include 하지 않는다.
// - outcome / event 는 문자열로 전달한다 ("allow" | "deny" | "abstain").
//
// [민감정보 취급 주의]
// - raw 토큰, 개인키, PKCE verifier, 요청 body 는 어떤 이벤트에도 넣지 않는다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. config 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// ---------------------------------------------------------------------------
// PolicyTrace
//   평가 과정에서 스캔된 정책 하나의 기록.
//   matched == false 이면 outcome 은 항상 "abstain" (엔진 미호출).
// ---------------------------------------------------------------------------
struct PolicyTrace {
    std::string policy_id{};
    std::string name{};
    bool        matched{false};
    std::string outcome{};   // "allow" | "deny" | "abstain"
};

// ---------------------------------------------------------------------------
// DecisionLog
//   evaluate() 1회당 1건 발행되는 판정 이벤트.
//   terminating_policy: 최종 Deny 를 낸 정책 ID. Allow/기본 거부면 빈 문자열.
//   scanned: 스캔 순서(priority 오름차순) 그대로의 정책 목록.
// ---------------------------------------------------------------------------
struct DecisionLog {
    std::string                           request_id{};
    std::string                           client_id{};
    std::string                           user_id{};
    std::string                           operation{};
    std::string                           resource_type{};
    std::string                           resource_id{};
    std::string                           source_ip{};
    std::string                           outcome{};            // "allow" | "deny"
    std::string                           deny_code{};
    std::string                           message{};
    std::string                           terminating_policy{};
    std::vector<PolicyTrace>              scanned{};
    std::chrono::system_clock::time_point timestamp{};
    std::chrono::microseconds             duration{0};
};

// ---------------------------------------------------------------------------
// TokenEventLog
//   토큰 수명 주기 이벤트.
//   event: "issued" | "revoked" | "rotated"
//   subject_id: jti (issued/revoked) 또는 kid (rotated)
// ---------------------------------------------------------------------------
struct TokenEventLog {
    std::string                           event{};
    std::string                           subject_id{};
    std::string                           client_id{};
    std::string                           kind{};
    std::chrono::system_clock::time_point timestamp{};
};
