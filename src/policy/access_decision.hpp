#pragma once

// ---------------------------------------------------------------------------
// access_decision.hpp
//
// 정책 1건 또는 전체 평가의 결과: Allow | Deny{code, message, details} | Abstain.
//
// [fail-close 원칙]
// - Abstain 은 "이 정책은 판단하지 않음" 이며 최종 결과로 반환되지 않는다.
// - 판정 메커니즘의 모든 실패는 Deny 로 표현된다 (예외 전파 금지).
// ---------------------------------------------------------------------------

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "common/types.hpp"

struct Allow {
    bool operator==(const Allow&) const = default;
};

struct Abstain {
    bool operator==(const Abstain&) const = default;
};

// ---------------------------------------------------------------------------
// Deny
//   code:      기계 판독용 ("policy-denied", "script-timeout" ...)
//   message:   사람이 읽는 설명
//   details:   엔진 오류 메시지 등 부가 정보
//   policy_id: Deny 를 낸 정책 ID (정책 외부 사유면 비어 있음)
// ---------------------------------------------------------------------------
struct Deny {
    std::string                code{};
    std::string                message{};
    std::optional<std::string> details{};
    std::optional<std::string> policy_id{};

    [[nodiscard]] static Deny policy_denied(std::string message) {
        return Deny{"policy-denied", std::move(message), std::nullopt, std::nullopt};
    }
    [[nodiscard]] static Deny no_matching_policy() {
        return Deny{"no-matching-policy", "No policy allowed this request", std::nullopt, std::nullopt};
    }
    [[nodiscard]] static Deny script_denied(std::string reason) {
        return Deny{"script-denied", std::move(reason), std::nullopt, std::nullopt};
    }
    [[nodiscard]] static Deny script_fault(ScriptFault fault, std::string details) {
        std::string message;
        switch (fault) {
            case ScriptFault::kTimeout:          message = "Policy script timed out"; break;
            case ScriptFault::kResourceExceeded: message = "Policy script exceeded resource limits"; break;
            case ScriptFault::kPoolExhausted:    message = "No script interpreter available"; break;
            case ScriptFault::kError:            message = "Policy script failed"; break;
        }
        return Deny{script_fault_code(fault), std::move(message), std::move(details), std::nullopt};
    }
    [[nodiscard]] static Deny insufficient_scope(std::string details) {
        return Deny{"insufficient-scope", "Token scopes do not permit this request",
                    std::move(details), std::nullopt};
    }
    [[nodiscard]] static Deny policy_store_unavailable(std::string details) {
        return Deny{"policy-store-unavailable", "Policy store is unavailable",
                    std::move(details), std::nullopt};
    }
    [[nodiscard]] static Deny evaluation_timeout() {
        return Deny{"evaluation-timeout", "Policy evaluation deadline exceeded", std::nullopt, std::nullopt};
    }
    [[nodiscard]] static Deny policy_error(std::string details) {
        return Deny{"policy-error", "Policy evaluation failed", std::move(details), std::nullopt};
    }

    bool operator==(const Deny&) const = default;
};

using AccessDecision = std::variant<Allow, Deny, Abstain>;

[[nodiscard]] inline bool is_allow(const AccessDecision& d) noexcept {
    return std::holds_alternative<Allow>(d);
}
[[nodiscard]] inline bool is_deny(const AccessDecision& d) noexcept {
    return std::holds_alternative<Deny>(d);
}
[[nodiscard]] inline bool is_abstain(const AccessDecision& d) noexcept {
    return std::holds_alternative<Abstain>(d);
}

// "allow" | "deny" | "abstain" (감사 로그용)
[[nodiscard]] inline std::string_view outcome_name(const AccessDecision& d) noexcept {
    if (is_allow(d)) return "allow";
    if (is_deny(d))  return "deny";
    return "abstain";
}
