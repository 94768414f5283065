#pragma once

// ---------------------------------------------------------------------------
// audit_sink.hpp
//
// Audit Service 경계. 평가/토큰 코어는 이벤트를 넘기기만 하고 결과를
// 기다리지 않는다 (fire-and-forget).
//
// [격리 원칙]
// 구현체의 실패가 판정 결과를 바꾸면 안 되므로 모든 메서드는 noexcept 다.
// ---------------------------------------------------------------------------

#include "log_types.hpp"

class AuditSink {
public:
    virtual ~AuditSink() = default;

    virtual void on_decision(const DecisionLog& entry) noexcept = 0;
    virtual void on_token_event(const TokenEventLog& entry) noexcept = 0;
};
