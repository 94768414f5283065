#pragma once

// ---------------------------------------------------------------------------
// execution_deadline.hpp
//
// 스크립트 실행의 wall-clock 마감 시각.
// 호출자가 값으로 넘기고, 인터프리터의 step hook / interrupt handler 가
// expired() 를 주기적으로 확인한다. 캡처된 시작 시각이나 공유 상태가 없다.
// ---------------------------------------------------------------------------

#include <algorithm>
#include <chrono>

class ExecutionDeadline {
public:
    using Clock = std::chrono::steady_clock;

    explicit ExecutionDeadline(Clock::time_point at) noexcept : at_(at) {}

    [[nodiscard]] static ExecutionDeadline after(Clock::duration budget) noexcept {
        return ExecutionDeadline(Clock::now() + budget);
    }

    // 두 마감 중 이른 쪽 (호출자 deadline ∧ 스크립트 timeout)
    [[nodiscard]] static ExecutionDeadline earliest(Clock::time_point a, Clock::time_point b) noexcept {
        return ExecutionDeadline(std::min(a, b));
    }

    [[nodiscard]] bool expired() const noexcept { return Clock::now() >= at_; }

    [[nodiscard]] Clock::time_point at() const noexcept { return at_; }

    [[nodiscard]] Clock::duration remaining() const noexcept {
        const auto now = Clock::now();
        return now >= at_ ? Clock::duration::zero() : at_ - now;
    }

private:
    Clock::time_point at_;
};
