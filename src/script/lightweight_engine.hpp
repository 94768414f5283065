#pragma once

// ---------------------------------------------------------------------------
// lightweight_engine.hpp
//
// 내장 경량 정책 언어 엔진 (ScriptEngine 구현).
//
// [컴파일 캐시]
// 소스 해시 → 파싱된 Program. 해시 충돌에 대비해 조회 시 소스 원문을
// 다시 비교한다. Program 은 불변이므로 여러 스레드가 공유 실행한다.
//
// [스레드 안전성]
// execute() 는 동시 호출 가능. 캐시는 shared_mutex 로 보호되며
// 실행 상태(ExprInterpreter)는 호출마다 새로 만든다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <shared_mutex>
#include <string_view>
#include <unordered_map>

#include "script/expr/expr_ast.hpp"
#include "script/script_engine.hpp"
#include "script/script_types.hpp"

class LightweightEngine final : public ScriptEngine {
public:
    static constexpr std::size_t kMaxCachedPrograms = 1024;

    explicit LightweightEngine(LightweightLimits limits = {});

    LightweightEngine(const LightweightEngine&)            = delete;
    LightweightEngine& operator=(const LightweightEngine&) = delete;

    [[nodiscard]] std::expected<AccessDecision, ScriptFailure>
    execute(const ScriptInvocation& invocation) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "lightweight"; }

    // 파싱만 수행 (정책 로드 시 문법 검증용). 성공 시 캐시에 등록된다.
    [[nodiscard]] std::expected<void, ScriptFailure> compile(std::string_view source);

    [[nodiscard]] std::size_t cached_programs() const;

    [[nodiscard]] const LightweightLimits& limits() const noexcept { return limits_; }

private:
    [[nodiscard]] std::expected<std::shared_ptr<const Program>, ScriptFailure>
    program_for(std::string_view source);

    LightweightLimits limits_;

    mutable std::shared_mutex cache_mutex_;
    std::unordered_map<std::size_t, std::shared_ptr<const Program>> cache_;
};
