#include "script/lightweight_engine.hpp"

#include <functional>
#include <mutex>
#include <new>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

#include "script/expr/expr_interpreter.hpp"
#include "script/expr/expr_parser.hpp"

LightweightEngine::LightweightEngine(LightweightLimits limits)
    : limits_(limits) {
    if (limits_.max_operations == 0 || limits_.max_call_levels == 0 || limits_.max_expr_depth == 0) {
        throw ConfigurationError("lightweight engine limits must be positive");
    }
}

// ---------------------------------------------------------------------------
// program_for
//   캐시 조회 (읽기 잠금) → 미스면 잠금 없이 파싱 → 쓰기 잠금으로 등록.
//   두 스레드가 같은 소스를 동시에 파싱할 수 있으나 결과는 동일하다.
// ---------------------------------------------------------------------------
std::expected<std::shared_ptr<const Program>, ScriptFailure>
LightweightEngine::program_for(std::string_view source) {
    const std::size_t hash = std::hash<std::string_view>{}(source);
    {
        std::shared_lock lock(cache_mutex_);
        const auto it = cache_.find(hash);
        if (it != cache_.end() && it->second->source == source) {
            return it->second;
        }
    }

    auto parsed = parse_program(source, limits_.max_expr_depth);
    if (!parsed) {
        const auto fault = parsed.error().depth_exceeded ? ScriptFault::kResourceExceeded
                                                         : ScriptFault::kError;
        return std::unexpected(ScriptFailure{fault, "syntax error: " + parsed.error().message});
    }

    std::unique_lock lock(cache_mutex_);
    if (cache_.size() >= kMaxCachedPrograms) {
        spdlog::debug("lightweight: program cache full ({}), clearing", cache_.size());
        cache_.clear();
    }
    cache_.insert_or_assign(hash, *parsed);
    return *parsed;
}

std::expected<void, ScriptFailure> LightweightEngine::compile(std::string_view source) {
    auto program = program_for(source);
    if (!program) {
        return std::unexpected(program.error());
    }
    return {};
}

std::size_t LightweightEngine::cached_programs() const {
    std::shared_lock lock(cache_mutex_);
    return cache_.size();
}

// ---------------------------------------------------------------------------
// execute
//   ScriptAbort / bad_alloc / 기타 예외를 모두 ScriptFailure 로 분류한다.
// ---------------------------------------------------------------------------
std::expected<AccessDecision, ScriptFailure>
LightweightEngine::execute(const ScriptInvocation& invocation) {
    auto program = program_for(invocation.source);
    if (!program) {
        spdlog::warn("lightweight: policy '{}' failed to compile: {}",
                     invocation.policy_id, program.error().details);
        return std::unexpected(program.error());
    }

    try {
        ExprInterpreter interpreter(**program, limits_, invocation.deadline);
        const ExprValue result = interpreter.run(invocation.context);
        spdlog::debug("lightweight: policy '{}' finished after {} operations",
                      invocation.policy_id, interpreter.operations());
        return decision_from_script_result(result.to_json());
    } catch (const ScriptAbort& e) {
        spdlog::warn("lightweight: policy '{}' aborted ({}): {}",
                     invocation.policy_id, script_fault_code(e.fault()), e.what());
        return std::unexpected(ScriptFailure{e.fault(), e.what()});
    } catch (const std::bad_alloc&) {
        spdlog::warn("lightweight: policy '{}' ran out of memory", invocation.policy_id);
        return std::unexpected(ScriptFailure{ScriptFault::kResourceExceeded, "out of memory"});
    } catch (const std::exception& e) {
        spdlog::error("lightweight: policy '{}' internal error: {}", invocation.policy_id, e.what());
        return std::unexpected(ScriptFailure{ScriptFault::kError, e.what()});
    }
}
