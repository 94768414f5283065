#pragma once

// ---------------------------------------------------------------------------
// script_types.hpp
//
// 스크립트 샌드박스 설정 및 엔진 경계 타입.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include <json/json.h>

#include "common/types.hpp"
#include "script/execution_deadline.hpp"

// ---------------------------------------------------------------------------
// LightweightLimits
//   내장 인터프리터의 자원 상한. 초과 시 ScriptFault::kResourceExceeded.
// ---------------------------------------------------------------------------
struct LightweightLimits {
    std::uint64_t max_operations{10000};
    std::uint32_t max_call_levels{32};
    std::uint32_t max_expr_depth{64};
    std::size_t   max_string_size{10000};
    std::size_t   max_array_size{1000};
    std::size_t   max_map_size{1000};
};

// ---------------------------------------------------------------------------
// QuickJsPoolConfig
//   pool_size == 0 이면 std::thread::hardware_concurrency() 사용.
// ---------------------------------------------------------------------------
struct QuickJsPoolConfig {
    std::size_t               pool_size{0};
    std::size_t               memory_limit{16 * 1024 * 1024};
    std::size_t               max_stack_size{256 * 1024};
    std::chrono::milliseconds checkout_timeout{50};
};

struct ScriptSandboxConfig {
    std::chrono::milliseconds timeout{100};
    LightweightLimits         lightweight{};
    QuickJsPoolConfig         quickjs{};
};

// ---------------------------------------------------------------------------
// ScriptInvocation
//   엔진 1회 실행 입력. context 는 to_json(PolicyContext) 결과이며
//   엔진은 이를 읽기 전용 값으로만 노출한다.
// ---------------------------------------------------------------------------
struct ScriptInvocation {
    const std::string& policy_id;
    const std::string& source;
    const Json::Value& context;
    ExecutionDeadline  deadline;
};

struct ScriptFailure {
    ScriptFault fault{ScriptFault::kError};
    std::string details{};
};
