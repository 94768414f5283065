#pragma once

// ---------------------------------------------------------------------------
// types.hpp
//
// 모듈 간 공유되는 기본 오류 타입.
//
// [순환 의존성 방지]
// 이 헤더는 어떤 authgate 헤더도 include 하지 않는다.
// token/, federation/, policy/, script/ 가 모두 이 헤더만 공유한다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// ConfigurationError
//   잘못된 정책/매처 정의, 활성 서명 키 부재 등 운영자 설정 오류.
//   생성/발급 시점에만 throw 된다. evaluate() 경로에서는 throw 금지.
// ---------------------------------------------------------------------------
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what)
        : std::runtime_error(what) {}
};

// ---------------------------------------------------------------------------
// StorageErrorCode / StorageError
//   Token/Revocation/SigningKey 저장소 호출 실패.
//   std::expected<T, StorageError> 패턴과 함께 사용한다.
// ---------------------------------------------------------------------------
enum class StorageErrorCode : std::uint8_t {
    kUnavailable = 0,  // 백엔드 접근 불가 (I/O, 연결 실패)
    kCorrupted   = 1,  // 저장된 레코드 해석 실패
    kConflict    = 2,  // 동시 쓰기 충돌 (트랜잭션 실패)
};

struct StorageError {
    StorageErrorCode code{StorageErrorCode::kUnavailable};
    std::string      message{};
};

// ---------------------------------------------------------------------------
// ScriptFault
//   스크립트 샌드박스 경계에서 분류되는 실행 실패 유형.
//   Deny 코드로 변환된 뒤에만 오케스트레이터에 전달된다.
// ---------------------------------------------------------------------------
enum class ScriptFault : std::uint8_t {
    kError            = 0,  // 런타임 예외, 문법 오류
    kTimeout          = 1,  // wall-clock deadline 초과
    kResourceExceeded = 2,  // 연산/호출 깊이/메모리/크기 상한 초과
    kPoolExhausted    = 3,  // 인터프리터 슬롯 획득 대기 시간 초과
};

// ---------------------------------------------------------------------------
// script_fault_code
//   ScriptFault → 기계 판독용 deny code.
// ---------------------------------------------------------------------------
[[nodiscard]] inline const char* script_fault_code(ScriptFault fault) noexcept {
    switch (fault) {
        case ScriptFault::kError:            return "script-error";
        case ScriptFault::kTimeout:          return "script-timeout";
        case ScriptFault::kResourceExceeded: return "script-resource-exceeded";
        case ScriptFault::kPoolExhausted:    return "script-pool-exhausted";
    }
    return "script-error";
}
