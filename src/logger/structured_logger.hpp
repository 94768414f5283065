#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 구조화 JSON 감사 로거. AuditSink 구현체.
//
// [설계 원칙]
// - 싱글턴 금지: 생성자 주입 방식으로 의존성을 명시적으로 표현한다.
// - 고빈도 경로(on_decision)에서 불필요한 문자열 복사를 줄이기 위해
//   const-ref 파라미터를 사용한다.
// - 감사 기록 실패는 spdlog 기본 로거로만 보고하고 호출자에게 전파하지 않는다.
//
// [JSON 스키마 일관성]
// 모든 구조체 필드를 snake_case JSON 키로 직렬화한다.
// ---------------------------------------------------------------------------

#include "audit_sink.hpp"
#include "log_types.hpp"

#include <filesystem>
#include <memory>
#include <string_view>

namespace spdlog {
class logger;
}

// ---------------------------------------------------------------------------
// StructuredLogger
//   DecisionLog / TokenEventLog 를 한 줄 JSON 으로 기록한다.
//   내부 진단용 debug/info/warn/error 메서드도 제공한다.
// ---------------------------------------------------------------------------
class StructuredLogger final : public AuditSink {
public:
    // 생성자
    //   min_level : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path  : 로그 파일 경로 (디렉터리가 아닌 파일 경로)
    //   logger 초기화 실패 시 std::runtime_error.
    explicit StructuredLogger(LogLevel min_level,
                              const std::filesystem::path& log_path);

    ~StructuredLogger() override;

    // 복사 금지 (spdlog 인스턴스 소유권 명확화)
    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    // on_decision
    //   판정 이벤트를 JSON 으로 기록한다. deny 는 warn, allow 는 info 레벨.
    void on_decision(const DecisionLog& entry) noexcept override;

    // on_token_event
    //   토큰 발급/폐기/키 교체 이벤트를 JSON 으로 기록한다.
    void on_token_event(const TokenEventLog& entry) noexcept override;

    // 내부 진단용 spdlog 래퍼
    //   클라이언트 데이터(토큰, 요청 body 등)를 직접 전달하지 말 것.
    void debug(std::string_view msg);
    void info(std::string_view msg);
    void warn(std::string_view msg);
    void error(std::string_view msg);

private:
    [[nodiscard]] int to_spdlog_level(LogLevel level) const;

    LogLevel                        min_level_;
    std::filesystem::path           log_path_;
    std::shared_ptr<spdlog::logger> logger_;
};

// parse_log_level
//   "debug" | "info" | "warn" | "error" → LogLevel. 알 수 없으면 kInfo.
[[nodiscard]] LogLevel parse_log_level(std::string_view text) noexcept;
