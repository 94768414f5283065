// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// spdlog 기반 구조화 JSON 감사 로거 구현.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"

#include "common/json_util.hpp"
#include "common/time_util.hpp"

#include <chrono>
#include <exception>
#include <stdexcept>
#include <vector>

#include <json/json.h>
#include <spdlog/common.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

namespace {

constexpr const char* kLoggerName = "authgate.audit";

}  // namespace

LogLevel parse_log_level(std::string_view text) noexcept {
    if (text == "debug") return LogLevel::kDebug;
    if (text == "warn")  return LogLevel::kWarn;
    if (text == "error") return LogLevel::kError;
    return LogLevel::kInfo;
}

// ---------------------------------------------------------------------------
// Helper: spdlog 로그 레벨 변환
// ---------------------------------------------------------------------------
int StructuredLogger::to_spdlog_level(LogLevel level) const {
    switch (level) {
        case LogLevel::kDebug:
            return static_cast<int>(spdlog::level::debug);
        case LogLevel::kInfo:
            return static_cast<int>(spdlog::level::info);
        case LogLevel::kWarn:
            return static_cast<int>(spdlog::level::warn);
        case LogLevel::kError:
            return static_cast<int>(spdlog::level::err);
        default:
            return static_cast<int>(spdlog::level::info);
    }
}

// ---------------------------------------------------------------------------
// StructuredLogger 생성자
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel min_level, const std::filesystem::path& log_path)
    : min_level_(min_level)
    , log_path_(log_path)
{
    try {
        if (log_path_.has_parent_path()) {
            std::filesystem::create_directories(log_path_.parent_path());
        }

        // 싱크: stderr + rotating file (100MB, 3개 파일 유지)
        // stdout 은 CLI 명령 결과 전용
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_sink_mt>());

        const size_t max_file_size = 100 * 1024 * 1024;
        const size_t max_files     = 3;
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_path_.string(), max_file_size, max_files));

        logger_ = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
        logger_->set_level(static_cast<spdlog::level::level_enum>(to_spdlog_level(min_level)));

        // 구조화 로그는 각 메서드에서 JSON 으로 생성하므로 타임스탬프만 붙인다
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] %v");
        logger_->flush_on(spdlog::level::trace);

        // 같은 이름의 이전 인스턴스가 남아 있으면 교체
        spdlog::drop(kLoggerName);
        spdlog::register_logger(logger_);

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    }
}

StructuredLogger::~StructuredLogger() {
    if (logger_) {
        logger_->flush();
        if (spdlog::get(kLoggerName) == logger_) {
            spdlog::drop(kLoggerName);
        }
    }
}

// ---------------------------------------------------------------------------
// on_decision: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::on_decision(const DecisionLog& entry) noexcept {
    if (!logger_) {
        return;
    }
    const bool denied = entry.outcome != "allow";
    const LogLevel level = denied ? LogLevel::kWarn : LogLevel::kInfo;
    if (static_cast<int>(min_level_) > static_cast<int>(level)) {
        return;
    }

    try {
        Json::Value json(Json::objectValue);
        json["event"]         = "decision";
        json["request_id"]    = entry.request_id;
        json["client_id"]     = entry.client_id;
        json["user_id"]       = entry.user_id;
        json["operation"]     = entry.operation;
        json["resource_type"] = entry.resource_type;
        json["resource_id"]   = entry.resource_id;
        json["source_ip"]     = entry.source_ip;
        json["outcome"]       = entry.outcome;
        if (denied) {
            json["deny_code"] = entry.deny_code;
            json["message"]   = entry.message;
        }
        json["terminating_policy"] = entry.terminating_policy;

        Json::Value scanned(Json::arrayValue);
        for (const auto& trace : entry.scanned) {
            Json::Value item(Json::objectValue);
            item["policy_id"] = trace.policy_id;
            item["matched"]   = trace.matched;
            item["outcome"]   = trace.outcome;
            scanned.append(std::move(item));
        }
        json["scanned"]     = std::move(scanned);
        json["timestamp"]   = format_iso8601(entry.timestamp);
        json["duration_us"] = Json::Int64{entry.duration.count()};

        if (denied) {
            logger_->warn(to_compact_json(json));
        } else {
            logger_->info(to_compact_json(json));
        }
    } catch (const std::exception& e) {
        spdlog::error("structured_logger: decision event dropped: {}", e.what());
    }
}

// ---------------------------------------------------------------------------
// on_token_event: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::on_token_event(const TokenEventLog& entry) noexcept {
    if (!logger_ || static_cast<int>(min_level_) > static_cast<int>(LogLevel::kInfo)) {
        return;
    }

    try {
        Json::Value json(Json::objectValue);
        json["event"]      = "token_" + entry.event;
        json["id"]         = entry.subject_id;
        json["client_id"]  = entry.client_id;
        json["kind"]       = entry.kind;
        json["timestamp"]  = format_iso8601(entry.timestamp);
        logger_->info(to_compact_json(json));
    } catch (const std::exception& e) {
        spdlog::error("structured_logger: token event dropped: {}", e.what());
    }
}

// ---------------------------------------------------------------------------
// 내부 진단용 spdlog 래퍼
// ---------------------------------------------------------------------------
void StructuredLogger::debug(std::string_view msg) {
    if (logger_) {
        logger_->debug(msg);
    }
}

void StructuredLogger::info(std::string_view msg) {
    if (logger_) {
        logger_->info(msg);
    }
}

void StructuredLogger::warn(std::string_view msg) {
    if (logger_) {
        logger_->warn(msg);
    }
}

void StructuredLogger::error(std::string_view msg) {
    if (logger_) {
        logger_->error(msg);
    }
}
