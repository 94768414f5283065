// ---------------------------------------------------------------------------
// test_logger.cpp
//
// StructuredLogger 단위 테스트
//
// [테스트 범위]
// - DecisionLog JSON 필드 (allow / deny, scanned 배열)
// - TokenEventLog JSON 필드
// - 로그 레벨 필터링 (warn 이상이면 allow 판정은 기록하지 않음)
// - 멀티스레드 동시 기록, JSON 이스케이프, 진단 로그
// ---------------------------------------------------------------------------

#include "logger/log_types.hpp"
#include "logger/structured_logger.hpp"

#include "common/json_util.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace {

DecisionLog make_decision(const std::string& outcome) {
    DecisionLog entry;
    entry.request_id    = "req-42";
    entry.client_id     = "app.portal.web";
    entry.user_id       = "user-1";
    entry.operation     = "read";
    entry.resource_type = "Observation";
    entry.resource_id   = "obs-1";
    entry.source_ip     = "10.1.2.3";
    entry.outcome       = outcome;
    entry.timestamp     = std::chrono::system_clock::now();
    entry.duration      = std::chrono::microseconds(1500);
    entry.scanned.push_back(PolicyTrace{"capabilities-public", "Capabilities", false, "abstain"});
    if (outcome == "deny") {
        entry.deny_code          = "policy-denied";
        entry.message            = "Research clients may not read observations";
        entry.terminating_policy = "deny-research";
        entry.scanned.push_back(PolicyTrace{"deny-research", "Deny research", true, "deny"});
    } else {
        entry.scanned.push_back(PolicyTrace{"clinician-read", "Clinician read", true, "allow"});
    }
    return entry;
}

}  // namespace

// ---------------------------------------------------------------------------
// Fixture: Temporary log file
// ---------------------------------------------------------------------------
class StructuredLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name =
            std::string(info->test_suite_name()) + "_" + info->name();
        log_dir_  = fs::temp_directory_path() / "authgate_test_logs" / unique_name;
        log_file_ = log_dir_ / "audit.log";
        fs::create_directories(log_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(log_dir_, ec);
    }

    // 타임스탬프 접두어를 떼고 JSON 으로 파싱한 줄들
    std::vector<Json::Value> read_log_lines() const {
        std::vector<Json::Value> lines;
        std::ifstream            file(log_file_);
        if (!file.is_open()) {
            return lines;
        }

        std::string line;
        while (std::getline(file, line)) {
            const size_t json_start = line.find('{');
            if (json_start == std::string::npos) {
                continue;
            }
            auto parsed = parse_json(line.substr(json_start));
            if (parsed) {
                lines.push_back(std::move(*parsed));
            }
        }
        return lines;
    }

    fs::path log_dir_;
    fs::path log_file_;
};

// ---------------------------------------------------------------------------
// Test: deny 판정 JSON 필드
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, DenyDecisionJsonFields) {
    {
        StructuredLogger logger(LogLevel::kInfo, log_file_);
        logger.on_decision(make_decision("deny"));
    }

    auto lines = read_log_lines();
    ASSERT_EQ(lines.size(), 1u);
    const auto& json = lines[0];

    EXPECT_EQ(json["event"].asString(), "decision");
    EXPECT_EQ(json["request_id"].asString(), "req-42");
    EXPECT_EQ(json["client_id"].asString(), "app.portal.web");
    EXPECT_EQ(json["user_id"].asString(), "user-1");
    EXPECT_EQ(json["operation"].asString(), "read");
    EXPECT_EQ(json["resource_type"].asString(), "Observation");
    EXPECT_EQ(json["resource_id"].asString(), "obs-1");
    EXPECT_EQ(json["source_ip"].asString(), "10.1.2.3");
    EXPECT_EQ(json["outcome"].asString(), "deny");
    EXPECT_EQ(json["deny_code"].asString(), "policy-denied");
    EXPECT_EQ(json["message"].asString(), "Research clients may not read observations");
    EXPECT_EQ(json["terminating_policy"].asString(), "deny-research");
    EXPECT_EQ(json["duration_us"].asInt64(), 1500);
    EXPECT_TRUE(json["timestamp"].isString());

    ASSERT_EQ(json["scanned"].size(), 2u);
    EXPECT_EQ(json["scanned"][0u]["policy_id"].asString(), "capabilities-public");
    EXPECT_FALSE(json["scanned"][0u]["matched"].asBool());
    EXPECT_EQ(json["scanned"][1u]["outcome"].asString(), "deny");
}

// ---------------------------------------------------------------------------
// Test: allow 판정에는 deny 필드가 없다
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, AllowDecisionOmitsDenyFields) {
    {
        StructuredLogger logger(LogLevel::kInfo, log_file_);
        logger.on_decision(make_decision("allow"));
    }

    auto lines = read_log_lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0]["outcome"].asString(), "allow");
    EXPECT_FALSE(lines[0].isMember("deny_code"));
    EXPECT_FALSE(lines[0].isMember("message"));
    EXPECT_EQ(lines[0]["terminating_policy"].asString(), "");
}

// ---------------------------------------------------------------------------
// Test: TokenEventLog JSON 필드
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, TokenEventJsonFields) {
    {
        StructuredLogger logger(LogLevel::kInfo, log_file_);
        TokenEventLog    entry;
        entry.event      = "revoked";
        entry.subject_id = "jti-123";
        entry.client_id  = "app-1";
        entry.kind       = "refresh";
        entry.timestamp  = std::chrono::system_clock::now();
        logger.on_token_event(entry);
    }

    auto lines = read_log_lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0]["event"].asString(), "token_revoked");
    EXPECT_EQ(lines[0]["id"].asString(), "jti-123");
    EXPECT_EQ(lines[0]["client_id"].asString(), "app-1");
    EXPECT_EQ(lines[0]["kind"].asString(), "refresh");
}

// ---------------------------------------------------------------------------
// Test: 로그 레벨 필터링
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, LogLevelFiltering) {
    {
        StructuredLogger logger(LogLevel::kWarn, log_file_);

        // info 레벨 (필터되어야 함)
        logger.on_decision(make_decision("allow"));
        TokenEventLog token;
        token.event = "issued";
        logger.on_token_event(token);

        // warn 레벨 (기록되어야 함)
        logger.on_decision(make_decision("deny"));
    }

    auto lines = read_log_lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0]["outcome"].asString(), "deny");
}

// ---------------------------------------------------------------------------
// Test: 멀티스레드 동시 로깅 (줄이 섞이지 않음)
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, MultithreadedLoggingKeepsLinesIntact) {
    const int num_threads     = 4;
    const int logs_per_thread = 10;
    {
        StructuredLogger         logger(LogLevel::kInfo, log_file_);
        std::vector<std::thread> threads;

        for (int t = 0; t < num_threads; ++t) {
            threads.emplace_back([&logger, t]() {
                for (int i = 0; i < logs_per_thread; ++i) {
                    DecisionLog entry = make_decision(i % 2 == 0 ? "allow" : "deny");
                    entry.request_id  = "req-" + std::to_string(t) + "-" + std::to_string(i);
                    logger.on_decision(entry);
                }
            });
        }

        for (auto& th : threads) {
            th.join();
        }
    }

    auto lines = read_log_lines();
    EXPECT_EQ(lines.size(), static_cast<size_t>(num_threads * logs_per_thread));
}

// ---------------------------------------------------------------------------
// Test: JSON 이스케이프 처리
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, JsonEscaping) {
    {
        StructuredLogger logger(LogLevel::kInfo, log_file_);
        DecisionLog      entry = make_decision("deny");
        entry.client_id        = "client\"with\\quotes";
        entry.message          = "line one\nline two";
        logger.on_decision(entry);
    }

    auto lines = read_log_lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0]["client_id"].asString(), "client\"with\\quotes");
    EXPECT_EQ(lines[0]["message"].asString(), "line one\nline two");
}

// ---------------------------------------------------------------------------
// Test: 디버그/정보/경고/에러 로깅
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, DiagnosticLogging) {
    {
        StructuredLogger logger(LogLevel::kDebug, log_file_);

        logger.debug("Debug message");
        logger.info("Info message");
        logger.warn("Warning message");
        logger.error("Error message");
    }

    // 진단 로그는 일반 텍스트이므로, 파일이 생성되고 크기가 0이 아닌지 확인
    std::ifstream file(log_file_);
    EXPECT_TRUE(file.is_open()) << "Log file was not created";

    file.seekg(0, std::ios::end);
    std::streamsize file_size = file.tellg();
    EXPECT_GT(file_size, 0) << "Log file is empty";
}

TEST(ParseLogLevel, KnownAndUnknownNames) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::kDebug);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::kWarn);
    EXPECT_EQ(parse_log_level("error"), LogLevel::kError);
    EXPECT_EQ(parse_log_level("info"), LogLevel::kInfo);
    EXPECT_EQ(parse_log_level("verbose"), LogLevel::kInfo);
}
