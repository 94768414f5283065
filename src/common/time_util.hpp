#pragma once

// ---------------------------------------------------------------------------
// time_util.hpp
//
// ISO-8601 (UTC) 타임스탬프 변환. 감사 로그와 스크립트 컨텍스트가 공유한다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

// "2024-01-01T09:30:00.123Z" (밀리초, UTC)
[[nodiscard]] std::string format_iso8601(const std::chrono::system_clock::time_point& tp);

// "YYYY-MM-DDTHH:MM:SS[.fff]Z" 만 허용한다. 오프셋 표기는 std::nullopt.
[[nodiscard]] std::optional<std::chrono::system_clock::time_point>
parse_iso8601(std::string_view text);
