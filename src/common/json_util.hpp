#pragma once

// ---------------------------------------------------------------------------
// json_util.hpp
//
// jsoncpp 공통 헬퍼. 파싱 오류는 예외 대신 std::expected 로 반환한다.
// ---------------------------------------------------------------------------

#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include <json/json.h>

// 문자열 → Json::Value. 중복 키/후행 데이터는 오류로 처리한다 (strict mode).
[[nodiscard]] std::expected<Json::Value, std::string> parse_json(std::string_view text);

// 공백 없는 한 줄 JSON
[[nodiscard]] std::string to_compact_json(const Json::Value& value);

// 객체 멤버가 문자열이면 값, 아니면 std::nullopt
[[nodiscard]] std::optional<std::string> json_string_member(const Json::Value& obj, const char* key);
