#pragma once

// ---------------------------------------------------------------------------
// expr_value.hpp
//
// 경량 정책 언어의 런타임 값.
// null | bool | int | float | string | array | map
//
// [불변 값]
// array / map 은 shared_ptr<const ...> 로 공유되며 생성 후 변경되지 않는다.
// 연결(+) 등은 항상 새 값을 만들어 크기 상한을 다시 검사한다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <json/json.h>

class ExprValue;

using ExprArray = std::vector<ExprValue>;
using ExprMap   = std::map<std::string, ExprValue, std::less<>>;

class ExprValue {
public:
    using Storage = std::variant<std::monostate, bool, std::int64_t, double, std::string,
                                 std::shared_ptr<const ExprArray>, std::shared_ptr<const ExprMap>>;

    ExprValue() = default;
    ExprValue(bool v) : data_(v) {}
    ExprValue(std::int64_t v) : data_(v) {}
    ExprValue(double v) : data_(v) {}
    ExprValue(std::string v) : data_(std::move(v)) {}
    ExprValue(const char* v) : data_(std::string(v)) {}
    ExprValue(ExprArray v) : data_(std::make_shared<const ExprArray>(std::move(v))) {}
    ExprValue(ExprMap v) : data_(std::make_shared<const ExprMap>(std::move(v))) {}

    [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data_); }
    [[nodiscard]] bool is_bool() const noexcept { return std::holds_alternative<bool>(data_); }
    [[nodiscard]] bool is_int() const noexcept { return std::holds_alternative<std::int64_t>(data_); }
    [[nodiscard]] bool is_float() const noexcept { return std::holds_alternative<double>(data_); }
    [[nodiscard]] bool is_number() const noexcept { return is_int() || is_float(); }
    [[nodiscard]] bool is_string() const noexcept { return std::holds_alternative<std::string>(data_); }
    [[nodiscard]] bool is_array() const noexcept {
        return std::holds_alternative<std::shared_ptr<const ExprArray>>(data_);
    }
    [[nodiscard]] bool is_map() const noexcept {
        return std::holds_alternative<std::shared_ptr<const ExprMap>>(data_);
    }

    // 타입이 맞지 않으면 std::bad_variant_access (호출자는 is_* 로 먼저 확인)
    [[nodiscard]] bool               as_bool() const { return std::get<bool>(data_); }
    [[nodiscard]] std::int64_t       as_int() const { return std::get<std::int64_t>(data_); }
    [[nodiscard]] double             as_number() const;
    [[nodiscard]] const std::string& as_string() const { return std::get<std::string>(data_); }
    [[nodiscard]] const ExprArray&   as_array() const { return *std::get<std::shared_ptr<const ExprArray>>(data_); }
    [[nodiscard]] const ExprMap&     as_map() const { return *std::get<std::shared_ptr<const ExprMap>>(data_); }

    // "null", "bool", "int", "float", "string", "array", "map"
    [[nodiscard]] std::string_view type_name() const noexcept;

    // 문자열 연결용 표현 (string 은 따옴표 없이)
    [[nodiscard]] std::string to_display_string() const;

    [[nodiscard]] Json::Value to_json() const;
    [[nodiscard]] static ExprValue from_json(const Json::Value& value);

    // 깊은 비교. int/float 는 수치로 비교한다.
    [[nodiscard]] bool equals(const ExprValue& other) const;

private:
    Storage data_{};
};
