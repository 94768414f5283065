#include "script/expr/expr_value.hpp"

#include <fmt/format.h>

double ExprValue::as_number() const {
    if (is_int()) {
        return static_cast<double>(as_int());
    }
    return std::get<double>(data_);
}

std::string_view ExprValue::type_name() const noexcept {
    switch (data_.index()) {
        case 0: return "null";
        case 1: return "bool";
        case 2: return "int";
        case 3: return "float";
        case 4: return "string";
        case 5: return "array";
        case 6: return "map";
        default: return "unknown";
    }
}

std::string ExprValue::to_display_string() const {
    if (is_null())   return "null";
    if (is_bool())   return as_bool() ? "true" : "false";
    if (is_int())    return std::to_string(as_int());
    if (is_float())  return fmt::format("{}", std::get<double>(data_));
    if (is_string()) return as_string();

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, to_json());
}

Json::Value ExprValue::to_json() const {
    if (is_null())   return Json::Value(Json::nullValue);
    if (is_bool())   return Json::Value(as_bool());
    if (is_int())    return Json::Value(static_cast<Json::Int64>(as_int()));
    if (is_float())  return Json::Value(std::get<double>(data_));
    if (is_string()) return Json::Value(as_string());

    if (is_array()) {
        Json::Value arr(Json::arrayValue);
        for (const auto& item : as_array()) {
            arr.append(item.to_json());
        }
        return arr;
    }

    Json::Value obj(Json::objectValue);
    for (const auto& [key, item] : as_map()) {
        obj[key] = item.to_json();
    }
    return obj;
}

ExprValue ExprValue::from_json(const Json::Value& value) {
    switch (value.type()) {
        case Json::nullValue:
            return ExprValue{};
        case Json::booleanValue:
            return ExprValue(value.asBool());
        case Json::intValue:
            return ExprValue(static_cast<std::int64_t>(value.asInt64()));
        case Json::uintValue:
            if (value.isInt64()) {
                return ExprValue(static_cast<std::int64_t>(value.asInt64()));
            }
            return ExprValue(value.asDouble());
        case Json::realValue:
            return ExprValue(value.asDouble());
        case Json::stringValue:
            return ExprValue(value.asString());
        case Json::arrayValue: {
            ExprArray arr;
            arr.reserve(value.size());
            for (const auto& item : value) {
                arr.push_back(from_json(item));
            }
            return ExprValue(std::move(arr));
        }
        case Json::objectValue: {
            ExprMap map;
            for (const auto& key : value.getMemberNames()) {
                map.emplace(key, from_json(value[key]));
            }
            return ExprValue(std::move(map));
        }
    }
    return ExprValue{};
}

bool ExprValue::equals(const ExprValue& other) const {
    if (is_number() && other.is_number()) {
        if (is_int() && other.is_int()) {
            return as_int() == other.as_int();
        }
        return as_number() == other.as_number();
    }
    if (data_.index() != other.data_.index()) {
        return false;
    }
    if (is_null())   return true;
    if (is_bool())   return as_bool() == other.as_bool();
    if (is_string()) return as_string() == other.as_string();

    if (is_array()) {
        const auto& a = as_array();
        const auto& b = other.as_array();
        if (a.size() != b.size()) {
            return false;
        }
        for (std::size_t i = 0; i < a.size(); ++i) {
            if (!a[i].equals(b[i])) {
                return false;
            }
        }
        return true;
    }

    const auto& a = as_map();
    const auto& b = other.as_map();
    if (a.size() != b.size()) {
        return false;
    }
    for (const auto& [key, value] : a) {
        const auto it = b.find(key);
        if (it == b.end() || !value.equals(it->second)) {
            return false;
        }
    }
    return true;
}
