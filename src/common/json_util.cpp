#include "common/json_util.hpp"

#include <memory>

std::expected<Json::Value, std::string> parse_json(std::string_view text) {
    Json::CharReaderBuilder builder;
    Json::CharReaderBuilder::strictMode(&builder.settings_);
    builder["failIfExtra"] = true;

    const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        return std::unexpected(errors.empty() ? std::string("invalid json") : errors);
    }
    return root;
}

std::string to_compact_json(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"]    = true;
    return Json::writeString(builder, value);
}

std::optional<std::string> json_string_member(const Json::Value& obj, const char* key) {
    if (!obj.isObject() || !obj.isMember(key) || !obj[key].isString()) {
        return std::nullopt;
    }
    return obj[key].asString();
}
