#include "token/jwt.hpp"

#include "common/base64url.hpp"
#include "common/json_util.hpp"

#include <fmt/format.h>

std::expected<JwtParts, std::string> decode_jwt(std::string_view raw) {
    const auto first = raw.find('.');
    if (first == std::string_view::npos) {
        return std::unexpected(std::string("token is not a JWS compact serialization"));
    }
    const auto second = raw.find('.', first + 1);
    if (second == std::string_view::npos || raw.find('.', second + 1) != std::string_view::npos) {
        return std::unexpected(std::string("token must have exactly three segments"));
    }

    const std::string_view header_b64  = raw.substr(0, first);
    const std::string_view payload_b64 = raw.substr(first + 1, second - first - 1);
    const std::string_view sig_b64     = raw.substr(second + 1);

    auto header_text = base64url_decode_string(header_b64);
    auto payload_text = base64url_decode_string(payload_b64);
    auto signature = base64url_decode(sig_b64);
    if (!header_text || !payload_text || !signature) {
        return std::unexpected(std::string("token segment is not base64url"));
    }

    JwtParts parts;
    auto header = parse_json(*header_text);
    if (!header || !header->isObject()) {
        return std::unexpected(std::string("token header is not a JSON object"));
    }
    auto claims = parse_json(*payload_text);
    if (!claims || !claims->isObject()) {
        return std::unexpected(std::string("token payload is not a JSON object"));
    }
    parts.header = std::move(*header);
    parts.claims = std::move(*claims);

    const auto alg_name = json_string_member(parts.header, "alg");
    if (!alg_name) {
        return std::unexpected(std::string("token header alg must be a string"));
    }
    const auto alg = parse_signing_algorithm(*alg_name);
    if (!alg) {
        return std::unexpected(fmt::format("unsupported alg '{}'", *alg_name));
    }
    parts.algorithm     = *alg;
    parts.kid           = json_string_member(parts.header, "kid").value_or("");
    parts.signing_input = std::string(raw.substr(0, second));
    parts.signature     = std::move(*signature);
    return parts;
}

std::expected<std::string, std::string> encode_jwt(const Json::Value& claims, const SigningKey& key) {
    Json::Value header(Json::objectValue);
    header["alg"] = std::string(to_string(key.algorithm()));
    header["typ"] = "JWT";
    header["kid"] = key.kid();

    std::string signing_input = base64url_encode(to_compact_json(header));
    signing_input += '.';
    signing_input += base64url_encode(to_compact_json(claims));

    auto signature = key.sign(signing_input);
    if (!signature) {
        return std::unexpected(signature.error());
    }
    signing_input += '.';
    signing_input += base64url_encode(signature->data(), signature->size());
    return signing_input;
}
