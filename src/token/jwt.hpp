#pragma once

// ---------------------------------------------------------------------------
// jwt.hpp
//
// JWS Compact Serialization (header.payload.signature) 코덱.
//
// [역할 분리]
// - decode_jwt : 구조/인코딩만 검사. 서명, exp, 폐기 여부는 검사하지 않는다.
//                (TokenService / JwksCache 소비자가 검증을 담당)
// - encode_jwt : 헤더 {alg, typ:"JWT", kid} 를 생성하고 서명한다.
//
// [보안 주의]
// "alg":"none" 및 지원하지 않는 alg 는 decode 단계에서 거부한다.
// ---------------------------------------------------------------------------

#include "token/signing_key.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include <json/json.h>

struct JwtParts {
    Json::Value               header{Json::objectValue};
    Json::Value               claims{Json::objectValue};
    std::string               signing_input{};   // base64url(header) "." base64url(payload)
    std::vector<std::uint8_t> signature{};
    SigningAlgorithm          algorithm{SigningAlgorithm::kRS256};
    std::string               kid{};             // 헤더에 없으면 빈 문자열
};

[[nodiscard]] std::expected<JwtParts, std::string> decode_jwt(std::string_view raw);

[[nodiscard]] std::expected<std::string, std::string>
encode_jwt(const Json::Value& claims, const SigningKey& key);
