#include "token/token_types.hpp"

#include "common/json_util.hpp"

#include <fmt/format.h>

std::string_view to_string(TokenKind kind) noexcept {
    switch (kind) {
        case TokenKind::kAccess:  return "access";
        case TokenKind::kRefresh: return "refresh";
        case TokenKind::kId:      return "id";
    }
    return "access";
}

std::optional<TokenKind> parse_token_kind(std::string_view text) noexcept {
    if (text == "access")  return TokenKind::kAccess;
    if (text == "refresh") return TokenKind::kRefresh;
    if (text == "id")      return TokenKind::kId;
    return std::nullopt;
}

std::string_view to_string(TokenErrorCode code) noexcept {
    switch (code) {
        case TokenErrorCode::kExpired:            return "token-expired";
        case TokenErrorCode::kRevoked:            return "token-revoked";
        case TokenErrorCode::kSignatureInvalid:   return "signature-invalid";
        case TokenErrorCode::kMalformed:          return "token-malformed";
        case TokenErrorCode::kInvalidIssuer:      return "invalid-issuer";
        case TokenErrorCode::kConfiguration:      return "configuration-error";
        case TokenErrorCode::kStorageUnavailable: return "storage-unavailable";
        case TokenErrorCode::kNotYetValid:        return "token-not-yet-valid";
    }
    return "token-malformed";
}

std::expected<TokenTypeHint, std::string> parse_token_type_hint(std::string_view text) {
    if (text == "access_token") {
        return TokenTypeHint::kAccessToken;
    }
    if (text == "refresh_token") {
        return TokenTypeHint::kRefreshToken;
    }
    return std::unexpected(std::string("unsupported_token_type"));
}

// ---------------------------------------------------------------------------
// ValidatedClaims::from_json
// ---------------------------------------------------------------------------
std::expected<ValidatedClaims, std::string> ValidatedClaims::from_json(const Json::Value& payload) {
    ValidatedClaims claims;

    auto sub = json_string_member(payload, "sub");
    if (!sub) {
        return std::unexpected(std::string("token is missing sub"));
    }
    // isIntegral 은 UInt64 범위도 참이므로 isInt64 로 asInt64 예외를 막는다
    if (!payload.isMember("exp") || !payload["exp"].isInt64() ||
        !payload.isMember("iat") || !payload["iat"].isInt64()) {
        return std::unexpected(std::string("token exp/iat must be 64-bit signed integers"));
    }
    if (payload.isMember("nbf") && !payload["nbf"].isInt64()) {
        return std::unexpected(std::string("token nbf must be a 64-bit signed integer"));
    }
    claims.sub = std::move(*sub);
    claims.jti = json_string_member(payload, "jti").value_or("");
    claims.exp = payload["exp"].asInt64();
    claims.iat = payload["iat"].asInt64();
    if (payload.isMember("nbf")) {
        claims.nbf = payload["nbf"].asInt64();
    }

    claims.iss       = json_string_member(payload, "iss").value_or("");
    claims.scope     = json_string_member(payload, "scope").value_or("");
    claims.client_id = json_string_member(payload, "client_id").value_or("");
    claims.patient   = json_string_member(payload, "patient");
    claims.encounter = json_string_member(payload, "encounter");
    claims.fhir_user = json_string_member(payload, "fhirUser");
    claims.nonce     = json_string_member(payload, "nonce");

    // aud: 문자열 또는 문자열 배열 (RFC 7519 §4.1.3)
    const Json::Value& aud = payload["aud"];
    if (aud.isString()) {
        claims.aud.push_back(aud.asString());
    } else if (aud.isArray()) {
        for (const auto& item : aud) {
            if (item.isString()) {
                claims.aud.push_back(item.asString());
            }
        }
    }

    const std::string use = json_string_member(payload, "token_use").value_or("access");
    const auto kind = parse_token_kind(use);
    if (!kind) {
        return std::unexpected(fmt::format("unknown token_use '{}'", use));
    }
    claims.kind = *kind;
    return claims;
}

// ---------------------------------------------------------------------------
// IntrospectionResult
// ---------------------------------------------------------------------------
IntrospectionResult IntrospectionResult::from_claims(const ValidatedClaims& claims) {
    IntrospectionResult r;
    r.active     = true;
    r.scope      = claims.scope;
    r.client_id  = claims.client_id;
    r.username   = claims.sub;
    r.token_type = claims.kind == TokenKind::kRefresh ? "refresh_token" : "Bearer";
    r.exp        = claims.exp;
    r.iat        = claims.iat;
    r.nbf        = claims.nbf;
    r.sub        = claims.sub;
    r.aud        = claims.aud;
    r.iss        = claims.iss;
    r.jti        = claims.jti;
    r.patient    = claims.patient;
    r.encounter  = claims.encounter;
    r.fhir_user  = claims.fhir_user;
    return r;
}

Json::Value IntrospectionResult::to_json() const {
    Json::Value out(Json::objectValue);
    out["active"] = active;
    if (!active) {
        return out;
    }
    const auto put_str = [&out](const char* key, const std::optional<std::string>& v) {
        if (v) {
            out[key] = *v;
        }
    };
    const auto put_int = [&out](const char* key, const std::optional<std::int64_t>& v) {
        if (v) {
            out[key] = Json::Int64{*v};
        }
    };
    put_str("scope", scope);
    put_str("client_id", client_id);
    put_str("username", username);
    put_str("token_type", token_type);
    put_int("exp", exp);
    put_int("iat", iat);
    put_int("nbf", nbf);
    put_str("sub", sub);
    if (aud.size() == 1) {
        out["aud"] = aud.front();
    } else if (!aud.empty()) {
        Json::Value arr(Json::arrayValue);
        for (const auto& a : aud) {
            arr.append(a);
        }
        out["aud"] = arr;
    }
    put_str("iss", iss);
    put_str("jti", jti);
    put_str("patient", patient);
    put_str("encounter", encounter);
    put_str("fhirUser", fhir_user);
    return out;
}
