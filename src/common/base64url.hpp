#pragma once

// ---------------------------------------------------------------------------
// base64url.hpp
//
// RFC 4648 §5 base64url (패딩 없음) 인코딩/디코딩.
// JWS 세그먼트, JWK 파라미터(n, e, x, y), PKCE challenge 에서 공통 사용.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// 바이트 → base64url 문자열 ('=' 패딩 제거)
[[nodiscard]] std::string base64url_encode(const std::uint8_t* data, std::size_t len);
[[nodiscard]] std::string base64url_encode(std::string_view data);

// base64url 문자열 → 바이트.
// 허용 문자 외 입력, 잘못된 길이, 패딩 포함 입력은 std::nullopt.
[[nodiscard]] std::optional<std::vector<std::uint8_t>> base64url_decode(std::string_view text);

// 디코딩 결과를 문자열로 (JSON 세그먼트용)
[[nodiscard]] std::optional<std::string> base64url_decode_string(std::string_view text);
