#pragma once

// ---------------------------------------------------------------------------
// http_jwks_fetcher.hpp
//
// Boost.Beast 기반 JWKS HTTP(S) 클라이언트.
//
// [설계 원칙]
// - 호출마다 전용 io_context 를 만들고 코루틴 하나를 실행한 뒤 버린다.
//   JwksCache 의 single-flight 가 동시 호출 수를 URI 당 1 로 제한하므로
//   연결 재사용은 하지 않는다.
// - 모든 비동기 단계(resolve/connect/handshake/write/read)에 남은 timeout 을
//   적용한다. 전체 시간이 초과되면 kFetchFailed.
//
// [보안 고려사항]
// - TLS: 시스템 CA 경로로 peer 검증 + SNI + 호스트명 검증.
// - 응답 본문은 max_size 로 제한 (body_limit). 초과 시 kResponseTooLarge.
// - 리다이렉트는 따라가지 않는다 (3xx → kHttpStatus).
// ---------------------------------------------------------------------------

#include "federation/jwks_fetcher.hpp"

#include <string>

class HttpJwksFetcher final : public JwksFetcher {
public:
    HttpJwksFetcher()  = default;
    ~HttpJwksFetcher() override = default;

    HttpJwksFetcher(const HttpJwksFetcher&)            = delete;
    HttpJwksFetcher& operator=(const HttpJwksFetcher&) = delete;

    [[nodiscard]] std::expected<JwksHttpResponse, JwksError>
    fetch(const std::string& uri, std::chrono::milliseconds timeout, std::size_t max_size) override;
};

// ---------------------------------------------------------------------------
// ParsedUri
//   scheme://host[:port]/target 분해 결과. 테스트에서 직접 사용한다.
// ---------------------------------------------------------------------------
struct ParsedUri {
    bool        tls{true};
    std::string host{};
    std::string port{};
    std::string target{"/"};
};

[[nodiscard]] std::expected<ParsedUri, JwksError> parse_jwks_uri(const std::string& uri);
