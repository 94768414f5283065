#pragma once

// ---------------------------------------------------------------------------
// jwks_fetcher.hpp
//
// JWKS 원격 조회 추상화. JwksCache 는 이 인터페이스만 안다.
// 테스트는 호출 횟수를 세는 가짜 구현을 주입한다.
// ---------------------------------------------------------------------------

#include "jwks_types.hpp"

#include <chrono>
#include <cstddef>
#include <expected>
#include <string>

class JwksFetcher {
public:
    virtual ~JwksFetcher() = default;

    // fetch
    //   uri 에 GET 요청. timeout 내에 완료되지 않으면 kFetchFailed.
    //   본문이 max_size 를 넘으면 kResponseTooLarge.
    //   2xx 이외 상태는 kHttpStatus (http_status 설정).
    [[nodiscard]] virtual std::expected<JwksHttpResponse, JwksError>
    fetch(const std::string& uri, std::chrono::milliseconds timeout, std::size_t max_size) = 0;
};
