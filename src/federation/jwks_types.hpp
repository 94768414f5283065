#pragma once

// ---------------------------------------------------------------------------
// jwks_types.hpp
//
// JWKS Cache 설정과 오류 타입.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// JwksCacheConfig
//   TTL 은 응답의 Cache-Control max-age 를 [min_ttl, max_ttl] 로 clamp 한다.
//   max_staleness: 갱신 실패 시 만료된 키를 계속 제공할 수 있는 상한.
//                  이 기간이 지나면 어떤 경우에도 캐시 키를 사용하지 않는다.
// ---------------------------------------------------------------------------
struct JwksCacheConfig {
    std::chrono::seconds      default_ttl{3600};
    std::chrono::seconds      min_ttl{300};
    std::chrono::seconds      max_ttl{86400};
    std::chrono::milliseconds request_timeout{10000};   // 재시도 포함 전체 상한
    std::size_t               max_response_size{1024 * 1024};
    bool                      allow_http{false};
    std::uint32_t             max_retries{3};
    std::chrono::milliseconds retry_backoff{200};       // 지수 증가 초기값
    std::chrono::seconds      max_staleness{86400};
};

enum class JwksErrorCode : std::uint8_t {
    kKeyNotFound      = 0,
    kFetchFailed      = 1,  // 네트워크/TLS 오류
    kHttpStatus       = 2,  // 2xx 이외 응답
    kParse            = 3,
    kNoSigningKeys    = 4,
    kInvalidKey       = 5,
    kInvalidScheme    = 6,
    kResponseTooLarge = 7,
    kStale            = 8,  // 캐시가 max_staleness 를 넘었고 갱신도 실패
};

[[nodiscard]] std::string_view to_string(JwksErrorCode code) noexcept;

struct JwksError {
    JwksErrorCode code{JwksErrorCode::kFetchFailed};
    std::string   message{};
    int           http_status{0};

    // 재시도해도 결과가 같을 오류는 false
    [[nodiscard]] bool retryable() const noexcept {
        if (code == JwksErrorCode::kFetchFailed) {
            return true;
        }
        return code == JwksErrorCode::kHttpStatus && (http_status >= 500 || http_status == 429);
    }
};

// ---------------------------------------------------------------------------
// JwksHttpResponse
//   fetcher 가 돌려주는 원시 응답. status 2xx 만 성공으로 반환한다.
// ---------------------------------------------------------------------------
struct JwksHttpResponse {
    int         status{0};
    std::string body{};
    std::string cache_control{};
};
