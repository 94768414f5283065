#pragma once

// ---------------------------------------------------------------------------
// jwks_cache.hpp
//
// 외부 IdP 의 JWKS 를 URI 단위로 캐시한다.
//
// [동시성]
// - 캐시 본체: std::shared_mutex. 조회는 공유 lock, 교체는 배타 lock.
// - 갱신: URI 별 single-flight. 같은 URI 에 대해 동시에 하나의 fetch 만
//   진행되고, 대기자는 같은 std::shared_future 결과를 받는다.
// - 프로세스 내부 유일한 공유 가변 상태이며 전역 인스턴스를 두지 않는다.
//
// [fail-close]
// - 캐시 TTL 경과 + 갱신 실패 → max_staleness 이내면 이전 키 제공 (경고 로그),
//   넘으면 kStale. 절대 무기한 stale 키를 제공하지 않는다.
// - 키를 찾지 못하면 kKeyNotFound.
// ---------------------------------------------------------------------------

#include "federation/jwks_fetcher.hpp"
#include "federation/jwks_types.hpp"
#include "token/signing_key.hpp"

#include <chrono>
#include <expected>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// JwksKeySet
//   한 URI 의 파싱된 서명 키 묶음 (불변).
// ---------------------------------------------------------------------------
struct JwksKeySet {
    std::vector<SigningKey>               keys{};
    std::chrono::system_clock::time_point fetched_at{};
    std::chrono::system_clock::time_point expires_at{};
};

class JwksCache {
public:
    using Clock     = std::chrono::system_clock;
    using TimePoint = Clock::time_point;
    using NowFn     = std::function<TimePoint()>;
    using KeySetPtr = std::shared_ptr<const JwksKeySet>;

    JwksCache(JwksCacheConfig config, std::shared_ptr<JwksFetcher> fetcher, NowFn now = &Clock::now);
    ~JwksCache() = default;

    JwksCache(const JwksCache&)            = delete;
    JwksCache& operator=(const JwksCache&) = delete;

    // get_key
    //   캐시가 유효하면 캐시에서, 아니면 원격 조회 후 반환한다.
    //   유효 캐시에 kid 가 없으면 한 번 강제 갱신한다 (IdP 키 교체 대응).
    [[nodiscard]] std::expected<SigningKey, JwksError>
    get_key(const std::string& jwks_uri, const std::string& kid);

    // find_signing_keys
    //   kid 가 없는 토큰 검증용. 유효 캐시(필요 시 조회)의 모든 키.
    [[nodiscard]] std::expected<std::vector<SigningKey>, JwksError>
    find_signing_keys(const std::string& jwks_uri);

    // refresh
    //   강제 재조회. 동시 호출은 하나의 fetch 로 합쳐진다. 키 개수 반환.
    [[nodiscard]] std::expected<std::size_t, JwksError> refresh(const std::string& jwks_uri);

    void invalidate(const std::string& jwks_uri);

    // max_staleness 까지 지난 항목 제거. 제거 건수 반환.
    std::size_t cleanup();

    void clear();

    // normalize_uri
    //   뒤쪽 '/' 제거 후 scheme 검사. https 만 허용 (allow_http 시 http 허용).
    [[nodiscard]] std::expected<std::string, JwksError> normalize_uri(std::string_view uri) const;

private:
    using FetchResult = std::expected<KeySetPtr, JwksError>;

    // single-flight 진입점. force == false 면 lock 획득 후 캐시가 유효한지 재확인한다.
    [[nodiscard]] FetchResult load(const std::string& uri, bool force);

    // 재시도 + 지수 backoff 포함 원격 조회 및 파싱
    [[nodiscard]] FetchResult fetch_with_retries(const std::string& uri);

    [[nodiscard]] FetchResult parse_key_set(const JwksHttpResponse& response) const;

    [[nodiscard]] std::chrono::seconds ttl_from_cache_control(std::string_view header) const;

    // 캐시 조회 (유효/만료 무관). 없으면 nullptr.
    [[nodiscard]] KeySetPtr cached(const std::string& uri) const;

    // 갱신 실패 시 stale 허용 범위 안의 키 집합 반환
    [[nodiscard]] FetchResult stale_or_error(const std::string& uri, const JwksError& error) const;

    JwksCacheConfig              config_;
    std::shared_ptr<JwksFetcher> fetcher_;
    NowFn                        now_;

    mutable std::shared_mutex        cache_mutex_;
    std::map<std::string, KeySetPtr> entries_;

    std::mutex                                           inflight_mutex_;
    std::map<std::string, std::shared_future<FetchResult>> inflight_;
};
